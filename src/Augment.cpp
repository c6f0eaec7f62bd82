#include <NGIN/ObjectModel/Access.hpp>
#include <NGIN/ObjectModel/Diagnostics.hpp>
#include <NGIN/ObjectModel/Registry.hpp>
#include <NGIN/ObjectModel/Validation.hpp>

#include "ObjectAccess.hpp"

namespace NGIN::ObjectModel::detail
{

  namespace
  {
    constexpr std::string_view kStaleHandle = "stale handle";

    std::string_view ClassNameOf(NGIN::UInt32 index) noexcept
    {
      const auto &reg = GetRegistry();
      return index < reg.classes.Size() ? reg.classes[index].name : std::string_view{};
    }

    // Errors only carry interned views; names never seen before are left out.
    std::string_view StableName(std::string_view name) noexcept
    {
      NameId nid{};
      if (!FindNameId(name, nid))
        return {};
      return NameFromId(nid);
    }

    const MemberDescriptor &Desc(const SlotAccess &a) noexcept
    {
      return GetRegistry().classes[a.ownerIndex].members[a.memberIndex];
    }

    std::unexpected<Error> Deny(AccessRule rule, const SlotAccess &a)
    {
      return Fail(MakeAccessDenied(rule, Desc(a).name, ClassNameOf(a.ownerIndex)));
    }

    MemberSlot &ClassSlot(const SlotAccess &a)
    {
      return GetRegistry().classes[a.ownerIndex].classSlots[a.memberIndex];
    }

    MemberSlot &InstanceSlot(const SlotAccess &a)
    {
      return a.instance->slots[a.propertyIndex];
    }

    // Instance constants live on the instance; through the class they resolve to
    // the class-level value.
    MemberSlot &ConstantSlot(const SlotAccess &a)
    {
      if (a.instance && !Desc(a).IsStatic())
        return InstanceSlot(a);
      return ClassSlot(a);
    }

    Expected<Any> Accept(const SlotAccess &a, const Any &value)
    {
      // Copy: coercion to a class type runs its constructor, which may grow the registry.
      const MemberDescriptor desc = Desc(a);
      return Validate(desc, value);
    }

    std::unexpected<Error> Unset(const SlotAccess &a)
    {
      return Fail(MakeNotFound("attribute has no value", Desc(a).name, ClassNameOf(a.ownerIndex)));
    }

    Expected<Any> GetInstanceVariable(const SlotAccess &a)
    {
      if (!a.instance)
        return Deny(AccessRule::InstanceScope, a);
      const auto &slot = InstanceSlot(a);
      if (!slot.committed)
        return Unset(a);
      return slot.value;
    }

    Expected<void> SetInstanceVariable(const SlotAccess &a, const Any &value)
    {
      if (!a.instance)
        return Deny(AccessRule::InstanceScope, a);
      auto accepted = Accept(a, value);
      if (!accepted.has_value())
        return std::unexpected(accepted.error());
      auto &slot = InstanceSlot(a);
      slot.value = std::move(*accepted);
      slot.committed = true;
      return {};
    }

    Expected<void> DeleteInstanceVariable(const SlotAccess &a)
    {
      if (!a.instance)
        return Deny(AccessRule::InstanceScope, a);
      auto &slot = InstanceSlot(a);
      slot.value = Any::MakeVoid();
      slot.committed = false;
      return {};
    }

    Expected<Any> GetStaticVariable(const SlotAccess &a)
    {
      const auto &slot = ClassSlot(a);
      if (!slot.committed)
        return Unset(a);
      return slot.value;
    }

    Expected<void> SetStaticVariable(const SlotAccess &a, const Any &value)
    {
      auto accepted = Accept(a, value);
      if (!accepted.has_value())
        return std::unexpected(accepted.error());
      auto &slot = ClassSlot(a);
      slot.value = std::move(*accepted);
      slot.committed = true;
      return {};
    }

    Expected<void> DeleteStaticVariable(const SlotAccess &a)
    {
      auto &slot = ClassSlot(a);
      slot.value = Any::MakeVoid();
      slot.committed = false;
      return {};
    }

    Expected<Any> GetConstant(const SlotAccess &a)
    {
      const auto &slot = ConstantSlot(a);
      if (!slot.committed)
        return Unset(a);
      return slot.value;
    }

    Expected<void> SetConstant(const SlotAccess &a, const Any &value)
    {
      if (ConstantSlot(a).committed)
        return Deny(AccessRule::Constant, a);
      auto accepted = Accept(a, value);
      if (!accepted.has_value())
        return std::unexpected(accepted.error());
      auto &slot = ConstantSlot(a);
      if (slot.committed)
        return Deny(AccessRule::Constant, a);
      slot.value = std::move(*accepted);
      slot.committed = true;
      return {};
    }

    Expected<void> DeleteConstant(const SlotAccess &a)
    {
      return Deny(AccessRule::Constant, a);
    }

    Error MakeAbstractMember(const SlotAccess &a)
    {
      Error e{ErrorCode::AbstractMember, "abstract member has no implementation"};
      e.member = Desc(a).name;
      e.className = ClassNameOf(a.ownerIndex);
      return e;
    }

    Expected<Any> GetMethod(const SlotAccess &a)
    {
      const auto &desc = Desc(a);
      if (desc.isAbstract || !desc.body)
        return Fail(MakeAbstractMember(a));
      if (desc.IsStatic())
        return Any{ObjectAccess::Bind(nullptr, a.receiverIndex, a.ownerIndex, a.memberIndex)};
      if (!a.instance)
        return Deny(AccessRule::InstanceScope, a);
      return Any{ObjectAccess::Bind(a.instance, a.receiverIndex, a.ownerIndex, a.memberIndex)};
    }

    Expected<void> SetMethod(const SlotAccess &a, const Any &)
    {
      return Deny(AccessRule::Method, a);
    }

    Expected<void> DeleteMethod(const SlotAccess &a)
    {
      return Deny(AccessRule::Method, a);
    }

    bool IsCommitted(const SlotAccess &a)
    {
      if (!Desc(a).IsConstant())
        return false;
      return ConstantSlot(a).committed;
    }

    struct Resolved
    {
      SlotAccess access;
      PropertySlot property;
    };

    bool Resolve(const std::shared_ptr<InstanceState> &instance,
                 NGIN::UInt32 receiverIndex,
                 std::string_view name,
                 const AccessContext &ctx,
                 Resolved &out)
    {
      const auto idx = FindPropertyIndexFrom(receiverIndex, name, ctx.IsExternal() ? InvalidIndex : ctx.cls.index);
      if (idx == InvalidIndex)
        return false;
      const auto &cdesc = GetRegistry().classes[receiverIndex];
      out.property = cdesc.properties[idx];
      out.access.instance = instance;
      out.access.receiverIndex = receiverIndex;
      out.access.propertyIndex = idx;
      out.access.ownerIndex = out.property.ownerIndex;
      out.access.memberIndex = out.property.memberIndex;
      out.access.enforce = cdesc.isEncapsulated;
      return true;
    }

    // Raw classes skip visibility; mutability always applies.
    AccessDecision Gate(const SlotAccess &a, const AccessContext &ctx, Operation op)
    {
      const auto &desc = Desc(a);
      const bool committed = IsCommitted(a);
      if (a.enforce)
        return Check(desc, ctx, op, committed);
      return CheckMutability(desc, op, committed);
    }

    std::unexpected<Error> NotFound(std::string_view name, NGIN::UInt32 receiverIndex)
    {
      return Fail(MakeNotFound("attribute not found", StableName(name), ClassNameOf(receiverIndex)));
    }

    OrdinaryAttribute *FindOrdinary(InstanceState &state, std::string_view name)
    {
      NameId nid{};
      if (!FindNameId(name, nid))
        return nullptr;
      if (auto *p = state.ordinaryIndex.GetPtr(nid))
      {
        auto &attr = state.ordinary[*p];
        return attr.present ? &attr : nullptr;
      }
      return nullptr;
    }

    AccessDecision GateUndeclared(NGIN::UInt32 receiverIndex, const AccessContext &ctx)
    {
      if (!GetRegistry().classes[receiverIndex].isEncapsulated)
        return AccessDecision::Allow();
      return CheckUndeclared(ClassHandle{receiverIndex}, ctx);
    }

    Expected<Any> ReadOrdinary(const std::shared_ptr<InstanceState> &instance,
                               NGIN::UInt32 receiverIndex,
                               std::string_view name,
                               const AccessContext &ctx)
    {
      OrdinaryAttribute *attr = instance ? FindOrdinary(*instance, name) : nullptr;
      if (!attr)
        return NotFound(name, receiverIndex);
      if (auto d = GateUndeclared(receiverIndex, ctx); !d)
        return Fail(MakeAccessDenied(d.rule, NameFromId(attr->nameId), ClassNameOf(receiverIndex)));
      return attr->value;
    }

    Expected<void> WriteOrdinary(const std::shared_ptr<InstanceState> &instance,
                                 NGIN::UInt32 receiverIndex,
                                 std::string_view name,
                                 const Any &value,
                                 const AccessContext &ctx)
    {
      if (!instance)
        return Fail(MakeDefinitionError(DefinitionFault::MemberTableClosed,
                                        "members cannot be added after the class is defined",
                                        ClassNameOf(receiverIndex),
                                        StableName(name)));
      if (auto d = GateUndeclared(receiverIndex, ctx); !d)
        return Fail(MakeAccessDenied(d.rule, StableName(name), ClassNameOf(receiverIndex)));
      const auto nid = InternNameId(name);
      if (auto *p = instance->ordinaryIndex.GetPtr(nid))
      {
        auto &attr = instance->ordinary[*p];
        attr.value = value;
        attr.present = true;
        return {};
      }
      instance->ordinary.PushBack(OrdinaryAttribute{nid, value, true});
      instance->ordinaryIndex.Insert(nid, static_cast<NGIN::UInt32>(instance->ordinary.Size() - 1));
      return {};
    }

    Expected<void> DeleteOrdinary(const std::shared_ptr<InstanceState> &instance,
                                  NGIN::UInt32 receiverIndex,
                                  std::string_view name,
                                  const AccessContext &ctx)
    {
      OrdinaryAttribute *attr = instance ? FindOrdinary(*instance, name) : nullptr;
      if (!attr)
        return NotFound(name, receiverIndex);
      if (auto d = GateUndeclared(receiverIndex, ctx); !d)
        return Fail(MakeAccessDenied(d.rule, NameFromId(attr->nameId), ClassNameOf(receiverIndex)));
      attr->value = Any::MakeVoid();
      attr->present = false;
      return {};
    }

    bool IsReceiverAlive(NGIN::UInt32 receiverIndex) noexcept
    {
      return receiverIndex < GetRegistry().classes.Size();
    }
  } // namespace

  void BindHandlers(PropertySlot &p, const MemberDescriptor &desc) noexcept
  {
    switch (desc.mutability)
    {
      case Mutability::Method:
        p.Get = &GetMethod;
        p.Set = &SetMethod;
        p.Delete = &DeleteMethod;
        return;
      case Mutability::Constant:
        p.Get = &GetConstant;
        p.Set = &SetConstant;
        p.Delete = &DeleteConstant;
        return;
      default:
        break;
    }
    if (desc.IsStatic())
    {
      p.Get = &GetStaticVariable;
      p.Set = &SetStaticVariable;
      p.Delete = &DeleteStaticVariable;
    }
    else
    {
      p.Get = &GetInstanceVariable;
      p.Set = &SetInstanceVariable;
      p.Delete = &DeleteInstanceVariable;
    }
  }

  Expected<Any> ReadMember(const std::shared_ptr<InstanceState> &instance,
                           NGIN::UInt32 receiverIndex,
                           std::string_view name,
                           const AccessContext &ctx)
  {
    if (!IsReceiverAlive(receiverIndex))
      return std::unexpected(Error{ErrorCode::InvalidArgument, kStaleHandle});
    Resolved r;
    if (!Resolve(instance, receiverIndex, name, ctx, r))
      return ReadOrdinary(instance, receiverIndex, name, ctx);
    if (auto d = Gate(r.access, ctx, Operation::Read); !d)
      return Deny(d.rule, r.access);
    return r.property.Get(r.access);
  }

  Expected<void> WriteMember(const std::shared_ptr<InstanceState> &instance,
                             NGIN::UInt32 receiverIndex,
                             std::string_view name,
                             const Any &value,
                             const AccessContext &ctx)
  {
    if (!IsReceiverAlive(receiverIndex))
      return std::unexpected(Error{ErrorCode::InvalidArgument, kStaleHandle});
    Resolved r;
    if (!Resolve(instance, receiverIndex, name, ctx, r))
      return WriteOrdinary(instance, receiverIndex, name, value, ctx);
    if (auto d = Gate(r.access, ctx, Operation::Write); !d)
      return Deny(d.rule, r.access);
    return r.property.Set(r.access, value);
  }

  Expected<void> DeleteMember(const std::shared_ptr<InstanceState> &instance,
                              NGIN::UInt32 receiverIndex,
                              std::string_view name,
                              const AccessContext &ctx)
  {
    if (!IsReceiverAlive(receiverIndex))
      return std::unexpected(Error{ErrorCode::InvalidArgument, kStaleHandle});
    Resolved r;
    if (!Resolve(instance, receiverIndex, name, ctx, r))
      return DeleteOrdinary(instance, receiverIndex, name, ctx);
    if (auto d = Gate(r.access, ctx, Operation::Delete); !d)
      return Deny(d.rule, r.access);
    return r.property.Delete(r.access);
  }

  Expected<Any> InvokeMember(const std::shared_ptr<InstanceState> &instance,
                             NGIN::UInt32 receiverIndex,
                             std::string_view name,
                             std::span<const Any> args,
                             const AccessContext &ctx)
  {
    auto target = ReadMember(instance, receiverIndex, name, ctx);
    if (!target.has_value())
      return std::unexpected(target.error());
    if (target->GetTypeId() != TypeIdOf<BoundMethod>())
      return std::unexpected(Error{ErrorCode::InvalidArgument, "member is not callable"});
    const BoundMethod method = target->Cast<BoundMethod>();
    return method.Invoke(args);
  }

  Expected<Any> CallMethod(const std::shared_ptr<InstanceState> &instance,
                           NGIN::UInt32 receiverIndex,
                           NGIN::UInt32 ownerIndex,
                           NGIN::UInt32 memberIndex,
                           std::span<const Any> args)
  {
    const auto &reg = GetRegistry();
    if (ownerIndex >= reg.classes.Size() || memberIndex >= reg.classes[ownerIndex].members.Size())
      return std::unexpected(Error{ErrorCode::InvalidArgument, kStaleHandle});
    const auto &desc = reg.classes[ownerIndex].members[memberIndex];
    // The body may define classes; keep nothing that points into the registry.
    const MethodFn body = desc.body;
    const auto arity = desc.arity;
    if (!body)
    {
      Error e{ErrorCode::AbstractMember, "abstract member has no implementation"};
      e.member = desc.name;
      e.className = reg.classes[ownerIndex].name;
      return Fail(e);
    }
    if (args.size() != arity)
      return std::unexpected(Error{ErrorCode::InvalidArgument, "arity mismatch"});
    Self self = ObjectAccess::MakeSelf(instance, receiverIndex, ownerIndex);
    return body(self, args);
  }

} // namespace NGIN::ObjectModel::detail
