#include <NGIN/ObjectModel/Object.hpp>
#include <NGIN/ObjectModel/Diagnostics.hpp>
#include <NGIN/ObjectModel/Registry.hpp>

#include "ObjectAccess.hpp"

namespace NGIN::ObjectModel
{

  using detail::GetRegistry;
  using detail::InvalidIndex;
  namespace
  {
    constexpr std::string_view kStaleHandle = "stale handle";

    bool IsClassAlive(ClassHandle h)
    {
      return h.IsValid() && h.index < GetRegistry().classes.Size();
    }

    // Fresh instance storage: variable defaults, and each instance constant
    // starting from the declaring class's committed value.
    std::shared_ptr<detail::InstanceState> AllocateInstance(NGIN::UInt32 classIndex)
    {
      auto &reg = GetRegistry();
      auto state = std::make_shared<detail::InstanceState>();
      state->classIndex = classIndex;
      state->instanceId = reg.nextInstanceId++;
      const auto &props = reg.classes[classIndex].properties;
      state->slots.Reserve(props.Size());
      for (NGIN::UIntSize i = 0; i < props.Size(); ++i)
      {
        detail::MemberSlot slot{};
        const auto &desc = detail::DescriptorOf(props[i]);
        if (!desc.IsStatic())
        {
          if (desc.IsConstant())
            slot = reg.classes[props[i].ownerIndex].classSlots[props[i].memberIndex];
          else if (!desc.IsMethod() && desc.hasDefault)
            slot = detail::MemberSlot{desc.defaultValue, true};
        }
        state->slots.PushBack(std::move(slot));
      }
      return state;
    }
  } // namespace

  ExpectedObject Class::New(std::span<const Any> args) const
  {
    if (!IsClassAlive(m_h))
      return std::unexpected(Error{ErrorCode::InvalidArgument, kStaleHandle});
    const auto &reg = GetRegistry();
    if (reg.classes[m_h.index].isAbstract)
    {
      Error e{ErrorCode::AbstractInstantiation, "cannot instantiate an abstract class"};
      e.className = reg.classes[m_h.index].name;
      return detail::Fail(e);
    }

    auto state = AllocateInstance(m_h.index);

    // Most-derived constructor in the lineage runs; its class is the context.
    MethodFn ctor = nullptr;
    NGIN::UIntSize ctorArity = 0;
    NGIN::UInt32 ctorOwner = InvalidIndex;
    for (auto cur = m_h.index; cur != InvalidIndex; cur = reg.classes[cur].parentIndex)
    {
      if (reg.classes[cur].constructor)
      {
        ctor = reg.classes[cur].constructor;
        ctorArity = reg.classes[cur].constructorArity;
        ctorOwner = cur;
        break;
      }
    }
    if (!ctor)
    {
      if (!args.empty())
        return std::unexpected(Error{ErrorCode::InvalidArgument, "class has no constructor taking arguments"});
      return detail::ObjectAccess::Wrap(std::move(state));
    }
    if (args.size() != ctorArity)
      return std::unexpected(Error{ErrorCode::InvalidArgument, "constructor arity mismatch"});

    Self self = detail::ObjectAccess::MakeSelf(state, m_h.index, ctorOwner);
    auto r = ctor(self, args);
    if (!r.has_value())
      return std::unexpected(r.error());
    return detail::ObjectAccess::Wrap(std::move(state));
  }

  Expected<Any> Class::Get(std::string_view name, const AccessContext &ctx) const
  {
    return detail::ReadMember(nullptr, m_h.index, name, ctx);
  }

  Expected<void> Class::Set(std::string_view name, const Any &value, const AccessContext &ctx) const
  {
    return detail::WriteMember(nullptr, m_h.index, name, value, ctx);
  }

  Expected<void> Class::Delete(std::string_view name, const AccessContext &ctx) const
  {
    return detail::DeleteMember(nullptr, m_h.index, name, ctx);
  }

  Expected<Any> Class::Invoke(std::string_view name, std::span<const Any> args, const AccessContext &ctx) const
  {
    return detail::InvokeMember(nullptr, m_h.index, name, args, ctx);
  }

  Class Object::GetClass() const
  {
    if (!m_state)
      return Class{};
    return Class{ClassHandle{m_state->classIndex}};
  }

  NGIN::UInt64 Object::InstanceId() const noexcept
  {
    return m_state ? m_state->instanceId : 0;
  }

  Expected<Any> Object::Get(std::string_view name, const AccessContext &ctx) const
  {
    if (!m_state)
      return std::unexpected(Error{ErrorCode::InvalidArgument, "null object"});
    return detail::ReadMember(m_state, m_state->classIndex, name, ctx);
  }

  Expected<void> Object::Set(std::string_view name, const Any &value, const AccessContext &ctx) const
  {
    if (!m_state)
      return std::unexpected(Error{ErrorCode::InvalidArgument, "null object"});
    return detail::WriteMember(m_state, m_state->classIndex, name, value, ctx);
  }

  Expected<void> Object::Delete(std::string_view name, const AccessContext &ctx) const
  {
    if (!m_state)
      return std::unexpected(Error{ErrorCode::InvalidArgument, "null object"});
    return detail::DeleteMember(m_state, m_state->classIndex, name, ctx);
  }

  Expected<Any> Object::Invoke(std::string_view name, std::span<const Any> args, const AccessContext &ctx) const
  {
    if (!m_state)
      return std::unexpected(Error{ErrorCode::InvalidArgument, "null object"});
    return detail::InvokeMember(m_state, m_state->classIndex, name, args, ctx);
  }

  bool BoundMethod::IsValid() const noexcept
  {
    const auto &reg = GetRegistry();
    return m_ownerIndex < reg.classes.Size() && m_memberIndex < reg.classes[m_ownerIndex].members.Size();
  }

  std::string_view BoundMethod::Name() const
  {
    if (!IsValid())
      return {};
    return GetRegistry().classes[m_ownerIndex].members[m_memberIndex].name;
  }

  NGIN::UIntSize BoundMethod::Arity() const
  {
    if (!IsValid())
      return 0;
    return GetRegistry().classes[m_ownerIndex].members[m_memberIndex].arity;
  }

  Expected<Any> BoundMethod::Invoke(std::span<const Any> args) const
  {
    return detail::CallMethod(m_instance, m_receiverIndex, m_ownerIndex, m_memberIndex, args);
  }

  Object Self::This() const
  {
    return detail::ObjectAccess::Wrap(m_instance);
  }

  Class Self::GetClass() const
  {
    return Class{ClassHandle{m_receiverIndex}};
  }

  Class Self::DeclaringClass() const
  {
    return Class{ClassHandle{m_contextIndex}};
  }

  AccessContext Self::Context() const noexcept
  {
    return AccessContext::Of(ClassHandle{m_contextIndex});
  }

  Expected<Any> Self::Get(std::string_view name) const
  {
    return detail::ReadMember(m_instance, m_receiverIndex, name, Context());
  }

  Expected<void> Self::Set(std::string_view name, const Any &value) const
  {
    return detail::WriteMember(m_instance, m_receiverIndex, name, value, Context());
  }

  Expected<void> Self::Delete(std::string_view name) const
  {
    return detail::DeleteMember(m_instance, m_receiverIndex, name, Context());
  }

  Expected<Any> Self::Invoke(std::string_view name, std::span<const Any> args) const
  {
    return detail::InvokeMember(m_instance, m_receiverIndex, name, args, Context());
  }

} // namespace NGIN::ObjectModel
