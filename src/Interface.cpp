#include <NGIN/ObjectModel/Interface.hpp>
#include <NGIN/ObjectModel/Diagnostics.hpp>
#include <NGIN/ObjectModel/Object.hpp>
#include <NGIN/ObjectModel/Registry.hpp>

namespace NGIN::ObjectModel
{

  using detail::GetRegistry;
  namespace
  {
    constexpr std::string_view kStaleHandle = "stale handle";

    bool IsHidden(std::string_view name) noexcept
    {
      return !name.empty() && name.front() == '_';
    }

    void AddRequirement(detail::InterfaceRuntimeDesc &idesc, const Requirement &req)
    {
      if (auto *p = idesc.requiredIndex.GetPtr(req.nameId))
      {
        idesc.required[*p] = req;
        return;
      }
      idesc.required.PushBack(req);
      idesc.requiredIndex.Insert(req.nameId, static_cast<NGIN::UInt32>(idesc.required.Size() - 1));
    }

    // One requirement probed on the external surface.
    bool Exposes(const Object &obj, const Requirement &req)
    {
      auto r = obj.Get(req.name);
      if (!r.has_value())
        return false;
      if (req.kind == RequirementKind::Data)
        return true;
      if (r->GetTypeId() != detail::TypeIdOf<BoundMethod>())
        return false;
      return r->Cast<BoundMethod>().Arity() == req.arity;
    }
  } // namespace

  InterfaceBuilder::InterfaceBuilder(std::string_view name, ModuleId moduleId)
      : m_moduleId(moduleId)
  {
    if (name.empty())
      m_error = detail::MakeDefinitionError(DefinitionFault::Malformed, "interface name is empty", {});
    else
      m_name = detail::NameFromId(detail::InternNameId(name));
  }

  InterfaceBuilder &InterfaceBuilder::Extends(const Interface &parent)
  {
    if (!parent.IsValid())
    {
      if (!m_error)
        m_error = detail::MakeDefinitionError(DefinitionFault::UnknownParent, "parent interface is not defined", {}, {}, m_name);
      return *this;
    }
    m_parents.PushBack(parent.Handle().index);
    return *this;
  }

  InterfaceBuilder &InterfaceBuilder::Method(std::string_view name, NGIN::UIntSize arity)
  {
    Add(name, RequirementKind::Method, arity, false);
    return *this;
  }

  InterfaceBuilder &InterfaceBuilder::Member(std::string_view name)
  {
    Add(name, RequirementKind::Data, 0, false);
    return *this;
  }

  InterfaceBuilder &InterfaceBuilder::Hidden(std::string_view name)
  {
    Add(name, RequirementKind::Data, 0, true);
    return *this;
  }

  void InterfaceBuilder::Add(std::string_view name, RequirementKind kind, NGIN::UIntSize arity, bool hidden)
  {
    if (m_error)
      return;
    if (name.empty())
    {
      m_error = detail::MakeDefinitionError(DefinitionFault::Malformed, "member name is empty", {}, {}, m_name);
      return;
    }
    const auto nid = detail::InternNameId(name);
    for (NGIN::UIntSize i = 0; i < m_declared.Size(); ++i)
    {
      if (m_declared[i] == nid)
      {
        m_error = detail::MakeDefinitionError(DefinitionFault::DuplicateMember, "member declared twice", {}, detail::NameFromId(nid), m_name);
        return;
      }
    }
    m_declared.PushBack(nid);
    if (hidden || IsHidden(name))
      return;
    m_own.PushBack(Requirement{detail::NameFromId(nid), nid, kind, arity});
  }

  ExpectedInterface InterfaceBuilder::Define()
  {
    if (m_defined)
      return detail::Fail(detail::MakeDefinitionError(DefinitionFault::MemberTableClosed, "interface already defined", {}, {}, m_name));
    if (m_error)
      return detail::Fail(*m_error);

    auto &reg = GetRegistry();
    detail::InterfaceRuntimeDesc idesc{};
    idesc.name = m_name;
    idesc.nameId = detail::InternNameId(m_name);
    idesc.moduleId = m_moduleId;
    for (NGIN::UIntSize i = 0; i < m_parents.Size(); ++i)
    {
      idesc.parents.PushBack(m_parents[i]);
      const auto &inherited = reg.interfaces[m_parents[i]].required;
      for (NGIN::UIntSize j = 0; j < inherited.Size(); ++j)
        AddRequirement(idesc, inherited[j]);
    }
    for (NGIN::UIntSize i = 0; i < m_own.Size(); ++i)
      AddRequirement(idesc, m_own[i]);

    const auto index = static_cast<NGIN::UInt32>(reg.interfaces.Size());
    reg.interfaces.PushBack(std::move(idesc));
    if (auto *p = reg.interfaceByName.GetPtr(reg.interfaces[index].nameId))
      *p = index;
    else
      reg.interfaceByName.Insert(reg.interfaces[index].nameId, index);
    m_defined = true;
    return Interface{InterfaceHandle{index}};
  }

  Expected<bool> InstanceOf(const Object &obj, const Interface &iface, bool duckTyped)
  {
    if (!obj.IsValid())
      return std::unexpected(Error{ErrorCode::InvalidArgument, "null object"});
    if (!iface.IsValid())
      return std::unexpected(Error{ErrorCode::InvalidArgument, kStaleHandle});

    if (duckTyped)
    {
      detail::ScopedSinkMute mute;
      const auto count = iface.RequiredCount();
      for (NGIN::UIntSize i = 0; i < count; ++i)
      {
        if (!Exposes(obj, iface.RequirementAt(i)))
          return false;
      }
      return true;
    }

    const auto &reg = GetRegistry();
    for (auto cur = obj.GetClass().Handle().index; cur != detail::InvalidIndex; cur = reg.classes[cur].parentIndex)
    {
      const auto &declared = reg.classes[cur].interfaces;
      for (NGIN::UIntSize i = 0; i < declared.Size(); ++i)
      {
        if (detail::IsSameOrDerivedInterface(declared[i], iface.Handle().index))
          return true;
      }
    }
    return false;
  }

  Expected<bool> InstanceOf(const Any &value, const Interface &iface, bool duckTyped)
  {
    if (!iface.IsValid())
      return std::unexpected(Error{ErrorCode::InvalidArgument, kStaleHandle});
    if (value.GetTypeId() != detail::TypeIdOf<Object>())
      return false;
    const auto &obj = value.Cast<Object>();
    if (!obj.IsValid())
      return false;
    return InstanceOf(obj, iface, duckTyped);
  }

  Expected<bool> InstanceOf(const Object &obj, const Class &cls)
  {
    if (!obj.IsValid())
      return std::unexpected(Error{ErrorCode::InvalidArgument, "null object"});
    if (!cls.IsValid())
      return std::unexpected(Error{ErrorCode::InvalidArgument, kStaleHandle});
    return obj.GetClass().IsSubclassOf(cls);
  }

  Expected<bool> InstanceOf(const Any &value, const Class &cls)
  {
    if (!cls.IsValid())
      return std::unexpected(Error{ErrorCode::InvalidArgument, kStaleHandle});
    if (value.GetTypeId() != detail::TypeIdOf<Object>())
      return false;
    const auto &obj = value.Cast<Object>();
    if (!obj.IsValid())
      return false;
    return InstanceOf(obj, cls);
  }

} // namespace NGIN::ObjectModel
