#include <NGIN/ObjectModel/Registry.hpp>
#include <NGIN/ObjectModel/Interface.hpp>
#include <NGIN/ObjectModel/Object.hpp>

#include <optional>

namespace NGIN::ObjectModel::detail
{

  static Registry g_registry{};

  Registry &GetRegistry() noexcept { return g_registry; }
  namespace
  {
    constexpr NameId InvalidNameId = static_cast<NameId>(StringInterner::INVALID_ID);
  }

  NameId InternNameId(std::string_view s) noexcept
  {
    auto &reg = GetRegistry();
    const auto id = reg.names.InsertOrGet(s);
    if (id == StringInterner::INVALID_ID)
      return InvalidNameId;
    return static_cast<NameId>(id);
  }

  bool FindNameId(std::string_view s, NameId &out) noexcept
  {
    auto &reg = GetRegistry();
    StringInterner::IdType id{};
    if (!reg.names.TryGetId(s, id))
      return false;
    out = static_cast<NameId>(id);
    return true;
  }

  std::string_view NameFromId(NameId id) noexcept
  {
    auto &reg = GetRegistry();
    return reg.names.View(static_cast<StringInterner::IdType>(id));
  }

  bool IsSameOrDerived(NGIN::UInt32 derived, NGIN::UInt32 base) noexcept
  {
    const auto &reg = GetRegistry();
    if (base == InvalidIndex)
      return false;
    for (auto cur = derived; cur != InvalidIndex && cur < reg.classes.Size(); cur = reg.classes[cur].parentIndex)
    {
      if (cur == base)
        return true;
    }
    return false;
  }

  bool InSameLineage(NGIN::UInt32 a, NGIN::UInt32 b) noexcept
  {
    return IsSameOrDerived(a, b) || IsSameOrDerived(b, a);
  }

  bool IsSameOrDerivedInterface(NGIN::UInt32 derived, NGIN::UInt32 base) noexcept
  {
    const auto &reg = GetRegistry();
    if (derived >= reg.interfaces.Size() || base == InvalidIndex)
      return false;
    if (derived == base)
      return true;
    const auto &parents = reg.interfaces[derived].parents;
    for (NGIN::UIntSize i = 0; i < parents.Size(); ++i)
    {
      if (IsSameOrDerivedInterface(parents[i], base))
        return true;
    }
    return false;
  }

  NGIN::UInt32 FindPropertyIndex(NGIN::UInt32 classIndex, std::string_view name) noexcept
  {
    const auto &reg = GetRegistry();
    if (classIndex >= reg.classes.Size())
      return InvalidIndex;
    NameId nid{};
    if (!FindNameId(name, nid))
      return InvalidIndex;
    if (auto *p = reg.classes[classIndex].propertyIndex.GetPtr(nid))
      return *p;
    return InvalidIndex;
  }

  NGIN::UInt32 FindPropertyIndexFrom(NGIN::UInt32 classIndex, std::string_view name, NGIN::UInt32 contextIndex) noexcept
  {
    const auto idx = FindPropertyIndex(classIndex, name);
    if (idx == InvalidIndex || contextIndex == InvalidIndex)
      return idx;
    const auto &cdesc = GetRegistry().classes[classIndex];
    const auto &found = cdesc.properties[idx];
    if (found.ownerIndex == contextIndex)
      return idx;
    for (NGIN::UIntSize i = 0; i < cdesc.shadowed.Size(); ++i)
    {
      const auto &hidden = cdesc.properties[cdesc.shadowed[i]];
      if (hidden.nameId == found.nameId && hidden.ownerIndex == contextIndex)
        return cdesc.shadowed[i];
    }
    return idx;
  }

  const PropertySlot *FindProperty(NGIN::UInt32 classIndex, std::string_view name) noexcept
  {
    const auto idx = FindPropertyIndex(classIndex, name);
    if (idx == InvalidIndex)
      return nullptr;
    return &GetRegistry().classes[classIndex].properties[idx];
  }

  const MemberDescriptor &DescriptorOf(const PropertySlot &p) noexcept
  {
    return GetRegistry().classes[p.ownerIndex].members[p.memberIndex];
  }

} // namespace NGIN::ObjectModel::detail

namespace NGIN::ObjectModel
{

  using detail::GetRegistry;
  namespace
  {
    bool IsClassAlive(ClassHandle h)
    {
      return h.IsValid() && h.index < GetRegistry().classes.Size();
    }

    bool IsInterfaceAlive(InterfaceHandle h)
    {
      return h.IsValid() && h.index < GetRegistry().interfaces.Size();
    }
  } // namespace

  bool Class::IsValid() const noexcept { return IsClassAlive(m_h); }

  std::string_view Class::Name() const
  {
    if (!IsClassAlive(m_h))
      return {};
    return GetRegistry().classes[m_h.index].name;
  }

  ModuleId Class::GetModuleId() const
  {
    if (!IsClassAlive(m_h))
      return 0;
    return GetRegistry().classes[m_h.index].moduleId;
  }

  std::optional<Class> Class::Parent() const
  {
    if (!IsClassAlive(m_h))
      return std::nullopt;
    const auto parent = GetRegistry().classes[m_h.index].parentIndex;
    if (parent == detail::InvalidIndex)
      return std::nullopt;
    return Class{ClassHandle{parent}};
  }

  bool Class::IsAbstract() const
  {
    return IsClassAlive(m_h) && GetRegistry().classes[m_h.index].isAbstract;
  }

  bool Class::IsFinal() const
  {
    return IsClassAlive(m_h) && GetRegistry().classes[m_h.index].isFinal;
  }

  bool Class::IsEncapsulated() const
  {
    return IsClassAlive(m_h) && GetRegistry().classes[m_h.index].isEncapsulated;
  }

  bool Class::IsSubclassOf(const Class &base) const
  {
    if (!IsClassAlive(m_h) || !IsClassAlive(base.m_h))
      return false;
    return detail::IsSameOrDerived(m_h.index, base.m_h.index);
  }

  NGIN::UIntSize Class::MemberCount() const
  {
    if (!IsClassAlive(m_h))
      return 0;
    return GetRegistry().classes[m_h.index].members.Size();
  }

  MemberDescriptor Class::MemberAt(NGIN::UIntSize i) const
  {
    if (!IsClassAlive(m_h))
      return MemberDescriptor{};
    const auto &members = GetRegistry().classes[m_h.index].members;
    if (i >= members.Size())
      return MemberDescriptor{};
    return members[i];
  }

  std::optional<MemberDescriptor> Class::FindMember(std::string_view name) const
  {
    if (!IsClassAlive(m_h))
      return std::nullopt;
    if (const auto *p = detail::FindProperty(m_h.index, name))
      return detail::DescriptorOf(*p);
    return std::nullopt;
  }

  NGIN::UIntSize Class::InterfaceCount() const
  {
    if (!IsClassAlive(m_h))
      return 0;
    return GetRegistry().classes[m_h.index].interfaces.Size();
  }

  Interface Class::InterfaceAt(NGIN::UIntSize i) const
  {
    if (!IsClassAlive(m_h))
      return Interface{};
    const auto &ifaces = GetRegistry().classes[m_h.index].interfaces;
    if (i >= ifaces.Size())
      return Interface{};
    return Interface{InterfaceHandle{ifaces[i]}};
  }

  bool Interface::IsValid() const noexcept { return IsInterfaceAlive(m_h); }

  std::string_view Interface::Name() const
  {
    if (!IsInterfaceAlive(m_h))
      return {};
    return GetRegistry().interfaces[m_h.index].name;
  }

  ModuleId Interface::GetModuleId() const
  {
    if (!IsInterfaceAlive(m_h))
      return 0;
    return GetRegistry().interfaces[m_h.index].moduleId;
  }

  NGIN::UIntSize Interface::ParentCount() const
  {
    if (!IsInterfaceAlive(m_h))
      return 0;
    return GetRegistry().interfaces[m_h.index].parents.Size();
  }

  Interface Interface::ParentAt(NGIN::UIntSize i) const
  {
    if (!IsInterfaceAlive(m_h))
      return Interface{};
    const auto &parents = GetRegistry().interfaces[m_h.index].parents;
    if (i >= parents.Size())
      return Interface{};
    return Interface{InterfaceHandle{parents[i]}};
  }

  bool Interface::IsDerivedFrom(const Interface &base) const
  {
    if (!IsInterfaceAlive(m_h) || !IsInterfaceAlive(base.m_h))
      return false;
    return detail::IsSameOrDerivedInterface(m_h.index, base.m_h.index);
  }

  NGIN::UIntSize Interface::RequiredCount() const
  {
    if (!IsInterfaceAlive(m_h))
      return 0;
    return GetRegistry().interfaces[m_h.index].required.Size();
  }

  Requirement Interface::RequirementAt(NGIN::UIntSize i) const
  {
    if (!IsInterfaceAlive(m_h))
      return Requirement{};
    const auto &required = GetRegistry().interfaces[m_h.index].required;
    if (i >= required.Size())
      return Requirement{};
    return required[i];
  }

  std::optional<Requirement> Interface::FindRequirement(std::string_view name) const
  {
    if (!IsInterfaceAlive(m_h))
      return std::nullopt;
    const auto &idesc = GetRegistry().interfaces[m_h.index];
    NameId nid{};
    if (detail::FindNameId(name, nid))
    {
      if (auto *p = idesc.requiredIndex.GetPtr(nid))
        return idesc.required[*p];
    }
    return std::nullopt;
  }

  ExpectedClass GetClass(std::string_view name)
  {
    if (auto c = FindClass(name))
      return *c;
    return std::unexpected(Error{ErrorCode::NotFound, "class not found"});
  }

  std::optional<Class> FindClass(std::string_view name)
  {
    const auto &reg = GetRegistry();
    NameId nid{};
    if (detail::FindNameId(name, nid))
    {
      if (auto *p = reg.classByName.GetPtr(nid))
        return Class{ClassHandle{*p}};
    }
    return std::nullopt;
  }

  ExpectedInterface GetInterface(std::string_view name)
  {
    if (auto i = FindInterface(name))
      return *i;
    return std::unexpected(Error{ErrorCode::NotFound, "interface not found"});
  }

  std::optional<Interface> FindInterface(std::string_view name)
  {
    const auto &reg = GetRegistry();
    NameId nid{};
    if (detail::FindNameId(name, nid))
    {
      if (auto *p = reg.interfaceByName.GetPtr(nid))
        return Interface{InterfaceHandle{*p}};
    }
    return std::nullopt;
  }

} // namespace NGIN::ObjectModel
