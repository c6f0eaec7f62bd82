#include <NGIN/ObjectModel/ClassBuilder.hpp>
#include <NGIN/ObjectModel/Diagnostics.hpp>
#include <NGIN/ObjectModel/Registry.hpp>

namespace NGIN::ObjectModel
{

  using detail::GetRegistry;
  using detail::InvalidIndex;
  namespace
  {
    std::unexpected<Error> Reject(DefinitionFault fault,
                                  std::string_view message,
                                  std::string_view className,
                                  std::string_view member = {},
                                  std::string_view iface = {})
    {
      return detail::Fail(detail::MakeDefinitionError(fault, message, className, member, iface));
    }

    // Own declaration first, then the parent's effective table.
    const MemberDescriptor *Lookup(const NGIN::Containers::Vector<MemberDescriptor> &own,
                                   NGIN::UInt32 parentIndex,
                                   NameId nameId,
                                   std::string_view name)
    {
      for (NGIN::UIntSize i = 0; i < own.Size(); ++i)
      {
        if (own[i].nameId == nameId)
          return &own[i];
      }
      if (parentIndex == InvalidIndex)
        return nullptr;
      if (const auto *p = detail::FindProperty(parentIndex, name))
        return &detail::DescriptorOf(*p);
      return nullptr;
    }

    detail::MemberSlot InitialClassSlot(const MemberDescriptor &desc)
    {
      if (desc.IsMethod() || !desc.hasDefault)
        return detail::MemberSlot{};
      if (desc.IsConstant() || desc.IsStatic())
        return detail::MemberSlot{desc.defaultValue, true};
      return detail::MemberSlot{};
    }
  } // namespace

  ClassBuilder::ClassBuilder(std::string_view name, ModuleId moduleId)
      : m_moduleId(moduleId)
  {
    if (!name.empty())
      m_name = detail::NameFromId(detail::InternNameId(name));
  }

  ClassBuilder &ClassBuilder::Extends(const Class &parent)
  {
    if (!parent.IsValid())
    {
      m_parentInvalid = true;
      return *this;
    }
    m_parent = parent;
    return *this;
  }

  ClassBuilder &ClassBuilder::Encapsulate()
  {
    m_encapsulated = true;
    return *this;
  }

  ClassBuilder &ClassBuilder::Abstract()
  {
    m_abstract = true;
    m_encapsulated = true;
    return *this;
  }

  ClassBuilder &ClassBuilder::Final()
  {
    m_final = true;
    m_encapsulated = true;
    return *this;
  }

  ClassBuilder &ClassBuilder::Implements(const Interface &iface)
  {
    m_interfaces.PushBack(iface);
    m_encapsulated = true;
    return *this;
  }

  ClassBuilder &ClassBuilder::Declare(MemberDecl decl)
  {
    m_members.PushBack(decl.Take());
    return *this;
  }

  ClassBuilder &ClassBuilder::Constructor(NGIN::UIntSize arity, MethodFn fn)
  {
    m_constructor = fn;
    m_constructorArity = arity;
    return *this;
  }

  ExpectedClass ClassBuilder::Define()
  {
    if (m_defined)
      return Reject(DefinitionFault::MemberTableClosed, "class already defined", m_name);
    if (m_name.empty())
      return Reject(DefinitionFault::Malformed, "class name is empty", {});
    if (m_parentInvalid)
      return Reject(DefinitionFault::UnknownParent, "parent class is not defined", m_name);

    auto &reg = GetRegistry();
    const NGIN::UInt32 parentIndex = m_parent ? m_parent->Handle().index : InvalidIndex;
    if (parentIndex != InvalidIndex && reg.classes[parentIndex].isFinal)
      return Reject(DefinitionFault::SubclassFinal, "cannot subclass a final class", m_name);

    // Member table gates
    for (NGIN::UIntSize i = 0; i < m_members.Size(); ++i)
    {
      const auto &m = m_members[i];
      if (m.name.empty())
        return Reject(DefinitionFault::Malformed, "member name is empty", m_name);
      for (NGIN::UIntSize j = 0; j < i; ++j)
      {
        if (m_members[j].nameId == m.nameId)
          return Reject(DefinitionFault::DuplicateMember, "member declared twice", m_name, m.name);
      }
      if (m.isAbstract && !m.IsMethod())
        return Reject(DefinitionFault::Malformed, "only methods can be abstract", m_name, m.name);
      if (m.IsMethod() && !m.isAbstract && !m.body)
        return Reject(DefinitionFault::Malformed, "method has no body", m_name, m.name);
      if (m.isAbstract && m.isFinal)
        return Reject(DefinitionFault::Malformed, "abstract method cannot be final", m_name, m.name);
      if (parentIndex != InvalidIndex)
      {
        if (const auto *p = detail::FindProperty(parentIndex, m.name))
        {
          const auto &inherited = detail::DescriptorOf(*p);
          if (inherited.IsMethod() && inherited.isFinal)
            return Reject(DefinitionFault::OverrideFinal, "cannot override a final method", m_name, m.name);
        }
      }
    }

    // Explicit conformance
    for (NGIN::UIntSize i = 0; i < m_interfaces.Size(); ++i)
    {
      const auto &iface = m_interfaces[i];
      if (!iface.IsValid())
        return Reject(DefinitionFault::UnknownParent, "implemented interface is not defined", m_name);
      const auto count = iface.RequiredCount();
      for (NGIN::UIntSize r = 0; r < count; ++r)
      {
        const auto req = iface.RequirementAt(r);
        const auto *found = Lookup(m_members, parentIndex, req.nameId, req.name);
        if (!found)
          return Reject(DefinitionFault::MissingInterfaceMember, "missing interface member", m_name, req.name, iface.Name());
        if (req.kind == RequirementKind::Method && (!found->IsMethod() || found->arity != req.arity))
          return Reject(DefinitionFault::MissingInterfaceMember, "interface method signature mismatch", m_name, req.name, iface.Name());
      }
    }

    const auto index = static_cast<NGIN::UInt32>(reg.classes.Size());
    detail::ClassRuntimeDesc cdesc{};
    cdesc.name = m_name;
    cdesc.nameId = detail::InternNameId(m_name);
    cdesc.moduleId = m_moduleId;
    cdesc.parentIndex = parentIndex;
    cdesc.isAbstract = m_abstract;
    cdesc.isFinal = m_final;
    cdesc.isEncapsulated = m_encapsulated || (parentIndex != InvalidIndex && reg.classes[parentIndex].isEncapsulated);
    cdesc.constructor = m_constructor;
    cdesc.constructorArity = m_constructorArity;

    // Inherited entries keep their position; own members shadow or append.
    if (parentIndex != InvalidIndex)
    {
      const auto &parent = reg.classes[parentIndex];
      const auto &inherited = parent.properties;
      cdesc.properties.Reserve(inherited.Size() + m_members.Size());
      for (NGIN::UIntSize i = 0; i < inherited.Size(); ++i)
      {
        cdesc.properties.PushBack(inherited[i]);
        const auto *visible = parent.propertyIndex.GetPtr(inherited[i].nameId);
        if (visible && *visible == static_cast<NGIN::UInt32>(i))
          cdesc.propertyIndex.Insert(inherited[i].nameId, static_cast<NGIN::UInt32>(i));
      }
      for (NGIN::UIntSize i = 0; i < parent.shadowed.Size(); ++i)
        cdesc.shadowed.PushBack(parent.shadowed[i]);
    }

    for (NGIN::UIntSize i = 0; i < m_members.Size(); ++i)
    {
      auto &m = m_members[i];
      m.owner = ClassHandle{index};
      const auto memberIdx = static_cast<NGIN::UInt32>(i);

      detail::PropertySlot prop{};
      prop.nameId = m.nameId;
      prop.ownerIndex = index;
      prop.memberIndex = memberIdx;
      detail::BindHandlers(prop, m);
      if (auto *p = cdesc.propertyIndex.GetPtr(m.nameId))
      {
        // A redeclared private member stays reachable from its declaring class's code.
        const detail::PropertySlot previous = cdesc.properties[*p];
        if (detail::DescriptorOf(previous).visibility == Visibility::Private)
        {
          cdesc.properties.PushBack(previous);
          cdesc.shadowed.PushBack(static_cast<NGIN::UInt32>(cdesc.properties.Size() - 1));
        }
        cdesc.properties[*p] = prop;
      }
      else
      {
        cdesc.properties.PushBack(prop);
        cdesc.propertyIndex.Insert(m.nameId, static_cast<NGIN::UInt32>(cdesc.properties.Size() - 1));
      }

      cdesc.classSlots.PushBack(InitialClassSlot(m));
      cdesc.members.PushBack(std::move(m));
    }

    for (NGIN::UIntSize i = 0; i < m_interfaces.Size(); ++i)
      cdesc.interfaces.PushBack(m_interfaces[i].Handle().index);

    reg.classes.PushBack(std::move(cdesc));
    if (auto *p = reg.classByName.GetPtr(reg.classes[index].nameId))
      *p = index;
    else
      reg.classByName.Insert(reg.classes[index].nameId, index);
    m_defined = true;
    return Class{ClassHandle{index}};
  }

} // namespace NGIN::ObjectModel
