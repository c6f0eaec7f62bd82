// Registry.hpp
// Process-wide class and interface tables backing every handle
#pragma once

#include <NGIN/Primitives.hpp>
#include <NGIN/Containers/Vector.hpp>
#include <NGIN/Containers/HashMap.hpp>
#include <NGIN/Utilities/StringInterner.hpp>

#include <memory>
#include <string_view>

#include <NGIN/ObjectModel/Export.hpp>
#include <NGIN/ObjectModel/Types.hpp>
#include <NGIN/ObjectModel/Descriptor.hpp>

namespace NGIN::ObjectModel::detail
{
  using StringInterner = NGIN::Utilities::StringInterner<>;

  inline constexpr NGIN::UInt32 InvalidIndex = static_cast<NGIN::UInt32>(-1);

  // Convenience wrappers using the global registry interner
  NGIN_OBJECTMODEL_API NameId InternNameId(std::string_view s) noexcept;
  NGIN_OBJECTMODEL_API bool FindNameId(std::string_view s, NameId &out) noexcept;
  NGIN_OBJECTMODEL_API std::string_view NameFromId(NameId id) noexcept;

  // One committed-or-not value cell. Used for instance storage, static storage and
  // class-level constant values.
  struct MemberSlot
  {
    Any value{Any::MakeVoid()};
    bool committed{false};
  };

  struct InstanceState;

  // Everything a slot handler needs to serve one access. Indices rather than
  // pointers: handlers may run user code that grows the registry.
  struct SlotAccess
  {
    std::shared_ptr<InstanceState> instance; // null for class-level access
    NGIN::UInt32 receiverIndex{InvalidIndex};
    NGIN::UInt32 propertyIndex{InvalidIndex}; // into the receiver's properties
    NGIN::UInt32 ownerIndex{InvalidIndex};
    NGIN::UInt32 memberIndex{InvalidIndex};
    bool enforce{true}; // visibility checks; false on raw classes
  };

  using SlotGetter = Expected<Any> (*)(const SlotAccess &);
  using SlotSetter = Expected<void> (*)(const SlotAccess &, const Any &);
  using SlotDeleter = Expected<void> (*)(const SlotAccess &);

  // Effective member table entry, installed once when a class is defined.
  struct PropertySlot
  {
    NameId nameId{static_cast<NameId>(-1)};
    NGIN::UInt32 ownerIndex{InvalidIndex};  // class that declared the descriptor
    NGIN::UInt32 memberIndex{InvalidIndex}; // index into owner's members
    SlotGetter Get{nullptr};
    SlotSetter Set{nullptr};
    SlotDeleter Delete{nullptr};
  };

  struct ClassRuntimeDesc
  {
    std::string_view name;
    NameId nameId{static_cast<NameId>(-1)};
    ModuleId moduleId{0};
    NGIN::UInt32 parentIndex{InvalidIndex};
    bool isAbstract{false};
    bool isFinal{false};
    bool isEncapsulated{false};
    // Own declarations, in declaration order.
    NGIN::Containers::Vector<MemberDescriptor> members;
    // Parallel to members: static storage and class-level constant values.
    NGIN::Containers::Vector<MemberSlot> classSlots;
    // Own and inherited members, most-derived wins.
    NGIN::Containers::Vector<PropertySlot> properties;
    NGIN::Containers::FlatHashMap<NameId, NGIN::UInt32> propertyIndex;
    // Entries of properties hidden by a redeclaration: private members of an
    // ancestor, still resolved for code declared in that ancestor.
    NGIN::Containers::Vector<NGIN::UInt32> shadowed;
    NGIN::Containers::Vector<NGIN::UInt32> interfaces;
    MethodFn constructor{nullptr};
    NGIN::UIntSize constructorArity{0};
  };

  struct InterfaceRuntimeDesc
  {
    std::string_view name;
    NameId nameId{static_cast<NameId>(-1)};
    ModuleId moduleId{0};
    NGIN::Containers::Vector<NGIN::UInt32> parents;
    // Own plus all ancestors' requirements.
    NGIN::Containers::Vector<Requirement> required;
    NGIN::Containers::FlatHashMap<NameId, NGIN::UInt32> requiredIndex;
  };

  struct OrdinaryAttribute
  {
    NameId nameId{static_cast<NameId>(-1)};
    Any value{Any::MakeVoid()};
    bool present{false};
  };

  struct InstanceState
  {
    NGIN::UInt32 classIndex{InvalidIndex};
    NGIN::UInt64 instanceId{0};
    // Parallel to the class's properties; only instance-scope entries are used.
    NGIN::Containers::Vector<MemberSlot> slots;
    // Undeclared attributes, present until deleted.
    NGIN::Containers::Vector<OrdinaryAttribute> ordinary;
    NGIN::Containers::FlatHashMap<NameId, NGIN::UInt32> ordinaryIndex;
  };

  struct Registry
  {
    NGIN::Containers::Vector<ClassRuntimeDesc> classes;
    NGIN::Containers::FlatHashMap<NameId, NGIN::UInt32> classByName;
    NGIN::Containers::Vector<InterfaceRuntimeDesc> interfaces;
    NGIN::Containers::FlatHashMap<NameId, NGIN::UInt32> interfaceByName;
    NGIN::UInt64 nextInstanceId{1};

    StringInterner names;
  };

  NGIN_OBJECTMODEL_API Registry &GetRegistry() noexcept;

  // Lineage queries over the single-inheritance chain.
  NGIN_OBJECTMODEL_API bool IsSameOrDerived(NGIN::UInt32 derived, NGIN::UInt32 base) noexcept;
  NGIN_OBJECTMODEL_API bool InSameLineage(NGIN::UInt32 a, NGIN::UInt32 b) noexcept;
  NGIN_OBJECTMODEL_API bool IsSameOrDerivedInterface(NGIN::UInt32 derived, NGIN::UInt32 base) noexcept;

  // Effective property lookup on a class; null when the name is undeclared in the lineage.
  NGIN_OBJECTMODEL_API const PropertySlot *FindProperty(NGIN::UInt32 classIndex, std::string_view name) noexcept;
  NGIN_OBJECTMODEL_API NGIN::UInt32 FindPropertyIndex(NGIN::UInt32 classIndex, std::string_view name) noexcept;
  // As FindPropertyIndex, but code declared in `contextIndex` sees its own private
  // member even where a descendant redeclared the name.
  NGIN_OBJECTMODEL_API NGIN::UInt32 FindPropertyIndexFrom(NGIN::UInt32 classIndex, std::string_view name, NGIN::UInt32 contextIndex) noexcept;
  NGIN_OBJECTMODEL_API const MemberDescriptor &DescriptorOf(const PropertySlot &p) noexcept;

  // Installs the handler triple for a descriptor.
  NGIN_OBJECTMODEL_API void BindHandlers(PropertySlot &p, const MemberDescriptor &desc) noexcept;

} // namespace NGIN::ObjectModel::detail
