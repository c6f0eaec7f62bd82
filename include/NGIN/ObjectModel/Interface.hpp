// Interface.hpp
// Interface contracts and conformance checks (declared and structural)
#pragma once

#include <NGIN/Primitives.hpp>
#include <NGIN/Containers/Vector.hpp>

#include <optional>
#include <string_view>

#include <NGIN/ObjectModel/Export.hpp>
#include <NGIN/ObjectModel/Types.hpp>
#include <NGIN/ObjectModel/Descriptor.hpp>

namespace NGIN::ObjectModel
{

  class NGIN_OBJECTMODEL_API Interface
  {
  public:
    constexpr Interface() = default;
    explicit constexpr Interface(InterfaceHandle h) : m_h(h) {}

    [[nodiscard]] bool IsValid() const noexcept;
    [[nodiscard]] constexpr InterfaceHandle Handle() const noexcept { return m_h; }
    [[nodiscard]] constexpr TypeTag Tag() const noexcept { return TypeTag::Of(m_h); }

    [[nodiscard]] std::string_view Name() const;
    [[nodiscard]] ModuleId GetModuleId() const;

    [[nodiscard]] NGIN::UIntSize ParentCount() const;
    [[nodiscard]] Interface ParentAt(NGIN::UIntSize i) const;
    // True for the interface itself and every interface extending `base`, directly or not.
    [[nodiscard]] bool IsDerivedFrom(const Interface &base) const;

    // Required members, own and inherited.
    [[nodiscard]] NGIN::UIntSize RequiredCount() const;
    [[nodiscard]] Requirement RequirementAt(NGIN::UIntSize i) const;
    [[nodiscard]] std::optional<Requirement> FindRequirement(std::string_view name) const;

    constexpr bool operator==(const Interface &other) const noexcept { return m_h == other.m_h; }

  private:
    InterfaceHandle m_h{};
  };

  /**
   * Collects an interface contract. Members whose name starts with '_' and members
   * declared through Hidden() are part of the interface body but not required.
   * Errors are deferred: the first one is returned from Define().
   */
  class NGIN_OBJECTMODEL_API InterfaceBuilder
  {
  public:
    explicit InterfaceBuilder(std::string_view name, ModuleId moduleId = 0);

    InterfaceBuilder &Extends(const Interface &parent);
    InterfaceBuilder &Method(std::string_view name, NGIN::UIntSize arity);
    InterfaceBuilder &Member(std::string_view name);
    InterfaceBuilder &Hidden(std::string_view name);

    [[nodiscard]] ExpectedInterface Define();

  private:
    void Add(std::string_view name, RequirementKind kind, NGIN::UIntSize arity, bool hidden);

    std::string_view m_name;
    ModuleId m_moduleId{0};
    NGIN::Containers::Vector<NGIN::UInt32> m_parents;
    NGIN::Containers::Vector<Requirement> m_own;
    NGIN::Containers::Vector<NameId> m_declared;
    std::optional<Error> m_error;
    bool m_defined{false};
  };

  // Duck typed: every requirement resolves on the object's external surface
  // (methods to a bound method of the same arity). Exact: some class in the
  // object's lineage declares the interface or one extending it.
  // A value that does not hold an Object conforms to nothing.
  [[nodiscard]] NGIN_OBJECTMODEL_API Expected<bool> InstanceOf(const Object &obj, const Interface &iface, bool duckTyped = true);
  [[nodiscard]] NGIN_OBJECTMODEL_API Expected<bool> InstanceOf(const Any &value, const Interface &iface, bool duckTyped = true);
  // Lineage membership.
  [[nodiscard]] NGIN_OBJECTMODEL_API Expected<bool> InstanceOf(const Object &obj, const Class &cls);
  [[nodiscard]] NGIN_OBJECTMODEL_API Expected<bool> InstanceOf(const Any &value, const Class &cls);

  // Name lookups; the latest definition under a name wins.
  [[nodiscard]] NGIN_OBJECTMODEL_API ExpectedInterface GetInterface(std::string_view name);
  [[nodiscard]] NGIN_OBJECTMODEL_API std::optional<Interface> FindInterface(std::string_view name);

} // namespace NGIN::ObjectModel
