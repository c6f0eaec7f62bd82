// ClassBuilder.hpp
// Collects a class body and admits it to the registry after the definition-time gates
#pragma once

#include <NGIN/Primitives.hpp>
#include <NGIN/Containers/Vector.hpp>

#include <optional>
#include <string_view>

#include <NGIN/ObjectModel/Export.hpp>
#include <NGIN/ObjectModel/Types.hpp>
#include <NGIN/ObjectModel/Descriptor.hpp>
#include <NGIN/ObjectModel/Interface.hpp>
#include <NGIN/ObjectModel/Object.hpp>

namespace NGIN::ObjectModel
{

  /**
   * Fluent class definition.
   *
   * Nothing reaches the registry until Define(). Define() rejects, in order:
   * a builder already used, an undefined or final parent, duplicate or malformed
   * members, redeclared final methods, and any member required by an implemented
   * interface that the own-or-inherited table lacks. After a successful Define()
   * the member table is closed.
   *
   * Classes are raw unless Encapsulate(), Abstract(), Final() or Implements() is
   * applied, or the parent is encapsulated. Raw classes skip visibility checks;
   * typed members are still validated and constants and methods stay read-only.
   */
  class NGIN_OBJECTMODEL_API ClassBuilder
  {
  public:
    explicit ClassBuilder(std::string_view name, ModuleId moduleId = 0);

    ClassBuilder &Extends(const Class &parent);
    // Idempotent.
    ClassBuilder &Encapsulate();
    ClassBuilder &Abstract();
    ClassBuilder &Final();
    ClassBuilder &Implements(const Interface &iface);
    ClassBuilder &Declare(MemberDecl decl);
    ClassBuilder &Constructor(NGIN::UIntSize arity, MethodFn fn);

    [[nodiscard]] ExpectedClass Define();

  private:
    std::string_view m_name;
    ModuleId m_moduleId{0};
    std::optional<Class> m_parent;
    bool m_parentInvalid{false};
    bool m_encapsulated{false};
    bool m_abstract{false};
    bool m_final{false};
    NGIN::Containers::Vector<Interface> m_interfaces;
    NGIN::Containers::Vector<MemberDescriptor> m_members;
    MethodFn m_constructor{nullptr};
    NGIN::UIntSize m_constructorArity{0};
    bool m_defined{false};
  };

} // namespace NGIN::ObjectModel
