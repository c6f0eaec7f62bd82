// Types.hpp
// Public-facing error codes, member classification enums and small handle types
#pragma once

#include <NGIN/Primitives.hpp>
#include <NGIN/Utilities/Any.hpp>
#include <string_view>
#include <expected>
#include <utility>

namespace NGIN::ObjectModel
{

  using Any = NGIN::Utilities::Any<>;
  using ModuleId = NGIN::UInt64;
  using NameId = NGIN::UInt32;

  enum class ErrorCode : unsigned
  {
    NotFound = 1,
    InvalidArgument = 2,
    Definition = 3,
    AccessDenied = 4,
    AbstractInstantiation = 5,
    AbstractMember = 6,
    InvalidValue = 7,
  };

  // Which rule rejected an access attempt.
  enum class AccessRule : unsigned char
  {
    None = 0,
    Private = 1,
    Protected = 2,
    Constant = 3,
    Method = 4,
    Undeclared = 5,
    InstanceScope = 6,
  };

  // Which definition-time gate rejected a class or interface.
  enum class DefinitionFault : unsigned char
  {
    None = 0,
    DuplicateMember = 1,
    MissingInterfaceMember = 2,
    SubclassFinal = 3,
    OverrideFinal = 4,
    Malformed = 5,
    MemberTableClosed = 6,
    UnknownParent = 7,
  };

  struct Error
  {
    ErrorCode code{ErrorCode::InvalidArgument};
    std::string_view message{};
    // Interned names; empty when not applicable.
    std::string_view member{};
    std::string_view className{};
    std::string_view interfaceName{};
    AccessRule rule{AccessRule::None};
    DefinitionFault fault{DefinitionFault::None};

    constexpr Error() = default;
    constexpr Error(ErrorCode c, std::string_view m) : code(c), message(m) {}
  };

  template <class T>
  using Expected = std::expected<T, Error>;

  enum class Visibility : unsigned char
  {
    Public = 0,
    Protected = 1,
    Private = 2,
  };

  // Where a member's storage lives: per instance, or shared by the class and all instances.
  enum class Scope : unsigned char
  {
    Instance = 0,
    Static = 1,
  };

  enum class Mutability : unsigned char
  {
    Variable = 0,
    Constant = 1,
    Method = 2,
  };

  enum class Operation : unsigned char
  {
    Read = 0,
    Write = 1,
    Delete = 2,
  };

  // Small opaque handles (indices into append-only registry tables).
  struct ClassHandle
  {
    NGIN::UInt32 index{static_cast<NGIN::UInt32>(-1)};
    constexpr bool IsValid() const noexcept { return index != static_cast<NGIN::UInt32>(-1); }
    constexpr bool operator==(const ClassHandle &) const noexcept = default;
  };

  struct InterfaceHandle
  {
    NGIN::UInt32 index{static_cast<NGIN::UInt32>(-1)};
    constexpr bool IsValid() const noexcept { return index != static_cast<NGIN::UInt32>(-1); }
    constexpr bool operator==(const InterfaceHandle &) const noexcept = default;
  };

  // Forward decls of high-level wrappers
  class Class;
  class Object;
  class Self;
  class BoundMethod;
  class Interface;
  class ClassBuilder;
  class InterfaceBuilder;

  using ExpectedClass = Expected<Class>;
  using ExpectedObject = Expected<Object>;
  using ExpectedInterface = Expected<Interface>;

} // namespace NGIN::ObjectModel
