// Descriptor.hpp
// Member descriptors: per-member visibility, mutability, scope and validation metadata
#pragma once

#include <NGIN/Primitives.hpp>
#include <NGIN/Containers/Vector.hpp>
#include <NGIN/Meta/TypeName.hpp>
#include <NGIN/Hashing/FNV.hpp>

#include <initializer_list>
#include <span>
#include <string_view>
#include <type_traits>
#include <utility>

#include <NGIN/ObjectModel/Export.hpp>
#include <NGIN/ObjectModel/Types.hpp>

namespace NGIN::ObjectModel
{

  namespace detail
  {
    // Compute FNV-based type id for a native type
    template <class T>
    inline NGIN::UInt64 TypeIdOf()
    {
      auto sv = NGIN::Meta::TypeName<std::remove_cv_t<std::remove_reference_t<T>>>::qualifiedName;
      return NGIN::Hashing::FNV1a64(sv.data(), sv.size());
    }
  } // namespace detail

  enum class TypeTagKind : unsigned char
  {
    Native = 0,
    Class = 1,
    Interface = 2,
  };

  // A declared type constraint: a native C++ type, a defined class, or an interface.
  struct TypeTag
  {
    TypeTagKind kind{TypeTagKind::Native};
    NGIN::UInt64 id{0}; // type id for Native, registry index otherwise

    template <class T>
    static TypeTag Of()
    {
      return TypeTag{TypeTagKind::Native, detail::TypeIdOf<T>()};
    }
    static constexpr TypeTag Of(ClassHandle h) noexcept { return TypeTag{TypeTagKind::Class, h.index}; }
    static constexpr TypeTag Of(InterfaceHandle h) noexcept { return TypeTag{TypeTagKind::Interface, h.index}; }

    constexpr bool operator==(const TypeTag &) const noexcept = default;
  };

  using MethodFn = Expected<Any> (*)(Self &, std::span<const Any>);
  using Validator = bool (*)(const Any &);

  struct MemberDescriptor
  {
    std::string_view name{};
    NameId nameId{static_cast<NameId>(-1)};
    Visibility visibility{Visibility::Public};
    Scope scope{Scope::Instance};
    Mutability mutability{Mutability::Variable};
    NGIN::Containers::Vector<TypeTag> declaredTypes;
    Validator validator{nullptr};
    Any defaultValue{Any::MakeVoid()};
    bool hasDefault{false};
    // Methods only
    NGIN::UIntSize arity{0};
    MethodFn body{nullptr};
    bool isAbstract{false};
    bool isFinal{false};
    // Fixed when the declaring class is admitted to the registry.
    ClassHandle owner{};

    [[nodiscard]] bool IsMethod() const noexcept { return mutability == Mutability::Method; }
    [[nodiscard]] bool IsConstant() const noexcept { return mutability == Mutability::Constant; }
    [[nodiscard]] bool IsStatic() const noexcept { return scope == Scope::Static; }
  };

  enum class RequirementKind : unsigned char
  {
    Data = 0,
    Method = 1,
  };

  // One entry of an interface contract: a name, its kind and, for methods, the arity.
  struct Requirement
  {
    std::string_view name{};
    NameId nameId{static_cast<NameId>(-1)};
    RequirementKind kind{RequirementKind::Method};
    NGIN::UIntSize arity{0};
  };

  // Fluent member declaration consumed by ClassBuilder::Declare.
  class MemberDecl
  {
  public:
    explicit MemberDecl(MemberDescriptor desc) : m_desc(std::move(desc)) {}

    MemberDecl &Types(std::initializer_list<TypeTag> tags)
    {
      for (const auto &t : tags)
        m_desc.declaredTypes.PushBack(t);
      return *this;
    }
    template <class... T>
    MemberDecl &Types()
    {
      (m_desc.declaredTypes.PushBack(TypeTag::Of<T>()), ...);
      return *this;
    }
    MemberDecl &Default(Any value)
    {
      m_desc.defaultValue = std::move(value);
      m_desc.hasDefault = true;
      return *this;
    }
    MemberDecl &Validate(Validator fn)
    {
      m_desc.validator = fn;
      return *this;
    }
    MemberDecl &WithVisibility(Visibility v)
    {
      m_desc.visibility = v;
      return *this;
    }
    MemberDecl &AsStatic()
    {
      m_desc.scope = Scope::Static;
      return *this;
    }
    MemberDecl &AsFinal()
    {
      m_desc.isFinal = true;
      return *this;
    }

    [[nodiscard]] const MemberDescriptor &Descriptor() const noexcept { return m_desc; }
    [[nodiscard]] MemberDescriptor Take() { return std::move(m_desc); }

  private:
    MemberDescriptor m_desc;
  };

  // Declaration factories. Names are interned on creation.
  [[nodiscard]] NGIN_OBJECTMODEL_API MemberDecl Variable(std::string_view name);
  [[nodiscard]] NGIN_OBJECTMODEL_API MemberDecl Public(std::string_view name);
  [[nodiscard]] NGIN_OBJECTMODEL_API MemberDecl Protected(std::string_view name);
  [[nodiscard]] NGIN_OBJECTMODEL_API MemberDecl Private(std::string_view name);
  [[nodiscard]] NGIN_OBJECTMODEL_API MemberDecl Static(std::string_view name);
  [[nodiscard]] NGIN_OBJECTMODEL_API MemberDecl Constant(std::string_view name, Any value);
  // Deferred constant: the first write on each owner commits it.
  [[nodiscard]] NGIN_OBJECTMODEL_API MemberDecl Constant(std::string_view name);
  [[nodiscard]] NGIN_OBJECTMODEL_API MemberDecl Method(std::string_view name, NGIN::UIntSize arity, MethodFn fn);
  [[nodiscard]] NGIN_OBJECTMODEL_API MemberDecl AbstractMethod(std::string_view name, NGIN::UIntSize arity);

} // namespace NGIN::ObjectModel
