// Object.hpp
// Augmented classes, their instances and the access context handed to method bodies
#pragma once

#include <NGIN/Primitives.hpp>

#include <array>
#include <memory>
#include <optional>
#include <span>
#include <string_view>
#include <type_traits>
#include <utility>

#include <NGIN/ObjectModel/Export.hpp>
#include <NGIN/ObjectModel/Types.hpp>
#include <NGIN/ObjectModel/Descriptor.hpp>
#include <NGIN/ObjectModel/Access.hpp>

namespace NGIN::ObjectModel
{

  namespace detail
  {
    struct InstanceState;
    struct ObjectAccess;

    template <class T>
    inline Expected<std::remove_cvref_t<T>> AnyAs(Expected<Any> r)
    {
      using U = std::remove_cvref_t<T>;
      if (!r.has_value())
        return std::unexpected(r.error());
      if (r->GetTypeId() != TypeIdOf<U>())
        return std::unexpected(Error{ErrorCode::InvalidArgument, "type-id mismatch"});
      return r->template Cast<U>();
    }
  } // namespace detail

  class NGIN_OBJECTMODEL_API Class
  {
  public:
    constexpr Class() = default;
    explicit constexpr Class(ClassHandle h) : m_h(h) {}

    [[nodiscard]] bool IsValid() const noexcept;
    [[nodiscard]] constexpr ClassHandle Handle() const noexcept { return m_h; }
    [[nodiscard]] constexpr TypeTag Tag() const noexcept { return TypeTag::Of(m_h); }
    // Context for code lexically bound to this class.
    [[nodiscard]] constexpr AccessContext Context() const noexcept { return AccessContext::Of(m_h); }

    [[nodiscard]] std::string_view Name() const;
    [[nodiscard]] ModuleId GetModuleId() const;
    [[nodiscard]] std::optional<Class> Parent() const;
    [[nodiscard]] bool IsAbstract() const;
    [[nodiscard]] bool IsFinal() const;
    [[nodiscard]] bool IsEncapsulated() const;
    // True for the class itself and every descendant of `base`.
    [[nodiscard]] bool IsSubclassOf(const Class &base) const;

    // Own declarations
    [[nodiscard]] NGIN::UIntSize MemberCount() const;
    [[nodiscard]] MemberDescriptor MemberAt(NGIN::UIntSize i) const;
    // Effective member table (own and inherited, most-derived wins)
    [[nodiscard]] std::optional<MemberDescriptor> FindMember(std::string_view name) const;

    [[nodiscard]] NGIN::UIntSize InterfaceCount() const;
    [[nodiscard]] Interface InterfaceAt(NGIN::UIntSize i) const;

    // Instantiation protocol: abstract check, member initialization, constructor.
    [[nodiscard]] ExpectedObject New(std::span<const Any> args = {}) const;
    template <class... A>
    [[nodiscard]] ExpectedObject Create(A &&...a) const
    {
      std::array<Any, sizeof...(A)> tmp{Any{std::forward<A>(a)}...};
      return New(std::span<const Any>{tmp.data(), tmp.size()});
    }

    // Class-level access: static members and class-level constant values.
    [[nodiscard]] Expected<Any> Get(std::string_view name, const AccessContext &ctx = AccessContext::External()) const;
    [[nodiscard]] Expected<void> Set(std::string_view name, const Any &value, const AccessContext &ctx = AccessContext::External()) const;
    [[nodiscard]] Expected<void> Delete(std::string_view name, const AccessContext &ctx = AccessContext::External()) const;
    [[nodiscard]] Expected<Any> Invoke(std::string_view name,
                                       std::span<const Any> args = {},
                                       const AccessContext &ctx = AccessContext::External()) const;

    template <class T>
    [[nodiscard]] Expected<std::remove_cvref_t<T>> GetAs(std::string_view name, const AccessContext &ctx = AccessContext::External()) const
    {
      return detail::AnyAs<T>(Get(name, ctx));
    }

    constexpr bool operator==(const Class &other) const noexcept { return m_h == other.m_h; }

  private:
    ClassHandle m_h{};
  };

  class NGIN_OBJECTMODEL_API Object
  {
  public:
    Object() = default;

    [[nodiscard]] bool IsValid() const noexcept { return m_state != nullptr; }
    [[nodiscard]] Class GetClass() const;
    [[nodiscard]] NGIN::UInt64 InstanceId() const noexcept;

    [[nodiscard]] Expected<Any> Get(std::string_view name, const AccessContext &ctx = AccessContext::External()) const;
    [[nodiscard]] Expected<void> Set(std::string_view name, const Any &value, const AccessContext &ctx = AccessContext::External()) const;
    [[nodiscard]] Expected<void> Delete(std::string_view name, const AccessContext &ctx = AccessContext::External()) const;
    [[nodiscard]] Expected<Any> Invoke(std::string_view name,
                                       std::span<const Any> args = {},
                                       const AccessContext &ctx = AccessContext::External()) const;

    template <class T>
    [[nodiscard]] Expected<std::remove_cvref_t<T>> GetAs(std::string_view name, const AccessContext &ctx = AccessContext::External()) const
    {
      return detail::AnyAs<T>(Get(name, ctx));
    }

    // External call with typed arguments and result.
    template <class R, class... A>
    [[nodiscard]] Expected<R> InvokeAs(std::string_view name, A &&...a) const
    {
      std::array<Any, sizeof...(A)> tmp{Any{std::forward<A>(a)}...};
      auto r = Invoke(name, std::span<const Any>{tmp.data(), tmp.size()});
      if (!r.has_value())
        return std::unexpected(r.error());
      if constexpr (std::is_void_v<R>)
        return {};
      else
        return detail::AnyAs<R>(std::move(r));
    }

    bool operator==(const Object &other) const noexcept { return m_state == other.m_state; }

  private:
    explicit Object(std::shared_ptr<detail::InstanceState> state) : m_state(std::move(state)) {}

    std::shared_ptr<detail::InstanceState> m_state;
    friend struct detail::ObjectAccess;
  };

  // A method resolved through an attribute read, bound to its receiver.
  class NGIN_OBJECTMODEL_API BoundMethod
  {
  public:
    BoundMethod() = default;

    [[nodiscard]] bool IsValid() const noexcept;
    [[nodiscard]] std::string_view Name() const;
    [[nodiscard]] NGIN::UIntSize Arity() const;
    [[nodiscard]] Expected<Any> Invoke(std::span<const Any> args = {}) const;

  private:
    std::shared_ptr<detail::InstanceState> m_instance; // null for static methods
    NGIN::UInt32 m_receiverIndex{static_cast<NGIN::UInt32>(-1)};
    NGIN::UInt32 m_ownerIndex{static_cast<NGIN::UInt32>(-1)};
    NGIN::UInt32 m_memberIndex{static_cast<NGIN::UInt32>(-1)};
    friend struct detail::ObjectAccess;
  };

  /**
   * Receiver of a running method or constructor. Every access made through it
   * carries the context of the class that declared the running code, so a base
   * class method reaches the base's private members even when invoked on a
   * subclass instance.
   */
  class NGIN_OBJECTMODEL_API Self
  {
  public:
    // Invalid inside static methods.
    [[nodiscard]] Object This() const;
    [[nodiscard]] Class GetClass() const;
    [[nodiscard]] Class DeclaringClass() const;
    [[nodiscard]] AccessContext Context() const noexcept;

    [[nodiscard]] Expected<Any> Get(std::string_view name) const;
    [[nodiscard]] Expected<void> Set(std::string_view name, const Any &value) const;
    [[nodiscard]] Expected<void> Delete(std::string_view name) const;
    [[nodiscard]] Expected<Any> Invoke(std::string_view name, std::span<const Any> args = {}) const;

    template <class T>
    [[nodiscard]] Expected<std::remove_cvref_t<T>> GetAs(std::string_view name) const
    {
      return detail::AnyAs<T>(Get(name));
    }

    template <class R, class... A>
    [[nodiscard]] Expected<R> InvokeAs(std::string_view name, A &&...a) const
    {
      std::array<Any, sizeof...(A)> tmp{Any{std::forward<A>(a)}...};
      auto r = Invoke(name, std::span<const Any>{tmp.data(), tmp.size()});
      if (!r.has_value())
        return std::unexpected(r.error());
      if constexpr (std::is_void_v<R>)
        return {};
      else
        return detail::AnyAs<R>(std::move(r));
    }

  private:
    Self() = default;

    std::shared_ptr<detail::InstanceState> m_instance;
    NGIN::UInt32 m_receiverIndex{static_cast<NGIN::UInt32>(-1)};
    NGIN::UInt32 m_contextIndex{static_cast<NGIN::UInt32>(-1)};
    friend struct detail::ObjectAccess;
  };

  // Name lookups; the latest definition under a name wins.
  [[nodiscard]] NGIN_OBJECTMODEL_API ExpectedClass GetClass(std::string_view name);
  [[nodiscard]] NGIN_OBJECTMODEL_API std::optional<Class> FindClass(std::string_view name);

} // namespace NGIN::ObjectModel
