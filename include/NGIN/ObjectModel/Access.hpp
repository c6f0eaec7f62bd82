// Access.hpp
// Access control resolver: visibility and mutability decisions for one access attempt
#pragma once

#include <NGIN/Primitives.hpp>

#include <NGIN/ObjectModel/Export.hpp>
#include <NGIN/ObjectModel/Types.hpp>
#include <NGIN/ObjectModel/Descriptor.hpp>

namespace NGIN::ObjectModel
{

  // The class whose code is performing an access, or none for external callers.
  // Method bodies receive theirs through Self; nothing inspects the call stack.
  struct AccessContext
  {
    ClassHandle cls{};

    [[nodiscard]] static constexpr AccessContext External() noexcept { return AccessContext{}; }
    [[nodiscard]] static constexpr AccessContext Of(ClassHandle h) noexcept { return AccessContext{h}; }
    [[nodiscard]] constexpr bool IsExternal() const noexcept { return !cls.IsValid(); }
  };

  struct AccessDecision
  {
    bool allowed{true};
    AccessRule rule{AccessRule::None};

    [[nodiscard]] static constexpr AccessDecision Allow() noexcept { return AccessDecision{}; }
    [[nodiscard]] static constexpr AccessDecision Deny(AccessRule r) noexcept { return AccessDecision{false, r}; }
    constexpr explicit operator bool() const noexcept { return allowed; }
  };

  // public: always; protected: owner's ancestors and descendants; private: owner only.
  [[nodiscard]] NGIN_OBJECTMODEL_API AccessDecision CheckVisibility(const MemberDescriptor &desc, const AccessContext &ctx) noexcept;

  // Constants accept a single initializing write and are never deletable; methods are
  // never writable or deletable as data.
  [[nodiscard]] NGIN_OBJECTMODEL_API AccessDecision CheckMutability(const MemberDescriptor &desc, Operation op, bool committed) noexcept;

  // Visibility first, then mutability.
  [[nodiscard]] NGIN_OBJECTMODEL_API AccessDecision Check(const MemberDescriptor &desc,
                                                          const AccessContext &ctx,
                                                          Operation op,
                                                          bool committed = false) noexcept;

  // Undeclared (ordinary) attributes are reachable only from code bound to the
  // receiver's class or one of its ancestors.
  [[nodiscard]] NGIN_OBJECTMODEL_API AccessDecision CheckUndeclared(ClassHandle receiver, const AccessContext &ctx) noexcept;

} // namespace NGIN::ObjectModel
