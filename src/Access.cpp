#include <NGIN/ObjectModel/Access.hpp>
#include <NGIN/ObjectModel/Registry.hpp>

namespace NGIN::ObjectModel
{

  AccessDecision CheckVisibility(const MemberDescriptor &desc, const AccessContext &ctx) noexcept
  {
    switch (desc.visibility)
    {
      case Visibility::Public:
        return AccessDecision::Allow();
      case Visibility::Protected:
        if (ctx.IsExternal() || !desc.owner.IsValid())
          return AccessDecision::Deny(AccessRule::Protected);
        if (detail::InSameLineage(ctx.cls.index, desc.owner.index))
          return AccessDecision::Allow();
        return AccessDecision::Deny(AccessRule::Protected);
      case Visibility::Private:
        if (!ctx.IsExternal() && ctx.cls == desc.owner)
          return AccessDecision::Allow();
        return AccessDecision::Deny(AccessRule::Private);
      default:
        break;
    }
    return AccessDecision::Deny(AccessRule::Private);
  }

  AccessDecision CheckMutability(const MemberDescriptor &desc, Operation op, bool committed) noexcept
  {
    if (op == Operation::Read)
      return AccessDecision::Allow();
    if (desc.IsMethod())
      return AccessDecision::Deny(AccessRule::Method);
    if (desc.IsConstant())
    {
      if (op == Operation::Delete || committed)
        return AccessDecision::Deny(AccessRule::Constant);
    }
    return AccessDecision::Allow();
  }

  AccessDecision Check(const MemberDescriptor &desc, const AccessContext &ctx, Operation op, bool committed) noexcept
  {
    if (auto v = CheckVisibility(desc, ctx); !v)
      return v;
    return CheckMutability(desc, op, committed);
  }

  AccessDecision CheckUndeclared(ClassHandle receiver, const AccessContext &ctx) noexcept
  {
    if (ctx.IsExternal() || !receiver.IsValid())
      return AccessDecision::Deny(AccessRule::Undeclared);
    if (detail::IsSameOrDerived(receiver.index, ctx.cls.index))
      return AccessDecision::Allow();
    return AccessDecision::Deny(AccessRule::Undeclared);
  }

} // namespace NGIN::ObjectModel
