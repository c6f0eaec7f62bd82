#include <NGIN/ObjectModel/Validation.hpp>
#include <NGIN/ObjectModel/Convert.hpp>
#include <NGIN/ObjectModel/Diagnostics.hpp>
#include <NGIN/ObjectModel/Interface.hpp>
#include <NGIN/ObjectModel/Object.hpp>
#include <NGIN/ObjectModel/Registry.hpp>

#include <optional>
#include <string>

namespace NGIN::ObjectModel
{

  namespace
  {
    constexpr std::string_view kNoCoercion = "no coercion to target type";

    template <class T>
    bool TryCoerceNative(const Any &value, NGIN::UInt64 target, std::optional<Any> &out)
    {
      if (target != detail::TypeIdOf<T>())
        return false;
      if (auto v = detail::ConvertAny<T>(value))
        out.emplace(Any{std::move(*v)});
      return true;
    }

    template <class... T>
    std::optional<Any> CoerceNative(const Any &value, NGIN::UInt64 target)
    {
      std::optional<Any> out;
      (void)(TryCoerceNative<T>(value, target, out) || ...);
      return out;
    }

    std::string_view OwnerName(const MemberDescriptor &desc) noexcept
    {
      if (!desc.owner.IsValid())
        return {};
      const auto &reg = detail::GetRegistry();
      if (desc.owner.index >= reg.classes.Size())
        return {};
      return reg.classes[desc.owner.index].name;
    }
  } // namespace

  bool MatchesTag(const Any &value, const TypeTag &tag)
  {
    switch (tag.kind)
    {
      case TypeTagKind::Native:
        return value.GetTypeId() == tag.id;
      case TypeTagKind::Class:
      {
        if (value.GetTypeId() != detail::TypeIdOf<Object>())
          return false;
        const auto &obj = value.Cast<Object>();
        if (!obj.IsValid())
          return false;
        return detail::IsSameOrDerived(obj.GetClass().Handle().index, static_cast<NGIN::UInt32>(tag.id));
      }
      case TypeTagKind::Interface:
      {
        auto r = InstanceOf(value, Interface{InterfaceHandle{static_cast<NGIN::UInt32>(tag.id)}});
        return r.has_value() && *r;
      }
      default:
        break;
    }
    return false;
  }

  Expected<Any> Coerce(const Any &value, const TypeTag &tag)
  {
    switch (tag.kind)
    {
      case TypeTagKind::Native:
      {
        auto out = CoerceNative<bool, char, signed char, unsigned char, short, unsigned short, int, unsigned int,
                                long, unsigned long, long long, unsigned long long, float, double, std::string>(value, tag.id);
        if (!out)
          return std::unexpected(Error{ErrorCode::InvalidValue, kNoCoercion});
        return std::move(*out);
      }
      case TypeTagKind::Class:
      {
        const Class cls{ClassHandle{static_cast<NGIN::UInt32>(tag.id)}};
        if (!cls.IsValid())
          return std::unexpected(Error{ErrorCode::InvalidArgument, "stale class handle"});
        auto obj = cls.New(std::span<const Any>{&value, 1});
        if (!obj.has_value())
          return std::unexpected(obj.error());
        return Any{std::move(*obj)};
      }
      default:
        break;
    }
    return std::unexpected(Error{ErrorCode::InvalidValue, kNoCoercion});
  }

  Expected<Any> Validate(const MemberDescriptor &desc, const Any &candidate)
  {
    const auto invalid = [&desc]() { return detail::Fail(detail::MakeInvalidValue(desc.name, OwnerName(desc))); };

    Any accepted = candidate;
    const auto typeCount = desc.declaredTypes.Size();
    if (typeCount > 0)
    {
      bool matched = false;
      for (NGIN::UIntSize i = 0; i < typeCount && !matched; ++i)
        matched = MatchesTag(candidate, desc.declaredTypes[i]);
      if (!matched)
      {
        if (typeCount != 1)
          return invalid();
        auto coerced = Coerce(candidate, desc.declaredTypes[0]);
        if (!coerced.has_value())
          return invalid();
        accepted = std::move(*coerced);
      }
    }
    if (desc.validator && !desc.validator(accepted))
      return invalid();
    return accepted;
  }

} // namespace NGIN::ObjectModel
