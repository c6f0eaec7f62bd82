// Convert.hpp - Any -> T coercion helpers shared by the validation engine
#pragma once

#include <NGIN/Primitives.hpp>

#include <charconv>
#include <cmath>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <utility>

#include <NGIN/ObjectModel/Types.hpp>
#include <NGIN/ObjectModel/Descriptor.hpp>

namespace NGIN::ObjectModel::detail
{

  template <class T>
  inline constexpr bool is_numeric_v = std::is_arithmetic_v<std::remove_cv_t<std::remove_reference_t<T>>>;

  // Text payloads accepted as coercion sources.
  inline std::optional<std::string_view> TextOf(const Any &src)
  {
    const auto tid = src.GetTypeId();
    if (tid == TypeIdOf<std::string>())
      return std::string_view{src.Cast<std::string>()};
    if (tid == TypeIdOf<std::string_view>())
      return src.Cast<std::string_view>();
    if (tid == TypeIdOf<const char *>())
    {
      const char *p = src.Cast<const char *>();
      if (p)
        return std::string_view{p};
    }
    return std::nullopt;
  }

  // Value-preserving arithmetic conversion: out-of-range values, non-finite values
  // bound for an integer, and negatives bound for an unsigned type are refused.
  // Floating to integer truncates toward zero.
  template <class Dest, class Src>
  inline std::optional<Dest> NarrowArithmetic(Src v)
  {
    if constexpr (std::is_same_v<Dest, bool>)
    {
      return v != Src{};
    }
    else if constexpr (std::is_floating_point_v<Dest>)
    {
      if constexpr (std::is_floating_point_v<Src>)
      {
        if (std::isfinite(v) &&
            (v > std::numeric_limits<Dest>::max() || v < std::numeric_limits<Dest>::lowest()))
          return std::nullopt;
      }
      return static_cast<Dest>(v);
    }
    else if constexpr (std::is_floating_point_v<Src>)
    {
      if (!std::isfinite(v))
        return std::nullopt;
      const long double x = v;
      if (x <= static_cast<long double>(std::numeric_limits<Dest>::lowest()) - 1.0L ||
          x >= static_cast<long double>(std::numeric_limits<Dest>::max()) + 1.0L)
        return std::nullopt;
      return static_cast<Dest>(v);
    }
    else
    {
      using Wide = std::conditional_t<std::is_signed_v<Src>, long long, unsigned long long>;
      const Wide w = static_cast<Wide>(v);
      if (std::cmp_less(w, static_cast<long long>(std::numeric_limits<Dest>::lowest())) ||
          std::cmp_greater(w, static_cast<unsigned long long>(std::numeric_limits<Dest>::max())))
        return std::nullopt;
      return static_cast<Dest>(v);
    }
  }

  template <class Dest>
  inline std::optional<Dest> ConvertArithmetic(const Any &src)
  {
    const auto tid = src.GetTypeId();
    if (tid == TypeIdOf<bool>())
      return NarrowArithmetic<Dest>(src.Cast<bool>());
    if (tid == TypeIdOf<signed char>())
      return NarrowArithmetic<Dest>(src.Cast<signed char>());
    if (tid == TypeIdOf<unsigned char>())
      return NarrowArithmetic<Dest>(src.Cast<unsigned char>());
    if (tid == TypeIdOf<char>())
      return NarrowArithmetic<Dest>(src.Cast<char>());
    if (tid == TypeIdOf<short>())
      return NarrowArithmetic<Dest>(src.Cast<short>());
    if (tid == TypeIdOf<unsigned short>())
      return NarrowArithmetic<Dest>(src.Cast<unsigned short>());
    if (tid == TypeIdOf<int>())
      return NarrowArithmetic<Dest>(src.Cast<int>());
    if (tid == TypeIdOf<unsigned int>())
      return NarrowArithmetic<Dest>(src.Cast<unsigned int>());
    if (tid == TypeIdOf<long>())
      return NarrowArithmetic<Dest>(src.Cast<long>());
    if (tid == TypeIdOf<unsigned long>())
      return NarrowArithmetic<Dest>(src.Cast<unsigned long>());
    if (tid == TypeIdOf<long long>())
      return NarrowArithmetic<Dest>(src.Cast<long long>());
    if (tid == TypeIdOf<unsigned long long>())
      return NarrowArithmetic<Dest>(src.Cast<unsigned long long>());
    if (tid == TypeIdOf<float>())
      return NarrowArithmetic<Dest>(src.Cast<float>());
    if (tid == TypeIdOf<double>())
      return NarrowArithmetic<Dest>(src.Cast<double>());
    if (tid == TypeIdOf<long double>())
      return NarrowArithmetic<Dest>(src.Cast<long double>());
    return std::nullopt;
  }

  // Whole-string parse; surrounding spaces are ignored.
  template <class Dest>
  inline std::optional<Dest> ParseArithmetic(std::string_view text)
  {
    while (!text.empty() && text.front() == ' ')
      text.remove_prefix(1);
    while (!text.empty() && text.back() == ' ')
      text.remove_suffix(1);
    if (text.empty())
      return std::nullopt;
    if constexpr (std::is_same_v<Dest, bool>)
    {
      if (text == "true" || text == "1")
        return true;
      if (text == "false" || text == "0")
        return false;
      return std::nullopt;
    }
    else
    {
      Dest out{};
      const auto *first = text.data();
      const auto *last = text.data() + text.size();
      auto [ptr, ec] = std::from_chars(first, last, out);
      if (ec != std::errc{} || ptr != last)
        return std::nullopt;
      return out;
    }
  }

  template <class Src>
  inline std::string FormatArithmetic(Src v)
  {
    if constexpr (std::is_same_v<Src, bool>)
    {
      return v ? std::string{"true"} : std::string{"false"};
    }
    else
    {
      char buf[64];
      auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), v);
      if (ec != std::errc{})
        return std::string{};
      return std::string{buf, ptr};
    }
  }

  inline std::optional<std::string> ArithmeticToString(const Any &src)
  {
    const auto tid = src.GetTypeId();
    if (tid == TypeIdOf<bool>())
      return FormatArithmetic(src.Cast<bool>());
    if (tid == TypeIdOf<int>())
      return FormatArithmetic(src.Cast<int>());
    if (tid == TypeIdOf<unsigned int>())
      return FormatArithmetic(src.Cast<unsigned int>());
    if (tid == TypeIdOf<long>())
      return FormatArithmetic(src.Cast<long>());
    if (tid == TypeIdOf<unsigned long>())
      return FormatArithmetic(src.Cast<unsigned long>());
    if (tid == TypeIdOf<long long>())
      return FormatArithmetic(src.Cast<long long>());
    if (tid == TypeIdOf<unsigned long long>())
      return FormatArithmetic(src.Cast<unsigned long long>());
    if (tid == TypeIdOf<float>())
      return FormatArithmetic(src.Cast<float>());
    if (tid == TypeIdOf<double>())
      return FormatArithmetic(src.Cast<double>());
    return std::nullopt;
  }

  // Try to convert Any -> To (exact match, arithmetic conversions, text parse and format)
  template <class To>
  inline std::optional<std::remove_cv_t<std::remove_reference_t<To>>> ConvertAny(const Any &src)
  {
    using Dest = std::remove_cv_t<std::remove_reference_t<To>>;
    if (src.GetTypeId() == TypeIdOf<Dest>())
      return src.Cast<Dest>();
    if constexpr (is_numeric_v<Dest>)
    {
      if (auto n = ConvertArithmetic<Dest>(src))
        return n;
      if (auto text = TextOf(src))
        return ParseArithmetic<Dest>(*text);
    }
    else if constexpr (std::is_same_v<Dest, std::string>)
    {
      if (auto text = TextOf(src))
        return std::string{*text};
      return ArithmeticToString(src);
    }
    return std::nullopt;
  }

} // namespace NGIN::ObjectModel::detail
