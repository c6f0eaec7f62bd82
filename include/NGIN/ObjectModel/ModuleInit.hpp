#pragma once

#include <string_view>
#include <type_traits>
#include <utility>

#include <NGIN/ObjectModel/ClassBuilder.hpp>
#include <NGIN/ObjectModel/Interface.hpp>
#include <NGIN/Hashing/FNV.hpp>

namespace NGIN::ObjectModel
{

  /**
   * Helper used by plugin or module authors to define classes and interfaces in a
   * predictable, explicit fashion. Constructed with a module identifier so every
   * definition made through it is attributed to a specific binary.
   */
  class ModuleRegistration
  {
  public:
    constexpr explicit ModuleRegistration(std::string_view moduleName) noexcept
        : m_moduleName(moduleName),
          m_moduleId(NGIN::Hashing::FNV1a64(moduleName.data(), moduleName.size()))
    {
    }

    [[nodiscard]] constexpr std::string_view ModuleName() const noexcept
    {
      return m_moduleName;
    }

    [[nodiscard]] constexpr ModuleId GetModuleId() const noexcept
    {
      return m_moduleId;
    }

    /** Start a class definition owned by this module. */
    [[nodiscard]] ClassBuilder DefineClass(std::string_view name) const
    {
      return ClassBuilder{name, m_moduleId};
    }

    /** Start an interface definition owned by this module. */
    [[nodiscard]] InterfaceBuilder DefineInterface(std::string_view name) const
    {
      return InterfaceBuilder{name, m_moduleId};
    }

  private:
    std::string_view m_moduleName;
    ModuleId m_moduleId{0};
  };

  /**
   * Runs `fn` exactly once per module and only marks the module as initialized
   * when the callable succeeds. The callable receives a `ModuleRegistration`
   * helper. If it returns a `bool`, that value controls whether initialization
   * is considered successful.
   */
  template <class Fn>
  bool EnsureModuleInitialized(std::string_view moduleName, Fn &&fn)
  {
    static bool initialized = false;
    if (initialized)
      return true;

    ModuleRegistration registration{moduleName};

    using Result = std::invoke_result_t<Fn, ModuleRegistration &>;

    if constexpr (std::is_void_v<Result>)
    {
      std::forward<Fn>(fn)(registration);
      initialized = true;
      return true;
    }
    else
    {
      Result result = std::forward<Fn>(fn)(registration);
      if constexpr (std::is_convertible_v<Result, bool>)
      {
        if (!static_cast<bool>(result))
          return false;
      }
      initialized = true;
      return true;
    }
  }

} // namespace NGIN::ObjectModel
