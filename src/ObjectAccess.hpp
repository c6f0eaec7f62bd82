// ObjectAccess.hpp
// Library-internal: construction of Object/BoundMethod/Self and the intercepted access path
#pragma once

#include <memory>
#include <span>
#include <string_view>

#include <NGIN/ObjectModel/Object.hpp>
#include <NGIN/ObjectModel/Registry.hpp>

namespace NGIN::ObjectModel::detail
{

  struct ObjectAccess
  {
    static Object Wrap(std::shared_ptr<InstanceState> state) { return Object{std::move(state)}; }
    static const std::shared_ptr<InstanceState> &State(const Object &obj) noexcept { return obj.m_state; }

    static BoundMethod Bind(std::shared_ptr<InstanceState> instance,
                            NGIN::UInt32 receiverIndex,
                            NGIN::UInt32 ownerIndex,
                            NGIN::UInt32 memberIndex)
    {
      BoundMethod m;
      m.m_instance = std::move(instance);
      m.m_receiverIndex = receiverIndex;
      m.m_ownerIndex = ownerIndex;
      m.m_memberIndex = memberIndex;
      return m;
    }

    static Self MakeSelf(std::shared_ptr<InstanceState> instance, NGIN::UInt32 receiverIndex, NGIN::UInt32 contextIndex)
    {
      Self s;
      s.m_instance = std::move(instance);
      s.m_receiverIndex = receiverIndex;
      s.m_contextIndex = contextIndex;
      return s;
    }
  };

  // The intercepted attribute path shared by Class, Object and Self. `instance` is
  // null for class-level access; `receiverIndex` is the class whose effective
  // member table resolves the name.
  Expected<Any> ReadMember(const std::shared_ptr<InstanceState> &instance,
                           NGIN::UInt32 receiverIndex,
                           std::string_view name,
                           const AccessContext &ctx);
  Expected<void> WriteMember(const std::shared_ptr<InstanceState> &instance,
                             NGIN::UInt32 receiverIndex,
                             std::string_view name,
                             const Any &value,
                             const AccessContext &ctx);
  Expected<void> DeleteMember(const std::shared_ptr<InstanceState> &instance,
                              NGIN::UInt32 receiverIndex,
                              std::string_view name,
                              const AccessContext &ctx);
  // Read, then call the resolved bound method.
  Expected<Any> InvokeMember(const std::shared_ptr<InstanceState> &instance,
                             NGIN::UInt32 receiverIndex,
                             std::string_view name,
                             std::span<const Any> args,
                             const AccessContext &ctx);

  // Runs a method body with a Self bound to the declaring class.
  Expected<Any> CallMethod(const std::shared_ptr<InstanceState> &instance,
                           NGIN::UInt32 receiverIndex,
                           NGIN::UInt32 ownerIndex,
                           NGIN::UInt32 memberIndex,
                           std::span<const Any> args);

} // namespace NGIN::ObjectModel::detail
