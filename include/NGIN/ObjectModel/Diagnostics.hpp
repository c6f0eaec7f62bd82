// Diagnostics.hpp
// Error rendering and an optional process-wide sink for enforcement failures
#pragma once

#include <expected>
#include <string>
#include <string_view>

#include <NGIN/ObjectModel/Export.hpp>
#include <NGIN/ObjectModel/Types.hpp>

namespace NGIN::ObjectModel
{

  /**
   * Receives every definition, access, abstract and invalid-value failure the
   * engine produces, before it is returned to the caller. `user` is passed through
   * unchanged. The library never writes to any stream on its own.
   */
  using DiagnosticSink = void (*)(const Error &error, void *user);

  NGIN_OBJECTMODEL_API void SetDiagnosticSink(DiagnosticSink sink, void *user = nullptr) noexcept;

  [[nodiscard]] NGIN_OBJECTMODEL_API std::string_view ToString(ErrorCode code) noexcept;
  [[nodiscard]] NGIN_OBJECTMODEL_API std::string_view ToString(AccessRule rule) noexcept;
  [[nodiscard]] NGIN_OBJECTMODEL_API std::string_view ToString(DefinitionFault fault) noexcept;

  // One-line description, e.g. "access denied (private): member 'weight' of class 'Apple'".
  [[nodiscard]] NGIN_OBJECTMODEL_API std::string FormatError(const Error &error);

  namespace detail
  {
    // Reports enforcement failures to the sink and wraps the error for return.
    NGIN_OBJECTMODEL_API std::unexpected<Error> Fail(const Error &error);

    NGIN_OBJECTMODEL_API Error MakeAccessDenied(AccessRule rule, std::string_view member, std::string_view className);
    NGIN_OBJECTMODEL_API Error MakeDefinitionError(DefinitionFault fault,
                                                  std::string_view message,
                                                  std::string_view className,
                                                  std::string_view member = {},
                                                  std::string_view interfaceName = {});
    NGIN_OBJECTMODEL_API Error MakeInvalidValue(std::string_view member, std::string_view className);
    NGIN_OBJECTMODEL_API Error MakeNotFound(std::string_view message, std::string_view member, std::string_view className);

    // Silences the sink while alive. Conformance probes use it so a failed probe
    // is not reported as an access failure.
    class NGIN_OBJECTMODEL_API ScopedSinkMute
    {
    public:
      ScopedSinkMute() noexcept;
      ~ScopedSinkMute();
      ScopedSinkMute(const ScopedSinkMute &) = delete;
      ScopedSinkMute &operator=(const ScopedSinkMute &) = delete;
    };
  } // namespace detail

} // namespace NGIN::ObjectModel
