#include <NGIN/ObjectModel/Diagnostics.hpp>

namespace NGIN::ObjectModel
{

  namespace
  {
    DiagnosticSink g_sink = nullptr;
    void *g_sinkUser = nullptr;
    unsigned g_muteDepth = 0;

    bool IsEnforcementFailure(ErrorCode code) noexcept
    {
      switch (code)
      {
        case ErrorCode::Definition:
        case ErrorCode::AccessDenied:
        case ErrorCode::AbstractInstantiation:
        case ErrorCode::AbstractMember:
        case ErrorCode::InvalidValue:
          return true;
        default:
          return false;
      }
    }
  } // namespace

  void SetDiagnosticSink(DiagnosticSink sink, void *user) noexcept
  {
    g_sink = sink;
    g_sinkUser = user;
  }

  std::string_view ToString(ErrorCode code) noexcept
  {
    switch (code)
    {
      case ErrorCode::NotFound: return "not found";
      case ErrorCode::InvalidArgument: return "invalid argument";
      case ErrorCode::Definition: return "definition error";
      case ErrorCode::AccessDenied: return "access denied";
      case ErrorCode::AbstractInstantiation: return "abstract instantiation";
      case ErrorCode::AbstractMember: return "abstract member";
      case ErrorCode::InvalidValue: return "invalid value";
      default: break;
    }
    return "unknown error";
  }

  std::string_view ToString(AccessRule rule) noexcept
  {
    switch (rule)
    {
      case AccessRule::None: return "none";
      case AccessRule::Private: return "private";
      case AccessRule::Protected: return "protected";
      case AccessRule::Constant: return "constant";
      case AccessRule::Method: return "method";
      case AccessRule::Undeclared: return "undeclared";
      case AccessRule::InstanceScope: return "instance scope";
      default: break;
    }
    return "unknown";
  }

  std::string_view ToString(DefinitionFault fault) noexcept
  {
    switch (fault)
    {
      case DefinitionFault::None: return "none";
      case DefinitionFault::DuplicateMember: return "duplicate member";
      case DefinitionFault::MissingInterfaceMember: return "missing interface member";
      case DefinitionFault::SubclassFinal: return "subclass of final class";
      case DefinitionFault::OverrideFinal: return "override of final method";
      case DefinitionFault::Malformed: return "malformed declaration";
      case DefinitionFault::MemberTableClosed: return "member table closed";
      case DefinitionFault::UnknownParent: return "unknown parent";
      default: break;
    }
    return "unknown";
  }

  std::string FormatError(const Error &error)
  {
    std::string out{ToString(error.code)};
    if (error.code == ErrorCode::AccessDenied && error.rule != AccessRule::None)
    {
      out += " (";
      out += ToString(error.rule);
      out += ")";
    }
    else if (error.code == ErrorCode::Definition && error.fault != DefinitionFault::None)
    {
      out += " (";
      out += ToString(error.fault);
      out += ")";
    }
    if (!error.message.empty())
    {
      out += ": ";
      out += error.message;
    }
    if (!error.member.empty())
    {
      out += "; member '";
      out += error.member;
      out += "'";
    }
    if (!error.className.empty())
    {
      out += " of class '";
      out += error.className;
      out += "'";
    }
    if (!error.interfaceName.empty())
    {
      out += " required by interface '";
      out += error.interfaceName;
      out += "'";
    }
    return out;
  }

  namespace detail
  {
    std::unexpected<Error> Fail(const Error &error)
    {
      if (g_sink && g_muteDepth == 0 && IsEnforcementFailure(error.code))
        g_sink(error, g_sinkUser);
      return std::unexpected(error);
    }

    Error MakeAccessDenied(AccessRule rule, std::string_view member, std::string_view className)
    {
      std::string_view message = "access denied";
      switch (rule)
      {
        case AccessRule::Private: message = "private member is only accessible from its declaring class"; break;
        case AccessRule::Protected: message = "protected member is only accessible from its class lineage"; break;
        case AccessRule::Constant: message = "cannot override or delete a constant"; break;
        case AccessRule::Method: message = "methods cannot be assigned or deleted"; break;
        case AccessRule::Undeclared: message = "undeclared attribute is only accessible from inside the class"; break;
        case AccessRule::InstanceScope: message = "instance member cannot be accessed from the class scope"; break;
        default: break;
      }
      Error e{ErrorCode::AccessDenied, message};
      e.rule = rule;
      e.member = member;
      e.className = className;
      return e;
    }

    Error MakeDefinitionError(DefinitionFault fault,
                              std::string_view message,
                              std::string_view className,
                              std::string_view member,
                              std::string_view interfaceName)
    {
      Error e{ErrorCode::Definition, message};
      e.fault = fault;
      e.className = className;
      e.member = member;
      e.interfaceName = interfaceName;
      return e;
    }

    Error MakeInvalidValue(std::string_view member, std::string_view className)
    {
      Error e{ErrorCode::InvalidValue, "invalid attribute value"};
      e.member = member;
      e.className = className;
      return e;
    }

    Error MakeNotFound(std::string_view message, std::string_view member, std::string_view className)
    {
      Error e{ErrorCode::NotFound, message};
      e.member = member;
      e.className = className;
      return e;
    }

    ScopedSinkMute::ScopedSinkMute() noexcept { ++g_muteDepth; }
    ScopedSinkMute::~ScopedSinkMute() { --g_muteDepth; }
  } // namespace detail

} // namespace NGIN::ObjectModel
