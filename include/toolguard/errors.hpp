#ifndef TOOLGUARD_ERRORS_HPP
#define TOOLGUARD_ERRORS_HPP

#include <nlohmann/json.hpp>
#include <optional>
#include <stdexcept>
#include <string>

namespace toolguard
{

/// Reason a tool invocation was denied
enum class ErrorCode
{
    EmptyInput,
    CommandTooLong,
    ForbiddenCommand,
    ShellInjectionDetected,
    PathTraversal,
    PathOutsideWorkspace,
    ForbiddenPath,
    SymlinkEscape,
    InvalidTargetType,
    MissingParameter
};

/// Stable identifier for an error code, e.g. "FORBIDDEN_PATH"
const char* error_code_name(ErrorCode code);

// Base exception
class ToolGuardError : public std::runtime_error
{
  public:
    explicit ToolGuardError(const std::string& message) : std::runtime_error(message) {}
};

// Policy denial
class SecurityError : public ToolGuardError
{
  public:
    SecurityError(ErrorCode code, const std::string& message)
        : ToolGuardError(message), code_(code)
    {
    }

    ErrorCode code() const
    {
        return code_;
    }

    const char* code_name() const
    {
        return error_code_name(code_);
    }

    /// {"code": "...", "message": "..."}
    nlohmann::json to_json() const;

  private:
    ErrorCode code_;
};

// Configuration could not be loaded or is malformed
class ConfigError : public ToolGuardError
{
  public:
    explicit ConfigError(const std::string& message) : ToolGuardError(message) {}
};

// Gated dispatcher has no handler for a tool name
class ToolNotFoundError : public ToolGuardError
{
  public:
    explicit ToolNotFoundError(const std::string& tool_name)
        : ToolGuardError("No handler registered for tool: " + tool_name), tool_name_(tool_name)
    {
    }

    const std::string& tool_name() const
    {
        return tool_name_;
    }

  private:
    std::string tool_name_;
};

/// Outcome of a validation: empty when the invocation is allowed.
using Verdict = std::optional<SecurityError>;

} // namespace toolguard

#endif // TOOLGUARD_ERRORS_HPP
