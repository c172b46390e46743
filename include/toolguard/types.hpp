#ifndef TOOLGUARD_TYPES_HPP
#define TOOLGUARD_TYPES_HPP

#include <cstddef>
#include <functional>
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <toolguard/errors.hpp>
#include <utility>
#include <variant>
#include <vector>

namespace toolguard
{

// JSON type alias - tool parameters arrive as JSON objects
using json = nlohmann::json;

// ============================================================================
// Tool Classes
// ============================================================================

/// Validation class a tool name is wired to
enum class ToolClass
{
    Shell,  // requires "command", runs the command validator
    File,   // requires "path", runs the path validator
    Delete  // requires "path", path validator + regular-file target
};

/// "shell" | "file" | "delete"
const char* tool_class_name(ToolClass tool_class);

/// Parse a tool class name (case-insensitive). Returns std::nullopt if unknown.
std::optional<ToolClass> tool_class_from_string(const std::string& name);

// ============================================================================
// Path Results
// ============================================================================

/// Result of canonicalizing or validating a path
struct PathResult
{
    std::string path;                   // Canonical (or resolved) path on success
    std::optional<SecurityError> error; // Set on failure

    bool ok() const
    {
        return !error.has_value();
    }

    static PathResult success(std::string p)
    {
        return PathResult{std::move(p), std::nullopt};
    }

    static PathResult failure(ErrorCode code, const std::string& message)
    {
        return PathResult{"", SecurityError(code, message)};
    }
};

// ============================================================================
// Permission Result Types
// ============================================================================

/// Permission result: Allow
struct PermissionResultAllow
{
    std::string behavior = "allow";
};

/// Permission result: Deny
struct PermissionResultDeny
{
    std::string behavior = "deny";
    std::string message = "";
    std::optional<ErrorCode> code;
    bool interrupt = false;
};

/// Permission result variant (Allow or Deny)
using PermissionResult = std::variant<PermissionResultAllow, PermissionResultDeny>;

inline bool is_allowed(const PermissionResult& result)
{
    return std::holds_alternative<PermissionResultAllow>(result);
}

// ============================================================================
// Callback Function Types
// ============================================================================

/// Record of one permission decision
struct AuditEvent
{
    std::string tool_name;
    bool allowed = true;
    std::optional<ToolClass> tool_class;   // std::nullopt for unrestricted tools
    std::optional<ErrorCode> code;         // Set when denied
    std::string message;                   // Denial reason (empty when allowed)
};

/// Callback invoked for every check_permission decision.
/// Note: Executes on the calling thread, possibly concurrently - ensure callback is thread-safe.
using AuditCallback = std::function<void(const AuditEvent& event)>;

/// Callback shape used by agent loops to ask whether a tool may run.
/// @param tool_name Tool name (e.g., "bash", "Read", "delete")
/// @param input Tool-specific arguments
/// @return PermissionResult (allow, or deny with message and code)
using ToolPermissionCallback =
    std::function<PermissionResult(const std::string& tool_name, const json& input)>;

// ============================================================================
// Configuration Options
// ============================================================================

/// Longest shell command accepted by default (bytes)
constexpr std::size_t DEFAULT_MAX_COMMAND_LENGTH = 10000;

struct SecurityOptions
{
    /// Workspace root. Relative values are resolved against the process working directory;
    /// a leading "~" or "~/" is expanded with $HOME.
    std::string work_dir = ".";

    /// Replaces the default forbidden command list when set (even if empty)
    std::optional<std::vector<std::string>> forbidden_commands;

    /// Replaces the default forbidden path list when set (even if empty)
    std::optional<std::vector<std::string>> forbidden_paths;

    /// Longest shell command accepted, in bytes. 0 disables the cap.
    std::size_t max_command_length = DEFAULT_MAX_COMMAND_LENGTH;

    /// Additional roots where file operations are permitted
    std::vector<std::string> allowed_dirs;

    /// Extra dispatch wiring: tool name -> class. Merged over the defaults.
    std::map<std::string, ToolClass> tool_classes;

    /// Receives every permission decision
    std::optional<AuditCallback> audit_callback;

    /// Convert to JSON (audit_callback is not serialized)
    json to_json() const;

    /// Create from JSON. Throws ConfigError on wrong-typed fields or unknown tool classes.
    static SecurityOptions from_json(const json& j);
};

} // namespace toolguard

#endif // TOOLGUARD_TYPES_HPP
