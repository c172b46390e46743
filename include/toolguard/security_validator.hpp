#ifndef TOOLGUARD_SECURITY_VALIDATOR_HPP
#define TOOLGUARD_SECURITY_VALIDATOR_HPP

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <toolguard/path_validator.hpp>
#include <toolguard/types.hpp>
#include <vector>

namespace toolguard
{

/// Default dispatch table (lower-case tool names)
const std::map<std::string, ToolClass>& default_tool_classes();

/// Immutable configuration snapshot read by a single validation call.
class SecurityPolicy
{
  public:
    /// Fills unset lists with the defaults and canonicalizes work_dir
    explicit SecurityPolicy(SecurityOptions options);

    /// Fully resolved options (work_dir canonical, lists always set)
    const SecurityOptions& options() const
    {
        return options_;
    }

    const std::string& work_dir() const
    {
        return options_.work_dir;
    }

    const std::vector<std::string>& forbidden_commands() const
    {
        return *options_.forbidden_commands;
    }

    const PathValidator& path_validator() const
    {
        return path_validator_;
    }

    /// Class a tool name is wired to (case-insensitive). std::nullopt = unrestricted.
    std::optional<ToolClass> tool_class(const std::string& tool_name) const;

    /// New snapshot from changed options. The workspace root of this snapshot is
    /// kept as is; options.work_dir is ignored.
    std::shared_ptr<const SecurityPolicy> reconfigure(SecurityOptions options) const;

  private:
    struct Resolved
    {
    };

    SecurityPolicy(SecurityOptions options, Resolved);

    static SecurityOptions resolve(SecurityOptions options);
    static void fill_defaults(SecurityOptions& options);

    SecurityOptions options_;
    PathValidator path_validator_;
    std::map<std::string, ToolClass> tool_classes_;
};

/// Security gate consulted before every tool invocation.
///
/// Configure once at startup, then share across threads. Every call reads one
/// immutable SecurityPolicy snapshot; set_* calls publish a new snapshot and are
/// mutually exclusive with each other. A call already in flight finishes against
/// the snapshot it started with.
///
/// @code
/// toolguard::SecurityValidator validator("/srv/agent/workspace");
/// if (auto denied = validator.check_permission("bash", {{"command", cmd}}))
///     return tool_error(denied->code_name(), denied->what());
/// run_shell(cmd);
/// @endcode
class SecurityValidator
{
  public:
    /// @param work_dir Workspace root; made absolute and canonical even if it does not exist
    explicit SecurityValidator(const std::string& work_dir);

    explicit SecurityValidator(SecurityOptions options);

    // Non-copyable (owns a mutex)
    SecurityValidator(const SecurityValidator&) = delete;
    SecurityValidator& operator=(const SecurityValidator&) = delete;

    // ========================================================================
    // Configuration
    // ========================================================================

    std::string work_dir() const;
    std::vector<std::string> forbidden_commands() const;
    std::vector<std::string> forbidden_paths() const;
    std::vector<std::string> allowed_dirs() const;

    /// Replace (not append) the forbidden command substrings
    void set_forbidden_commands(std::vector<std::string> commands);

    /// Replace (not append) the forbidden path entries
    void set_forbidden_paths(std::vector<std::string> paths);

    /// Replace (not append) the additional allowed roots
    void set_allowed_dirs(std::vector<std::string> dirs);

    /// Wire a tool name into the dispatch table (overrides a default entry)
    void set_tool_class(const std::string& tool_name, ToolClass tool_class);

    /// Receive every check_permission decision
    void set_audit_callback(AuditCallback callback);

    /// Current configuration snapshot
    std::shared_ptr<const SecurityPolicy> policy() const;

    // ========================================================================
    // Validation
    // ========================================================================

    /// Command validator with the current forbidden list
    Verdict validate_command(const std::string& command) const;

    /// Path validator: containment, forbidden paths, symlink escape
    Verdict validate_path(const std::string& path) const;

    /// Like validate_path, but returns the resolved target on success
    PathResult resolve_path(const std::string& path) const;

    /// Lexical canonicalization against the workspace and allowed roots
    PathResult sanitize(const std::string& path) const;

    /// Route a tool invocation to the validator for its class.
    /// Unknown tool names are allowed.
    Verdict check_permission(const std::string& tool_name, const json& params) const;

    /// Throwing form of check_permission
    /// @throws SecurityError if the invocation is denied
    void require_permission(const std::string& tool_name, const json& params) const;

    /// check_permission as an allow/deny result
    PermissionResult decide(const std::string& tool_name, const json& params) const;

  private:
    template <typename Mutator> void update(Mutator&& mutate);

    mutable std::mutex mutex_;
    std::shared_ptr<const SecurityPolicy> policy_;
};

/// Adapt a validator to the ToolPermissionCallback shape used by agent loops.
/// The callback keeps the validator alive.
ToolPermissionCallback make_permission_callback(std::shared_ptr<const SecurityValidator> validator);

} // namespace toolguard

#endif // TOOLGUARD_SECURITY_VALIDATOR_HPP
