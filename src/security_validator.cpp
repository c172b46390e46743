#include "internal/string_utils.hpp"

#include <filesystem>
#include <initializer_list>
#include <toolguard/command_validator.hpp>
#include <toolguard/security_validator.hpp>

namespace fs = std::filesystem;

namespace toolguard
{

const std::map<std::string, ToolClass>& default_tool_classes()
{
    static const std::map<std::string, ToolClass> classes = {
        {"bash", ToolClass::Shell},     {"shell", ToolClass::Shell},
        {"execute", ToolClass::Shell},  {"file_read", ToolClass::File},
        {"file_write", ToolClass::File}, {"edit", ToolClass::File},
        {"read", ToolClass::File},      {"write", ToolClass::File},
        {"delete", ToolClass::Delete},  {"remove", ToolClass::Delete},
    };
    return classes;
}

// ============================================================================
// SecurityPolicy
// ============================================================================

void SecurityPolicy::fill_defaults(SecurityOptions& options)
{
    if (!options.forbidden_commands)
        options.forbidden_commands = default_forbidden_commands();
    if (!options.forbidden_paths)
        options.forbidden_paths = default_forbidden_paths();
    if (options.audit_callback && !*options.audit_callback)
        options.audit_callback.reset();
}

SecurityOptions SecurityPolicy::resolve(SecurityOptions options)
{
    auto work_dir = PathSanitizer::expand_home(options.work_dir);
    options.work_dir = PathSanitizer::canonical_root(work_dir.value_or(options.work_dir)).string();
    fill_defaults(options);
    return options;
}

SecurityPolicy::SecurityPolicy(SecurityOptions options)
    : SecurityPolicy(resolve(std::move(options)), Resolved{})
{
}

SecurityPolicy::SecurityPolicy(SecurityOptions options, Resolved)
    : options_(std::move(options)),
      path_validator_(PathSanitizer::with_canonical_root(options_.work_dir, options_.allowed_dirs),
                      *options_.forbidden_paths),
      tool_classes_(default_tool_classes())
{
    for (const auto& [name, tool_class] : options_.tool_classes)
        tool_classes_[internal::to_lower(name)] = tool_class;
}

std::shared_ptr<const SecurityPolicy> SecurityPolicy::reconfigure(SecurityOptions options) const
{
    options.work_dir = options_.work_dir;
    fill_defaults(options);
    return std::shared_ptr<const SecurityPolicy>(new SecurityPolicy(std::move(options), Resolved{}));
}

std::optional<ToolClass> SecurityPolicy::tool_class(const std::string& tool_name) const
{
    auto it = tool_classes_.find(internal::to_lower(tool_name));
    if (it == tool_classes_.end())
        return std::nullopt;
    return it->second;
}

// ============================================================================
// Dispatch
// ============================================================================

namespace
{

// First of the given keys holding a string value
std::optional<std::string> string_param(const json& params,
                                        std::initializer_list<const char*> keys)
{
    for (const char* key : keys)
    {
        auto it = params.find(key);
        if (it != params.end() && it->is_string())
            return it->get<std::string>();
    }
    return std::nullopt;
}

SecurityError missing_parameter(const std::string& tool_name, const std::string& param)
{
    return SecurityError(ErrorCode::MissingParameter,
                         "tool " + tool_name + " requires a string '" + param + "' parameter");
}

Verdict check_delete_target(const std::string& resolved)
{
    std::error_code ec;
    auto status = fs::status(resolved, ec);
    if (ec || !fs::exists(status))
        return SecurityError(ErrorCode::InvalidTargetType,
                             "delete target does not exist: " + resolved);

    if (fs::is_directory(status))
        return SecurityError(ErrorCode::InvalidTargetType,
                             "deletion of directories is not allowed: " + resolved);

    if (!fs::is_regular_file(status))
        return SecurityError(ErrorCode::InvalidTargetType,
                             "delete target is not a regular file: " + resolved);

    return std::nullopt;
}

Verdict evaluate(const SecurityPolicy& policy, const std::optional<ToolClass>& tool_class,
                 const std::string& tool_name, const json& params)
{
    if (!tool_class)
        return std::nullopt;

    if (!params.is_object())
        return SecurityError(ErrorCode::MissingParameter,
                             "tool " + tool_name + " expects an object of parameters");

    switch (*tool_class)
    {
    case ToolClass::Shell:
    {
        auto command = string_param(params, {"command"});
        if (!command)
            return missing_parameter(tool_name, "command");
        return validate_command(*command, policy.forbidden_commands(),
                                policy.options().max_command_length);
    }

    case ToolClass::File:
    {
        auto path = string_param(params, {"path", "file_path"});
        if (!path)
            return missing_parameter(tool_name, "path");
        return policy.path_validator().validate(*path).error;
    }

    case ToolClass::Delete:
    {
        auto path = string_param(params, {"path", "file_path"});
        if (!path)
            return missing_parameter(tool_name, "path");

        PathResult resolved = policy.path_validator().validate(*path);
        if (!resolved.ok())
            return resolved.error;
        return check_delete_target(resolved.path);
    }
    }

    return std::nullopt;
}

} // namespace

// ============================================================================
// SecurityValidator
// ============================================================================

SecurityValidator::SecurityValidator(const std::string& work_dir)
    : SecurityValidator([&work_dir] {
          SecurityOptions options;
          options.work_dir = work_dir;
          return options;
      }())
{
}

SecurityValidator::SecurityValidator(SecurityOptions options)
    : policy_(std::make_shared<const SecurityPolicy>(std::move(options)))
{
}

std::shared_ptr<const SecurityPolicy> SecurityValidator::policy() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return policy_;
}

template <typename Mutator> void SecurityValidator::update(Mutator&& mutate)
{
    std::lock_guard<std::mutex> lock(mutex_);
    SecurityOptions options = policy_->options();
    mutate(options);
    policy_ = policy_->reconfigure(std::move(options));
}

std::string SecurityValidator::work_dir() const
{
    return policy()->work_dir();
}

std::vector<std::string> SecurityValidator::forbidden_commands() const
{
    return policy()->forbidden_commands();
}

std::vector<std::string> SecurityValidator::forbidden_paths() const
{
    return policy()->path_validator().forbidden_paths();
}

std::vector<std::string> SecurityValidator::allowed_dirs() const
{
    return policy()->options().allowed_dirs;
}

void SecurityValidator::set_forbidden_commands(std::vector<std::string> commands)
{
    update([&commands](SecurityOptions& options)
           { options.forbidden_commands = std::move(commands); });
}

void SecurityValidator::set_forbidden_paths(std::vector<std::string> paths)
{
    update([&paths](SecurityOptions& options) { options.forbidden_paths = std::move(paths); });
}

void SecurityValidator::set_allowed_dirs(std::vector<std::string> dirs)
{
    update([&dirs](SecurityOptions& options) { options.allowed_dirs = std::move(dirs); });
}

void SecurityValidator::set_tool_class(const std::string& tool_name, ToolClass tool_class)
{
    update([&](SecurityOptions& options)
           { options.tool_classes[internal::to_lower(tool_name)] = tool_class; });
}

void SecurityValidator::set_audit_callback(AuditCallback callback)
{
    update(
        [&callback](SecurityOptions& options)
        {
            if (callback)
                options.audit_callback = std::move(callback);
            else
                options.audit_callback.reset();
        });
}

Verdict SecurityValidator::validate_command(const std::string& command) const
{
    auto snapshot = policy();
    return toolguard::validate_command(command, snapshot->forbidden_commands(),
                                       snapshot->options().max_command_length);
}

Verdict SecurityValidator::validate_path(const std::string& path) const
{
    return resolve_path(path).error;
}

PathResult SecurityValidator::resolve_path(const std::string& path) const
{
    return policy()->path_validator().validate(path);
}

PathResult SecurityValidator::sanitize(const std::string& path) const
{
    return policy()->path_validator().sanitizer().sanitize(path);
}

Verdict SecurityValidator::check_permission(const std::string& tool_name,
                                            const json& params) const
{
    auto snapshot = policy();
    auto tool_class = snapshot->tool_class(tool_name);
    Verdict verdict = evaluate(*snapshot, tool_class, tool_name, params);

    const auto& audit_callback = snapshot->options().audit_callback;
    if (audit_callback && *audit_callback)
    {
        AuditEvent event;
        event.tool_name = tool_name;
        event.allowed = !verdict.has_value();
        event.tool_class = tool_class;
        if (verdict)
        {
            event.code = verdict->code();
            event.message = verdict->what();
        }
        (*audit_callback)(event);
    }

    return verdict;
}

void SecurityValidator::require_permission(const std::string& tool_name,
                                           const json& params) const
{
    if (auto denied = check_permission(tool_name, params))
        throw *denied;
}

PermissionResult SecurityValidator::decide(const std::string& tool_name,
                                           const json& params) const
{
    auto denied = check_permission(tool_name, params);
    if (!denied)
        return PermissionResultAllow{};

    PermissionResultDeny deny;
    deny.message = denied->what();
    deny.code = denied->code();
    return deny;
}

ToolPermissionCallback make_permission_callback(std::shared_ptr<const SecurityValidator> validator)
{
    return [validator](const std::string& tool_name, const json& input) -> PermissionResult
    { return validator->decide(tool_name, input); };
}

} // namespace toolguard
