#include "internal/string_utils.hpp"

#include <toolguard/command_validator.hpp>

namespace toolguard
{

const std::vector<std::string>& default_forbidden_commands()
{
    static const std::vector<std::string> commands = {
        "rm -rf /",
        "rm -rf /*",
        "shutdown",
        "reboot",
        "halt",
        "poweroff",
        "init 0",
        "init 6",
        "mkfs",
        "dd if=/dev/zero",
        "dd if=/dev/random",
        ":(){ :|:& };:", // Fork bomb
        "systemctl poweroff",
        "systemctl reboot",
        "systemctl halt",
    };
    return commands;
}

const std::vector<std::string>& builtin_dangerous_patterns()
{
    static const std::vector<std::string> patterns = {
        "sudo rm",
        "sudo dd",
        "sudo mkfs",
        "< /dev/zero",
        "< /dev/random",
        "chmod -R 777",
        "chmod 777",
        "chown -R",
    };
    return patterns;
}

namespace
{

// A ';' preceded by an odd number of backslashes is escaped (e.g. find -exec ... \;)
bool has_bare_semicolon(const std::string& command)
{
    for (size_t i = 0; i < command.size(); ++i)
    {
        if (command[i] != ';')
            continue;

        size_t backslashes = 0;
        for (size_t j = i; j > 0 && command[j - 1] == '\\'; --j)
            ++backslashes;

        if (backslashes % 2 == 0)
            return true;
    }
    return false;
}

// Device files that may be written to
bool is_harmless_sink(const std::string& device)
{
    static const char* const sinks[] = {"/dev/null", "/dev/stdout", "/dev/stderr", "/dev/tty"};
    for (const char* sink : sinks)
    {
        if (device == sink)
            return true;
    }
    return false;
}

// "/dev/..." starting at pos, up to the next blank or shell metacharacter
std::string device_at(const std::string& command, size_t pos)
{
    size_t end = command.find_first_of(" \t\n\r;|&<>()'\"", pos);
    return command.substr(pos, end == std::string::npos ? std::string::npos : end - pos);
}

} // namespace

std::optional<std::string> raw_device_write(const std::string& command)
{
    std::string lower = internal::to_lower(command);

    // dd of=/dev/...
    for (size_t pos = lower.find("of=/dev/"); pos != std::string::npos;
         pos = lower.find("of=/dev/", pos + 1))
    {
        std::string device = device_at(lower, pos + 3);
        if (!is_harmless_sink(device))
            return device;
    }

    // > /dev/..., >> /dev/..., >/dev/...
    for (size_t pos = lower.find('>'); pos != std::string::npos; pos = lower.find('>', pos + 1))
    {
        size_t target = pos + 1;
        if (target < lower.size() && lower[target] == '>')
            ++target;
        while (target < lower.size() && (lower[target] == ' ' || lower[target] == '\t'))
            ++target;

        if (lower.compare(target, 5, "/dev/") != 0)
            continue;

        std::string device = device_at(lower, target);
        if (!is_harmless_sink(device))
            return device;
    }

    return std::nullopt;
}

bool contains_shell_injection(const std::string& command)
{
    static const char* const injection_patterns[] = {
        "$(",    // Command substitution
        "`",     // Backtick substitution
        "&&",    // Command chaining
        "||",    // Command chaining
        "|&",    // Pipe with stderr
        "\n",    // Newline injection
        "\r",    // Carriage return injection
        "${IFS", // IFS manipulation
        "$IFS",  // IFS manipulation
        "IFS=",  // IFS reassignment
    };

    if (command.find('\0') != std::string::npos)
        return true;

    for (const char* pattern : injection_patterns)
    {
        if (command.find(pattern) != std::string::npos)
            return true;
    }

    return has_bare_semicolon(command);
}

Verdict validate_command(const std::string& command,
                         const std::vector<std::string>& forbidden_commands, size_t max_length)
{
    if (internal::trim(command).empty())
        return SecurityError(ErrorCode::EmptyInput, "empty command");

    if (max_length > 0 && command.size() > max_length)
        return SecurityError(ErrorCode::CommandTooLong,
                             "command exceeds maximum length of " + std::to_string(max_length) +
                                 " characters");

    if (contains_shell_injection(command))
        return SecurityError(ErrorCode::ShellInjectionDetected, "potential shell injection detected");

    for (const auto& forbidden : forbidden_commands)
    {
        if (internal::contains_ignore_case(command, forbidden))
            return SecurityError(ErrorCode::ForbiddenCommand,
                                 "command contains forbidden pattern: " + forbidden);
    }

    for (const auto& pattern : builtin_dangerous_patterns())
    {
        if (internal::contains_ignore_case(command, pattern))
            return SecurityError(ErrorCode::ForbiddenCommand,
                                 "command contains dangerous pattern: " + pattern);
    }

    if (auto device = raw_device_write(command))
        return SecurityError(ErrorCode::ForbiddenCommand, "command writes to device " + *device);

    return std::nullopt;
}

} // namespace toolguard
