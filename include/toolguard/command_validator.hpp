#ifndef TOOLGUARD_COMMAND_VALIDATOR_HPP
#define TOOLGUARD_COMMAND_VALIDATOR_HPP

#include <cstddef>
#include <optional>
#include <string>
#include <toolguard/errors.hpp>
#include <toolguard/types.hpp>
#include <vector>

namespace toolguard
{

/// Default forbidden command substrings (replaceable per validator)
const std::vector<std::string>& default_forbidden_commands();

/// Dangerous patterns that are always enforced, whatever the configured list
const std::vector<std::string>& builtin_dangerous_patterns();

/// Device written by a "of=/dev/..." operand or a ">"/">>" redirect into /dev/.
/// /dev/null, /dev/stdout, /dev/stderr and /dev/tty are not reported.
std::optional<std::string> raw_device_write(const std::string& command);

/// Heuristic check for syntax that can chain, substitute or smuggle a second command.
///
/// Flags: "$(", backticks, "&&", "||", "|&", an unescaped ';', newline, carriage
/// return, a NUL byte, and IFS manipulation ("${IFS", "$IFS", "IFS="). A plain pipe is not
/// flagged on its own, so "ls | grep test" passes.
///
/// This is not a shell parser: quoting is ignored, so "echo 'a;b'" is flagged.
bool contains_shell_injection(const std::string& command);

/// Validate a shell command.
/// Checks, in order: empty input, length, injection syntax, then the forbidden list,
/// the built-in dangerous patterns (both case-insensitive substring matches) and
/// raw device writes.
/// @param max_length Longest accepted command in bytes; 0 disables the cap
/// @return std::nullopt if the command may run
Verdict validate_command(const std::string& command,
                         const std::vector<std::string>& forbidden_commands,
                         std::size_t max_length = DEFAULT_MAX_COMMAND_LENGTH);

} // namespace toolguard

#endif // TOOLGUARD_COMMAND_VALIDATOR_HPP
