#ifndef TOOLGUARD_CONFIG_HPP
#define TOOLGUARD_CONFIG_HPP

#include <string>
#include <toolguard/types.hpp>

namespace toolguard
{

/// Environment variable that overrides SecurityOptions::work_dir
constexpr const char* WORK_DIR_ENV = "TOOLGUARD_WORK_DIR";

/// Read SecurityOptions from a JSON file.
/// @throws ConfigError if the file cannot be read, is not valid JSON, or has wrong-typed fields
SecurityOptions load_options_file(const std::string& path);

/// Parse SecurityOptions from a JSON document string.
/// @throws ConfigError on malformed input
SecurityOptions parse_options(const std::string& text);

/// Apply TOOLGUARD_WORK_DIR when it is set and non-empty
void apply_environment_overrides(SecurityOptions& options);

} // namespace toolguard

#endif // TOOLGUARD_CONFIG_HPP
