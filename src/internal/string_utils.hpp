#pragma once

#include <string>

namespace toolguard::internal
{

/// ASCII lower-casing (tool names, commands and path entries are matched case-insensitively)
std::string to_lower(std::string value);

/// Strip leading and trailing whitespace
std::string trim(const std::string& value);

/// Case-insensitive substring test
bool contains_ignore_case(const std::string& haystack, const std::string& needle);

} // namespace toolguard::internal
