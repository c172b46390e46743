#include "string_utils.hpp"

#include <algorithm>
#include <cctype>

namespace toolguard::internal
{

std::string to_lower(std::string value)
{
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

std::string trim(const std::string& value)
{
    const char* whitespace = " \t\n\r\f\v";
    auto begin = value.find_first_not_of(whitespace);
    if (begin == std::string::npos)
        return "";
    auto end = value.find_last_not_of(whitespace);
    return value.substr(begin, end - begin + 1);
}

bool contains_ignore_case(const std::string& haystack, const std::string& needle)
{
    if (needle.empty())
        return false;
    return to_lower(haystack).find(to_lower(needle)) != std::string::npos;
}

} // namespace toolguard::internal
