#ifndef TOOLGUARD_VERSION_HPP
#define TOOLGUARD_VERSION_HPP

#include <string>

namespace toolguard
{

constexpr int VERSION_MAJOR = 0;
constexpr int VERSION_MINOR = 3;
constexpr int VERSION_PATCH = 1;

std::string version_string();

} // namespace toolguard

#endif // TOOLGUARD_VERSION_HPP
