#include <sstream>
#include <toolguard/version.hpp>

namespace toolguard
{

std::string version_string()
{
    std::ostringstream oss;
    oss << VERSION_MAJOR << "." << VERSION_MINOR << "." << VERSION_PATCH;
    return oss.str();
}

} // namespace toolguard
