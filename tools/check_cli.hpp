#ifndef TOOLGUARD_TOOLS_CHECK_CLI_HPP
#define TOOLGUARD_TOOLS_CHECK_CLI_HPP

#include <ostream>
#include <string>
#include <vector>

namespace toolguard
{
namespace cli
{

constexpr int EXIT_ALLOWED = 0;
constexpr int EXIT_DENIED = 1;
constexpr int EXIT_USAGE = 2;

/// Run toolguard_check with the given arguments (argv without the program name).
/// The decision goes to out, usage and configuration errors to err.
/// @return EXIT_ALLOWED, EXIT_DENIED or EXIT_USAGE
int run(const std::vector<std::string>& args, std::ostream& out, std::ostream& err);

} // namespace cli
} // namespace toolguard

#endif // TOOLGUARD_TOOLS_CHECK_CLI_HPP
