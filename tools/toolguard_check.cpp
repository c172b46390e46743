/**
 * toolguard_check.cpp - Evaluate one tool invocation against the security gate
 *
 * Usage:
 *   toolguard_check [--workdir DIR] [--config FILE] [--json] TOOL [PARAMS_JSON]
 *
 * Examples:
 *   toolguard_check bash '{"command": "ls -la"}'
 *   toolguard_check --workdir /srv/ws delete '{"path": "build/out.o"}'
 *   toolguard_check --config policy.json --json file_read '{"path": "../secret"}'
 *
 * Exit codes: 0 allowed, 1 denied, 2 usage or configuration error.
 */

#include "check_cli.hpp"

#include <iostream>
#include <string>
#include <vector>

int main(int argc, char* argv[])
{
    std::vector<std::string> args(argv + 1, argv + argc);
    return toolguard::cli::run(args, std::cout, std::cerr);
}
