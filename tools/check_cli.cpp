#include "check_cli.hpp"

#include <optional>
#include <toolguard/toolguard.hpp>
#include <utility>

namespace toolguard
{
namespace cli
{

namespace
{

constexpr const char* PROGRAM = "toolguard_check";

void print_usage(std::ostream& err)
{
    err << PROGRAM << " " << version_string() << "\n"
        << "Usage: " << PROGRAM << " [--workdir DIR] [--config FILE] [--json] TOOL [PARAMS_JSON]\n"
        << "\n"
        << "  --workdir DIR   Workspace root (default: $" << WORK_DIR_ENV
        << " or the current directory)\n"
        << "  --config FILE   Load security options from a JSON file\n"
        << "  --json          Print the decision as JSON\n"
        << "  -h, --help      Show this help\n";
}

struct Arguments
{
    std::optional<std::string> work_dir;
    std::optional<std::string> config_path;
    bool json_output = false;
    std::string tool_name;
    std::string params_text = "{}";
};

// Returns std::nullopt (after printing usage) on malformed arguments
std::optional<Arguments> parse_arguments(const std::vector<std::string>& argv, std::ostream& err)
{
    Arguments args;
    std::vector<std::string> positional;

    for (size_t i = 0; i < argv.size(); ++i)
    {
        const std::string& arg = argv[i];

        if (arg == "-h" || arg == "--help")
        {
            print_usage(err);
            return std::nullopt;
        }
        else if (arg == "--json")
        {
            args.json_output = true;
        }
        else if (arg == "--workdir" || arg == "--config")
        {
            if (i + 1 >= argv.size())
            {
                err << "Error: " << arg << " requires a value\n";
                print_usage(err);
                return std::nullopt;
            }
            if (arg == "--workdir")
                args.work_dir = argv[++i];
            else
                args.config_path = argv[++i];
        }
        else if (arg.size() > 1 && arg[0] == '-' && arg[1] == '-')
        {
            err << "Error: unknown option " << arg << "\n";
            print_usage(err);
            return std::nullopt;
        }
        else
        {
            positional.push_back(arg);
        }
    }

    if (positional.empty() || positional.size() > 2)
    {
        print_usage(err);
        return std::nullopt;
    }

    args.tool_name = positional[0];
    if (positional.size() == 2)
        args.params_text = positional[1];

    return args;
}

} // namespace

int run(const std::vector<std::string>& argv, std::ostream& out, std::ostream& err)
{
    auto args = parse_arguments(argv, err);
    if (!args)
        return EXIT_USAGE;

    SecurityOptions options;
    json params;

    try
    {
        if (args->config_path)
            options = load_options_file(*args->config_path);

        apply_environment_overrides(options);
        if (args->work_dir)
            options.work_dir = *args->work_dir;

        params = json::parse(args->params_text);
    }
    catch (const ConfigError& e)
    {
        err << "Error: " << e.what() << "\n";
        return EXIT_USAGE;
    }
    catch (const json::parse_error& e)
    {
        err << "Error: invalid PARAMS_JSON: " << e.what() << "\n";
        return EXIT_USAGE;
    }

    SecurityValidator validator(std::move(options));
    auto denied = validator.check_permission(args->tool_name, params);

    if (args->json_output)
    {
        json output = {{"tool", args->tool_name},
                       {"allowed", !denied.has_value()},
                       {"work_dir", validator.work_dir()}};
        if (denied)
            output["error"] = denied->to_json();
        out << output.dump(2) << "\n";
    }
    else if (denied)
    {
        out << "DENY [" << denied->code_name() << "] " << denied->what() << "\n";
    }
    else
    {
        out << "ALLOW\n";
    }

    return denied ? EXIT_DENIED : EXIT_ALLOWED;
}

} // namespace cli
} // namespace toolguard
