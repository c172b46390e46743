#include <cstdlib>
#include <fstream>
#include <sstream>
#include <toolguard/config.hpp>

namespace toolguard
{

SecurityOptions parse_options(const std::string& text)
{
    json document;
    try
    {
        document = json::parse(text);
    }
    catch (const json::parse_error& e)
    {
        throw ConfigError(std::string("invalid security options JSON: ") + e.what());
    }

    return SecurityOptions::from_json(document);
}

SecurityOptions load_options_file(const std::string& path)
{
    std::ifstream file(path);
    if (!file)
        throw ConfigError("Failed to open security options file: " + path);

    std::ostringstream contents;
    contents << file.rdbuf();

    try
    {
        return parse_options(contents.str());
    }
    catch (const ConfigError& e)
    {
        throw ConfigError(path + ": " + e.what());
    }
}

void apply_environment_overrides(SecurityOptions& options)
{
    const char* work_dir = std::getenv(WORK_DIR_ENV);
    if (work_dir != nullptr && work_dir[0] != '\0')
        options.work_dir = work_dir;
}

} // namespace toolguard
