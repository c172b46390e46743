#include "internal/string_utils.hpp"

#include <toolguard/types.hpp>

namespace toolguard
{

const char* tool_class_name(ToolClass tool_class)
{
    switch (tool_class)
    {
    case ToolClass::Shell:
        return "shell";
    case ToolClass::File:
        return "file";
    case ToolClass::Delete:
        return "delete";
    }
    return "unknown";
}

std::optional<ToolClass> tool_class_from_string(const std::string& name)
{
    std::string lower = internal::to_lower(internal::trim(name));
    if (lower == "shell")
        return ToolClass::Shell;
    if (lower == "file")
        return ToolClass::File;
    if (lower == "delete")
        return ToolClass::Delete;
    return std::nullopt;
}

json SecurityOptions::to_json() const
{
    json result = {{"work_dir", work_dir},
                   {"max_command_length", max_command_length},
                   {"allowed_dirs", allowed_dirs}};

    if (forbidden_commands.has_value())
        result["forbidden_commands"] = *forbidden_commands;
    if (forbidden_paths.has_value())
        result["forbidden_paths"] = *forbidden_paths;

    json classes = json::object();
    for (const auto& [name, tool_class] : tool_classes)
        classes[name] = tool_class_name(tool_class);
    result["tool_classes"] = classes;

    return result;
}

namespace
{

std::vector<std::string> string_list(const json& j, const char* key)
{
    const json& value = j.at(key);
    if (!value.is_array())
        throw ConfigError(std::string("'") + key + "' must be an array of strings");

    std::vector<std::string> items;
    for (const auto& item : value)
    {
        if (!item.is_string())
            throw ConfigError(std::string("'") + key + "' must be an array of strings");
        items.push_back(item.get<std::string>());
    }
    return items;
}

} // namespace

SecurityOptions SecurityOptions::from_json(const json& j)
{
    if (!j.is_object())
        throw ConfigError("security options must be a JSON object");

    SecurityOptions options;

    if (j.contains("work_dir"))
    {
        if (!j["work_dir"].is_string())
            throw ConfigError("'work_dir' must be a string");
        options.work_dir = j["work_dir"].get<std::string>();
    }

    if (j.contains("max_command_length"))
    {
        if (!j["max_command_length"].is_number_unsigned())
            throw ConfigError("'max_command_length' must be a non-negative integer");
        options.max_command_length = j["max_command_length"].get<std::size_t>();
    }

    if (j.contains("forbidden_commands"))
        options.forbidden_commands = string_list(j, "forbidden_commands");
    if (j.contains("forbidden_paths"))
        options.forbidden_paths = string_list(j, "forbidden_paths");
    if (j.contains("allowed_dirs"))
        options.allowed_dirs = string_list(j, "allowed_dirs");

    if (j.contains("tool_classes"))
    {
        const json& classes = j["tool_classes"];
        if (!classes.is_object())
            throw ConfigError("'tool_classes' must be an object of tool name -> class");

        for (const auto& item : classes.items())
        {
            const std::string& name = item.key();
            const json& value = item.value();
            if (!value.is_string())
                throw ConfigError("tool class for '" + name + "' must be a string");

            auto tool_class = tool_class_from_string(value.get<std::string>());
            if (!tool_class)
                throw ConfigError("unknown tool class '" + value.get<std::string>() +
                                  "' for tool '" + name + "'");
            options.tool_classes[name] = *tool_class;
        }
    }

    return options;
}

} // namespace toolguard
