#include "../test_utils.hpp"

#include <gtest/gtest.h>
#include <toolguard/command_validator.hpp>
#include <toolguard/config.hpp>
#include <toolguard/security_validator.hpp>

using namespace toolguard;

TEST(ConfigTest, ParsesAllFields)
{
    auto options = parse_options(R"({
        "work_dir": "/srv/agent",
        "forbidden_commands": ["git push", "npm publish"],
        "forbidden_paths": ["/srv/agent/.env"],
        "allowed_dirs": ["/opt/shared"],
        "max_command_length": 4096,
        "tool_classes": {"run_script": "shell", "Grep": "FILE"}
    })");

    EXPECT_EQ(options.work_dir, "/srv/agent");
    ASSERT_TRUE(options.forbidden_commands.has_value());
    EXPECT_EQ(options.forbidden_commands->size(), 2u);
    ASSERT_TRUE(options.forbidden_paths.has_value());
    EXPECT_EQ(options.forbidden_paths->front(), "/srv/agent/.env");
    EXPECT_EQ(options.allowed_dirs, std::vector<std::string>{"/opt/shared"});
    EXPECT_EQ(options.tool_classes.at("run_script"), ToolClass::Shell);
    EXPECT_EQ(options.tool_classes.at("Grep"), ToolClass::File);
    EXPECT_EQ(options.max_command_length, 4096u);
}

TEST(ConfigTest, MissingListsKeepDefaults)
{
    auto options = parse_options(R"({"work_dir": "/tmp"})");
    EXPECT_FALSE(options.forbidden_commands.has_value());
    EXPECT_FALSE(options.forbidden_paths.has_value());
    EXPECT_EQ(options.max_command_length, DEFAULT_MAX_COMMAND_LENGTH);

    SecurityValidator validator(options);
    EXPECT_EQ(validator.forbidden_commands(), default_forbidden_commands());
    EXPECT_EQ(validator.forbidden_paths(), default_forbidden_paths());
}

TEST(ConfigTest, EmptyListReplacesDefaults)
{
    auto options = parse_options(R"({"forbidden_commands": []})");
    ASSERT_TRUE(options.forbidden_commands.has_value());

    SecurityValidator validator(options);
    EXPECT_TRUE(validator.forbidden_commands().empty());
    EXPECT_FALSE(validator.validate_command("shutdown -h now"));
}

TEST(ConfigTest, MalformedDocumentsThrow)
{
    EXPECT_THROW(parse_options("{not json"), ConfigError);
    EXPECT_THROW(parse_options("[]"), ConfigError);
    EXPECT_THROW(parse_options(R"({"work_dir": 3})"), ConfigError);
    EXPECT_THROW(parse_options(R"({"forbidden_commands": "rm"})"), ConfigError);
    EXPECT_THROW(parse_options(R"({"allowed_dirs": ["/a", 1]})"), ConfigError);
    EXPECT_THROW(parse_options(R"({"tool_classes": ["bash"]})"), ConfigError);
    EXPECT_THROW(parse_options(R"({"tool_classes": {"bash": "network"}})"), ConfigError);
    EXPECT_THROW(parse_options(R"({"max_command_length": -1})"), ConfigError);
    EXPECT_THROW(parse_options(R"({"max_command_length": "10"})"), ConfigError);
}

TEST(ConfigTest, LoadsFromFile)
{
    test::TempDir temp;
    auto file = temp.write_file("toolguard.json", R"({"forbidden_commands": ["curl"]})");

    auto options = load_options_file(file.string());
    ASSERT_TRUE(options.forbidden_commands.has_value());
    EXPECT_EQ(*options.forbidden_commands, std::vector<std::string>{"curl"});
}

TEST(ConfigTest, FileErrorsNameTheFile)
{
    test::TempDir temp;
    auto file = temp.write_file("broken.json", "{");

    try
    {
        load_options_file(file.string());
        FAIL() << "Expected ConfigError";
    }
    catch (const ConfigError& e)
    {
        EXPECT_NE(std::string(e.what()).find("broken.json"), std::string::npos);
    }

    EXPECT_THROW(load_options_file((temp.path() / "missing.json").string()), ConfigError);
}

TEST(ConfigTest, SerializedOptionsParseBack)
{
    SecurityOptions options;
    options.work_dir = "/srv/agent";
    options.forbidden_paths = std::vector<std::string>{"/srv/agent/secrets"};
    options.tool_classes["purge"] = ToolClass::Delete;
    options.max_command_length = 0;

    auto parsed = SecurityOptions::from_json(options.to_json());
    EXPECT_EQ(parsed.work_dir, options.work_dir);
    EXPECT_FALSE(parsed.forbidden_commands.has_value());
    EXPECT_EQ(parsed.forbidden_paths, options.forbidden_paths);
    EXPECT_EQ(parsed.tool_classes, options.tool_classes);
    EXPECT_EQ(parsed.max_command_length, 0u);
}

TEST(ConfigTest, EnvironmentOverridesWorkDir)
{
    SecurityOptions options;
    options.work_dir = "/srv/agent";

    {
        test::EnvGuard env(WORK_DIR_ENV, std::string("/srv/other"));
        apply_environment_overrides(options);
        EXPECT_EQ(options.work_dir, "/srv/other");
    }

    {
        test::EnvGuard env(WORK_DIR_ENV, std::string(""));
        apply_environment_overrides(options);
        EXPECT_EQ(options.work_dir, "/srv/other");
    }

    {
        test::EnvGuard env(WORK_DIR_ENV, std::nullopt);
        options.work_dir = "/srv/agent";
        apply_environment_overrides(options);
        EXPECT_EQ(options.work_dir, "/srv/agent");
    }
}
