#include <iostream>
#include <toolguard/toolguard.hpp>

int main(int argc, char* argv[])
{
    std::string config_path = argc > 1 ? argv[1] : "toolguard.json";

    try
    {
        toolguard::SecurityOptions options = toolguard::load_options_file(config_path);
        toolguard::apply_environment_overrides(options);

        toolguard::SecurityValidator validator(std::move(options));
        validator.require_permission("bash", {{"command", "cat /etc/hostname; id"}});

        std::cout << "Command allowed\n";
    }
    catch (const toolguard::ConfigError& e)
    {
        std::cerr << "Configuration error: " << e.what() << "\n";
        return 2;
    }
    catch (const toolguard::SecurityError& e)
    {
        std::cerr << "Denied [" << e.code_name() << "]: " << e.what() << "\n";

        switch (e.code())
        {
        case toolguard::ErrorCode::ShellInjectionDetected:
            std::cerr << "Hint: run one command per invocation\n";
            break;
        case toolguard::ErrorCode::ForbiddenCommand:
            std::cerr << "Hint: this command is never allowed\n";
            break;
        default:
            break;
        }
        return 1;
    }
    catch (const toolguard::ToolGuardError& e)
    {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
