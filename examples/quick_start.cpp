#include <filesystem>
#include <iostream>
#include <toolguard/toolguard.hpp>

int main()
{
    std::string workspace = (std::filesystem::current_path() / "workspace").string();
    toolguard::SecurityValidator validator(workspace);

    std::cout << "Workspace: " << validator.work_dir() << "\n\n";

    struct Invocation
    {
        std::string tool;
        toolguard::json params;
    };

    const Invocation invocations[] = {
        {"bash", {{"command", "ls -la | grep src"}}},
        {"bash", {{"command", "make && make install"}}},
        {"bash", {{"command", "sudo reboot"}}},
        {"file_read", {{"path", "notes/todo.md"}}},
        {"file_write", {{"path", "../outside.txt"}}},
        {"file_read", {{"path", "/etc/shadow"}}},
        {"delete", {{"path", "."}}},
        {"web_fetch", {{"url", "https://example.com"}}},
    };

    for (const auto& invocation : invocations)
    {
        std::cout << invocation.tool << " " << invocation.params.dump() << "\n";

        if (auto denied = validator.check_permission(invocation.tool, invocation.params))
            std::cout << "  -> DENY [" << denied->code_name() << "] " << denied->what() << "\n";
        else
            std::cout << "  -> ALLOW\n";
    }

    return 0;
}
