#include <filesystem>
#include <iostream>
#include <memory>
#include <mutex>
#include <toolguard/toolguard.hpp>

int main()
{
    std::mutex output_mutex;

    auto validator =
        std::make_shared<toolguard::SecurityValidator>(std::filesystem::current_path().string());

    // Wire a custom tool into the dispatch table and log every decision
    validator->set_tool_class("run_script", toolguard::ToolClass::Shell);
    validator->set_audit_callback(
        [&output_mutex](const toolguard::AuditEvent& event)
        {
            std::lock_guard<std::mutex> lock(output_mutex);
            std::cout << "[AUDIT] " << event.tool_name
                      << (event.allowed ? " [ALLOWED]" : " [DENIED]");
            if (event.code)
                std::cout << " " << toolguard::error_code_name(*event.code);
            std::cout << "\n";
        });

    // Same shape an agent loop asks before running a tool
    toolguard::ToolPermissionCallback can_use_tool = toolguard::make_permission_callback(validator);

    auto result = can_use_tool("run_script", {{"command", "python3 build.py `whoami`"}});
    if (auto* deny = std::get_if<toolguard::PermissionResultDeny>(&result))
        std::cout << "Tool denied: " << deny->message << "\n";

    result = can_use_tool("Read", {{"file_path", "README.md"}});
    if (toolguard::is_allowed(result))
        std::cout << "Read allowed\n";

    return 0;
}
