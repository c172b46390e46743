/**
 * @file gated_dispatcher.hpp
 * @brief Tool handler registry that runs the security gate before every handler
 *
 * Reference consumer of SecurityValidator: handlers are plain callables taking
 * the tool's JSON parameters. dispatch() checks permission first, so a denied
 * invocation never reaches its handler.
 */

#ifndef TOOLGUARD_EXT_GATED_DISPATCHER_HPP
#define TOOLGUARD_EXT_GATED_DISPATCHER_HPP

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <toolguard/security_validator.hpp>
#include <toolguard/types.hpp>
#include <vector>

namespace toolguard
{
namespace ext
{

/// Tool implementation: receives the (already validated) parameters, returns a JSON result
using ToolHandler = std::function<json(const json& params)>;

/**
 * @brief Routes tool calls to handlers behind a SecurityValidator
 *
 * @code
 * auto validator = std::make_shared<toolguard::SecurityValidator>(workspace);
 * toolguard::ext::GatedDispatcher dispatcher(validator);
 * dispatcher.register_tool("bash", run_shell);
 *
 * try {
 *     auto output = dispatcher.dispatch("bash", {{"command", "ls -la"}});
 * } catch (const toolguard::SecurityError& e) {
 *     // e.code_name(), e.what()
 * }
 * @endcode
 */
class GatedDispatcher
{
  public:
    explicit GatedDispatcher(std::shared_ptr<const SecurityValidator> validator);

    // Non-copyable (owns a mutex)
    GatedDispatcher(const GatedDispatcher&) = delete;
    GatedDispatcher& operator=(const GatedDispatcher&) = delete;

    /// Register or replace the handler for a tool name (names are case-insensitive)
    void register_tool(const std::string& tool_name, ToolHandler handler);

    bool has_tool(const std::string& tool_name) const;

    /// Registered tool names (lower-case, sorted)
    std::vector<std::string> tool_names() const;

    /**
     * @brief Check permission, then run the handler
     * @throws ToolNotFoundError if no handler is registered
     * @throws SecurityError if the invocation is denied (the handler does not run)
     */
    json dispatch(const std::string& tool_name, const json& params) const;

    const SecurityValidator& validator() const
    {
        return *validator_;
    }

  private:
    std::shared_ptr<const SecurityValidator> validator_;
    mutable std::mutex mutex_;
    std::map<std::string, ToolHandler> handlers_;
};

} // namespace ext
} // namespace toolguard

#endif // TOOLGUARD_EXT_GATED_DISPATCHER_HPP
