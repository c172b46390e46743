/**
 * @file gated_dispatcher.cpp
 * @brief Implementation of GatedDispatcher
 */

#include "../internal/string_utils.hpp"

#include <stdexcept>
#include <toolguard/ext/gated_dispatcher.hpp>

namespace toolguard
{
namespace ext
{

GatedDispatcher::GatedDispatcher(std::shared_ptr<const SecurityValidator> validator)
    : validator_(std::move(validator))
{
    if (!validator_)
        throw std::invalid_argument("GatedDispatcher requires a validator");
}

void GatedDispatcher::register_tool(const std::string& tool_name, ToolHandler handler)
{
    std::lock_guard<std::mutex> lock(mutex_);
    handlers_[internal::to_lower(tool_name)] = std::move(handler);
}

bool GatedDispatcher::has_tool(const std::string& tool_name) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return handlers_.count(internal::to_lower(tool_name)) > 0;
}

std::vector<std::string> GatedDispatcher::tool_names() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> names;
    for (const auto& entry : handlers_)
        names.push_back(entry.first);
    return names;
}

json GatedDispatcher::dispatch(const std::string& tool_name, const json& params) const
{
    ToolHandler handler;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = handlers_.find(internal::to_lower(tool_name));
        if (it == handlers_.end())
            throw ToolNotFoundError(tool_name);
        handler = it->second;
    }

    // Must run before the handler; a denial aborts the call with no side effect
    validator_->require_permission(tool_name, params);

    return handler(params);
}

} // namespace ext
} // namespace toolguard
