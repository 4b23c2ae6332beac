#include "tools/tool_registry.hpp"

#include <utility>
#include "core/logging/logger.hpp"

namespace gemini_mcp::tools {

using core::errors::ErrorCategory;
using core::errors::ServerError;

core::errors::Result<std::string> ToolRegistry::register_tool(
    protocol::ToolDescriptor descriptor, ToolHandler handler) {
    if (descriptor.name.empty()) {
        return ServerError{ErrorCategory::Input, "Tool name cannot be empty.",
                           "invalid_tool_name"};
    }
    if (!handler) {
        return ServerError{ErrorCategory::Input,
                           "Tool has no handler: " + descriptor.name,
                           "missing_tool_handler"};
    }
    if (index_.find(descriptor.name) != index_.end()) {
        return ServerError{ErrorCategory::Input,
                           "Tool already registered: " + descriptor.name,
                           "duplicate_tool"};
    }

    std::string name = descriptor.name;
    index_.emplace(name, entries_.size());
    entries_.push_back(Entry{std::move(descriptor), std::move(handler)});
    LOG_DEBUG("ToolRegistry: registered " + name);
    return name;
}

nlohmann::json ToolRegistry::list_tools() const {
    nlohmann::json tools = nlohmann::json::array();
    for (const auto& entry : entries_) {
        tools.push_back(protocol::to_json(entry.descriptor));
    }

    nlohmann::json result;
    result["tools"] = tools;
    return result;
}

core::errors::Result<nlohmann::json> ToolRegistry::call_tool(
    const std::string& name, const nlohmann::json& arguments) const {
    const auto it = index_.find(name);
    if (it == index_.end()) {
        return ServerError{ErrorCategory::Input, "Unknown tool: " + name,
                           "unknown_tool"};
    }
    return entries_[it->second].handler(arguments);
}

std::size_t ToolRegistry::size() const {
    return entries_.size();
}

}  // namespace gemini_mcp::tools
