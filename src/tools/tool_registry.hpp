#pragma once

#include <cstddef>
#include <functional>
#include <string>
#include <unordered_map>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/errors/server_errors.hpp"
#include "protocol/tool_contract.hpp"

namespace gemini_mcp::tools {

using ToolHandler = std::function<core::errors::Result<nlohmann::json>(
    const nlohmann::json& arguments)>;

// Name -> descriptor/handler table behind tools/list and tools/call.
// Filled at startup and read-only afterwards.
class ToolRegistry {
public:
    core::errors::Result<std::string> register_tool(protocol::ToolDescriptor descriptor,
                                                    ToolHandler handler);

    // {"tools":[...]} in registration order.
    nlohmann::json list_tools() const;

    core::errors::Result<nlohmann::json> call_tool(
        const std::string& name, const nlohmann::json& arguments) const;

    std::size_t size() const;

private:
    struct Entry {
        protocol::ToolDescriptor descriptor;
        ToolHandler handler;
    };

    std::vector<Entry> entries_;
    std::unordered_map<std::string, std::size_t> index_;
};

}  // namespace gemini_mcp::tools
