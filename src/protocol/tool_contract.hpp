#pragma once
#include <string>
#include <nlohmann/json.hpp>

namespace gemini_mcp::protocol {

    // What the host sees in tools/list
    struct ToolDescriptor {
        std::string name;
        std::string description;
        nlohmann::json input_schema = nlohmann::json::object();
    };

    inline nlohmann::json to_json(const ToolDescriptor& descriptor) {
        nlohmann::json payload;
        payload["name"] = descriptor.name;
        payload["description"] = descriptor.description;
        payload["inputSchema"] = descriptor.input_schema;
        return payload;
    }

    // {"content":[{"type":"text","text":...}]}, the shape of a tools/call result
    inline nlohmann::json text_content_result(const std::string& text) {
        nlohmann::json item;
        item["type"] = "text";
        item["text"] = text;

        nlohmann::json result;
        result["content"] = nlohmann::json::array({item});
        return result;
    }

} // namespace gemini_mcp::protocol
