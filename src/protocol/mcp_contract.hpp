#pragma once
#include <string>

namespace gemini_mcp::protocol {

    inline constexpr const char* kProtocolVersion = "2024-11-05";
    inline constexpr const char* kServerName = "gemini-mcp-server";
    inline constexpr const char* kServerVersion = "1.0.0";

    // The methods this server answers. Anything else parses to Unknown.
    enum class Method {
        Initialize,
        ToolsList,
        ToolsCall,
        Unknown
    };

    inline Method parse_method(const std::string& name) {
        if (name == "initialize") {
            return Method::Initialize;
        }
        if (name == "tools/list") {
            return Method::ToolsList;
        }
        if (name == "tools/call") {
            return Method::ToolsCall;
        }
        return Method::Unknown;
    }

    inline std::string to_string(const Method method) {
        switch (method) {
            case Method::Initialize:
                return "initialize";
            case Method::ToolsList:
                return "tools/list";
            case Method::ToolsCall:
                return "tools/call";
            default:
                return "unknown";
        }
    }

} // namespace gemini_mcp::protocol
