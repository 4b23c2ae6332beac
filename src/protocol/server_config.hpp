#pragma once
#include <cstdint>
#include <string>

namespace gemini_mcp::protocol {

    // Validated startup options for one server process
    struct ServerConfig {
        std::string gemini_command = "gemini";
        std::uint32_t timeout_ms = 60000;
        bool verbose = false;
        bool show_help = false;
    };

} // namespace gemini_mcp::protocol
