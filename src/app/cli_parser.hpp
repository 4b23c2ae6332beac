#pragma once
#include <string>
#include "protocol/server_config.hpp"
#include "core/errors/server_errors.hpp"

namespace gemini_mcp::app::cli {
    gemini_mcp::core::errors::Result<gemini_mcp::protocol::ServerConfig> parse_and_validate(int argc, char* argv[]);

    std::string usage(const std::string& program_name);
}
