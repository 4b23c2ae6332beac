#pragma once

#include <atomic>
#include <cstddef>
#include <istream>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <nlohmann/json.hpp>
#include "core/errors/server_errors.hpp"
#include "protocol/jsonrpc.hpp"
#include "protocol/mcp_contract.hpp"
#include "tools/tool_registry.hpp"

namespace gemini_mcp::runtime {

// I/O handles and shutdown flags for one serve() call.
struct ServerContext {
    std::istream& input;
    std::ostream& output;
    // Set from outside (signal handler) to stop after the current request.
    std::shared_ptr<std::atomic_bool> stop_token;
    // True while a request is being handled; false while blocked on input.
    std::shared_ptr<std::atomic_bool> busy_flag;
};

struct ServeStats {
    std::size_t lines_read = 0;
    std::size_t responses_written = 0;
    std::size_t lines_dropped = 0;
};

class StdioServer {
public:
    explicit StdioServer(const tools::ToolRegistry& registry);

    // Runs until end of input, a stop request or a dead output stream.
    ServeStats serve(ServerContext& context) const;

    // nullopt when the line is dropped (not a JSON object).
    std::optional<nlohmann::json> handle_line(const std::string& line) const;

    nlohmann::json handle_request(const protocol::RequestEnvelope& request) const;

private:
    core::errors::Result<nlohmann::json> dispatch(
        protocol::Method method, const protocol::RequestEnvelope& request) const;

    core::errors::Result<nlohmann::json> handle_initialize() const;
    core::errors::Result<nlohmann::json> handle_tools_list() const;
    core::errors::Result<nlohmann::json> handle_tools_call(
        const nlohmann::json& params) const;

    const tools::ToolRegistry& registry_;
};

}  // namespace gemini_mcp::runtime
