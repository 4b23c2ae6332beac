#include "runtime/stdio_server.hpp"

#include <exception>
#include <string>
#include "core/logging/logger.hpp"
#include "protocol/mcp_contract.hpp"

namespace gemini_mcp::runtime {

using core::errors::ErrorCategory;
using core::errors::ServerError;
using nlohmann::json;
using protocol::Method;
using protocol::RequestEnvelope;

namespace {

bool stop_requested(const ServerContext& context) {
    return context.stop_token && context.stop_token->load();
}

void set_busy(const ServerContext& context, const bool busy) {
    if (context.busy_flag) {
        context.busy_flag->store(busy);
    }
}

std::string describe_id(const RequestEnvelope& request) {
    return request.has_id ? protocol::serialize(request.id) : "<none>";
}

}  // namespace

StdioServer::StdioServer(const tools::ToolRegistry& registry)
    : registry_(registry) {}

ServeStats StdioServer::serve(ServerContext& context) const {
    ServeStats stats;
    std::string line;

    while (!stop_requested(context)) {
        set_busy(context, false);
        if (!std::getline(context.input, line)) {
            LOG_DEBUG("StdioServer: end of input");
            break;
        }
        set_busy(context, true);
        ++stats.lines_read;

        std::optional<json> response;
        try {
            response = handle_line(line);
        } catch (const std::exception& e) {
            // handle_request answers its own failures
            LOG_ERROR(std::string("StdioServer: failed to handle line: ") + e.what());
        }

        if (stop_requested(context)) {
            LOG_INFO("StdioServer: stop requested, discarding in-flight response");
            break;
        }
        if (!response.has_value()) {
            ++stats.lines_dropped;
            continue;
        }

        context.output << protocol::serialize(*response) << '\n';
        context.output.flush();
        if (!context.output) {
            LOG_ERROR("StdioServer: output stream failed, shutting down");
            break;
        }
        ++stats.responses_written;
    }

    set_busy(context, false);
    return stats;
}

std::optional<json> StdioServer::handle_line(const std::string& line) const {
    auto parsed = protocol::parse_request_line(line);
    if (core::errors::is_error(parsed)) {
        const auto& err = core::errors::get_error(parsed);
        if (err.code == "parse_error") {
            LOG_DEBUG("StdioServer: ignoring line: " + err.message);
        } else {
            LOG_WARN("StdioServer: ignoring line: " + err.message);
        }
        return std::nullopt;
    }
    return handle_request(core::errors::get_value(parsed));
}

json StdioServer::handle_request(const RequestEnvelope& request) const {
    const Method method = request.method.is_string()
                              ? protocol::parse_method(request.method.get<std::string>())
                              : Method::Unknown;
    LOG_DEBUG("StdioServer: request id=" + describe_id(request) + " method=" +
              protocol::method_name(request) + " (" + protocol::to_string(method) + ")");

    core::errors::Result<json> outcome = json::object();
    try {
        outcome = dispatch(method, request);
    } catch (const std::exception& e) {
        LOG_ERROR("StdioServer: unexpected failure handling " +
                  protocol::method_name(request) + ": " + e.what());
        outcome = ServerError{ErrorCategory::Internal,
                              std::string("Internal error: ") + e.what(),
                              "internal_error"};
    }

    if (core::errors::is_error(outcome)) {
        const auto& err = core::errors::get_error(outcome);
        LOG_DEBUG("StdioServer: request id=" + describe_id(request) + " failed [" +
                  core::errors::to_string(err.category) + "/" + err.code + "]: " +
                  err.message);
        return protocol::make_error_response(request.id, err);
    }
    return protocol::make_result_response(request.id, core::errors::get_value(outcome));
}

core::errors::Result<json> StdioServer::dispatch(const Method method,
                                                 const RequestEnvelope& request) const {
    switch (method) {
        case Method::Initialize:
            return handle_initialize();
        case Method::ToolsList:
            return handle_tools_list();
        case Method::ToolsCall:
            return handle_tools_call(request.params);
        case Method::Unknown:
        default:
            return ServerError{ErrorCategory::Protocol,
                               "Method not found: " + protocol::method_name(request),
                               "method_not_found"};
    }
}

core::errors::Result<json> StdioServer::handle_initialize() const {
    json result;
    result["protocolVersion"] = protocol::kProtocolVersion;
    result["capabilities"]["tools"] = json::object();
    result["serverInfo"]["name"] = protocol::kServerName;
    result["serverInfo"]["version"] = protocol::kServerVersion;
    return result;
}

core::errors::Result<json> StdioServer::handle_tools_list() const {
    return registry_.list_tools();
}

core::errors::Result<json> StdioServer::handle_tools_call(const json& params) const {
    if (!params.is_object()) {
        return ServerError{ErrorCategory::Input, "Invalid params: expected an object",
                           "invalid_params"};
    }

    // A missing or non-string name can never match a registered tool.
    const auto name_it = params.find("name");
    if (name_it == params.end() || !name_it->is_string()) {
        const json name = name_it == params.end() ? json() : *name_it;
        return ServerError{ErrorCategory::Input,
                           "Unknown tool: " + protocol::display_value(name),
                           "unknown_tool"};
    }

    return registry_.call_tool(name_it->get<std::string>(),
                               protocol::object_or_empty(params, "arguments"));
}

}  // namespace gemini_mcp::runtime
