#include "tools/gemini_search.hpp"

#include <cctype>
#include <utility>
#include "core/logging/logger.hpp"
#include "protocol/jsonrpc.hpp"

namespace gemini_mcp::tools {

using core::errors::ErrorCategory;
using core::errors::ServerError;
using nlohmann::json;

namespace {

std::string trim(const std::string& text) {
    std::size_t begin = 0;
    std::size_t end = text.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(text[begin])) != 0) {
        ++begin;
    }
    while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1])) != 0) {
        --end;
    }
    return text.substr(begin, end - begin);
}

std::string query_from(const json& arguments) {
    if (!arguments.is_object()) {
        return "";
    }
    const auto it = arguments.find("query");
    if (it == arguments.end() || it->is_null()) {
        return "";
    }
    return protocol::display_value(*it);
}

}  // namespace

std::string build_search_prompt(const std::string& query) {
    return std::string(kWebSearchMarker) + query;
}

protocol::ToolDescriptor gemini_search_descriptor() {
    json query_schema;
    query_schema["type"] = "string";
    query_schema["description"] =
        "The search query (e.g., 'current weather in Tokyo', 'latest news about "
        "AI', 'stock price of AAPL')";

    json schema;
    schema["type"] = "object";
    schema["properties"]["query"] = query_schema;
    schema["required"] = json::array({"query"});

    return protocol::ToolDescriptor{
        kGeminiSearchToolName,
        "Search the web using Google Gemini AI for current information, news, "
        "weather, and real-time data",
        schema};
}

GeminiSearchTool::GeminiSearchTool(std::shared_ptr<const ProcessRunner> runner,
                                   GeminiSearchSettings settings)
    : runner_(std::move(runner)), settings_(std::move(settings)) {}

core::errors::Result<json> GeminiSearchTool::call(const json& arguments) const {
    if (!runner_) {
        return ServerError{ErrorCategory::Internal, "No process runner configured.",
                           "missing_process_runner"};
    }

    ProcessRequest request;
    request.executable = settings_.command;
    request.arguments = {"-p", build_search_prompt(query_from(arguments))};
    request.timeout_ms = settings_.timeout_ms;
    request.cancel_token = settings_.cancel_token;

    LOG_DEBUG("gemini_search: running " + request.executable + " -p \"" +
              request.arguments[1] + "\"");
    auto run_result = runner_->run(request);
    if (core::errors::is_error(run_result)) {
        const auto& err = core::errors::get_error(run_result);
        return ServerError{ErrorCategory::Execution,
                           "Error executing gemini: " + err.message,
                           err.code};
    }
    const auto& capture = core::errors::get_value(run_result);
    LOG_DEBUG("gemini_search: exit_code=" + std::to_string(capture.exit_code) +
              " duration_ms=" + std::to_string(static_cast<long long>(capture.duration_ms)));

    if (capture.cancelled) {
        return ServerError{ErrorCategory::Execution, "Gemini command cancelled",
                           "command_cancelled"};
    }
    if (capture.timed_out) {
        return ServerError{ErrorCategory::Execution, "Gemini command timed out",
                           "command_timed_out",
                           "Raise --timeout-ms if searches legitimately take longer."};
    }
    if (capture.exit_code != 0) {
        return ServerError{ErrorCategory::Execution,
                           "Gemini command failed: " + capture.stderr_text,
                           "command_failed"};
    }

    return protocol::text_content_result(trim(capture.stdout_text));
}

core::errors::Result<std::string> register_gemini_search(
    ToolRegistry& registry, std::shared_ptr<const ProcessRunner> runner,
    GeminiSearchSettings settings) {
    auto tool = std::make_shared<const GeminiSearchTool>(std::move(runner),
                                                         std::move(settings));
    return registry.register_tool(
        gemini_search_descriptor(),
        [tool](const json& arguments) { return tool->call(arguments); });
}

}  // namespace gemini_mcp::tools
