#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <nlohmann/json.hpp>
#include "core/errors/server_errors.hpp"
#include "protocol/tool_contract.hpp"
#include "tools/process_runner.hpp"
#include "tools/tool_registry.hpp"

namespace gemini_mcp::tools {

inline constexpr const char* kGeminiSearchToolName = "gemini_search";

// Tells gemini to search the web instead of answering from its own knowledge.
inline constexpr const char* kWebSearchMarker = "WebSearch: ";

struct GeminiSearchSettings {
    std::string command = "gemini";
    std::uint32_t timeout_ms = 60000;
    std::shared_ptr<std::atomic_bool> cancel_token;
};

std::string build_search_prompt(const std::string& query);

protocol::ToolDescriptor gemini_search_descriptor();

class GeminiSearchTool {
public:
    GeminiSearchTool(std::shared_ptr<const ProcessRunner> runner,
                     GeminiSearchSettings settings);

    // arguments: {"query": "..."}; a missing query searches for "".
    core::errors::Result<nlohmann::json> call(const nlohmann::json& arguments) const;

private:
    std::shared_ptr<const ProcessRunner> runner_;
    GeminiSearchSettings settings_;
};

core::errors::Result<std::string> register_gemini_search(
    ToolRegistry& registry, std::shared_ptr<const ProcessRunner> runner,
    GeminiSearchSettings settings);

}  // namespace gemini_mcp::tools
