#include <filesystem>
#include <fstream>
#include <memory>
#include <string>
#include <vector>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "core/config/session_id.hpp"
#include "core/errors/server_errors.hpp"
#include "tools/gemini_search.hpp"
#include "tools/process_runner.hpp"
#include "tools/tool_registry.hpp"

namespace {

using gemini_mcp::core::errors::ErrorCategory;
using gemini_mcp::core::errors::get_error;
using gemini_mcp::core::errors::get_value;
using gemini_mcp::core::errors::is_error;
using gemini_mcp::core::errors::Result;
using gemini_mcp::core::errors::ServerError;
using gemini_mcp::tools::GeminiSearchSettings;
using gemini_mcp::tools::GeminiSearchTool;
using gemini_mcp::tools::PosixProcessRunner;
using gemini_mcp::tools::ProcessCapture;
using gemini_mcp::tools::ProcessRequest;
using gemini_mcp::tools::ProcessRunner;
using nlohmann::json;

// Records every request and replays a canned outcome.
class FakeProcessRunner : public ProcessRunner {
public:
    explicit FakeProcessRunner(Result<ProcessCapture> outcome)
        : outcome_(std::move(outcome)) {}

    Result<ProcessCapture> run(const ProcessRequest& request) const override {
        requests_.push_back(request);
        return outcome_;
    }

    const std::vector<ProcessRequest>& requests() const { return requests_; }

private:
    Result<ProcessCapture> outcome_;
    mutable std::vector<ProcessRequest> requests_;
};

ProcessCapture exited(int exit_code, const std::string& out, const std::string& err = "") {
    ProcessCapture capture;
    capture.exit_code = exit_code;
    capture.stdout_text = out;
    capture.stderr_text = err;
    return capture;
}

class TempWorkspace {
public:
    TempWorkspace() {
        root_ = std::filesystem::current_path() /
                (".tmp_gemini_search_" + gemini_mcp::core::config::generate_hex_id(12));
        std::filesystem::create_directories(root_);
    }

    ~TempWorkspace() {
        std::error_code ec;
        std::filesystem::remove_all(root_, ec);
    }

    const std::filesystem::path& root() const { return root_; }

private:
    std::filesystem::path root_;
};

std::filesystem::path write_script(const std::filesystem::path& path,
                                   const std::string& body) {
    std::ofstream out(path);
    out << "#!/bin/sh\n" << body << "\n";
    out.close();
    std::filesystem::permissions(path, std::filesystem::perms::owner_all);
    return path;
}

TEST(GeminiSearchTest, PrefixesQueryWithWebSearchMarker) {
    EXPECT_EQ(gemini_mcp::tools::build_search_prompt("X"), "WebSearch: X");
    EXPECT_EQ(gemini_mcp::tools::build_search_prompt(""), "WebSearch: ");
}

TEST(GeminiSearchTest, DescriptorMatchesAdvertisedSchema) {
    const auto descriptor = gemini_mcp::tools::gemini_search_descriptor();
    EXPECT_EQ(descriptor.name, "gemini_search");
    EXPECT_NE(descriptor.description.find("Google Gemini"), std::string::npos);
    EXPECT_EQ(descriptor.input_schema["type"], "object");
    EXPECT_EQ(descriptor.input_schema["properties"]["query"]["type"], "string");
    EXPECT_EQ(descriptor.input_schema["required"], json::array({"query"}));
}

TEST(GeminiSearchTest, InvokesGeminiWithPromptFlag) {
    auto runner = std::make_shared<FakeProcessRunner>(exited(0, "ok"));
    GeminiSearchTool tool(runner, GeminiSearchSettings{});

    auto result = tool.call(json{{"query", "current weather in Tokyo"}});
    ASSERT_FALSE(is_error(result));

    ASSERT_EQ(runner->requests().size(), 1u);
    const auto& request = runner->requests().front();
    EXPECT_EQ(request.executable, "gemini");
    EXPECT_EQ(request.arguments,
              (std::vector<std::string>{"-p", "WebSearch: current weather in Tokyo"}));
    EXPECT_EQ(request.timeout_ms, 60000u);
}

TEST(GeminiSearchTest, MissingQuerySendsBareMarker) {
    auto runner = std::make_shared<FakeProcessRunner>(exited(0, "ok"));
    GeminiSearchTool tool(runner, GeminiSearchSettings{});

    ASSERT_FALSE(is_error(tool.call(json::object())));
    ASSERT_FALSE(is_error(tool.call(json{{"query", nullptr}})));
    ASSERT_FALSE(is_error(tool.call(json{{"query", 42}})));

    ASSERT_EQ(runner->requests().size(), 3u);
    EXPECT_EQ(runner->requests()[0].arguments[1], "WebSearch: ");
    EXPECT_EQ(runner->requests()[1].arguments[1], "WebSearch: ");
    EXPECT_EQ(runner->requests()[2].arguments[1], "WebSearch: 42");
}

TEST(GeminiSearchTest, UsesConfiguredCommandAndTimeout) {
    auto runner = std::make_shared<FakeProcessRunner>(exited(0, "ok"));
    GeminiSearchSettings settings;
    settings.command = "/usr/local/bin/gemini";
    settings.timeout_ms = 1234;
    GeminiSearchTool tool(runner, settings);

    ASSERT_FALSE(is_error(tool.call(json{{"query", "q"}})));
    EXPECT_EQ(runner->requests().front().executable, "/usr/local/bin/gemini");
    EXPECT_EQ(runner->requests().front().timeout_ms, 1234u);
}

TEST(GeminiSearchTest, WrapsTrimmedStdoutAsTextContent) {
    auto runner = std::make_shared<FakeProcessRunner>(exited(0, "\n  42 degrees \n"));
    GeminiSearchTool tool(runner, GeminiSearchSettings{});

    auto result = tool.call(json{{"query", "X"}});
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result),
              json::parse(R"({"content":[{"type":"text","text":"42 degrees"}]})"));
}

TEST(GeminiSearchTest, NonZeroExitEmbedsStderr) {
    auto runner = std::make_shared<FakeProcessRunner>(exited(1, "ignored", "API key missing"));
    GeminiSearchTool tool(runner, GeminiSearchSettings{});

    auto result = tool.call(json{{"query", "X"}});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).category, ErrorCategory::Execution);
    EXPECT_EQ(get_error(result).code, "command_failed");
    EXPECT_EQ(get_error(result).message, "Gemini command failed: API key missing");
}

TEST(GeminiSearchTest, TimeoutReturnsFixedMessage) {
    ProcessCapture capture = exited(137, "partial answer");
    capture.timed_out = true;
    auto runner = std::make_shared<FakeProcessRunner>(capture);
    GeminiSearchTool tool(runner, GeminiSearchSettings{});

    auto result = tool.call(json{{"query", "X"}});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "command_timed_out");
    EXPECT_EQ(get_error(result).message, "Gemini command timed out");
}

TEST(GeminiSearchTest, CancellationIsReported) {
    ProcessCapture capture = exited(137, "");
    capture.cancelled = true;
    auto runner = std::make_shared<FakeProcessRunner>(capture);
    GeminiSearchTool tool(runner, GeminiSearchSettings{});

    auto result = tool.call(json{{"query", "X"}});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "command_cancelled");
}

TEST(GeminiSearchTest, LaunchFailureEmbedsDescription) {
    auto runner = std::make_shared<FakeProcessRunner>(
        ServerError{ErrorCategory::Execution, "Failed to launch 'gemini': No such file or directory",
                    "process_launch_failed"});
    GeminiSearchTool tool(runner, GeminiSearchSettings{});

    auto result = tool.call(json{{"query", "X"}});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).category, ErrorCategory::Execution);
    EXPECT_EQ(get_error(result).code, "process_launch_failed");
    EXPECT_EQ(get_error(result).message,
              "Error executing gemini: Failed to launch 'gemini': No such file or directory");
}

TEST(GeminiSearchTest, RegistersIntoRegistry) {
    gemini_mcp::tools::ToolRegistry registry;
    auto runner = std::make_shared<FakeProcessRunner>(exited(0, "sunny"));
    auto registered = gemini_mcp::tools::register_gemini_search(registry, runner, {});
    ASSERT_FALSE(is_error(registered));
    EXPECT_EQ(get_value(registered), "gemini_search");

    auto result = registry.call_tool("gemini_search", json{{"query", "weather"}});
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result)["content"][0]["text"], "sunny");
    EXPECT_EQ(runner->requests().front().arguments[1], "WebSearch: weather");
}

TEST(GeminiSearchTest, RunsRealExecutableEndToEnd) {
    TempWorkspace workspace;
    const auto script = write_script(workspace.root() / "fake-gemini",
                                     "[ \"$1\" = \"-p\" ] || exit 9\nprintf '  %s  \\n' \"$2\"");

    GeminiSearchSettings settings;
    settings.command = script.string();
    settings.timeout_ms = 5000;
    GeminiSearchTool tool(std::make_shared<PosixProcessRunner>(), settings);

    auto result = tool.call(json{{"query", "latest news about AI"}});
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result)["content"][0]["text"], "WebSearch: latest news about AI");
}

TEST(GeminiSearchTest, RealExecutableTimesOut) {
    TempWorkspace workspace;
    const auto script = write_script(workspace.root() / "slow-gemini", "exec sleep 30");

    GeminiSearchSettings settings;
    settings.command = script.string();
    settings.timeout_ms = 150;
    GeminiSearchTool tool(std::make_shared<PosixProcessRunner>(), settings);

    auto result = tool.call(json{{"query", "X"}});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).message, "Gemini command timed out");
}

}  // namespace
