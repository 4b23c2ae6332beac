#include <string>
#include <vector>
#include <gtest/gtest.h>
#include "app/cli_parser.hpp"
#include "core/errors/server_errors.hpp"

namespace {

using gemini_mcp::app::cli::parse_and_validate;
using gemini_mcp::core::errors::ErrorCategory;
using gemini_mcp::core::errors::get_error;
using gemini_mcp::core::errors::get_value;
using gemini_mcp::core::errors::is_error;
using gemini_mcp::protocol::ServerConfig;

gemini_mcp::core::errors::Result<ServerConfig> parse_tokens(
    const std::vector<std::string>& tokens) {
    std::vector<std::string> owned_args;
    owned_args.reserve(tokens.size() + 1);
    owned_args.emplace_back("gemini_mcp_server");
    for (const auto& token : tokens) {
        owned_args.push_back(token);
    }

    std::vector<char*> argv;
    argv.reserve(owned_args.size());
    for (auto& arg : owned_args) {
        argv.push_back(arg.data());
    }

    return parse_and_validate(static_cast<int>(argv.size()), argv.data());
}

TEST(CliParserTest, DefaultsWithoutArguments) {
    auto result = parse_tokens({});
    ASSERT_FALSE(is_error(result));

    const auto& config = get_value(result);
    EXPECT_EQ(config.gemini_command, "gemini");
    EXPECT_EQ(config.timeout_ms, 60000u);
    EXPECT_FALSE(config.verbose);
    EXPECT_FALSE(config.show_help);
}

TEST(CliParserTest, FailsWhenArgumentUnknown) {
    auto result = parse_tokens({"--model", "pro"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).category, ErrorCategory::Input);
    EXPECT_EQ(get_error(result).code, "unknown_argument");
    EXPECT_FALSE(get_error(result).hint.empty());
}

TEST(CliParserTest, FailsWhenCommandValueMissing) {
    auto result = parse_tokens({"--command"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "missing_value");
}

TEST(CliParserTest, FailsWhenCommandEmpty) {
    auto result = parse_tokens({"--command", ""});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "empty_command");
}

TEST(CliParserTest, FailsWhenTimeoutNotNumeric) {
    auto result = parse_tokens({"--timeout-ms", "abc"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_integer");
}

TEST(CliParserTest, FailsWhenTimeoutHasTrailingCharacters) {
    auto result = parse_tokens({"--timeout-ms", "500ms"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_integer");
}

TEST(CliParserTest, FailsWhenTimeoutOutOfBounds) {
    auto zero = parse_tokens({"--timeout-ms", "0"});
    ASSERT_TRUE(is_error(zero));
    EXPECT_EQ(get_error(zero).code, "bounds_error");

    auto huge = parse_tokens({"--timeout-ms", "3600001"});
    ASSERT_TRUE(is_error(huge));
    EXPECT_EQ(get_error(huge).code, "bounds_error");
}

TEST(CliParserTest, FailsWhenTimeoutValueMissing) {
    auto result = parse_tokens({"--verbose", "--timeout-ms"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "missing_value");
}

TEST(CliParserTest, ParsesAllFlags) {
    auto result = parse_tokens({"--command", "/opt/gemini/bin/gemini", "--timeout-ms",
                                "1500", "--verbose"});
    ASSERT_FALSE(is_error(result));

    const auto& config = get_value(result);
    EXPECT_EQ(config.gemini_command, "/opt/gemini/bin/gemini");
    EXPECT_EQ(config.timeout_ms, 1500u);
    EXPECT_TRUE(config.verbose);
}

TEST(CliParserTest, ParsesHelp) {
    auto result = parse_tokens({"--help"});
    ASSERT_FALSE(is_error(result));
    EXPECT_TRUE(get_value(result).show_help);

    const std::string text = gemini_mcp::app::cli::usage("gemini_mcp_server");
    EXPECT_NE(text.find("--timeout-ms"), std::string::npos);
    EXPECT_NE(text.find("--command"), std::string::npos);
}

}  // namespace
