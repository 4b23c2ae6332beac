#include <atomic>
#include <csignal>
#include <iostream>
#include <memory>
#include <signal.h>
#include <string>
#include <unistd.h>
#include "app/cli_parser.hpp"
#include "core/config/session_id.hpp"
#include "core/errors/server_errors.hpp"
#include "core/logging/logger.hpp"
#include "protocol/mcp_contract.hpp"
#include "runtime/stdio_server.hpp"
#include "tools/gemini_search.hpp"
#include "tools/process_runner.hpp"
#include "tools/tool_registry.hpp"

namespace {

// Signal handlers only touch these lock-free atomics.
std::atomic_bool* g_stop_requested = nullptr;
std::atomic_bool* g_busy = nullptr;

void handle_stop_signal(int) {
    if (g_stop_requested != nullptr) {
        g_stop_requested->store(true);
    }
    // Blocked on stdin: nothing is in flight, leave right away.
    if (g_busy == nullptr || !g_busy->load()) {
        _exit(0);
    }
}

void install_signal_handlers() {
    struct sigaction action {};
    action.sa_handler = handle_stop_signal;
    sigemptyset(&action.sa_mask);
    static_cast<void>(sigaction(SIGINT, &action, nullptr));
    static_cast<void>(sigaction(SIGTERM, &action, nullptr));

    struct sigaction ignore {};
    ignore.sa_handler = SIG_IGN;
    sigemptyset(&ignore.sa_mask);
    static_cast<void>(sigaction(SIGPIPE, &ignore, nullptr));
}

}  // namespace

int main(int argc, char* argv[]) {
    namespace errors = gemini_mcp::core::errors;
    namespace logging = gemini_mcp::core::logging;

    // 1. Diagnostics go to stderr; stdout belongs to the protocol
    logging::Logger::get().set_sink(std::cerr);
    logging::Logger::get().set_session_id(gemini_mcp::core::config::generate_session_id());

    // 2. Parse CLI input and return normalized input errors
    auto parsed = gemini_mcp::app::cli::parse_and_validate(argc, argv);
    if (errors::is_error(parsed)) {
        const auto& err = errors::get_error(parsed);
        LOG_ERROR("Input error [" + err.code + "]: " + err.message);
        if (!err.hint.empty()) {
            LOG_INFO("Hint: " + err.hint);
        }
        return 2;
    }

    const auto& config = errors::get_value(parsed);
    if (config.show_help) {
        std::cerr << gemini_mcp::app::cli::usage(argc > 0 ? argv[0] : "gemini_mcp_server");
        return 0;
    }
    if (config.verbose) {
        logging::Logger::get().set_min_level(logging::LogLevel::DEBUG);
    }

    auto stop_token = std::make_shared<std::atomic_bool>(false);
    auto busy_flag = std::make_shared<std::atomic_bool>(false);
    g_stop_requested = stop_token.get();
    g_busy = busy_flag.get();
    install_signal_handlers();

    // 3. Register tools
    gemini_mcp::tools::ToolRegistry registry;
    gemini_mcp::tools::GeminiSearchSettings settings;
    settings.command = config.gemini_command;
    settings.timeout_ms = config.timeout_ms;
    settings.cancel_token = stop_token;

    auto registered = gemini_mcp::tools::register_gemini_search(
        registry, std::make_shared<gemini_mcp::tools::PosixProcessRunner>(), settings);
    if (errors::is_error(registered)) {
        const auto& err = errors::get_error(registered);
        LOG_ERROR("Failed to register tool [" + err.code + "]: " + err.message);
        return 1;
    }

    LOG_INFO(std::string(gemini_mcp::protocol::kServerName) + " " +
             gemini_mcp::protocol::kServerVersion + " starting (command=" +
             config.gemini_command + ", timeout_ms=" +
             std::to_string(config.timeout_ms) + ", tools=" +
             std::to_string(registry.size()) + ")");

    // 4. Serve until stdin closes or a stop signal arrives
    gemini_mcp::runtime::StdioServer server(registry);
    gemini_mcp::runtime::ServerContext context{std::cin, std::cout, stop_token, busy_flag};
    const auto stats = server.serve(context);

    LOG_INFO("Shutting down: lines_read=" + std::to_string(stats.lines_read) +
             " responses_written=" + std::to_string(stats.responses_written) +
             " lines_dropped=" + std::to_string(stats.lines_dropped));
    return 0;
}
