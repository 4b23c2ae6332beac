#include "cli_parser.hpp"
#include <charconv>
#include <cstdint>
#include <optional>
#include <system_error>
#include <vector>

namespace gemini_mcp::app::cli {

    using namespace gemini_mcp::core::errors;
    using gemini_mcp::protocol::ServerConfig;

    // 1. Raw Options Struct (Internal only)
    struct RawCliOptions {
        std::optional<std::string> command;
        std::optional<std::string> timeout_ms;
        bool verbose = false;
        bool help = false;
    };

    constexpr uint32_t kMaxTimeoutMs = 3600000;

    Result<ServerConfig> parse_and_validate(int argc, char* argv[]) {
        RawCliOptions raw;
        std::vector<std::string> args;
        for (int i = 1; i < argc; ++i) { // Start at 1 to skip program name
            args.push_back(argv[i]);
        }

        // 2. Parser Phase: Just read the raw strings
        for (size_t i = 0; i < args.size(); ++i) {
            if (args[i] == "--command") {
                if (i + 1 < args.size()) raw.command = args[++i];
                else return ServerError{ErrorCategory::Input, "Missing value for --command", "missing_value"};
            } else if (args[i] == "--timeout-ms") {
                if (i + 1 < args.size()) raw.timeout_ms = args[++i];
                else return ServerError{ErrorCategory::Input, "Missing value for --timeout-ms", "missing_value"};
            } else if (args[i] == "--verbose") {
                raw.verbose = true;
            } else if (args[i] == "--help" || args[i] == "-h") {
                raw.help = true;
            } else {
                return ServerError{ErrorCategory::Input, "Unknown argument: " + args[i], "unknown_argument", "Run with --help to list the supported flags."};
            }
        }

        // 3. Validator Phase: Enforce logic and bounds
        ServerConfig config;
        config.verbose = raw.verbose;
        config.show_help = raw.help;

        if (raw.command) {
            if (raw.command->empty()) {
                return ServerError{ErrorCategory::Input, "--command cannot be empty", "empty_command", "Pass the gemini executable name or path."};
            }
            config.gemini_command = raw.command.value();
        }

        // Exception-free integer parsing
        if (raw.timeout_ms) {
            uint32_t timeout = 0;
            const char* begin = raw.timeout_ms->data();
            const char* end = raw.timeout_ms->data() + raw.timeout_ms->size();
            auto [ptr, ec] = std::from_chars(begin, end, timeout);
            if (ec != std::errc() || ptr != end) {
                return ServerError{ErrorCategory::Input, "Invalid number for --timeout-ms", "invalid_integer", "Provide a positive integer."};
            }
            if (timeout == 0 || timeout > kMaxTimeoutMs) {
                return ServerError{ErrorCategory::Input, "--timeout-ms out of bounds", "bounds_error", "Must be between 1 and 3600000."};
            }
            config.timeout_ms = timeout;
        }

        return config;
    }

    std::string usage(const std::string& program_name) {
        return "Usage: " + program_name + " [--command <exe>] [--timeout-ms <n>] [--verbose]\n"
               "  --command <exe>     gemini executable to run (default: gemini)\n"
               "  --timeout-ms <n>    per-call timeout in milliseconds (default: 60000)\n"
               "  --verbose           log debug diagnostics to stderr\n";
    }

} // namespace gemini_mcp::app::cli
