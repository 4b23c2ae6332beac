#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>
#include "core/errors/server_errors.hpp"

namespace gemini_mcp::tools {

struct ProcessRequest {
    std::string executable;              // resolved through PATH
    std::vector<std::string> arguments;  // argv[1..], passed without a shell
    std::uint32_t timeout_ms = 60000;    // 0 disables the timeout
    std::shared_ptr<std::atomic_bool> cancel_token;
};

struct ProcessCapture {
    int exit_code = -1;
    bool timed_out = false;
    bool cancelled = false;
    std::string stdout_text;
    std::string stderr_text;
    double duration_ms = 0.0;
};

// Seam between the tool handlers and the operating system. Launch failures
// come back as errors; a process that ran (whatever its exit code) comes
// back as a capture.
class ProcessRunner {
public:
    virtual ~ProcessRunner() = default;

    virtual core::errors::Result<ProcessCapture> run(
        const ProcessRequest& request) const = 0;
};

// fork/exec runner. The child gets /dev/null as stdin and its own process
// group, so a timeout or cancellation kills everything it spawned.
class PosixProcessRunner final : public ProcessRunner {
public:
    core::errors::Result<ProcessCapture> run(
        const ProcessRequest& request) const override;
};

}  // namespace gemini_mcp::tools
