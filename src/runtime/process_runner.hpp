#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include "core/errors/gate_errors.hpp"

namespace cmdgate::runtime {

struct ProcessRequest {
    std::string command;                    // passed to /bin/sh -c
    std::filesystem::path working_directory;
    std::uint32_t timeout_ms = 5000;        // 0 disables the timeout
    std::size_t max_output_bytes = 1024 * 1024;  // per stream
    std::optional<std::string> stdin_text;  // child reads /dev/null when unset
    std::shared_ptr<std::atomic_bool> cancel_token;
};

struct ProcessCapture {
    int exit_code = -1;
    bool timed_out = false;
    bool cancelled = false;
    std::string stdout_text;
    std::string stderr_text;
    bool stdout_truncated = false;
    bool stderr_truncated = false;
    std::chrono::milliseconds duration{0};
};

// Runs the command in its own process group. Timeout and cancellation kill
// the whole group with SIGKILL; a timed-out run reports exit code 124.
core::errors::Result<ProcessCapture> run_process(const ProcessRequest& request);

}  // namespace cmdgate::runtime
