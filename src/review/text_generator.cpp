#include "review/text_generator.hpp"

#include <filesystem>
#include <utility>
#include "core/logging/logger.hpp"
#include "runtime/process_runner.hpp"

namespace cmdgate::review {

using core::errors::ErrorCategory;
using core::errors::GateError;

namespace {

std::string trim(const std::string& text) {
    const auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return "";
    }
    const auto last = text.find_last_not_of(" \t\r\n");
    return text.substr(first, last - first + 1);
}

}  // namespace

ProcessTextGenerator::ProcessTextGenerator(std::string command,
                                           const std::size_t max_output_bytes)
    : command_(std::move(command)), max_output_bytes_(max_output_bytes) {}

core::errors::Result<std::string> ProcessTextGenerator::generate(
    const std::string& prompt, const std::uint32_t timeout_ms) const {
    if (command_.empty()) {
        return GateError{ErrorCategory::Input, "No generator command configured.",
                         "generator_not_configured",
                         "Set proposer_command / reviewer_command in the config file."};
    }

    runtime::ProcessRequest request;
    request.command = command_;
    request.working_directory = std::filesystem::current_path();
    request.timeout_ms = timeout_ms;
    request.max_output_bytes = max_output_bytes_;
    request.stdin_text = prompt;

    auto capture_result = runtime::run_process(request);
    if (core::errors::is_error(capture_result)) {
        return core::errors::get_error(capture_result);
    }
    const auto& capture = core::errors::get_value(capture_result);
    if (capture.timed_out) {
        return GateError{ErrorCategory::Proposal,
                         "Generator timed out after " + std::to_string(timeout_ms) + " ms.",
                         "generator_timeout"};
    }
    if (capture.exit_code != 0) {
        LOG_WARN("Generator stderr: " + capture.stderr_text);
        return GateError{ErrorCategory::Proposal,
                         "Generator exited with code " + std::to_string(capture.exit_code) + ".",
                         "generator_failed"};
    }
    return capture.stdout_text;
}

std::string final_answer(const std::string& raw) {
    std::string text = raw;
    const std::string think_close = "</think>";
    const auto think = text.rfind(think_close);
    if (think != std::string::npos) {
        text = text.substr(think + think_close.size());
    }
    text = trim(text);

    if (text.rfind("```", 0) == 0) {
        const auto first_newline = text.find('\n');
        const auto closing = text.rfind("```");
        if (first_newline != std::string::npos && closing > first_newline) {
            text = trim(text.substr(first_newline + 1, closing - first_newline - 1));
        } else {
            // One-line fence: ```cmd```
            text = text.substr(3);
            if (text.size() >= 3 && text.compare(text.size() - 3, 3, "```") == 0) {
                text.resize(text.size() - 3);
            }
            text = trim(text);
        }
    }
    return text;
}

}  // namespace cmdgate::review
