#include "runtime/sandboxed_executor.hpp"

#include <map>
#include <utility>
#include "core/logging/logger.hpp"
#include "policy/classifiers/path_containment_classifier.hpp"
#include "policy/sandbox_paths.hpp"
#include "runtime/process_runner.hpp"

namespace cmdgate::runtime {

using core::errors::ErrorCategory;
using core::errors::GateError;
using protocol::CommandProposal;
using protocol::ExecutionResult;

namespace {

// Same analysis as the containment classifier, run from `working_dir`.
std::optional<GateError> find_escape(const std::filesystem::path& root,
                                     const std::filesystem::path& working_dir,
                                     const std::string& command,
                                     const policy::PolicySettings& settings) {
    const policy::PolicyContext context{root, settings};
    const auto violation = policy::find_containment_violation(
        policy::analyze_command(command), context, working_dir);
    if (!violation) {
        return std::nullopt;
    }
    if (violation->unresolvable) {
        return GateError{ErrorCategory::SandboxViolation,
                         "Unresolvable path at execution time: " + violation->message,
                         "unresolvable_path"};
    }
    return GateError{ErrorCategory::SandboxViolation,
                     "Command escapes sandbox root: " + violation->message,
                     "path_outside_sandbox"};
}

}  // namespace

std::shared_ptr<std::mutex> sandbox_lock(const std::filesystem::path& canonical_root) {
    static std::mutex registry_mutex;
    static std::map<std::string, std::weak_ptr<std::mutex>> registry;

    std::lock_guard<std::mutex> lock(registry_mutex);
    auto& slot = registry[canonical_root.string()];
    auto existing = slot.lock();
    if (existing) {
        return existing;
    }
    auto created = std::make_shared<std::mutex>();
    slot = created;
    return created;
}

SandboxedExecutor::SandboxedExecutor(policy::PolicySettings settings,
                                     const std::size_t max_output_bytes)
    : settings_(std::move(settings)), max_output_bytes_(max_output_bytes) {}

core::errors::Result<ExecutionResult> SandboxedExecutor::run(
    const std::filesystem::path& sandbox_root, const CommandProposal& proposal,
    const ExecutionOptions& options) const {
    auto root_result = policy::canonical_sandbox_root(sandbox_root);
    if (core::errors::is_error(root_result)) {
        return core::errors::get_error(root_result);
    }
    const auto root = core::errors::get_value(root_result);

    auto cwd_result = policy::validate_path_in_sandbox(root, options.working_directory);
    if (core::errors::is_error(cwd_result)) {
        const auto& error = core::errors::get_error(cwd_result);
        LOG_ERROR("Refusing to run " + proposal.id + ": " + error.message);
        return error;
    }
    const auto working_dir = core::errors::get_value(cwd_result);

    if (auto escape = find_escape(root, working_dir, proposal.command, settings_)) {
        LOG_ERROR("Refusing to run " + proposal.id + ": " + escape->message);
        return escape.value();
    }

    ProcessRequest request;
    request.command = proposal.command;
    request.working_directory = working_dir;
    request.timeout_ms = options.timeout_ms;
    request.max_output_bytes = max_output_bytes_;
    request.stdin_text = options.stdin_text;
    request.cancel_token = options.cancel_token;

    const auto root_lock = sandbox_lock(root);
    std::lock_guard<std::mutex> guard(*root_lock);

    LOG_DEBUG("Executing " + proposal.id + " in " + working_dir.string() + ": " +
              proposal.command);
    auto capture_result = run_process(request);
    if (core::errors::is_error(capture_result)) {
        return core::errors::get_error(capture_result);
    }
    const auto& capture = core::errors::get_value(capture_result);

    ExecutionResult result;
    result.proposal_id = proposal.id;
    result.exit_code = capture.exit_code;
    result.stdout_text = capture.stdout_text;
    result.stderr_text = capture.stderr_text;
    result.duration = capture.duration;
    result.timed_out = capture.timed_out;
    result.cancelled = capture.cancelled;
    result.stdout_truncated = capture.stdout_truncated;
    result.stderr_truncated = capture.stderr_truncated;

    if (result.timed_out) {
        LOG_WARN("Command " + proposal.id + " timed out after " +
                 std::to_string(options.timeout_ms) + " ms");
    } else {
        LOG_INFO("Command " + proposal.id + " exited with " +
                 std::to_string(result.exit_code) + " in " +
                 std::to_string(result.duration.count()) + " ms");
    }
    return result;
}

}  // namespace cmdgate::runtime
