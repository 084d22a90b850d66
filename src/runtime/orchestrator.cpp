#include "runtime/orchestrator.hpp"

#include <utility>
#include "core/logging/logger.hpp"
#include "verify/verifier.hpp"

namespace cmdgate::runtime {

using core::errors::ErrorCategory;
using core::errors::GateError;
using protocol::CommandProposal;
using protocol::TaskReport;
using protocol::TaskRequest;
using protocol::TaskState;

namespace {

template <typename T>
void warn_if_error(const core::errors::Result<T>& result) {
    if (core::errors::is_error(result)) {
        LOG_WARN("Artifact write failed: " + core::errors::get_error(result).message);
    }
}

std::string describe_outcome(const TaskReport& report) {
    const std::string command =
        report.proposal.has_value() ? "`" + report.proposal->command + "`" : "(none)";
    if (report.state == TaskState::Rejected && report.verdict.has_value()) {
        return "Previous command " + command + " was rejected (" +
               protocol::to_string(report.verdict->category) +
               "): " + report.verdict->reasoning.value_or("no reason given");
    }
    if (report.failure.has_value()) {
        return "Previous command " + command + " failed: " + report.failure->message;
    }
    return "Previous command " + command + " did not accomplish the task.";
}

}  // namespace

Orchestrator::Orchestrator(session::Session& session,
                           std::shared_ptr<const review::Proposer> proposer,
                           std::shared_ptr<const review::Reviewer> reviewer,
                           SandboxedExecutor executor)
    : session_(session),
      proposer_(std::move(proposer)),
      reviewer_(std::move(reviewer)),
      executor_(std::move(executor)) {}

core::errors::Result<TaskReport> Orchestrator::run_task(const TaskRequest& request) {
    return drive(request, std::nullopt, true, "");
}

core::errors::Result<TaskReport> Orchestrator::run_proposal(const TaskRequest& request,
                                                            CommandProposal proposal) {
    return drive(request, std::move(proposal), true, "");
}

core::errors::Result<TaskReport> Orchestrator::review_only(const TaskRequest& request,
                                                           CommandProposal proposal) {
    return drive(request, std::move(proposal), false, "");
}

core::errors::Result<TaskReport> Orchestrator::run_with_revisions(const TaskRequest& request,
                                                                  const std::uint32_t max_revisions) {
    std::string feedback;
    std::uint32_t attempt = 0;
    while (true) {
        ++attempt;
        auto result = drive(request, std::nullopt, true, feedback);
        if (core::errors::is_error(result)) {
            return result;
        }
        TaskReport report = core::errors::get_value(result);
        report.attempts = attempt;
        if (report.succeeded() || attempt > max_revisions) {
            if (!report.succeeded()) {
                LOG_WARN("Orchestrator: giving up on task after " + std::to_string(attempt) +
                         " attempt(s)");
            }
            return report;
        }
        feedback = describe_outcome(report);
        LOG_INFO("Orchestrator: revision " + std::to_string(attempt) + "/" +
                 std::to_string(max_revisions) + " after: " + feedback);
    }
}

core::errors::Result<TaskState> Orchestrator::advance(TaskReport& report, const TaskState next,
                                                      const std::optional<GateError>& failure) {
    std::optional<std::string> reason;
    if (failure.has_value()) {
        reason = failure->message;
        report.failure = failure;
    }
    auto moved = session_.tasks().transition(report.task_id, next, reason);
    if (core::errors::is_error(moved)) {
        return moved;
    }
    report.state = next;
    report.transitions.push_back(next);
    return moved;
}

void Orchestrator::finish(const TaskReport& report) const {
    if (const auto* artifacts = session_.artifacts()) {
        warn_if_error(artifacts->write_final(report));
    }
    LOG_INFO("Orchestrator: task " + report.task_id + " finished in state " +
             protocol::to_string(report.state));
}

core::errors::Result<TaskReport> Orchestrator::drive(const TaskRequest& request,
                                                     std::optional<CommandProposal> proposal,
                                                     const bool execute,
                                                     const std::string& feedback) {
    auto opened = session_.tasks().open_task(request.task_description);
    if (core::errors::is_error(opened)) {
        return core::errors::get_error(opened);
    }

    TaskReport report;
    report.task_id = core::errors::get_value(opened);
    report.state = TaskState::Proposed;
    report.transitions.push_back(TaskState::Proposed);
    const auto* artifacts = session_.artifacts();

    std::string context = request.context;
    if (!feedback.empty()) {
        context += context.empty() ? feedback : "\n" + feedback;
    }

    // Propose
    if (!proposal.has_value()) {
        if (!proposer_) {
            auto moved = advance(report, TaskState::Failed,
                                 GateError{ErrorCategory::Proposal, "No proposer configured.",
                                           "no_proposer"});
            if (core::errors::is_error(moved)) {
                return core::errors::get_error(moved);
            }
            finish(report);
            return report;
        }
        auto proposed = proposer_->propose(request.task_description, context);
        if (core::errors::is_error(proposed)) {
            auto error = core::errors::get_error(proposed);
            error.category = ErrorCategory::Proposal;
            auto moved = advance(report, TaskState::Failed, error);
            if (core::errors::is_error(moved)) {
                return core::errors::get_error(moved);
            }
            finish(report);
            return report;
        }
        proposal = core::errors::get_value(proposed);
    }
    if (proposal->id.empty()) {
        proposal->id = session_.next_proposal_id();
    }
    report.proposal = proposal;
    if (artifacts != nullptr) {
        warn_if_error(artifacts->write_proposal(report.task_id, proposal.value()));
    }
    LOG_INFO("Orchestrator: task " + report.task_id + " proposal " + proposal->id + ": " +
             proposal->command);

    // Review
    if (!reviewer_) {
        return GateError{ErrorCategory::Internal, "No reviewer configured.", "no_reviewer"};
    }
    const review::ReviewContext review_context{request.task_description, context,
                                               session_.sandbox_root()};
    auto assessed = reviewer_->assess(proposal.value(), review_context);
    if (core::errors::is_error(assessed)) {
        auto moved = advance(report, TaskState::Failed, core::errors::get_error(assessed));
        if (core::errors::is_error(moved)) {
            return core::errors::get_error(moved);
        }
        finish(report);
        return report;
    }
    auto verdict = core::errors::get_value(assessed);
    verdict.proposal_id = proposal->id;
    report.verdict = verdict;
    session_.record_verdict(verdict);
    if (artifacts != nullptr) {
        warn_if_error(artifacts->write_verdict(report.task_id, verdict));
    }

    auto reviewed = advance(report, TaskState::Reviewed);
    if (core::errors::is_error(reviewed)) {
        return core::errors::get_error(reviewed);
    }
    if (!verdict.approved) {
        auto moved = advance(report, TaskState::Rejected);
        if (core::errors::is_error(moved)) {
            return core::errors::get_error(moved);
        }
        finish(report);
        return report;
    }
    if (!execute) {
        finish(report);
        return report;
    }

    // Execute
    if (!session_.is_approved(proposal->id)) {
        auto moved = advance(report, TaskState::Failed,
                             GateError{ErrorCategory::Internal,
                                       "Proposal " + proposal->id + " has no approved verdict.",
                                       "unapproved_execution"});
        if (core::errors::is_error(moved)) {
            return core::errors::get_error(moved);
        }
        finish(report);
        return report;
    }

    auto token = session_.tasks().get_cancel_token(report.task_id);
    if (core::errors::is_error(token)) {
        return core::errors::get_error(token);
    }
    ExecutionOptions options;
    options.working_directory = request.working_subdir;
    options.timeout_ms = request.timeout_ms;
    options.cancel_token = core::errors::get_value(token);

    auto executed = executor_.run(session_.sandbox_root(), proposal.value(), options);
    if (core::errors::is_error(executed)) {
        const auto& error = core::errors::get_error(executed);
        if (error.category == ErrorCategory::SandboxViolation) {
            session_.file_defect(session::DefectReport{report.task_id, proposal->id,
                                                       proposal->command, error.message,
                                                       error.code});
        }
        auto moved = advance(report, TaskState::Failed, error);
        if (core::errors::is_error(moved)) {
            return core::errors::get_error(moved);
        }
        finish(report);
        return report;
    }
    const auto& execution = core::errors::get_value(executed);
    report.execution = execution;
    if (artifacts != nullptr) {
        warn_if_error(artifacts->write_execution(report.task_id, execution));
    }
    auto ran = advance(report, TaskState::Executed);
    if (core::errors::is_error(ran)) {
        return core::errors::get_error(ran);
    }

    std::optional<GateError> execution_failure;
    if (execution.timed_out) {
        execution_failure = GateError{ErrorCategory::Execution,
                                      "Command timed out after " +
                                          std::to_string(request.timeout_ms) + " ms.",
                                      "command_timeout"};
    } else if (execution.cancelled) {
        execution_failure =
            GateError{ErrorCategory::Execution, "Command was cancelled.", "command_cancelled"};
    } else if (execution.exit_code != 0) {
        execution_failure = GateError{ErrorCategory::Execution,
                                      "Command exited with code " +
                                          std::to_string(execution.exit_code) + ": " +
                                          execution.stderr_text,
                                      "command_failed"};
    }
    if (execution_failure.has_value()) {
        auto moved = advance(report, TaskState::Failed, execution_failure);
        if (core::errors::is_error(moved)) {
            return core::errors::get_error(moved);
        }
        finish(report);
        return report;
    }

    // Verify
    const verify::Verifier verifier(session_.sandbox_root());
    const auto outcome = verifier.verify_all(execution, request.expectations);
    report.verification = outcome;
    if (artifacts != nullptr) {
        warn_if_error(artifacts->write_verification(report.task_id, outcome));
    }
    std::optional<GateError> verification_failure;
    if (!outcome.passed) {
        verification_failure =
            GateError{ErrorCategory::Verification, outcome.detail, "verification_failed"};
        LOG_WARN("Orchestrator: task " + report.task_id + " verification failed: " +
                 outcome.detail);
    }
    auto verified = advance(report, TaskState::Verified, verification_failure);
    if (core::errors::is_error(verified)) {
        return core::errors::get_error(verified);
    }
    finish(report);
    return report;
}

}  // namespace cmdgate::runtime
