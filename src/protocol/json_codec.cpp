#include "protocol/json_codec.hpp"

namespace cmdgate::protocol {

using nlohmann::json;

json proposal_to_json(const CommandProposal& proposal) {
    json payload;
    payload["id"] = proposal.id;
    payload["command"] = proposal.command;
    payload["rationale"] = proposal.rationale;
    return payload;
}

json verdict_to_json(const ReviewVerdict& verdict) {
    json payload;
    payload["proposal_id"] = verdict.proposal_id;
    payload["approved"] = verdict.approved;
    payload["reasoning"] = verdict.reasoning.has_value() ? json(verdict.reasoning.value())
                                                         : json(nullptr);
    payload["category"] = to_string(verdict.category);
    payload["classifier"] = verdict.classifier;
    return payload;
}

json execution_to_json(const ExecutionResult& execution) {
    json payload;
    payload["proposal_id"] = execution.proposal_id;
    payload["exit_code"] = execution.exit_code;
    payload["stdout"] = execution.stdout_text;
    payload["stderr"] = execution.stderr_text;
    payload["duration_ms"] = execution.duration.count();
    payload["timed_out"] = execution.timed_out;
    payload["cancelled"] = execution.cancelled;
    payload["stdout_truncated"] = execution.stdout_truncated;
    payload["stderr_truncated"] = execution.stderr_truncated;
    return payload;
}

json verification_to_json(const VerificationOutcome& outcome) {
    json payload;
    payload["passed"] = outcome.passed;
    payload["detail"] = outcome.detail;
    return payload;
}

json error_to_json(const core::errors::GateError& error) {
    json payload;
    payload["category"] = core::errors::to_string(error.category);
    payload["code"] = error.code;
    payload["message"] = error.message;
    if (!error.hint.empty()) {
        payload["hint"] = error.hint;
    }
    return payload;
}

json report_to_json(const TaskReport& report) {
    json payload;
    payload["task_id"] = report.task_id;
    payload["state"] = to_string(report.state);
    payload["attempts"] = report.attempts;
    payload["succeeded"] = report.succeeded();
    json transitions = json::array();
    for (const auto state : report.transitions) {
        transitions.push_back(to_string(state));
    }
    payload["transitions"] = transitions;
    if (report.proposal.has_value()) {
        payload["proposal"] = proposal_to_json(report.proposal.value());
    }
    if (report.verdict.has_value()) {
        payload["verdict"] = verdict_to_json(report.verdict.value());
    }
    if (report.execution.has_value()) {
        payload["execution"] = execution_to_json(report.execution.value());
    }
    if (report.verification.has_value()) {
        payload["verification"] = verification_to_json(report.verification.value());
    }
    if (report.failure.has_value()) {
        payload["failure"] = error_to_json(report.failure.value());
    }
    return payload;
}

}  // namespace cmdgate::protocol
