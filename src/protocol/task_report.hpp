#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "command_contract.hpp"
#include "core/errors/gate_errors.hpp"

namespace cmdgate::protocol {

enum class TaskState {
    Proposed,
    Reviewed,
    Rejected,
    Executed,
    Verified,
    Failed
};

struct TaskReport {
    std::string task_id;
    TaskState state = TaskState::Proposed;
    std::optional<CommandProposal> proposal;
    std::optional<ReviewVerdict> verdict;
    std::optional<ExecutionResult> execution;
    std::optional<VerificationOutcome> verification;
    std::optional<core::errors::GateError> failure;
    std::vector<TaskState> transitions;
    std::uint32_t attempts = 1;

    // True only for a task that ran and whose post-conditions all held.
    bool succeeded() const {
        return state == TaskState::Verified && verification.has_value() &&
               verification->passed;
    }
};

inline bool is_terminal(const TaskState state) {
    return state == TaskState::Rejected || state == TaskState::Verified ||
           state == TaskState::Failed;
}

inline std::string to_string(const TaskState state) {
    switch (state) {
        case TaskState::Proposed:
            return "proposed";
        case TaskState::Reviewed:
            return "reviewed";
        case TaskState::Rejected:
            return "rejected";
        case TaskState::Executed:
            return "executed";
        case TaskState::Verified:
            return "verified";
        case TaskState::Failed:
            return "failed";
        default:
            return "unknown";
    }
}

}  // namespace cmdgate::protocol
