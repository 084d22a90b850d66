#include "session/task_registry.hpp"
#include <utility>
#include "core/config/session_id.hpp"
#include "core/logging/logger.hpp"

namespace cmdgate::session {

using core::errors::ErrorCategory;
using core::errors::GateError;
using protocol::TaskState;

bool TaskRegistry::is_allowed(const TaskState from, const TaskState to) {
    switch (from) {
        case TaskState::Proposed:
            return to == TaskState::Reviewed || to == TaskState::Failed;
        case TaskState::Reviewed:
            return to == TaskState::Rejected || to == TaskState::Executed ||
                   to == TaskState::Failed;
        case TaskState::Executed:
            return to == TaskState::Verified || to == TaskState::Failed;
        default:
            return false;
    }
}

core::errors::Result<std::string> TaskRegistry::open_task(const std::string& task_description) {
    if (task_description.empty()) {
        return GateError{ErrorCategory::Input, "Task description cannot be empty.",
                         "invalid_task_request"};
    }

    std::lock_guard<std::mutex> lock(mutex_);
    constexpr int kMaxAttempts = 16;
    for (int attempt = 0; attempt < kMaxAttempts; ++attempt) {
        const std::string task_id = core::config::generate_id("task");
        if (tasks_.find(task_id) != tasks_.end()) {
            continue;
        }

        TaskRecord record;
        record.task_id = task_id;
        record.task_description = task_description;
        record.cancel_token = std::make_shared<std::atomic_bool>(false);
        record.transitions.push_back(TaskState::Proposed);
        tasks_.emplace(task_id, std::move(record));
        LOG_DEBUG("TaskRegistry: task " + task_id + " opened");
        return task_id;
    }

    return GateError{ErrorCategory::Internal, "Unable to allocate unique task ID.",
                     "task_id_generation_failed"};
}

core::errors::Result<TaskState> TaskRegistry::transition(
    const std::string& task_id, const TaskState next,
    const std::optional<std::string>& failure_reason) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tasks_.find(task_id);
    if (it == tasks_.end()) {
        return GateError{ErrorCategory::Input, "Task ID not found: " + task_id,
                         "task_not_found"};
    }

    if (!is_allowed(it->second.state, next)) {
        return GateError{ErrorCategory::Internal,
                         "Illegal task transition " + protocol::to_string(it->second.state) +
                             " -> " + protocol::to_string(next),
                         "invalid_state_transition"};
    }

    const std::string prev = protocol::to_string(it->second.state);
    it->second.state = next;
    it->second.transitions.push_back(next);
    if (failure_reason.has_value()) {
        it->second.failure_reason = failure_reason;
    }
    LOG_INFO("TaskRegistry: task " + task_id + " transition " + prev + " -> " +
             protocol::to_string(next));
    return it->second.state;
}

core::errors::Result<TaskState> TaskRegistry::cancel_task(const std::string& task_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tasks_.find(task_id);
    if (it == tasks_.end()) {
        return GateError{ErrorCategory::Input, "Task ID not found: " + task_id,
                         "task_not_found"};
    }
    if (protocol::is_terminal(it->second.state)) {
        return GateError{ErrorCategory::Input,
                         "Task is already terminal: " + protocol::to_string(it->second.state),
                         "invalid_state_transition"};
    }
    it->second.cancel_token->store(true);
    LOG_INFO("TaskRegistry: task " + task_id + " cancellation requested");
    return it->second.state;
}

core::errors::Result<TaskState> TaskRegistry::get_task_state(const std::string& task_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tasks_.find(task_id);
    if (it == tasks_.end()) {
        return GateError{ErrorCategory::Input, "Task ID not found: " + task_id,
                         "task_not_found"};
    }
    return it->second.state;
}

core::errors::Result<std::shared_ptr<std::atomic_bool>> TaskRegistry::get_cancel_token(
    const std::string& task_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tasks_.find(task_id);
    if (it == tasks_.end()) {
        return GateError{ErrorCategory::Input, "Task ID not found: " + task_id,
                         "task_not_found"};
    }
    return it->second.cancel_token;
}

core::errors::Result<std::vector<TaskState>> TaskRegistry::get_transitions(
    const std::string& task_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tasks_.find(task_id);
    if (it == tasks_.end()) {
        return GateError{ErrorCategory::Input, "Task ID not found: " + task_id,
                         "task_not_found"};
    }
    return it->second.transitions;
}

std::size_t TaskRegistry::task_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tasks_.size();
}

}  // namespace cmdgate::session
