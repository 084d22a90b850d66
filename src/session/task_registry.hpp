#pragma once

#include <atomic>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include "core/errors/gate_errors.hpp"
#include "protocol/task_report.hpp"

namespace cmdgate::session {

struct TaskRecord {
    std::string task_id;
    std::string task_description;
    protocol::TaskState state = protocol::TaskState::Proposed;
    std::optional<std::string> failure_reason;
    std::shared_ptr<std::atomic_bool> cancel_token;
    std::vector<protocol::TaskState> transitions;
};

// Per-session record of every task and the states it moved through.
class TaskRegistry {
public:
    // New task in state Proposed, id "task-XXXXXXXX".
    core::errors::Result<std::string> open_task(const std::string& task_description);

    // Only forward edges of the pipeline are accepted:
    //   proposed -> reviewed | failed
    //   reviewed -> rejected | executed | failed
    //   executed -> verified | failed
    core::errors::Result<protocol::TaskState> transition(
        const std::string& task_id, protocol::TaskState next,
        const std::optional<std::string>& failure_reason = std::nullopt);

    // Trips the task's cancel token; a running command is killed and the
    // task then fails. Terminal tasks cannot be cancelled.
    core::errors::Result<protocol::TaskState> cancel_task(const std::string& task_id);

    core::errors::Result<protocol::TaskState> get_task_state(const std::string& task_id) const;
    core::errors::Result<std::shared_ptr<std::atomic_bool>> get_cancel_token(
        const std::string& task_id) const;
    core::errors::Result<std::vector<protocol::TaskState>> get_transitions(
        const std::string& task_id) const;

    std::size_t task_count() const;

private:
    static bool is_allowed(protocol::TaskState from, protocol::TaskState to);

    mutable std::mutex mutex_;
    std::unordered_map<std::string, TaskRecord> tasks_;
};

}  // namespace cmdgate::session
