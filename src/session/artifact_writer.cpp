#include "session/artifact_writer.hpp"

#include <chrono>
#include <fstream>
#include <utility>
#include "protocol/json_codec.hpp"

namespace cmdgate::session {

using core::errors::ErrorCategory;
using core::errors::GateError;
using nlohmann::json;

namespace {

std::int64_t now_unix_ms() {
    const auto now = std::chrono::system_clock::now();
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                        now.time_since_epoch())
                        .count();
    return static_cast<std::int64_t>(ms);
}

}  // namespace

ArtifactWriter::ArtifactWriter(std::filesystem::path artifact_dir, std::string session_id)
    : artifact_dir_(std::move(artifact_dir)), session_id_(std::move(session_id)) {}

core::errors::Result<std::filesystem::path> ArtifactWriter::session_log_path() const {
    if (session_id_.empty()) {
        return GateError{ErrorCategory::Input, "Session ID cannot be empty.",
                         "invalid_session_id"};
    }

    std::error_code ec;
    std::filesystem::create_directories(artifact_dir_, ec);
    if (ec) {
        return GateError{ErrorCategory::Internal,
                         "Unable to create artifacts directory: " + artifact_dir_.string(),
                         "artifact_dir_create_failed"};
    }
    return artifact_dir_ / (session_id_ + ".jsonl");
}

core::errors::Result<std::filesystem::path> ArtifactWriter::append_event(
    const std::string& event, const std::string& task_id, const json& payload) const {
    auto log_path_result = session_log_path();
    if (core::errors::is_error(log_path_result)) {
        return core::errors::get_error(log_path_result);
    }
    const auto log_path = core::errors::get_value(log_path_result);

    json line;
    line["ts_unix_ms"] = now_unix_ms();
    line["event"] = event;
    line["session_id"] = session_id_;
    line["task_id"] = task_id;
    line["payload"] = payload;

    std::lock_guard<std::mutex> lock(mutex_);
    std::ofstream out(log_path, std::ios::app);
    if (!out.is_open()) {
        return GateError{ErrorCategory::Internal,
                         "Unable to open artifact file: " + log_path.string(),
                         "artifact_open_failed"};
    }

    out << line.dump() << "\n";
    if (!out.good()) {
        return GateError{ErrorCategory::Internal,
                         "Unable to write artifact event: " + log_path.string(),
                         "artifact_write_failed"};
    }
    return log_path;
}

core::errors::Result<std::filesystem::path> ArtifactWriter::write_proposal(
    const std::string& task_id, const protocol::CommandProposal& proposal) const {
    return append_event("proposal", task_id, protocol::proposal_to_json(proposal));
}

core::errors::Result<std::filesystem::path> ArtifactWriter::write_verdict(
    const std::string& task_id, const protocol::ReviewVerdict& verdict) const {
    return append_event("verdict", task_id, protocol::verdict_to_json(verdict));
}

core::errors::Result<std::filesystem::path> ArtifactWriter::write_execution(
    const std::string& task_id, const protocol::ExecutionResult& execution) const {
    return append_event("execution", task_id, protocol::execution_to_json(execution));
}

core::errors::Result<std::filesystem::path> ArtifactWriter::write_verification(
    const std::string& task_id, const protocol::VerificationOutcome& outcome) const {
    return append_event("verification", task_id, protocol::verification_to_json(outcome));
}

core::errors::Result<std::filesystem::path> ArtifactWriter::write_final(
    const protocol::TaskReport& report) const {
    return append_event("final", report.task_id, protocol::report_to_json(report));
}

}  // namespace cmdgate::session
