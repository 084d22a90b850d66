#pragma once

#include <filesystem>
#include <mutex>
#include <string>
#include <nlohmann/json.hpp>
#include "core/errors/gate_errors.hpp"
#include "protocol/command_contract.hpp"
#include "protocol/task_report.hpp"

namespace cmdgate::session {

// Appends one JSON object per line to <artifact_dir>/<session_id>.jsonl.
class ArtifactWriter {
public:
    ArtifactWriter(std::filesystem::path artifact_dir, std::string session_id);

    core::errors::Result<std::filesystem::path> write_proposal(
        const std::string& task_id, const protocol::CommandProposal& proposal) const;

    core::errors::Result<std::filesystem::path> write_verdict(
        const std::string& task_id, const protocol::ReviewVerdict& verdict) const;

    core::errors::Result<std::filesystem::path> write_execution(
        const std::string& task_id, const protocol::ExecutionResult& execution) const;

    core::errors::Result<std::filesystem::path> write_verification(
        const std::string& task_id, const protocol::VerificationOutcome& outcome) const;

    core::errors::Result<std::filesystem::path> write_final(
        const protocol::TaskReport& report) const;

    core::errors::Result<std::filesystem::path> session_log_path() const;

private:
    core::errors::Result<std::filesystem::path> append_event(
        const std::string& event, const std::string& task_id,
        const nlohmann::json& payload) const;

    std::filesystem::path artifact_dir_;
    std::string session_id_;
    mutable std::mutex mutex_;
};

}  // namespace cmdgate::session
