#pragma once

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>
#include "core/errors/gate_errors.hpp"
#include "protocol/command_contract.hpp"
#include "session/artifact_writer.hpp"
#include "session/task_registry.hpp"

namespace cmdgate::session {

// Filed when an approved command still tried to leave the sandbox: the
// policy engine let something through that it should not have.
struct DefectReport {
    std::string task_id;
    std::string proposal_id;
    std::string command;
    std::string message;
    std::string code;
};

struct SessionOptions {
    std::filesystem::path sandbox_base;
    std::optional<std::filesystem::path> artifact_dir;  // no artifact log when unset
    std::string session_id;                             // generated when empty
};

// Owns one sandbox root (<sandbox_base>/<session_id>) for its lifetime and
// purges it on destruction.
class Session {
    struct CreateTag {};

public:
    static core::errors::Result<std::unique_ptr<Session>> create(const SessionOptions& options);

    // Only reachable through create().
    Session(CreateTag, std::string id, std::filesystem::path sandbox_root,
            std::unique_ptr<ArtifactWriter> artifacts);

    ~Session();
    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    const std::string& id() const { return id_; }
    const std::filesystem::path& sandbox_root() const { return sandbox_root_; }

    // "prop-1", "prop-2", ...
    std::string next_proposal_id();

    // Only approved verdicts enter the ledger.
    void record_verdict(const protocol::ReviewVerdict& verdict);
    bool is_approved(const std::string& proposal_id) const;

    void file_defect(DefectReport report);
    std::vector<DefectReport> defects() const;

    TaskRegistry& tasks() { return tasks_; }
    const TaskRegistry& tasks() const { return tasks_; }

    // nullptr when the session keeps no artifact log.
    const ArtifactWriter* artifacts() const { return artifacts_.get(); }

    // Removes the sandbox tree now; the destructor does the same.
    core::errors::Result<std::uintmax_t> purge();

private:
    std::string id_;
    std::filesystem::path sandbox_root_;
    std::unique_ptr<ArtifactWriter> artifacts_;
    TaskRegistry tasks_;
    std::atomic<unsigned> proposal_counter_{0};
    bool purged_ = false;

    mutable std::mutex mutex_;
    std::unordered_set<std::string> approved_;
    std::vector<DefectReport> defects_;
};

}  // namespace cmdgate::session
