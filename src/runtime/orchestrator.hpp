#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include "core/errors/gate_errors.hpp"
#include "protocol/command_contract.hpp"
#include "protocol/task_report.hpp"
#include "protocol/task_request.hpp"
#include "review/proposer.hpp"
#include "review/reviewer.hpp"
#include "runtime/sandboxed_executor.hpp"
#include "session/session.hpp"

namespace cmdgate::runtime {

// Drives one task through propose -> review -> execute -> verify inside a
// session's sandbox. Pipeline outcomes (rejections, failed commands, failed
// checks) come back in the TaskReport; the Result error side is reserved for
// bad requests and internal faults.
class Orchestrator {
public:
    Orchestrator(session::Session& session, std::shared_ptr<const review::Proposer> proposer,
                 std::shared_ptr<const review::Reviewer> reviewer, SandboxedExecutor executor);

    core::errors::Result<protocol::TaskReport> run_task(const protocol::TaskRequest& request);

    // Skips the proposer and uses `proposal` as given.
    core::errors::Result<protocol::TaskReport> run_proposal(const protocol::TaskRequest& request,
                                                            protocol::CommandProposal proposal);

    // Stops at reviewed/rejected. Never executes.
    core::errors::Result<protocol::TaskReport> review_only(const protocol::TaskRequest& request,
                                                           protocol::CommandProposal proposal);

    // Re-prompts the proposer with the previous rejection or failure, at most
    // `max_revisions` extra times, and returns the last attempt's report.
    core::errors::Result<protocol::TaskReport> run_with_revisions(
        const protocol::TaskRequest& request, std::uint32_t max_revisions);

private:
    core::errors::Result<protocol::TaskReport> drive(
        const protocol::TaskRequest& request,
        std::optional<protocol::CommandProposal> proposal, bool execute,
        const std::string& feedback);

    core::errors::Result<protocol::TaskState> advance(
        protocol::TaskReport& report, protocol::TaskState next,
        const std::optional<core::errors::GateError>& failure = std::nullopt);

    void finish(const protocol::TaskReport& report) const;

    session::Session& session_;
    std::shared_ptr<const review::Proposer> proposer_;
    std::shared_ptr<const review::Reviewer> reviewer_;
    SandboxedExecutor executor_;
};

}  // namespace cmdgate::runtime
