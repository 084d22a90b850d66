#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include "core/errors/gate_errors.hpp"
#include "policy/classifier.hpp"
#include "protocol/command_contract.hpp"

namespace cmdgate::runtime {

struct ExecutionOptions {
    std::filesystem::path working_directory = ".";  // relative to the sandbox root
    std::uint32_t timeout_ms = 5000;
    std::optional<std::string> stdin_text;
    std::shared_ptr<std::atomic_bool> cancel_token;
};

// One mutex per canonical sandbox root, shared process-wide.
std::shared_ptr<std::mutex> sandbox_lock(const std::filesystem::path& canonical_root);

class SandboxedExecutor {
public:
    SandboxedExecutor(policy::PolicySettings settings, std::size_t max_output_bytes);

    // Re-checks containment of the working directory and every path word
    // before spawning; a violation fails with ErrorCategory::SandboxViolation
    // and nothing runs. Non-zero exits are results, not errors.
    core::errors::Result<protocol::ExecutionResult> run(
        const std::filesystem::path& sandbox_root,
        const protocol::CommandProposal& proposal,
        const ExecutionOptions& options) const;

private:
    policy::PolicySettings settings_;
    std::size_t max_output_bytes_;
};

}  // namespace cmdgate::runtime
