#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>
#include "core/errors/gate_errors.hpp"
#include "policy/safety_policy_engine.hpp"
#include "protocol/command_contract.hpp"
#include "review/text_generator.hpp"

namespace cmdgate::review {

struct ReviewContext {
    std::string task_description;
    std::string context;
    std::filesystem::path sandbox_root;
};

class Reviewer {
public:
    virtual ~Reviewer() = default;
    virtual std::string name() const = 0;
    virtual core::errors::Result<protocol::ReviewVerdict> assess(
        const protocol::CommandProposal& proposal, const ReviewContext& context) const = 0;
};

class PolicyReviewer : public Reviewer {
public:
    explicit PolicyReviewer(policy::SafetyPolicyEngine engine);

    std::string name() const override { return "policy"; }
    core::errors::Result<protocol::ReviewVerdict> assess(
        const protocol::CommandProposal& proposal, const ReviewContext& context) const override;

private:
    policy::SafetyPolicyEngine engine_;
};

// Asks a model for {"approved": bool, "reasoning": string}. Anything that
// does not parse as exactly that is a rejection.
class GenerativeReviewer : public Reviewer {
public:
    GenerativeReviewer(std::shared_ptr<const TextGenerator> generator, std::uint32_t timeout_ms);

    std::string name() const override { return "generative"; }
    core::errors::Result<protocol::ReviewVerdict> assess(
        const protocol::CommandProposal& proposal, const ReviewContext& context) const override;

    std::string build_prompt(const protocol::CommandProposal& proposal,
                             const ReviewContext& context) const;

    // Exposed for tests: maps a raw model reply to a verdict.
    static protocol::ReviewVerdict parse_reply(const std::string& proposal_id,
                                               const std::string& raw_reply);

private:
    std::shared_ptr<const TextGenerator> generator_;
    std::uint32_t timeout_ms_;
};

// Policy engine first, then each supplementary reviewer in order; the
// first rejection wins.
class CompositeReviewer : public Reviewer {
public:
    CompositeReviewer(PolicyReviewer policy,
                      std::vector<std::shared_ptr<const Reviewer>> supplementary);

    std::string name() const override { return "composite"; }
    core::errors::Result<protocol::ReviewVerdict> assess(
        const protocol::CommandProposal& proposal, const ReviewContext& context) const override;

private:
    PolicyReviewer policy_;
    std::vector<std::shared_ptr<const Reviewer>> supplementary_;
};

}  // namespace cmdgate::review
