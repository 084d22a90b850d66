#include "review/reviewer.hpp"

#include <sstream>
#include <utility>
#include <nlohmann/json.hpp>
#include "core/logging/logger.hpp"

namespace cmdgate::review {

using nlohmann::json;
using protocol::CommandProposal;
using protocol::RejectionCategory;
using protocol::ReviewVerdict;

namespace {

ReviewVerdict reviewer_rejection(const std::string& proposal_id, const std::string& classifier,
                                 const std::string& reasoning) {
    ReviewVerdict verdict;
    verdict.proposal_id = proposal_id;
    verdict.approved = false;
    verdict.category = RejectionCategory::Reviewer;
    verdict.classifier = classifier;
    verdict.reasoning = reasoning;
    return verdict;
}

}  // namespace

PolicyReviewer::PolicyReviewer(policy::SafetyPolicyEngine engine) : engine_(std::move(engine)) {}

core::errors::Result<ReviewVerdict> PolicyReviewer::assess(const CommandProposal& proposal,
                                                           const ReviewContext& context) const {
    return engine_.review(proposal, context.sandbox_root);
}

GenerativeReviewer::GenerativeReviewer(std::shared_ptr<const TextGenerator> generator,
                                       const std::uint32_t timeout_ms)
    : generator_(std::move(generator)), timeout_ms_(timeout_ms) {}

std::string GenerativeReviewer::build_prompt(const CommandProposal& proposal,
                                             const ReviewContext& context) const {
    json plan;
    plan["command"] = proposal.command;
    plan["description"] = proposal.rationale;

    std::ostringstream prompt;
    prompt << "You are an extremely strict senior reviewer acting as a security and "
              "correctness gatekeeper for shell commands.\n"
           << "Answer with ONLY a JSON object: {\"approved\": true|false, \"reasoning\": "
              "\"...\"}. No text before or after it.\n\n"
           << "Review criteria:\n"
           << "1. Safety: the command must not delete, overwrite or modify anything outside "
              "the working directory "
           << context.sandbox_root.string()
           << ". Reject '..' traversal out of it, absolute paths outside it, and writes to "
              "system or shell configuration files.\n"
           << "2. Correctness: the command must be syntactically valid and plausibly "
              "accomplish the task.\n"
           << "3. Simplicity: prefer simple, common commands.\n\n"
           << "Task: " << context.task_description << "\n";
    if (!context.context.empty()) {
        prompt << "Context: " << context.context << "\n";
    }
    prompt << "Proposed plan:\n" << plan.dump(2) << "\n";
    return prompt.str();
}

ReviewVerdict GenerativeReviewer::parse_reply(const std::string& proposal_id,
                                              const std::string& raw_reply) {
    const std::string answer = final_answer(raw_reply);
    const json doc = json::parse(answer, nullptr, false);
    if (doc.is_discarded() || !doc.is_object() || !doc.contains("approved") ||
        !doc["approved"].is_boolean()) {
        return reviewer_rejection(proposal_id, "generative",
                                  "Reviewer reply is not a valid verdict object.");
    }
    std::optional<std::string> reasoning;
    if (doc.contains("reasoning")) {
        if (doc["reasoning"].is_string()) {
            reasoning = doc["reasoning"].get<std::string>();
        } else if (!doc["reasoning"].is_null()) {
            return reviewer_rejection(proposal_id, "generative",
                                      "Reviewer reasoning is not a string.");
        }
    }

    if (!doc["approved"].get<bool>()) {
        return reviewer_rejection(proposal_id, "generative",
                                  reasoning.value_or("Rejected by reviewer."));
    }
    ReviewVerdict verdict;
    verdict.proposal_id = proposal_id;
    verdict.approved = true;
    verdict.reasoning = reasoning;
    return verdict;
}

core::errors::Result<ReviewVerdict> GenerativeReviewer::assess(
    const CommandProposal& proposal, const ReviewContext& context) const {
    if (!generator_) {
        return reviewer_rejection(proposal.id, "generative", "No reviewer backend configured.");
    }
    auto reply = generator_->generate(build_prompt(proposal, context), timeout_ms_);
    if (core::errors::is_error(reply)) {
        const auto& error = core::errors::get_error(reply);
        LOG_WARN("Generative review failed for " + proposal.id + ": " + error.message);
        return reviewer_rejection(proposal.id, "generative",
                                  "Review process failed: " + error.message);
    }
    auto verdict = parse_reply(proposal.id, core::errors::get_value(reply));
    if (!verdict.approved) {
        LOG_INFO("Generative reviewer rejected " + proposal.id + ": " +
                 verdict.reasoning.value_or(""));
    }
    return verdict;
}

CompositeReviewer::CompositeReviewer(PolicyReviewer policy,
                                     std::vector<std::shared_ptr<const Reviewer>> supplementary)
    : policy_(std::move(policy)), supplementary_(std::move(supplementary)) {}

core::errors::Result<ReviewVerdict> CompositeReviewer::assess(
    const CommandProposal& proposal, const ReviewContext& context) const {
    auto verdict = policy_.assess(proposal, context);
    if (core::errors::is_error(verdict) || !core::errors::get_value(verdict).approved) {
        return verdict;
    }
    for (const auto& reviewer : supplementary_) {
        auto next = reviewer->assess(proposal, context);
        if (core::errors::is_error(next)) {
            return reviewer_rejection(proposal.id, reviewer->name(),
                                      core::errors::get_error(next).message);
        }
        if (!core::errors::get_value(next).approved) {
            auto rejected = core::errors::get_value(next);
            rejected.category = RejectionCategory::Reviewer;
            if (rejected.classifier.empty()) {
                rejected.classifier = reviewer->name();
            }
            return rejected;
        }
    }
    return verdict;
}

}  // namespace cmdgate::review
