#pragma once

#include <filesystem>
#include <memory>
#include <vector>
#include "policy/classifier.hpp"
#include "protocol/command_contract.hpp"

namespace cmdgate::policy {

// destructive_root, path_containment, platform_compat, syntax, system_file
std::vector<std::shared_ptr<const Classifier>> default_classifiers();

// Runs the classifiers in order; the first rejection decides the verdict.
// Stateless: reviewing the same proposal twice yields equal verdicts.
class SafetyPolicyEngine {
public:
    explicit SafetyPolicyEngine(PolicySettings settings);
    SafetyPolicyEngine(PolicySettings settings,
                       std::vector<std::shared_ptr<const Classifier>> classifiers);

    // Never executes anything. An invalid sandbox root fails closed
    // (rejected, category=containment).
    protocol::ReviewVerdict review(const protocol::CommandProposal& proposal,
                                   const std::filesystem::path& sandbox_root) const;

    const PolicySettings& settings() const { return settings_; }
    const std::vector<std::shared_ptr<const Classifier>>& classifiers() const {
        return classifiers_;
    }

private:
    PolicySettings settings_;
    std::vector<std::shared_ptr<const Classifier>> classifiers_;
};

}  // namespace cmdgate::policy
