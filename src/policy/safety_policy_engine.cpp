#include "policy/safety_policy_engine.hpp"

#include <utility>
#include "core/logging/logger.hpp"
#include "policy/classifiers/destructive_root_classifier.hpp"
#include "policy/classifiers/path_containment_classifier.hpp"
#include "policy/classifiers/platform_compat_classifier.hpp"
#include "policy/classifiers/syntax_classifier.hpp"
#include "policy/classifiers/system_file_classifier.hpp"
#include "policy/sandbox_paths.hpp"

namespace cmdgate::policy {

using protocol::CommandProposal;
using protocol::RejectionCategory;
using protocol::ReviewVerdict;

PolicySettings settings_from_config(const core::config::GateConfig& config) {
    PolicySettings settings;
    settings.platform = config.target_platform;
    if (!config.home_directory.empty()) {
        settings.home_directory = config.home_directory;
    }
    settings.allowed_external_paths = config.allowed_external_paths;
    settings.protected_locations = config.protected_locations;
    settings.trusted_program_dirs = config.trusted_program_dirs;
    return settings;
}

bool PolicyContext::is_allowed_external(const std::string& path_text) const {
    const auto normal = std::filesystem::path(path_text).lexically_normal();
    for (const auto& allowed : settings.allowed_external_paths) {
        if (path_text == allowed ||
            normal == std::filesystem::path(allowed).lexically_normal()) {
            return true;
        }
    }
    return false;
}

std::vector<std::shared_ptr<const Classifier>> default_classifiers() {
    return {std::make_shared<DestructiveRootClassifier>(),
            std::make_shared<PathContainmentClassifier>(),
            std::make_shared<PlatformCompatClassifier>(),
            std::make_shared<SyntaxClassifier>(),
            std::make_shared<SystemFileClassifier>()};
}

SafetyPolicyEngine::SafetyPolicyEngine(PolicySettings settings)
    : SafetyPolicyEngine(std::move(settings), default_classifiers()) {}

SafetyPolicyEngine::SafetyPolicyEngine(
    PolicySettings settings, std::vector<std::shared_ptr<const Classifier>> classifiers)
    : settings_(std::move(settings)), classifiers_(std::move(classifiers)) {}

ReviewVerdict SafetyPolicyEngine::review(const CommandProposal& proposal,
                                         const std::filesystem::path& sandbox_root) const {
    ReviewVerdict verdict;
    verdict.proposal_id = proposal.id;

    auto root_result = canonical_sandbox_root(sandbox_root);
    if (core::errors::is_error(root_result)) {
        verdict.category = RejectionCategory::Containment;
        verdict.classifier = "sandbox_root";
        verdict.reasoning = core::errors::get_error(root_result).message;
        LOG_WARN("Proposal " + proposal.id + " rejected: " + verdict.reasoning.value());
        return verdict;
    }

    if (proposal.command.find_first_not_of(" \t\r\n") == std::string::npos) {
        verdict.category = RejectionCategory::Syntax;
        verdict.classifier = "syntax";
        verdict.reasoning = "Command is empty.";
        LOG_INFO("Proposal " + proposal.id + " rejected: empty command");
        return verdict;
    }

    PolicyContext context{core::errors::get_value(root_result), settings_};
    const CommandAnalysis analysis = analyze_command(proposal.command);

    for (const auto& classifier : classifiers_) {
        auto rejection = classifier->evaluate(analysis, context);
        if (!rejection.has_value()) {
            continue;
        }
        verdict.category = rejection->category;
        verdict.classifier = classifier->name();
        verdict.reasoning = rejection->reason;
        LOG_INFO("Proposal " + proposal.id + " rejected by " + verdict.classifier + " (" +
                 protocol::to_string(verdict.category) + "): " + rejection->reason);
        return verdict;
    }

    verdict.approved = true;
    LOG_DEBUG("Proposal " + proposal.id + " approved: " + proposal.command);
    return verdict;
}

}  // namespace cmdgate::policy
