#include "session/session.hpp"

#include <system_error>
#include <utility>
#include "core/config/session_id.hpp"
#include "core/logging/logger.hpp"
#include "policy/sandbox_paths.hpp"

namespace cmdgate::session {

using core::errors::ErrorCategory;
using core::errors::GateError;

core::errors::Result<std::unique_ptr<Session>> Session::create(const SessionOptions& options) {
    const std::string id =
        options.session_id.empty() ? core::config::generate_session_id() : options.session_id;

    std::error_code ec;
    const auto base = std::filesystem::absolute(options.sandbox_base, ec);
    if (ec) {
        return GateError{ErrorCategory::Input,
                         "Unable to resolve sandbox base: " + options.sandbox_base.string(),
                         "invalid_sandbox_base"};
    }
    const auto root = base / id;
    if (std::filesystem::exists(root, ec)) {
        return GateError{ErrorCategory::Input, "Sandbox root already exists: " + root.string(),
                         "sandbox_root_exists"};
    }
    std::filesystem::create_directories(root, ec);
    if (ec) {
        return GateError{ErrorCategory::Internal,
                         "Unable to create sandbox root: " + root.string(),
                         "sandbox_create_failed"};
    }

    auto canonical_result = policy::canonical_sandbox_root(root);
    if (core::errors::is_error(canonical_result)) {
        std::filesystem::remove_all(root, ec);
        return core::errors::get_error(canonical_result);
    }
    const auto canonical_root = core::errors::get_value(canonical_result);

    std::unique_ptr<ArtifactWriter> artifacts;
    if (options.artifact_dir.has_value()) {
        const auto artifact_dir = policy::resolve_path_word(
            std::filesystem::absolute(options.artifact_dir.value(), ec).string(), "/", "/");
        if (policy::is_within_root(canonical_root, artifact_dir)) {
            std::filesystem::remove_all(root, ec);
            return GateError{ErrorCategory::Input,
                             "Artifact directory must live outside the sandbox root: " +
                                 artifact_dir.string(),
                             "artifact_dir_inside_sandbox"};
        }
        artifacts = std::make_unique<ArtifactWriter>(artifact_dir, id);
    }

    LOG_INFO("Session " + id + " created with sandbox root " + canonical_root.string());
    return std::make_unique<Session>(CreateTag{}, id, canonical_root, std::move(artifacts));
}

Session::Session(CreateTag, std::string id, std::filesystem::path sandbox_root,
                 std::unique_ptr<ArtifactWriter> artifacts)
    : id_(std::move(id)), sandbox_root_(std::move(sandbox_root)), artifacts_(std::move(artifacts)) {}

Session::~Session() {
    auto purged = purge();
    if (core::errors::is_error(purged)) {
        LOG_WARN(core::errors::get_error(purged).message);
    }
}

std::string Session::next_proposal_id() {
    return "prop-" + std::to_string(++proposal_counter_);
}

void Session::record_verdict(const protocol::ReviewVerdict& verdict) {
    if (!verdict.approved || verdict.proposal_id.empty()) {
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    approved_.insert(verdict.proposal_id);
}

bool Session::is_approved(const std::string& proposal_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return approved_.count(proposal_id) != 0;
}

void Session::file_defect(DefectReport report) {
    LOG_ERROR("Policy engine defect: approved proposal " + report.proposal_id +
              " escaped the sandbox (" + report.code + "): " + report.message +
              " | command: " + report.command);
    std::lock_guard<std::mutex> lock(mutex_);
    defects_.push_back(std::move(report));
}

std::vector<DefectReport> Session::defects() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return defects_;
}

core::errors::Result<std::uintmax_t> Session::purge() {
    if (purged_) {
        return std::uintmax_t{0};
    }
    std::error_code ec;
    const auto removed = std::filesystem::remove_all(sandbox_root_, ec);
    if (ec) {
        return GateError{ErrorCategory::Internal,
                         "Unable to purge sandbox root " + sandbox_root_.string() + ": " +
                             ec.message(),
                         "sandbox_purge_failed"};
    }
    purged_ = true;
    LOG_DEBUG("Session " + id_ + " purged " + std::to_string(removed) + " entries");
    return removed;
}

}  // namespace cmdgate::session
