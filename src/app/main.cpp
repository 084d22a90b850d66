#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <vector>
#include "app/cli_parser.hpp"
#include "core/config/gate_config.hpp"
#include "core/config/session_id.hpp"
#include "core/errors/gate_errors.hpp"
#include "core/logging/logger.hpp"
#include "harness/builtin_battery.hpp"
#include "harness/regression_harness.hpp"
#include "policy/safety_policy_engine.hpp"
#include "protocol/json_codec.hpp"
#include "review/proposer.hpp"
#include "review/reviewer.hpp"
#include "review/text_generator.hpp"
#include "runtime/orchestrator.hpp"
#include "runtime/sandboxed_executor.hpp"
#include "session/session.hpp"

namespace {

using cmdgate::app::cli::CliCommand;
using cmdgate::app::cli::CliOptions;
using cmdgate::core::config::GateConfig;
using cmdgate::core::errors::GateError;

constexpr int kExitOk = 0;
constexpr int kExitFailed = 1;
constexpr int kExitInput = 2;
constexpr int kExitInternal = 3;
constexpr int kExitSandboxViolation = 4;

int report_error(const GateError& err, const int exit_code) {
    LOG_ERROR(cmdgate::core::errors::to_string(err.category) + " error [" + err.code +
              "]: " + err.message);
    if (!err.hint.empty()) {
        LOG_INFO("Hint: " + err.hint);
    }
    return exit_code;
}

cmdgate::core::errors::Result<std::shared_ptr<const cmdgate::review::Proposer>> make_proposer(
    const GateConfig& config) {
    if (config.proposals_file.has_value()) {
        auto loaded = cmdgate::review::ScriptedProposer::load(config.proposals_file.value());
        if (cmdgate::core::errors::is_error(loaded)) {
            return cmdgate::core::errors::get_error(loaded);
        }
        LOG_INFO("Using scripted proposals from " + config.proposals_file->string());
        return std::shared_ptr<const cmdgate::review::Proposer>(
            std::make_shared<cmdgate::review::ScriptedProposer>(
                cmdgate::core::errors::get_value(loaded)));
    }
    if (!config.proposer_command.empty()) {
        auto generator = std::make_shared<cmdgate::review::ProcessTextGenerator>(
            config.proposer_command, config.max_output_bytes);
        return std::shared_ptr<const cmdgate::review::Proposer>(
            std::make_shared<cmdgate::review::GenerativeProposer>(
                generator, config.target_platform, config.proposer_timeout_ms));
    }
    return std::shared_ptr<const cmdgate::review::Proposer>();
}

std::shared_ptr<const cmdgate::review::Reviewer> make_reviewer(const GateConfig& config) {
    cmdgate::review::PolicyReviewer policy(
        cmdgate::policy::SafetyPolicyEngine(cmdgate::policy::settings_from_config(config)));
    std::vector<std::shared_ptr<const cmdgate::review::Reviewer>> supplementary;
    if (!config.reviewer_command.empty()) {
        auto generator = std::make_shared<cmdgate::review::ProcessTextGenerator>(
            config.reviewer_command, config.max_output_bytes);
        supplementary.push_back(std::make_shared<cmdgate::review::GenerativeReviewer>(
            generator, config.proposer_timeout_ms));
    }
    return std::make_shared<cmdgate::review::CompositeReviewer>(std::move(policy),
                                                                std::move(supplementary));
}

cmdgate::core::errors::Result<std::filesystem::path> seed_sandbox(const std::filesystem::path& seed,
                                                                 const std::filesystem::path& root) {
    std::error_code ec;
    std::filesystem::copy(seed, root,
                          std::filesystem::copy_options::recursive |
                              std::filesystem::copy_options::copy_symlinks,
                          ec);
    if (ec) {
        return GateError{cmdgate::core::errors::ErrorCategory::Input,
                         "Unable to seed sandbox from " + seed.string() + ": " + ec.message(),
                         "seed_failed"};
    }
    LOG_INFO("Seeded sandbox from " + seed.string());
    return root;
}

void print_report(const cmdgate::protocol::TaskReport& report, const bool json) {
    if (json) {
        std::cout << cmdgate::protocol::report_to_json(report).dump(2) << std::endl;
        return;
    }
    std::cout << "task:     " << report.task_id << "\n"
              << "state:    " << cmdgate::protocol::to_string(report.state) << "\n";
    if (report.proposal.has_value()) {
        std::cout << "command:  " << report.proposal->command << "\n";
    }
    if (report.verdict.has_value()) {
        std::cout << "verdict:  " << (report.verdict->approved ? "APPROVED" : "REJECTED");
        if (!report.verdict->approved) {
            std::cout << " (" << cmdgate::protocol::to_string(report.verdict->category) << ", "
                      << report.verdict->classifier << ")";
        }
        std::cout << "\n";
        if (report.verdict->reasoning.has_value()) {
            std::cout << "reason:   " << report.verdict->reasoning.value() << "\n";
        }
    }
    if (report.execution.has_value()) {
        std::cout << "exit:     " << report.execution->exit_code << "\n";
        if (!report.execution->stdout_text.empty()) {
            std::cout << "stdout:\n" << report.execution->stdout_text;
            if (report.execution->stdout_text.back() != '\n') {
                std::cout << "\n";
            }
        }
    }
    if (report.verification.has_value()) {
        std::cout << "verified: " << (report.verification->passed ? "PASS" : "FAIL") << " ("
                  << report.verification->detail << ")\n";
    }
    if (report.failure.has_value()) {
        std::cout << "failure:  [" << report.failure->code << "] " << report.failure->message
                  << "\n";
    }
    if (report.attempts > 1) {
        std::cout << "attempts: " << report.attempts << "\n";
    }
    std::cout.flush();
}

int exit_code_for(const cmdgate::protocol::TaskReport& report,
                  const cmdgate::session::Session& session) {
    if (!session.defects().empty()) {
        return kExitSandboxViolation;
    }
    if (report.state == cmdgate::protocol::TaskState::Reviewed) {
        return kExitOk;  // review-only approval
    }
    return report.succeeded() ? kExitOk : kExitFailed;
}

int run_review(const CliOptions& options, const GateConfig& config) {
    cmdgate::protocol::CommandProposal proposal{"", options.proposal_command.value(), ""};

    // Judge against an existing directory without creating a session.
    if (options.sandbox_dir.has_value()) {
        proposal.id = "prop-1";
        const cmdgate::policy::SafetyPolicyEngine engine(
            cmdgate::policy::settings_from_config(config));
        const auto verdict = engine.review(proposal, options.sandbox_dir.value());
        if (options.json) {
            std::cout << cmdgate::protocol::verdict_to_json(verdict).dump(2) << std::endl;
        } else {
            std::cout << (verdict.approved ? "APPROVED" : "REJECTED");
            if (!verdict.approved) {
                std::cout << " (" << cmdgate::protocol::to_string(verdict.category) << ", "
                          << verdict.classifier << "): " << verdict.reasoning.value_or("");
            }
            std::cout << std::endl;
        }
        return verdict.approved ? kExitOk : kExitFailed;
    }

    cmdgate::session::SessionOptions session_options;
    session_options.sandbox_base = config.sandbox_base;
    session_options.artifact_dir = config.artifact_dir;
    auto created = cmdgate::session::Session::create(session_options);
    if (cmdgate::core::errors::is_error(created)) {
        return report_error(cmdgate::core::errors::get_error(created), kExitInput);
    }
    const auto& session = cmdgate::core::errors::get_value(created);
    cmdgate::core::logging::Logger::get().set_session_id(session->id());

    cmdgate::runtime::Orchestrator orchestrator(
        *session, nullptr, make_reviewer(config),
        cmdgate::runtime::SandboxedExecutor(cmdgate::policy::settings_from_config(config),
                                            config.max_output_bytes));
    cmdgate::protocol::TaskRequest request;
    request.task_description = options.task.value();
    auto reviewed = orchestrator.review_only(request, proposal);
    if (cmdgate::core::errors::is_error(reviewed)) {
        return report_error(cmdgate::core::errors::get_error(reviewed), kExitInternal);
    }
    const auto& report = cmdgate::core::errors::get_value(reviewed);
    print_report(report, options.json);
    return exit_code_for(report, *session);
}

int run_task(const CliOptions& options, const GateConfig& config) {
    std::shared_ptr<const cmdgate::review::Proposer> proposer;
    if (!options.proposal_command.has_value()) {
        auto made = make_proposer(config);
        if (cmdgate::core::errors::is_error(made)) {
            return report_error(cmdgate::core::errors::get_error(made), kExitInput);
        }
        proposer = cmdgate::core::errors::get_value(made);
        if (!proposer) {
            return report_error(
                GateError{cmdgate::core::errors::ErrorCategory::Input,
                          "No proposer available for run without --command.", "no_proposer",
                          "Pass --command, --proposals FILE, or set proposer_command."},
                kExitInput);
        }
    }

    cmdgate::session::SessionOptions session_options;
    session_options.sandbox_base = config.sandbox_base;
    session_options.artifact_dir = config.artifact_dir;
    auto created = cmdgate::session::Session::create(session_options);
    if (cmdgate::core::errors::is_error(created)) {
        return report_error(cmdgate::core::errors::get_error(created), kExitInput);
    }
    const auto& session = cmdgate::core::errors::get_value(created);
    cmdgate::core::logging::Logger::get().set_session_id(session->id());

    if (options.seed_dir.has_value()) {
        auto seeded = seed_sandbox(options.seed_dir.value(), session->sandbox_root());
        if (cmdgate::core::errors::is_error(seeded)) {
            return report_error(cmdgate::core::errors::get_error(seeded), kExitInput);
        }
    }

    cmdgate::runtime::Orchestrator orchestrator(
        *session, proposer, make_reviewer(config),
        cmdgate::runtime::SandboxedExecutor(cmdgate::policy::settings_from_config(config),
                                            config.max_output_bytes));
    cmdgate::protocol::TaskRequest request;
    request.task_description = options.task.value();
    request.expectations = options.expectations;
    request.timeout_ms = config.command_timeout_ms;

    auto ran = options.proposal_command.has_value()
                   ? orchestrator.run_proposal(
                         request, cmdgate::protocol::CommandProposal{
                                      "", options.proposal_command.value(), ""})
                   : orchestrator.run_with_revisions(request, config.max_revisions);
    if (cmdgate::core::errors::is_error(ran)) {
        return report_error(cmdgate::core::errors::get_error(ran), kExitInternal);
    }
    const auto& report = cmdgate::core::errors::get_value(ran);
    print_report(report, options.json);
    return exit_code_for(report, *session);
}

int run_regress(const CliOptions& options, const GateConfig& config) {
    std::shared_ptr<const cmdgate::review::Proposer> proposer;
    if (options.use_proposer) {
        auto made = make_proposer(config);
        if (cmdgate::core::errors::is_error(made)) {
            return report_error(cmdgate::core::errors::get_error(made), kExitInput);
        }
        proposer = cmdgate::core::errors::get_value(made);
        if (!proposer) {
            return report_error(GateError{cmdgate::core::errors::ErrorCategory::Input,
                                          "--use-proposer needs a configured proposer.",
                                          "no_proposer"},
                                kExitInput);
        }
    }

    cmdgate::harness::HarnessOptions harness_options;
    harness_options.sandbox_base = config.sandbox_base;
    harness_options.artifact_dir = config.artifact_dir;
    harness_options.jobs = config.jobs;
    harness_options.timeout_ms = config.command_timeout_ms;
    harness_options.use_proposer = options.use_proposer;

    const cmdgate::harness::RegressionHarness harness(
        harness_options, proposer, make_reviewer(config),
        cmdgate::runtime::SandboxedExecutor(cmdgate::policy::settings_from_config(config),
                                            config.max_output_bytes));
    LOG_INFO("Running regression battery for target platform " +
             cmdgate::core::config::to_string(config.target_platform));
    const auto report = harness.run(cmdgate::harness::builtin_battery(config.target_platform));
    std::cout << cmdgate::harness::format_report_table(report) << std::flush;

    if (options.report_file.has_value()) {
        auto written = cmdgate::harness::write_json_report(report, options.report_file.value());
        if (cmdgate::core::errors::is_error(written)) {
            return report_error(cmdgate::core::errors::get_error(written), kExitInternal);
        }
        LOG_INFO("Report written to " + options.report_file->string());
    }

    for (const auto& result : report.cases) {
        if (result.report.has_value() && result.report->failure.has_value() &&
            result.report->failure->category ==
                cmdgate::core::errors::ErrorCategory::SandboxViolation) {
            return kExitSandboxViolation;
        }
    }
    return report.all_passed() ? kExitOk : kExitFailed;
}

}  // namespace

int main(int argc, char* argv[]) {
    cmdgate::core::logging::Logger::get().set_session_id(
        cmdgate::core::config::generate_session_id());

    auto parsed = cmdgate::app::cli::parse_and_validate(argc, argv);
    if (cmdgate::core::errors::is_error(parsed)) {
        return report_error(cmdgate::core::errors::get_error(parsed), kExitInput);
    }
    const auto& options = cmdgate::core::errors::get_value(parsed);

    GateConfig config = cmdgate::core::config::default_config();
    if (options.config_file.has_value()) {
        auto loaded = cmdgate::core::config::load_config(options.config_file.value());
        if (cmdgate::core::errors::is_error(loaded)) {
            return report_error(cmdgate::core::errors::get_error(loaded), kExitInput);
        }
        config = cmdgate::core::errors::get_value(loaded);
    }
    cmdgate::app::cli::apply_overrides(options, config);
    cmdgate::core::logging::Logger::get().set_min_level(
        cmdgate::core::logging::Logger::parse_level(config.log_level));

    switch (options.command) {
        case CliCommand::Review:
            return run_review(options, config);
        case CliCommand::Run:
            return run_task(options, config);
        case CliCommand::Regress:
            return run_regress(options, config);
    }
    return kExitInternal;
}
