#include "harness/regression_harness.hpp"

#include <algorithm>
#include <atomic>
#include <exception>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <thread>
#include <utility>
#include "core/logging/logger.hpp"
#include "protocol/json_codec.hpp"
#include "runtime/orchestrator.hpp"
#include "session/session.hpp"

namespace cmdgate::harness {

using core::errors::ErrorCategory;
using core::errors::GateError;
using nlohmann::json;
using protocol::TaskReport;
using protocol::TaskState;

namespace {

std::string substitute_root(std::string command, const std::filesystem::path& root) {
    const std::string placeholder = kRootPlaceholder;
    const std::string replacement = root.string();
    std::size_t pos = 0;
    while ((pos = command.find(placeholder, pos)) != std::string::npos) {
        command.replace(pos, placeholder.size(), replacement);
        pos += replacement.size();
    }
    return command;
}

std::string why_not_verified(const TaskReport& report) {
    if (report.state == TaskState::Rejected && report.verdict.has_value()) {
        return "rejected by " + report.verdict->classifier + ": " +
               report.verdict->reasoning.value_or("");
    }
    if (report.failure.has_value()) {
        return protocol::to_string(report.state) + ": " + report.failure->message;
    }
    return "ended in state " + protocol::to_string(report.state);
}

}  // namespace

RegressionHarness::RegressionHarness(HarnessOptions options,
                                     std::shared_ptr<const review::Proposer> proposer,
                                     std::shared_ptr<const review::Reviewer> reviewer,
                                     runtime::SandboxedExecutor executor)
    : options_(std::move(options)),
      proposer_(std::move(proposer)),
      reviewer_(std::move(reviewer)),
      executor_(std::move(executor)) {}

HarnessReport RegressionHarness::run(const std::vector<ScenarioCase>& cases) const {
    HarnessReport report;
    report.cases.resize(cases.size());

    const std::size_t workers =
        std::max<std::size_t>(1, std::min<std::size_t>(options_.jobs, cases.size()));
    std::atomic<std::size_t> next{0};
    auto worker = [&]() {
        while (true) {
            const std::size_t index = next.fetch_add(1);
            if (index >= cases.size()) {
                return;
            }
            report.cases[index] = run_case(cases[index]);
        }
    };

    if (workers == 1) {
        worker();
    } else {
        std::vector<std::thread> pool;
        pool.reserve(workers);
        for (std::size_t i = 0; i < workers; ++i) {
            pool.emplace_back(worker);
        }
        for (auto& thread : pool) {
            thread.join();
        }
    }

    LOG_INFO("Regression battery: " + std::to_string(report.passed_count()) + "/" +
             std::to_string(report.cases.size()) + " cases passed");
    return report;
}

CaseResult RegressionHarness::run_case(const ScenarioCase& scenario) const {
    const auto started = std::chrono::steady_clock::now();
    CaseResult result;
    try {
        result = run_case_unchecked(scenario);
    } catch (const std::exception& e) {
        result.name = scenario.name;
        result.category = scenario.category;
        result.passed = false;
        result.detail = std::string("exception: ") + e.what();
        LOG_ERROR("Case " + scenario.name + " threw: " + e.what());
    }
    result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    return result;
}

CaseResult RegressionHarness::run_case_unchecked(const ScenarioCase& scenario) const {
    CaseResult result;
    result.name = scenario.name;
    result.category = scenario.category;
    LOG_INFO("--- Case " + scenario.name + " (" + to_string(scenario.category) + ") ---");

    session::SessionOptions session_options;
    session_options.sandbox_base = options_.sandbox_base;
    session_options.artifact_dir = options_.artifact_dir;
    auto created = session::Session::create(session_options);
    if (core::errors::is_error(created)) {
        result.detail = "session: " + core::errors::get_error(created).message;
        return result;
    }
    // Purged when this scope ends, whatever happens below.
    const std::unique_ptr<session::Session> session =
        std::move(std::get<std::unique_ptr<session::Session>>(created));
    const auto& root = session->sandbox_root();

    if (scenario.setup) {
        try {
            scenario.setup(root);
        } catch (const std::exception& e) {
            result.detail = std::string("setup failed: ") + e.what();
            return result;
        }
    }

    runtime::Orchestrator orchestrator(*session, proposer_, reviewer_, executor_);
    protocol::TaskRequest request;
    request.task_description = scenario.task_description;
    request.context = scenario.context;
    request.expectations = scenario.expectations;
    request.timeout_ms = options_.timeout_ms;

    std::optional<protocol::CommandProposal> fixed;
    if (scenario.command.has_value()) {
        fixed = protocol::CommandProposal{"", substitute_root(scenario.command.value(), root),
                                          "regression fixture"};
    }

    if (scenario.category == ScenarioCategory::Negative) {
        if (!fixed.has_value()) {
            result.detail = "negative case has no command to review";
            return result;
        }
        auto reviewed = orchestrator.review_only(request, fixed.value());
        if (core::errors::is_error(reviewed)) {
            result.detail = core::errors::get_error(reviewed).message;
            return result;
        }
        const auto& report = core::errors::get_value(reviewed);
        result.report = report;
        if (!report.verdict.has_value()) {
            result.detail = why_not_verified(report);
            return result;
        }
        result.passed = !report.verdict->approved;
        result.detail = result.passed
                            ? "rejected (" + protocol::to_string(report.verdict->category) +
                                  "): " + report.verdict->reasoning.value_or("")
                            : "APPROVED: " + fixed->command;
        return result;
    }

    const bool ask_proposer = options_.use_proposer || !fixed.has_value();
    auto ran = ask_proposer ? orchestrator.run_task(request)
                            : orchestrator.run_proposal(request, fixed.value());
    if (core::errors::is_error(ran)) {
        result.detail = core::errors::get_error(ran).message;
        return result;
    }
    const auto& report = core::errors::get_value(ran);
    result.report = report;
    if (!report.succeeded()) {
        result.detail = report.state == TaskState::Verified && report.verification.has_value()
                            ? report.verification->detail
                            : why_not_verified(report);
        return result;
    }

    if (scenario.verify) {
        try {
            const auto outcome = scenario.verify(root, report);
            result.passed = outcome.passed;
            result.detail = report.verification->detail + "; " + outcome.detail;
        } catch (const std::exception& e) {
            result.detail = std::string("verify failed: ") + e.what();
        }
        return result;
    }
    result.passed = true;
    result.detail = report.verification->detail;
    return result;
}

std::string format_report_table(const HarnessReport& report) {
    std::size_t width = 4;
    for (const auto& result : report.cases) {
        width = std::max(width, result.name.size());
    }

    std::ostringstream out;
    out << std::left << std::setw(static_cast<int>(width)) << "CASE" << "  "
        << std::setw(8) << "KIND" << "  " << std::setw(6) << "RESULT" << "  DETAIL\n";
    for (const auto& result : report.cases) {
        out << std::setw(static_cast<int>(width)) << result.name << "  " << std::setw(8)
            << to_string(result.category) << "  " << std::setw(6)
            << (result.passed ? "PASS" : "FAIL") << "  " << result.detail << "\n";
    }
    out << "\n"
        << report.passed_count() << "/" << report.cases.size() << " passed: "
        << (report.all_passed() ? "SUITE PASS" : "SUITE FAIL") << "\n";
    return out.str();
}

json harness_report_to_json(const HarnessReport& report) {
    json cases = json::array();
    for (const auto& result : report.cases) {
        json entry;
        entry["name"] = result.name;
        entry["category"] = to_string(result.category);
        entry["passed"] = result.passed;
        entry["detail"] = result.detail;
        entry["duration_ms"] = result.duration.count();
        if (result.report.has_value()) {
            entry["report"] = protocol::report_to_json(result.report.value());
        }
        cases.push_back(entry);
    }

    json payload;
    payload["passed"] = report.all_passed();
    payload["passed_count"] = report.passed_count();
    payload["total"] = report.cases.size();
    payload["cases"] = cases;
    return payload;
}

core::errors::Result<std::filesystem::path> write_json_report(const HarnessReport& report,
                                                              const std::filesystem::path& path) {
    std::ofstream out(path);
    if (!out.is_open()) {
        return GateError{ErrorCategory::Internal, "Unable to open report file: " + path.string(),
                         "report_open_failed"};
    }
    out << harness_report_to_json(report).dump(2) << "\n";
    if (!out.good()) {
        return GateError{ErrorCategory::Internal, "Unable to write report file: " + path.string(),
                         "report_write_failed"};
    }
    return path;
}

}  // namespace cmdgate::harness
