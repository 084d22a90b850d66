#include <filesystem>
#include <fstream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "core/config/gate_config.hpp"
#include "core/config/session_id.hpp"
#include "core/errors/gate_errors.hpp"
#include "harness/builtin_battery.hpp"
#include "harness/regression_harness.hpp"
#include "policy/classifier.hpp"
#include "review/reviewer.hpp"

namespace {

using cmdgate::core::config::TargetPlatform;
using cmdgate::core::errors::get_value;
using cmdgate::core::errors::is_error;
using cmdgate::harness::builtin_battery;
using cmdgate::harness::HarnessOptions;
using cmdgate::harness::RegressionHarness;
using cmdgate::harness::ScenarioCase;
using cmdgate::harness::ScenarioCategory;
using cmdgate::protocol::FileExists;
using cmdgate::protocol::VerificationOutcome;

class TempWorkspace {
public:
    TempWorkspace() {
        root_ = std::filesystem::current_path() /
                (".tmp_harness_" + cmdgate::core::config::generate_session_id());
        std::filesystem::create_directories(root_);
    }

    ~TempWorkspace() {
        std::error_code ec;
        std::filesystem::remove_all(root_, ec);
    }

    const std::filesystem::path& root() const { return root_; }

private:
    std::filesystem::path root_;
};

RegressionHarness make_harness(const std::filesystem::path& sandbox_base, std::uint32_t jobs) {
    auto config = cmdgate::core::config::default_config();
    config.home_directory = "/home/cmdgate-test";
    const auto settings = cmdgate::policy::settings_from_config(config);

    HarnessOptions options;
    options.sandbox_base = sandbox_base;
    options.jobs = jobs;
    auto reviewer = std::make_shared<cmdgate::review::CompositeReviewer>(
        cmdgate::review::PolicyReviewer(cmdgate::policy::SafetyPolicyEngine(settings)),
        std::vector<std::shared_ptr<const cmdgate::review::Reviewer>>{});
    return RegressionHarness(options, nullptr, reviewer,
                             cmdgate::runtime::SandboxedExecutor(settings, 64 * 1024));
}

ScenarioCase touch_case(const std::string& name) {
    ScenarioCase scenario;
    scenario.name = name;
    scenario.task_description = "Create " + name + ".txt";
    scenario.command = "touch " + name + ".txt";
    scenario.expectations = {FileExists{name + ".txt", 0}};
    return scenario;
}

TEST(RegressionHarnessTest, BuiltinBatteryPassesOnHost) {
    TempWorkspace workspace;
    const auto harness = make_harness(workspace.root(), 1);
    const auto cases = builtin_battery(cmdgate::core::config::host_platform());
    ASSERT_EQ(cases.size(), 15u);

    const auto report = harness.run(cases);
    for (const auto& result : report.cases) {
        EXPECT_TRUE(result.passed) << result.name << ": " << result.detail;
    }
    EXPECT_TRUE(report.all_passed());
    EXPECT_EQ(report.passed_count(), 15u);

    // Every case had its own sandbox and none is left behind.
    EXPECT_TRUE(std::filesystem::is_empty(workspace.root()));
}

TEST(RegressionHarnessTest, BatteryHasSixPositiveAndNineNegativeCases) {
    for (const auto platform : {TargetPlatform::Gnu, TargetPlatform::Bsd}) {
        std::size_t positive = 0;
        std::size_t negative = 0;
        for (const auto& scenario : builtin_battery(platform)) {
            (scenario.category == ScenarioCategory::Positive ? positive : negative)++;
            EXPECT_TRUE(scenario.command.has_value()) << scenario.name;
        }
        EXPECT_EQ(positive, 6u);
        EXPECT_EQ(negative, 9u);
    }
}

TEST(RegressionHarnessTest, ThrowingSetupFailsOnlyThatCase) {
    TempWorkspace workspace;
    const auto harness = make_harness(workspace.root(), 1);

    auto broken = touch_case("broken");
    broken.setup = [](const std::filesystem::path&) {
        throw std::runtime_error("fixture unavailable");
    };
    auto checked = touch_case("checked");
    checked.verify = [](const std::filesystem::path&, const cmdgate::protocol::TaskReport&) {
        throw std::runtime_error("checker crashed");
        return VerificationOutcome{};
    };

    const auto report = harness.run({touch_case("first"), broken, checked, touch_case("last")});
    ASSERT_EQ(report.cases.size(), 4u);
    EXPECT_TRUE(report.cases[0].passed);
    EXPECT_FALSE(report.cases[1].passed);
    EXPECT_NE(report.cases[1].detail.find("fixture unavailable"), std::string::npos);
    EXPECT_FALSE(report.cases[2].passed);
    EXPECT_NE(report.cases[2].detail.find("checker crashed"), std::string::npos);
    EXPECT_TRUE(report.cases[3].passed);
    EXPECT_FALSE(report.all_passed());
}

TEST(RegressionHarnessTest, ApprovedNegativeCaseFails) {
    TempWorkspace workspace;
    const auto harness = make_harness(workspace.root(), 1);

    ScenarioCase harmless;
    harmless.name = "harmless_negative";
    harmless.task_description = "List files";
    harmless.category = ScenarioCategory::Negative;
    harmless.command = "ls";

    const auto result = harness.run_case(harmless);
    EXPECT_FALSE(result.passed);
    EXPECT_NE(result.detail.find("APPROVED"), std::string::npos);
}

TEST(RegressionHarnessTest, ParallelRunKeepsCaseOrder) {
    TempWorkspace workspace;
    const auto harness = make_harness(workspace.root(), 4);
    std::vector<ScenarioCase> cases;
    for (int i = 0; i < 8; ++i) {
        cases.push_back(touch_case("case_" + std::to_string(i)));
    }

    const auto report = harness.run(cases);
    ASSERT_EQ(report.cases.size(), cases.size());
    for (std::size_t i = 0; i < cases.size(); ++i) {
        EXPECT_EQ(report.cases[i].name, cases[i].name);
        EXPECT_TRUE(report.cases[i].passed) << report.cases[i].detail;
    }
}

TEST(RegressionHarnessTest, RendersTableAndJson) {
    TempWorkspace workspace;
    const auto harness = make_harness(workspace.root() / "sandboxes", 1);
    const auto report = harness.run({touch_case("only")});

    const auto table = cmdgate::harness::format_report_table(report);
    EXPECT_NE(table.find("only"), std::string::npos);
    EXPECT_NE(table.find("POSITIVE"), std::string::npos);
    EXPECT_NE(table.find("1/1 passed: SUITE PASS"), std::string::npos);

    const auto path = workspace.root() / "report.json";
    auto written = cmdgate::harness::write_json_report(report, path);
    ASSERT_FALSE(is_error(written));
    EXPECT_EQ(get_value(written).string(), path.string());

    std::ifstream in(path);
    const auto doc = nlohmann::json::parse(in);
    EXPECT_TRUE(doc.at("passed").get<bool>());
    EXPECT_EQ(doc.at("total").get<std::size_t>(), 1u);
    EXPECT_EQ(doc.at("cases").at(0).at("report").at("state").get<std::string>(), "verified");
}

}  // namespace
