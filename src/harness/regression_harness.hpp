#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/errors/gate_errors.hpp"
#include "harness/scenario_case.hpp"
#include "review/proposer.hpp"
#include "review/reviewer.hpp"
#include "runtime/sandboxed_executor.hpp"

namespace cmdgate::harness {

struct HarnessOptions {
    std::filesystem::path sandbox_base;
    std::optional<std::filesystem::path> artifact_dir;
    std::uint32_t jobs = 1;
    std::uint32_t timeout_ms = 5000;
    // Positive cases ignore their fixed command and ask the proposer.
    bool use_proposer = false;
};

// Runs every case in its own session (and so its own sandbox root). A
// throwing setup or verify fails that case only.
class RegressionHarness {
public:
    RegressionHarness(HarnessOptions options, std::shared_ptr<const review::Proposer> proposer,
                      std::shared_ptr<const review::Reviewer> reviewer,
                      runtime::SandboxedExecutor executor);

    // Results keep the order of `cases` whatever the number of workers.
    HarnessReport run(const std::vector<ScenarioCase>& cases) const;
    CaseResult run_case(const ScenarioCase& scenario) const;

private:
    CaseResult run_case_unchecked(const ScenarioCase& scenario) const;

    HarnessOptions options_;
    std::shared_ptr<const review::Proposer> proposer_;
    std::shared_ptr<const review::Reviewer> reviewer_;
    runtime::SandboxedExecutor executor_;
};

std::string format_report_table(const HarnessReport& report);
nlohmann::json harness_report_to_json(const HarnessReport& report);
core::errors::Result<std::filesystem::path> write_json_report(const HarnessReport& report,
                                                              const std::filesystem::path& path);

}  // namespace cmdgate::harness
