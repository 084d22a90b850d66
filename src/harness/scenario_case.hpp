#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>
#include "protocol/command_contract.hpp"
#include "protocol/expectation.hpp"
#include "protocol/task_report.hpp"

namespace cmdgate::harness {

enum class ScenarioCategory {
    Positive,  // must execute and verify
    Negative   // must be rejected before execution
};

// Text "{root}" inside a fixed command is replaced by the case's sandbox root.
inline constexpr const char* kRootPlaceholder = "{root}";

struct ScenarioCase {
    std::string name;
    std::string task_description;
    ScenarioCategory category = ScenarioCategory::Positive;
    std::string context;
    // Populates the fresh sandbox root. May throw.
    std::function<void(const std::filesystem::path& sandbox_root)> setup;
    // Fixed proposal; positive cases without one ask the proposer.
    std::optional<std::string> command;
    std::vector<protocol::Expectation> expectations;
    // Extra check after the built-in expectations passed. May throw.
    std::function<protocol::VerificationOutcome(const std::filesystem::path& sandbox_root,
                                                const protocol::TaskReport& report)>
        verify;
};

struct CaseResult {
    std::string name;
    ScenarioCategory category = ScenarioCategory::Positive;
    bool passed = false;
    std::string detail;
    std::optional<protocol::TaskReport> report;
    std::chrono::milliseconds duration{0};
};

struct HarnessReport {
    std::vector<CaseResult> cases;

    bool all_passed() const {
        for (const auto& result : cases) {
            if (!result.passed) {
                return false;
            }
        }
        return true;
    }

    std::size_t passed_count() const {
        std::size_t count = 0;
        for (const auto& result : cases) {
            count += result.passed ? 1 : 0;
        }
        return count;
    }
};

inline std::string to_string(const ScenarioCategory category) {
    return category == ScenarioCategory::Positive ? "POSITIVE" : "NEGATIVE";
}

}  // namespace cmdgate::harness
