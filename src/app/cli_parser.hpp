#pragma once
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include "core/config/gate_config.hpp"
#include "core/errors/gate_errors.hpp"
#include "protocol/expectation.hpp"

namespace cmdgate::app::cli {

    enum class CliCommand {
        Review,   // policy verdict for one command, never executes
        Run,      // full pipeline in a fresh sandbox
        Regress   // built-in regression battery
    };

    struct CliOptions {
        CliCommand command = CliCommand::Review;
        std::optional<std::string> task;
        std::optional<std::string> proposal_command;
        std::optional<std::filesystem::path> config_file;
        std::optional<std::filesystem::path> sandbox_dir;     // review: judge against this dir
        std::optional<std::filesystem::path> seed_dir;        // run: copied into the sandbox
        std::optional<std::filesystem::path> report_file;     // regress: JSON report
        std::optional<std::filesystem::path> proposals_file;
        std::optional<core::config::TargetPlatform> platform;
        std::optional<std::uint32_t> timeout_ms;
        std::optional<std::uint32_t> jobs;
        std::optional<std::uint32_t> revisions;
        std::optional<std::string> log_level;
        std::vector<protocol::Expectation> expectations;
        bool use_proposer = false;
        bool json = false;
    };

    core::errors::Result<CliOptions> parse_and_validate(int argc, char* argv[]);

    // CLI flags win over config file values.
    void apply_overrides(const CliOptions& options, core::config::GateConfig& config);

    std::string usage();

} // namespace cmdgate::app::cli
