#include "cli_parser.hpp"
#include <charconv>
#include <optional>
#include <system_error>
#include <utility>
#include <vector>

namespace cmdgate::app::cli {

    using namespace cmdgate::core::errors;

    namespace {

    // 1. Raw Options Struct (Internal only)
    struct RawCliOptions {
        std::optional<std::string> task;
        std::optional<std::string> command;
        std::optional<std::string> config;
        std::optional<std::string> sandbox;
        std::optional<std::string> seed;
        std::optional<std::string> report;
        std::optional<std::string> proposals;
        std::optional<std::string> platform;
        std::optional<std::string> timeout_ms;
        std::optional<std::string> jobs;
        std::optional<std::string> revisions;
        std::optional<std::string> log_level;
        std::vector<protocol::Expectation> expectations;
        bool use_proposer = false;
        bool json = false;
    };

    Result<std::uint32_t> parse_bounded(const std::string& flag, const std::string& text,
                                        const std::uint32_t min, const std::uint32_t max) {
        std::uint32_t value = 0;
        const char* begin = text.data();
        const char* end = text.data() + text.size();
        auto [ptr, ec] = std::from_chars(begin, end, value);
        if (ec != std::errc() || ptr != end) {
            return GateError{ErrorCategory::Input, "Invalid number for " + flag, "invalid_integer",
                             "Provide a non-negative integer."};
        }
        if (value < min || value > max) {
            return GateError{ErrorCategory::Input, flag + " out of bounds", "bounds_error",
                             "Must be between " + std::to_string(min) + " and " +
                                 std::to_string(max) + "."};
        }
        return value;
    }

    Result<std::filesystem::path> existing_directory(const std::string& flag,
                                                     const std::string& text) {
        std::filesystem::path p(text);
        std::error_code path_ec;
        const bool is_dir = std::filesystem::is_directory(p, path_ec);
        if (path_ec || !is_dir) {
            return GateError{ErrorCategory::Input, flag + " is not an existing directory: " + text,
                             "invalid_path"};
        }
        std::filesystem::path canonical_path = std::filesystem::canonical(p, path_ec);
        if (path_ec) {
            return GateError{ErrorCategory::Input, "Failed to canonicalize " + flag, "invalid_path"};
        }
        return canonical_path;
    }

    }  // namespace

    std::string usage() {
        return "Usage:\n"
               "  cmdgate review --command CMD [--task TEXT] [--sandbox DIR] [--json]\n"
               "  cmdgate run --task TEXT [--command CMD] [--seed DIR] [--revisions N]\n"
               "              [--expect-exists PATH] [--expect-absent PATH] [--expect-dir PATH]\n"
               "              [--expect-content PATH=TEXT] [--expect-output TEXT] [--json]\n"
               "  cmdgate regress [--jobs N] [--report FILE] [--use-proposer]\n"
               "Common: --config FILE --platform gnu|bsd --timeout-ms N --log-level LEVEL\n"
               "        --proposals FILE";
    }

    Result<CliOptions> parse_and_validate(int argc, char* argv[]) {
        if (argc < 2) {
            return GateError{ErrorCategory::Input, "No command provided.", "missing_command", usage()};
        }

        CliOptions options;
        const std::string command = argv[1];
        if (command == "review") {
            options.command = CliCommand::Review;
        } else if (command == "run") {
            options.command = CliCommand::Run;
        } else if (command == "regress") {
            options.command = CliCommand::Regress;
        } else {
            return GateError{ErrorCategory::Input, "Unknown command: " + command, "unknown_command",
                             usage()};
        }

        RawCliOptions raw;
        std::vector<std::string> args;
        for (int i = 2; i < argc; ++i) { // skip program name and subcommand
            args.push_back(argv[i]);
        }

        // 2. Parser Phase: Just read the raw strings
        const std::vector<std::pair<std::string, std::optional<std::string>*>> valued = {
            {"--task", &raw.task},           {"--command", &raw.command},
            {"--config", &raw.config},       {"--sandbox", &raw.sandbox},
            {"--seed", &raw.seed},           {"--report", &raw.report},
            {"--proposals", &raw.proposals}, {"--platform", &raw.platform},
            {"--timeout-ms", &raw.timeout_ms}, {"--jobs", &raw.jobs},
            {"--revisions", &raw.revisions}, {"--log-level", &raw.log_level}};

        for (size_t i = 0; i < args.size(); ++i) {
            const std::string& arg = args[i];
            if (arg == "--json") {
                raw.json = true;
                continue;
            }
            if (arg == "--use-proposer") {
                raw.use_proposer = true;
                continue;
            }

            bool matched = false;
            for (const auto& [flag, slot] : valued) {
                if (arg != flag) {
                    continue;
                }
                if (i + 1 >= args.size()) {
                    return GateError{ErrorCategory::Input, "Missing value for " + flag, "missing_value"};
                }
                *slot = args[++i];
                matched = true;
                break;
            }
            if (matched) {
                continue;
            }

            if (arg == "--expect-exists" || arg == "--expect-absent" || arg == "--expect-dir" ||
                arg == "--expect-output" || arg == "--expect-content") {
                if (i + 1 >= args.size()) {
                    return GateError{ErrorCategory::Input, "Missing value for " + arg, "missing_value"};
                }
                const std::string value = args[++i];
                if (arg == "--expect-exists") {
                    raw.expectations.push_back(protocol::FileExists{value, std::nullopt});
                } else if (arg == "--expect-absent") {
                    raw.expectations.push_back(protocol::FileAbsent{value});
                } else if (arg == "--expect-dir") {
                    raw.expectations.push_back(protocol::DirectoryExists{value});
                } else if (arg == "--expect-output") {
                    raw.expectations.push_back(protocol::OutputContains{{value}});
                } else {
                    const auto eq = value.find('=');
                    if (eq == std::string::npos || eq == 0) {
                        return GateError{ErrorCategory::Input, "--expect-content needs PATH=TEXT",
                                         "invalid_expectation"};
                    }
                    raw.expectations.push_back(
                        protocol::FileContentEquals{value.substr(0, eq), value.substr(eq + 1)});
                }
                continue;
            }
            return GateError{ErrorCategory::Input, "Unknown argument: " + arg, "unknown_argument"};
        }

        // 3. Validator Phase: Enforce logic and bounds
        options.json = raw.json;
        options.use_proposer = raw.use_proposer;
        options.task = raw.task;
        options.proposal_command = raw.command;
        options.log_level = raw.log_level;
        options.expectations = raw.expectations;

        switch (options.command) {
            case CliCommand::Review:
                if (!raw.command.has_value()) {
                    return GateError{ErrorCategory::Input, "review requires --command",
                                     "missing_required_flag"};
                }
                if (!raw.task.has_value()) {
                    options.task = "Review command";
                }
                break;
            case CliCommand::Run:
                if (!raw.task.has_value()) {
                    return GateError{ErrorCategory::Input, "run requires --task",
                                     "missing_required_flag"};
                }
                break;
            case CliCommand::Regress:
                if (raw.task.has_value() || raw.command.has_value()) {
                    return GateError{ErrorCategory::Input,
                                     "regress runs the built-in battery; --task/--command not allowed",
                                     "conflicting_flags"};
                }
                break;
        }
        if (options.command != CliCommand::Run &&
            (!raw.expectations.empty() || raw.seed.has_value() || raw.revisions.has_value())) {
            return GateError{ErrorCategory::Input, "Expectations, --seed and --revisions apply to run only",
                             "conflicting_flags"};
        }
        if (options.command != CliCommand::Review && raw.sandbox.has_value()) {
            return GateError{ErrorCategory::Input, "--sandbox applies to review only", "conflicting_flags"};
        }
        if (options.command != CliCommand::Regress &&
            (raw.jobs.has_value() || raw.report.has_value() || raw.use_proposer)) {
            return GateError{ErrorCategory::Input,
                             "--jobs, --report and --use-proposer apply to regress only",
                             "conflicting_flags"};
        }
        if (raw.command.has_value() && raw.command->find_first_not_of(" \t\r\n") == std::string::npos) {
            return GateError{ErrorCategory::Input, "--command cannot be empty", "invalid_command"};
        }

        if (raw.platform) {
            auto platform = core::config::parse_platform(raw.platform.value());
            if (is_error(platform)) {
                return get_error(platform);
            }
            options.platform = get_value(platform);
        }

        // Exception-free integer parsing
        if (raw.timeout_ms) {
            auto value = parse_bounded("--timeout-ms", raw.timeout_ms.value(), 1, 3600000);
            if (is_error(value)) return get_error(value);
            options.timeout_ms = get_value(value);
        }
        if (raw.jobs) {
            auto value = parse_bounded("--jobs", raw.jobs.value(), 1, 64);
            if (is_error(value)) return get_error(value);
            options.jobs = get_value(value);
        }
        if (raw.revisions) {
            auto value = parse_bounded("--revisions", raw.revisions.value(), 0, 10);
            if (is_error(value)) return get_error(value);
            options.revisions = get_value(value);
        }

        // Path validation
        if (raw.sandbox) {
            auto dir = existing_directory("--sandbox", raw.sandbox.value());
            if (is_error(dir)) return get_error(dir);
            options.sandbox_dir = get_value(dir);
        }
        if (raw.seed) {
            auto dir = existing_directory("--seed", raw.seed.value());
            if (is_error(dir)) return get_error(dir);
            options.seed_dir = get_value(dir);
        }
        if (raw.config) options.config_file = std::filesystem::path(raw.config.value());
        if (raw.report) options.report_file = std::filesystem::path(raw.report.value());
        if (raw.proposals) options.proposals_file = std::filesystem::path(raw.proposals.value());

        return options;
    }

    void apply_overrides(const CliOptions& options, core::config::GateConfig& config) {
        if (options.platform) config.target_platform = options.platform.value();
        if (options.timeout_ms) config.command_timeout_ms = options.timeout_ms.value();
        if (options.jobs) config.jobs = options.jobs.value();
        if (options.revisions) config.max_revisions = options.revisions.value();
        if (options.log_level) config.log_level = options.log_level.value();
        if (options.proposals_file) config.proposals_file = options.proposals_file;
    }

} // namespace cmdgate::app::cli
