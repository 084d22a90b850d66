#include <filesystem>
#include <string>
#include <variant>
#include <vector>
#include <gtest/gtest.h>
#include "app/cli_parser.hpp"
#include "core/config/gate_config.hpp"
#include "core/errors/gate_errors.hpp"

namespace {

using cmdgate::app::cli::CliCommand;
using cmdgate::app::cli::CliOptions;
using cmdgate::app::cli::parse_and_validate;
using cmdgate::core::config::TargetPlatform;
using cmdgate::core::errors::ErrorCategory;
using cmdgate::core::errors::get_error;
using cmdgate::core::errors::get_value;
using cmdgate::core::errors::is_error;

cmdgate::core::errors::Result<CliOptions> parse_tokens(const std::vector<std::string>& tokens) {
    std::vector<std::string> owned_args;
    owned_args.reserve(tokens.size() + 1);
    owned_args.emplace_back("cmdgate");
    for (const auto& token : tokens) {
        owned_args.push_back(token);
    }

    std::vector<char*> argv;
    argv.reserve(owned_args.size());
    for (auto& arg : owned_args) {
        argv.push_back(arg.data());
    }

    return parse_and_validate(static_cast<int>(argv.size()), argv.data());
}

TEST(CliParserTest, FailsWhenCommandMissing) {
    auto result = parse_tokens({});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).category, ErrorCategory::Input);
    EXPECT_EQ(get_error(result).code, "missing_command");
    EXPECT_FALSE(get_error(result).hint.empty());
}

TEST(CliParserTest, FailsWhenCommandUnknown) {
    auto result = parse_tokens({"status"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "unknown_command");
}

TEST(CliParserTest, ReviewRequiresCommand) {
    auto result = parse_tokens({"review"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "missing_required_flag");

    auto blank = parse_tokens({"review", "--command", "   "});
    ASSERT_TRUE(is_error(blank));
    EXPECT_EQ(get_error(blank).code, "invalid_command");
}

TEST(CliParserTest, ParsesReview) {
    auto result = parse_tokens({"review", "--command", "rm -rf /", "--platform", "bsd", "--json"});
    ASSERT_FALSE(is_error(result));
    const auto& options = get_value(result);
    EXPECT_EQ(options.command, CliCommand::Review);
    EXPECT_EQ(options.proposal_command.value_or(""), "rm -rf /");
    EXPECT_EQ(options.task.value_or(""), "Review command");
    EXPECT_EQ(options.platform.value_or(TargetPlatform::Gnu), TargetPlatform::Bsd);
    EXPECT_TRUE(options.json);
}

TEST(CliParserTest, ParsesRunWithExpectations) {
    auto result = parse_tokens({"run", "--task", "Create a file", "--command", "touch a.txt",
                                "--expect-exists", "a.txt", "--expect-content", "b.txt=hi",
                                "--expect-output", "done", "--revisions", "0",
                                "--timeout-ms", "250"});
    ASSERT_FALSE(is_error(result));
    const auto& options = get_value(result);
    EXPECT_EQ(options.command, CliCommand::Run);
    ASSERT_EQ(options.expectations.size(), 3u);
    EXPECT_TRUE(std::holds_alternative<cmdgate::protocol::FileExists>(options.expectations[0]));
    const auto& content =
        std::get<cmdgate::protocol::FileContentEquals>(options.expectations[1]);
    EXPECT_EQ(content.path.string(), "b.txt");
    EXPECT_EQ(content.expected_text, "hi");
    EXPECT_EQ(options.revisions.value_or(99), 0u);
    EXPECT_EQ(options.timeout_ms.value_or(0), 250u);
}

TEST(CliParserTest, RunRequiresTask) {
    auto result = parse_tokens({"run", "--command", "ls"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "missing_required_flag");
}

TEST(CliParserTest, RejectsFlagsForTheWrongCommand) {
    for (const auto& tokens : std::vector<std::vector<std::string>>{
             {"regress", "--task", "x"},
             {"review", "--command", "ls", "--expect-exists", "a"},
             {"review", "--command", "ls", "--revisions", "1"},
             {"run", "--task", "x", "--sandbox", "."},
             {"run", "--task", "x", "--jobs", "2"},
             {"review", "--command", "ls", "--use-proposer"}}) {
        auto result = parse_tokens(tokens);
        ASSERT_TRUE(is_error(result)) << tokens[0] << " " << tokens[1];
        EXPECT_EQ(get_error(result).code, "conflicting_flags");
    }
}

TEST(CliParserTest, ValidatesNumbers) {
    auto bad = parse_tokens({"regress", "--jobs", "four"});
    ASSERT_TRUE(is_error(bad));
    EXPECT_EQ(get_error(bad).code, "invalid_integer");

    auto out_of_range = parse_tokens({"regress", "--jobs", "0"});
    ASSERT_TRUE(is_error(out_of_range));
    EXPECT_EQ(get_error(out_of_range).code, "bounds_error");

    auto ok = parse_tokens({"regress", "--jobs", "8", "--report", "out.json"});
    ASSERT_FALSE(is_error(ok));
    EXPECT_EQ(get_value(ok).jobs.value_or(0), 8u);
    EXPECT_EQ(get_value(ok).report_file.value_or("").string(), "out.json");
}

TEST(CliParserTest, RejectsUnknownPlatformAndArguments) {
    auto platform = parse_tokens({"regress", "--platform", "windows"});
    ASSERT_TRUE(is_error(platform));
    EXPECT_EQ(get_error(platform).code, "invalid_platform");

    auto unknown = parse_tokens({"regress", "--verbose"});
    ASSERT_TRUE(is_error(unknown));
    EXPECT_EQ(get_error(unknown).code, "unknown_argument");

    auto missing = parse_tokens({"review", "--command"});
    ASSERT_TRUE(is_error(missing));
    EXPECT_EQ(get_error(missing).code, "missing_value");

    auto bad_content = parse_tokens({"run", "--task", "x", "--expect-content", "=x"});
    ASSERT_TRUE(is_error(bad_content));
    EXPECT_EQ(get_error(bad_content).code, "invalid_expectation");
}

TEST(CliParserTest, SandboxMustBeAnExistingDirectory) {
    auto missing = parse_tokens({"review", "--command", "ls", "--sandbox",
                                 "/nonexistent/cmdgate/sandbox"});
    ASSERT_TRUE(is_error(missing));
    EXPECT_EQ(get_error(missing).code, "invalid_path");

    auto ok = parse_tokens({"review", "--command", "ls", "--sandbox", "."});
    ASSERT_FALSE(is_error(ok));
    EXPECT_EQ(get_value(ok).sandbox_dir.value_or("").string(),
              std::filesystem::canonical(std::filesystem::current_path()).string());
}

TEST(CliParserTest, OverridesApplyOnTopOfConfig) {
    auto result = parse_tokens({"regress", "--platform", "gnu", "--jobs", "3", "--log-level",
                                "debug", "--proposals", "p.json"});
    ASSERT_FALSE(is_error(result));
    auto config = cmdgate::core::config::default_config();
    config.target_platform = TargetPlatform::Bsd;
    cmdgate::app::cli::apply_overrides(get_value(result), config);
    EXPECT_EQ(config.target_platform, TargetPlatform::Gnu);
    EXPECT_EQ(config.jobs, 3u);
    EXPECT_EQ(config.log_level, "debug");
    ASSERT_TRUE(config.proposals_file.has_value());
    EXPECT_EQ(config.proposals_file->string(), "p.json");
    EXPECT_EQ(config.command_timeout_ms, 5000u);
}

}  // namespace
