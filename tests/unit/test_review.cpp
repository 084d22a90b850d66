#include <filesystem>
#include <memory>
#include <string>
#include <utility>
#include <vector>
#include <gtest/gtest.h>
#include "core/config/gate_config.hpp"
#include "core/config/session_id.hpp"
#include "core/errors/gate_errors.hpp"
#include "policy/classifier.hpp"
#include "review/proposer.hpp"
#include "review/reviewer.hpp"
#include "review/text_generator.hpp"

namespace {

using cmdgate::core::config::TargetPlatform;
using cmdgate::core::errors::ErrorCategory;
using cmdgate::core::errors::GateError;
using cmdgate::core::errors::get_error;
using cmdgate::core::errors::get_value;
using cmdgate::core::errors::is_error;
using cmdgate::core::errors::Result;
using cmdgate::protocol::CommandProposal;
using cmdgate::protocol::RejectionCategory;
using cmdgate::review::CompositeReviewer;
using cmdgate::review::final_answer;
using cmdgate::review::GenerativeProposer;
using cmdgate::review::GenerativeReviewer;
using cmdgate::review::PolicyReviewer;
using cmdgate::review::ProcessTextGenerator;
using cmdgate::review::ReviewContext;
using cmdgate::review::ScriptedProposer;
using cmdgate::review::TextGenerator;

// Returns a canned reply and remembers the last prompt.
class CannedGenerator : public TextGenerator {
public:
    explicit CannedGenerator(Result<std::string> reply) : reply_(std::move(reply)) {}

    Result<std::string> generate(const std::string& prompt,
                                 std::uint32_t /*timeout_ms*/) const override {
        last_prompt_ = prompt;
        return reply_;
    }

    const std::string& last_prompt() const { return last_prompt_; }

private:
    Result<std::string> reply_;
    mutable std::string last_prompt_;
};

class TempSandbox {
public:
    TempSandbox() {
        root_ = std::filesystem::current_path() /
                (".tmp_review_" + cmdgate::core::config::generate_session_id());
        std::filesystem::create_directories(root_);
    }

    ~TempSandbox() {
        std::error_code ec;
        std::filesystem::remove_all(root_, ec);
    }

    const std::filesystem::path& root() const { return root_; }

private:
    std::filesystem::path root_;
};

PolicyReviewer make_policy_reviewer() {
    auto config = cmdgate::core::config::default_config();
    config.target_platform = TargetPlatform::Gnu;
    config.home_directory = "/home/cmdgate-test";
    return PolicyReviewer(
        cmdgate::policy::SafetyPolicyEngine(cmdgate::policy::settings_from_config(config)));
}

TEST(FinalAnswerTest, StripsThinkingAndFences) {
    EXPECT_EQ(final_answer("  ls -la \n"), "ls -la");
    EXPECT_EQ(final_answer("<think>maybe rm?</think>\ntouch a.txt"), "touch a.txt");
    EXPECT_EQ(final_answer("<think>a</think><think>b</think> pwd"), "pwd");
    EXPECT_EQ(final_answer("```bash\nmkdir new_sub\n```"), "mkdir new_sub");
    EXPECT_EQ(final_answer("```ls```"), "ls");
}

TEST(ScriptedProposerTest, LooksUpExactTask) {
    ScriptedProposer proposer;
    proposer.add("Create an empty file", "touch new_empty_file.txt", "creates it");

    auto found = proposer.propose("Create an empty file", "");
    ASSERT_FALSE(is_error(found));
    EXPECT_EQ(get_value(found).command, "touch new_empty_file.txt");
    EXPECT_EQ(get_value(found).rationale, "creates it");

    auto missing = proposer.propose("Something else", "");
    ASSERT_TRUE(is_error(missing));
    EXPECT_EQ(get_error(missing).category, ErrorCategory::Proposal);
    EXPECT_EQ(get_error(missing).code, "no_scripted_proposal");
}

TEST(ScriptedProposerTest, EmptyCommandIsAProposalFailure) {
    ScriptedProposer proposer;
    proposer.add("Do nothing", "   ");
    auto result = proposer.propose("Do nothing", "");
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "empty_proposal");
}

TEST(ScriptedProposerTest, ParsesProposalsDocument) {
    auto parsed = ScriptedProposer::from_json_text(R"({"proposals": [
        {"task": "List files", "command": "ls"},
        {"task": "Make dir", "command": "mkdir new_sub", "rationale": "mkdir"}
    ]})");
    ASSERT_FALSE(is_error(parsed));
    EXPECT_EQ(get_value(parsed).size(), 2u);

    EXPECT_EQ(get_error(ScriptedProposer::from_json_text("[]")).code, "invalid_proposals_json");
    EXPECT_EQ(get_error(ScriptedProposer::from_json_text(
                            R"({"proposals": [{"task": "x"}]})"))
                  .code,
              "invalid_proposals_json");
}

TEST(GenerativeProposerTest, CleansModelOutput) {
    auto generator = std::make_shared<CannedGenerator>(
        std::string("<think>sed it</think>\n`sed -i 's/a/b/' f.txt`\n"));
    const GenerativeProposer proposer(generator, TargetPlatform::Gnu, 1000);

    auto result = proposer.propose("Replace a with b in f.txt", "");
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).command, "sed -i 's/a/b/' f.txt");
    EXPECT_NE(generator->last_prompt().find("Task: Replace a with b in f.txt"),
              std::string::npos);
    EXPECT_NE(generator->last_prompt().find("GNU/Linux"), std::string::npos);
}

TEST(GenerativeProposerTest, AcceptsJsonShapedReply) {
    auto generator = std::make_shared<CannedGenerator>(
        std::string(R"({"command": "mkdir new_sub", "description": "make it"})"));
    const GenerativeProposer proposer(generator, TargetPlatform::Bsd, 1000);

    auto result = proposer.propose("Make a directory", "");
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).command, "mkdir new_sub");
    EXPECT_EQ(get_value(result).rationale, "make it");
    EXPECT_NE(proposer.build_prompt("t", "").find("sed -i ''"), std::string::npos);
}

TEST(GenerativeProposerTest, GeneratorFailureBecomesProposalError) {
    auto generator = std::make_shared<CannedGenerator>(
        GateError{ErrorCategory::Input, "backend down", "generator_failed"});
    const GenerativeProposer proposer(generator, TargetPlatform::Gnu, 1000);
    auto result = proposer.propose("anything", "");
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).category, ErrorCategory::Proposal);

    const GenerativeProposer blank(std::make_shared<CannedGenerator>(std::string("\n\n")),
                                   TargetPlatform::Gnu, 1000);
    auto empty = blank.propose("anything", "");
    ASSERT_TRUE(is_error(empty));
    EXPECT_EQ(get_error(empty).code, "empty_proposal");
}

TEST(GenerativeReviewerTest, ParsesVerdictReplies) {
    const auto approved =
        GenerativeReviewer::parse_reply("prop-1", R"({"approved": true, "reasoning": null})");
    EXPECT_TRUE(approved.approved);
    EXPECT_FALSE(approved.reasoning.has_value());

    const auto rejected = GenerativeReviewer::parse_reply(
        "prop-1", "<think>hmm</think>{\"approved\": false, \"reasoning\": \"too broad\"}");
    EXPECT_FALSE(rejected.approved);
    EXPECT_EQ(rejected.category, RejectionCategory::Reviewer);
    EXPECT_EQ(rejected.reasoning.value_or(""), "too broad");

    for (const std::string& reply : std::vector<std::string>{
             "yes", R"({"approved": "yes"})", R"({"approved": true, "reasoning": 5})", "[]"}) {
        const auto verdict = GenerativeReviewer::parse_reply("prop-1", reply);
        EXPECT_FALSE(verdict.approved) << reply;
        EXPECT_EQ(verdict.category, RejectionCategory::Reviewer) << reply;
    }
}

TEST(CompositeReviewerTest, PolicyRejectionShortCircuits) {
    TempSandbox sandbox;
    auto generator =
        std::make_shared<CannedGenerator>(std::string(R"({"approved": true})"));
    const CompositeReviewer reviewer(
        make_policy_reviewer(), {std::make_shared<GenerativeReviewer>(generator, 1000)});

    auto verdict = reviewer.assess(CommandProposal{"prop-1", "rm -rf /", ""},
                                   ReviewContext{"wipe", "", sandbox.root()});
    ASSERT_FALSE(is_error(verdict));
    EXPECT_FALSE(get_value(verdict).approved);
    EXPECT_EQ(get_value(verdict).category, RejectionCategory::Safety);
    EXPECT_TRUE(generator->last_prompt().empty());
}

TEST(CompositeReviewerTest, SupplementaryReviewerCanVeto) {
    TempSandbox sandbox;
    auto generator = std::make_shared<CannedGenerator>(
        std::string(R"({"approved": false, "reasoning": "does not solve the task"})"));
    const CompositeReviewer reviewer(
        make_policy_reviewer(), {std::make_shared<GenerativeReviewer>(generator, 1000)});

    auto verdict = reviewer.assess(CommandProposal{"prop-2", "ls", "lists"},
                                   ReviewContext{"Create a file", "", sandbox.root()});
    ASSERT_FALSE(is_error(verdict));
    EXPECT_FALSE(get_value(verdict).approved);
    EXPECT_EQ(get_value(verdict).category, RejectionCategory::Reviewer);
    EXPECT_EQ(get_value(verdict).classifier, "generative");
    EXPECT_NE(generator->last_prompt().find("Create a file"), std::string::npos);
}

TEST(CompositeReviewerTest, ApprovesWhenEveryoneAgrees) {
    TempSandbox sandbox;
    auto generator = std::make_shared<CannedGenerator>(std::string(R"({"approved": true})"));
    const CompositeReviewer reviewer(
        make_policy_reviewer(), {std::make_shared<GenerativeReviewer>(generator, 1000)});
    auto verdict = reviewer.assess(CommandProposal{"prop-3", "touch a.txt", ""},
                                   ReviewContext{"Create a file", "", sandbox.root()});
    ASSERT_FALSE(is_error(verdict));
    EXPECT_TRUE(get_value(verdict).approved);
}

TEST(ProcessTextGeneratorTest, PipesPromptThroughCommand) {
    const ProcessTextGenerator echo("cat");
    auto result = echo.generate("ls -la", 2000);
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result), "ls -la");

    const ProcessTextGenerator failing("false");
    auto failed = failing.generate("x", 2000);
    ASSERT_TRUE(is_error(failed));
    EXPECT_EQ(get_error(failed).code, "generator_failed");

    const ProcessTextGenerator slow("sleep 5");
    auto timed_out = slow.generate("x", 100);
    ASSERT_TRUE(is_error(timed_out));
    EXPECT_EQ(get_error(timed_out).code, "generator_timeout");

    const ProcessTextGenerator unset("");
    EXPECT_EQ(get_error(unset.generate("x", 100)).code, "generator_not_configured");
}

}  // namespace
