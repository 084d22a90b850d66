#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include <gtest/gtest.h>
#include "core/config/gate_config.hpp"
#include "core/config/session_id.hpp"
#include "policy/safety_policy_engine.hpp"

namespace {

using cmdgate::core::config::TargetPlatform;
using cmdgate::policy::Classifier;
using cmdgate::policy::CommandAnalysis;
using cmdgate::policy::PolicyContext;
using cmdgate::policy::PolicySettings;
using cmdgate::policy::Rejection;
using cmdgate::policy::SafetyPolicyEngine;
using cmdgate::protocol::CommandProposal;
using cmdgate::protocol::RejectionCategory;

class TempSandbox {
public:
    TempSandbox() {
        root_ = std::filesystem::current_path() /
                (".tmp_policy_engine_" + cmdgate::core::config::generate_session_id());
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

PolicySettings settings_for(const TargetPlatform platform) {
    auto config = cmdgate::core::config::default_config();
    config.target_platform = platform;
    config.home_directory = "/home/cmdgate-test";
    return cmdgate::policy::settings_from_config(config);
}

CommandProposal proposal(const std::string& command) {
    return CommandProposal{"prop-1", command, "test"};
}

class FixedClassifier : public Classifier {
public:
    FixedClassifier(std::string name, std::optional<Rejection> answer)
        : name_(std::move(name)), answer_(std::move(answer)) {}

    std::string name() const override { return name_; }
    std::optional<Rejection> evaluate(const CommandAnalysis& /*analysis*/,
                                      const PolicyContext& /*context*/) const override {
        return answer_;
    }

private:
    std::string name_;
    std::optional<Rejection> answer_;
};

TEST(SafetyPolicyEngineTest, DefaultClassifiersRunInFixedOrder) {
    const SafetyPolicyEngine engine(settings_for(TargetPlatform::Gnu));
    std::vector<std::string> names;
    for (const auto& classifier : engine.classifiers()) {
        names.push_back(classifier->name());
    }
    EXPECT_EQ(names, std::vector<std::string>({"destructive_root", "path_containment",
                                               "platform_compat", "syntax", "system_file"}));
}

TEST(SafetyPolicyEngineTest, ApprovesOrdinarySandboxCommands) {
    TempSandbox sandbox;
    const SafetyPolicyEngine engine(settings_for(TargetPlatform::Gnu));
    for (const std::string& command : std::vector<std::string>{
             "sed -i 's/hello/goodbye/g' greeting.txt", "touch new_empty_file.txt",
             "cp src_cp.txt dst_cp.txt", "mkdir new_sub", "grep marker grep.txt", "ls -la",
             "find . -name '*.txt' | xargs wc -l", "echo done > /dev/null"}) {
        const auto verdict = engine.review(proposal(command), sandbox.root());
        EXPECT_TRUE(verdict.approved) << command << ": " << verdict.reasoning.value_or("");
        EXPECT_EQ(verdict.category, RejectionCategory::None);
        EXPECT_EQ(verdict.proposal_id, "prop-1");
    }
}

TEST(SafetyPolicyEngineTest, RecursiveDeleteOfRootIsASafetyRejection) {
    TempSandbox sandbox;
    const SafetyPolicyEngine engine(settings_for(TargetPlatform::Gnu));
    for (const std::string& command :
         std::vector<std::string>{"rm -rf /", "rm -rf *", "rm -rf ."}) {
        const auto verdict = engine.review(proposal(command), sandbox.root());
        EXPECT_FALSE(verdict.approved) << command;
        EXPECT_EQ(verdict.category, RejectionCategory::Safety) << command;
        EXPECT_EQ(verdict.classifier, "destructive_root") << command;
        ASSERT_TRUE(verdict.reasoning.has_value());
        EXPECT_FALSE(verdict.reasoning->empty());
    }
}

TEST(SafetyPolicyEngineTest, AppendToEtcHostsIsRejectedBeforeSystemFileCheck) {
    TempSandbox sandbox;
    const SafetyPolicyEngine engine(settings_for(TargetPlatform::Gnu));
    const auto verdict = engine.review(proposal("echo 'new' >> /etc/hosts"), sandbox.root());
    EXPECT_FALSE(verdict.approved);
    EXPECT_EQ(verdict.category, RejectionCategory::Containment);
    EXPECT_EQ(verdict.classifier, "path_containment");
}

TEST(SafetyPolicyEngineTest, TraversalIsAContainmentRejection) {
    TempSandbox sandbox;
    const SafetyPolicyEngine engine(settings_for(TargetPlatform::Gnu));
    for (const std::string& command : std::vector<std::string>{
             "cat sandbox/../../../etc/passwd", "ls " + sandbox.root().string() + "/../",
             "echo 'alias l=ls' >> ~/.bashrc"}) {
        const auto verdict = engine.review(proposal(command), sandbox.root());
        EXPECT_FALSE(verdict.approved) << command;
        EXPECT_EQ(verdict.category, RejectionCategory::Containment) << command;
    }
}

TEST(SafetyPolicyEngineTest, WrongSedDialectIsPortabilityNotSafety) {
    TempSandbox sandbox;
    const SafetyPolicyEngine gnu(settings_for(TargetPlatform::Gnu));
    const auto on_gnu = gnu.review(proposal("sed -i '' 's/old/new/g' dummy.txt"), sandbox.root());
    EXPECT_FALSE(on_gnu.approved);
    EXPECT_EQ(on_gnu.category, RejectionCategory::Portability);
    EXPECT_EQ(on_gnu.classifier, "platform_compat");

    const SafetyPolicyEngine bsd(settings_for(TargetPlatform::Bsd));
    const auto on_bsd = bsd.review(proposal("sed -i 's/old/new/g' dummy.txt"), sandbox.root());
    EXPECT_FALSE(on_bsd.approved);
    EXPECT_EQ(on_bsd.category, RejectionCategory::Portability);

    EXPECT_TRUE(bsd.review(proposal("sed -i '' 's/old/new/g' dummy.txt"), sandbox.root())
                    .approved);
}

TEST(SafetyPolicyEngineTest, MalformedCommandIsRejected) {
    TempSandbox sandbox;
    const SafetyPolicyEngine bsd(settings_for(TargetPlatform::Bsd));
    const auto verdict =
        bsd.review(proposal("sed -i '' s/the/teh/g' file.txt"), sandbox.root());
    EXPECT_FALSE(verdict.approved);
    EXPECT_EQ(verdict.category, RejectionCategory::Syntax);
    EXPECT_EQ(verdict.classifier, "syntax");

    const SafetyPolicyEngine gnu(settings_for(TargetPlatform::Gnu));
    EXPECT_FALSE(gnu.review(proposal("sed -i '' s/the/teh/g' file.txt"), sandbox.root())
                     .approved);
}

TEST(SafetyPolicyEngineTest, EmptyCommandIsASyntaxRejection) {
    TempSandbox sandbox;
    const SafetyPolicyEngine engine(settings_for(TargetPlatform::Gnu));
    const auto verdict = engine.review(proposal("   "), sandbox.root());
    EXPECT_FALSE(verdict.approved);
    EXPECT_EQ(verdict.category, RejectionCategory::Syntax);
    EXPECT_EQ(verdict.reasoning.value_or(""), "Command is empty.");
}

TEST(SafetyPolicyEngineTest, InvalidSandboxRootFailsClosed) {
    const SafetyPolicyEngine engine(settings_for(TargetPlatform::Gnu));
    const auto missing = std::filesystem::current_path() /
                         ("__missing_sandbox__" + cmdgate::core::config::generate_session_id());
    const auto verdict = engine.review(proposal("ls"), missing);
    EXPECT_FALSE(verdict.approved);
    EXPECT_EQ(verdict.category, RejectionCategory::Containment);
    EXPECT_EQ(verdict.classifier, "sandbox_root");
}

TEST(SafetyPolicyEngineTest, ReviewIsIdempotent) {
    TempSandbox sandbox;
    const SafetyPolicyEngine engine(settings_for(TargetPlatform::Gnu));
    for (const std::string& command :
         std::vector<std::string>{"rm -rf /", "touch a.txt", "cat ../x"}) {
        const auto first = engine.review(proposal(command), sandbox.root());
        const auto second = engine.review(proposal(command), sandbox.root());
        EXPECT_EQ(first, second) << command;
    }
}

TEST(SafetyPolicyEngineTest, FirstRejectingClassifierWins) {
    TempSandbox sandbox;
    std::vector<std::shared_ptr<const Classifier>> classifiers = {
        std::make_shared<FixedClassifier>("silent", std::nullopt),
        std::make_shared<FixedClassifier>(
            "first", Rejection{RejectionCategory::Portability, "first says no"}),
        std::make_shared<FixedClassifier>(
            "second", Rejection{RejectionCategory::Safety, "second says no"})};
    const SafetyPolicyEngine engine(settings_for(TargetPlatform::Gnu), classifiers);

    const auto verdict = engine.review(proposal("ls"), sandbox.root());
    EXPECT_FALSE(verdict.approved);
    EXPECT_EQ(verdict.classifier, "first");
    EXPECT_EQ(verdict.category, RejectionCategory::Portability);
    EXPECT_EQ(verdict.reasoning.value_or(""), "first says no");
}

}  // namespace
