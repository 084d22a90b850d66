#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include <gtest/gtest.h>
#include "core/config/gate_config.hpp"
#include "core/config/session_id.hpp"
#include "policy/classifier.hpp"
#include "policy/classifiers/destructive_root_classifier.hpp"
#include "policy/classifiers/path_containment_classifier.hpp"
#include "policy/classifiers/platform_compat_classifier.hpp"
#include "policy/classifiers/syntax_classifier.hpp"
#include "policy/classifiers/system_file_classifier.hpp"
#include "policy/shell_lexer.hpp"

namespace {

using cmdgate::core::config::TargetPlatform;
using cmdgate::policy::analyze_command;
using cmdgate::policy::Classifier;
using cmdgate::policy::DestructiveRootClassifier;
using cmdgate::policy::PathContainmentClassifier;
using cmdgate::policy::PlatformCompatClassifier;
using cmdgate::policy::PolicyContext;
using cmdgate::policy::Rejection;
using cmdgate::policy::SyntaxClassifier;
using cmdgate::policy::SystemFileClassifier;
using cmdgate::protocol::RejectionCategory;

class TempDir {
public:
    explicit TempDir(const std::string& tag) {
        const auto raw = std::filesystem::current_path() /
                         (".tmp_" + tag + "_" + cmdgate::core::config::generate_session_id());
        std::filesystem::create_directories(raw / "sub");
        path_ = std::filesystem::canonical(raw);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

class ClassifierTest : public ::testing::Test {
protected:
    ClassifierTest() : sandbox_("classifier_sandbox"), home_("classifier_home") {}

    PolicyContext context(const TargetPlatform platform = TargetPlatform::Gnu) const {
        auto config = cmdgate::core::config::default_config();
        config.home_directory = home_.path();
        PolicyContext ctx{sandbox_.path(), cmdgate::policy::settings_from_config(config)};
        ctx.settings.platform = platform;
        return ctx;
    }

    std::optional<Rejection> check(const Classifier& classifier, const std::string& command,
                                   const TargetPlatform platform = TargetPlatform::Gnu) const {
        return classifier.evaluate(analyze_command(command), context(platform));
    }

    std::string root() const { return sandbox_.path().string(); }

    TempDir sandbox_;
    TempDir home_;
};

TEST_F(ClassifierTest, DestructiveRootRejectsRootLikeTargets) {
    const DestructiveRootClassifier classifier;
    for (const std::string& command : std::vector<std::string>
         {"rm -rf /", "rm -rf *", "rm -rf .", "rm -rf ./", "rm -rf ~", "rm -r ./*",
          "rm -R .*", "rm --recursive --force *", "sudo rm -rf /",
          "rm -rf " + root(), "rm -rf " + root() + "/..", "cd sub && rm -rf ..",
          "find . -delete", "find -delete", "sh -c 'rm -rf *'"}) {
        const auto rejection = check(classifier, command);
        ASSERT_TRUE(rejection.has_value()) << command;
        EXPECT_EQ(rejection->category, RejectionCategory::Safety) << command;
    }
}

TEST_F(ClassifierTest, DestructiveRootRejectsNoPreserveRoot) {
    const DestructiveRootClassifier classifier;
    const auto rejection = check(classifier, "rm -rf --no-preserve-root build");
    ASSERT_TRUE(rejection.has_value());
    EXPECT_NE(rejection->reason.find("--no-preserve-root"), std::string::npos);
}

TEST_F(ClassifierTest, DestructiveRootAllowsScopedDeletes) {
    const DestructiveRootClassifier classifier;
    for (const std::string& command : std::vector<std::string>
         {"rm -rf build", "rm -rf sub/*", "rm -f *", "rm old.txt", "find . -name '*.o' -print",
          "find sub -delete", "ls -R ."}) {
        EXPECT_FALSE(check(classifier, command).has_value()) << command;
    }
}

TEST_F(ClassifierTest, ContainmentRejectsEscapes) {
    const PathContainmentClassifier classifier;
    for (const std::string& command : std::vector<std::string>
         {"cat ../secret.txt", "cat /etc/passwd", "ls " + root() + "/../",
          "cat sandbox/../../../etc/passwd", "cd .. && cat notes", "sh -c 'cat ../x'",
          "cp a.txt ~/a.txt", "grep -r key /etc", "echo $(cat /etc/shadow)",
          // other users' homes and the directory stack
          "cat ~root/.profile", "rm -rf ~root", "cat ~+/../x", "ls ~-",
          // per-command directory changes
          "env --chdir=/ cat etc/hostname", "env -C / cat etc/hostname",
          "env -iC/ cat etc/hostname", "sudo -D / cat etc/hostname", "git -C .. status",
          "make -C / install", "env -C sub sh -c 'cat ../../x'", "cd && ls",
          "env -S 'cat /etc/hostname'",
          // brace lists
          "bash -c 'cat {/etc/hostname,in.txt}'", "cat {a,b}.txt",
          // files opened by scripts
          "sed -n 'w ../leak.txt' in.txt", "sed -e 's/a/b/w ../leak.txt' in.txt",
          "sed '1r /etc/hostname' in.txt", "sed --expression='W ../x' in.txt",
          "sed 's/.*/id/e' in.txt", "sed -f fix.sed in.txt",
          "awk '{print > \"../leak\"}' in.txt", "awk 'BEGIN {system(\"id\")}'",
          "awk '{getline line < \"/etc/passwd\"}' in.txt",
          // find output actions and xargs argument files
          "find . -fprint ../leak", "find . -fprintf ../leak '%p'", "find . -fls /tmp/l",
          "find . -newer /etc/hostname", "xargs -a /etc/hostname echo",
          "xargs --arg-file=../list rm",
          // program words
          "../outside.sh", "sub/../../outside.sh", "../bin/env cat a.txt"}) {
        const auto rejection = check(classifier, command);
        ASSERT_TRUE(rejection.has_value()) << command;
        EXPECT_EQ(rejection->category, RejectionCategory::Containment) << command;
    }
}

TEST_F(ClassifierTest, ContainmentRejectsUnresolvableTildeForms) {
    const PathContainmentClassifier classifier;
    const auto rejection = check(classifier, "cat ~root/.profile");
    ASSERT_TRUE(rejection.has_value());
    EXPECT_NE(rejection->reason.find("tilde"), std::string::npos);
}

TEST_F(ClassifierTest, ContainmentAllowsScriptsAndDirectoryChangesInsideTheSandbox) {
    const PathContainmentClassifier classifier;
    for (const std::string& command : std::vector<std::string>
         {"sed -n 'w copy.txt' in.txt", "sed -n 'p;w /dev/stdout' in.txt",
          "awk '{print $1}' in.txt", "awk '$1 > 5 {print}' in.txt",
          "awk -F, '/a|b/ {n++} END {print n}' in.csv", "env -C sub cat f.txt",
          "git -C sub status", "make -C sub", "find . -fprint found.txt",
          "find . -newer ref.txt", "xargs -a list.txt echo", "./build.sh", "sub/run.sh arg",
          "/bin/ls -la", "/usr/bin/env cat a.txt", "echo {a,b}", "cd sub && ls"}) {
        EXPECT_FALSE(check(classifier, command).has_value()) << command;
    }
}

TEST_F(ClassifierTest, ContainmentRejectsExpansionInPaths) {
    const PathContainmentClassifier classifier;
    const auto rejection = check(classifier, "cat $HOME/notes.txt");
    ASSERT_TRUE(rejection.has_value());
    EXPECT_NE(rejection->reason.find("shell expansion"), std::string::npos);
}

TEST_F(ClassifierTest, ContainmentRejectsSymlinkEscape) {
    std::error_code ec;
    std::filesystem::create_directory_symlink(home_.path(), sandbox_.path() / "link", ec);
    ASSERT_FALSE(ec);
    const PathContainmentClassifier classifier;
    EXPECT_TRUE(check(classifier, "cat link/secret.txt").has_value());
}

TEST_F(ClassifierTest, ContainmentAllowsSandboxPathsAndExternalsOnAllowList) {
    const PathContainmentClassifier classifier;
    for (const std::string& command : std::vector<std::string>
         {"cat a.txt", "ls -la", "grep -r foo .", "echo hi > /dev/null",
          "cat " + root() + "/a.txt", "sed -i 's/a/b/' sub/../a.txt", "mkdir -p out/deep",
          "find . -name '*.txt' -exec cat {} \\;", "echo /etc/passwd"}) {
        EXPECT_FALSE(check(classifier, command).has_value()) << command;
    }
}

TEST_F(ClassifierTest, GnuRejectsDetachedSedSuffix) {
    const PlatformCompatClassifier classifier;
    const auto rejection = check(classifier, "sed -i '' 's/a/b/' f.txt", TargetPlatform::Gnu);
    ASSERT_TRUE(rejection.has_value());
    EXPECT_EQ(rejection->category, RejectionCategory::Portability);
    EXPECT_FALSE(check(classifier, "sed -i 's/a/b/' f.txt", TargetPlatform::Gnu).has_value());
}

TEST_F(ClassifierTest, BsdRequiresSedSuffix) {
    const PlatformCompatClassifier classifier;
    for (const std::string& command : std::vector<std::string>
         {"sed -i 's/a/b/' f.txt", "sed -Ei 's/a/b/' f.txt", "sed --in-place 's/a/b/' f.txt"}) {
        const auto rejection = check(classifier, command, TargetPlatform::Bsd);
        ASSERT_TRUE(rejection.has_value()) << command;
        EXPECT_EQ(rejection->category, RejectionCategory::Portability) << command;
    }
    for (const std::string& command : std::vector<std::string>
         {"sed -i '' 's/a/b/' f.txt", "sed -i .bak 's/a/b/' f.txt", "sed -E -i '' 's/a/b/' f.txt",
          "sed -n 's/a/b/p' f.txt"}) {
        EXPECT_FALSE(check(classifier, command, TargetPlatform::Bsd).has_value()) << command;
    }
}

TEST_F(ClassifierTest, AttachedSedSuffixWorksOnBoth) {
    const PlatformCompatClassifier classifier;
    EXPECT_FALSE(check(classifier, "sed -i.bak 's/a/b/' f.txt", TargetPlatform::Gnu).has_value());
    EXPECT_FALSE(check(classifier, "sed -i.bak 's/a/b/' f.txt", TargetPlatform::Bsd).has_value());
}

TEST_F(ClassifierTest, DialectFlagsFollowTheTarget) {
    const PlatformCompatClassifier classifier;
    EXPECT_TRUE(check(classifier, "grep -rP '\\d+' .", TargetPlatform::Bsd).has_value());
    EXPECT_FALSE(check(classifier, "grep -rP '\\d+' .", TargetPlatform::Gnu).has_value());
    EXPECT_TRUE(check(classifier, "find . -type f -printf '%s\\n'", TargetPlatform::Bsd)
                    .has_value());
    EXPECT_TRUE(check(classifier, "stat -f %z a.txt", TargetPlatform::Gnu).has_value());
    EXPECT_FALSE(check(classifier, "stat -f %z a.txt", TargetPlatform::Bsd).has_value());
    EXPECT_TRUE(check(classifier, "ls --all", TargetPlatform::Bsd).has_value());
    EXPECT_FALSE(check(classifier, "ls --all", TargetPlatform::Gnu).has_value());
    EXPECT_FALSE(check(classifier, "grep -e pattern a.txt", TargetPlatform::Bsd).has_value());
}

TEST_F(ClassifierTest, DialectRulesAreNamedPerPlatform) {
    bool gnu_only = false;
    bool bsd_only = false;
    for (const auto& rule : cmdgate::policy::dialect_flag_rules()) {
        gnu_only = gnu_only || rule.only_on == TargetPlatform::Gnu;
        bsd_only = bsd_only || rule.only_on == TargetPlatform::Bsd;
        EXPECT_FALSE(rule.note.empty()) << rule.verb << " " << rule.flag;
    }
    EXPECT_TRUE(gnu_only);
    EXPECT_TRUE(bsd_only);
}

TEST_F(ClassifierTest, SyntaxRejectsMalformedCommands) {
    const SyntaxClassifier classifier;
    for (const std::string& command : std::vector<std::string>
         {"sed -i '' s/the/teh/g' file.txt", "ls |", "cat >", "(ls", "bash -c 'echo \"oops'"}) {
        const auto rejection = check(classifier, command);
        ASSERT_TRUE(rejection.has_value()) << command;
        EXPECT_EQ(rejection->category, RejectionCategory::Syntax) << command;
        EXPECT_EQ(rejection->reason.rfind("Command is not well-formed: ", 0), 0u) << command;
    }
    EXPECT_FALSE(check(classifier, "ls -la && wc -l a.txt").has_value());
}

TEST_F(ClassifierTest, SystemFileRejectsProtectedWrites) {
    const SystemFileClassifier classifier;
    const auto redirected = check(classifier, "echo x >> /etc/cmdgate_test.conf");
    ASSERT_TRUE(redirected.has_value());
    EXPECT_EQ(redirected->category, RejectionCategory::SystemFile);
    EXPECT_NE(redirected->reason.find("via redirection"), std::string::npos);

    const auto rc_file = check(classifier, "echo 'alias l=ls' >> ~/.bashrc");
    ASSERT_TRUE(rc_file.has_value());
    EXPECT_EQ(rc_file->category, RejectionCategory::SystemFile);

    const auto copied = check(classifier, "cp a.txt /usr/local/bin/a");
    ASSERT_TRUE(copied.has_value());
    EXPECT_NE(copied->reason.find("via 'cp'"), std::string::npos);
}

TEST_F(ClassifierTest, SystemFileIgnoresReadsAndAllowedExternals) {
    const SystemFileClassifier classifier;
    EXPECT_FALSE(check(classifier, "cat /etc/passwd").has_value());
    EXPECT_FALSE(check(classifier, "ls > /dev/null").has_value());
    EXPECT_FALSE(check(classifier, "echo hi > notes.txt").has_value());
}

}  // namespace
