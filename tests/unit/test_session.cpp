#include <filesystem>
#include <fstream>
#include <memory>
#include <string>
#include <variant>
#include <gtest/gtest.h>
#include "core/config/session_id.hpp"
#include "core/errors/gate_errors.hpp"
#include "protocol/command_contract.hpp"
#include "session/session.hpp"

namespace {

using cmdgate::core::errors::get_error;
using cmdgate::core::errors::get_value;
using cmdgate::core::errors::is_error;
using cmdgate::protocol::RejectionCategory;
using cmdgate::protocol::ReviewVerdict;
using cmdgate::session::DefectReport;
using cmdgate::session::Session;
using cmdgate::session::SessionOptions;

class TempWorkspace {
public:
    TempWorkspace() {
        root_ = std::filesystem::current_path() /
                (".tmp_session_" + cmdgate::core::config::generate_session_id());
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

std::unique_ptr<Session> make_session(const TempWorkspace& workspace) {
    SessionOptions options;
    options.sandbox_base = workspace.root() / "sandboxes";
    auto created = Session::create(options);
    if (is_error(created)) {
        ADD_FAILURE() << get_error(created).message;
        return nullptr;
    }
    return std::move(std::get<std::unique_ptr<Session>>(created));
}

TEST(SessionTest, CreatesSandboxRootAndPurgesOnDestruction) {
    TempWorkspace workspace;
    std::filesystem::path root;
    {
        auto session = make_session(workspace);
        ASSERT_TRUE(session);
        root = session->sandbox_root();
        EXPECT_TRUE(std::filesystem::is_directory(root));
        EXPECT_EQ(root.filename().string(), session->id());

        std::ofstream(root / "leftover.txt") << "data";
        std::filesystem::create_directories(root / "nested" / "dir");
    }
    EXPECT_FALSE(std::filesystem::exists(root));
}

TEST(SessionTest, PurgeIsIdempotent) {
    TempWorkspace workspace;
    auto session = make_session(workspace);
    std::ofstream(session->sandbox_root() / "a.txt") << "a";

    auto first = session->purge();
    ASSERT_FALSE(is_error(first));
    EXPECT_GE(get_value(first), 2u);
    EXPECT_FALSE(std::filesystem::exists(session->sandbox_root()));

    auto second = session->purge();
    ASSERT_FALSE(is_error(second));
    EXPECT_EQ(get_value(second), 0u);
}

TEST(SessionTest, ExplicitIdMustNotCollide) {
    TempWorkspace workspace;
    SessionOptions options;
    options.sandbox_base = workspace.root();
    options.session_id = "fixed-session";

    auto first = Session::create(options);
    ASSERT_FALSE(is_error(first));
    auto second = Session::create(options);
    ASSERT_TRUE(is_error(second));
    EXPECT_EQ(get_error(second).code, "sandbox_root_exists");
}

TEST(SessionTest, ArtifactDirInsideSandboxIsRejected) {
    TempWorkspace workspace;
    SessionOptions options;
    options.sandbox_base = workspace.root();
    options.session_id = "artifacts-inside";
    options.artifact_dir = workspace.root() / "artifacts-inside" / "logs";

    auto created = Session::create(options);
    ASSERT_TRUE(is_error(created));
    EXPECT_EQ(get_error(created).code, "artifact_dir_inside_sandbox");
    EXPECT_FALSE(std::filesystem::exists(workspace.root() / "artifacts-inside"));
}

TEST(SessionTest, ProposalIdsAreSequential) {
    TempWorkspace workspace;
    auto session = make_session(workspace);
    EXPECT_EQ(session->next_proposal_id(), "prop-1");
    EXPECT_EQ(session->next_proposal_id(), "prop-2");
    EXPECT_EQ(session->artifacts(), nullptr);
}

TEST(SessionTest, LedgerOnlyRecordsApprovals) {
    TempWorkspace workspace;
    auto session = make_session(workspace);

    session->record_verdict(ReviewVerdict{"prop-1", true, std::nullopt,
                                          RejectionCategory::None, ""});
    session->record_verdict(ReviewVerdict{"prop-2", false, std::string("no"),
                                          RejectionCategory::Safety, "destructive_root"});

    EXPECT_TRUE(session->is_approved("prop-1"));
    EXPECT_FALSE(session->is_approved("prop-2"));
    EXPECT_FALSE(session->is_approved("prop-3"));
}

TEST(SessionTest, DefectsAreKept) {
    TempWorkspace workspace;
    auto session = make_session(workspace);
    EXPECT_TRUE(session->defects().empty());

    session->file_defect(DefectReport{"task-1", "prop-1", "cat ../x", "escaped",
                                      "path_outside_sandbox"});
    const auto defects = session->defects();
    ASSERT_EQ(defects.size(), 1u);
    EXPECT_EQ(defects[0].command, "cat ../x");
    EXPECT_EQ(defects[0].code, "path_outside_sandbox");
}

}  // namespace
