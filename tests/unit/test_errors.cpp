#include <gtest/gtest.h>
#include "core/errors/gate_errors.hpp"

using namespace cmdgate::core::errors;

// Stands in for a pipeline step that can fail
Result<std::string> simulate_proposal(bool should_fail) {
    if (should_fail) {
        return GateError{ErrorCategory::Proposal, "Proposer returned an empty command.",
                         "empty_proposal"};
    }
    return std::string("touch new_file.txt");
}

TEST(ErrorModelTest, HandlesSuccess) {
    auto result = simulate_proposal(false);

    EXPECT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result), "touch new_file.txt");
}

TEST(ErrorModelTest, HandlesFailure) {
    auto result = simulate_proposal(true);

    EXPECT_TRUE(is_error(result));

    auto error = get_error(result);
    EXPECT_EQ(error.category, ErrorCategory::Proposal);
    EXPECT_EQ(error.code, "empty_proposal");
    EXPECT_TRUE(error.hint.empty());
}

TEST(ErrorModelTest, CategoryNamesAreStable) {
    EXPECT_EQ(to_string(ErrorCategory::Input), "input");
    EXPECT_EQ(to_string(ErrorCategory::SandboxViolation), "sandbox_violation");
    EXPECT_EQ(to_string(ErrorCategory::Verification), "verification");
}
