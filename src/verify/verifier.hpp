#pragma once

#include <filesystem>
#include <vector>
#include "protocol/command_contract.hpp"
#include "protocol/expectation.hpp"

namespace cmdgate::verify {

// Read-only post-condition checks. Expectation paths are sandbox-relative;
// one that escapes the sandbox root fails rather than being read.
class Verifier {
public:
    explicit Verifier(std::filesystem::path sandbox_root);

    protocol::VerificationOutcome verify(const protocol::ExecutionResult& execution,
                                         const protocol::Expectation& expectation) const;

    // Passes only when every expectation passes; details are joined with "; ".
    // An empty list passes.
    protocol::VerificationOutcome verify_all(
        const protocol::ExecutionResult& execution,
        const std::vector<protocol::Expectation>& expectations) const;

private:
    std::filesystem::path sandbox_root_;
};

}  // namespace cmdgate::verify
