#pragma once
#include <chrono>
#include <optional>
#include <string>

namespace cmdgate::protocol {

    // What the proposer hands over: one shell command plus why it solves the task.
    struct CommandProposal {
        std::string id;         // session-scoped, e.g. "prop-3"
        std::string command;
        std::string rationale;
    };

    // Why a proposal was turned down. Portability is kept apart from safety
    // so callers can branch on it (e.g. re-prompt for the right sed dialect).
    enum class RejectionCategory {
        None,         // approved
        Safety,       // destructive-root deletes
        Containment,  // path escapes the sandbox root
        Portability,  // flag dialect does not match the target platform
        Syntax,       // would not parse as one well-formed invocation
        SystemFile,   // writes a protected system or shell run-control file
        Reviewer      // a supplementary (generative) reviewer said no
    };

    struct ReviewVerdict {
        std::string proposal_id;
        bool approved = false;
        std::optional<std::string> reasoning;
        RejectionCategory category = RejectionCategory::None;
        std::string classifier;  // who decided; empty when approved
    };

    inline bool operator==(const ReviewVerdict& lhs, const ReviewVerdict& rhs) {
        return lhs.proposal_id == rhs.proposal_id && lhs.approved == rhs.approved &&
               lhs.reasoning == rhs.reasoning && lhs.category == rhs.category &&
               lhs.classifier == rhs.classifier;
    }

    // Exit code reported for a command killed by the wall-clock timeout.
    constexpr int kTimeoutExitCode = 124;

    struct ExecutionResult {
        std::string proposal_id;
        int exit_code = -1;
        std::string stdout_text;
        std::string stderr_text;
        std::chrono::milliseconds duration{0};
        bool timed_out = false;
        bool cancelled = false;
        bool stdout_truncated = false;
        bool stderr_truncated = false;
    };

    struct VerificationOutcome {
        bool passed = false;
        std::string detail;
    };

    inline std::string to_string(const RejectionCategory category) {
        switch (category) {
            case RejectionCategory::None:
                return "none";
            case RejectionCategory::Safety:
                return "safety";
            case RejectionCategory::Containment:
                return "containment";
            case RejectionCategory::Portability:
                return "portability";
            case RejectionCategory::Syntax:
                return "syntax";
            case RejectionCategory::SystemFile:
                return "system_file";
            case RejectionCategory::Reviewer:
                return "reviewer";
            default:
                return "unknown";
        }
    }

} // namespace cmdgate::protocol
