#pragma once
#include <string>
#include <variant>

namespace cmdgate::core::errors {

    // 1. Typed error categories, one per pipeline failure kind
    enum class ErrorCategory {
        Input,             // E.g., unknown CLI flag, malformed config file
        Proposal,          // E.g., proposer unreachable or returned an empty command
        Policy,            // E.g., command rejected by a classifier
        Execution,         // E.g., non-zero exit or timeout
        SandboxViolation,  // E.g., approved command still escapes the sandbox root
        Verification,      // E.g., file content does not match the expectation
        Internal           // E.g., pipe/fork failure or a logic bug
    };

    // The standardized error payload
    struct GateError {
            ErrorCategory category;
            std::string message;
            std::string code = "unknown_error";
            std::string hint = "";              // Helpful tips for the user
        };

    // 2. Propagation strategy: a Result holds either a value of type T, OR a GateError.
    template <typename T>
    using Result = std::variant<T, GateError>;

    template <typename T>
    bool is_error(const Result<T>& result) {
        return std::holds_alternative<GateError>(result);
    }

    template <typename T>
    const GateError& get_error(const Result<T>& result) {
        return std::get<GateError>(result);
    }

    template <typename T>
    const T& get_value(const Result<T>& result) {
        return std::get<T>(result);
    }

    inline std::string to_string(const ErrorCategory category) {
        switch (category) {
            case ErrorCategory::Input:            return "input";
            case ErrorCategory::Proposal:         return "proposal";
            case ErrorCategory::Policy:           return "policy";
            case ErrorCategory::Execution:        return "execution";
            case ErrorCategory::SandboxViolation: return "sandbox_violation";
            case ErrorCategory::Verification:     return "verification";
            case ErrorCategory::Internal:         return "internal";
            default: return "unknown";
        }
    }

} // namespace cmdgate::core::errors
