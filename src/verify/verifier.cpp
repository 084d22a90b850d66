#include "verify/verifier.hpp"

#include <fstream>
#include <optional>
#include <sstream>
#include <system_error>
#include <utility>
#include "policy/sandbox_paths.hpp"

namespace cmdgate::verify {

using protocol::ExecutionResult;
using protocol::Expectation;
using protocol::VerificationOutcome;

namespace {

std::optional<std::string> read_file(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        return std::nullopt;
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    if (!in.good() && !in.eof()) {
        return std::nullopt;
    }
    return buffer.str();
}

VerificationOutcome pass(std::string detail) { return {true, std::move(detail)}; }
VerificationOutcome fail(std::string detail) { return {false, std::move(detail)}; }

struct ExpectationChecker {
    const std::filesystem::path& root;
    const ExecutionResult& execution;

    // Resolves a sandbox-relative path, or explains why it cannot be checked.
    core::errors::Result<std::filesystem::path> locate(const std::filesystem::path& path) const {
        return policy::validate_path_in_sandbox(root, path);
    }

    VerificationOutcome operator()(const protocol::FileContentEquals& e) const {
        auto located = locate(e.path);
        if (core::errors::is_error(located)) {
            return fail(core::errors::get_error(located).message);
        }
        const auto content = read_file(core::errors::get_value(located));
        if (!content.has_value()) {
            return fail("cannot read " + e.path.string());
        }
        if (content.value() != e.expected_text) {
            return fail(e.path.string() + " content mismatch: expected \"" + e.expected_text +
                        "\", got \"" + content.value() + "\"");
        }
        return pass(e.path.string() + " content matches");
    }

    VerificationOutcome operator()(const protocol::FileExists& e) const {
        auto located = locate(e.path);
        if (core::errors::is_error(located)) {
            return fail(core::errors::get_error(located).message);
        }
        const auto& path = core::errors::get_value(located);
        std::error_code ec;
        if (!std::filesystem::is_regular_file(path, ec) || ec) {
            return fail(e.path.string() + " does not exist");
        }
        if (e.expected_size.has_value()) {
            const auto size = std::filesystem::file_size(path, ec);
            if (ec) {
                return fail("cannot stat " + e.path.string());
            }
            if (size != e.expected_size.value()) {
                return fail(e.path.string() + " has size " + std::to_string(size) +
                            ", expected " + std::to_string(e.expected_size.value()));
            }
        }
        return pass(e.path.string() + " exists");
    }

    VerificationOutcome operator()(const protocol::FileAbsent& e) const {
        auto located = locate(e.path);
        if (core::errors::is_error(located)) {
            return fail(core::errors::get_error(located).message);
        }
        std::error_code ec;
        const auto status = std::filesystem::symlink_status(core::errors::get_value(located), ec);
        if (std::filesystem::exists(status)) {
            return fail(e.path.string() + " still exists");
        }
        return pass(e.path.string() + " is absent");
    }

    VerificationOutcome operator()(const protocol::DirectoryExists& e) const {
        auto located = locate(e.path);
        if (core::errors::is_error(located)) {
            return fail(core::errors::get_error(located).message);
        }
        std::error_code ec;
        if (!std::filesystem::is_directory(core::errors::get_value(located), ec) || ec) {
            return fail(e.path.string() + " is not a directory");
        }
        return pass(e.path.string() + " is a directory");
    }

    VerificationOutcome operator()(const protocol::OutputContains& e) const {
        std::string missing;
        for (const auto& substring : e.substrings) {
            if (execution.stdout_text.find(substring) == std::string::npos) {
                missing += missing.empty() ? "\"" + substring + "\""
                                           : ", \"" + substring + "\"";
            }
        }
        if (!missing.empty()) {
            return fail("stdout is missing " + missing);
        }
        return pass("stdout contains all " + std::to_string(e.substrings.size()) +
                    " substrings");
    }

    VerificationOutcome operator()(const protocol::FilesEqual& e) const {
        auto located = locate(e.path);
        if (core::errors::is_error(located)) {
            return fail(core::errors::get_error(located).message);
        }
        auto reference = locate(e.reference_path);
        if (core::errors::is_error(reference)) {
            return fail(core::errors::get_error(reference).message);
        }
        const auto actual = read_file(core::errors::get_value(located));
        if (!actual.has_value()) {
            return fail("cannot read " + e.path.string());
        }
        const auto expected = read_file(core::errors::get_value(reference));
        if (!expected.has_value()) {
            return fail("cannot read " + e.reference_path.string());
        }
        if (actual.value() != expected.value()) {
            return fail(e.path.string() + " differs from " + e.reference_path.string());
        }
        return pass(e.path.string() + " equals " + e.reference_path.string());
    }
};

}  // namespace

Verifier::Verifier(std::filesystem::path sandbox_root) : sandbox_root_(std::move(sandbox_root)) {}

VerificationOutcome Verifier::verify(const ExecutionResult& execution,
                                     const Expectation& expectation) const {
    return std::visit(ExpectationChecker{sandbox_root_, execution}, expectation);
}

VerificationOutcome Verifier::verify_all(const ExecutionResult& execution,
                                         const std::vector<Expectation>& expectations) const {
    VerificationOutcome combined{true, ""};
    for (const auto& expectation : expectations) {
        const auto outcome = verify(execution, expectation);
        combined.passed = combined.passed && outcome.passed;
        if (!combined.detail.empty()) {
            combined.detail += "; ";
        }
        combined.detail += outcome.detail;
    }
    if (expectations.empty()) {
        combined.detail = "no expectations";
    }
    return combined;
}

}  // namespace cmdgate::verify
