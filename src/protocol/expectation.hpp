#pragma once
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace cmdgate::protocol {

    // Post-conditions the verifier knows how to check. Paths are
    // sandbox-relative.
    struct FileContentEquals {
        std::filesystem::path path;
        std::string expected_text;
    };
    struct FileExists {
        std::filesystem::path path;
        std::optional<std::uintmax_t> expected_size;
    };
    struct FileAbsent { std::filesystem::path path; };
    struct DirectoryExists { std::filesystem::path path; };
    // Every substring must appear in captured stdout, in any order.
    struct OutputContains { std::vector<std::string> substrings; };
    // Byte-identical to another file in the sandbox (copy tasks).
    struct FilesEqual {
        std::filesystem::path path;
        std::filesystem::path reference_path;
    };

    using Expectation = std::variant<
        FileContentEquals,
        FileExists,
        FileAbsent,
        DirectoryExists,
        OutputContains,
        FilesEqual
    >;

    struct ExpectationDescriber {
        std::string operator()(const FileContentEquals& e) const {
            return "file_content_equals(" + e.path.string() + ")";
        }
        std::string operator()(const FileExists& e) const {
            if (e.expected_size.has_value()) {
                return "file_exists(" + e.path.string() + ", size=" +
                       std::to_string(e.expected_size.value()) + ")";
            }
            return "file_exists(" + e.path.string() + ")";
        }
        std::string operator()(const FileAbsent& e) const {
            return "file_absent(" + e.path.string() + ")";
        }
        std::string operator()(const DirectoryExists& e) const {
            return "directory_exists(" + e.path.string() + ")";
        }
        std::string operator()(const OutputContains& e) const {
            std::string joined;
            for (const auto& s : e.substrings) {
                if (!joined.empty()) {
                    joined += ", ";
                }
                joined += "\"" + s + "\"";
            }
            return "output_contains(" + joined + ")";
        }
        std::string operator()(const FilesEqual& e) const {
            return "files_equal(" + e.path.string() + ", " + e.reference_path.string() + ")";
        }
    };

    inline std::string describe(const Expectation& expectation) {
        return std::visit(ExpectationDescriber{}, expectation);
    }

} // namespace cmdgate::protocol
