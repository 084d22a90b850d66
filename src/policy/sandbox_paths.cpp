#include "policy/sandbox_paths.hpp"

#include <system_error>

namespace cmdgate::policy {

using core::errors::ErrorCategory;
using core::errors::GateError;

namespace {

// "/a/b/" iterates as {"/", "a", "b", ""}; drop the trailing empty element.
std::filesystem::path without_trailing_separator(const std::filesystem::path& path) {
    if (path.has_relative_path() && !path.has_filename()) {
        return path.parent_path();
    }
    return path;
}

std::filesystem::path resolve(const std::filesystem::path& candidate) {
    std::error_code ec;
    auto resolved = std::filesystem::weakly_canonical(candidate, ec);
    if (ec) {
        return candidate.lexically_normal();
    }
    return resolved;
}

}  // namespace

core::errors::Result<std::filesystem::path> canonical_sandbox_root(
    const std::filesystem::path& sandbox_root) {
    std::error_code ec;
    if (!std::filesystem::exists(sandbox_root, ec) || ec) {
        return GateError{ErrorCategory::Input,
                         "Sandbox root does not exist: " + sandbox_root.string(),
                         "invalid_sandbox_root"};
    }
    if (!std::filesystem::is_directory(sandbox_root, ec) || ec) {
        return GateError{ErrorCategory::Input,
                         "Sandbox root is not a directory: " + sandbox_root.string(),
                         "invalid_sandbox_root"};
    }

    const std::filesystem::path canonical_root =
        std::filesystem::weakly_canonical(std::filesystem::absolute(sandbox_root, ec), ec);
    if (ec) {
        return GateError{ErrorCategory::Input,
                         "Unable to resolve sandbox root: " + sandbox_root.string(),
                         "invalid_sandbox_root"};
    }
    return without_trailing_separator(canonical_root);
}

std::filesystem::path resolve_path_word(const std::string& word,
                                        const std::filesystem::path& base_dir,
                                        const std::filesystem::path& home) {
    std::filesystem::path candidate;
    if (word == "~") {
        candidate = home;
    } else if (word.rfind("~/", 0) == 0) {
        candidate = home / word.substr(2);
    } else {
        candidate = std::filesystem::path(word);
    }
    if (candidate.is_relative()) {
        candidate = base_dir / candidate;
    }
    return without_trailing_separator(resolve(candidate));
}

bool has_unresolvable_tilde(const std::string& word) {
    return word.size() > 1 && word[0] == '~' && word[1] != '/';
}

bool is_within_root(const std::filesystem::path& root,
                    const std::filesystem::path& child) {
    const auto normal_root = without_trailing_separator(root.lexically_normal());
    const auto normal_child = without_trailing_separator(child.lexically_normal());
    auto root_it = normal_root.begin();
    auto child_it = normal_child.begin();
    for (; root_it != normal_root.end() && child_it != normal_child.end();
         ++root_it, ++child_it) {
        if (*root_it != *child_it) {
            return false;
        }
    }
    return root_it == normal_root.end();
}

core::errors::Result<std::filesystem::path> validate_path_in_sandbox(
    const std::filesystem::path& sandbox_root,
    const std::filesystem::path& target_path) {
    auto root_result = canonical_sandbox_root(sandbox_root);
    if (core::errors::is_error(root_result)) {
        return core::errors::get_error(root_result);
    }
    const auto& canonical_root = core::errors::get_value(root_result);

    std::filesystem::path candidate = target_path;
    if (candidate.is_relative()) {
        candidate = canonical_root / candidate;
    }
    const auto canonical_candidate = without_trailing_separator(resolve(candidate));

    if (!is_within_root(canonical_root, canonical_candidate)) {
        return GateError{ErrorCategory::SandboxViolation,
                         "Path escapes sandbox root: " + canonical_candidate.string(),
                         "path_outside_sandbox"};
    }
    return canonical_candidate;
}

}  // namespace cmdgate::policy
