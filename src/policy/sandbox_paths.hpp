#pragma once

#include <filesystem>
#include <string>
#include "core/errors/gate_errors.hpp"

namespace cmdgate::policy {

// Validates that the sandbox root exists and is a directory, then returns its
// canonical form. Every other function here expects that canonical form.
core::errors::Result<std::filesystem::path> canonical_sandbox_root(
    const std::filesystem::path& sandbox_root);

// Resolves a path word the way the shell would see it from `base_dir`:
// leading "~" expands to `home`, relative paths join `base_dir`, existing
// symlinks are followed and "."/".." are folded. Other tilde prefixes are
// not expanded; check has_unresolvable_tilde first.
std::filesystem::path resolve_path_word(const std::string& word,
                                        const std::filesystem::path& base_dir,
                                        const std::filesystem::path& home);

// "~name", "~+" and "~-" depend on the user database or the shell's
// directory stack and are never resolved.
bool has_unresolvable_tilde(const std::string& word);

// Lexical containment on already-resolved paths; the root counts as inside.
bool is_within_root(const std::filesystem::path& root,
                    const std::filesystem::path& child);

// Resolves `target_path` against the sandbox root and fails with
// "path_outside_sandbox" if it escapes.
core::errors::Result<std::filesystem::path> validate_path_in_sandbox(
    const std::filesystem::path& sandbox_root,
    const std::filesystem::path& target_path);

}  // namespace cmdgate::policy
