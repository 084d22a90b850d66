#include "policy/classifiers/destructive_root_classifier.hpp"

#include "policy/command_paths.hpp"
#include "policy/sandbox_paths.hpp"

namespace cmdgate::policy {

using protocol::RejectionCategory;

namespace {

bool is_recursive_rm(const CommandView& view) {
    for (const auto* flag : view.flags) {
        const auto& text = flag->text;
        if (text == "--recursive") {
            return true;
        }
        if (text.rfind("--", 0) == 0) {
            continue;
        }
        if (text.find('r') != std::string::npos || text.find('R') != std::string::npos) {
            return true;
        }
    }
    return false;
}

bool has_flag(const CommandView& view, const std::string& name) {
    for (const auto* flag : view.flags) {
        if (flag->text == name) {
            return true;
        }
    }
    return false;
}

// "*", ".*", "**": a last component with nothing but wildcards (and dots).
bool is_bare_wildcard(const std::string& component) {
    bool has_star = false;
    for (const char c : component) {
        if (c == '*') {
            has_star = true;
        } else if (c != '.' && c != '?') {
            return false;
        }
    }
    return has_star;
}

std::optional<std::string> root_like_target(const ShellWord& word,
                                            const std::filesystem::path& base_dir,
                                            const PolicyContext& context) {
    const std::string& text = word.text;
    if (text.empty()) {
        return std::nullopt;
    }
    if (text == "." || text == "./") {
        return std::string("the current directory '.'");
    }
    if (text == "~" || text == "~/") {
        return std::string("the home directory '~'");
    }

    const auto& home = context.settings.home_directory;
    if (word.has_glob) {
        const auto slash = text.find_last_of('/');
        const std::string last = slash == std::string::npos ? text : text.substr(slash + 1);
        if (is_bare_wildcard(last)) {
            std::string dir = ".";
            if (slash == 0) {
                dir = "/";
            } else if (slash != std::string::npos) {
                dir = text.substr(0, slash);
            }
            const auto resolved_dir = resolve_path_word(dir, base_dir, home);
            if (is_within_root(resolved_dir, context.sandbox_root)) {
                return "the wildcard '" + text + "' at " + resolved_dir.string();
            }
        }
    }

    const auto resolved = resolve_path_word(text, base_dir, home);
    if (!resolved.has_relative_path()) {
        return "the filesystem root via '" + text + "'";
    }
    if (resolved == context.sandbox_root) {
        return "the sandbox root via '" + text + "'";
    }
    if (is_within_root(resolved, context.sandbox_root)) {
        return "an ancestor of the sandbox root via '" + text + "'";
    }
    if (resolved == resolve_path_word(".", home, home)) {
        return "the home directory via '" + text + "'";
    }
    return std::nullopt;
}

}  // namespace

std::string DestructiveRootClassifier::name() const { return "destructive_root"; }

std::optional<Rejection> DestructiveRootClassifier::evaluate(
    const CommandAnalysis& analysis, const PolicyContext& context) const {
    const auto commands =
        scoped_commands(analysis, context.sandbox_root, context.settings.home_directory);
    for (const auto& scoped : commands) {
        const CommandView view = view_of(scoped.command);
        bool destructive = false;
        if (view.verb == "rm") {
            if (has_flag(view, "--no-preserve-root")) {
                return Rejection{RejectionCategory::Safety,
                                 "rm --no-preserve-root disables the last safeguard "
                                 "against deleting '/'."};
            }
            destructive = is_recursive_rm(view);
        } else if (view.verb == "find") {
            destructive = has_flag(view, "-delete");
        }
        if (!destructive) {
            continue;
        }

        std::vector<const ShellWord*> targets;
        if (view.verb == "find") {
            for (const auto* operand : view.operands) {
                targets.push_back(operand);
            }
            // find's starting point defaults to "."
            if (view.operands.empty()) {
                static const ShellWord kDot{".", 0, false, false, false, false};
                targets.push_back(&kDot);
            }
        } else {
            targets = view.operands;
        }

        for (const auto* target : targets) {
            if (auto reason = root_like_target(*target, scoped.base_dir, context)) {
                return Rejection{RejectionCategory::Safety,
                                 "Recursive delete (" + view.verb + ") targets " +
                                     reason.value() + "."};
            }
        }
    }
    return std::nullopt;
}

}  // namespace cmdgate::policy
