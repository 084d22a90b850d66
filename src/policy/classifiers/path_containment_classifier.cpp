#include "policy/classifiers/path_containment_classifier.hpp"

#include <vector>
#include "policy/command_paths.hpp"
#include "policy/sandbox_paths.hpp"

namespace cmdgate::policy {

using protocol::RejectionCategory;

std::optional<ContainmentViolation> find_containment_violation(
    const CommandAnalysis& analysis, const PolicyContext& context,
    const std::filesystem::path& start_dir) {
    const auto& root = context.sandbox_root;
    const auto& home = context.settings.home_directory;

    std::vector<std::filesystem::path> program_dirs;
    for (const auto& dir : context.settings.trusted_program_dirs) {
        program_dirs.push_back(resolve_path_word(dir, "/", home));
    }

    for (const auto& scoped : scoped_commands(analysis, start_dir, home)) {
        if (!is_within_root(root, scoped.base_dir)) {
            return ContainmentViolation{"Command runs in " + scoped.base_dir.string() +
                                            ", outside the sandbox root " + root.string() + ".",
                                        false};
        }
        for (const auto& operand : collect_path_operands(scoped.command)) {
            if (!operand.unresolvable.empty()) {
                return ContainmentViolation{operand.unresolvable, true};
            }
            if (operand.text.empty()) {
                continue;
            }
            if (operand.word.has_expansion) {
                return ContainmentViolation{"Path '" + operand.word.text +
                                                "' depends on a shell expansion and cannot be "
                                                "checked against the sandbox.",
                                            true};
            }
            if (has_unresolvable_tilde(operand.text)) {
                return ContainmentViolation{"Path '" + operand.text +
                                                "' uses a tilde prefix that cannot be resolved.",
                                            true};
            }
            if (context.is_allowed_external(operand.text)) {
                continue;
            }
            const auto resolved = resolve_path_word(operand.text, scoped.base_dir, home);
            if (is_within_root(root, resolved)) {
                continue;
            }
            if (operand.executes) {
                bool trusted = false;
                for (const auto& dir : program_dirs) {
                    trusted = trusted || is_within_root(dir, resolved);
                }
                if (trusted) {
                    continue;
                }
            }
            return ContainmentViolation{"Path '" + operand.text + "' resolves to " +
                                            resolved.string() + ", outside the sandbox root " +
                                            root.string() + ".",
                                        false};
        }
    }
    return std::nullopt;
}

std::string PathContainmentClassifier::name() const { return "path_containment"; }

std::optional<Rejection> PathContainmentClassifier::evaluate(
    const CommandAnalysis& analysis, const PolicyContext& context) const {
    if (auto violation = find_containment_violation(analysis, context, context.sandbox_root)) {
        return Rejection{RejectionCategory::Containment, violation->message};
    }
    return std::nullopt;
}

}  // namespace cmdgate::policy
