#include "policy/classifiers/system_file_classifier.hpp"

#include "policy/command_paths.hpp"
#include "policy/sandbox_paths.hpp"

namespace cmdgate::policy {

using protocol::RejectionCategory;

std::string SystemFileClassifier::name() const { return "system_file"; }

std::optional<Rejection> SystemFileClassifier::evaluate(
    const CommandAnalysis& analysis, const PolicyContext& context) const {
    const auto& home = context.settings.home_directory;

    std::vector<std::filesystem::path> protected_paths;
    for (const auto& location : context.settings.protected_locations) {
        protected_paths.push_back(resolve_path_word(location, "/", home));
    }

    for (const auto& scoped : scoped_commands(analysis, context.sandbox_root, home)) {
        for (const auto& operand : collect_path_operands(scoped.command)) {
            if (!operand.writes || operand.text.empty()) {
                continue;
            }
            if (context.is_allowed_external(operand.text)) {
                continue;
            }
            const auto target = resolve_path_word(operand.text, scoped.base_dir, home);
            if (is_within_root(context.sandbox_root, target)) {
                continue;
            }
            for (const auto& location : protected_paths) {
                if (is_within_root(location, target)) {
                    const std::string how =
                        operand.from_redirection ? "redirection" : "'" + operand.verb + "'";
                    return Rejection{RejectionCategory::SystemFile,
                                     "Command writes to protected location " +
                                         target.string() + " via " + how + "."};
                }
            }
        }
    }
    return std::nullopt;
}

}  // namespace cmdgate::policy
