#include "policy/classifiers/syntax_classifier.hpp"

#include "policy/command_paths.hpp"

namespace cmdgate::policy {

using protocol::RejectionCategory;

namespace {

bool is_shell(const std::string& verb) {
    return verb == "sh" || verb == "bash" || verb == "zsh" || verb == "dash" || verb == "ksh";
}

// First problem found in `analysis` or any `sh -c` payload it carries.
std::optional<std::string> first_problem(const CommandAnalysis& analysis, const int depth) {
    if (!analysis.well_formed) {
        if (analysis.syntax_errors.empty()) {
            return std::string("malformed command");
        }
        return analysis.syntax_errors.front();
    }
    if (analysis.commands.empty()) {
        return std::string("empty command");
    }
    if (depth >= kMaxUnwrapDepth) {
        return std::nullopt;
    }
    for (const auto& command : analysis.commands) {
        const CommandView view = view_of(command);
        if (!is_shell(view.verb)) {
            continue;
        }
        const auto& words = command.words;
        for (std::size_t i = view.verb_index + 1; i + 1 < words.size(); ++i) {
            const auto& text = words[i].text;
            if (text.size() < 2 || text[0] != '-' || text[1] == '-' ||
                text.find('c') == std::string::npos) {
                continue;
            }
            if (auto nested = first_problem(analyze_command(words[i + 1].text), depth + 1)) {
                return "in " + view.verb + " -c payload: " + nested.value();
            }
            break;
        }
    }
    return std::nullopt;
}

}  // namespace

std::string SyntaxClassifier::name() const { return "syntax"; }

std::optional<Rejection> SyntaxClassifier::evaluate(const CommandAnalysis& analysis,
                                                    const PolicyContext& /*context*/) const {
    if (auto problem = first_problem(analysis, 0)) {
        return Rejection{RejectionCategory::Syntax,
                         "Command is not well-formed: " + problem.value() + "."};
    }
    return std::nullopt;
}

}  // namespace cmdgate::policy
