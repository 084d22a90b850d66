#include "policy/classifiers/platform_compat_classifier.hpp"

#include <cctype>
#include "policy/command_paths.hpp"

namespace cmdgate::policy {

using core::config::TargetPlatform;
using protocol::RejectionCategory;

namespace {

std::string basename_of(const std::string& word) {
    const auto slash = word.find_last_of('/');
    return slash == std::string::npos ? word : word.substr(slash + 1);
}

// "-rP" matches rule "-P"; "--perl-regexp" only matches itself.
bool flag_matches(const std::string& word, const std::string& flag) {
    if (word == flag) {
        return true;
    }
    if (flag.size() != 2 || word.size() <= 2 || word[0] != '-' || word[1] == '-') {
        return false;
    }
    for (std::size_t i = 1; i < word.size(); ++i) {
        if (std::isalpha(static_cast<unsigned char>(word[i])) == 0) {
            return false;
        }
    }
    return word.find(flag[1]) != std::string::npos;
}

std::optional<std::string> check_sed(const SimpleCommand& command, const CommandView& view,
                                     const TargetPlatform platform) {
    const auto& words = command.words;
    for (std::size_t i = view.verb_index + 1; i < words.size(); ++i) {
        const std::string& text = words[i].text;
        if (text == "--") {
            break;
        }
        if (text.rfind("--in-place", 0) == 0) {
            if (platform == TargetPlatform::Bsd) {
                return std::string("BSD sed has no --in-place option; use -i ''.");
            }
            continue;
        }
        if (text.size() < 2 || text[0] != '-' || text[1] == '-') {
            continue;
        }
        const auto i_pos = text.find('i');
        if (i_pos == std::string::npos) {
            continue;
        }
        if (i_pos + 1 != text.size()) {
            continue;  // attached suffix, "-i.bak", accepted by both
        }
        const bool has_next = i + 1 < words.size();
        const bool next_is_suffix =
            has_next && (words[i + 1].text.empty() || words[i + 1].text[0] == '.');
        if (platform == TargetPlatform::Bsd && !next_is_suffix) {
            return std::string(
                "BSD sed -i requires a backup suffix argument; use sed -i '' ... to "
                "edit without a backup.");
        }
        if (platform == TargetPlatform::Gnu && next_is_suffix) {
            return "GNU sed reads the detached suffix '" + words[i + 1].text +
                   "' as the script; use sed -i without a suffix.";
        }
    }
    return std::nullopt;
}

std::optional<std::string> check_flag_rules(const SimpleCommand& command,
                                            const TargetPlatform platform) {
    const auto& words = command.words;
    for (const auto& rule : dialect_flag_rules()) {
        if (rule.only_on == platform) {
            continue;
        }
        for (std::size_t v = 0; v < words.size(); ++v) {
            if (words[v].quoted || basename_of(words[v].text) != rule.verb) {
                continue;
            }
            // find takes its primaries anywhere; other verbs stop at the first operand
            const bool scan_all = rule.verb == "find";
            for (std::size_t i = v + 1; i < words.size(); ++i) {
                const std::string& text = words[i].text;
                if (text == "--" || text == "-exec" || text == "-execdir") {
                    break;
                }
                if (text.empty() || text[0] != '-') {
                    if (scan_all) {
                        continue;
                    }
                    break;
                }
                if (flag_matches(text, rule.flag)) {
                    return rule.verb + " " + rule.flag + " is not available on " +
                           core::config::to_string(platform) + ": " + rule.note;
                }
            }
        }
    }
    return std::nullopt;
}

std::optional<std::string> check_long_options(const CommandView& view) {
    static const std::vector<std::string> kBsdShortOnly = {"ls", "cp", "mv", "rm", "mkdir",
                                                           "touch"};
    bool short_only = false;
    for (const auto& verb : kBsdShortOnly) {
        if (view.verb == verb) {
            short_only = true;
        }
    }
    if (!short_only) {
        return std::nullopt;
    }
    for (const auto* flag : view.flags) {
        if (flag->text.rfind("--", 0) == 0) {
            return "BSD " + view.verb + " does not accept long option " + flag->text + ".";
        }
    }
    return std::nullopt;
}

}  // namespace

const std::vector<DialectFlagRule>& dialect_flag_rules() {
    static const std::vector<DialectFlagRule> kRules = {
        {"grep", "-P", TargetPlatform::Gnu, "Perl regexps are a GNU grep extension."},
        {"find", "-printf", TargetPlatform::Gnu, "use -exec stat or -print instead."},
        {"xargs", "-r", TargetPlatform::Gnu, "BSD xargs skips empty input by default."},
        {"stat", "-c", TargetPlatform::Gnu, "BSD stat formats with -f."},
        {"date", "-d", TargetPlatform::Gnu, "BSD date adjusts with -v or parses with -j -f."},
        {"readlink", "-f", TargetPlatform::Gnu, "older BSD readlink has no -f."},
        {"stat", "-f", TargetPlatform::Bsd, "GNU stat -f reports file system status."},
        {"date", "-v", TargetPlatform::Bsd, "GNU date adjusts with -d."},
    };
    return kRules;
}

std::string PlatformCompatClassifier::name() const { return "platform_compat"; }

std::optional<Rejection> PlatformCompatClassifier::evaluate(
    const CommandAnalysis& analysis, const PolicyContext& context) const {
    const TargetPlatform platform = context.settings.platform;
    const auto commands =
        scoped_commands(analysis, context.sandbox_root, context.settings.home_directory);
    for (const auto& scoped : commands) {
        const CommandView view = view_of(scoped.command);
        std::optional<std::string> problem;
        if (view.verb == "sed") {
            problem = check_sed(scoped.command, view, platform);
        }
        if (!problem) {
            problem = check_flag_rules(scoped.command, platform);
        }
        if (!problem && platform == TargetPlatform::Bsd) {
            problem = check_long_options(view);
        }
        if (problem) {
            return Rejection{RejectionCategory::Portability, problem.value()};
        }
    }
    return std::nullopt;
}

}  // namespace cmdgate::policy
