#include "policy/command_paths.hpp"

#include <cctype>
#include <optional>
#include <unordered_set>
#include <utility>
#include "policy/sandbox_paths.hpp"
#include "policy/script_access.hpp"

namespace cmdgate::policy {

namespace {

const std::unordered_set<std::string> kWrapperVerbs = {
    "sudo", "doas", "env", "nice", "nohup", "timeout", "command",
    "exec", "time", "xargs", "stdbuf", "ionice", "builtin"};

const std::unordered_set<std::string> kShellVerbs = {"sh", "bash", "zsh", "dash", "ksh"};

// Verbs whose operands are data, never paths.
const std::unordered_set<std::string> kDataVerbs = {"echo", "printf", "true", "false",
                                                    ":", "export", "alias", "read"};

// Verbs whose first operand is a program or pattern unless -e/-f supplies it.
const std::unordered_set<std::string> kScriptVerbs = {
    "sed", "gsed", "awk", "gawk", "mawk", "nawk", "grep", "egrep", "fgrep", "rg"};

const std::unordered_set<std::string> kAllOperandsWritten = {
    "tee", "touch", "truncate", "rm", "rmdir", "mkdir", "unlink", "shred"};

const std::unordered_set<std::string> kModeFirstVerbs = {"chmod", "chown", "chgrp"};

const std::unordered_set<std::string> kCopyVerbs = {"cp", "mv", "install", "ln"};

std::string basename_of(const std::string& word) {
    const auto slash = word.find_last_of('/');
    if (slash == std::string::npos) {
        return word;
    }
    return word.substr(slash + 1);
}

bool is_flag(const std::string& text) {
    return text.size() > 1 && text[0] == '-';
}

bool is_assignment(const ShellWord& word) {
    const auto eq = word.text.find('=');
    if (eq == std::string::npos || eq == 0) {
        return false;
    }
    if (std::isdigit(static_cast<unsigned char>(word.text[0])) != 0) {
        return false;
    }
    for (std::size_t i = 0; i < eq; ++i) {
        const char c = word.text[i];
        if (std::isalnum(static_cast<unsigned char>(c)) == 0 && c != '_') {
            return false;
        }
    }
    return true;
}

enum class OptionValue { None, Plain, Directory, ReadPath, Opaque };

// What an option of `program` consumes. Directory: the wrapped command runs
// there. Opaque: the value is split into more arguments (env -S).
OptionValue option_value(const std::string& program, const std::string& name) {
    if (program == "sudo") {
        if (name == "-D" || name == "--chdir") {
            return OptionValue::Directory;
        }
        if (name == "-u" || name == "-g" || name == "-C" || name == "-h" || name == "-p" ||
            name == "-U" || name == "--user" || name == "--group" || name == "--host" ||
            name == "--prompt" || name == "--other-user" || name == "--close-from") {
            return OptionValue::Plain;
        }
    } else if (program == "doas") {
        if (name == "-C") {
            return OptionValue::ReadPath;
        }
        if (name == "-u") {
            return OptionValue::Plain;
        }
    } else if (program == "env") {
        if (name == "-C" || name == "--chdir") {
            return OptionValue::Directory;
        }
        if (name == "-S" || name == "--split-string") {
            return OptionValue::Opaque;
        }
        if (name == "-u" || name == "--unset") {
            return OptionValue::Plain;
        }
    } else if (program == "xargs") {
        if (name == "-a" || name == "--arg-file") {
            return OptionValue::ReadPath;
        }
        if (name == "-I" || name == "-n" || name == "-P" || name == "-L" || name == "-d" ||
            name == "-E" || name == "-s" || name == "--max-args" || name == "--max-procs" ||
            name == "--max-lines" || name == "--delimiter" || name == "--max-chars") {
            return OptionValue::Plain;
        }
    } else if (program == "nice" || program == "ionice") {
        if (name == "-n" || name == "-c" || name == "-p" || name == "--adjustment" ||
            name == "--class" || name == "--classdata") {
            return OptionValue::Plain;
        }
    } else if (program == "timeout") {
        if (name == "-s" || name == "-k" || name == "--signal" || name == "--kill-after") {
            return OptionValue::Plain;
        }
    } else if (program == "stdbuf") {
        if (name == "-i" || name == "-o" || name == "-e" || name == "--input" ||
            name == "--output" || name == "--error") {
            return OptionValue::Plain;
        }
    } else if (program == "git") {
        if (name == "-C") {
            return OptionValue::Directory;
        }
    } else if (program == "make" || program == "gmake") {
        if (name == "-C" || name == "--directory") {
            return OptionValue::Directory;
        }
    }
    return OptionValue::None;
}

struct ParsedOption {
    OptionValue kind = OptionValue::None;
    std::string name;
    std::optional<std::string> attached;  // "--name=value", "-Xvalue"
};

// Short options may be clustered; the first one that takes a value ends the
// cluster and the rest of the word, if any, is that value.
ParsedOption parse_option(const std::string& program, const std::string& text) {
    ParsedOption option;
    if (text.rfind("--", 0) == 0) {
        const auto eq = text.find('=');
        option.name = text.substr(0, eq);
        option.kind = option_value(program, option.name);
        if (eq != std::string::npos) {
            option.attached = text.substr(eq + 1);
        }
        return option;
    }
    for (std::size_t k = 1; k < text.size(); ++k) {
        option.name = std::string("-") + text[k];
        option.kind = option_value(program, option.name);
        if (option.kind != OptionValue::None) {
            if (k + 1 < text.size()) {
                option.attached = text.substr(k + 1);
            }
            return option;
        }
    }
    return ParsedOption{};
}

PathOperand make_operand(const ShellWord& word, const std::string& text,
                         const std::string& verb, const bool writes) {
    PathOperand operand;
    operand.text = text;
    operand.word = word;
    operand.verb = verb;
    operand.writes = writes;
    return operand;
}

PathOperand program_operand(const ShellWord& word) {
    PathOperand operand = make_operand(word, word.text, basename_of(word.text), false);
    operand.executes = true;
    return operand;
}

void record_option_value(CommandView& view, const std::string& program,
                         const ParsedOption& option, const ShellWord& word,
                         const std::string& value) {
    switch (option.kind) {
    case OptionValue::Directory:
        view.directory_changes.push_back(make_operand(word, value, program, false));
        break;
    case OptionValue::ReadPath:
        view.wrapper_paths.push_back(make_operand(word, value, program, false));
        break;
    case OptionValue::Opaque: {
        PathOperand operand = make_operand(word, value, program, false);
        operand.unresolvable = "'" + program + " " + option.name +
                               "' builds an argument list that cannot be checked.";
        view.wrapper_paths.push_back(std::move(operand));
        break;
    }
    default:
        break;
    }
}

bool looks_like_path(const std::string& value) {
    return value.find('/') != std::string::npos || value.rfind('~', 0) == 0 ||
           value == "." || value == "..";
}

bool is_sed(const std::string& verb) { return verb == "sed" || verb == "gsed"; }

bool is_awk(const std::string& verb) {
    return verb == "awk" || verb == "gawk" || verb == "mawk" || verb == "nawk";
}

bool is_grep(const std::string& verb) {
    return verb == "grep" || verb == "egrep" || verb == "fgrep" || verb == "rg";
}

// -e/-f (and long forms) supply the program, so no operand is consumed as one.
bool supplies_script(const std::string& verb, const std::string& flag) {
    if (is_sed(verb)) {
        return flag == "-e" || flag == "-f" || flag.rfind("--expression", 0) == 0 ||
               flag.rfind("--file", 0) == 0;
    }
    if (is_awk(verb)) {
        return flag == "-f" || flag.rfind("--file", 0) == 0;
    }
    if (is_grep(verb)) {
        return flag == "-e" || flag == "-f" || flag.rfind("--regexp", 0) == 0 ||
               flag.rfind("--file", 0) == 0;
    }
    return false;
}

// Flags whose next word is a script/pattern/assignment, not a path.
bool flag_takes_non_path(const std::string& verb, const std::string& flag) {
    if (is_sed(verb) || is_grep(verb)) {
        return flag == "-e";
    }
    if (is_awk(verb)) {
        return flag == "-v" || flag == "-F";
    }
    if (verb == "head" || verb == "tail") {
        return flag == "-n" || flag == "-c";
    }
    if (verb == "cut") {
        return flag == "-d" || flag == "-f" || flag == "-c";
    }
    if (verb == "sort") {
        return flag == "-k" || flag == "-t";
    }
    return false;
}

// Flags whose next word is a path; the bool says whether it is written.
bool flag_takes_path(const std::string& verb, const std::string& flag, bool& writes) {
    writes = false;
    if ((is_sed(verb) || is_awk(verb) || is_grep(verb)) && flag == "-f") {
        return true;
    }
    if (kCopyVerbs.count(verb) != 0 && flag == "-t") {
        writes = true;
        return true;
    }
    if (verb == "sort" && flag == "-o") {
        writes = true;
        return true;
    }
    if (verb == "tar" && (flag == "-f" || flag == "-C")) {
        return true;
    }
    return false;
}

// "-i", "-Ei", "-ni" end the short-option cluster with i: the suffix (BSD)
// or nothing (GNU) follows. "-i.bak" carries an attached suffix.
bool sed_in_place_flag(const std::string& flag, bool& detached) {
    detached = false;
    if (flag.rfind("--in-place", 0) == 0) {
        return true;
    }
    if (flag.rfind("--", 0) == 0) {
        return false;
    }
    const auto i_pos = flag.find('i');
    if (i_pos == std::string::npos) {
        return false;
    }
    detached = i_pos + 1 == flag.size();
    return true;
}

void push_operand(std::vector<PathOperand>& out, const ShellWord& word,
                  const std::string& text, const std::string& verb, const bool writes) {
    out.push_back(make_operand(word, text, verb, writes));
}

void push_unresolvable(std::vector<PathOperand>& out, const ShellWord& word,
                       const std::string& verb, const std::string& reason) {
    PathOperand operand = make_operand(word, word.text, verb, false);
    operand.unresolvable = reason;
    out.push_back(std::move(operand));
}

// Files named inside a sed script or opened by an awk program.
void collect_script_access(const std::string& verb, const ShellWord& word,
                           const std::string& script, std::vector<PathOperand>& out) {
    if (is_sed(verb)) {
        const ScriptFileAccess access = sed_script_access(script);
        for (const auto& path : access.reads) {
            push_operand(out, word, path, verb, false);
        }
        for (const auto& path : access.writes) {
            push_operand(out, word, path, verb, true);
        }
        if (access.runs_commands) {
            push_unresolvable(out, word, verb,
                              "sed script '" + script + "' runs shell commands.");
        }
    } else if (is_awk(verb) && awk_program_does_io(script)) {
        push_unresolvable(out, word, verb,
                          "awk program '" + script + "' opens files or commands itself.");
    }
}

// sed -f / awk -f: the program text is not known at review time.
void push_program_file(std::vector<PathOperand>& out, const ShellWord& word,
                       const std::string& path, const std::string& verb) {
    PathOperand operand = make_operand(word, path, verb, false);
    operand.unresolvable = "Program file '" + path + "' of '" + verb +
                           "' may open files that cannot be checked.";
    out.push_back(std::move(operand));
}

bool find_reference_test(const std::string& text) {
    if (text == "-newer" || text == "-anewer" || text == "-cnewer" || text == "-samefile") {
        return true;
    }
    // -newerXY compares against file Y unless Y is 't' (a timestamp).
    return text.size() == 8 && text.rfind("-newer", 0) == 0 && text[7] != 't';
}

void collect_find_operands(const SimpleCommand& command, const CommandView& view,
                           std::vector<PathOperand>& out) {
    const auto& words = command.words;
    std::size_t i = view.verb_index + 1;
    for (; i < words.size(); ++i) {
        const auto& text = words[i].text;
        if (text == "-H" || text == "-L" || text == "-P" || text.rfind("-O", 0) == 0) {
            continue;
        }
        if (text == "-D") {
            ++i;
            continue;
        }
        break;
    }
    for (; i < words.size(); ++i) {
        const auto& text = words[i].text;
        if (text.empty() || text[0] == '-' || text == "(" || text == "!") {
            break;
        }
        push_operand(out, words[i], text, view.verb, false);
    }

    for (; i < words.size(); ++i) {
        const auto& text = words[i].text;
        if (text == "-exec" || text == "-execdir" || text == "-ok" || text == "-okdir") {
            while (i + 1 < words.size() && words[i + 1].text != ";" && words[i + 1].text != "+") {
                ++i;
            }
            ++i;
            continue;
        }
        if (i + 1 >= words.size()) {
            break;
        }
        if (text == "-fprint" || text == "-fprint0" || text == "-fls" || text == "-fprintf") {
            push_operand(out, words[i + 1], words[i + 1].text, view.verb, true);
            i += text == "-fprintf" ? 2 : 1;
        } else if (find_reference_test(text) || text == "-files0-from") {
            push_operand(out, words[i + 1], words[i + 1].text, view.verb, false);
            ++i;
        }
    }
}

void append_scoped(const std::vector<SimpleCommand>& commands, std::filesystem::path& base,
                   const int depth, const std::filesystem::path& home,
                   std::vector<ScopedCommand>& out);

// Bodies of $(...) and `...` inside a word, outermost first.
std::vector<std::string> substitution_payloads(const std::string& text) {
    std::vector<std::string> payloads;
    for (std::size_t i = 0; i < text.size(); ++i) {
        if (text[i] == '$' && i + 1 < text.size() && text[i + 1] == '(') {
            int depth = 0;
            std::size_t j = i + 1;
            for (; j < text.size(); ++j) {
                if (text[j] == '(') ++depth;
                if (text[j] == ')' && --depth == 0) break;
            }
            payloads.push_back(text.substr(i + 2, j - i - 2));
            i = j;
        } else if (text[i] == '`') {
            const auto close = text.find('`', i + 1);
            const auto end = close == std::string::npos ? text.size() : close;
            payloads.push_back(text.substr(i + 1, end - i - 1));
            i = end;
        }
    }
    return payloads;
}

void append_substitutions(const SimpleCommand& command, const std::filesystem::path& base,
                          const int depth, const std::filesystem::path& home,
                          std::vector<ScopedCommand>& out) {
    std::vector<const ShellWord*> words;
    for (const auto& word : command.words) words.push_back(&word);
    for (const auto& redirection : command.redirections) words.push_back(&redirection.target);
    for (const auto* word : words) {
        if (!word->has_expansion) {
            continue;
        }
        for (const auto& payload : substitution_payloads(word->text)) {
            const auto nested = analyze_command(payload);
            std::filesystem::path nested_base = base;
            append_scoped(nested.commands, nested_base, depth + 1, home, out);
        }
    }
}

void append_nested(const SimpleCommand& command, const CommandView& view,
                   const std::filesystem::path& base, const int depth,
                   const std::filesystem::path& home, std::vector<ScopedCommand>& out) {
    const auto& words = command.words;
    if (kShellVerbs.count(view.verb) != 0) {
        for (std::size_t i = view.verb_index + 1; i < words.size(); ++i) {
            const auto& text = words[i].text;
            if (!is_flag(text) || text.rfind("--", 0) == 0 ||
                text.find('c') == std::string::npos) {
                continue;
            }
            if (i + 1 < words.size()) {
                const auto nested = analyze_command(words[i + 1].text);
                std::filesystem::path nested_base = base;
                append_scoped(nested.commands, nested_base, depth + 1, home, out);
            }
            return;
        }
        return;
    }
    if (view.verb == "find") {
        for (std::size_t i = view.verb_index + 1; i < words.size(); ++i) {
            const auto& text = words[i].text;
            if (text != "-exec" && text != "-execdir" && text != "-ok" && text != "-okdir") {
                continue;
            }
            SimpleCommand nested;
            std::size_t j = i + 1;
            for (; j < words.size(); ++j) {
                if (words[j].text == ";" || words[j].text == "+") {
                    break;
                }
                nested.words.push_back(words[j]);
            }
            if (!nested.empty()) {
                std::filesystem::path nested_base = base;
                append_scoped({nested}, nested_base, depth + 1, home, out);
            }
            i = j;
        }
    }
}

void append_scoped(const std::vector<SimpleCommand>& commands, std::filesystem::path& base,
                   const int depth, const std::filesystem::path& home,
                   std::vector<ScopedCommand>& out) {
    for (const auto& command : commands) {
        const CommandView view = view_of(command);
        std::filesystem::path command_base = base;
        for (const auto& change : view.directory_changes) {
            command_base = resolve_path_word(change.text, command_base, home);
        }
        out.push_back(ScopedCommand{command, command_base, depth});
        if (view.verb == "cd" || view.verb == "pushd") {
            if (view.operands.empty() || view.operands.front()->text == "-") {
                base = home;
            } else {
                base = resolve_path_word(view.operands.front()->text, base, home);
            }
        }
        if (depth < kMaxUnwrapDepth) {
            append_nested(command, view, command_base, depth, home, out);
            append_substitutions(command, base, depth, home, out);
        }
    }
}

}  // namespace

CommandView view_of(const SimpleCommand& command) {
    CommandView view;
    const auto& words = command.words;
    std::size_t i = 0;
    int depth = 0;
    while (i < words.size()) {
        if (is_assignment(words[i])) {
            ++i;
            continue;
        }
        const std::string base = basename_of(words[i].text);
        if (kWrapperVerbs.count(base) == 0 || depth >= kMaxUnwrapDepth) {
            break;
        }
        ++depth;
        if (words[i].text.find('/') != std::string::npos) {
            view.wrapper_paths.push_back(program_operand(words[i]));
        }
        ++i;
        while (i < words.size()) {
            const auto& text = words[i].text;
            if (is_flag(text)) {
                const ParsedOption option = parse_option(base, text);
                const ShellWord& flag_word = words[i];
                ++i;
                if (option.kind == OptionValue::None) {
                    continue;
                }
                if (option.attached) {
                    record_option_value(view, base, option, flag_word, *option.attached);
                } else if (i < words.size()) {
                    record_option_value(view, base, option, words[i], words[i].text);
                    ++i;
                }
                continue;
            }
            if (base == "env" && is_assignment(words[i])) {
                ++i;
                continue;
            }
            break;
        }
        if (base == "timeout" && i < words.size()) {
            ++i;  // duration
        }
    }

    view.verb_index = i;
    if (i >= words.size()) {
        return view;
    }
    view.verb = basename_of(words[i].text);

    bool end_of_flags = false;
    for (std::size_t j = i + 1; j < words.size(); ++j) {
        const auto& word = words[j];
        if (!end_of_flags && word.text == "--") {
            end_of_flags = true;
            continue;
        }
        if (!end_of_flags && is_flag(word.text)) {
            view.flags.push_back(&word);
            // git -C only counts before the subcommand (git commit -C reuses a message).
            if (view.verb == "git" && !view.operands.empty()) {
                continue;
            }
            const ParsedOption option = parse_option(view.verb, word.text);
            if (option.kind != OptionValue::Directory) {
                continue;
            }
            if (option.attached) {
                record_option_value(view, view.verb, option, word, *option.attached);
            } else if (j + 1 < words.size()) {
                record_option_value(view, view.verb, option, words[j + 1], words[j + 1].text);
                ++j;
            }
        } else {
            view.operands.push_back(&word);
        }
    }
    return view;
}

std::vector<PathOperand> collect_path_operands(const SimpleCommand& command) {
    std::vector<PathOperand> out;
    const CommandView view = view_of(command);

    for (const auto& redirection : command.redirections) {
        if (redirection.op.rfind("<<", 0) == 0) {
            continue;  // here-doc delimiter / here-string
        }
        if (redirection.target.text.empty() && !redirection.target.quoted) {
            continue;  // fd duplication
        }
        PathOperand operand;
        operand.text = redirection.target.text;
        operand.word = redirection.target;
        operand.verb = view.verb;
        operand.writes = redirection.writes;
        operand.from_redirection = true;
        out.push_back(std::move(operand));
    }

    out.insert(out.end(), view.directory_changes.begin(), view.directory_changes.end());
    out.insert(out.end(), view.wrapper_paths.begin(), view.wrapper_paths.end());

    const auto& words = command.words;
    if (view.verb_index >= words.size()) {
        return out;
    }
    if (words[view.verb_index].text.find('/') != std::string::npos) {
        out.push_back(program_operand(words[view.verb_index]));
    }
    if (kDataVerbs.count(view.verb) != 0) {
        return out;
    }
    const std::string& verb = view.verb;
    if (verb == "find") {
        collect_find_operands(command, view, out);
        return out;
    }

    bool script_pending = kScriptVerbs.count(verb) != 0;
    if (script_pending) {
        for (const auto* flag : view.flags) {
            if (supplies_script(verb, flag->text)) {
                script_pending = false;
                break;
            }
        }
    }

    bool in_place = false;
    bool end_of_flags = false;
    std::vector<const ShellWord*> operand_words;
    for (std::size_t j = view.verb_index + 1; j < words.size(); ++j) {
        const ShellWord& word = words[j];
        const std::string& text = word.text;
        if (!end_of_flags && text == "--") {
            end_of_flags = true;
            continue;
        }
        if (!end_of_flags && is_flag(text)) {
            const auto eq = text.find('=');
            if (text.rfind("--", 0) == 0 && eq != std::string::npos) {
                const std::string name = text.substr(0, eq);
                const std::string value = text.substr(eq + 1);
                if (is_sed(verb) && name == "--expression") {
                    collect_script_access(verb, word, value, out);
                    continue;
                }
                if ((is_sed(verb) || is_awk(verb)) && name == "--file") {
                    push_program_file(out, word, value, verb);
                    continue;
                }
                if (looks_like_path(value)) {
                    const bool writes = text.rfind("--target-directory", 0) == 0 ||
                                        text.rfind("--output", 0) == 0;
                    push_operand(out, word, value, verb, writes);
                }
                continue;
            }
            bool detached = false;
            if (is_sed(verb) && sed_in_place_flag(text, detached)) {
                in_place = true;
                if (detached && j + 1 < words.size() &&
                    (words[j + 1].text.empty() || words[j + 1].text[0] == '.')) {
                    ++j;  // BSD backup suffix, e.g. '' or .bak
                }
                continue;
            }
            if (flag_takes_non_path(verb, text)) {
                if (text == "-e" && j + 1 < words.size()) {
                    collect_script_access(verb, words[j + 1], words[j + 1].text, out);
                }
                ++j;
                continue;
            }
            bool writes = false;
            if (flag_takes_path(verb, text, writes)) {
                if (j + 1 < words.size()) {
                    if ((is_sed(verb) || is_awk(verb)) && text == "-f") {
                        push_program_file(out, words[j + 1], words[j + 1].text, verb);
                    } else {
                        push_operand(out, words[j + 1], words[j + 1].text, verb, writes);
                    }
                    ++j;
                }
                continue;
            }
            continue;
        }
        if (verb == "dd") {
            if (text.rfind("if=", 0) == 0) {
                push_operand(out, word, text.substr(3), verb, false);
            } else if (text.rfind("of=", 0) == 0) {
                push_operand(out, word, text.substr(3), verb, true);
            }
            continue;
        }
        if (script_pending) {
            script_pending = false;
            collect_script_access(verb, word, text, out);
            continue;
        }
        if (text.find("://") != std::string::npos) {
            continue;
        }
        operand_words.push_back(&word);
    }

    std::size_t first = 0;
    if (kModeFirstVerbs.count(verb) != 0) {
        first = 1;
    }
    for (std::size_t k = first; k < operand_words.size(); ++k) {
        bool writes = false;
        if (kAllOperandsWritten.count(verb) != 0 || kModeFirstVerbs.count(verb) != 0) {
            writes = true;
        } else if (kCopyVerbs.count(verb) != 0) {
            writes = operand_words.size() > 1 && k + 1 == operand_words.size();
        } else if (is_sed(verb)) {
            writes = in_place;
        }
        push_operand(out, *operand_words[k], operand_words[k]->text, verb, writes);
    }
    return out;
}

std::vector<ScopedCommand> scoped_commands(const CommandAnalysis& analysis,
                                           const std::filesystem::path& sandbox_root,
                                           const std::filesystem::path& home) {
    std::vector<ScopedCommand> out;
    std::filesystem::path base = sandbox_root;
    append_scoped(analysis.commands, base, 0, home, out);
    return out;
}

}  // namespace cmdgate::policy
