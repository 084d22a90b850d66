#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>
#include "policy/shell_lexer.hpp"

namespace cmdgate::policy {

// Wrapper verbs (sudo, env, nice, ...) are peeled off until this depth.
constexpr int kMaxUnwrapDepth = 8;

// A word that names a filesystem location.
struct PathOperand {
    std::string text;         // the path part (value of --opt=VALUE, of=VALUE, ...)
    ShellWord word;
    std::string verb;
    bool writes = false;
    bool from_redirection = false;
    bool executes = false;    // run as a program, e.g. ./build.sh
    std::string unresolvable; // non-empty when the location cannot be known statically
};

// The real verb of a simple command after wrappers and leading NAME=VALUE
// assignments, with its remaining words split into flags and operands.
struct CommandView {
    std::string verb;                       // basename, e.g. "rm"
    std::size_t verb_index = 0;             // == words.size() when there is no verb
    std::vector<const ShellWord*> flags;    // words starting with '-' before "--"
    std::vector<const ShellWord*> operands; // everything else after the verb
    // Directories the verb runs in (env -C, sudo -D, git -C, make -C), in order.
    std::vector<PathOperand> directory_changes;
    // Paths consumed by wrapper words themselves (xargs -a, ../bin/env).
    std::vector<PathOperand> wrapper_paths;
};

CommandView view_of(const SimpleCommand& command);

// Operands, option values and redirection targets that are paths. Scripts
// (sed/awk programs, grep patterns), echo/printf data and URLs are skipped,
// but files a sed script opens are reported, and awk programs doing their
// own I/O are reported as unresolvable.
std::vector<PathOperand> collect_path_operands(const SimpleCommand& command);

// A simple command plus the directory its relative paths resolve against.
struct ScopedCommand {
    SimpleCommand command;
    std::filesystem::path base_dir;
    int depth = 0;  // 0 for top level, >0 for sh -c / find -exec payloads
};

// Flattens the analysis into simple commands in execution order, including
// nested `sh -c '...'` and `find -exec ... ;` payloads, and tracks `cd` and
// per-command directory changes so every command resolves against the
// directory it would really run in.
std::vector<ScopedCommand> scoped_commands(const CommandAnalysis& analysis,
                                           const std::filesystem::path& sandbox_root,
                                           const std::filesystem::path& home);

}  // namespace cmdgate::policy
