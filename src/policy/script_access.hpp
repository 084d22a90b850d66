#pragma once

#include <string>
#include <vector>

namespace cmdgate::policy {

// Files a sed script opens on its own, outside the operands of the command.
struct ScriptFileAccess {
    std::vector<std::string> reads;   // r, R
    std::vector<std::string> writes;  // w, W and the w flag of s///
    bool runs_commands = false;       // e command or the e flag of s///
};

ScriptFileAccess sed_script_access(const std::string& script);

// True when an awk program redirects print output, reads with getline from
// a file or a command, pipes, or calls system(). The targets of these are
// expressions and are not resolved.
bool awk_program_does_io(const std::string& program);

}  // namespace cmdgate::policy
