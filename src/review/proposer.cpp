#include "review/proposer.hpp"

#include <fstream>
#include <sstream>
#include <utility>
#include <nlohmann/json.hpp>
#include "core/logging/logger.hpp"

namespace cmdgate::review {

using core::errors::ErrorCategory;
using core::errors::GateError;
using nlohmann::json;
using protocol::CommandProposal;

void ScriptedProposer::add(const std::string& task_description, const std::string& command,
                           const std::string& rationale) {
    table_[task_description] = CommandProposal{"", command, rationale};
}

core::errors::Result<ScriptedProposer> ScriptedProposer::from_json_text(const std::string& text) {
    const json doc = json::parse(text, nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) {
        return GateError{ErrorCategory::Input, "Proposals file is not a JSON object.",
                         "invalid_proposals_json"};
    }
    if (!doc.contains("proposals") || !doc["proposals"].is_array()) {
        return GateError{ErrorCategory::Input, "Proposals file needs a \"proposals\" array.",
                         "invalid_proposals_json"};
    }

    ScriptedProposer proposer;
    std::size_t index = 0;
    for (const auto& entry : doc["proposals"]) {
        const std::string where = "proposals[" + std::to_string(index++) + "]";
        if (!entry.is_object() || !entry.contains("task") || !entry["task"].is_string() ||
            !entry.contains("command") || !entry["command"].is_string()) {
            return GateError{ErrorCategory::Input,
                             where + " needs string fields \"task\" and \"command\".",
                             "invalid_proposals_json"};
        }
        std::string rationale;
        if (entry.contains("rationale")) {
            if (!entry["rationale"].is_string()) {
                return GateError{ErrorCategory::Input, where + ".rationale must be a string.",
                                 "invalid_proposals_json"};
            }
            rationale = entry["rationale"].get<std::string>();
        }
        proposer.add(entry["task"].get<std::string>(), entry["command"].get<std::string>(),
                     rationale);
    }
    return proposer;
}

core::errors::Result<ScriptedProposer> ScriptedProposer::load(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        return GateError{ErrorCategory::Input, "Unable to open proposals file: " + path.string(),
                         "proposals_open_failed"};
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return from_json_text(buffer.str());
}

core::errors::Result<CommandProposal> ScriptedProposer::propose(
    const std::string& task_description, const std::string& /*context*/) const {
    const auto it = table_.find(task_description);
    if (it == table_.end()) {
        return GateError{ErrorCategory::Proposal,
                         "No scripted proposal for task: " + task_description,
                         "no_scripted_proposal"};
    }
    if (it->second.command.find_first_not_of(" \t\r\n") == std::string::npos) {
        return GateError{ErrorCategory::Proposal, "Scripted proposal is empty.",
                         "empty_proposal"};
    }
    return it->second;
}

GenerativeProposer::GenerativeProposer(std::shared_ptr<const TextGenerator> generator,
                                       const core::config::TargetPlatform platform,
                                       const std::uint32_t timeout_ms)
    : generator_(std::move(generator)), platform_(platform), timeout_ms_(timeout_ms) {}

std::string GenerativeProposer::build_prompt(const std::string& task_description,
                                             const std::string& context) const {
    std::ostringstream prompt;
    prompt << "You propose exactly one shell command that accomplishes the task below.\n"
           << "Rules:\n"
           << "- Output ONLY the raw command. No explanation, no markdown, no backticks.\n"
           << "- Operate only inside the working directory; never use absolute paths "
              "outside it and never use '..' to leave it.\n";
    if (platform_ == core::config::TargetPlatform::Bsd) {
        prompt << "- The target is macOS/BSD: edit files in place with sed -i '' "
                  "'s/old/new/' file.\n";
    } else {
        prompt << "- The target is GNU/Linux: edit files in place with sed -i "
                  "'s/old/new/' file (no suffix argument).\n";
    }
    prompt << "\nTask: " << task_description << "\n";
    if (!context.empty()) {
        prompt << "\nContext:\n" << context << "\n";
    }
    prompt << "\nCommand:\n";
    return prompt.str();
}

core::errors::Result<CommandProposal> GenerativeProposer::propose(
    const std::string& task_description, const std::string& context) const {
    if (!generator_) {
        return GateError{ErrorCategory::Proposal, "No text generator configured.",
                         "generator_not_configured"};
    }
    auto generated = generator_->generate(build_prompt(task_description, context), timeout_ms_);
    if (core::errors::is_error(generated)) {
        auto error = core::errors::get_error(generated);
        error.category = ErrorCategory::Proposal;
        return error;
    }

    std::string command = final_answer(core::errors::get_value(generated));
    // Single backticks around the whole command
    if (command.size() >= 2 && command.front() == '`' && command.back() == '`') {
        command = final_answer(command.substr(1, command.size() - 2));
    }
    // Models sometimes answer with {"command": ..., "description": ...}
    std::string rationale;
    if (!command.empty() && command.front() == '{') {
        const json doc = json::parse(command, nullptr, false);
        if (!doc.is_discarded() && doc.is_object() && doc.contains("command") &&
            doc["command"].is_string()) {
            command = doc["command"].get<std::string>();
            if (doc.contains("description") && doc["description"].is_string()) {
                rationale = doc["description"].get<std::string>();
            }
        }
    }

    if (command.find_first_not_of(" \t\r\n") == std::string::npos) {
        LOG_WARN("Proposer returned no command for task: " + task_description);
        return GateError{ErrorCategory::Proposal, "Proposer returned an empty command.",
                         "empty_proposal"};
    }
    LOG_DEBUG("Proposer suggested: " + command);
    return CommandProposal{"", command, rationale};
}

}  // namespace cmdgate::review
