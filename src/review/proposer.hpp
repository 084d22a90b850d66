#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <string>
#include "core/config/gate_config.hpp"
#include "core/errors/gate_errors.hpp"
#include "protocol/command_contract.hpp"
#include "review/text_generator.hpp"

namespace cmdgate::review {

// Turns a task description into one shell command. Failures and empty
// output are ErrorCategory::Proposal errors.
class Proposer {
public:
    virtual ~Proposer() = default;
    virtual core::errors::Result<protocol::CommandProposal> propose(
        const std::string& task_description, const std::string& context) const = 0;
};

// Fixed task -> command table, e.g. for replaying known proposals.
class ScriptedProposer : public Proposer {
public:
    ScriptedProposer() = default;

    void add(const std::string& task_description, const std::string& command,
             const std::string& rationale = "");

    // {"proposals": [{"task": "...", "command": "...", "rationale": "..."}]}
    static core::errors::Result<ScriptedProposer> from_json_text(const std::string& text);
    static core::errors::Result<ScriptedProposer> load(const std::filesystem::path& path);

    core::errors::Result<protocol::CommandProposal> propose(
        const std::string& task_description, const std::string& context) const override;

    std::size_t size() const { return table_.size(); }

private:
    std::map<std::string, protocol::CommandProposal> table_;
};

// Prompts a text generator for a single raw command.
class GenerativeProposer : public Proposer {
public:
    GenerativeProposer(std::shared_ptr<const TextGenerator> generator,
                       core::config::TargetPlatform platform, std::uint32_t timeout_ms);

    core::errors::Result<protocol::CommandProposal> propose(
        const std::string& task_description, const std::string& context) const override;

    std::string build_prompt(const std::string& task_description,
                             const std::string& context) const;

private:
    std::shared_ptr<const TextGenerator> generator_;
    core::config::TargetPlatform platform_;
    std::uint32_t timeout_ms_;
};

}  // namespace cmdgate::review
