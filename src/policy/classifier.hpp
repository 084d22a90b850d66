#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include "core/config/gate_config.hpp"
#include "policy/shell_lexer.hpp"
#include "protocol/command_contract.hpp"

namespace cmdgate::policy {

// Host-independent policy knobs, usually taken from GateConfig.
struct PolicySettings {
    core::config::TargetPlatform platform = core::config::TargetPlatform::Gnu;
    std::filesystem::path home_directory = "/root";
    std::vector<std::string> allowed_external_paths = {"/dev/null", "/dev/stdout",
                                                       "/dev/stderr"};
    std::vector<std::string> trusted_program_dirs = {"/bin", "/usr/bin", "/sbin", "/usr/sbin",
                                                     "/usr/local/bin"};
    std::vector<std::string> protected_locations;
};

PolicySettings settings_from_config(const core::config::GateConfig& config);

// Everything a classifier may look at besides the command itself.
struct PolicyContext {
    std::filesystem::path sandbox_root;  // canonical
    PolicySettings settings;

    bool is_allowed_external(const std::string& path_text) const;
};

struct Rejection {
    protocol::RejectionCategory category;
    std::string reason;
};

// One independent rejection rule. Returns std::nullopt for "no opinion".
class Classifier {
public:
    virtual ~Classifier() = default;
    virtual std::string name() const = 0;
    virtual std::optional<Rejection> evaluate(const CommandAnalysis& analysis,
                                              const PolicyContext& context) const = 0;
};

}  // namespace cmdgate::policy
