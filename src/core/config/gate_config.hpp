#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include "core/errors/gate_errors.hpp"

namespace cmdgate::core::config {

// Flag dialect the proposed commands must be valid for.
enum class TargetPlatform {
    Gnu,  // Linux coreutils / GNU sed
    Bsd   // macOS and the BSDs
};

struct GateConfig {
    std::filesystem::path sandbox_base = std::filesystem::current_path() / ".cmdgate_sandbox";
    TargetPlatform target_platform = TargetPlatform::Gnu;
    std::uint32_t command_timeout_ms = 5000;
    std::uint32_t proposer_timeout_ms = 30000;
    std::size_t max_output_bytes = 1024 * 1024;
    std::uint32_t max_revisions = 2;
    std::filesystem::path artifact_dir = std::filesystem::current_path() / ".cmdgate_runs";
    std::string log_level = "info";
    std::filesystem::path home_directory;
    std::vector<std::string> allowed_external_paths = {"/dev/null", "/dev/stdout",
                                                       "/dev/stderr"};
    // Programs named by path may live here as well as in the sandbox.
    std::vector<std::string> trusted_program_dirs = {"/bin", "/usr/bin", "/sbin", "/usr/sbin",
                                                     "/usr/local/bin"};
    // Entries starting with "~/" are resolved against home_directory.
    std::vector<std::string> protected_locations = {
        "/etc",           "/boot",         "/usr",       "/bin",
        "/sbin",          "/lib",          "/lib64",     "/var",
        "/sys",           "/proc",         "/dev",       "~/.bashrc",
        "~/.bash_profile", "~/.bash_login", "~/.profile", "~/.zshrc",
        "~/.zprofile",    "~/.zshenv",     "~/.ssh",     "~/.gitconfig",
        "~/.config"};
    std::string proposer_command;
    std::string reviewer_command;
    std::optional<std::filesystem::path> proposals_file;
    std::uint32_t jobs = 1;
};

TargetPlatform host_platform();
std::string to_string(TargetPlatform platform);
errors::Result<TargetPlatform> parse_platform(const std::string& text);

// Defaults with host-derived values (platform, $HOME) filled in.
GateConfig default_config();

errors::Result<GateConfig> config_from_json_text(const std::string& text);
errors::Result<GateConfig> load_config(const std::filesystem::path& path);

}  // namespace cmdgate::core::config
