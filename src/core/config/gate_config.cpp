#include "core/config/gate_config.hpp"

#include <cstdlib>
#include <fstream>
#include <sstream>
#include <system_error>
#include <unordered_set>
#include <nlohmann/json.hpp>

namespace cmdgate::core::config {

using errors::ErrorCategory;
using errors::GateError;
using nlohmann::json;

namespace {

GateError invalid_value(const std::string& key, const std::string& expected) {
    return GateError{ErrorCategory::Input,
                     "Config key '" + key + "' must be " + expected + ".",
                     "invalid_config_value"};
}

std::optional<GateError> read_string(const json& doc, const std::string& key,
                                     std::string& out) {
    if (!doc.contains(key)) {
        return std::nullopt;
    }
    if (!doc.at(key).is_string()) {
        return invalid_value(key, "a string");
    }
    out = doc.at(key).get<std::string>();
    return std::nullopt;
}

std::optional<GateError> read_u32(const json& doc, const std::string& key,
                                  std::uint32_t& out, const std::uint32_t min_value,
                                  const std::uint32_t max_value) {
    if (!doc.contains(key)) {
        return std::nullopt;
    }
    const auto& value = doc.at(key);
    if (!value.is_number_unsigned()) {
        return invalid_value(key, "a non-negative integer");
    }
    const auto number = value.get<std::uint64_t>();
    if (number < min_value || number > max_value) {
        return invalid_value(key, "between " + std::to_string(min_value) + " and " +
                                      std::to_string(max_value));
    }
    out = static_cast<std::uint32_t>(number);
    return std::nullopt;
}

std::optional<GateError> read_string_list(const json& doc, const std::string& key,
                                          std::vector<std::string>& out) {
    if (!doc.contains(key)) {
        return std::nullopt;
    }
    const auto& value = doc.at(key);
    if (!value.is_array()) {
        return invalid_value(key, "an array of strings");
    }
    std::vector<std::string> items;
    for (const auto& item : value) {
        if (!item.is_string()) {
            return invalid_value(key, "an array of strings");
        }
        items.push_back(item.get<std::string>());
    }
    out = std::move(items);
    return std::nullopt;
}

}  // namespace

TargetPlatform host_platform() {
#if defined(__APPLE__) || defined(__FreeBSD__) || defined(__OpenBSD__) || \
    defined(__NetBSD__)
    return TargetPlatform::Bsd;
#else
    return TargetPlatform::Gnu;
#endif
}

std::string to_string(const TargetPlatform platform) {
    switch (platform) {
        case TargetPlatform::Gnu:
            return "gnu";
        case TargetPlatform::Bsd:
            return "bsd";
        default:
            return "unknown";
    }
}

errors::Result<TargetPlatform> parse_platform(const std::string& text) {
    if (text == "gnu" || text == "linux") {
        return TargetPlatform::Gnu;
    }
    if (text == "bsd" || text == "macos" || text == "darwin") {
        return TargetPlatform::Bsd;
    }
    return GateError{ErrorCategory::Input, "Unknown target platform: " + text,
                     "invalid_platform", "Use 'gnu' or 'bsd'."};
}

GateConfig default_config() {
    GateConfig config;
    config.target_platform = host_platform();
    const char* home = std::getenv("HOME");
    if (home != nullptr && *home != '\0') {
        config.home_directory = home;
    } else {
        config.home_directory = "/root";
    }
    return config;
}

errors::Result<GateConfig> config_from_json_text(const std::string& text) {
    const json doc = json::parse(text, nullptr, false);
    if (doc.is_discarded()) {
        return GateError{ErrorCategory::Input, "Config is not valid JSON.",
                         "invalid_config_json"};
    }
    if (!doc.is_object()) {
        return GateError{ErrorCategory::Input, "Config root must be a JSON object.",
                         "invalid_config_json"};
    }

    static const std::unordered_set<std::string> kKnownKeys = {
        "sandbox_base",        "target_platform",        "command_timeout_ms",
        "proposer_timeout_ms", "max_output_bytes",       "max_revisions",
        "artifact_dir",        "log_level",              "home_directory",
        "allowed_external_paths", "protected_locations", "proposer_command",
        "reviewer_command",    "proposals_file",         "jobs",
        "trusted_program_dirs"};
    for (const auto& item : doc.items()) {
        if (kKnownKeys.count(item.key()) == 0) {
            return GateError{ErrorCategory::Input, "Unknown config key: " + item.key(),
                             "unknown_config_key"};
        }
    }

    GateConfig config = default_config();
    std::string text_value;

    if (doc.contains("sandbox_base")) {
        if (auto err = read_string(doc, "sandbox_base", text_value)) return *err;
        config.sandbox_base = text_value;
    }
    if (doc.contains("target_platform")) {
        if (auto err = read_string(doc, "target_platform", text_value)) return *err;
        auto platform = parse_platform(text_value);
        if (errors::is_error(platform)) {
            return errors::get_error(platform);
        }
        config.target_platform = errors::get_value(platform);
    }
    if (auto err = read_u32(doc, "command_timeout_ms", config.command_timeout_ms, 1,
                            3600000)) {
        return *err;
    }
    if (auto err = read_u32(doc, "proposer_timeout_ms", config.proposer_timeout_ms, 1,
                            3600000)) {
        return *err;
    }
    if (doc.contains("max_output_bytes")) {
        std::uint32_t bytes = 0;
        if (auto err = read_u32(doc, "max_output_bytes", bytes, 1024, 256u * 1024u * 1024u)) {
            return *err;
        }
        config.max_output_bytes = bytes;
    }
    if (auto err = read_u32(doc, "max_revisions", config.max_revisions, 0, 10)) {
        return *err;
    }
    if (doc.contains("artifact_dir")) {
        if (auto err = read_string(doc, "artifact_dir", text_value)) return *err;
        config.artifact_dir = text_value;
    }
    if (auto err = read_string(doc, "log_level", config.log_level)) return *err;
    if (doc.contains("home_directory")) {
        if (auto err = read_string(doc, "home_directory", text_value)) return *err;
        config.home_directory = text_value;
    }
    if (auto err = read_string_list(doc, "allowed_external_paths",
                                    config.allowed_external_paths)) {
        return *err;
    }
    if (auto err = read_string_list(doc, "protected_locations",
                                    config.protected_locations)) {
        return *err;
    }
    if (auto err = read_string_list(doc, "trusted_program_dirs",
                                    config.trusted_program_dirs)) {
        return *err;
    }
    if (auto err = read_string(doc, "proposer_command", config.proposer_command)) return *err;
    if (auto err = read_string(doc, "reviewer_command", config.reviewer_command)) return *err;
    if (doc.contains("proposals_file")) {
        if (auto err = read_string(doc, "proposals_file", text_value)) return *err;
        config.proposals_file = std::filesystem::path(text_value);
    }
    if (auto err = read_u32(doc, "jobs", config.jobs, 1, 64)) return *err;

    return config;
}

errors::Result<GateConfig> load_config(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec) || ec) {
        return GateError{ErrorCategory::Input, "Config file not found: " + path.string(),
                         "config_not_found"};
    }
    std::ifstream in(path);
    if (!in.is_open()) {
        return GateError{ErrorCategory::Input, "Unable to open config file: " + path.string(),
                         "config_open_failed"};
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return config_from_json_text(buffer.str());
}

}  // namespace cmdgate::core::config
