#pragma once
#include <string>
#include <filesystem>
#include <cstdint>
#include <vector>
#include "expectation.hpp"

namespace cmdgate::protocol {

    // One natural-language task plus the post-conditions that prove it was done.
    struct TaskRequest {
        std::string task_description;
        std::string context;                              // extra hints for the proposer
        std::vector<Expectation> expectations;
        std::filesystem::path working_subdir = ".";       // relative to the sandbox root
        uint32_t timeout_ms = 5000;
    };

} // namespace cmdgate::protocol
