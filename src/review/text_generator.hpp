#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include "core/errors/gate_errors.hpp"

namespace cmdgate::review {

// A backend that turns a prompt into text (a local model, a wrapper script
// around a hosted API, a canned responder in tests).
class TextGenerator {
public:
    virtual ~TextGenerator() = default;
    virtual core::errors::Result<std::string> generate(const std::string& prompt,
                                                       std::uint32_t timeout_ms) const = 0;
};

// Runs `command` through /bin/sh with the prompt on stdin and takes stdout
// as the generated text. A non-zero exit or a timeout is an error.
class ProcessTextGenerator : public TextGenerator {
public:
    explicit ProcessTextGenerator(std::string command,
                                  std::size_t max_output_bytes = 1024 * 1024);

    core::errors::Result<std::string> generate(const std::string& prompt,
                                               std::uint32_t timeout_ms) const override;

private:
    std::string command_;
    std::size_t max_output_bytes_;
};

// The part of a model reply that carries the answer: text after the last
// "</think>" block, trimmed, with a surrounding ``` fence removed.
std::string final_answer(const std::string& raw);

}  // namespace cmdgate::review
