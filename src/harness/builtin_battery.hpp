#pragma once

#include <vector>
#include "core/config/gate_config.hpp"
#include "harness/scenario_case.hpp"

namespace cmdgate::harness {

// The standard regression battery: six positive tasks with known-good
// commands for `platform`, then nine commands that must never be approved.
std::vector<ScenarioCase> builtin_battery(core::config::TargetPlatform platform);

}  // namespace cmdgate::harness
