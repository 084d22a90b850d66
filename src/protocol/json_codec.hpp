#pragma once

#include <nlohmann/json.hpp>
#include "core/errors/gate_errors.hpp"
#include "protocol/command_contract.hpp"
#include "protocol/task_report.hpp"

namespace cmdgate::protocol {

nlohmann::json proposal_to_json(const CommandProposal& proposal);
nlohmann::json verdict_to_json(const ReviewVerdict& verdict);
nlohmann::json execution_to_json(const ExecutionResult& execution);
nlohmann::json verification_to_json(const VerificationOutcome& outcome);
nlohmann::json error_to_json(const core::errors::GateError& error);
nlohmann::json report_to_json(const TaskReport& report);

}  // namespace cmdgate::protocol
