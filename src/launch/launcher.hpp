#pragma once

#include "core/env_utils.hpp"
#include "core/logging/logger.hpp"
#include "launch/command_plan.hpp"
#include "launch/process_replacer.hpp"
#include "launch/process_type.hpp"

#include <optional>
#include <ostream>
#include <string>
#include <string_view>

namespace rolelaunch::launch {

// Fixed diagnostic for a missing or unrecognized PROCESS_TYPE. Unset and
// unknown values share this text.
inline constexpr std::string_view kProcessTypeNotSetMessage =
    "Error: PROCESS_TYPE environment variable not set.";

// Outcome of the role decision before anything is executed. `plan` is set
// exactly when `type` is web or worker.
struct LaunchDecision {
  ProcessType type = ProcessType::kUnrecognized;
  std::optional<std::string> raw_value;
  std::optional<CommandPlan> plan;
};

// Pure function of PROCESS_TYPE in `env`; no other key is consulted.
LaunchDecision ResolveLaunch(const core::Environment& env);

// Writes the single-line configuration diagnostic.
void PrintProcessTypeNotSet(std::ostream& err);

// Resolves the role and hands control to `replacer`. Does not return when
// replacement succeeds. Otherwise returns:
//   1        => PROCESS_TYPE missing or unrecognized
//   126/127  => the selected program could not be executed
int Run(const core::Environment& env, IProcessReplacer& replacer, core::logging::Logger& logger);

} // namespace rolelaunch::launch
