#pragma once

#include "launch/process_type.hpp"

#include <string>
#include <vector>

namespace rolelaunch::launch {

// Fully resolved external command for one role. `argv.front()` is always
// `program`, matching the execvp() calling convention.
struct CommandPlan {
  ProcessType type = ProcessType::kUnrecognized;
  std::string program;
  std::vector<std::string> argv;
};

// Builds the hard-coded command for `web` or `worker`. Returns false for
// `kUnrecognized`, which has no command.
bool BuildCommandPlan(ProcessType type, CommandPlan& plan, std::string& error);

// Space-joined argv for logs and `rolelaunch plan`. Not shell-quoted.
std::string FormatCommandLine(const CommandPlan& plan);

} // namespace rolelaunch::launch
