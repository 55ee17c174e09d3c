#pragma once

#include "core/env_utils.hpp"
#include "core/logging/logger.hpp"
#include "launch/process_replacer.hpp"

namespace rolelaunch::cli {

// Inputs the router needs from the outside world. `Dispatch(argc, argv)`
// fills this from the real process; tests pass their own snapshot and a
// replacer that records instead of exec-ing.
struct LaunchContext {
  const core::Environment* environment = nullptr;
  launch::IProcessReplacer* replacer = nullptr;
};

struct LaunchOptions {
  core::logging::LogLevel log_level = core::logging::LogLevel::kInfo;
};

// Routes `rolelaunch` subcommands and returns process exit codes:
//   0        => plan/version/help succeeded
//   1        => PROCESS_TYPE missing or unrecognized
//   2        => usage error (unknown command / invalid args)
//   126/127  => the selected program could not be executed
// Running with no subcommand is the same as `rolelaunch launch`.
int Dispatch(int argc, char** argv);

int Dispatch(int argc, char** argv, const LaunchContext& context);

} // namespace rolelaunch::cli
