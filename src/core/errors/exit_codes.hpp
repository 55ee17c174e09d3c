#pragma once

namespace rolelaunch::core::errors {

// Stable process-exit contract for container entrypoints and supervisors.
//
// 0 and 2 keep their conventional CLI meanings. 1 is the one configuration
// failure the launcher itself defines. 126 and 127 mirror what a POSIX shell
// reports when a command cannot be executed or cannot be found, so callers
// see the same codes they would have seen from a shell wrapper.
enum class ExitCode : int {
  kSuccess = 0,
  kConfigurationMissing = 1,
  kUsage = 2,
  kCommandNotExecutable = 126,
  kCommandNotFound = 127,
};

constexpr int ToInt(ExitCode code) {
  return static_cast<int>(code);
}

} // namespace rolelaunch::core::errors
