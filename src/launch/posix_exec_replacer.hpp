#pragma once

#include "launch/process_replacer.hpp"

namespace rolelaunch::launch {

// execvp()-backed replacement. The program is resolved through the current
// PATH and inherits the environment and standard streams unchanged, so the
// launcher pid becomes the target pid and no supervisor process remains.
//
// Failure codes follow POSIX shell convention:
//   127 => program not found (ENOENT, ENOTDIR)
//   126 => program found but could not be executed (EACCES, ENOEXEC, ...)
class PosixExecReplacer final : public IProcessReplacer {
public:
  int Replace(const CommandPlan& plan, std::string& error) override;
};

// Maps an execvp() errno to the exit code reported when replacement fails.
int ExitCodeForExecErrno(int error_number);

} // namespace rolelaunch::launch
