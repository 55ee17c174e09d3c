#include "launch/posix_exec_replacer.hpp"

#include "core/errors/exit_codes.hpp"

#include <cerrno>
#include <cstring>
#include <iostream>
#include <vector>

#include <unistd.h>

namespace rolelaunch::launch {

int ExitCodeForExecErrno(int error_number) {
  if (error_number == ENOENT || error_number == ENOTDIR) {
    return core::errors::ToInt(core::errors::ExitCode::kCommandNotFound);
  }
  return core::errors::ToInt(core::errors::ExitCode::kCommandNotExecutable);
}

int PosixExecReplacer::Replace(const CommandPlan& plan, std::string& error) {
  error.clear();
  if (plan.program.empty() || plan.argv.empty()) {
    error = "command plan has no program to execute";
    return core::errors::ToInt(core::errors::ExitCode::kCommandNotFound);
  }

  std::vector<char*> argv;
  argv.reserve(plan.argv.size() + 1U);
  for (const auto& arg : plan.argv) {
    argv.push_back(const_cast<char*>(arg.c_str()));
  }
  argv.push_back(nullptr);

  // iostream buffers are discarded by exec.
  std::cout.flush();
  std::cerr.flush();

  ::execvp(plan.program.c_str(), argv.data());

  const int exec_errno = errno;
  error = "failed to execute '" + plan.program + "': " + std::strerror(exec_errno);
  return ExitCodeForExecErrno(exec_errno);
}

} // namespace rolelaunch::launch
