#pragma once

#include "launch/command_plan.hpp"

#include <string>

namespace rolelaunch::launch {

// Seam between the launch decision and the platform primitive that turns the
// current process into the target program.
//
// Contract:
// - on success `Replace` does not return; the caller's process image is gone
// - on failure it returns a non-zero exit code and fills `error`
class IProcessReplacer {
public:
  virtual ~IProcessReplacer() = default;

  virtual int Replace(const CommandPlan& plan, std::string& error) = 0;
};

} // namespace rolelaunch::launch
