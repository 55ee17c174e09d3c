#ifndef ROLELAUNCH_TESTS_COMMON_RECORDING_REPLACER_HPP_
#define ROLELAUNCH_TESTS_COMMON_RECORDING_REPLACER_HPP_

#include "launch/process_replacer.hpp"

#include <string>
#include <utility>
#include <vector>

namespace rolelaunch::tests::common {

// Stands in for exec: records every plan it is handed and then reports the
// configured failure, since a real replacement would never return.
class RecordingReplacer final : public launch::IProcessReplacer {
public:
  explicit RecordingReplacer(int exit_code = 127, std::string error = "recorded, not executed")
      : exit_code_(exit_code), error_(std::move(error)) {}

  int Replace(const launch::CommandPlan& plan, std::string& error) override {
    calls_.push_back(plan);
    error = error_;
    return exit_code_;
  }

  const std::vector<launch::CommandPlan>& Calls() const {
    return calls_;
  }

private:
  int exit_code_ = 127;
  std::string error_;
  std::vector<launch::CommandPlan> calls_;
};

} // namespace rolelaunch::tests::common

#endif // ROLELAUNCH_TESTS_COMMON_RECORDING_REPLACER_HPP_
