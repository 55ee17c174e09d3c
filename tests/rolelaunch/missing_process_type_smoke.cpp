#include "../common/assertions.hpp"
#include "../common/cli_dispatch.hpp"
#include "../common/env_override.hpp"

#include <iostream>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace {

using rolelaunch::tests::common::AssertExitCode;
using rolelaunch::tests::common::Fail;
using rolelaunch::tests::common::ScopedEnvOverride;

constexpr const char* kExpectedDiagnostic = "Error: PROCESS_TYPE environment variable not set.\n";

int DispatchWithCapturedStreams(const std::vector<std::string>& args, std::string& stdout_text,
                                std::string& stderr_text) {
  std::ostringstream captured_stdout;
  std::ostringstream captured_stderr;
  std::streambuf* original_stdout = std::cout.rdbuf(captured_stdout.rdbuf());
  std::streambuf* original_stderr = std::cerr.rdbuf(captured_stderr.rdbuf());
  const int exit_code = rolelaunch::tests::common::DispatchArgs(args);
  std::cout.rdbuf(original_stdout);
  std::cerr.rdbuf(original_stderr);
  stdout_text = captured_stdout.str();
  stderr_text = captured_stderr.str();
  return exit_code;
}

// Runs the real entrypoint path (process environment + exec replacer) for a
// value that must be rejected before any exec is attempted.
void ExpectRejected(const char* process_type, std::string_view label) {
  ScopedEnvOverride override("PROCESS_TYPE", process_type);

  std::string stdout_text;
  std::string stderr_text;
  const int exit_code = DispatchWithCapturedStreams({"rolelaunch"}, stdout_text, stderr_text);
  AssertExitCode(exit_code, 1, label);
  if (stderr_text != kExpectedDiagnostic) {
    std::cerr << label << ": unexpected stderr:\n" << stderr_text << '\n';
    Fail("diagnostic must be exactly one fixed line");
  }
  if (!stdout_text.empty()) {
    Fail("rejected launch must not write to stdout");
  }
}

} // namespace

int main() {
  ExpectRejected(nullptr, "unset");
  ExpectRejected("", "empty");
  ExpectRejected("staging", "staging");
  ExpectRejected("WEB", "uppercase");

  // Same environment, same outcome.
  ExpectRejected("staging", "staging repeated");

  std::cout << "missing_process_type_smoke: ok\n";
  return 0;
}
