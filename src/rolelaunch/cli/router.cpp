#include "rolelaunch/cli/router.hpp"

#include "core/errors/exit_codes.hpp"
#include "launch/command_plan.hpp"
#include "launch/launcher.hpp"
#include "launch/posix_exec_replacer.hpp"
#include "launch/process_type.hpp"

#include <iostream>
#include <string>
#include <string_view>
#include <vector>

namespace rolelaunch::cli {

namespace {

constexpr int kExitSuccess = core::errors::ToInt(core::errors::ExitCode::kSuccess);
constexpr int kExitConfigurationMissing =
    core::errors::ToInt(core::errors::ExitCode::kConfigurationMissing);
constexpr int kExitUsage = core::errors::ToInt(core::errors::ExitCode::kUsage);

void PrintUsage(std::ostream& out) {
  out << "usage:\n"
      << "  rolelaunch [launch] [--log-level <debug|info|warn|error>]\n"
      << "  rolelaunch plan\n"
      << "  rolelaunch version\n"
      << "\n"
      << "PROCESS_TYPE selects the program that replaces this process:\n"
      << "  web     uvicorn main:app --host 0.0.0.0 --port 8000\n"
      << "  worker  celery -A celery_app.celery worker --loglevel=info --pool=solo\n";
}

bool ParseLaunchOptions(const std::vector<std::string_view>& args, LaunchOptions& options,
                        std::string& error) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string_view token = args[i];
    if (token == "--log-level") {
      if (i + 1 >= args.size()) {
        error = "missing value for --log-level";
        return false;
      }
      core::logging::LogLevel parsed = core::logging::LogLevel::kInfo;
      if (!core::logging::ParseLogLevel(args[i + 1], parsed, error)) {
        return false;
      }
      options.log_level = parsed;
      ++i;
      continue;
    }

    if (!token.empty() && token.front() == '-') {
      error = "unknown option: " + std::string(token);
      return false;
    }

    error = "launch does not accept positional arguments";
    return false;
  }

  return true;
}

int CommandLaunch(const std::vector<std::string_view>& args, const LaunchContext& context) {
  LaunchOptions options;
  std::string error;
  if (!ParseLaunchOptions(args, options, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitUsage;
  }

  core::logging::Logger logger(options.log_level);
  return launch::Run(*context.environment, *context.replacer, logger);
}

// Dry run: reports the decision `launch` would make without exec-ing.
int CommandShowPlan(const std::vector<std::string_view>& args, const LaunchContext& context) {
  if (!args.empty()) {
    std::cerr << "error: plan does not accept arguments\n";
    return kExitUsage;
  }

  const launch::LaunchDecision decision = launch::ResolveLaunch(*context.environment);
  if (!decision.plan.has_value()) {
    launch::PrintProcessTypeNotSet(std::cerr);
    return kExitConfigurationMissing;
  }

  std::cout << "process_type: " << launch::ToString(decision.type) << '\n';
  std::cout << "program: " << decision.plan->program << '\n';
  std::cout << "command: " << launch::FormatCommandLine(*decision.plan) << '\n';
  return kExitSuccess;
}

int CommandVersion(const std::vector<std::string_view>& args) {
  if (!args.empty()) {
    std::cerr << "error: version does not accept arguments\n";
    return kExitUsage;
  }

  std::cout << "rolelaunch 0.1.0\n";
  return kExitSuccess;
}

} // namespace

int Dispatch(int argc, char** argv) {
  const core::Environment environment = core::SnapshotProcessEnvironment();
  launch::PosixExecReplacer replacer;

  LaunchContext context;
  context.environment = &environment;
  context.replacer = &replacer;
  return Dispatch(argc, argv, context);
}

int Dispatch(int argc, char** argv, const LaunchContext& context) {
  if (context.environment == nullptr || context.replacer == nullptr) {
    std::cerr << "error: launch context is incomplete\n";
    return kExitUsage;
  }

  // The bare entrypoint form keeps `rolelaunch` usable as a drop-in
  // container CMD with no arguments.
  if (argc < 2) {
    return CommandLaunch({}, context);
  }

  const std::string_view command(argv[1]);
  const std::vector<std::string_view> args(argv + 2, argv + argc);

  if (command == "launch") {
    return CommandLaunch(args, context);
  }

  if (command == "plan") {
    return CommandShowPlan(args, context);
  }

  if (command == "version") {
    return CommandVersion(args);
  }

  if (command == "help" || command == "--help" || command == "-h") {
    PrintUsage(std::cout);
    return kExitSuccess;
  }

  // Options without a subcommand go to launch, e.g. `rolelaunch --log-level debug`.
  if (!command.empty() && command.front() == '-') {
    const std::vector<std::string_view> launch_args(argv + 1, argv + argc);
    return CommandLaunch(launch_args, context);
  }

  std::cerr << "error: unknown subcommand: " << command << '\n';
  PrintUsage(std::cerr);
  return kExitUsage;
}

} // namespace rolelaunch::cli
