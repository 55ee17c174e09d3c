#include "launch/launcher.hpp"

#include "core/errors/exit_codes.hpp"

#include <iostream>
#include <string>
#include <utility>

namespace rolelaunch::launch {

LaunchDecision ResolveLaunch(const core::Environment& env) {
  LaunchDecision decision;
  const std::optional<std::string_view> raw = core::LookupEnv(env, kProcessTypeEnvVar);
  if (raw.has_value()) {
    decision.raw_value = std::string(*raw);
  }

  decision.type = ParseProcessType(raw);

  CommandPlan plan;
  std::string error;
  if (BuildCommandPlan(decision.type, plan, error)) {
    decision.plan = std::move(plan);
  }
  return decision;
}

void PrintProcessTypeNotSet(std::ostream& err) {
  err << kProcessTypeNotSetMessage << '\n';
  err.flush();
}

int Run(const core::Environment& env, IProcessReplacer& replacer, core::logging::Logger& logger) {
  const LaunchDecision decision = ResolveLaunch(env);
  logger.SetProcessType(std::string(ToString(decision.type)));

  if (!decision.plan.has_value()) {
    logger.Debug("process type rejected",
                 {{"env_var", kProcessTypeEnvVar},
                  {"value", decision.raw_value.has_value() ? *decision.raw_value : "<unset>"}});
    PrintProcessTypeNotSet(std::cerr);
    return core::errors::ToInt(core::errors::ExitCode::kConfigurationMissing);
  }

  const CommandPlan& plan = *decision.plan;
  const std::string command_line = FormatCommandLine(plan);
  logger.Info("launching process", {{"program", plan.program}, {"command", command_line}});

  std::string error;
  const int exit_code = replacer.Replace(plan, error);
  logger.Error("process replacement failed",
               {{"program", plan.program},
                {"error", error},
                {"exit_code", std::to_string(exit_code)}});
  return exit_code;
}

} // namespace rolelaunch::launch
