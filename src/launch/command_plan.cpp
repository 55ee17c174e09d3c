#include "launch/command_plan.hpp"

#include <string_view>

namespace rolelaunch::launch {

namespace {

// ASGI server bound to all interfaces, serving `app` from module `main`.
constexpr std::string_view kWebProgram = "uvicorn";
constexpr std::string_view kWebAppTarget = "main:app";
constexpr std::string_view kWebBindHost = "0.0.0.0";
constexpr std::string_view kWebBindPort = "8000";

// Task-queue worker for `celery` in module `celery_app`, single-process pool.
constexpr std::string_view kWorkerProgram = "celery";
constexpr std::string_view kWorkerAppTarget = "celery_app.celery";
constexpr std::string_view kWorkerLogLevel = "info";
constexpr std::string_view kWorkerPool = "solo";

CommandPlan MakeWebPlan() {
  CommandPlan plan;
  plan.type = ProcessType::kWeb;
  plan.program = std::string(kWebProgram);
  plan.argv = {
      std::string(kWebProgram),
      std::string(kWebAppTarget),
      "--host",
      std::string(kWebBindHost),
      "--port",
      std::string(kWebBindPort),
  };
  return plan;
}

CommandPlan MakeWorkerPlan() {
  CommandPlan plan;
  plan.type = ProcessType::kWorker;
  plan.program = std::string(kWorkerProgram);
  plan.argv = {
      std::string(kWorkerProgram),
      "-A",
      std::string(kWorkerAppTarget),
      "worker",
      "--loglevel=" + std::string(kWorkerLogLevel),
      "--pool=" + std::string(kWorkerPool),
  };
  return plan;
}

} // namespace

bool BuildCommandPlan(ProcessType type, CommandPlan& plan, std::string& error) {
  error.clear();
  switch (type) {
  case ProcessType::kWeb:
    plan = MakeWebPlan();
    return true;
  case ProcessType::kWorker:
    plan = MakeWorkerPlan();
    return true;
  case ProcessType::kUnrecognized:
    break;
  }

  error = "no command is defined for process type '" + std::string(ToString(type)) + "'";
  return false;
}

std::string FormatCommandLine(const CommandPlan& plan) {
  std::string line;
  for (const auto& arg : plan.argv) {
    if (!line.empty()) {
      line.push_back(' ');
    }
    line += arg;
  }
  return line;
}

} // namespace rolelaunch::launch
