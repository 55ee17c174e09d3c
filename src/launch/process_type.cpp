#include "launch/process_type.hpp"

namespace rolelaunch::launch {

ProcessType ParseProcessType(std::optional<std::string_view> raw) {
  if (!raw.has_value()) {
    return ProcessType::kUnrecognized;
  }
  if (*raw == "web") {
    return ProcessType::kWeb;
  }
  if (*raw == "worker") {
    return ProcessType::kWorker;
  }
  return ProcessType::kUnrecognized;
}

std::string_view ToString(ProcessType type) {
  switch (type) {
  case ProcessType::kWeb:
    return "web";
  case ProcessType::kWorker:
    return "worker";
  case ProcessType::kUnrecognized:
    return "unrecognized";
  }
  return "unrecognized";
}

} // namespace rolelaunch::launch
