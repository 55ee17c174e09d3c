#pragma once

#include <optional>
#include <string_view>

namespace rolelaunch::launch {

// Environment variable that selects the role this container runs.
inline constexpr std::string_view kProcessTypeEnvVar = "PROCESS_TYPE";

// `kUnrecognized` covers unset, empty, and any value other than the two
// known roles. Callers treat all three the same way.
enum class ProcessType {
  kWeb,
  kWorker,
  kUnrecognized,
};

// Exact, case-sensitive match: "Web" or " web" are unrecognized.
ProcessType ParseProcessType(std::optional<std::string_view> raw);

std::string_view ToString(ProcessType type);

} // namespace rolelaunch::launch
