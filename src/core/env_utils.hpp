#ifndef ROLELAUNCH_CORE_ENV_UTILS_HPP_
#define ROLELAUNCH_CORE_ENV_UTILS_HPP_

#include <map>
#include <optional>
#include <string>
#include <string_view>

extern "C" {
extern char** environ;
}

namespace rolelaunch::core {

// Read-once view of the process environment. Decisions are made against a
// snapshot so they stay a pure function of its contents.
using Environment = std::map<std::string, std::string>;

// Builds a snapshot from a NULL-terminated `KEY=VALUE` array such as
// `environ`. Entries without '=' are skipped and the first occurrence of a
// duplicated key wins, which matches getenv() on glibc.
inline Environment SnapshotEnvironment(char** entries) {
  Environment env;
  if (entries == nullptr) {
    return env;
  }

  for (char** it = entries; *it != nullptr; ++it) {
    const std::string_view entry(*it);
    const std::size_t separator = entry.find('=');
    if (separator == std::string_view::npos || separator == 0U) {
      continue;
    }
    env.emplace(std::string(entry.substr(0, separator)), std::string(entry.substr(separator + 1U)));
  }
  return env;
}

inline Environment SnapshotProcessEnvironment() {
  return SnapshotEnvironment(environ);
}

inline std::optional<std::string_view> LookupEnv(const Environment& env, std::string_view name) {
  const auto it = env.find(std::string(name));
  if (it == env.end()) {
    return std::nullopt;
  }
  return std::string_view(it->second);
}

} // namespace rolelaunch::core

#endif // ROLELAUNCH_CORE_ENV_UTILS_HPP_
