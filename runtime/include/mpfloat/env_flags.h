#pragma once

#include <cstddef>
#include <cstdlib>
#include <functional>
#include <string>

namespace mpfloat {

// Environment lookup used by every config reader. Tests substitute a map-backed
// lookup; production code reads the process environment.
using EnvLookup = std::function<const char*(const char*)>;

inline const char* process_env(const char* name) {
  return std::getenv(name);
}

// Canonical env-flag parser shared by the runtime and core libraries.
inline bool parse_env_flag_value(const char* raw, bool fallback) {
  if (!raw || *raw == '\0') {
    return fallback;
  }
  const std::string value(raw);
  if (value == "0" || value == "false" || value == "False" || value == "off" ||
      value == "OFF" || value == "no" || value == "NO") {
    return false;
  }
  return true;
}

inline bool env_flag_enabled(const EnvLookup& lookup, const char* name, bool fallback) {
  return parse_env_flag_value(lookup(name), fallback);
}

// Parses a non-negative decimal count. Anything else yields the fallback.
inline std::size_t parse_env_count_value(const char* raw, std::size_t fallback) {
  if (!raw || *raw == '\0') {
    return fallback;
  }
  std::size_t value = 0;
  for (const char* it = raw; *it != '\0'; ++it) {
    if (*it < '0' || *it > '9') {
      return fallback;
    }
    value = value * 10U + static_cast<std::size_t>(*it - '0');
  }
  return value;
}

}  // namespace mpfloat
