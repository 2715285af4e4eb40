#include "mpfloat/config.h"

#include <algorithm>
#include <atomic>
#include <cmath>
#include <cstdio>
#include <string>

#include "mpfloat/errors.h"

namespace mpfloat {

namespace {

std::atomic<mpfr_prec_t>& default_precision_slot() {
  static std::atomic<mpfr_prec_t> slot(runtime_config().default_precision);
  return slot;
}

bool precision_in_range(long long bits) {
  return bits >= static_cast<long long>(MPFR_PREC_MIN) &&
         bits <= static_cast<long long>(MPFR_PREC_MAX);
}

}  // namespace

std::optional<mpfr_prec_t> precision_for_kind(std::string_view kind) {
  if (kind == "f32") {
    return 24;
  }
  if (kind == "f64") {
    return 53;
  }
  if (kind == "f80") {
    return 64;
  }
  if (kind == "f128") {
    return 113;
  }
  if (kind == "f256") {
    return 237;
  }
  if (kind == "f512") {
    return 493;
  }
  return std::nullopt;
}

std::optional<mpfr_prec_t> parse_precision(std::string_view text) {
  if (text.empty()) {
    return std::nullopt;
  }
  if (auto by_kind = precision_for_kind(text)) {
    return by_kind;
  }
  long long bits = 0;
  for (const char ch : text) {
    if (ch < '0' || ch > '9') {
      return std::nullopt;
    }
    const int digit = ch - '0';
    if (bits > (static_cast<long long>(MPFR_PREC_MAX) - digit) / 10) {
      return std::nullopt;
    }
    bits = bits * 10 + digit;
  }
  if (!precision_in_range(bits)) {
    return std::nullopt;
  }
  return static_cast<mpfr_prec_t>(bits);
}

int decimal_digits_for_precision(mpfr_prec_t bits) {
  const auto digits = static_cast<int>(std::ceil(static_cast<double>(bits) * 0.3010299956639812));
  return std::max(1, digits + 1);
}

RuntimeConfig parse_runtime_config(const EnvLookup& lookup) {
  RuntimeConfig config;
  if (const char* raw = lookup("MPFLOAT_DEFAULT_PRECISION")) {
    if (auto bits = parse_precision(raw)) {
      config.default_precision = *bits;
    }
  }
  config.trace_conversions = env_flag_enabled(lookup, "MPFLOAT_TRACE_CONVERSIONS", false);
  return config;
}

const RuntimeConfig& runtime_config() {
  static const RuntimeConfig config = parse_runtime_config(&process_env);
  return config;
}

mpfr_prec_t default_precision() {
  return default_precision_slot().load(std::memory_order_relaxed);
}

void set_default_precision(mpfr_prec_t bits) {
  check_precision(bits);
  default_precision_slot().store(bits, std::memory_order_relaxed);
}

void check_precision(mpfr_prec_t bits) {
  if (!precision_in_range(static_cast<long long>(bits))) {
    throw FloatError("precision out of range: " + std::to_string(static_cast<long long>(bits)));
  }
}

bool trace_conversions_enabled() {
  return runtime_config().trace_conversions;
}

void trace_conversion(const char* tag, const char* event, const char* detail) {
  if (!trace_conversions_enabled()) {
    return;
  }
  std::fprintf(stderr, "[%s] %s %s\n", tag, event, detail ? detail : "");
}

}  // namespace mpfloat
