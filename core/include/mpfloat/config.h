#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

#include <mpfr.h>

#include "mpfloat/env_flags.h"

namespace mpfloat {

struct RuntimeConfig {
  mpfr_prec_t default_precision = 53;
  bool trace_conversions = false;
};

// Pure over `lookup`: reads MPFLOAT_DEFAULT_PRECISION and
// MPFLOAT_TRACE_CONVERSIONS. An unusable precision keeps the default.
RuntimeConfig parse_runtime_config(const EnvLookup& lookup);

// Process-wide config, parsed from the environment once.
const RuntimeConfig& runtime_config();

mpfr_prec_t default_precision();
void set_default_precision(mpfr_prec_t bits);

// f32=24, f64=53, f80=64, f128=113, f256=237, f512=493.
std::optional<mpfr_prec_t> precision_for_kind(std::string_view kind);
// Accepts a bit count or a kind name.
std::optional<mpfr_prec_t> parse_precision(std::string_view text);
int decimal_digits_for_precision(mpfr_prec_t bits);

void check_precision(mpfr_prec_t bits);

bool trace_conversions_enabled();
void trace_conversion(const char* tag, const char* event, const char* detail);

}  // namespace mpfloat
