#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include <mpfr.h>

namespace mpfloat {

enum class RoundingMode {
  ToNearest,
  TowardZero,
  Up,
  Down,
  AwayFromZero,
};

mpfr_rnd_t to_mpfr_rnd(RoundingMode mode);
RoundingMode from_mpfr_rnd(mpfr_rnd_t rnd);

const char* rounding_mode_name(RoundingMode mode);
// Accepts the names produced by rounding_mode_name() and the MPFR spellings
// ("RNDN", "RNDZ", "RNDU", "RNDD", "RNDA").
std::optional<RoundingMode> parse_rounding_mode(std::string_view name);

}  // namespace mpfloat
