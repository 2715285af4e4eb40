#pragma once

#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <string>
#include <string_view>

#include <mpfr.h>

#include "mpfloat/errors.h"

namespace mpfloat {

class Float;

enum class FormatStyle {
  Positional,
  Exponent,
};

struct FormatOptions {
  FormatStyle style = FormatStyle::Positional;
  // 0 requests every significant digit mpfr_get_str produces for the precision.
  std::size_t digits = 0;
  bool trim_trailing_zeros = false;
};

// value = (negative ? -1 : 1) * 0.<digits> * 10^exponent
struct DecimalDigits {
  bool negative = false;
  std::string digits;
  long exponent = 0;
};

// Finite, non-zero values only.
DecimalDigits extract_decimal_digits(mpfr_srcptr value, std::size_t digits, mpfr_rnd_t rnd);

std::string assemble_positional(const DecimalDigits& parts);
std::string assemble_exponent(const DecimalDigits& parts);
std::string trim_decimal_string(std::string text);

std::string format(const Float& value, const FormatOptions& options = FormatOptions{});

// Base 0 (prefix detection) or 2..62. The target is untouched on failure.
ParseStatus parse(Float& target, std::string_view text, int base = 10);

std::ostream& operator<<(std::ostream& out, const Float& value);

}  // namespace mpfloat
