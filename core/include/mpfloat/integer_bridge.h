#pragma once

#include <cstdint>
#include <string>

#include <gmp.h>

namespace mpfloat {

struct GmpInt {
  mpz_t value;
  GmpInt() {
    mpz_init(value);
  }
  explicit GmpInt(mp_bitcnt_t bits) {
    mpz_init2(value, bits);
  }
  ~GmpInt() {
    mpz_clear(value);
  }
  GmpInt(const GmpInt&) = delete;
  GmpInt& operator=(const GmpInt&) = delete;
};

struct GmpFloat {
  mpf_t value;
  GmpFloat() {
    mpf_init(value);
  }
  explicit GmpFloat(mp_bitcnt_t bits) {
    mpf_init2(value, bits);
  }
  ~GmpFloat() {
    mpf_clear(value);
  }
  GmpFloat(const GmpFloat&) = delete;
  GmpFloat& operator=(const GmpFloat&) = delete;
};

// NativeWord: the value fits the 32-bit word every platform's `long` holds and
// goes straight through mpfr_set_si/mpfr_set_ui. DecimalText: the value is
// rendered to decimal text and parsed.
enum class ConversionPath {
  NativeWord,
  DecimalText,
};

ConversionPath conversion_path_for(std::int64_t value);
ConversionPath conversion_path_for(std::uint64_t value);
const char* conversion_path_name(ConversionPath path);

std::string mpz_to_decimal_string(mpz_srcptr value);
// Positional decimal text ("12.5", "-0.001", "0.0") for an mpf_t.
std::string mpf_to_decimal_string(mpf_srcptr value);

}  // namespace mpfloat
