#include <cassert>
#include <cstdint>
#include <limits>
#include <string>

#include "core_support.h"

namespace core_test {
namespace {

using mpfloat::ConversionPath;
using mpfloat::Float;
using mpfloat::GmpFloat;
using mpfloat::GmpInt;
using mpfloat::LifecycleState;

std::string integer_text(const Float& value) {
  GmpInt out;
  value.to_mpz(out.value);
  return mpfloat::mpz_to_decimal_string(out.value);
}

void test_conversion_path_boundaries() {
  const std::int64_t int32_max = std::numeric_limits<std::int32_t>::max();
  const std::int64_t int32_min = std::numeric_limits<std::int32_t>::min();
  assert(mpfloat::conversion_path_for(int32_max) == ConversionPath::NativeWord);
  assert(mpfloat::conversion_path_for(int32_max + 1) == ConversionPath::DecimalText);
  assert(mpfloat::conversion_path_for(int32_min) == ConversionPath::NativeWord);
  assert(mpfloat::conversion_path_for(int32_min - 1) == ConversionPath::DecimalText);

  const std::uint64_t uint32_max = std::numeric_limits<std::uint32_t>::max();
  assert(mpfloat::conversion_path_for(uint32_max) == ConversionPath::NativeWord);
  assert(mpfloat::conversion_path_for(uint32_max + 1U) == ConversionPath::DecimalText);
  assert(std::string(mpfloat::conversion_path_name(ConversionPath::DecimalText)) == "decimal-text");
}

void test_int64_extremes_survive_both_paths() {
  Float max_value(64);
  max_value.set_int64(std::numeric_limits<std::int64_t>::max());
  assert(integer_text(max_value) == "9223372036854775807");
  assert(max_value.consume_int64() == std::numeric_limits<std::int64_t>::max());
  assert(max_value.state() == LifecycleState::Cleared);

  Float min_value(64);
  min_value.set_int64(std::numeric_limits<std::int64_t>::min());
  assert(integer_text(min_value) == "-9223372036854775808");
  assert(min_value.consume_int64() == std::numeric_limits<std::int64_t>::min());

  Float small(64);
  small.set_int64(-42);
  assert(small.consume_int64() == -42);

  expect_value(Float::from_int64(5000000000LL), 5e9);
}

void test_uint64_extremes() {
  Float max_value(64);
  max_value.set_uint64(std::numeric_limits<std::uint64_t>::max());
  assert(integer_text(max_value) == "18446744073709551615");
  assert(max_value.consume_uint64() == std::numeric_limits<std::uint64_t>::max());
  assert(max_value.state() == LifecycleState::Cleared);

  assert(Float::from_uint64(7U).consume_uint64() == 7U);
}

void test_decimal_text_rounds_with_target_mode() {
  // 2^53 + 1 is not representable in 53 bits.
  const std::int64_t odd = (std::int64_t{1} << 53) + 1;
  Float down(53);
  down.set_rounding_mode(mpfloat::RoundingMode::Down);
  down.set_int64(odd);
  assert(integer_text(down) == "9007199254740992");

  Float up(53);
  up.set_rounding_mode(mpfloat::RoundingMode::Up);
  up.set_int64(odd);
  assert(integer_text(up) == "9007199254740994");
}

void test_mpz_round_trip() {
  GmpInt source;
  assert(mpz_set_str(source.value, "-123456789012345678901234567890", 10) == 0);
  Float value = Float::from_mpz(source.value, 128);
  GmpInt back;
  value.to_mpz(back.value);
  assert(mpz_cmp(source.value, back.value) == 0);

  Float from_null = Float::from_mpz(nullptr);
  assert(from_null.is_zero());
  assert(mpfr_signbit(from_null.native()) == 0);
}

void test_mpf_endpoints() {
  GmpFloat source(128);
  mpf_set_d(source.value, -12.5);
  assert(mpfloat::mpf_to_decimal_string(source.value) == "-12.5");
  expect_value(Float::from_mpf(source.value), -12.5);

  mpf_set_d(source.value, 0.125);
  assert(mpfloat::mpf_to_decimal_string(source.value) == "0.125");
  mpf_set_ui(source.value, 100U);
  assert(mpfloat::mpf_to_decimal_string(source.value) == "100.0");
  mpf_set_ui(source.value, 0U);
  assert(mpfloat::mpf_to_decimal_string(source.value) == "0.0");
  assert(Float::from_mpf(source.value).is_zero());
  assert(Float::from_mpf(nullptr).is_zero());

  GmpFloat out(128);
  Float::from_double(12.5).to_mpf(out.value);
  assert(mpf_cmp_d(out.value, 12.5) == 0);

  Float consumed = Float::from_double(-0.375);
  consumed.consume_into(out.value);
  assert(mpf_cmp_d(out.value, -0.375) == 0);
  assert(consumed.state() == LifecycleState::Cleared);
}

void test_to_mpz_truncates_toward_zero() {
  assert(integer_text(Float::from_double(12345.67)) == "12345");
  assert(integer_text(Float::from_double(-12345.67)) == "-12345");
  assert(integer_text(Float::from_double(0.000123456)) == "0");
  assert(integer_text(Float::from_double(-0.999)) == "0");
  assert(integer_text(Float::from_double(99.99999999)) == "99");
  assert(integer_text(Float::from_double(1e20)) == "100000000000000000000");
  assert(integer_text(Float::from_double(7.0)) == "7");
  assert(integer_text(Float()) == "0");

  // Truncation ignores the value's mode.
  Float up = Float::from_double(2.75);
  up.set_rounding_mode(mpfloat::RoundingMode::Up);
  assert(integer_text(up) == "2");
}

void test_non_finite_conversions_fail() {
  Float nan;
  nan.set_nan();
  GmpInt z;
  bool threw = false;
  try {
    nan.to_mpz(z.value);
  } catch (const mpfloat::FloatError&) {
    threw = true;
  }
  assert(threw);

  Float inf;
  inf.set_inf(-1);
  GmpFloat f;
  threw = false;
  try {
    inf.to_mpf(f.value);
  } catch (const mpfloat::FloatError& err) {
    threw = true;
    assert(std::string(err.what()).find("infinity") != std::string::npos);
  }
  assert(threw);

  threw = false;
  try {
    inf.consume_into(z.value);
  } catch (const mpfloat::FloatError&) {
    threw = true;
  }
  assert(threw);
  assert(inf.state() == LifecycleState::Cleared);
}

void test_word_setters_and_getters() {
  Float value;
  value.set_long(-7);
  assert(value.get_long() == -7);
  value.set_ulong(9U);
  assert(value.get_ulong() == 9U);
  value.set_long_double(0.25L);
  assert(value.get_long_double() == 0.25L);
  value.set_double(-1.5);
  assert(value.get_double() == -1.5);
  assert(value.consume_double() == -1.5);
  assert(value.state() == LifecycleState::Cleared);
}

void test_mpz_to_decimal_string() {
  GmpInt value;
  mpz_set_si(value.value, -42);
  assert(mpfloat::mpz_to_decimal_string(value.value) == "-42");
  mpz_set_ui(value.value, 0U);
  assert(mpfloat::mpz_to_decimal_string(value.value) == "0");
}

}  // namespace

void run_integer_bridge_tests() {
  test_conversion_path_boundaries();
  test_int64_extremes_survive_both_paths();
  test_uint64_extremes();
  test_decimal_text_rounds_with_target_mode();
  test_mpz_round_trip();
  test_mpf_endpoints();
  test_to_mpz_truncates_toward_zero();
  test_non_finite_conversions_fail();
  test_word_setters_and_getters();
  test_mpz_to_decimal_string();
}

}  // namespace core_test
