#pragma once

#include <map>
#include <string>
#include <string_view>

#include "mpfloat/config.h"
#include "mpfloat/decimal_codec.h"
#include "mpfloat/errors.h"
#include "mpfloat/float.h"
#include "mpfloat/integer_bridge.h"
#include "mpfloat/ops.h"

namespace core_test {

mpfloat::Float decimal(std::string_view text, mpfr_prec_t precision = 0);
mpfloat::EnvLookup map_lookup(const std::map<std::string, std::string>& values);

// Positional text with trailing fractional zeros trimmed.
std::string trimmed(const mpfloat::Float& value);

void expect_text(const mpfloat::Float& value, const std::string& expected);
void expect_trimmed(const mpfloat::Float& value, const std::string& expected);
void expect_value(const mpfloat::Float& value, double expected);
void expect_close(const mpfloat::Float& value, double expected, double tol, std::string_view context);

// Enables pooling with a known capacity and drops pooled handles.
void reset_handle_pool(std::size_t capacity = 64);

void run_lifecycle_tests();
void run_rounding_tests();
void run_fold_protocol_tests();
void run_fold_protocol_extreme_tests();
void run_decimal_codec_tests();
void run_decimal_codec_extreme_tests();
void run_integer_bridge_tests();
void run_fit_predicate_tests();
void run_config_tests();
void run_transcendental_tests();

}  // namespace core_test
