#include <cassert>

#include "core_support.h"

namespace core_test {
namespace {

using mpfloat::Float;

void test_add_instance_and_free_forms() {
  const Float a = Float::from_double(1.5);
  const Float b = Float::from_double(2.25);
  Float acc;
  acc.add(a, b);
  expect_trimmed(acc, "3.75");
  expect_trimmed(mpfloat::add(a, b), "3.75");
  expect_trimmed(a + b, "3.75");
}

void test_fold_reads_accumulator_as_left_operand() {
  const Float x = Float::from_double(5.0);
  const Float y = Float::from_double(3.1);

  Float fresh;
  fresh.sub(x, y);
  expect_value(fresh, -(5.0 + 3.1));

  Float seeded = Float::from_double(5.0);
  seeded.sub(y);
  expect_close(seeded, 1.9, 1e-15, "seeded sub");
  expect_close(mpfloat::sub(x, y), 1.9, 1e-15, "free sub");
}

void test_fold_order_is_left_to_right() {
  Float difference = Float::from_int(10);
  difference.sub(Float::from_int(4), Float::from_int(3));
  expect_value(difference, 3.0);

  Float ratio = Float::from_int(100);
  ratio.div(Float::from_int(2), Float::from_int(5));
  expect_value(ratio, 10.0);

  Float power = Float::from_int(2);
  power.pow(Float::from_int(3), Float::from_int(2));
  expect_value(power, 64.0);
}

void test_zero_operands_leave_binary_fold_unchanged() {
  Float value = Float::from_int(7);
  value.add();
  value.mul();
  value.div();
  value.quotient();
  value.max();
  expect_value(value, 7.0);
}

void test_unary_in_place_and_from_operand() {
  Float in_place = Float::from_int(16);
  in_place.sqrt();
  expect_value(in_place, 4.0);

  const Float source = Float::from_int(16);
  Float target = Float::from_int(99);
  target.sqrt(source);
  expect_value(target, 4.0);
  expect_value(source, 16.0);

  Float negated = Float::from_double(2.5);
  negated.neg().abs().sqr();
  expect_value(negated, 6.25);
  expect_value(mpfloat::neg(source), -16.0);
  expect_value(-source, -16.0);
}

void test_chaining_returns_accumulator() {
  Float acc = Float::from_int(1);
  Float& result = acc.add(Float::from_int(2)).mul(Float::from_int(4)).sub(Float::from_int(2));
  assert(&result == &acc);
  expect_value(acc, 10.0);
}

void test_compound_operators_fold_one_operand() {
  Float acc = Float::from_int(6);
  acc += Float::from_int(2);
  acc -= Float::from_int(1);
  acc *= Float::from_int(3);
  acc /= Float::from_int(7);
  expect_value(acc, 3.0);
}

void test_quotient_rejects_zero_operands() {
  Float acc = Float::from_int(10);
  bool threw = false;
  try {
    acc.quotient(Float::from_int(0));
  } catch (const mpfloat::DivisionByZeroError&) {
    threw = true;
  }
  assert(threw);
  expect_value(acc, 10.0);

  threw = false;
  try {
    acc.quotient(Float::from_int(2), Float::from_int(0));
  } catch (const mpfloat::DivisionByZeroError&) {
    threw = true;
  }
  assert(threw);
  expect_value(acc, 10.0);

  threw = false;
  Float negative_zero;
  negative_zero.set_zero(-1);
  try {
    (void)mpfloat::quotient(acc, negative_zero);
  } catch (const mpfloat::DivisionByZeroError&) {
    threw = true;
  }
  assert(threw);

  acc.quotient(Float::from_int(4));
  expect_value(acc, 2.5);
}

void test_div_by_zero_is_ieee() {
  Float positive = Float::from_int(10);
  positive.div(Float::from_int(0));
  assert(positive.is_inf());
  assert(positive.sign() > 0);

  Float negative = Float::from_int(-10);
  negative.div(Float::from_int(0));
  assert(negative.is_inf());
  assert(negative.sign() < 0);

  Float nan = Float::from_int(0);
  nan.div(Float::from_int(0));
  assert(nan.is_nan());
}

void test_binary_kernels() {
  expect_value(mpfloat::fmod(Float::from_int(10), Float::from_int(3)), 1.0);
  expect_value(mpfloat::remainder(Float::from_int(10), Float::from_int(3)), 1.0);
  expect_value(mpfloat::remainder(Float::from_int(11), Float::from_int(3)), -1.0);
  expect_value(mpfloat::pow(Float::from_int(2), Float::from_int(10)), 1024.0);
  expect_value(mpfloat::hypot(Float::from_int(3), Float::from_int(4)), 5.0);
  expect_value(mpfloat::dim(Float::from_int(5), Float::from_int(3)), 2.0);
  expect_value(mpfloat::dim(Float::from_int(3), Float::from_int(5)), 0.0);
  expect_value(mpfloat::max(Float::from_int(3), Float::from_int(5)), 5.0);
  expect_value(mpfloat::min(Float::from_int(3), Float::from_int(5)), 3.0);
  expect_close(mpfloat::agm(Float::from_int(1), Float::from_int(9)), 3.936235503649555, 1e-12, "agm(1,9)");
  expect_close(mpfloat::atan2(Float::from_int(1), Float::from_int(1)), 0.7853981633974483, 1e-15,
               "atan2(1,1)");
  expect_value(mpfloat::mul(Float::from_double(1.5), Float::from_int(4)), 6.0);
  expect_value(mpfloat::div(Float::from_int(9), Float::from_int(4)), 2.25);
}

void test_free_form_precision_is_widest_operand() {
  const Float narrow = Float::from_int(1, 24);
  const Float wide = Float::from_int(1, 200);
  assert(mpfloat::add(narrow, wide).precision() == 200);
  assert(mpfloat::add(wide, narrow).precision() == 200);
  assert(mpfloat::sqrt(narrow).precision() == 24);
}

void test_kernel_entry_points() {
  Float value = Float::from_int(9);
  value.apply_in_place(&mpfr_sqrt);
  expect_value(value, 3.0);
  value.apply_to(&mpfr_sqr, Float::from_int(5));
  expect_value(value, 25.0);
  const Float one = Float::from_int(1);
  const Float two = Float::from_int(2);
  value.fold_all(&mpfr_sub, {&one, &two});
  expect_value(value, 22.0);
  value.fold_all(&mpfr_add, {});
  expect_value(value, 22.0);
}

}  // namespace

void run_fold_protocol_tests() {
  test_add_instance_and_free_forms();
  test_fold_reads_accumulator_as_left_operand();
  test_fold_order_is_left_to_right();
  test_zero_operands_leave_binary_fold_unchanged();
  test_unary_in_place_and_from_operand();
  test_chaining_returns_accumulator();
  test_compound_operators_fold_one_operand();
  test_quotient_rejects_zero_operands();
  test_div_by_zero_is_ieee();
  test_binary_kernels();
  test_free_form_precision_is_widest_operand();
  test_kernel_entry_points();
}

}  // namespace core_test
