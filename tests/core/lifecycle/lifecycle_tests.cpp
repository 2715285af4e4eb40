#include <cassert>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include "core_support.h"

namespace core_test {
namespace {

using mpfloat::Float;
using mpfloat::LifecycleState;
using mpfloat::runtime::HandlePool;

void test_lazy_initialization() {
  Float value;
  assert(value.state() == LifecycleState::Uninitialized);
  assert(!value.initialized());
  assert(value.precision() == 53);
  expect_text(value, "0.0");
  assert(value.state() == LifecycleState::Initialized);
  assert(value.is_zero());
  assert(value.sign() == 0);
}

void test_const_operands_initialize_lazily() {
  const Float operand;
  Float acc = Float::from_int(4);
  acc.add(operand);
  assert(operand.state() == LifecycleState::Initialized);
  expect_value(acc, 4.0);
}

void test_clear_is_idempotent() {
  reset_handle_pool();
  auto& pool = HandlePool::local();
  const auto before = pool.stats();
  Float value(100);
  value.set_double(5.0);
  assert(pool.stats().live == before.live + 1);
  value.clear();
  assert(value.state() == LifecycleState::Cleared);
  const auto after_first = pool.stats();
  assert(after_first.live == before.live);
  value.clear();
  const auto after_second = pool.stats();
  assert(value.state() == LifecycleState::Cleared);
  assert(after_second.live == after_first.live);
  assert(after_second.released_total == after_first.released_total);
}

void test_cleared_value_reinitializes_to_zero() {
  Float value(100);
  value.set_double(5.0);
  value.clear();
  assert(value.precision() == 100);
  assert(value.is_zero());
  assert(value.state() == LifecycleState::Initialized);
  assert(value.precision() == 100);
  value.add(Float::from_int(3));
  expect_value(value, 3.0);
}

void test_cleared_handle_is_reused() {
  reset_handle_pool();
  auto& pool = HandlePool::local();
  Float first(64);
  first.set_long(9);
  first.clear();
  const auto before = pool.stats();
  Float second(64);
  second.ensure_initialized();
  const auto after = pool.stats();
  assert(after.reused_total == before.reused_total + 1);
  assert(second.is_zero());
}

void test_destructor_releases_handle() {
  reset_handle_pool();
  auto& pool = HandlePool::local();
  const auto before = pool.stats();
  {
    Float scoped(256);
    scoped.set_pi();
    assert(pool.stats().live == before.live + 1);
  }
  assert(pool.stats().live == before.live);
  {
    Float never_used(256);
  }
  assert(pool.stats().acquired_total == before.acquired_total + 1);
}

void test_release_guard_clears_on_every_exit() {
  Float a = Float::from_int(1);
  Float b = Float::from_int(2);
  {
    mpfloat::ReleaseGuard guard{&a, &b};
    assert(guard.size() == 2);
  }
  assert(a.state() == LifecycleState::Cleared);
  assert(b.state() == LifecycleState::Cleared);

  Float c = Float::from_int(3);
  bool threw = false;
  try {
    mpfloat::ReleaseGuard guard;
    guard.hold(c);
    throw std::runtime_error("leave scope");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
  assert(c.state() == LifecycleState::Cleared);
}

void test_move_leaves_source_uninitialized() {
  Float source(80);
  source.set_double(2.5);
  source.set_rounding_mode(mpfloat::RoundingMode::Up);
  Float moved(std::move(source));
  assert(source.state() == LifecycleState::Uninitialized);
  assert(moved.precision() == 80);
  assert(moved.rounding_mode() == mpfloat::RoundingMode::Up);
  expect_value(moved, 2.5);
  assert(source.is_zero());

  Float target(20);
  target.set_rounding_mode(mpfloat::RoundingMode::Down);
  target = std::move(moved);
  assert(moved.state() == LifecycleState::Uninitialized);
  assert(target.precision() == 80);
  assert(target.rounding_mode() == mpfloat::RoundingMode::Down);
  expect_value(target, 2.5);
}

void test_copy_construct_and_assign() {
  Float pi(200);
  pi.set_rounding_mode(mpfloat::RoundingMode::TowardZero);
  pi.set_pi();

  Float copy(pi);
  assert(copy.precision() == 200);
  assert(copy.rounding_mode() == mpfloat::RoundingMode::TowardZero);
  assert(copy == pi);
  copy.add(Float::from_int(1));
  assert(copy != pi);

  Float narrow(10);
  narrow.set_rounding_mode(mpfloat::RoundingMode::Up);
  narrow = pi;
  assert(narrow.precision() == 10);
  assert(narrow.rounding_mode() == mpfloat::RoundingMode::Up);
  assert(narrow > pi);
  // 10 bits hold 3.1406 and 3.1445 around pi; rounding up picks the latter.
  expect_value(narrow, 3.14453125);

  Float uninitialized_source;
  Float copied_zero(uninitialized_source);
  assert(copied_zero.state() == LifecycleState::Uninitialized);
  assert(copied_zero.is_zero());
}

void test_swap_exchanges_values_not_modes() {
  Float left(64);
  left.set_long(1);
  left.set_rounding_mode(mpfloat::RoundingMode::Up);
  Float right(128);
  right.set_long(2);
  right.set_rounding_mode(mpfloat::RoundingMode::Down);

  left.swap(right);
  expect_value(left, 2.0);
  expect_value(right, 1.0);
  assert(left.precision() == 128);
  assert(right.precision() == 64);
  assert(left.rounding_mode() == mpfloat::RoundingMode::Up);
  assert(right.rounding_mode() == mpfloat::RoundingMode::Down);

  swap(left, right);
  expect_value(left, 1.0);
}

void test_precision_preserving_and_resetting() {
  Float value(53);
  value.set_double(3.141592653589793);
  value.set_precision(128);
  assert(value.precision() == 128);
  expect_value(value, 3.141592653589793);

  value.reset_precision(64);
  assert(value.precision() == 64);
  assert(value.is_zero());
  assert(value.sign() == 0);

  bool threw = false;
  value.set_long(7);
  try {
    value.set_precision(0);
  } catch (const mpfloat::FloatError&) {
    threw = true;
  }
  assert(threw);
  assert(value.precision() == 64);
  expect_value(value, 7.0);

  Float lazy;
  lazy.set_precision(300);
  assert(lazy.state() == LifecycleState::Uninitialized);
  assert(lazy.precision() == 300);
  lazy.ensure_initialized();
  assert(mpfr_get_prec(lazy.native()) == 300);
}

void test_state_names() {
  Float value;
  assert(std::string(mpfloat::lifecycle_state_name(value.state())) == "uninitialized");
  value.ensure_initialized();
  assert(std::string(mpfloat::lifecycle_state_name(value.state())) == "initialized");
  value.clear();
  assert(std::string(mpfloat::lifecycle_state_name(value.state())) == "cleared");
}

void test_vector_growth_moves_handles() {
  static_assert(std::is_nothrow_move_constructible<Float>::value, "Float move must not throw");
  static_assert(std::is_nothrow_move_assignable<Float>::value, "Float move must not throw");

  std::vector<Float> values;
  values.push_back(Float::from_int(1, 96));
  const mpfr_srcptr first_handle = values.front().native();
  for (long i = 2; i <= 40; ++i) {
    values.push_back(Float::from_int(i, 96));
  }
  // Reallocation moved the first element, so it still owns its handle.
  assert(values.front().native() == first_handle);
  for (std::size_t i = 0; i < values.size(); ++i) {
    expect_value(values[i], static_cast<double>(i + 1));
    assert(values[i].precision() == 96);
  }
}

void test_min_prec_and_cache_release() {
  Float value(200);
  value.set_long(12);
  assert(value.min_prec() == 2);
  value.set_pi();
  mpfloat::free_cache();
  mpfloat::memory_cleanup();
  expect_close(value, 3.141592653589793, 1e-15, "pi after free_cache");
}

}  // namespace

void run_lifecycle_tests() {
  test_lazy_initialization();
  test_const_operands_initialize_lazily();
  test_clear_is_idempotent();
  test_cleared_value_reinitializes_to_zero();
  test_cleared_handle_is_reused();
  test_destructor_releases_handle();
  test_release_guard_clears_on_every_exit();
  test_move_leaves_source_uninitialized();
  test_copy_construct_and_assign();
  test_swap_exchanges_values_not_modes();
  test_precision_preserving_and_resetting();
  test_min_prec_and_cache_release();
  test_state_names();
  test_vector_growth_moves_handles();
}

}  // namespace core_test
