#pragma once

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>
#include <vector>

#include <gmp.h>
#include <mpfr.h>

#include "mpfloat/decimal_codec.h"
#include "mpfloat/errors.h"
#include "mpfloat/handle_pool.h"
#include "mpfloat/rounding.h"

namespace mpfloat {

enum class LifecycleState {
  Uninitialized,
  Initialized,
  Cleared,
};

const char* lifecycle_state_name(LifecycleState state);

using BinaryKernel = int (*)(mpfr_ptr, mpfr_srcptr, mpfr_srcptr, mpfr_rnd_t);
using UnaryKernel = int (*)(mpfr_ptr, mpfr_srcptr, mpfr_rnd_t);

// Arbitrary-precision binary float backed by one pooled mpfr_t.
//
// A value is lazily initialized to +0 on first use (const access included), so
// no MPFR call ever sees an uninitialized handle. clear() hands the handle back
// early; the destructor does it otherwise. Every in-place operation rounds with
// the value's own rounding mode.
class Float {
 public:
  // Precision 0 selects default_precision() at initialization time.
  Float();
  explicit Float(mpfr_prec_t precision);
  Float(const Float& other);
  Float(Float&& other) noexcept;
  // Copies the magnitude, rounded to this value's precision and mode. The
  // rounding mode of `other` is not copied.
  Float& operator=(const Float& other);
  // Adopts the handle and precision of `other`; keeps this value's mode.
  Float& operator=(Float&& other) noexcept;
  ~Float();

  static Float from_int(long value, mpfr_prec_t precision = 0);
  static Float from_int64(std::int64_t value, mpfr_prec_t precision = 0);
  static Float from_uint64(std::uint64_t value, mpfr_prec_t precision = 0);
  static Float from_double(double value, mpfr_prec_t precision = 0);
  static Float from_mpz(mpz_srcptr value, mpfr_prec_t precision = 0);
  static Float from_mpf(mpf_srcptr value, mpfr_prec_t precision = 0);
  // Throws InvalidStringError.
  static Float from_string(std::string_view text, int base = 10, mpfr_prec_t precision = 0);

  // Lifecycle.
  void ensure_initialized() const;
  void clear();
  LifecycleState state() const;
  bool initialized() const;
  mpfr_ptr native();
  mpfr_srcptr native() const;

  // Rounding mode and precision.
  void set_rounding_mode(RoundingMode mode);
  RoundingMode rounding_mode() const;
  mpfr_rnd_t rnd() const;
  mpfr_prec_t precision() const;
  // Keeps the value, rounded to `bits` with this value's mode.
  void set_precision(mpfr_prec_t bits);
  // Changes precision and sets the value to +0.
  void reset_precision(mpfr_prec_t bits);
  mpfr_prec_t min_prec() const;

  Float& assign(const Float& x);
  void swap(Float& other);

  // Fold protocol. The three entry points share one reduction.
  Float& apply_in_place(UnaryKernel kernel);
  Float& apply_to(UnaryKernel kernel, const Float& operand);
  Float& fold_all(BinaryKernel kernel, std::initializer_list<const Float*> operands);

  // Binary folds: acc = ((acc op x1) op x2) ... op xN. No operands leaves acc
  // unchanged.
  Float& add() { return *this; }
  template <typename... Rest>
  Float& add(const Float& first, const Rest&... rest) {
    return fold_all(&mpfr_add, {&first, &rest...});
  }
  Float& sub() { return *this; }
  template <typename... Rest>
  Float& sub(const Float& first, const Rest&... rest) {
    return fold_all(&mpfr_sub, {&first, &rest...});
  }
  Float& mul() { return *this; }
  template <typename... Rest>
  Float& mul(const Float& first, const Rest&... rest) {
    return fold_all(&mpfr_mul, {&first, &rest...});
  }
  Float& div() { return *this; }
  template <typename... Rest>
  Float& div(const Float& first, const Rest&... rest) {
    return fold_all(&mpfr_div, {&first, &rest...});
  }
  // Like div, but any exactly-zero operand throws DivisionByZeroError before
  // anything is computed.
  Float& quotient() { return *this; }
  template <typename... Rest>
  Float& quotient(const Float& first, const Rest&... rest) {
    return checked_quotient({&first, &rest...});
  }
  Float& pow() { return *this; }
  template <typename... Rest>
  Float& pow(const Float& first, const Rest&... rest) {
    return fold_all(&mpfr_pow, {&first, &rest...});
  }
  Float& fmod() { return *this; }
  template <typename... Rest>
  Float& fmod(const Float& first, const Rest&... rest) {
    return fold_all(&mpfr_fmod, {&first, &rest...});
  }
  Float& remainder() { return *this; }
  template <typename... Rest>
  Float& remainder(const Float& first, const Rest&... rest) {
    return fold_all(&mpfr_remainder, {&first, &rest...});
  }
  Float& max() { return *this; }
  template <typename... Rest>
  Float& max(const Float& first, const Rest&... rest) {
    return fold_all(&mpfr_max, {&first, &rest...});
  }
  Float& min() { return *this; }
  template <typename... Rest>
  Float& min(const Float& first, const Rest&... rest) {
    return fold_all(&mpfr_min, {&first, &rest...});
  }
  Float& hypot() { return *this; }
  template <typename... Rest>
  Float& hypot(const Float& first, const Rest&... rest) {
    return fold_all(&mpfr_hypot, {&first, &rest...});
  }
  Float& agm() { return *this; }
  template <typename... Rest>
  Float& agm(const Float& first, const Rest&... rest) {
    return fold_all(&mpfr_agm, {&first, &rest...});
  }
  Float& atan2() { return *this; }
  template <typename... Rest>
  Float& atan2(const Float& first, const Rest&... rest) {
    return fold_all(&mpfr_atan2, {&first, &rest...});
  }
  Float& dim() { return *this; }
  template <typename... Rest>
  Float& dim(const Float& first, const Rest&... rest) {
    return fold_all(&mpfr_dim, {&first, &rest...});
  }

  Float& operator+=(const Float& rhs);
  Float& operator-=(const Float& rhs);
  Float& operator*=(const Float& rhs);
  Float& operator/=(const Float& rhs);

  // Unary operations: in place, or acc = f(x).
  Float& neg();
  Float& neg(const Float& x);
  Float& abs();
  Float& abs(const Float& x);
  Float& sqr();
  Float& sqr(const Float& x);
  Float& sqrt();
  Float& sqrt(const Float& x);
  Float& rec_sqrt();
  Float& rec_sqrt(const Float& x);
  Float& cbrt();
  Float& cbrt(const Float& x);
  Float& exp();
  Float& exp(const Float& x);
  Float& exp2();
  Float& exp2(const Float& x);
  Float& exp10();
  Float& exp10(const Float& x);
  Float& expm1();
  Float& expm1(const Float& x);
  Float& log();
  Float& log(const Float& x);
  Float& log2();
  Float& log2(const Float& x);
  Float& log10();
  Float& log10(const Float& x);
  Float& log1p();
  Float& log1p(const Float& x);
  Float& sin();
  Float& sin(const Float& x);
  Float& cos();
  Float& cos(const Float& x);
  Float& tan();
  Float& tan(const Float& x);
  Float& sec();
  Float& sec(const Float& x);
  Float& csc();
  Float& csc(const Float& x);
  Float& cot();
  Float& cot(const Float& x);
  Float& asin();
  Float& asin(const Float& x);
  Float& acos();
  Float& acos(const Float& x);
  Float& atan();
  Float& atan(const Float& x);
  Float& sinh();
  Float& sinh(const Float& x);
  Float& cosh();
  Float& cosh(const Float& x);
  Float& tanh();
  Float& tanh(const Float& x);
  Float& sech();
  Float& sech(const Float& x);
  Float& csch();
  Float& csch(const Float& x);
  Float& coth();
  Float& coth(const Float& x);
  Float& asinh();
  Float& asinh(const Float& x);
  Float& acosh();
  Float& acosh(const Float& x);
  Float& atanh();
  Float& atanh(const Float& x);
  Float& gamma();
  Float& gamma(const Float& x);
  Float& lngamma();
  Float& lngamma(const Float& x);
  Float& digamma();
  Float& digamma(const Float& x);
  Float& zeta();
  Float& zeta(const Float& x);
  Float& erf();
  Float& erf(const Float& x);
  Float& erfc();
  Float& erfc(const Float& x);
  Float& eint();
  Float& eint(const Float& x);
  Float& li2();
  Float& li2(const Float& x);
  Float& ai();
  Float& ai(const Float& x);
  Float& j0();
  Float& j0(const Float& x);
  Float& j1();
  Float& j1(const Float& x);
  Float& y0();
  Float& y0(const Float& x);
  Float& y1();
  Float& y1(const Float& x);
  Float& frac();
  Float& frac(const Float& x);
  Float& ceil();
  Float& ceil(const Float& x);
  Float& floor();
  Float& floor(const Float& x);
  Float& round();
  Float& round(const Float& x);
  Float& roundeven();
  Float& roundeven(const Float& x);
  Float& trunc();
  Float& trunc(const Float& x);
  Float& rint();
  Float& rint(const Float& x);

  // Parameterized unary operations.
  Float& jn(long n);
  Float& jn(long n, const Float& x);
  Float& yn(long n);
  Float& yn(long n, const Float& x);
  // Throws InvalidRootDegreeError, NegativeEvenRootError or NaNResultError;
  // the value is unchanged when it throws.
  Float& root(unsigned long k);
  Float& root(unsigned long k, const Float& x);
  // Returns the sign of Gamma.
  int lgamma();
  int lgamma(const Float& x);

  // Explicit-operand operations.
  Float& fma(const Float& x, const Float& y, const Float& z);
  Float& fms(const Float& x, const Float& y, const Float& z);
  Float& fmma(const Float& a, const Float& b, const Float& c, const Float& d);
  Float& fmms(const Float& a, const Float& b, const Float& c, const Float& d);
  Float& gamma_inc(const Float& a, const Float& x);
  // acc = |x - y| / x.
  Float& reldiff(const Float& x, const Float& y);
  // Both return the low bits of the integral quotient.
  long fmodquo(const Float& x, const Float& y);
  long remquo(const Float& x, const Float& y);
  Float& next_above();
  Float& next_below();
  Float& next_toward(const Float& y);

  Float& set_pi();
  Float& set_e();
  Float& set_log2();
  Float& set_euler();
  Float& set_catalan();
  Float& set_nan();
  Float& set_inf(int sign);
  Float& set_zero(int sign);

  // Decimal codec.
  std::string to_string() const;
  std::string to_string(const FormatOptions& options) const;
  ParseStatus set_string(std::string_view text, int base = 10);

  // Integer/decimal bridge.
  Float& set_int64(std::int64_t value);
  Float& set_uint64(std::uint64_t value);
  Float& set_long(long value);
  Float& set_ulong(unsigned long value);
  Float& set_double(double value);
  Float& set_long_double(long double value);
  Float& set_mpz(mpz_srcptr value);
  Float& set_mpf(mpf_srcptr value);
  // Parses decimal text produced by the bridge; throws FloatError on failure.
  Float& set_from_decimal_text(const std::string& text);

  double get_double() const;
  long double get_long_double() const;
  long get_long() const;
  unsigned long get_ulong() const;

  // Truncate toward zero; throw FloatError for NaN and infinities.
  void to_mpz(mpz_ptr out) const;
  void to_mpf(mpf_ptr out) const;

  // The value is Cleared after each of these.
  std::int64_t consume_int64();
  std::uint64_t consume_uint64();
  double consume_double();
  void consume_into(mpz_ptr out);
  void consume_into(mpf_ptr out);

  // Range-fit predicates, rounding with this value's mode.
  bool fits_sint() const;
  bool fits_uint() const;
  bool fits_slong() const;
  bool fits_ulong() const;
  bool fits_sshort() const;
  bool fits_ushort() const;
  bool fits_intmax() const;
  bool fits_uintmax() const;

  // Comparison and classification.
  int cmp(const Float& other) const;
  int cmpabs(const Float& other) const;
  bool greater(const Float& other) const;
  bool greater_equal(const Float& other) const;
  bool less(const Float& other) const;
  bool less_equal(const Float& other) const;
  bool less_greater(const Float& other) const;
  bool equal(const Float& other) const;
  bool unordered(const Float& other) const;
  bool is_nan() const;
  bool is_inf() const;
  bool is_zero() const;
  bool is_regular() const;
  bool is_number() const;
  bool is_integer() const;
  int sign() const;

 private:
  mpfr_prec_t effective_precision() const;
  Float& reduce(BinaryKernel kernel, std::initializer_list<const Float*> operands);
  Float& checked_quotient(std::initializer_list<const Float*> operands);
  Float& checked_root(unsigned long k, const Float& base);

  mutable runtime::HandlePtr handle;
  mutable LifecycleState lifecycle = LifecycleState::Uninitialized;
  mutable mpfr_prec_t requested_precision = 0;
  RoundingMode rounding = RoundingMode::ToNearest;
};

// Clears every held value when the scope exits.
class ReleaseGuard {
 public:
  ReleaseGuard() = default;
  ReleaseGuard(std::initializer_list<Float*> values);
  ~ReleaseGuard();
  ReleaseGuard(const ReleaseGuard&) = delete;
  ReleaseGuard& operator=(const ReleaseGuard&) = delete;

  void hold(Float& value);
  std::size_t size() const;

 private:
  std::vector<Float*> values;
};

void swap(Float& lhs, Float& rhs);

// Drop MPFR's constant caches and the thread's internal memory pools.
void free_cache();
void memory_cleanup();

}  // namespace mpfloat
