#include "mpfloat/ops.h"

#include <algorithm>

namespace mpfloat {

namespace {

Float fresh_accumulator(mpfr_prec_t precision, RoundingMode mode) {
  Float acc(precision);
  acc.set_rounding_mode(mode);
  return acc;
}

template <typename Fold>
Float fold_pair(const Float& x, const Float& y, RoundingMode mode, Fold fold) {
  Float acc = fresh_accumulator(std::max(x.precision(), y.precision()), mode);
  acc.assign(x);
  fold(acc, y);
  return acc;
}

Float unary_result(const Float& x, RoundingMode mode, UnaryKernel kernel) {
  Float acc = fresh_accumulator(x.precision(), mode);
  acc.apply_to(kernel, x);
  return acc;
}

}  // namespace

Float add(const Float& x, const Float& y, RoundingMode mode) {
  return fold_pair(x, y, mode, [](Float& acc, const Float& rhs) { acc.add(rhs); });
}

Float sub(const Float& x, const Float& y, RoundingMode mode) {
  return fold_pair(x, y, mode, [](Float& acc, const Float& rhs) { acc.sub(rhs); });
}

Float mul(const Float& x, const Float& y, RoundingMode mode) {
  return fold_pair(x, y, mode, [](Float& acc, const Float& rhs) { acc.mul(rhs); });
}

Float div(const Float& x, const Float& y, RoundingMode mode) {
  return fold_pair(x, y, mode, [](Float& acc, const Float& rhs) { acc.div(rhs); });
}

Float quotient(const Float& x, const Float& y, RoundingMode mode) {
  return fold_pair(x, y, mode, [](Float& acc, const Float& rhs) { acc.quotient(rhs); });
}

Float pow(const Float& x, const Float& y, RoundingMode mode) {
  return fold_pair(x, y, mode, [](Float& acc, const Float& rhs) { acc.pow(rhs); });
}

Float fmod(const Float& x, const Float& y, RoundingMode mode) {
  return fold_pair(x, y, mode, [](Float& acc, const Float& rhs) { acc.fmod(rhs); });
}

Float remainder(const Float& x, const Float& y, RoundingMode mode) {
  return fold_pair(x, y, mode, [](Float& acc, const Float& rhs) { acc.remainder(rhs); });
}

Float max(const Float& x, const Float& y, RoundingMode mode) {
  return fold_pair(x, y, mode, [](Float& acc, const Float& rhs) { acc.max(rhs); });
}

Float min(const Float& x, const Float& y, RoundingMode mode) {
  return fold_pair(x, y, mode, [](Float& acc, const Float& rhs) { acc.min(rhs); });
}

Float hypot(const Float& x, const Float& y, RoundingMode mode) {
  return fold_pair(x, y, mode, [](Float& acc, const Float& rhs) { acc.hypot(rhs); });
}

Float agm(const Float& x, const Float& y, RoundingMode mode) {
  return fold_pair(x, y, mode, [](Float& acc, const Float& rhs) { acc.agm(rhs); });
}

Float atan2(const Float& y, const Float& x, RoundingMode mode) {
  return fold_pair(y, x, mode, [](Float& acc, const Float& rhs) { acc.atan2(rhs); });
}

Float dim(const Float& x, const Float& y, RoundingMode mode) {
  return fold_pair(x, y, mode, [](Float& acc, const Float& rhs) { acc.dim(rhs); });
}

Float neg(const Float& x, RoundingMode mode) { return unary_result(x, mode, &mpfr_neg); }
Float abs(const Float& x, RoundingMode mode) { return unary_result(x, mode, &mpfr_abs); }
Float sqr(const Float& x, RoundingMode mode) { return unary_result(x, mode, &mpfr_sqr); }
Float sqrt(const Float& x, RoundingMode mode) { return unary_result(x, mode, &mpfr_sqrt); }
Float rec_sqrt(const Float& x, RoundingMode mode) { return unary_result(x, mode, &mpfr_rec_sqrt); }
Float cbrt(const Float& x, RoundingMode mode) { return unary_result(x, mode, &mpfr_cbrt); }
Float exp(const Float& x, RoundingMode mode) { return unary_result(x, mode, &mpfr_exp); }
Float exp2(const Float& x, RoundingMode mode) { return unary_result(x, mode, &mpfr_exp2); }
Float exp10(const Float& x, RoundingMode mode) { return unary_result(x, mode, &mpfr_exp10); }
Float expm1(const Float& x, RoundingMode mode) { return unary_result(x, mode, &mpfr_expm1); }
Float log(const Float& x, RoundingMode mode) { return unary_result(x, mode, &mpfr_log); }
Float log2(const Float& x, RoundingMode mode) { return unary_result(x, mode, &mpfr_log2); }
Float log10(const Float& x, RoundingMode mode) { return unary_result(x, mode, &mpfr_log10); }
Float log1p(const Float& x, RoundingMode mode) { return unary_result(x, mode, &mpfr_log1p); }
Float sin(const Float& x, RoundingMode mode) { return unary_result(x, mode, &mpfr_sin); }
Float cos(const Float& x, RoundingMode mode) { return unary_result(x, mode, &mpfr_cos); }
Float tan(const Float& x, RoundingMode mode) { return unary_result(x, mode, &mpfr_tan); }
Float sec(const Float& x, RoundingMode mode) { return unary_result(x, mode, &mpfr_sec); }
Float csc(const Float& x, RoundingMode mode) { return unary_result(x, mode, &mpfr_csc); }
Float cot(const Float& x, RoundingMode mode) { return unary_result(x, mode, &mpfr_cot); }
Float asin(const Float& x, RoundingMode mode) { return unary_result(x, mode, &mpfr_asin); }
Float acos(const Float& x, RoundingMode mode) { return unary_result(x, mode, &mpfr_acos); }
Float atan(const Float& x, RoundingMode mode) { return unary_result(x, mode, &mpfr_atan); }
Float sinh(const Float& x, RoundingMode mode) { return unary_result(x, mode, &mpfr_sinh); }
Float cosh(const Float& x, RoundingMode mode) { return unary_result(x, mode, &mpfr_cosh); }
Float tanh(const Float& x, RoundingMode mode) { return unary_result(x, mode, &mpfr_tanh); }
Float sech(const Float& x, RoundingMode mode) { return unary_result(x, mode, &mpfr_sech); }
Float csch(const Float& x, RoundingMode mode) { return unary_result(x, mode, &mpfr_csch); }
Float coth(const Float& x, RoundingMode mode) { return unary_result(x, mode, &mpfr_coth); }
Float asinh(const Float& x, RoundingMode mode) { return unary_result(x, mode, &mpfr_asinh); }
Float acosh(const Float& x, RoundingMode mode) { return unary_result(x, mode, &mpfr_acosh); }
Float atanh(const Float& x, RoundingMode mode) { return unary_result(x, mode, &mpfr_atanh); }
Float gamma(const Float& x, RoundingMode mode) { return unary_result(x, mode, &mpfr_gamma); }
Float lngamma(const Float& x, RoundingMode mode) { return unary_result(x, mode, &mpfr_lngamma); }
Float digamma(const Float& x, RoundingMode mode) { return unary_result(x, mode, &mpfr_digamma); }
Float zeta(const Float& x, RoundingMode mode) { return unary_result(x, mode, &mpfr_zeta); }
Float erf(const Float& x, RoundingMode mode) { return unary_result(x, mode, &mpfr_erf); }
Float erfc(const Float& x, RoundingMode mode) { return unary_result(x, mode, &mpfr_erfc); }
Float eint(const Float& x, RoundingMode mode) { return unary_result(x, mode, &mpfr_eint); }
Float li2(const Float& x, RoundingMode mode) { return unary_result(x, mode, &mpfr_li2); }
Float ai(const Float& x, RoundingMode mode) { return unary_result(x, mode, &mpfr_ai); }
Float j0(const Float& x, RoundingMode mode) { return unary_result(x, mode, &mpfr_j0); }
Float j1(const Float& x, RoundingMode mode) { return unary_result(x, mode, &mpfr_j1); }
Float y0(const Float& x, RoundingMode mode) { return unary_result(x, mode, &mpfr_y0); }
Float y1(const Float& x, RoundingMode mode) { return unary_result(x, mode, &mpfr_y1); }
Float frac(const Float& x, RoundingMode mode) { return unary_result(x, mode, &mpfr_frac); }
Float ceil(const Float& x, RoundingMode mode) { return unary_result(x, mode, &mpfr_rint_ceil); }
Float floor(const Float& x, RoundingMode mode) { return unary_result(x, mode, &mpfr_rint_floor); }
Float round(const Float& x, RoundingMode mode) { return unary_result(x, mode, &mpfr_rint_round); }
Float roundeven(const Float& x, RoundingMode mode) {
  return unary_result(x, mode, &mpfr_rint_roundeven);
}
Float trunc(const Float& x, RoundingMode mode) { return unary_result(x, mode, &mpfr_rint_trunc); }
Float rint(const Float& x, RoundingMode mode) { return unary_result(x, mode, &mpfr_rint); }

Float jn(long n, const Float& x, RoundingMode mode) {
  Float acc = fresh_accumulator(x.precision(), mode);
  acc.jn(n, x);
  return acc;
}

Float yn(long n, const Float& x, RoundingMode mode) {
  Float acc = fresh_accumulator(x.precision(), mode);
  acc.yn(n, x);
  return acc;
}

Float root(unsigned long k, const Float& x, RoundingMode mode) {
  Float acc = fresh_accumulator(x.precision(), mode);
  acc.root(k, x);
  return acc;
}

Float fma(const Float& x, const Float& y, const Float& z, RoundingMode mode) {
  Float acc = fresh_accumulator(std::max({x.precision(), y.precision(), z.precision()}), mode);
  acc.fma(x, y, z);
  return acc;
}

Float fms(const Float& x, const Float& y, const Float& z, RoundingMode mode) {
  Float acc = fresh_accumulator(std::max({x.precision(), y.precision(), z.precision()}), mode);
  acc.fms(x, y, z);
  return acc;
}

Float fmma(const Float& a, const Float& b, const Float& c, const Float& d, RoundingMode mode) {
  Float acc = fresh_accumulator(
      std::max({a.precision(), b.precision(), c.precision(), d.precision()}), mode);
  acc.fmma(a, b, c, d);
  return acc;
}

Float fmms(const Float& a, const Float& b, const Float& c, const Float& d, RoundingMode mode) {
  Float acc = fresh_accumulator(
      std::max({a.precision(), b.precision(), c.precision(), d.precision()}), mode);
  acc.fmms(a, b, c, d);
  return acc;
}

Float gamma_inc(const Float& a, const Float& x, RoundingMode mode) {
  Float acc = fresh_accumulator(std::max(a.precision(), x.precision()), mode);
  acc.gamma_inc(a, x);
  return acc;
}

Float reldiff(const Float& x, const Float& y, RoundingMode mode) {
  Float acc = fresh_accumulator(std::max(x.precision(), y.precision()), mode);
  acc.reldiff(x, y);
  return acc;
}

std::pair<Float, int> lgamma(const Float& x, RoundingMode mode) {
  Float acc = fresh_accumulator(x.precision(), mode);
  const int sign = acc.lgamma(x);
  return {std::move(acc), sign};
}

std::pair<Float, long> fmodquo(const Float& x, const Float& y, RoundingMode mode) {
  Float acc = fresh_accumulator(std::max(x.precision(), y.precision()), mode);
  const long quotient_bits = acc.fmodquo(x, y);
  return {std::move(acc), quotient_bits};
}

std::pair<Float, long> remquo(const Float& x, const Float& y, RoundingMode mode) {
  Float acc = fresh_accumulator(std::max(x.precision(), y.precision()), mode);
  const long quotient_bits = acc.remquo(x, y);
  return {std::move(acc), quotient_bits};
}

Float next_above(const Float& x) {
  Float acc = fresh_accumulator(x.precision(), x.rounding_mode());
  acc.assign(x);
  acc.next_above();
  return acc;
}

Float next_below(const Float& x) {
  Float acc = fresh_accumulator(x.precision(), x.rounding_mode());
  acc.assign(x);
  acc.next_below();
  return acc;
}

Float next_toward(const Float& x, const Float& y) {
  Float acc = fresh_accumulator(x.precision(), x.rounding_mode());
  acc.assign(x);
  acc.next_toward(y);
  return acc;
}

Float const_pi(mpfr_prec_t precision, RoundingMode mode) {
  Float acc = fresh_accumulator(precision, mode);
  acc.set_pi();
  return acc;
}

Float const_e(mpfr_prec_t precision, RoundingMode mode) {
  Float acc = fresh_accumulator(precision, mode);
  acc.set_e();
  return acc;
}

Float const_log2(mpfr_prec_t precision, RoundingMode mode) {
  Float acc = fresh_accumulator(precision, mode);
  acc.set_log2();
  return acc;
}

Float const_euler(mpfr_prec_t precision, RoundingMode mode) {
  Float acc = fresh_accumulator(precision, mode);
  acc.set_euler();
  return acc;
}

Float const_catalan(mpfr_prec_t precision, RoundingMode mode) {
  Float acc = fresh_accumulator(precision, mode);
  acc.set_catalan();
  return acc;
}

mpfr_prec_t min_prec(const Float& x, const Float& y) {
  return std::min(x.min_prec(), y.min_prec());
}

std::pair<Float, Float> modf(const Float& x, RoundingMode mode) {
  Float integral = fresh_accumulator(x.precision(), mode);
  Float fractional = fresh_accumulator(x.precision(), mode);
  mpfr_modf(integral.native(), fractional.native(), x.native(), to_mpfr_rnd(mode));
  return {std::move(integral), std::move(fractional)};
}

int cmp(const Float& x, const Float& y) {
  return x.cmp(y);
}

int cmpabs(const Float& x, const Float& y) {
  return x.cmpabs(y);
}

bool greater(const Float& x, const Float& y) {
  return x.greater(y);
}

bool greater_equal(const Float& x, const Float& y) {
  return x.greater_equal(y);
}

bool less(const Float& x, const Float& y) {
  return x.less(y);
}

bool less_equal(const Float& x, const Float& y) {
  return x.less_equal(y);
}

bool less_greater(const Float& x, const Float& y) {
  return x.less_greater(y);
}

bool equal(const Float& x, const Float& y) {
  return x.equal(y);
}

bool unordered(const Float& x, const Float& y) {
  return x.unordered(y);
}

Float operator+(const Float& lhs, const Float& rhs) {
  return add(lhs, rhs, lhs.rounding_mode());
}

Float operator-(const Float& lhs, const Float& rhs) {
  return sub(lhs, rhs, lhs.rounding_mode());
}

Float operator*(const Float& lhs, const Float& rhs) {
  return mul(lhs, rhs, lhs.rounding_mode());
}

Float operator/(const Float& lhs, const Float& rhs) {
  return div(lhs, rhs, lhs.rounding_mode());
}

Float operator-(const Float& value) {
  return neg(value, value.rounding_mode());
}

bool operator==(const Float& lhs, const Float& rhs) {
  return lhs.equal(rhs);
}

bool operator!=(const Float& lhs, const Float& rhs) {
  return !lhs.equal(rhs);
}

bool operator<(const Float& lhs, const Float& rhs) {
  return lhs.less(rhs);
}

bool operator<=(const Float& lhs, const Float& rhs) {
  return lhs.less_equal(rhs);
}

bool operator>(const Float& lhs, const Float& rhs) {
  return lhs.greater(rhs);
}

bool operator>=(const Float& lhs, const Float& rhs) {
  return lhs.greater_equal(rhs);
}

}  // namespace mpfloat
