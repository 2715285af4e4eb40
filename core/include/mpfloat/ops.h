#pragma once

#include <utility>

#include "mpfloat/float.h"

namespace mpfloat {

// Free-function forms. Each builds a fresh zero accumulator, sets `mode`,
// seeds it with `x` and applies the instance form. Binary results use
// max(prec(x), prec(y)); unary results use prec(x).

Float add(const Float& x, const Float& y, RoundingMode mode = RoundingMode::ToNearest);
Float sub(const Float& x, const Float& y, RoundingMode mode = RoundingMode::ToNearest);
Float mul(const Float& x, const Float& y, RoundingMode mode = RoundingMode::ToNearest);
Float div(const Float& x, const Float& y, RoundingMode mode = RoundingMode::ToNearest);
Float quotient(const Float& x, const Float& y, RoundingMode mode = RoundingMode::ToNearest);
Float pow(const Float& x, const Float& y, RoundingMode mode = RoundingMode::ToNearest);
Float fmod(const Float& x, const Float& y, RoundingMode mode = RoundingMode::ToNearest);
Float remainder(const Float& x, const Float& y, RoundingMode mode = RoundingMode::ToNearest);
Float max(const Float& x, const Float& y, RoundingMode mode = RoundingMode::ToNearest);
Float min(const Float& x, const Float& y, RoundingMode mode = RoundingMode::ToNearest);
Float hypot(const Float& x, const Float& y, RoundingMode mode = RoundingMode::ToNearest);
Float agm(const Float& x, const Float& y, RoundingMode mode = RoundingMode::ToNearest);
Float atan2(const Float& y, const Float& x, RoundingMode mode = RoundingMode::ToNearest);
Float dim(const Float& x, const Float& y, RoundingMode mode = RoundingMode::ToNearest);

Float neg(const Float& x, RoundingMode mode = RoundingMode::ToNearest);
Float abs(const Float& x, RoundingMode mode = RoundingMode::ToNearest);
Float sqr(const Float& x, RoundingMode mode = RoundingMode::ToNearest);
Float sqrt(const Float& x, RoundingMode mode = RoundingMode::ToNearest);
Float rec_sqrt(const Float& x, RoundingMode mode = RoundingMode::ToNearest);
Float cbrt(const Float& x, RoundingMode mode = RoundingMode::ToNearest);
Float exp(const Float& x, RoundingMode mode = RoundingMode::ToNearest);
Float exp2(const Float& x, RoundingMode mode = RoundingMode::ToNearest);
Float exp10(const Float& x, RoundingMode mode = RoundingMode::ToNearest);
Float expm1(const Float& x, RoundingMode mode = RoundingMode::ToNearest);
Float log(const Float& x, RoundingMode mode = RoundingMode::ToNearest);
Float log2(const Float& x, RoundingMode mode = RoundingMode::ToNearest);
Float log10(const Float& x, RoundingMode mode = RoundingMode::ToNearest);
Float log1p(const Float& x, RoundingMode mode = RoundingMode::ToNearest);
Float sin(const Float& x, RoundingMode mode = RoundingMode::ToNearest);
Float cos(const Float& x, RoundingMode mode = RoundingMode::ToNearest);
Float tan(const Float& x, RoundingMode mode = RoundingMode::ToNearest);
Float sec(const Float& x, RoundingMode mode = RoundingMode::ToNearest);
Float csc(const Float& x, RoundingMode mode = RoundingMode::ToNearest);
Float cot(const Float& x, RoundingMode mode = RoundingMode::ToNearest);
Float asin(const Float& x, RoundingMode mode = RoundingMode::ToNearest);
Float acos(const Float& x, RoundingMode mode = RoundingMode::ToNearest);
Float atan(const Float& x, RoundingMode mode = RoundingMode::ToNearest);
Float sinh(const Float& x, RoundingMode mode = RoundingMode::ToNearest);
Float cosh(const Float& x, RoundingMode mode = RoundingMode::ToNearest);
Float tanh(const Float& x, RoundingMode mode = RoundingMode::ToNearest);
Float sech(const Float& x, RoundingMode mode = RoundingMode::ToNearest);
Float csch(const Float& x, RoundingMode mode = RoundingMode::ToNearest);
Float coth(const Float& x, RoundingMode mode = RoundingMode::ToNearest);
Float asinh(const Float& x, RoundingMode mode = RoundingMode::ToNearest);
Float acosh(const Float& x, RoundingMode mode = RoundingMode::ToNearest);
Float atanh(const Float& x, RoundingMode mode = RoundingMode::ToNearest);
Float gamma(const Float& x, RoundingMode mode = RoundingMode::ToNearest);
Float lngamma(const Float& x, RoundingMode mode = RoundingMode::ToNearest);
Float digamma(const Float& x, RoundingMode mode = RoundingMode::ToNearest);
Float zeta(const Float& x, RoundingMode mode = RoundingMode::ToNearest);
Float erf(const Float& x, RoundingMode mode = RoundingMode::ToNearest);
Float erfc(const Float& x, RoundingMode mode = RoundingMode::ToNearest);
Float eint(const Float& x, RoundingMode mode = RoundingMode::ToNearest);
Float li2(const Float& x, RoundingMode mode = RoundingMode::ToNearest);
Float ai(const Float& x, RoundingMode mode = RoundingMode::ToNearest);
Float j0(const Float& x, RoundingMode mode = RoundingMode::ToNearest);
Float j1(const Float& x, RoundingMode mode = RoundingMode::ToNearest);
Float y0(const Float& x, RoundingMode mode = RoundingMode::ToNearest);
Float y1(const Float& x, RoundingMode mode = RoundingMode::ToNearest);
Float frac(const Float& x, RoundingMode mode = RoundingMode::ToNearest);
Float ceil(const Float& x, RoundingMode mode = RoundingMode::ToNearest);
Float floor(const Float& x, RoundingMode mode = RoundingMode::ToNearest);
Float round(const Float& x, RoundingMode mode = RoundingMode::ToNearest);
Float roundeven(const Float& x, RoundingMode mode = RoundingMode::ToNearest);
Float trunc(const Float& x, RoundingMode mode = RoundingMode::ToNearest);
Float rint(const Float& x, RoundingMode mode = RoundingMode::ToNearest);

Float jn(long n, const Float& x, RoundingMode mode = RoundingMode::ToNearest);
Float yn(long n, const Float& x, RoundingMode mode = RoundingMode::ToNearest);
Float root(unsigned long k, const Float& x, RoundingMode mode = RoundingMode::ToNearest);
Float fma(const Float& x, const Float& y, const Float& z, RoundingMode mode = RoundingMode::ToNearest);
Float fms(const Float& x, const Float& y, const Float& z, RoundingMode mode = RoundingMode::ToNearest);
Float fmma(const Float& a, const Float& b, const Float& c, const Float& d,
           RoundingMode mode = RoundingMode::ToNearest);
Float fmms(const Float& a, const Float& b, const Float& c, const Float& d,
           RoundingMode mode = RoundingMode::ToNearest);
Float gamma_inc(const Float& a, const Float& x, RoundingMode mode = RoundingMode::ToNearest);
// |x - y| / x.
Float reldiff(const Float& x, const Float& y, RoundingMode mode = RoundingMode::ToNearest);

// {log|Gamma(x)|, sign of Gamma(x)}.
std::pair<Float, int> lgamma(const Float& x, RoundingMode mode = RoundingMode::ToNearest);
// {remainder, low bits of the quotient}.
std::pair<Float, long> fmodquo(const Float& x, const Float& y, RoundingMode mode = RoundingMode::ToNearest);
std::pair<Float, long> remquo(const Float& x, const Float& y, RoundingMode mode = RoundingMode::ToNearest);

// Neighbours of x at prec(x).
Float next_above(const Float& x);
Float next_below(const Float& x);
Float next_toward(const Float& x, const Float& y);

// Constants at `precision` bits (0 selects the default precision).
Float const_pi(mpfr_prec_t precision = 0, RoundingMode mode = RoundingMode::ToNearest);
Float const_e(mpfr_prec_t precision = 0, RoundingMode mode = RoundingMode::ToNearest);
Float const_log2(mpfr_prec_t precision = 0, RoundingMode mode = RoundingMode::ToNearest);
Float const_euler(mpfr_prec_t precision = 0, RoundingMode mode = RoundingMode::ToNearest);
Float const_catalan(mpfr_prec_t precision = 0, RoundingMode mode = RoundingMode::ToNearest);

// The smaller of the two minimal precisions.
mpfr_prec_t min_prec(const Float& x, const Float& y);

// {integral part, fractional part}, both at prec(x).
std::pair<Float, Float> modf(const Float& x, RoundingMode mode = RoundingMode::ToNearest);

int cmp(const Float& x, const Float& y);
int cmpabs(const Float& x, const Float& y);
bool greater(const Float& x, const Float& y);
bool greater_equal(const Float& x, const Float& y);
bool less(const Float& x, const Float& y);
bool less_equal(const Float& x, const Float& y);
bool less_greater(const Float& x, const Float& y);
bool equal(const Float& x, const Float& y);
bool unordered(const Float& x, const Float& y);

// Arithmetic operators round with the left operand's mode.
Float operator+(const Float& lhs, const Float& rhs);
Float operator-(const Float& lhs, const Float& rhs);
Float operator*(const Float& lhs, const Float& rhs);
Float operator/(const Float& lhs, const Float& rhs);
Float operator-(const Float& value);

// IEEE comparisons: every comparison with NaN is false except !=.
bool operator==(const Float& lhs, const Float& rhs);
bool operator!=(const Float& lhs, const Float& rhs);
bool operator<(const Float& lhs, const Float& rhs);
bool operator<=(const Float& lhs, const Float& rhs);
bool operator>(const Float& lhs, const Float& rhs);
bool operator>=(const Float& lhs, const Float& rhs);

}  // namespace mpfloat
