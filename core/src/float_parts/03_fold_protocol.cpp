Float& Float::reduce(BinaryKernel kernel, std::initializer_list<const Float*> operands) {
  ensure_initialized();
  for (const auto* operand : operands) {
    operand->ensure_initialized();
  }
  const auto mode = rnd();
  for (const auto* operand : operands) {
    kernel(handle->value, handle->value, operand->handle->value, mode);
  }
  return *this;
}

Float& Float::apply_in_place(UnaryKernel kernel) {
  ensure_initialized();
  kernel(handle->value, handle->value, rnd());
  return *this;
}

Float& Float::apply_to(UnaryKernel kernel, const Float& operand) {
  ensure_initialized();
  operand.ensure_initialized();
  kernel(handle->value, operand.handle->value, rnd());
  return *this;
}

Float& Float::fold_all(BinaryKernel kernel, std::initializer_list<const Float*> operands) {
  return reduce(kernel, operands);
}

Float& Float::checked_quotient(std::initializer_list<const Float*> operands) {
  std::size_t position = 0;
  for (const auto* operand : operands) {
    ++position;
    if (mpfr_zero_p(operand->native()) != 0) {
      throw DivisionByZeroError("quotient: operand " + std::to_string(position) + " is zero");
    }
  }
  return reduce(&mpfr_div, operands);
}

Float& Float::operator+=(const Float& rhs) {
  return add(rhs);
}

Float& Float::operator-=(const Float& rhs) {
  return sub(rhs);
}

Float& Float::operator*=(const Float& rhs) {
  return mul(rhs);
}

Float& Float::operator/=(const Float& rhs) {
  return div(rhs);
}

Float& Float::neg() { return apply_in_place(&mpfr_neg); }
Float& Float::neg(const Float& x) { return apply_to(&mpfr_neg, x); }
Float& Float::abs() { return apply_in_place(&mpfr_abs); }
Float& Float::abs(const Float& x) { return apply_to(&mpfr_abs, x); }
Float& Float::sqr() { return apply_in_place(&mpfr_sqr); }
Float& Float::sqr(const Float& x) { return apply_to(&mpfr_sqr, x); }
Float& Float::sqrt() { return apply_in_place(&mpfr_sqrt); }
Float& Float::sqrt(const Float& x) { return apply_to(&mpfr_sqrt, x); }
Float& Float::rec_sqrt() { return apply_in_place(&mpfr_rec_sqrt); }
Float& Float::rec_sqrt(const Float& x) { return apply_to(&mpfr_rec_sqrt, x); }
Float& Float::cbrt() { return apply_in_place(&mpfr_cbrt); }
Float& Float::cbrt(const Float& x) { return apply_to(&mpfr_cbrt, x); }
Float& Float::exp() { return apply_in_place(&mpfr_exp); }
Float& Float::exp(const Float& x) { return apply_to(&mpfr_exp, x); }
Float& Float::exp2() { return apply_in_place(&mpfr_exp2); }
Float& Float::exp2(const Float& x) { return apply_to(&mpfr_exp2, x); }
Float& Float::exp10() { return apply_in_place(&mpfr_exp10); }
Float& Float::exp10(const Float& x) { return apply_to(&mpfr_exp10, x); }
Float& Float::expm1() { return apply_in_place(&mpfr_expm1); }
Float& Float::expm1(const Float& x) { return apply_to(&mpfr_expm1, x); }
Float& Float::log() { return apply_in_place(&mpfr_log); }
Float& Float::log(const Float& x) { return apply_to(&mpfr_log, x); }
Float& Float::log2() { return apply_in_place(&mpfr_log2); }
Float& Float::log2(const Float& x) { return apply_to(&mpfr_log2, x); }
Float& Float::log10() { return apply_in_place(&mpfr_log10); }
Float& Float::log10(const Float& x) { return apply_to(&mpfr_log10, x); }
Float& Float::log1p() { return apply_in_place(&mpfr_log1p); }
Float& Float::log1p(const Float& x) { return apply_to(&mpfr_log1p, x); }
Float& Float::sin() { return apply_in_place(&mpfr_sin); }
Float& Float::sin(const Float& x) { return apply_to(&mpfr_sin, x); }
Float& Float::cos() { return apply_in_place(&mpfr_cos); }
Float& Float::cos(const Float& x) { return apply_to(&mpfr_cos, x); }
Float& Float::tan() { return apply_in_place(&mpfr_tan); }
Float& Float::tan(const Float& x) { return apply_to(&mpfr_tan, x); }
Float& Float::sec() { return apply_in_place(&mpfr_sec); }
Float& Float::sec(const Float& x) { return apply_to(&mpfr_sec, x); }
Float& Float::csc() { return apply_in_place(&mpfr_csc); }
Float& Float::csc(const Float& x) { return apply_to(&mpfr_csc, x); }
Float& Float::cot() { return apply_in_place(&mpfr_cot); }
Float& Float::cot(const Float& x) { return apply_to(&mpfr_cot, x); }
Float& Float::asin() { return apply_in_place(&mpfr_asin); }
Float& Float::asin(const Float& x) { return apply_to(&mpfr_asin, x); }
Float& Float::acos() { return apply_in_place(&mpfr_acos); }
Float& Float::acos(const Float& x) { return apply_to(&mpfr_acos, x); }
Float& Float::atan() { return apply_in_place(&mpfr_atan); }
Float& Float::atan(const Float& x) { return apply_to(&mpfr_atan, x); }
Float& Float::sinh() { return apply_in_place(&mpfr_sinh); }
Float& Float::sinh(const Float& x) { return apply_to(&mpfr_sinh, x); }
Float& Float::cosh() { return apply_in_place(&mpfr_cosh); }
Float& Float::cosh(const Float& x) { return apply_to(&mpfr_cosh, x); }
Float& Float::tanh() { return apply_in_place(&mpfr_tanh); }
Float& Float::tanh(const Float& x) { return apply_to(&mpfr_tanh, x); }
Float& Float::sech() { return apply_in_place(&mpfr_sech); }
Float& Float::sech(const Float& x) { return apply_to(&mpfr_sech, x); }
Float& Float::csch() { return apply_in_place(&mpfr_csch); }
Float& Float::csch(const Float& x) { return apply_to(&mpfr_csch, x); }
Float& Float::coth() { return apply_in_place(&mpfr_coth); }
Float& Float::coth(const Float& x) { return apply_to(&mpfr_coth, x); }
Float& Float::asinh() { return apply_in_place(&mpfr_asinh); }
Float& Float::asinh(const Float& x) { return apply_to(&mpfr_asinh, x); }
Float& Float::acosh() { return apply_in_place(&mpfr_acosh); }
Float& Float::acosh(const Float& x) { return apply_to(&mpfr_acosh, x); }
Float& Float::atanh() { return apply_in_place(&mpfr_atanh); }
Float& Float::atanh(const Float& x) { return apply_to(&mpfr_atanh, x); }
Float& Float::gamma() { return apply_in_place(&mpfr_gamma); }
Float& Float::gamma(const Float& x) { return apply_to(&mpfr_gamma, x); }
Float& Float::lngamma() { return apply_in_place(&mpfr_lngamma); }
Float& Float::lngamma(const Float& x) { return apply_to(&mpfr_lngamma, x); }
Float& Float::digamma() { return apply_in_place(&mpfr_digamma); }
Float& Float::digamma(const Float& x) { return apply_to(&mpfr_digamma, x); }
Float& Float::zeta() { return apply_in_place(&mpfr_zeta); }
Float& Float::zeta(const Float& x) { return apply_to(&mpfr_zeta, x); }
Float& Float::erf() { return apply_in_place(&mpfr_erf); }
Float& Float::erf(const Float& x) { return apply_to(&mpfr_erf, x); }
Float& Float::erfc() { return apply_in_place(&mpfr_erfc); }
Float& Float::erfc(const Float& x) { return apply_to(&mpfr_erfc, x); }
Float& Float::eint() { return apply_in_place(&mpfr_eint); }
Float& Float::eint(const Float& x) { return apply_to(&mpfr_eint, x); }
Float& Float::li2() { return apply_in_place(&mpfr_li2); }
Float& Float::li2(const Float& x) { return apply_to(&mpfr_li2, x); }
Float& Float::ai() { return apply_in_place(&mpfr_ai); }
Float& Float::ai(const Float& x) { return apply_to(&mpfr_ai, x); }
Float& Float::j0() { return apply_in_place(&mpfr_j0); }
Float& Float::j0(const Float& x) { return apply_to(&mpfr_j0, x); }
Float& Float::j1() { return apply_in_place(&mpfr_j1); }
Float& Float::j1(const Float& x) { return apply_to(&mpfr_j1, x); }
Float& Float::y0() { return apply_in_place(&mpfr_y0); }
Float& Float::y0(const Float& x) { return apply_to(&mpfr_y0, x); }
Float& Float::y1() { return apply_in_place(&mpfr_y1); }
Float& Float::y1(const Float& x) { return apply_to(&mpfr_y1, x); }
Float& Float::frac() { return apply_in_place(&mpfr_frac); }
Float& Float::frac(const Float& x) { return apply_to(&mpfr_frac, x); }

// Integral roundings go through the mpfr_rint_* family so the result is also
// rounded to precision with this value's mode.
Float& Float::ceil() { return apply_in_place(&mpfr_rint_ceil); }
Float& Float::ceil(const Float& x) { return apply_to(&mpfr_rint_ceil, x); }
Float& Float::floor() { return apply_in_place(&mpfr_rint_floor); }
Float& Float::floor(const Float& x) { return apply_to(&mpfr_rint_floor, x); }
Float& Float::round() { return apply_in_place(&mpfr_rint_round); }
Float& Float::round(const Float& x) { return apply_to(&mpfr_rint_round, x); }
Float& Float::roundeven() { return apply_in_place(&mpfr_rint_roundeven); }
Float& Float::roundeven(const Float& x) { return apply_to(&mpfr_rint_roundeven, x); }
Float& Float::trunc() { return apply_in_place(&mpfr_rint_trunc); }
Float& Float::trunc(const Float& x) { return apply_to(&mpfr_rint_trunc, x); }
Float& Float::rint() { return apply_in_place(&mpfr_rint); }
Float& Float::rint(const Float& x) { return apply_to(&mpfr_rint, x); }
