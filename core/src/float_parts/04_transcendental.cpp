Float& Float::jn(long n) {
  ensure_initialized();
  mpfr_jn(handle->value, n, handle->value, rnd());
  return *this;
}

Float& Float::jn(long n, const Float& x) {
  mpfr_jn(native(), n, x.native(), rnd());
  return *this;
}

Float& Float::yn(long n) {
  ensure_initialized();
  mpfr_yn(handle->value, n, handle->value, rnd());
  return *this;
}

Float& Float::yn(long n, const Float& x) {
  mpfr_yn(native(), n, x.native(), rnd());
  return *this;
}

Float& Float::checked_root(unsigned long k, const Float& base) {
  if (k == 0) {
    throw InvalidRootDegreeError("root: degree must be positive");
  }
  if (k % 2U == 0U && mpfr_sgn(base.native()) < 0) {
    throw NegativeEvenRootError("root: even root of a negative number (k=" + std::to_string(k) +
                                ")");
  }
  Float staged(precision());
  staged.set_rounding_mode(rounding);
  mpfr_rootn_ui(staged.native(), base.native(), k, rnd());
  if (mpfr_nan_p(staged.native()) != 0) {
    throw NaNResultError("root: result is NaN (k=" + std::to_string(k) + ")");
  }
  swap(staged);
  return *this;
}

Float& Float::root(unsigned long k) {
  return checked_root(k, *this);
}

Float& Float::root(unsigned long k, const Float& x) {
  return checked_root(k, x);
}

int Float::lgamma() {
  ensure_initialized();
  int sign = 0;
  mpfr_lgamma(handle->value, &sign, handle->value, rnd());
  return sign;
}

int Float::lgamma(const Float& x) {
  int sign = 0;
  mpfr_lgamma(native(), &sign, x.native(), rnd());
  return sign;
}

Float& Float::fma(const Float& x, const Float& y, const Float& z) {
  mpfr_fma(native(), x.native(), y.native(), z.native(), rnd());
  return *this;
}

Float& Float::fms(const Float& x, const Float& y, const Float& z) {
  mpfr_fms(native(), x.native(), y.native(), z.native(), rnd());
  return *this;
}

Float& Float::fmma(const Float& a, const Float& b, const Float& c, const Float& d) {
  mpfr_fmma(native(), a.native(), b.native(), c.native(), d.native(), rnd());
  return *this;
}

Float& Float::fmms(const Float& a, const Float& b, const Float& c, const Float& d) {
  mpfr_fmms(native(), a.native(), b.native(), c.native(), d.native(), rnd());
  return *this;
}

Float& Float::gamma_inc(const Float& a, const Float& x) {
  mpfr_gamma_inc(native(), a.native(), x.native(), rnd());
  return *this;
}

Float& Float::reldiff(const Float& x, const Float& y) {
  mpfr_reldiff(native(), x.native(), y.native(), rnd());
  return *this;
}

long Float::fmodquo(const Float& x, const Float& y) {
  long quotient_bits = 0;
  mpfr_fmodquo(native(), &quotient_bits, x.native(), y.native(), rnd());
  return quotient_bits;
}

long Float::remquo(const Float& x, const Float& y) {
  long quotient_bits = 0;
  mpfr_remquo(native(), &quotient_bits, x.native(), y.native(), rnd());
  return quotient_bits;
}

Float& Float::next_above() {
  mpfr_nextabove(native());
  return *this;
}

Float& Float::next_below() {
  mpfr_nextbelow(native());
  return *this;
}

Float& Float::next_toward(const Float& y) {
  mpfr_nexttoward(native(), y.native());
  return *this;
}

Float& Float::set_pi() {
  mpfr_const_pi(native(), rnd());
  return *this;
}

Float& Float::set_e() {
  // MPFR has no e constant; exp(1) is correctly rounded.
  mpfr_set_ui(native(), 1U, MPFR_RNDN);
  mpfr_exp(handle->value, handle->value, rnd());
  return *this;
}

Float& Float::set_log2() {
  mpfr_const_log2(native(), rnd());
  return *this;
}

Float& Float::set_euler() {
  mpfr_const_euler(native(), rnd());
  return *this;
}

Float& Float::set_catalan() {
  mpfr_const_catalan(native(), rnd());
  return *this;
}

Float& Float::set_nan() {
  mpfr_set_nan(native());
  return *this;
}

Float& Float::set_inf(int sign) {
  mpfr_set_inf(native(), sign);
  return *this;
}

Float& Float::set_zero(int sign) {
  mpfr_set_zero(native(), sign);
  return *this;
}
