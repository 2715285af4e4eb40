bool Float::fits_sint() const {
  return mpfr_fits_sint_p(native(), rnd()) != 0;
}

bool Float::fits_uint() const {
  return mpfr_fits_uint_p(native(), rnd()) != 0;
}

bool Float::fits_slong() const {
  return mpfr_fits_slong_p(native(), rnd()) != 0;
}

bool Float::fits_ulong() const {
  return mpfr_fits_ulong_p(native(), rnd()) != 0;
}

bool Float::fits_sshort() const {
  return mpfr_fits_sshort_p(native(), rnd()) != 0;
}

bool Float::fits_ushort() const {
  return mpfr_fits_ushort_p(native(), rnd()) != 0;
}

bool Float::fits_intmax() const {
  return mpfr_fits_intmax_p(native(), rnd()) != 0;
}

bool Float::fits_uintmax() const {
  return mpfr_fits_uintmax_p(native(), rnd()) != 0;
}

// mpfr_cmp returns 0 for NaN operands; use unordered() to tell them apart.
int Float::cmp(const Float& other) const {
  return mpfr_cmp(native(), other.native());
}

int Float::cmpabs(const Float& other) const {
  return mpfr_cmpabs(native(), other.native());
}

bool Float::greater(const Float& other) const {
  return mpfr_greater_p(native(), other.native()) != 0;
}

bool Float::greater_equal(const Float& other) const {
  return mpfr_greaterequal_p(native(), other.native()) != 0;
}

bool Float::less(const Float& other) const {
  return mpfr_less_p(native(), other.native()) != 0;
}

bool Float::less_equal(const Float& other) const {
  return mpfr_lessequal_p(native(), other.native()) != 0;
}

bool Float::less_greater(const Float& other) const {
  return mpfr_lessgreater_p(native(), other.native()) != 0;
}

bool Float::equal(const Float& other) const {
  return mpfr_equal_p(native(), other.native()) != 0;
}

bool Float::unordered(const Float& other) const {
  return mpfr_unordered_p(native(), other.native()) != 0;
}

bool Float::is_nan() const {
  return mpfr_nan_p(native()) != 0;
}

bool Float::is_inf() const {
  return mpfr_inf_p(native()) != 0;
}

bool Float::is_zero() const {
  return mpfr_zero_p(native()) != 0;
}

bool Float::is_regular() const {
  return mpfr_regular_p(native()) != 0;
}

bool Float::is_number() const {
  return mpfr_number_p(native()) != 0;
}

bool Float::is_integer() const {
  return mpfr_integer_p(native()) != 0;
}

int Float::sign() const {
  return mpfr_sgn(native());
}

}  // namespace mpfloat
