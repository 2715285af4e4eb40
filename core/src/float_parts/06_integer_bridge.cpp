namespace {

void free_gmp_string(char* raw) {
  if (!raw) {
    return;
  }
  void* (*alloc_fn)(size_t) = nullptr;
  void* (*realloc_fn)(void*, size_t, size_t) = nullptr;
  void (*free_fn)(void*, size_t) = nullptr;
  mp_get_memory_functions(&alloc_fn, &realloc_fn, &free_fn);
  if (free_fn) {
    free_fn(raw, std::strlen(raw) + 1U);
  }
}

void require_finite(mpfr_srcptr value, const char* target) {
  if (mpfr_number_p(value) == 0) {
    throw FloatError(std::string("cannot convert ") + (mpfr_nan_p(value) != 0 ? "NaN" : "infinity") +
                     " to " + target);
  }
}

}  // namespace

ConversionPath conversion_path_for(std::int64_t value) {
  if (value >= std::numeric_limits<std::int32_t>::min() &&
      value <= std::numeric_limits<std::int32_t>::max()) {
    return ConversionPath::NativeWord;
  }
  return ConversionPath::DecimalText;
}

ConversionPath conversion_path_for(std::uint64_t value) {
  if (value <= std::numeric_limits<std::uint32_t>::max()) {
    return ConversionPath::NativeWord;
  }
  return ConversionPath::DecimalText;
}

const char* conversion_path_name(ConversionPath path) {
  switch (path) {
    case ConversionPath::NativeWord:
      return "native-word";
    case ConversionPath::DecimalText:
      return "decimal-text";
  }
  return "unknown";
}

std::string mpz_to_decimal_string(mpz_srcptr value) {
  char* raw = mpz_get_str(nullptr, 10, value);
  if (!raw) {
    throw FloatError("mpz_get_str failed");
  }
  std::string out(raw);
  free_gmp_string(raw);
  return out.empty() ? "0" : out;
}

std::string mpf_to_decimal_string(mpf_srcptr value) {
  mp_exp_t exponent = 0;
  char* raw = mpf_get_str(nullptr, &exponent, 10, 0, value);
  if (!raw) {
    throw FloatError("mpf_get_str failed");
  }
  DecimalDigits parts;
  const char* cursor = raw;
  if (*cursor == '-') {
    parts.negative = true;
    ++cursor;
  }
  parts.digits.assign(cursor);
  parts.exponent = static_cast<long>(exponent);
  free_gmp_string(raw);
  if (parts.digits.empty()) {
    return "0.0";
  }
  return assemble_positional(parts);
}

Float& Float::set_int64(std::int64_t value) {
  if (conversion_path_for(value) == ConversionPath::NativeWord) {
    mpfr_set_si(native(), static_cast<long>(value), rnd());
    return *this;
  }
  return set_from_decimal_text(std::to_string(value));
}

Float& Float::set_uint64(std::uint64_t value) {
  if (conversion_path_for(value) == ConversionPath::NativeWord) {
    mpfr_set_ui(native(), static_cast<unsigned long>(value), rnd());
    return *this;
  }
  return set_from_decimal_text(std::to_string(value));
}

Float& Float::set_long(long value) {
  mpfr_set_si(native(), value, rnd());
  return *this;
}

Float& Float::set_ulong(unsigned long value) {
  mpfr_set_ui(native(), value, rnd());
  return *this;
}

Float& Float::set_double(double value) {
  mpfr_set_d(native(), value, rnd());
  return *this;
}

Float& Float::set_long_double(long double value) {
  mpfr_set_ld(native(), value, rnd());
  return *this;
}

Float& Float::set_mpz(mpz_srcptr value) {
  if (!value) {
    return set_zero(1);
  }
  return set_from_decimal_text(mpz_to_decimal_string(value));
}

Float& Float::set_mpf(mpf_srcptr value) {
  if (!value) {
    return set_zero(1);
  }
  return set_from_decimal_text(mpf_to_decimal_string(value));
}

Float& Float::set_from_decimal_text(const std::string& text) {
  trace_conversion("mpfloat-bridge", "decimal-text", text.c_str());
  ensure_initialized();
  if (set_string(text, 10) != ParseStatus::Ok) {
    throw FloatError("decimal text conversion failed: \"" + text + "\"");
  }
  return *this;
}

double Float::get_double() const {
  return mpfr_get_d(native(), rnd());
}

long double Float::get_long_double() const {
  return mpfr_get_ld(native(), rnd());
}

long Float::get_long() const {
  return mpfr_get_si(native(), rnd());
}

unsigned long Float::get_ulong() const {
  return mpfr_get_ui(native(), rnd());
}

// Integer part as decimal text: a truncating two-digit read finds the decimal exponent
// E, then exactly E truncated digits are requested.
void Float::to_mpz(mpz_ptr out) const {
  mpfr_srcptr value = native();
  require_finite(value, "mpz_t");
  if (mpfr_zero_p(value) != 0) {
    mpz_set_ui(out, 0U);
    return;
  }
  const auto leading = extract_decimal_digits(value, 2U, MPFR_RNDZ);
  if (leading.exponent <= 0) {
    mpz_set_ui(out, 0U);
    return;
  }
  const auto digit_count = static_cast<std::size_t>(leading.exponent);
  const auto parts = extract_decimal_digits(value, std::max<std::size_t>(digit_count, 2U), MPFR_RNDZ);
  std::string text = parts.negative ? "-" : "";
  text += parts.digits.substr(0, std::min(digit_count, parts.digits.size()));
  if (parts.digits.size() < digit_count) {
    text.append(digit_count - parts.digits.size(), '0');
  }
  trace_conversion("mpfloat-bridge", "to-mpz", text.c_str());
  if (mpz_set_str(out, text.c_str(), 10) != 0) {
    throw FloatError("mpz_set_str rejected \"" + text + "\"");
  }
}

void Float::to_mpf(mpf_ptr out) const {
  require_finite(native(), "mpf_t");
  const std::string text = format(*this);
  trace_conversion("mpfloat-bridge", "to-mpf", text.c_str());
  if (mpf_set_str(out, text.c_str(), 10) != 0) {
    throw FloatError("mpf_set_str rejected \"" + text + "\"");
  }
}

std::int64_t Float::consume_int64() {
  const auto out = static_cast<std::int64_t>(mpfr_get_sj(native(), rnd()));
  clear();
  return out;
}

std::uint64_t Float::consume_uint64() {
  const auto out = static_cast<std::uint64_t>(mpfr_get_uj(native(), rnd()));
  clear();
  return out;
}

double Float::consume_double() {
  const double out = mpfr_get_d(native(), rnd());
  clear();
  return out;
}

void Float::consume_into(mpz_ptr out) {
  ReleaseGuard release{this};
  to_mpz(out);
}

void Float::consume_into(mpf_ptr out) {
  ReleaseGuard release{this};
  to_mpf(out);
}
