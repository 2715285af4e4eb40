namespace {

bool valid_parse_base(int base) {
  return base == 0 || (base >= 2 && base <= 62);
}

std::string special_value_text(mpfr_srcptr value, FormatStyle style) {
  if (mpfr_nan_p(value) != 0) {
    return "nan";
  }
  if (mpfr_inf_p(value) != 0) {
    return mpfr_signbit(value) != 0 ? "-inf" : "inf";
  }
  const bool negative = mpfr_signbit(value) != 0;
  if (style == FormatStyle::Exponent) {
    return negative ? "-0e0" : "0e0";
  }
  return negative ? "-0.0" : "0.0";
}

}  // namespace

DecimalDigits extract_decimal_digits(mpfr_srcptr value, std::size_t digits, mpfr_rnd_t rnd) {
  mpfr_exp_t exponent = 0;
  char* raw = mpfr_get_str(nullptr, &exponent, 10, digits, value, rnd);
  if (!raw) {
    throw FloatError("mpfr_get_str failed");
  }
  DecimalDigits out;
  const char* cursor = raw;
  if (*cursor == '-') {
    out.negative = true;
    ++cursor;
  }
  out.digits.assign(cursor);
  out.exponent = static_cast<long>(exponent);
  mpfr_free_str(raw);
  return out;
}

std::string assemble_positional(const DecimalDigits& parts) {
  std::string body;
  const auto length = static_cast<long>(parts.digits.size());
  if (parts.exponent >= length) {
    body = parts.digits;
    body.append(static_cast<std::size_t>(parts.exponent - length), '0');
    body += ".0";
  } else if (parts.exponent > 0) {
    body = parts.digits.substr(0, static_cast<std::size_t>(parts.exponent));
    body += '.';
    body += parts.digits.substr(static_cast<std::size_t>(parts.exponent));
  } else {
    body = "0.";
    body.append(static_cast<std::size_t>(-parts.exponent), '0');
    body += parts.digits;
  }
  return parts.negative ? "-" + body : body;
}

std::string assemble_exponent(const DecimalDigits& parts) {
  std::string body;
  if (parts.digits.empty()) {
    body = "0";
  } else {
    body.push_back(parts.digits.front());
    if (parts.digits.size() > 1U) {
      body += '.';
      body += parts.digits.substr(1);
    }
  }
  body += 'e';
  body += std::to_string(parts.exponent - 1);
  return parts.negative ? "-" + body : body;
}

// Drops trailing fractional zeros. Positional text keeps one digit after the
// point; exponent text drops the point when nothing remains after it.
std::string trim_decimal_string(std::string text) {
  const auto exp_pos = text.find_first_of("eE");
  std::string mantissa = exp_pos == std::string::npos ? text : text.substr(0, exp_pos);
  const std::string exponent = exp_pos == std::string::npos ? std::string() : text.substr(exp_pos);
  const auto dot = mantissa.find('.');
  if (dot == std::string::npos) {
    return text;
  }
  while (mantissa.size() > dot + 1U && mantissa.back() == '0') {
    mantissa.pop_back();
  }
  if (mantissa.size() == dot + 1U) {
    if (exponent.empty()) {
      mantissa.push_back('0');
    } else {
      mantissa.pop_back();
    }
  }
  return mantissa + exponent;
}

std::string format(const Float& value, const FormatOptions& options) {
  mpfr_srcptr native = value.native();
  if (mpfr_regular_p(native) == 0) {
    return special_value_text(native, options.style);
  }
  const auto parts = extract_decimal_digits(native, options.digits, value.rnd());
  std::string text = options.style == FormatStyle::Exponent ? assemble_exponent(parts)
                                                            : assemble_positional(parts);
  if (options.trim_trailing_zeros) {
    text = trim_decimal_string(std::move(text));
  }
  return text;
}

ParseStatus parse(Float& target, std::string_view text, int base) {
  const std::string owned(text);
  // mpfr_set_str stops at the first NUL, so an embedded one would hide a tail.
  if (!valid_parse_base(base) || owned.empty() || owned.find('\0') != std::string::npos) {
    trace_conversion("mpfloat-codec", "parse-rejected", owned.c_str());
    return ParseStatus::InvalidString;
  }
  Float staged(target.precision());
  staged.set_rounding_mode(target.rounding_mode());
  if (mpfr_set_str(staged.native(), owned.c_str(), base, staged.rnd()) != 0) {
    trace_conversion("mpfloat-codec", "parse-failed", owned.c_str());
    return ParseStatus::InvalidString;
  }
  target.swap(staged);
  return ParseStatus::Ok;
}

std::ostream& operator<<(std::ostream& out, const Float& value) {
  return out << format(value);
}

std::string Float::to_string() const {
  return format(*this);
}

std::string Float::to_string(const FormatOptions& options) const {
  return format(*this, options);
}

ParseStatus Float::set_string(std::string_view text, int base) {
  return parse(*this, text, base);
}
