mpfr_rnd_t to_mpfr_rnd(RoundingMode mode) {
  switch (mode) {
    case RoundingMode::ToNearest:
      return MPFR_RNDN;
    case RoundingMode::TowardZero:
      return MPFR_RNDZ;
    case RoundingMode::Up:
      return MPFR_RNDU;
    case RoundingMode::Down:
      return MPFR_RNDD;
    case RoundingMode::AwayFromZero:
      return MPFR_RNDA;
  }
  return MPFR_RNDN;
}

RoundingMode from_mpfr_rnd(mpfr_rnd_t rnd) {
  switch (rnd) {
    case MPFR_RNDZ:
      return RoundingMode::TowardZero;
    case MPFR_RNDU:
      return RoundingMode::Up;
    case MPFR_RNDD:
      return RoundingMode::Down;
    case MPFR_RNDA:
      return RoundingMode::AwayFromZero;
    default:
      return RoundingMode::ToNearest;
  }
}

const char* rounding_mode_name(RoundingMode mode) {
  switch (mode) {
    case RoundingMode::ToNearest:
      return "to_nearest";
    case RoundingMode::TowardZero:
      return "toward_zero";
    case RoundingMode::Up:
      return "up";
    case RoundingMode::Down:
      return "down";
    case RoundingMode::AwayFromZero:
      return "away_from_zero";
  }
  return "unknown";
}

std::optional<RoundingMode> parse_rounding_mode(std::string_view name) {
  if (name == "to_nearest" || name == "RNDN") {
    return RoundingMode::ToNearest;
  }
  if (name == "toward_zero" || name == "RNDZ") {
    return RoundingMode::TowardZero;
  }
  if (name == "up" || name == "RNDU") {
    return RoundingMode::Up;
  }
  if (name == "down" || name == "RNDD") {
    return RoundingMode::Down;
  }
  if (name == "away_from_zero" || name == "RNDA") {
    return RoundingMode::AwayFromZero;
  }
  return std::nullopt;
}

void Float::set_rounding_mode(RoundingMode mode) {
  rounding = mode;
}

RoundingMode Float::rounding_mode() const {
  return rounding;
}

mpfr_rnd_t Float::rnd() const {
  return to_mpfr_rnd(rounding);
}

mpfr_prec_t Float::precision() const {
  if (lifecycle == LifecycleState::Initialized) {
    return mpfr_get_prec(handle->value);
  }
  return effective_precision();
}

void Float::set_precision(mpfr_prec_t bits) {
  check_precision(bits);
  if (lifecycle == LifecycleState::Initialized) {
    mpfr_prec_round(handle->value, bits, rnd());
  }
  requested_precision = bits;
}

void Float::reset_precision(mpfr_prec_t bits) {
  check_precision(bits);
  requested_precision = bits;
  if (lifecycle == LifecycleState::Initialized) {
    mpfr_set_prec(handle->value, bits);
    mpfr_set_zero(handle->value, 1);
  }
}

mpfr_prec_t Float::min_prec() const {
  return mpfr_min_prec(native());
}
