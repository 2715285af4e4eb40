#include <algorithm>
#include <cstdint>
#include <cstring>
#include <limits>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

#include <gmp.h>
#include <mpfr.h>

#include "mpfloat/config.h"
#include "mpfloat/decimal_codec.h"
#include "mpfloat/errors.h"
#include "mpfloat/float.h"
#include "mpfloat/handle_pool.h"
#include "mpfloat/integer_bridge.h"
#include "mpfloat/rounding.h"

namespace mpfloat {

const char* lifecycle_state_name(LifecycleState state) {
  switch (state) {
    case LifecycleState::Uninitialized:
      return "uninitialized";
    case LifecycleState::Initialized:
      return "initialized";
    case LifecycleState::Cleared:
      return "cleared";
  }
  return "unknown";
}

Float::Float() = default;

Float::Float(mpfr_prec_t precision) : requested_precision(precision) {
  if (precision != 0) {
    check_precision(precision);
  }
}

Float::Float(const Float& other)
    : requested_precision(other.effective_precision()), rounding(other.rounding) {
  if (other.lifecycle == LifecycleState::Initialized) {
    ensure_initialized();
    mpfr_set(handle->value, other.handle->value, rnd());
  }
}

Float::Float(Float&& other) noexcept
    : handle(std::move(other.handle)),
      lifecycle(other.lifecycle),
      requested_precision(other.requested_precision),
      rounding(other.rounding) {
  other.lifecycle = LifecycleState::Uninitialized;
}

Float& Float::operator=(const Float& other) {
  if (this != &other) {
    assign(other);
  }
  return *this;
}

Float& Float::operator=(Float&& other) noexcept {
  if (this != &other) {
    handle = std::move(other.handle);
    lifecycle = other.lifecycle;
    requested_precision = other.requested_precision;
    other.lifecycle = LifecycleState::Uninitialized;
  }
  return *this;
}

Float::~Float() = default;

mpfr_prec_t Float::effective_precision() const {
  return requested_precision != 0 ? requested_precision : default_precision();
}

void Float::ensure_initialized() const {
  if (lifecycle == LifecycleState::Initialized) {
    return;
  }
  requested_precision = effective_precision();
  handle = runtime::HandlePool::local().acquire(requested_precision);
  lifecycle = LifecycleState::Initialized;
}

void Float::clear() {
  if (lifecycle != LifecycleState::Initialized) {
    return;
  }
  handle.reset();
  lifecycle = LifecycleState::Cleared;
}

LifecycleState Float::state() const {
  return lifecycle;
}

bool Float::initialized() const {
  return lifecycle == LifecycleState::Initialized;
}

mpfr_ptr Float::native() {
  ensure_initialized();
  return handle->value;
}

mpfr_srcptr Float::native() const {
  ensure_initialized();
  return handle->value;
}

Float& Float::assign(const Float& x) {
  if (this == &x) {
    ensure_initialized();
    return *this;
  }
  mpfr_set(native(), x.native(), rnd());
  return *this;
}

void Float::swap(Float& other) {
  if (this == &other) {
    return;
  }
  std::swap(handle, other.handle);
  std::swap(lifecycle, other.lifecycle);
  std::swap(requested_precision, other.requested_precision);
}

void swap(Float& lhs, Float& rhs) {
  lhs.swap(rhs);
}

ReleaseGuard::ReleaseGuard(std::initializer_list<Float*> held) : values(held) {}

ReleaseGuard::~ReleaseGuard() {
  for (auto* value : values) {
    if (value) {
      value->clear();
    }
  }
}

void ReleaseGuard::hold(Float& value) {
  values.push_back(&value);
}

std::size_t ReleaseGuard::size() const {
  return values.size();
}

void free_cache() {
  mpfr_free_cache();
}

void memory_cleanup() {
  mpfr_mp_memory_cleanup();
}

Float Float::from_int(long value, mpfr_prec_t precision) {
  Float out(precision);
  out.set_long(value);
  return out;
}

Float Float::from_int64(std::int64_t value, mpfr_prec_t precision) {
  Float out(precision);
  out.set_int64(value);
  return out;
}

Float Float::from_uint64(std::uint64_t value, mpfr_prec_t precision) {
  Float out(precision);
  out.set_uint64(value);
  return out;
}

Float Float::from_double(double value, mpfr_prec_t precision) {
  Float out(precision);
  out.set_double(value);
  return out;
}

Float Float::from_mpz(mpz_srcptr value, mpfr_prec_t precision) {
  Float out(precision);
  out.set_mpz(value);
  return out;
}

Float Float::from_mpf(mpf_srcptr value, mpfr_prec_t precision) {
  Float out(precision);
  out.set_mpf(value);
  return out;
}

Float Float::from_string(std::string_view text, int base, mpfr_prec_t precision) {
  Float out(precision);
  if (out.set_string(text, base) != ParseStatus::Ok) {
    throw InvalidStringError("invalid numeric string: \"" + std::string(text) + "\"");
  }
  return out;
}
