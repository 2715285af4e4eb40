#include "mpfloat/handle_pool.h"

#include <cstdio>

namespace mpfloat::runtime {

namespace {

// Trivially destructible, so it stays readable while thread_local objects with
// destructors are being torn down at thread exit.
thread_local bool local_pool_destroyed = false;

void trace_lifecycle(const HandlePoolConfig& config, const char* event, mpfr_prec_t precision,
                     std::size_t live, std::size_t pooled) {
  if (!config.trace) {
    return;
  }
  std::fprintf(stderr, "[mpfloat-lifecycle] %s prec=%ld live=%zu pooled=%zu\n", event,
               static_cast<long>(precision), live, pooled);
}

}  // namespace

NativeHandle::NativeHandle(mpfr_prec_t precision) {
  mpfr_init2(value, precision);
  mpfr_set_zero(value, 1);
}

NativeHandle::~NativeHandle() {
  mpfr_clear(value);
}

void HandleReturn::operator()(NativeHandle* handle) const {
  if (!handle) {
    return;
  }
  if (local_pool_destroyed) {
    delete handle;
    return;
  }
  HandlePool::local().release(handle);
}

HandlePoolConfig parse_handle_pool_config(const EnvLookup& lookup) {
  HandlePoolConfig config;
  config.enabled = env_flag_enabled(lookup, "MPFLOAT_HANDLE_POOL", true);
  config.capacity_per_bucket =
      parse_env_count_value(lookup("MPFLOAT_HANDLE_POOL_CAPACITY"), config.capacity_per_bucket);
  config.trace = env_flag_enabled(lookup, "MPFLOAT_TRACE_LIFECYCLE", false);
  return config;
}

HandlePool& HandlePool::local() {
  thread_local HandlePool pool;
  return pool;
}

HandlePool::HandlePool() : settings(parse_handle_pool_config(&process_env)) {}

HandlePool::~HandlePool() {
  trim();
  local_pool_destroyed = true;
}

std::vector<NativeHandle*>& HandlePool::bucket_for(mpfr_prec_t precision) {
  if (precision <= 64) {
    return p64;
  }
  if (precision <= 128) {
    return p128;
  }
  if (precision <= 256) {
    return p256;
  }
  if (precision <= 512) {
    return p512;
  }
  return wide;
}

std::size_t HandlePool::pooled_count() const {
  return p64.size() + p128.size() + p256.size() + p512.size() + wide.size();
}

HandlePtr HandlePool::acquire(mpfr_prec_t precision) {
  auto& bucket = bucket_for(precision);
  NativeHandle* entry = nullptr;
  if (settings.enabled && !bucket.empty()) {
    entry = bucket.back();
    bucket.pop_back();
    // mpfr_set_prec discards the old value (it becomes NaN).
    mpfr_set_prec(entry->value, precision);
    mpfr_set_zero(entry->value, 1);
    ++reused_total;
    trace_lifecycle(settings, "reuse", precision, live + 1, pooled_count());
  } else {
    entry = new NativeHandle(precision);
    trace_lifecycle(settings, "acquire", precision, live + 1, pooled_count());
  }
  ++live;
  ++acquired_total;
  return HandlePtr(entry);
}

void HandlePool::release(NativeHandle* handle) {
  if (!handle) {
    return;
  }
  if (live > 0) {
    --live;
  }
  ++released_total;
  const mpfr_prec_t precision = mpfr_get_prec(handle->value);
  auto& bucket = bucket_for(precision);
  if (!settings.enabled || bucket.size() >= settings.capacity_per_bucket) {
    delete handle;
    ++freed_total;
    trace_lifecycle(settings, "free", precision, live, pooled_count());
    return;
  }
  bucket.push_back(handle);
  trace_lifecycle(settings, "release", precision, live, pooled_count());
}

void HandlePool::trim() {
  auto release_all = [this](std::vector<NativeHandle*>& free_list) {
    for (auto* entry : free_list) {
      delete entry;
      ++freed_total;
    }
    free_list.clear();
  };
  release_all(p64);
  release_all(p128);
  release_all(p256);
  release_all(p512);
  release_all(wide);
  trace_lifecycle(settings, "trim", 0, live, 0);
}

void HandlePool::configure(const HandlePoolConfig& config) {
  settings = config;
  if (!settings.enabled) {
    trim();
  }
}

const HandlePoolConfig& HandlePool::config() const {
  return settings;
}

HandlePoolStats HandlePool::stats() const {
  HandlePoolStats out;
  out.live = live;
  out.pooled = pooled_count();
  out.acquired_total = acquired_total;
  out.reused_total = reused_total;
  out.released_total = released_total;
  out.freed_total = freed_total;
  return out;
}

}  // namespace mpfloat::runtime
