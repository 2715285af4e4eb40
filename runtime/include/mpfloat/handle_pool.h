#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>

#include <gmp.h>
#include <mpfr.h>

#include "mpfloat/env_flags.h"

namespace mpfloat::runtime {

// One native MPFR value. Owned by a Float through HandlePtr; never shared.
struct NativeHandle {
  explicit NativeHandle(mpfr_prec_t precision);
  ~NativeHandle();
  NativeHandle(const NativeHandle&) = delete;
  NativeHandle& operator=(const NativeHandle&) = delete;

  mpfr_t value;
};

// Deleter that hands the handle back to the releasing thread's pool.
struct HandleReturn {
  void operator()(NativeHandle* handle) const;
};

using HandlePtr = std::unique_ptr<NativeHandle, HandleReturn>;

struct HandlePoolConfig {
  bool enabled = true;
  std::size_t capacity_per_bucket = 64;
  bool trace = false;
};

HandlePoolConfig parse_handle_pool_config(const EnvLookup& lookup);

struct HandlePoolStats {
  std::size_t live = 0;
  std::size_t pooled = 0;
  std::uint64_t acquired_total = 0;
  std::uint64_t reused_total = 0;
  std::uint64_t released_total = 0;
  std::uint64_t freed_total = 0;
};

// Per-thread free list of native handles, bucketed by precision so that a
// reused handle rarely has to grow its limb storage.
class HandlePool {
 public:
  static HandlePool& local();

  ~HandlePool();
  HandlePool(const HandlePool&) = delete;
  HandlePool& operator=(const HandlePool&) = delete;

  // Returns a handle at `precision` holding +0.
  HandlePtr acquire(mpfr_prec_t precision);
  void release(NativeHandle* handle);
  void trim();

  void configure(const HandlePoolConfig& config);
  const HandlePoolConfig& config() const;
  HandlePoolStats stats() const;

 private:
  HandlePool();

  std::vector<NativeHandle*>& bucket_for(mpfr_prec_t precision);
  std::size_t pooled_count() const;

  HandlePoolConfig settings;
  std::vector<NativeHandle*> p64;
  std::vector<NativeHandle*> p128;
  std::vector<NativeHandle*> p256;
  std::vector<NativeHandle*> p512;
  std::vector<NativeHandle*> wide;
  std::size_t live = 0;
  std::uint64_t acquired_total = 0;
  std::uint64_t reused_total = 0;
  std::uint64_t released_total = 0;
  std::uint64_t freed_total = 0;
};

}  // namespace mpfloat::runtime
