// Copyright (c) 2025 The Strata Developers
// Distributed under the MIT software license

#include "util/rate_limiter.hpp"

#include <algorithm>

namespace strata {
namespace util {

bool RateLimiter::should_log(const std::string& callsite_key, int tokens_per_period, int period_seconds) {
  std::lock_guard<std::mutex> lock(mutex_);

  const auto now = GetSteadyTime();
  const double capacity = static_cast<double>(tokens_per_period);
  Bucket& bucket = buckets_[callsite_key];

  if (!bucket.primed) {
    bucket.tokens = capacity;
    bucket.last_refill = now;
    bucket.primed = true;
  }

  const auto elapsed = std::chrono::duration_cast<std::chrono::seconds>(now - bucket.last_refill).count();
  if (elapsed > 0 && period_seconds > 0) {
    bucket.tokens = std::min(capacity, bucket.tokens + capacity * static_cast<double>(elapsed) / period_seconds);
    bucket.last_refill = now;
  }

  if (bucket.tokens < 1.0)
    return false;
  bucket.tokens -= 1.0;
  return true;
}

RateLimiter& RateLimiter::instance() {
  static RateLimiter limiter;
  return limiter;
}

}  // namespace util
}  // namespace strata
