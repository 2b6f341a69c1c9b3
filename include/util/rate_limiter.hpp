// Copyright (c) 2025 The Strata Developers
// Distributed under the MIT software license

#pragma once

#include "util/time.hpp"

#include <chrono>
#include <mutex>
#include <string>
#include <unordered_map>

namespace strata {
namespace util {

/**
 * Token bucket keyed by log callsite.
 *
 * Blocks arrive from untrusted sources; rejections of those blocks are logged
 * through this limiter so a flood of bad blocks cannot flood the log.
 */
class RateLimiter {
public:
  // Returns true if the callsite still has a token. Each callsite starts with
  // |tokens_per_period| tokens that refill linearly over |period_seconds|.
  bool should_log(const std::string& callsite_key, int tokens_per_period, int period_seconds);

  static RateLimiter& instance();

private:
  struct Bucket {
    double tokens{0.0};
    std::chrono::steady_clock::time_point last_refill{};
    bool primed{false};
  };

  std::mutex mutex_;
  std::unordered_map<std::string, Bucket> buckets_;
};

}  // namespace util
}  // namespace strata
