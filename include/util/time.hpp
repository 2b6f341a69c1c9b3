// Copyright (c) 2025 The Strata Developers
// Distributed under the MIT software license

#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace strata {
namespace util {

// Wall-clock seconds since the epoch, or the mock time when one is set.
// Block timestamp checks read the clock through here so tests can move it.
int64_t GetTime();

// Monotonic clock. Under mock time it advances with the mock clock.
std::chrono::steady_clock::time_point GetSteadyTime();

// 0 disables mock time.
void SetMockTime(int64_t time);
int64_t GetMockTime();

// "YYYY-MM-DD HH:MM:SS UTC"
std::string FormatTime(int64_t unix_time);

}  // namespace util
}  // namespace strata
