// Copyright (c) 2025 The Strata Developers
// Distributed under the MIT software license

#include "util/time.hpp"

#include <atomic>
#include <mutex>

#include <fmt/format.h>

namespace strata {
namespace util {

namespace {

std::atomic<int64_t> g_mock_time{0};

// Anchor pairing a real steady instant with the mock time observed there.
struct SteadyAnchor {
  std::mutex mutex;
  bool set{false};
  std::chrono::steady_clock::time_point real;
  int64_t mock{0};
};

SteadyAnchor& anchor() {
  static SteadyAnchor a;
  return a;
}

}  // namespace

int64_t GetTime() {
  int64_t mock = g_mock_time.load(std::memory_order_relaxed);
  if (mock != 0)
    return mock;
  return std::chrono::duration_cast<std::chrono::seconds>(std::chrono::system_clock::now().time_since_epoch())
      .count();
}

std::chrono::steady_clock::time_point GetSteadyTime() {
  int64_t mock = g_mock_time.load(std::memory_order_relaxed);
  if (mock == 0)
    return std::chrono::steady_clock::now();

  auto& a = anchor();
  std::lock_guard<std::mutex> lock(a.mutex);
  if (!a.set) {
    a.real = std::chrono::steady_clock::now();
    a.mock = mock;
    a.set = true;
  }
  return a.real + std::chrono::seconds(mock - a.mock);
}

void SetMockTime(int64_t time) {
  g_mock_time.store(time, std::memory_order_relaxed);
  if (time == 0) {
    auto& a = anchor();
    std::lock_guard<std::mutex> lock(a.mutex);
    a.set = false;
  }
}

int64_t GetMockTime() {
  return g_mock_time.load(std::memory_order_relaxed);
}

std::string FormatTime(int64_t unix_time) {
  const std::chrono::sys_seconds secs{std::chrono::seconds{unix_time}};
  const auto days = std::chrono::floor<std::chrono::days>(secs);
  const std::chrono::year_month_day ymd{days};
  const std::chrono::hh_mm_ss hms{secs - days};
  return fmt::format("{:04}-{:02}-{:02} {:02}:{:02}:{:02} UTC", static_cast<int>(ymd.year()),
                     static_cast<unsigned>(ymd.month()), static_cast<unsigned>(ymd.day()), hms.hours().count(),
                     hms.minutes().count(), hms.seconds().count());
}

}  // namespace util
}  // namespace strata
