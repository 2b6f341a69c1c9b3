// Copyright (c) 2025 The Strata Developers
// Distributed under the MIT software license
// Tests for the log rate limiter

#include "util/rate_limiter.hpp"
#include "util/time.hpp"

#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <thread>
#include <vector>

using namespace strata::util;

namespace {

struct MockClock {
    explicit MockClock(int64_t t) { SetMockTime(t); }
    ~MockClock() { SetMockTime(0); }
};

}  // namespace

TEST_CASE("RateLimiter - burst capacity", "[rate_limiter]") {
    RateLimiter limiter;

    SECTION("First N messages allowed") {
        for (int i = 0; i < 200; ++i) {
            REQUIRE(limiter.should_log("test:1", 200, 3600));
        }
        REQUIRE_FALSE(limiter.should_log("test:1", 200, 3600));
    }

    SECTION("Callsites have independent buckets") {
        for (int i = 0; i < 200; ++i) {
            limiter.should_log("test:1", 200, 3600);
        }
        REQUIRE_FALSE(limiter.should_log("test:1", 200, 3600));
        REQUIRE(limiter.should_log("test:2", 200, 3600));
    }
}

TEST_CASE("RateLimiter - refill follows the mock clock", "[rate_limiter]") {
    MockClock clock(1000000);
    RateLimiter limiter;

    SECTION("One token back after a tenth of the period") {
        for (int i = 0; i < 10; ++i) {
            limiter.should_log("test:refill", 10, 100);
        }
        REQUIRE_FALSE(limiter.should_log("test:refill", 10, 100));

        SetMockTime(1000010);
        REQUIRE(limiter.should_log("test:refill", 10, 100));
        REQUIRE_FALSE(limiter.should_log("test:refill", 10, 100));
    }

    SECTION("Refill caps at capacity") {
        for (int i = 0; i < 5; ++i) {
            limiter.should_log("test:cap", 5, 1);
        }
        SetMockTime(1000010);
        for (int i = 0; i < 5; ++i) {
            REQUIRE(limiter.should_log("test:cap", 5, 1));
        }
        REQUIRE_FALSE(limiter.should_log("test:cap", 5, 1));
    }
}

TEST_CASE("RateLimiter - flood of rejected blocks", "[rate_limiter]") {
    RateLimiter limiter;
    int logged = 0;
    for (int i = 0; i < 1000; ++i) {
        if (limiter.should_log("validation.cpp:42", 200, 3600)) {
            ++logged;
        }
    }
    REQUIRE(logged == 200);
}

TEST_CASE("RateLimiter - concurrent callers share a bucket", "[rate_limiter][threading]") {
    RateLimiter limiter;
    std::atomic<int> logged{0};

    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&limiter, &logged] {
            for (int i = 0; i < 100; ++i) {
                if (limiter.should_log("thread_test", 200, 3600)) {
                    ++logged;
                }
            }
        });
    }
    for (auto& th : threads) {
        th.join();
    }
    REQUIRE(logged.load() == 200);
}
