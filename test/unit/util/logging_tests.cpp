// Copyright (c) 2025 The Strata Developers
// Distributed under the MIT software license
// Unit tests for LogManager

#include "util/logging.hpp"

#include <catch2/catch_test_macros.hpp>

#include <thread>
#include <vector>

using namespace strata::util;

// Initialize() only takes effect once until Shutdown(), so each test starts
// from a shut-down manager.

TEST_CASE("LogManager - GetLogger returns component loggers", "[logging]") {
    LogManager::Shutdown();
    LogManager::Initialize("debug", false, "");

    SECTION("Default logger") {
        auto logger = LogManager::GetLogger();
        REQUIRE(logger != nullptr);
        CHECK(logger->name() == "default");
    }

    SECTION("Named component loggers") {
        CHECK(LogManager::GetLogger("chain")->name() == "chain");
        CHECK(LogManager::GetLogger("consensus")->name() == "consensus");
        CHECK(LogManager::GetLogger("crypto")->name() == "crypto");
    }

    SECTION("Unknown component returns default logger") {
        CHECK(LogManager::GetLogger("nonexistent")->name() == "default");
    }

    LogManager::Shutdown();
}

TEST_CASE("LogManager - level control", "[logging]") {
    LogManager::Shutdown();
    LogManager::Initialize("info", false, "");

    CHECK(LogManager::GetLogger("chain")->level() == spdlog::level::info);

    LogManager::SetComponentLevel("consensus", "trace");
    CHECK(LogManager::GetLogger("consensus")->level() == spdlog::level::trace);
    CHECK(LogManager::GetLogger("chain")->level() == spdlog::level::info);

    LogManager::SetLogLevel("error");
    CHECK(LogManager::GetLogger("consensus")->level() == spdlog::level::err);
    CHECK(LogManager::GetLogger("crypto")->level() == spdlog::level::err);

    LogManager::Shutdown();
}

TEST_CASE("LogManager - second Initialize is ignored", "[logging]") {
    LogManager::Shutdown();
    LogManager::Initialize("warn", false, "");
    LogManager::Initialize("trace", false, "");
    CHECK(LogManager::GetLogger()->level() == spdlog::level::warn);
    LogManager::Shutdown();
}

TEST_CASE("LogManager - loggers are usable from several threads", "[logging]") {
    LogManager::Shutdown();
    LogManager::Initialize("off", false, "");

    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([t] {
            for (int i = 0; i < 50; ++i) {
                LOG_CHAIN_DEBUG("thread {} message {}", t, i);
                LOG_CONSENSUS_TRACE("thread {} message {}", t, i);
            }
        });
    }
    for (auto& th : threads) {
        th.join();
    }
    CHECK(LogManager::GetLogger("chain") != nullptr);

    LogManager::Shutdown();
}
