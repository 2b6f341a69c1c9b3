// Copyright (c) 2025 The Strata Developers
// Distributed under the MIT software license

#pragma once

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace strata {
namespace util {

/**
 * Process-wide spdlog configuration.
 *
 * One named logger per component ("chain", "consensus", "crypto", "default"),
 * all sharing the same sinks. Unknown component names resolve to "default".
 *
 * Thread-safety: all methods may be called from any thread. GetLogger()
 * initializes with defaults on first use.
 */
class LogManager {
public:
  // Only the first call (since start-up or the last Shutdown) takes effect.
  static void Initialize(const std::string& log_level = "off", bool log_to_file = false,
                         const std::string& log_file_path = "strata.log");

  // Flushes and drops all loggers.
  static void Shutdown();

  static std::shared_ptr<spdlog::logger> GetLogger(const std::string& name = "default");

  static void SetLogLevel(const std::string& level);
  static void SetComponentLevel(const std::string& component, const std::string& level);
};

}  // namespace util
}  // namespace strata

#define LOG_TRACE(...) strata::util::LogManager::GetLogger()->trace(__VA_ARGS__)
#define LOG_DEBUG(...) strata::util::LogManager::GetLogger()->debug(__VA_ARGS__)
#define LOG_INFO(...) strata::util::LogManager::GetLogger()->info(__VA_ARGS__)
#define LOG_WARN(...) strata::util::LogManager::GetLogger()->warn(__VA_ARGS__)
#define LOG_ERROR(...) strata::util::LogManager::GetLogger()->error(__VA_ARGS__)

#define LOG_CHAIN_TRACE(...) strata::util::LogManager::GetLogger("chain")->trace(__VA_ARGS__)
#define LOG_CHAIN_DEBUG(...) strata::util::LogManager::GetLogger("chain")->debug(__VA_ARGS__)
#define LOG_CHAIN_INFO(...) strata::util::LogManager::GetLogger("chain")->info(__VA_ARGS__)
#define LOG_CHAIN_WARN(...) strata::util::LogManager::GetLogger("chain")->warn(__VA_ARGS__)
#define LOG_CHAIN_ERROR(...) strata::util::LogManager::GetLogger("chain")->error(__VA_ARGS__)
#define LOG_CHAIN_CRITICAL(...) strata::util::LogManager::GetLogger("chain")->critical(__VA_ARGS__)

#define LOG_CONSENSUS_TRACE(...) strata::util::LogManager::GetLogger("consensus")->trace(__VA_ARGS__)
#define LOG_CONSENSUS_DEBUG(...) strata::util::LogManager::GetLogger("consensus")->debug(__VA_ARGS__)
#define LOG_CONSENSUS_INFO(...) strata::util::LogManager::GetLogger("consensus")->info(__VA_ARGS__)
#define LOG_CONSENSUS_WARN(...) strata::util::LogManager::GetLogger("consensus")->warn(__VA_ARGS__)
#define LOG_CONSENSUS_ERROR(...) strata::util::LogManager::GetLogger("consensus")->error(__VA_ARGS__)
#define LOG_CONSENSUS_CRITICAL(...) strata::util::LogManager::GetLogger("consensus")->critical(__VA_ARGS__)

#define LOG_CRYPTO_DEBUG(...) strata::util::LogManager::GetLogger("crypto")->debug(__VA_ARGS__)
#define LOG_CRYPTO_ERROR(...) strata::util::LogManager::GetLogger("crypto")->error(__VA_ARGS__)

// ============================================================================
// RATE-LIMITED LOGGING
// ============================================================================
// For messages triggered by block content from untrusted sources. Each
// callsite (file:line) gets 200 messages per hour.

#include "util/rate_limiter.hpp"

#define STRATA_CALLSITE_KEY_ (std::string(__FILE__) + ":" + std::to_string(__LINE__))

#define STRATA_LOG_RL_(component, level, ...)                                                                          \
  do {                                                                                                                 \
    if (strata::util::RateLimiter::instance().should_log(STRATA_CALLSITE_KEY_, 200, 3600)) {                          \
      strata::util::LogManager::GetLogger(component)->level(__VA_ARGS__);                                             \
    }                                                                                                                  \
  } while (0)

#define LOG_WARN_RL(...) STRATA_LOG_RL_("default", warn, __VA_ARGS__)
#define LOG_CHAIN_DEBUG_RL(...) STRATA_LOG_RL_("chain", debug, __VA_ARGS__)
#define LOG_CHAIN_WARN_RL(...) STRATA_LOG_RL_("chain", warn, __VA_ARGS__)
#define LOG_CHAIN_ERROR_RL(...) STRATA_LOG_RL_("chain", error, __VA_ARGS__)
#define LOG_CONSENSUS_DEBUG_RL(...) STRATA_LOG_RL_("consensus", debug, __VA_ARGS__)
