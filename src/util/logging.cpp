// Copyright (c) 2025 The Strata Developers
// Distributed under the MIT software license

#include "util/logging.hpp"

#include <map>
#include <mutex>
#include <vector>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace strata {
namespace util {

namespace {

const char* const kComponents[] = {"default", "chain", "consensus", "crypto"};

std::mutex g_mutex;
bool g_initialized = false;
std::map<std::string, std::shared_ptr<spdlog::logger>> g_loggers;

// Caller holds g_mutex.
void InitializeLocked(const std::string& log_level, bool log_to_file, const std::string& log_file_path) {
  if (g_initialized)
    return;

  std::vector<spdlog::sink_ptr> sinks;
  sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
  if (log_to_file && !log_file_path.empty()) {
    try {
      sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file_path, false));
    } catch (const spdlog::spdlog_ex& e) {
      fprintf(stderr, "Failed to open log file %s: %s\n", log_file_path.c_str(), e.what());
    }
  }

  const auto level = spdlog::level::from_str(log_level);
  for (const char* name : kComponents) {
    auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");
    logger->set_level(level);
    logger->flush_on(spdlog::level::warn);
    g_loggers[name] = logger;
  }
  g_initialized = true;
}

}  // namespace

void LogManager::Initialize(const std::string& log_level, bool log_to_file, const std::string& log_file_path) {
  std::lock_guard<std::mutex> lock(g_mutex);
  InitializeLocked(log_level, log_to_file, log_file_path);
}

void LogManager::Shutdown() {
  std::lock_guard<std::mutex> lock(g_mutex);
  for (auto& [name, logger] : g_loggers) {
    logger->flush();
  }
  g_loggers.clear();
  g_initialized = false;
}

std::shared_ptr<spdlog::logger> LogManager::GetLogger(const std::string& name) {
  std::lock_guard<std::mutex> lock(g_mutex);
  InitializeLocked("off", false, "");
  auto it = g_loggers.find(name);
  if (it == g_loggers.end()) {
    return g_loggers["default"];
  }
  return it->second;
}

void LogManager::SetLogLevel(const std::string& level) {
  std::lock_guard<std::mutex> lock(g_mutex);
  const auto lvl = spdlog::level::from_str(level);
  for (auto& [name, logger] : g_loggers) {
    logger->set_level(lvl);
  }
}

void LogManager::SetComponentLevel(const std::string& component, const std::string& level) {
  std::lock_guard<std::mutex> lock(g_mutex);
  auto it = g_loggers.find(component);
  if (it != g_loggers.end()) {
    it->second->set_level(spdlog::level::from_str(level));
  }
}

}  // namespace util
}  // namespace strata
