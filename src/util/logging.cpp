// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license

#include "util/logging.hpp"
#include <atomic>
#include <iostream>
#include <map>
#include <mutex>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <vector>

namespace peerwire {
namespace util {

namespace {

std::mutex s_mutex;
std::atomic<bool> s_initialized{false};

// Entries are created on the first initialization and never erased or
// replaced. Once s_initialized is set the map is read without s_mutex.
std::map<std::string, std::shared_ptr<spdlog::logger>> s_loggers;

std::shared_ptr<spdlog::logger> FindLogger(const std::string &name) {
  auto it = s_loggers.find(name);
  if (it != s_loggers.end()) {
    return it->second;
  }

  auto def = s_loggers.find("default");
  if (def != s_loggers.end()) {
    return def->second;
  }

  // Initialization failed; fall back to whatever spdlog provides
  return spdlog::default_logger();
}

// Caller must hold s_mutex
void InitializeLocked(const std::string &log_level, bool log_to_file,
                      const std::string &log_file_path) {
  if (s_initialized.load(std::memory_order_relaxed)) {
    return;
  }

  try {
    std::vector<spdlog::sink_ptr> sinks;

    if (log_to_file) {
      // Append mode
      auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(
          log_file_path, true);
      file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%l] %v");
      sinks.push_back(file_sink);
    } else {
      // stderr keeps stdout free for tool output
      auto console_sink =
          std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
      console_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%l] %v");
      sinks.push_back(console_sink);
    }

    const std::vector<std::string> components = {"default", "network",
                                                 "crypto", "app"};

    for (const auto &component : components) {
      std::shared_ptr<spdlog::logger> logger;
      auto it = s_loggers.find(component);
      if (it == s_loggers.end()) {
        logger = std::make_shared<spdlog::logger>(component, sinks.begin(),
                                                  sinks.end());
        s_loggers.emplace(component, logger);
      } else {
        // Re-initialization after Shutdown keeps the logger, swaps sinks
        logger = it->second;
        logger->sinks() = sinks;
      }
      logger->set_level(spdlog::level::from_str(log_level));
      logger->flush_on(spdlog::level::warn);
      spdlog::drop(component);
      spdlog::register_logger(logger);
    }

    spdlog::set_default_logger(s_loggers["default"]);
    s_initialized.store(true, std::memory_order_release);

    s_loggers["default"]->debug("Logging system initialized (level: {})",
                                log_level);
  } catch (const spdlog::spdlog_ex &ex) {
    std::cerr << "Log initialization failed: " << ex.what() << std::endl;
  }
}

} // namespace

void LogManager::Initialize(const std::string &log_level, bool log_to_file,
                            const std::string &log_file_path) {
  std::lock_guard<std::mutex> lock(s_mutex);
  InitializeLocked(log_level, log_to_file, log_file_path);
}

void LogManager::Shutdown() {
  std::lock_guard<std::mutex> lock(s_mutex);
  if (!s_initialized.load(std::memory_order_relaxed)) {
    return;
  }

  for (auto &[name, logger] : s_loggers) {
    logger->flush();
  }

  spdlog::shutdown();
  s_initialized.store(false, std::memory_order_release);
}

std::shared_ptr<spdlog::logger> LogManager::GetLogger(const std::string &name) {
  if (s_initialized.load(std::memory_order_acquire)) {
    return FindLogger(name);
  }

  std::lock_guard<std::mutex> lock(s_mutex);
  // Auto-initialize with defaults if not initialized
  InitializeLocked("info", false, "");
  return FindLogger(name);
}

void LogManager::SetLogLevel(const std::string &level) {
  std::lock_guard<std::mutex> lock(s_mutex);
  if (!s_initialized.load(std::memory_order_relaxed)) {
    return;
  }

  auto log_level = spdlog::level::from_str(level);
  for (auto &[name, logger] : s_loggers) {
    logger->set_level(log_level);
  }
}

void LogManager::SetComponentLevel(const std::string &component,
                                   const std::string &level) {
  std::shared_ptr<spdlog::logger> def;
  {
    std::lock_guard<std::mutex> lock(s_mutex);
    if (!s_initialized.load(std::memory_order_relaxed)) {
      return;
    }

    auto it = s_loggers.find(component);
    if (it != s_loggers.end()) {
      it->second->set_level(spdlog::level::from_str(level));
      return;
    }
    def = s_loggers["default"];
  }

  def->warn("Unknown log component: {}", component);
}

} // namespace util
} // namespace peerwire
