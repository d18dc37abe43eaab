#include "Logging/LogManager.h"
#include "Utils/ConfigManager.h"

#include <iostream>

namespace {

// HomeLens 레벨 <-> LogLib 레벨 (값 체계가 같지만 타입은 독립)
LogLib::LogLevel ToEngineLevel(HomeLens::Enums::LogLevel level) {
  switch (level) {
  case HomeLens::Enums::LogLevel::TRACE:
    return LogLib::LogLevel::TRACE;
  case HomeLens::Enums::LogLevel::DEBUG:
    return LogLib::LogLevel::DEBUG;
  case HomeLens::Enums::LogLevel::WARN:
    return LogLib::LogLevel::WARN;
  case HomeLens::Enums::LogLevel::LOG_ERROR:
    return LogLib::LogLevel::LOG_ERROR;
  case HomeLens::Enums::LogLevel::LOG_FATAL:
    return LogLib::LogLevel::LOG_FATAL;
  case HomeLens::Enums::LogLevel::OFF:
    return LogLib::LogLevel::OFF;
  default:
    return LogLib::LogLevel::INFO;
  }
}

HomeLens::Enums::LogLevel FromEngineLevel(LogLib::LogLevel level) {
  switch (level) {
  case LogLib::LogLevel::TRACE:
    return HomeLens::Enums::LogLevel::TRACE;
  case LogLib::LogLevel::DEBUG:
    return HomeLens::Enums::LogLevel::DEBUG;
  case LogLib::LogLevel::WARN:
    return HomeLens::Enums::LogLevel::WARN;
  case LogLib::LogLevel::LOG_ERROR:
    return HomeLens::Enums::LogLevel::LOG_ERROR;
  case LogLib::LogLevel::LOG_FATAL:
    return HomeLens::Enums::LogLevel::LOG_FATAL;
  case LogLib::LogLevel::OFF:
    return HomeLens::Enums::LogLevel::OFF;
  default:
    return HomeLens::Enums::LogLevel::INFO;
  }
}

} // namespace

void LogManager::ensureInitialized() {
  if (initialized_.load(std::memory_order_acquire))
    return;

  // ConfigManager 초기화가 다시 LogManager 를 부르는 경로 차단
  static thread_local bool in_init = false;
  if (in_init)
    return;

  std::lock_guard<std::mutex> lock(init_mutex_);
  if (initialized_.load(std::memory_order_relaxed))
    return;

  in_init = true;
  applyConfigSettings();
  in_init = false;
  initialized_.store(true, std::memory_order_release);
}

void LogManager::applyConfigSettings() {
  auto &engine = LogLib::LoggerEngine::getInstance();
  try {
    auto &config = ConfigManager::getInstance();
    engine.setLogLevel(LogLib::LoggerEngine::stringToLogLevel(
        config.getOrDefault("LOG_LEVEL", "INFO")));
    engine.setConsoleOutput(config.getBool("LOG_TO_CONSOLE", true));
    engine.setFileOutput(config.getBool("LOG_TO_FILE", true));
    engine.setLogBasePath(config.getOrDefault("LOG_FILE_PATH", "./logs/"));
    engine.setMaxLogSizeMB(
        static_cast<size_t>(config.getInt("LOG_MAX_SIZE_MB", 100)));
    engine.setMaxLogFiles(config.getInt("LOG_MAX_FILES", 30));
  } catch (const std::exception &e) {
    std::cerr << "[LogManager] failed to apply log settings: " << e.what()
              << std::endl;
  }
}

void LogManager::reloadSettings() {
  std::lock_guard<std::mutex> lock(init_mutex_);
  applyConfigSettings();
}

void LogManager::log(const std::string &category, LogLevel level,
                     const std::string &message) {
  LogLib::LoggerEngine::getInstance().log(category, ToEngineLevel(level),
                                          message);
}

void LogManager::logAdapter(const std::string &protocol, LogLevel level,
                            const std::string &message) {
  log("", level, "[" + protocol + "] " + message);
  log("discovery_" + protocol, level, message);
}

void LogManager::setLogLevel(LogLevel level) {
  LogLib::LoggerEngine::getInstance().setLogLevel(ToEngineLevel(level));
}

LogLevel LogManager::getLogLevel() const {
  return FromEngineLevel(LogLib::LoggerEngine::getInstance().getLogLevel());
}

void LogManager::setConsoleOutput(bool enabled) {
  LogLib::LoggerEngine::getInstance().setConsoleOutput(enabled);
}

void LogManager::setFileOutput(bool enabled) {
  LogLib::LoggerEngine::getInstance().setFileOutput(enabled);
}

void LogManager::setLogBasePath(const std::string &path) {
  LogLib::LoggerEngine::getInstance().setLogBasePath(path);
}

LogLib::LogStatistics LogManager::getStatistics() const {
  return LogLib::LoggerEngine::getInstance().getStatistics();
}

void LogManager::flushAll() { LogLib::LoggerEngine::getInstance().flushAll(); }
