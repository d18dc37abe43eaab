#ifndef LOG_MANAGER_H
#define LOG_MANAGER_H

/**
 * @file LogManager.h
 * @brief HomeLens 로그 관리자 - LogLib::LoggerEngine 위임 래퍼
 * @details
 * 파일 경로/로테이션/통계는 LoggerEngine 이 처리한다. 이 클래스는
 * ConfigManager 의 LOG_* 설정 적용과 탐색 도메인 헬퍼(logAdapter)만 담당.
 */

#include "Common/Enums.h"

#include "LoggerEngine.hpp"

#include <atomic>
#include <mutex>
#include <sstream>
#include <string>

// 전역 네임스페이스 타입 별칭
using LogLevel = HomeLens::Enums::LogLevel;

class LogManager {
public:
  static LogManager &getInstance() {
    static LogManager instance;
    instance.ensureInitialized();
    return instance;
  }

  // =============================================================================
  // 기본 로그 메소드 (메인 로그 파일)
  // =============================================================================
  void Info(const std::string &message) { log("", LogLevel::INFO, message); }
  void Warn(const std::string &message) { log("", LogLevel::WARN, message); }
  void Error(const std::string &message) {
    log("", LogLevel::LOG_ERROR, message);
  }
  void Debug(const std::string &message) { log("", LogLevel::DEBUG, message); }

  // "{}" 자리표시자 치환. 인자가 남으면 무시, 모자라면 "{}" 그대로.
  template <typename... Args>
  void Info(const std::string &format, const Args &...args) {
    Info(formatString(format, args...));
  }
  template <typename... Args>
  void Warn(const std::string &format, const Args &...args) {
    Warn(formatString(format, args...));
  }
  template <typename... Args>
  void Error(const std::string &format, const Args &...args) {
    Error(formatString(format, args...));
  }
  template <typename... Args>
  void Debug(const std::string &format, const Args &...args) {
    Debug(formatString(format, args...));
  }

  void log(const std::string &category, LogLevel level,
           const std::string &message);

  /**
   * @brief 프로토콜 어댑터 로그
   * 메인 로그에 "[protocol] message" 로, discovery_<protocol> 카테고리에 원문으로 기록.
   */
  void logAdapter(const std::string &protocol, LogLevel level,
                  const std::string &message);

  void setLogLevel(LogLevel level);
  LogLevel getLogLevel() const;
  void setConsoleOutput(bool enabled);
  void setFileOutput(bool enabled);
  void setLogBasePath(const std::string &path);

  /**
   * @brief ConfigManager 의 LOG_* 키를 다시 적용
   */
  void reloadSettings();

  LogLib::LogStatistics getStatistics() const;
  void flushAll();

  template <typename... Args>
  static std::string formatString(const std::string &format,
                                  const Args &...args) {
    std::ostringstream out;
    size_t pos = 0;
    (appendArgument(out, format, pos, args), ...);
    out << format.substr(pos);
    return out.str();
  }

private:
  LogManager() = default;
  ~LogManager() = default;

  void ensureInitialized();
  void applyConfigSettings();

  template <typename T>
  static void appendArgument(std::ostringstream &out, const std::string &format,
                             size_t &pos, const T &value) {
    size_t placeholder = format.find("{}", pos);
    if (placeholder == std::string::npos)
      return;
    out << format.substr(pos, placeholder - pos) << value;
    pos = placeholder + 2;
  }

  std::atomic<bool> initialized_{false};
  std::mutex init_mutex_;
};

inline void ReloadLogSettings() { LogManager::getInstance().reloadSettings(); }

#endif // LOG_MANAGER_H
