#include "LoggerEngine.hpp"

#include <algorithm>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <vector>

#ifdef _WIN32
#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#include <windows.h>
#endif

namespace LogLib {

namespace fs = std::filesystem;

namespace {

constexpr const char *kDefaultCategoryFile = "homelens";
constexpr const char *kDiscoveryPrefix = "discovery_";
constexpr uint64_t kBytesPerMB = 1024ULL * 1024ULL;

std::string TrimValue(const std::string &s) {
  auto first = s.find_first_not_of(" \t\r\n\"");
  if (first == std::string::npos)
    return "";
  auto last = s.find_last_not_of(" \t\r\n\"");
  return s.substr(first, last - first + 1);
}

bool ParseFlag(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(), ::tolower);
  return value == "true" || value == "1" || value == "yes" || value == "on";
}

bool StartsWith(const std::string &text, const std::string &prefix) {
  return text.rfind(prefix, 0) == 0;
}

fs::path RouteFor(const fs::path &base, const std::string &category,
                  const std::string &date) {
  if (category.empty())
    return base / date / (std::string(kDefaultCategoryFile) + ".log");

  if (StartsWith(category, kDiscoveryPrefix)) {
    // discovery_mdns -> discovery/<date>/mdns.log
    std::string name = category.substr(std::string(kDiscoveryPrefix).size());
    std::replace(name.begin(), name.end(), '/', '_');
    return base / "discovery" / date / (name + ".log");
  }
  return base / date / (category + ".log");
}

} // namespace

LoggerEngine::LoggerEngine()
    : min_level_(LogLevel::INFO), base_path_("./logs"), console_enabled_(true),
      file_enabled_(true), max_file_bytes_(100 * kBytesPerMB),
      max_log_files_(30), rotation_seq_(0) {
#ifdef _WIN32
  // Windows 콘솔 UTF-8 출력
  SetConsoleOutputCP(CP_UTF8);
#endif
}

LoggerEngine::~LoggerEngine() { flushAll(); }

LoggerEngine &LoggerEngine::getInstance() {
  static LoggerEngine instance;
  return instance;
}

// =============================================================================
// 설정
// =============================================================================

void LoggerEngine::setLogLevel(LogLevel level) {
  std::lock_guard<std::mutex> lock(mutex_);
  min_level_ = level;
}

LogLevel LoggerEngine::getLogLevel() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return min_level_;
}

void LoggerEngine::setLogBasePath(const std::string &path) {
  std::lock_guard<std::mutex> lock(mutex_);
  base_path_ = path.empty() ? fs::path("./logs") : fs::path(path);
}

void LoggerEngine::setConsoleOutput(bool enabled) {
  std::lock_guard<std::mutex> lock(mutex_);
  console_enabled_ = enabled;
}

void LoggerEngine::setFileOutput(bool enabled) {
  std::lock_guard<std::mutex> lock(mutex_);
  file_enabled_ = enabled;
}

bool LoggerEngine::isConsoleOutputEnabled() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return console_enabled_;
}

void LoggerEngine::setMaxLogSizeMB(size_t size_mb) {
  setMaxLogSizeBytes(static_cast<uint64_t>(size_mb) * kBytesPerMB);
}

void LoggerEngine::setMaxLogSizeBytes(uint64_t bytes) {
  std::lock_guard<std::mutex> lock(mutex_);
  max_file_bytes_ = bytes;
}

void LoggerEngine::setMaxLogFiles(int count) {
  std::lock_guard<std::mutex> lock(mutex_);
  max_log_files_ = count;
}

bool LoggerEngine::loadFromConfigFile(const std::string &path) {
  std::ifstream file(path);
  if (!file.is_open())
    return false;

  std::string line;
  while (std::getline(file, line)) {
    line = TrimValue(line);
    if (line.empty() || line[0] == '#')
      continue;

    size_t sep = line.find('=');
    if (sep == std::string::npos)
      continue;
    applyConfig(TrimValue(line.substr(0, sep)), TrimValue(line.substr(sep + 1)));
  }
  return true;
}

void LoggerEngine::applyConfig(const std::string &key,
                               const std::string &value) {
  try {
    if (key == "LOG_LEVEL") {
      setLogLevel(stringToLogLevel(value));
    } else if (key == "LOG_FILE_PATH") {
      setLogBasePath(value);
    } else if (key == "LOG_TO_CONSOLE") {
      setConsoleOutput(ParseFlag(value));
    } else if (key == "LOG_TO_FILE") {
      setFileOutput(ParseFlag(value));
    } else if (key == "LOG_MAX_SIZE_MB") {
      setMaxLogSizeMB(static_cast<size_t>(std::stoul(value)));
    } else if (key == "LOG_MAX_FILES") {
      setMaxLogFiles(std::stoi(value));
    }
  } catch (const std::exception &) {
    // 숫자가 아니면 기존 값 유지
  }
}

LogLevel LoggerEngine::stringToLogLevel(const std::string &level) {
  std::string s = level;
  std::transform(s.begin(), s.end(), s.begin(), ::toupper);

  if (s == "TRACE")
    return LogLevel::TRACE;
  if (s == "DEBUG")
    return LogLevel::DEBUG;
  if (s == "WARN" || s == "WARNING")
    return LogLevel::WARN;
  if (s == "ERROR")
    return LogLevel::LOG_ERROR;
  if (s == "FATAL")
    return LogLevel::LOG_FATAL;
  if (s == "OFF")
    return LogLevel::OFF;
  return LogLevel::INFO;
}

// =============================================================================
// 기록
// =============================================================================

void LoggerEngine::log(const std::string &category, LogLevel level,
                       const std::string &message) {
  if (level == LogLevel::OFF)
    return;

  std::ostringstream line;
  line << "[" << formatNow("%Y-%m-%d %H:%M:%S") << "][" << LogLevelToString(level)
       << "]";
  if (!category.empty())
    line << "[" << category << "]";
  line << " " << message;
  const std::string text = line.str();

  std::lock_guard<std::mutex> lock(mutex_);
  if (static_cast<int>(level) < static_cast<int>(min_level_))
    return;
  countLevel(level);

  if (console_enabled_)
    std::cout << text << std::endl;
  if (!file_enabled_)
    return;

  fs::path path = RouteFor(base_path_, category, formatNow("%Y%m%d"));
  FileSink *sink = openSink(path);
  if (!sink)
    return;

  sink->stream << text << '\n';
  sink->stream.flush();
  sink->bytes += text.size() + 1;

  if (max_file_bytes_ > 0 && sink->bytes >= max_file_bytes_)
    rotate(path, *sink);
}

LoggerEngine::FileSink *LoggerEngine::openSink(const fs::path &path) {
  FileSink &sink = sinks_[path.string()];
  if (sink.stream.is_open())
    return &sink;

  std::error_code ec;
  fs::create_directories(path.parent_path(), ec);
  sink.stream.open(path, std::ios::app);
  if (!sink.stream.is_open()) {
    sinks_.erase(path.string());
    return nullptr;
  }
  auto size = fs::file_size(path, ec);
  sink.bytes = ec ? 0 : static_cast<uint64_t>(size);
  return &sink;
}

void LoggerEngine::rotate(const fs::path &path, FileSink &sink) {
  sink.stream.close();

  std::ostringstream backup;
  backup << path.stem().string() << "_" << formatNow("%Y%m%d%H%M%S") << "_"
         << std::setw(6) << std::setfill('0') << ++rotation_seq_
         << path.extension().string();

  std::error_code ec;
  fs::rename(path, path.parent_path() / backup.str(), ec);
  if (!ec) {
    statistics_.rotated_files++;
    pruneBackups(path);
  }

  sink.stream.open(path, std::ios::app);
  sink.bytes = 0;
}

void LoggerEngine::pruneBackups(const fs::path &path) {
  if (max_log_files_ <= 0)
    return;

  // <stem>_<timestamp>_<seq>.log 는 이름순이 곧 생성순
  const std::string prefix = path.stem().string() + "_";
  std::vector<fs::path> backups;
  std::error_code ec;
  for (const auto &entry : fs::directory_iterator(path.parent_path(), ec)) {
    const std::string name = entry.path().filename().string();
    if (entry.is_regular_file(ec) && StartsWith(name, prefix))
      backups.push_back(entry.path());
  }
  if (backups.size() <= static_cast<size_t>(max_log_files_))
    return;

  std::sort(backups.begin(), backups.end());
  size_t excess = backups.size() - static_cast<size_t>(max_log_files_);
  for (size_t i = 0; i < excess; ++i)
    fs::remove(backups[i], ec);
}

void LoggerEngine::flushAll() {
  std::lock_guard<std::mutex> lock(mutex_);
  for (auto &kv : sinks_) {
    if (kv.second.stream.is_open())
      kv.second.stream.close();
  }
  sinks_.clear();
}

fs::path LoggerEngine::buildLogFilePath(const std::string &category) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return RouteFor(base_path_, category, formatNow("%Y%m%d"));
}

// =============================================================================
// 통계
// =============================================================================

LogStatistics LoggerEngine::getStatistics() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return statistics_;
}

void LoggerEngine::resetStatistics() {
  std::lock_guard<std::mutex> lock(mutex_);
  statistics_ = LogStatistics{};
}

void LoggerEngine::countLevel(LogLevel level) {
  switch (level) {
  case LogLevel::TRACE:
    statistics_.trace_count++;
    break;
  case LogLevel::DEBUG:
    statistics_.debug_count++;
    break;
  case LogLevel::INFO:
    statistics_.info_count++;
    break;
  case LogLevel::WARN:
    statistics_.warn_count++;
    break;
  case LogLevel::LOG_ERROR:
    statistics_.error_count++;
    break;
  case LogLevel::LOG_FATAL:
    statistics_.fatal_count++;
    break;
  default:
    break;
  }
  statistics_.total_logs++;
  statistics_.last_log_time = std::chrono::system_clock::now();
}

std::string LoggerEngine::formatNow(const char *pattern) {
  std::time_t t = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
  std::tm tm_buf;
#ifdef _WIN32
  localtime_s(&tm_buf, &t);
#else
  localtime_r(&t, &tm_buf);
#endif
  std::ostringstream oss;
  oss << std::put_time(&tm_buf, pattern);
  return oss.str();
}

} // namespace LogLib
