/**
 * @file ConfigManager.cpp
 * @brief ConfigManager 구현부
 * @author HomeLens Development Team
 * @date 2026-10-12
 */

#include "Utils/ConfigManager.h"
#include "Logging/LogManager.h"

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <regex>
#include <sstream>

namespace fs = std::filesystem;

namespace {

constexpr const char *kConfigDirEnv = "HOMELENS_CONFIG_DIR";

std::string TrimCopy(const std::string &s) {
  auto first = s.find_first_not_of(" \t\r\n");
  if (first == std::string::npos)
    return "";
  auto last = s.find_last_not_of(" \t\r\n");
  return s.substr(first, last - first + 1);
}

std::string StripQuotes(const std::string &value) {
  if (value.size() < 2)
    return value;
  char open = value.front();
  if ((open == '"' || open == '\'') && value.back() == open)
    return value.substr(1, value.size() - 2);
  return value;
}

bool IsDirectory(const std::string &path) {
  std::error_code ec;
  return fs::is_directory(path, ec);
}

void LogConfig(LogLevel level, const std::string &message) {
  LogManager::getInstance().log("config", level, message);
}

} // namespace

// =============================================================================
// 초기화
// =============================================================================

void ConfigManager::ensureInitialized() {
  if (initialized_.load(std::memory_order_acquire))
    return;

  // 로딩 중 LogManager -> ConfigManager 재진입 차단
  static thread_local bool in_init = false;
  if (in_init)
    return;

  std::lock_guard<std::mutex> lock(init_mutex_);
  if (initialized_.load(std::memory_order_relaxed))
    return;

  in_init = true;
  std::string dir = locateConfigDirectory();
  {
    std::lock_guard<std::mutex> values_lock(mutex_);
    config_dir_ = dir;
  }
  if (dir.empty()) {
    LogConfig(LogLevel::WARN, "설정 디렉토리 없음 - 환경변수만 사용");
  } else {
    loadFromDirectory(dir);
  }
  in_init = false;

  initialized_.store(true, std::memory_order_release);
}

std::string ConfigManager::locateConfigDirectory() {
  const char *env_dir = std::getenv(kConfigDirEnv);
  if (env_dir && IsDirectory(env_dir))
    return env_dir;

  for (const char *candidate : {"./config", "../config", "../../config"}) {
    if (!IsDirectory(candidate))
      continue;
    std::error_code ec;
    auto absolute = fs::absolute(candidate, ec);
    return ec ? std::string(candidate) : absolute.lexically_normal().string();
  }
  return "";
}

void ConfigManager::loadFromDirectory(const std::string &dir) {
  fs::path main_env = fs::path(dir) / ".env";
  if (!load(main_env.string())) {
    LogConfig(LogLevel::WARN, "메인 설정 파일 없음: " + main_env.string());
  }

  // CONFIG_FILES=discovery.env,logging.env
  for (const auto &name : getList("CONFIG_FILES")) {
    fs::path extra = fs::path(dir) / name;
    if (!load(extra.string())) {
      LogConfig(LogLevel::WARN, "추가 설정 파일 없음: " + name);
    }
  }

  expandLoadedValues();
}

bool ConfigManager::load(const std::string &filepath) {
  std::ifstream file(filepath);
  if (!file.is_open())
    return false;

  size_t parsed = 0;
  std::string line;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    while (std::getline(file, line)) {
      line = TrimCopy(line);
      if (line.empty() || line[0] == '#')
        continue;

      size_t eq = line.find('=');
      if (eq == std::string::npos)
        continue;
      std::string key = TrimCopy(line.substr(0, eq));
      if (key.empty())
        continue;
      values_[key] = StripQuotes(TrimCopy(line.substr(eq + 1)));
      ++parsed;
    }
  }

  LogConfig(LogLevel::INFO, fs::path(filepath).filename().string() + " 로드 (" +
                                std::to_string(parsed) + " 키)");
  return true;
}

// =============================================================================
// 읽기 / 쓰기
// =============================================================================

std::string ConfigManager::lookupUnlocked(const std::string &key) const {
  auto it = values_.find(key);
  if (it != values_.end() && !it->second.empty())
    return it->second;
  const char *env_value = std::getenv(key.c_str());
  return env_value ? std::string(env_value) : std::string();
}

std::string ConfigManager::get(const std::string &key) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return lookupUnlocked(key);
}

std::string ConfigManager::getOrDefault(const std::string &key,
                                        const std::string &defaultValue) const {
  std::string value = get(key);
  return value.empty() ? defaultValue : value;
}

void ConfigManager::set(const std::string &key, const std::string &value) {
  std::lock_guard<std::mutex> lock(mutex_);
  values_[key] = value;
}

bool ConfigManager::hasKey(const std::string &key) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return values_.count(key) > 0;
}

int ConfigManager::getInt(const std::string &key, int defaultValue) const {
  std::string value = get(key);
  if (value.empty())
    return defaultValue;
  try {
    return std::stoi(value);
  } catch (const std::exception &) {
    return defaultValue;
  }
}

bool ConfigManager::getBool(const std::string &key, bool defaultValue) const {
  std::string value = get(key);
  if (value.empty())
    return defaultValue;
  std::transform(value.begin(), value.end(), value.begin(), ::tolower);
  return value == "true" || value == "yes" || value == "1" || value == "on";
}

double ConfigManager::getDouble(const std::string &key,
                                double defaultValue) const {
  std::string value = get(key);
  if (value.empty())
    return defaultValue;
  try {
    return std::stod(value);
  } catch (const std::exception &) {
    return defaultValue;
  }
}

std::vector<std::string>
ConfigManager::getList(const std::string &key,
                       const std::string &defaultValue) const {
  std::vector<std::string> items;
  std::stringstream ss(getOrDefault(key, defaultValue));
  std::string item;
  while (std::getline(ss, item, ',')) {
    item = TrimCopy(item);
    if (!item.empty())
      items.push_back(item);
  }
  return items;
}

// =============================================================================
// ${VAR} 확장
// =============================================================================

void ConfigManager::expandLoadedValues() {
  std::map<std::string, std::string> expanded;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    expanded = values_;
  }
  for (auto &entry : expanded) {
    entry.second = expandVariables(entry.second);
  }
  std::lock_guard<std::mutex> lock(mutex_);
  values_ = std::move(expanded);
}

std::string ConfigManager::expandVariables(const std::string &value) const {
  static const std::regex var_pattern(R"(\$\{([^}]+)\})");

  std::string result = value;
  std::smatch match;
  // 자기 참조 값이 무한 확장되지 않도록 횟수 제한
  for (int round = 0; round < 64 && std::regex_search(result, match, var_pattern);
       ++round) {
    std::string name = match[1].str();
    std::string replacement;
    if (name == "CONFIG_DIR") {
      std::lock_guard<std::mutex> lock(mutex_);
      replacement = config_dir_;
    } else {
      replacement = get(name);
    }
    result.replace(static_cast<size_t>(match.position()),
                   static_cast<size_t>(match.length()), replacement);
  }
  return result;
}
