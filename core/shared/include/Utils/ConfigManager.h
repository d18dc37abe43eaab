#pragma once

/**
 * @file ConfigManager.h
 * @brief 통합 설정 관리자
 * @author HomeLens Development Team
 * @date 2026-10-12
 *
 * - 설정 디렉토리 탐색 (HOMELENS_CONFIG_DIR -> ./config -> ../config -> ../../config)
 * - .env 와 CONFIG_FILES 에 나열된 추가 파일 로드 (KEY=VALUE, # 주석, 따옴표 허용)
 * - 메모리에 없는(또는 빈) 키는 환경변수로 fallback
 * - 로드 후 ${VAR} 확장 (${CONFIG_DIR} 는 설정 디렉토리)
 */

#include <atomic>
#include <map>
#include <mutex>
#include <string>
#include <vector>

class ConfigManager {
public:
  static ConfigManager &getInstance() {
    static ConfigManager instance;
    instance.ensureInitialized();
    return instance;
  }

  /**
   * @brief 파일 하나를 추가로 읽는다. 같은 키는 덮어쓴다.
   * @return 파일을 열지 못하면 false
   */
  bool load(const std::string &filepath);

  std::string get(const std::string &key) const;
  std::string getOrDefault(const std::string &key,
                           const std::string &defaultValue) const;
  void set(const std::string &key, const std::string &value);
  bool hasKey(const std::string &key) const;

  int getInt(const std::string &key, int defaultValue = 0) const;
  bool getBool(const std::string &key, bool defaultValue = false) const;
  double getDouble(const std::string &key, double defaultValue = 0.0) const;

  /**
   * @brief 콤마 구분 목록 ("mdns, upnp" -> {"mdns","upnp"}), 빈 항목 제외
   */
  std::vector<std::string> getList(const std::string &key,
                                   const std::string &defaultValue = "") const;

  std::string expandVariables(const std::string &value) const;

private:
  ConfigManager() = default;
  ~ConfigManager() = default;
  ConfigManager(const ConfigManager &) = delete;
  ConfigManager &operator=(const ConfigManager &) = delete;

  void ensureInitialized();
  void loadFromDirectory(const std::string &dir);
  void expandLoadedValues();
  std::string lookupUnlocked(const std::string &key) const;

  static std::string locateConfigDirectory();

  mutable std::mutex mutex_;
  std::map<std::string, std::string> values_;
  std::string config_dir_;

  std::atomic<bool> initialized_{false};
  std::mutex init_mutex_;
};

inline std::string GetConfig(const std::string &key,
                             const std::string &defaultValue = "") {
  return ConfigManager::getInstance().getOrDefault(key, defaultValue);
}
