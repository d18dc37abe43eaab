#ifndef LOGGER_ENGINE_HPP
#define LOGGER_ENGINE_HPP

#include "LogExport.hpp"
#include "LogTypes.hpp"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <map>
#include <mutex>
#include <string>

namespace LogLib {

/**
 * @brief 카테고리별 파일/콘솔 출력과 크기 기반 로테이션을 담당하는 엔진
 * @details 프로젝트 설정과 무관하게 동작하며 DLL/SO 로도 배포 가능.
 *
 * 카테고리 경로:
 *  - ""                    -> <base>/<YYYYMMDD>/homelens.log
 *  - "discovery_<proto>"   -> <base>/discovery/<YYYYMMDD>/<proto>.log
 *  - 그 외                 -> <base>/<YYYYMMDD>/<category>.log
 *
 * 파일이 최대 크기에 도달하면 <stem>_<YYYYmmddHHMMSS>_<seq>.log 로 옮기고 새 파일을 연다.
 * 같은 디렉토리의 백업은 최대 max_log_files 개만 남긴다.
 */
class LOGLIB_API LoggerEngine {
public:
    static LoggerEngine& getInstance();

    void setLogLevel(LogLevel level);
    LogLevel getLogLevel() const;

    void setLogBasePath(const std::string& path);
    void setConsoleOutput(bool enabled);
    void setFileOutput(bool enabled);
    bool isConsoleOutputEnabled() const;

    void setMaxLogSizeMB(size_t size_mb);
    void setMaxLogSizeBytes(uint64_t bytes);
    void setMaxLogFiles(int count);

    void log(const std::string& category, LogLevel level, const std::string& message);

    void flushAll();
    LogStatistics getStatistics() const;
    void resetStatistics();

    /**
     * @brief KEY=VALUE 형식 파일 적용 (LOG_LEVEL, LOG_FILE_PATH, LOG_TO_CONSOLE,
     *        LOG_TO_FILE, LOG_MAX_SIZE_MB, LOG_MAX_FILES)
     * @return 파일을 열지 못하면 false
     */
    bool loadFromConfigFile(const std::string& path);

    static LogLevel stringToLogLevel(const std::string& level);

    std::filesystem::path buildLogFilePath(const std::string& category) const;

private:
    struct FileSink {
        std::ofstream stream;
        uint64_t bytes = 0;
    };

    LoggerEngine();
    ~LoggerEngine();

    LoggerEngine(const LoggerEngine&) = delete;
    LoggerEngine& operator=(const LoggerEngine&) = delete;

    FileSink* openSink(const std::filesystem::path& path);
    void rotate(const std::filesystem::path& path, FileSink& sink);
    void pruneBackups(const std::filesystem::path& path);
    void applyConfig(const std::string& key, const std::string& value);
    void countLevel(LogLevel level);

    static std::string formatNow(const char* pattern);

    mutable std::mutex mutex_;
    std::map<std::string, FileSink> sinks_;

    LogLevel min_level_;
    std::filesystem::path base_path_;
    bool console_enabled_;
    bool file_enabled_;
    uint64_t max_file_bytes_;
    int max_log_files_;
    uint64_t rotation_seq_;

    LogStatistics statistics_;
};

} // namespace LogLib

#endif // LOGGER_ENGINE_HPP
