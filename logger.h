#pragma once
// Thread-safe log sink shared by branch workers and the HTTP thread. Lines go
// to the console always and to a file once initialize() succeeds.

#include <fstream>
#include <mutex>
#include <sstream>
#include <string>

enum class LogLevel { Debug, Info, Warn, Error };

class Logger {
public:
    static Logger& instance();

    void initialize(const std::string& log_file_path);
    void set_min_level(LogLevel level);
    void log(LogLevel level, const std::string& message);

private:
    Logger() = default;
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::mutex mutex_;
    std::ofstream file_;
    LogLevel min_level_ = LogLevel::Info;
};

inline void log_debug(const std::string& m) { Logger::instance().log(LogLevel::Debug, m); }
inline void log_info(const std::string& m) { Logger::instance().log(LogLevel::Info, m); }
inline void log_warn(const std::string& m) { Logger::instance().log(LogLevel::Warn, m); }
inline void log_error(const std::string& m) { Logger::instance().log(LogLevel::Error, m); }
