#include "logger.h"
#include "sync_errors.h"

#include <chrono>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <iostream>

namespace fs = std::filesystem;

static const char* level_name(LogLevel level) {
    switch (level) {
    case LogLevel::Debug: return "DEBUG";
    case LogLevel::Info: return "INFO";
    case LogLevel::Warn: return "WARN";
    case LogLevel::Error: return "ERROR";
    }
    return "INFO";
}

Logger& Logger::instance() {
    static Logger logger;
    return logger;
}

void Logger::initialize(const std::string& log_file_path) {
    std::lock_guard<std::mutex> guard(mutex_);
    const fs::path target(log_file_path);
    if (const auto parent = target.parent_path(); !parent.empty()) {
        std::error_code ec;
        fs::create_directories(parent, ec);
        if (ec) throw ConfigError("cannot create log directory " + parent.string() + ": " + ec.message());
    }
    file_.close();
    file_.open(target, std::ios::out | std::ios::app);
    if (!file_.is_open()) throw ConfigError("failed to open log file: " + target.string());
}

void Logger::set_min_level(LogLevel level) {
    std::lock_guard<std::mutex> guard(mutex_);
    min_level_ = level;
}

void Logger::log(LogLevel level, const std::string& message) {
    std::lock_guard<std::mutex> guard(mutex_);
    if (level < min_level_) return;

    const auto now = std::chrono::system_clock::now();
    const std::time_t t = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
#if defined(_WIN32)
    localtime_s(&tm, &t);
#else
    localtime_r(&t, &tm);
#endif
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S") << " | " << level_name(level) << " | " << message;
    const std::string line = oss.str();

    if (file_.is_open()) {
        file_ << line << '\n';
        file_.flush();
    }
    if (level == LogLevel::Error) std::cerr << line << std::endl;
    else std::cout << line << std::endl;
}
