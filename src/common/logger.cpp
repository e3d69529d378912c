#include "common/logger.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>

LogLevel parse_log_level(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "debug") return LogLevel::DEBUG;
    if (lower == "warn" || lower == "warning") return LogLevel::WARNING;
    if (lower == "error") return LogLevel::ERROR;
    return LogLevel::INFO;
}

Logger& Logger::instance() {
    static Logger instance;
    return instance;
}

Logger::~Logger() {
    if (log_file_.is_open()) {
        log_file_.close();
    }
}

void Logger::init(const std::string& filename) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (log_file_.is_open()) {
        log_file_.close();
    }
    if (!filename.empty()) {
        log_file_.open(filename, std::ios::app);
    }
}

void Logger::set_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    min_level_ = level;
}

LogLevel Logger::level() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return min_level_;
}

void Logger::set_console(bool enabled) {
    std::lock_guard<std::mutex> lock(mutex_);
    console_ = enabled;
}

bool Logger::enabled(LogLevel level) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<int>(level) >= static_cast<int>(min_level_);
}

void Logger::log(LogLevel level, const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (static_cast<int>(level) < static_cast<int>(min_level_)) return;

    std::string timestamp = get_timestamp();
    std::string level_str = level_to_string(level);

    // Construct log line
    std::stringstream ss;
    ss << "[" << timestamp << "] [" << level_str << "] " << message << "\n";
    std::string log_line = ss.str();

    if (log_file_.is_open()) {
        log_file_ << log_line;
        log_file_.flush();
    }

    if (!console_) return;

    // Write to console (colored)
    std::string color_code;
    switch(level) {
        case LogLevel::INFO:    color_code = "\033[32m"; break; // Green
        case LogLevel::WARNING: color_code = "\033[33m"; break; // Yellow
        case LogLevel::ERROR:   color_code = "\033[31m"; break; // Red
        case LogLevel::DEBUG:   color_code = "\033[36m"; break; // Cyan
    }
    std::ostream& out = (level == LogLevel::ERROR) ? std::cerr : std::cout;
    out << color_code << log_line << "\033[0m";
}

std::string Logger::level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARNING: return "WARN";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::DEBUG: return "DEBUG";
        default: return "UNKNOWN";
    }
}

std::string Logger::get_timestamp() {
    auto now = std::chrono::system_clock::now();
    auto in_time_t = std::chrono::system_clock::to_time_t(now);
    std::tm local_tm{};
    localtime_r(&in_time_t, &local_tm);
    std::stringstream ss;
    ss << std::put_time(&local_tm, "%Y-%m-%d %X");
    return ss.str();
}
