#pragma once
#include <string>
#include <fstream>
#include <mutex>

namespace promfile {

enum class LogLevel {
    DEBUG,
    INFO,
    WARN,
    ERROR
};

// Accepts "debug", "info", "warn"/"warning", "error" (case-insensitive).
// Returns false and leaves `level` untouched for anything else.
bool parse_log_level(const std::string& text, LogLevel& level);

class Logger {
public:
    static void init(LogLevel level, const std::string& log_file_path = "");
    static void set_level(LogLevel level);
    static LogLevel level();
    static void log(LogLevel level, const std::string& message);
    
    static void debug(const std::string& message) { log(LogLevel::DEBUG, message); }
    static void info(const std::string& message) { log(LogLevel::INFO, message); }
    static void warn(const std::string& message) { log(LogLevel::WARN, message); }
    static void error(const std::string& message) { log(LogLevel::ERROR, message); }

private:
    static LogLevel current_level;
    static std::ofstream log_file;
    static std::mutex log_mutex;
};

} // namespace promfile
