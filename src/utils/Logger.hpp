#pragma once
#include <string>
#include <mutex>
#include <ctime>
#include <filesystem>

namespace LinkPreview {
    enum class LogLevel {
        Debug,
        Info,
        Warn,
        Error
    };

    // Where console lines go. Stderr keeps stdout free for machine-readable output.
    enum class LogConsole {
        Stdout,
        Stderr,
        None
    };

    class Logger {
    public:
        // Empty base_dir disables the daily log file.
        static void Init(const std::string& base_dir, LogLevel min_level, LogConsole console = LogConsole::Stderr);
        static void SetMinLevel(LogLevel level);
        static void SetConsole(LogConsole console);
        static LogLevel FromString(const std::string& s);
        static const char* ToString(LogLevel level);
        static bool IsEnabled(LogLevel level);
        static void Log(LogLevel level, const std::string& message);
    private:
        static std::mutex log_mutex;
        static LogLevel min_level_;
        static LogConsole console_;
        static std::filesystem::path logs_dir_;
        static std::string current_date_;
        static void EnsureLogFileUnlocked(const std::tm& now_tm);
        static void OpenLogFileForDate(const std::string& date);
    };
}
