#include "Logger.hpp"
#include <iostream>
#include <iomanip>
#include <chrono>
#include <fstream>

namespace LinkPreview {

std::mutex Logger::log_mutex;
LogLevel Logger::min_level_ = LogLevel::Info;
LogConsole Logger::console_ = LogConsole::Stderr;
std::filesystem::path Logger::logs_dir_{};
std::string Logger::current_date_{};

namespace {

std::ofstream& FileStream() {
    static std::ofstream ofs;
    return ofs;
}

std::string FormatDate(const std::tm& tm) {
    char buf[16];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d", &tm);
    return buf;
}

} // anonymous namespace

void Logger::Init(const std::string& base_dir, LogLevel min_level, LogConsole console) {
    std::lock_guard<std::mutex> lock(log_mutex);
    min_level_ = min_level;
    console_ = console;
    current_date_.clear();
    if (base_dir.empty()) {
        logs_dir_.clear();
        auto& ofs = FileStream();
        if (ofs.is_open()) ofs.close();
        return;
    }
    logs_dir_ = std::filesystem::path(base_dir) / "logs";
    std::error_code ec;
    std::filesystem::create_directories(logs_dir_, ec);
    if (ec) {
        std::cerr << "Could not create log directory " << logs_dir_.string() << ": " << ec.message() << std::endl;
        logs_dir_.clear();
    }
    // The dated file is opened on the first Log() call.
}

void Logger::SetMinLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(log_mutex);
    min_level_ = level;
}

void Logger::SetConsole(LogConsole console) {
    std::lock_guard<std::mutex> lock(log_mutex);
    console_ = console;
}

LogLevel Logger::FromString(const std::string& s) {
    std::string t;
    t.reserve(s.size());
    for (unsigned char c : s) t.push_back((c >= 'A' && c <= 'Z') ? char(c + 32) : char(c));
    if (t == "debug") return LogLevel::Debug;
    if (t == "info")  return LogLevel::Info;
    if (t == "warn" || t == "warning")  return LogLevel::Warn;
    if (t == "error" || t == "err") return LogLevel::Error;
    return LogLevel::Info;
}

const char* Logger::ToString(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "Debug";
        case LogLevel::Info:  return "Info";
        case LogLevel::Warn:  return "Warn";
        case LogLevel::Error: return "Error";
    }
    return "Info";
}

bool Logger::IsEnabled(LogLevel level) {
    std::lock_guard<std::mutex> lock(log_mutex);
    return level >= min_level_;
}

void Logger::OpenLogFileForDate(const std::string& date) {
    auto& ofs = FileStream();
    if (ofs.is_open()) ofs.close();
    ofs.open(logs_dir_ / (date + ".log"), std::ios::out | std::ios::app);
}

void Logger::EnsureLogFileUnlocked(const std::tm& now_tm) {
    std::string date = FormatDate(now_tm);
    if (date != current_date_) {
        current_date_ = date;
        OpenLogFileForDate(date);
    }
}

void Logger::Log(LogLevel level, const std::string& message) {
    std::lock_guard<std::mutex> lock(log_mutex);
    if (level < min_level_) return;

    auto in_time_t = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm buf;
    #ifdef _WIN32
    localtime_s(&buf, &in_time_t);
    #else
    localtime_r(&in_time_t, &buf);
    #endif

    std::ostream* console = nullptr;
    if (console_ == LogConsole::Stdout) console = &std::cout;
    else if (console_ == LogConsole::Stderr) console = &std::cerr;
    if (console) {
        *console << std::put_time(&buf, "%Y-%m-%d %X") << " [" << ToString(level) << "] " << message << std::endl;
    }

    // logs/YYYY-MM-DD.log
    if (!logs_dir_.empty()) {
        EnsureLogFileUnlocked(buf);
        auto& ofs = FileStream();
        if (ofs.is_open()) {
            ofs << std::put_time(&buf, "%Y-%m-%d %X") << " [" << ToString(level) << "] " << message << std::endl;
        }
    }
}

}
