#include "Config.hpp"
#include "../src/utils/Logger.hpp"
#include <fstream>
#include <iomanip>
#include <stdexcept>
#include <filesystem>
#include <thread>

namespace LinkPreview {

nlohmann::json Config::ToJson() const {
    nlohmann::json data;
    data["http_timeout_ms"] = http_timeout_ms;
    data["http_max_redirects"] = http_max_redirects;
    data["http_user_agent"] = http_user_agent;
    data["http_accept"] = http_accept;
    data["http_accept_language"] = http_accept_language;
    data["max_html_bytes"] = max_html_bytes;
    data["max_concurrency"] = max_concurrency;
    data["log_level"] = log_level;
    data["log_to_file"] = log_to_file;
    return data;
}

void Config::Validate() const {
    if (http_timeout_ms <= 0) {
        throw std::runtime_error("http_timeout_ms must be positive, got " + std::to_string(http_timeout_ms));
    }
    if (http_max_redirects < 0) {
        throw std::runtime_error("http_max_redirects must not be negative, got " + std::to_string(http_max_redirects));
    }
    if (max_html_bytes == 0) {
        throw std::runtime_error("max_html_bytes must be positive");
    }
    if (max_concurrency < 0) {
        throw std::runtime_error("max_concurrency must not be negative, got " + std::to_string(max_concurrency));
    }
    // hardware_concurrency() may report 0 when unknown; no upper bound then.
    const unsigned int hardware_cores = std::thread::hardware_concurrency();
    if (hardware_cores > 0 && static_cast<unsigned int>(max_concurrency) > hardware_cores) {
        throw std::runtime_error("max_concurrency (" + std::to_string(max_concurrency) +
            ") must be between 0 and the number of system cores (" + std::to_string(hardware_cores) + ")");
    }
}

void Config::Load(const std::string& path) {
    std::ifstream f(path);
    if (!f.is_open()) {
        throw std::runtime_error("Could not open config file: " + path);
    }

    nlohmann::json data;
    Config loaded;
    try {
        data = nlohmann::json::parse(f);
        if (!data.is_object()) {
            throw std::runtime_error("top-level value is not an object");
        }
        loaded.http_timeout_ms = data.value("http_timeout_ms", loaded.http_timeout_ms);
        loaded.http_max_redirects = data.value("http_max_redirects", loaded.http_max_redirects);
        loaded.http_user_agent = data.value("http_user_agent", loaded.http_user_agent);
        loaded.http_accept = data.value("http_accept", loaded.http_accept);
        loaded.http_accept_language = data.value("http_accept_language", loaded.http_accept_language);
        const long long max_bytes = data.value("max_html_bytes", static_cast<long long>(loaded.max_html_bytes));
        if (max_bytes <= 0) {
            throw std::runtime_error("max_html_bytes must be positive, got " + std::to_string(max_bytes));
        }
        loaded.max_html_bytes = static_cast<size_t>(max_bytes);
        loaded.max_concurrency = data.value("max_concurrency", loaded.max_concurrency);
        loaded.log_level = data.value("log_level", loaded.log_level);
        loaded.log_to_file = data.value("log_to_file", loaded.log_to_file);
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error("Invalid config file " + path + ": " + e.what());
    } catch (const std::runtime_error& e) {
        throw std::runtime_error("Invalid config file " + path + ": " + e.what());
    }
    loaded.Validate();
    *this = loaded;

    // Write back missing keys so an existing config.json shows every option.
    // Unknown keys are preserved.
    bool changed = false;
    for (const auto& item : ToJson().items()) {
        if (!data.contains(item.key())) {
            data[item.key()] = item.value();
            changed = true;
        }
    }
    if (!changed) return;

    std::filesystem::path p(path);
    std::filesystem::path bak = p;
    bak += ".bak";
    std::error_code ec;
    std::filesystem::copy_file(p, bak, std::filesystem::copy_options::overwrite_existing, ec);
    if (ec) {
        Logger::Log(LogLevel::Warn, "Could not back up config file " + path + ": " + ec.message());
        return;
    }

    std::ofstream o(path, std::ios::trunc);
    o << std::setw(4) << data << std::endl;
    if (!o.good()) {
        // Startup continues with the values already loaded.
        Logger::Log(LogLevel::Warn, "Could not write missing keys back to " + path);
    }
}

void Config::CreateDefault(const std::string& path_str) {
    std::filesystem::path path(path_str);

    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path());
    }

    Config defaults;
    std::ofstream o(path);
    if (!o.is_open()) {
        throw std::runtime_error("Could not open config file for writing: " + path_str);
    }
    o << std::setw(4) << defaults.ToJson() << std::endl;
    if (!o.good()) {
        throw std::runtime_error("Failed to write to config file: " + path_str);
    }
    *this = defaults;
}

}
