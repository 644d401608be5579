#include "Cli.hpp"
#include <condition_variable>
#include <future>
#include <istream>
#include <memory>
#include <mutex>
#include <ostream>
#include <stdexcept>
#include "../utils/Logger.hpp"
#include "../utils/ResponseJson.hpp"
#include "../utils/StringUtil.hpp"

namespace LinkPreview {
namespace Cli {

void PrintUsage(std::ostream& out, const std::string& program) {
    out << "Usage: " << program << " [--config PATH] URL...\n"
        << "       " << program << " [--config PATH] --serve\n\n"
        << "Fetches each URL and prints its link-preview metadata as one JSON line.\n"
        << "--serve reads requests from stdin, one per line: a bare URL or {\"url\": \"...\", \"id\": ...}.\n";
}

bool ParseArgs(const std::vector<std::string>& args, Options& options, std::string& error) {
    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        if (arg == "--help" || arg == "-h") {
            options.help = true;
        } else if (arg == "--serve") {
            options.serve = true;
        } else if (arg == "--config") {
            if (i + 1 >= args.size()) {
                error = "--config requires a path";
                return false;
            }
            options.config_path = args[++i];
        } else if (arg.rfind("--", 0) == 0) {
            error = "Unknown option: " + arg;
            return false;
        } else {
            options.urls.push_back(arg);
        }
    }
    if (!options.help && !options.serve && options.urls.empty()) {
        error = "No URL given";
        return false;
    }
    if (options.serve && !options.urls.empty()) {
        error = "--serve does not take URL arguments";
        return false;
    }
    return true;
}

std::string DumpLine(const nlohmann::json& j) {
    return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

bool LoadConfig(Config& config, const std::string& config_path) {
    try {
        config.Load(config_path);
        Logger::Log(LogLevel::Debug, "Configuration loaded from: " + config_path);
        return true;
    } catch (const std::runtime_error& e) {
        std::string error_message = e.what();
        if (error_message.find("Could not open config file") == std::string::npos) {
            Logger::Log(LogLevel::Error, "Failed to load config: " + error_message);
            return false;
        }
    }

    Logger::Log(LogLevel::Warn, "config.json not found. Creating a default one at: " + config_path);
    try {
        config.CreateDefault(config_path);
    } catch (const std::exception& create_e) {
        // Defaults still apply; only the file could not be written.
        Logger::Log(LogLevel::Warn, "Failed to create default config: " + std::string(create_e.what()));
    }
    return true;
}

int RunUrls(LinkPreviewHandler& handler, const std::vector<std::string>& urls, std::ostream& out) {
    std::vector<std::future<UnfurlResponse>> futures;
    futures.reserve(urls.size());
    for (const auto& url : urls) {
        auto promise = std::make_shared<std::promise<UnfurlResponse>>();
        futures.push_back(promise->get_future());
        handler.UnfurlAsync(url, [promise](UnfurlResponse response) {
            promise->set_value(std::move(response));
        });
    }

    int exit_code = kExitOk;
    for (auto& fut : futures) {
        UnfurlResponse response = fut.get();
        if (!response.success) exit_code = kExitRequestFailed;
        out << DumpLine(ResponseToJson(response)) << std::endl;
    }
    return exit_code;
}

int RunServe(LinkPreviewHandler& handler, std::istream& in, std::ostream& out) {
    std::mutex output_mutex;
    std::mutex outstanding_mutex;
    std::condition_variable outstanding_cv;
    size_t outstanding = 0;

    auto write_line = [&output_mutex, &out](const nlohmann::json& j) {
        std::lock_guard<std::mutex> lock(output_mutex);
        out << DumpLine(j) << std::endl;
    };

    std::string line;
    while (std::getline(in, line)) {
        line = StringUtil::Trim(line);
        if (line.empty()) continue;

        std::string url;
        nlohmann::json id;
        if (line[0] == '{') {
            nlohmann::json request = nlohmann::json::parse(line, nullptr, false);
            if (request.is_discarded() || !request.is_object() || !request.contains("url") || !request["url"].is_string()) {
                Logger::Log(LogLevel::Warn, "Malformed request line: " + line);
                nlohmann::json reply = ResponseToJson(UnfurlResponse::Failure(
                    ErrorCode::kInvalidRequest, "Invalid request: expected {\"url\": \"...\"}"));
                if (!request.is_discarded() && request.is_object() && request.contains("id")) reply["id"] = request["id"];
                write_line(reply);
                continue;
            }
            url = request["url"].get<std::string>();
            if (request.contains("id")) id = request["id"];
        } else {
            url = line;
        }

        {
            std::lock_guard<std::mutex> lock(outstanding_mutex);
            ++outstanding;
        }
        handler.UnfurlAsync(url, [&, id](UnfurlResponse response) {
            nlohmann::json reply = ResponseToJson(response);
            if (!id.is_null()) reply["id"] = id;
            write_line(reply);
            // Notify under the lock: RunServe's locals go away once outstanding hits zero.
            std::lock_guard<std::mutex> lock(outstanding_mutex);
            --outstanding;
            outstanding_cv.notify_all();
        });
    }

    std::unique_lock<std::mutex> lock(outstanding_mutex);
    outstanding_cv.wait(lock, [&outstanding] { return outstanding == 0; });
    return kExitOk;
}

}
}
