#include <algorithm>
#include <iostream>
#include <curl/curl.h>
#include <filesystem>
#include <thread>
#include <vector>
#include <string>
#include "../config/Config.hpp"
#include "core/Cli.hpp"
#include "core/LinkPreviewHandler.hpp"
#include "network/HTMLFetcher.hpp"
#include "parser/DefaultMetadataExtractor.hpp"
#include "utils/Logger.hpp"
#include "utils/ThreadPool.hpp"

using namespace LinkPreview::Cli;

int main(int argc, char* argv[]) {
    if (argc == 0 || argv[0] == nullptr) {
        LinkPreview::Logger::Log(LinkPreview::LogLevel::Error, "Cannot determine executable path.");
        return kExitStartupError;
    }

    Options options;
    std::string arg_error;
    if (!ParseArgs(std::vector<std::string>(argv + 1, argv + argc), options, arg_error)) {
        std::cerr << arg_error << "\n";
        PrintUsage(std::cerr, argv[0]);
        return kExitStartupError;
    }
    if (options.help) {
        PrintUsage(std::cout, argv[0]);
        return kExitOk;
    }

    std::filesystem::path exe_dir = std::filesystem::path(argv[0]).parent_path();
    const std::string config_path_str = options.config_path.empty()
        ? (exe_dir / "config" / "config.json").string()
        : options.config_path;

    // stdout carries results; logs go to stderr.
    LinkPreview::Logger::Init("", LinkPreview::LogLevel::Info, LinkPreview::LogConsole::Stderr);

    // Initialize global resources
    curl_global_init(CURL_GLOBAL_ALL);

    if (!LoadConfig(LinkPreview::Config::GetInstance(), config_path_str)) {
        curl_global_cleanup();
        return kExitStartupError;
    }
    const auto& config = LinkPreview::Config::GetInstance();
    LinkPreview::Logger::Init(config.log_to_file ? exe_dir.string() : std::string(),
                              LinkPreview::Logger::FromString(config.log_level),
                              LinkPreview::LogConsole::Stderr);

    // Determine thread pool size
    const unsigned int hardware_cores = std::thread::hardware_concurrency();
    unsigned int worker_threads = 0;
    if (config.max_concurrency == 0) {
        worker_threads = std::max(1u, hardware_cores / 2);
        LinkPreview::Logger::Log(LinkPreview::LogLevel::Debug, "max_concurrency is 0, using half of system cores: " + std::to_string(worker_threads));
    } else {
        worker_threads = static_cast<unsigned int>(config.max_concurrency);
    }

    LinkPreview::FetchOptions fetch_options;
    fetch_options.timeout_ms = config.http_timeout_ms;
    fetch_options.max_redirects = config.http_max_redirects;
    fetch_options.max_bytes = config.max_html_bytes;
    fetch_options.user_agent = config.http_user_agent;
    fetch_options.accept = config.http_accept;
    fetch_options.accept_language = config.http_accept_language;

    int exit_code = kExitOk;
    try {
        // Both run modes wait for every response, so no transfer is in flight
        // when these are destroyed.
        LinkPreview::ThreadPool thread_pool(worker_threads);
        LinkPreview::HTMLFetcher html_fetcher(fetch_options);
        LinkPreview::DefaultMetadataExtractor extractor;
        LinkPreview::LinkPreviewHandler handler(thread_pool, html_fetcher, extractor);

        exit_code = options.serve ? RunServe(handler, std::cin, std::cout) : RunUrls(handler, options.urls, std::cout);
    } catch (const std::exception& e) {
        LinkPreview::Logger::Log(LinkPreview::LogLevel::Error, "Fatal error: " + std::string(e.what()));
        exit_code = kExitStartupError;
    }

    // Cleanup global resources
    curl_global_cleanup();
    return exit_code;
}
