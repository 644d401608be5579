#include <catch2/catch_all.hpp>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <future>
#include <sstream>
#include <stdexcept>
#include <thread>
#include "network/FetchError.hpp"
#include "utils/Logger.hpp"
#include "utils/StringUtil.hpp"
#include "utils/ThreadPool.hpp"

using namespace LinkPreview;

TEST_CASE("ThreadPool runs every queued task before shutdown returns") {
    ThreadPool pool(3);
    CHECK(pool.size() == 3);

    std::atomic<int> done{0};
    for (int i = 0; i < 50; ++i) {
        REQUIRE(pool.enqueue([&done] {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
            done++;
        }));
    }
    pool.shutdown();
    CHECK(done == 50);
    CHECK(pool.pending() == 0);
}

TEST_CASE("ThreadPool refuses work after shutdown") {
    ThreadPool pool(1);
    pool.shutdown();
    pool.shutdown(); // idempotent

    bool ran = false;
    CHECK_FALSE(pool.enqueue([&ran] { ran = true; }));
    CHECK_FALSE(ran);
}

TEST_CASE("ThreadPool keeps working after a task throws") {
    Logger::SetConsole(LogConsole::None);
    ThreadPool pool(1);

    REQUIRE(pool.enqueue([] { throw std::runtime_error("task failure"); }));
    std::promise<void> second;
    auto fut = second.get_future();
    REQUIRE(pool.enqueue([&second] { second.set_value(); }));

    CHECK(fut.wait_for(std::chrono::seconds(5)) == std::future_status::ready);
    Logger::SetConsole(LogConsole::Stderr);
}

TEST_CASE("ThreadPool with zero threads still gets one worker") {
    ThreadPool pool(0);
    CHECK(pool.size() == 1);
}

TEST_CASE("StringUtil helpers") {
    using namespace StringUtil;

    CHECK(Trim("  \t text \r\n") == "text");
    CHECK(Trim("   ") == "");
    CHECK(Trim("") == "");
    CHECK(ToLowerAscii("Og:Title") == "og:title");
    CHECK(EqualsIgnoreCase("Text/HTML", "text/html"));
    CHECK_FALSE(EqualsIgnoreCase("text/htm", "text/html"));
    CHECK(ContainsIgnoreCase("Text/HTML; charset=utf-8", "text/html"));
    CHECK(SplitWhitespace("  shortcut \t icon ") == std::vector<std::string>{"shortcut", "icon"});
    CHECK(SplitWhitespace("   ").empty());
}

TEST_CASE("FetchError describes itself for logs") {
    CHECK(FetchError::Timeout().Describe() == "Timeout");
    CHECK(FetchError::HttpStatus(404).Describe() == "HttpStatus(404)");
    CHECK(FetchError::Network("Connection refused").Describe() == "Network(Connection refused)");
    CHECK(FetchError::TooLarge(6000000).Describe() == "TooLarge(6000000)");
    CHECK(FetchError::NotHtml("application/pdf").Describe() == "NotHtml(application/pdf)");
    CHECK(std::string(ToString(FetchErrorKind::NotHtml)) == "NotHtml");
}

TEST_CASE("Logger level parsing and filtering") {
    CHECK(Logger::FromString("DEBUG") == LogLevel::Debug);
    CHECK(Logger::FromString("info") == LogLevel::Info);
    CHECK(Logger::FromString("Warning") == LogLevel::Warn);
    CHECK(Logger::FromString("err") == LogLevel::Error);
    CHECK(Logger::FromString("nonsense") == LogLevel::Info);
    CHECK(std::string(Logger::ToString(LogLevel::Warn)) == "Warn");

    Logger::SetMinLevel(LogLevel::Warn);
    CHECK_FALSE(Logger::IsEnabled(LogLevel::Info));
    CHECK(Logger::IsEnabled(LogLevel::Error));
    Logger::SetMinLevel(LogLevel::Info);
}

TEST_CASE("Logger writes a dated file under logs/ when given a base directory") {
    namespace fs = std::filesystem;
    fs::path dir = fs::temp_directory_path() / ("linkpreview_logger_" + std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()));
    fs::create_directories(dir);

    Logger::Init(dir.string(), LogLevel::Info, LogConsole::None);
    Logger::Log(LogLevel::Debug, "hidden debug line");
    Logger::Log(LogLevel::Warn, "visible warning line");
    Logger::Init("", LogLevel::Info, LogConsole::Stderr);

    std::vector<fs::path> files;
    for (const auto& entry : fs::directory_iterator(dir / "logs")) files.push_back(entry.path());
    REQUIRE(files.size() == 1);
    CHECK(files[0].extension() == ".log");

    std::ifstream in(files[0]);
    std::stringstream content;
    content << in.rdbuf();
    CHECK_THAT(content.str(), Catch::Matchers::ContainsSubstring("[Warn] visible warning line"));
    CHECK_THAT(content.str(), !Catch::Matchers::ContainsSubstring("hidden debug line"));

    in.close();
    fs::remove_all(dir);
}
