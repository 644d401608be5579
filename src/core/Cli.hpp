#pragma once
#include <iosfwd>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "LinkPreviewHandler.hpp"
#include "../../config/Config.hpp"

namespace LinkPreview {
namespace Cli {

constexpr int kExitOk = 0;
constexpr int kExitStartupError = 1;
constexpr int kExitRequestFailed = 2;

struct Options {
    std::string config_path;
    bool serve = false;
    bool help = false;
    std::vector<std::string> urls;
};

void PrintUsage(std::ostream& out, const std::string& program);

// args excludes the program name. On false, error says what was wrong.
bool ParseArgs(const std::vector<std::string>& args, Options& options, std::string& error);

// One compact JSON line; invalid UTF-8 is replaced rather than thrown on.
std::string DumpLine(const nlohmann::json& j);

// Loads config_path into config, creating a default file when it is missing.
// Returns false on a fatal error (malformed or invalid file).
bool LoadConfig(Config& config, const std::string& config_path);

// Unfurls every URL concurrently and writes one line per URL in argument order.
// kExitRequestFailed when any of them failed.
int RunUrls(LinkPreviewHandler& handler, const std::vector<std::string>& urls, std::ostream& out);

// Reads one request per line until EOF: a bare URL or {"url": "...", "id": ...}.
// Replies are written as they complete, carrying the request's id. Returns once
// every accepted request has been answered.
int RunServe(LinkPreviewHandler& handler, std::istream& in, std::ostream& out);

}
}
