#pragma once
#include <string>
#include <cstddef>
#include <nlohmann/json.hpp>

namespace LinkPreview {
    struct Config {
        long http_timeout_ms = 10000;
        long http_max_redirects = 20;
        std::string http_user_agent = "Mozilla/5.0 (compatible; LinkPreviewer/1.0; +https://github.com/link-previewer/link-previewer)";
        std::string http_accept = "text/html,application/xhtml+xml,application/xml;q=0.9,*/*;q=0.8";
        std::string http_accept_language = "en-US,en;q=0.5";
        size_t max_html_bytes = 5242880; // 5 MiB
        int max_concurrency = 0;         // 0: half of the hardware threads
        std::string log_level = "info";
        bool log_to_file = false;

        static Config& GetInstance() {
            static Config instance;
            return instance;
        }

        // Throws std::runtime_error("Could not open config file: ...") when the file is missing,
        // std::runtime_error for malformed JSON, wrong value types or out-of-range values.
        void Load(const std::string& path);
        void CreateDefault(const std::string& path);
        void Validate() const;

        nlohmann::json ToJson() const;
    };
}
