#pragma once
#include <string>
#include <optional>
#include <utility>
#include "../parser/MetadataExtractor.hpp"

namespace LinkPreview {

namespace ErrorCode {
    constexpr const char* kInvalidUrl = "invalid_url";
    constexpr const char* kInvalidRequest = "invalid_request";
    constexpr const char* kTimeout = "timeout";
    constexpr const char* kHttpStatus = "http_status";
    constexpr const char* kNetwork = "network";
    constexpr const char* kTooLarge = "too_large";
    constexpr const char* kNotHtml = "not_html";
    constexpr const char* kUnexpected = "unexpected";
}

// Result of one Unfurl call: either data, or an error message with its code.
struct UnfurlResponse {
    bool success = false;
    std::optional<Metadata> data;
    std::optional<std::string> error;
    std::optional<std::string> error_code;

    static UnfurlResponse Success(Metadata metadata) {
        UnfurlResponse r;
        r.success = true;
        r.data = std::move(metadata);
        return r;
    }

    static UnfurlResponse Failure(std::string code, std::string message) {
        UnfurlResponse r;
        r.error_code = std::move(code);
        r.error = std::move(message);
        return r;
    }
};

}
