#pragma once
#include <string>
#include <cstdint>

namespace LinkPreview {

enum class FetchErrorKind {
    Timeout,
    HttpStatus,
    Network,
    TooLarge,
    NotHtml
};

const char* ToString(FetchErrorKind kind);

// Classified fetch failure. Only the field matching kind is meaningful:
// status_code for HttpStatus, size for TooLarge, content_type for NotHtml,
// cause for Network.
struct FetchError {
    FetchErrorKind kind = FetchErrorKind::Network;
    long status_code = 0;
    std::uint64_t size = 0;
    std::string content_type;
    std::string cause;

    static FetchError Timeout();
    static FetchError HttpStatus(long code);
    static FetchError Network(std::string cause);
    static FetchError TooLarge(std::uint64_t size);
    static FetchError NotHtml(std::string content_type);

    // Short text for logs, e.g. "HttpStatus(404)".
    std::string Describe() const;
};

}
