#include "FetchError.hpp"
#include <utility>

namespace LinkPreview {

const char* ToString(FetchErrorKind kind) {
    switch (kind) {
        case FetchErrorKind::Timeout:    return "Timeout";
        case FetchErrorKind::HttpStatus: return "HttpStatus";
        case FetchErrorKind::Network:    return "Network";
        case FetchErrorKind::TooLarge:   return "TooLarge";
        case FetchErrorKind::NotHtml:    return "NotHtml";
    }
    return "Network";
}

FetchError FetchError::Timeout() {
    FetchError e;
    e.kind = FetchErrorKind::Timeout;
    return e;
}

FetchError FetchError::HttpStatus(long code) {
    FetchError e;
    e.kind = FetchErrorKind::HttpStatus;
    e.status_code = code;
    return e;
}

FetchError FetchError::Network(std::string cause) {
    FetchError e;
    e.kind = FetchErrorKind::Network;
    e.cause = std::move(cause);
    return e;
}

FetchError FetchError::TooLarge(std::uint64_t size) {
    FetchError e;
    e.kind = FetchErrorKind::TooLarge;
    e.size = size;
    return e;
}

FetchError FetchError::NotHtml(std::string content_type) {
    FetchError e;
    e.kind = FetchErrorKind::NotHtml;
    e.content_type = std::move(content_type);
    return e;
}

std::string FetchError::Describe() const {
    std::string out = ToString(kind);
    switch (kind) {
        case FetchErrorKind::Timeout:
            break;
        case FetchErrorKind::HttpStatus:
            out += "(" + std::to_string(status_code) + ")";
            break;
        case FetchErrorKind::Network:
            out += "(" + cause + ")";
            break;
        case FetchErrorKind::TooLarge:
            out += "(" + std::to_string(size) + ")";
            break;
        case FetchErrorKind::NotHtml:
            out += "(" + content_type + ")";
            break;
    }
    return out;
}

}
