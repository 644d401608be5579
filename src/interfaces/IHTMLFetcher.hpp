#pragma once
#include <string>
#include <optional>
#include <functional>
#include "../network/FetchError.hpp"

namespace LinkPreview {

struct FetchResult {
    std::string content;            // HTML text, empty on error
    long status_code = 0;
    std::string effective_url;      // after redirects
    std::string content_type;
    std::optional<FetchError> error;

    bool ok() const { return !error.has_value(); }
};

class IHTMLFetcher {
public:
    using Callback = std::function<void(FetchResult)>;
    virtual ~IHTMLFetcher() = default;
    // Starts one GET. cb is invoked exactly once, possibly on another thread.
    virtual void Fetch(const std::string& url, Callback cb) = 0;
};

}
