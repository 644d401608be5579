#include "HTMLFetcher.hpp"
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <curl/curl.h>
#include <algorithm>
#include <optional>
#include <stdexcept>
#include <cstdlib>
#include <cerrno>
#include <cctype>
#include "../utils/Logger.hpp"
#include "../utils/StringUtil.hpp"

namespace {

using LinkPreview::FetchError;

// Context for a single cURL easy handle transfer
struct TransferContext {
    std::string url;
    std::string buffer;
    size_t max_bytes = 0;
    LinkPreview::IHTMLFetcher::Callback callback;
    curl_slist* headers = nullptr;
    char error_buffer[CURL_ERROR_SIZE] = {0};

    // Current response header block; reset on every status line (redirect hops).
    long header_status = 0;
    std::string header_content_type;
    std::optional<curl_off_t> header_content_length;

    // Set when a callback aborts the transfer on purpose.
    std::optional<FetchError> rejection;
    curl_off_t bytes_received = 0;

    ~TransferContext() {
        if (headers) curl_slist_free_all(headers);
    }
};

std::optional<curl_off_t> ParseContentLength(const std::string& value) {
    if (value.empty()) return std::nullopt;
    for (unsigned char c : value) {
        if (!std::isdigit(c)) return std::nullopt;
    }
    errno = 0;
    unsigned long long parsed = std::strtoull(value.c_str(), nullptr, 10);
    if (errno == ERANGE) return std::nullopt;
    return static_cast<curl_off_t>(parsed);
}

long ParseStatusLine(const std::string& line) {
    // "HTTP/1.1 200 OK", "HTTP/2 404"
    auto space = line.find(' ');
    if (space == std::string::npos) return 0;
    long code = 0;
    size_t digits = 0;
    for (size_t i = space + 1; i < line.size() && digits < 3; ++i, ++digits) {
        unsigned char c = static_cast<unsigned char>(line[i]);
        if (!std::isdigit(c)) return 0;
        code = code * 10 + (c - '0');
    }
    return digits == 3 ? code : 0;
}

// Judges a completed header block. Returns false to abort the transfer.
bool AcceptHeaderBlock(TransferContext* ctx) {
    const long status = ctx->header_status;
    if (status >= 100 && status < 200) return true;  // interim response, real headers follow
    if (status >= 300 && status < 400) return true;  // redirect hop; a final 3xx is judged on completion
    if (status < 200 || status >= 300) {
        ctx->rejection = FetchError::HttpStatus(status);
        return false;
    }
    if (ctx->header_content_length && *ctx->header_content_length > static_cast<curl_off_t>(ctx->max_bytes)) {
        ctx->rejection = FetchError::TooLarge(static_cast<std::uint64_t>(*ctx->header_content_length));
        return false;
    }
    if (!LinkPreview::IsHtmlContentType(ctx->header_content_type)) {
        ctx->rejection = FetchError::NotHtml(ctx->header_content_type);
        return false;
    }
    return true;
}

size_t HeaderCallback(char* buffer, size_t size, size_t nitems, void* userp) {
    const size_t total = size * nitems;
    auto* ctx = static_cast<TransferContext*>(userp);
    if (!ctx) return 0;

    std::string line(buffer, total);
    while (!line.empty() && (line.back() == '\r' || line.back() == '\n')) {
        line.pop_back();
    }

    if (line.compare(0, 5, "HTTP/") == 0) {
        ctx->header_status = ParseStatusLine(line);
        ctx->header_content_type.clear();
        ctx->header_content_length.reset();
        ctx->buffer.clear();
        ctx->bytes_received = 0;
        return total;
    }

    if (line.empty()) {
        return AcceptHeaderBlock(ctx) ? total : 0;
    }

    auto colon = line.find(':');
    if (colon == std::string::npos) return total;
    std::string key = LinkPreview::StringUtil::ToLowerAscii(LinkPreview::StringUtil::Trim(line.substr(0, colon)));
    std::string value = LinkPreview::StringUtil::Trim(line.substr(colon + 1));
    if (key == "content-type") {
        ctx->header_content_type = value;
    } else if (key == "content-length") {
        ctx->header_content_length = ParseContentLength(value);
    }
    return total;
}

size_t WriteCallback(void* contents, size_t size, size_t nmemb, void* userp) {
    const size_t chunk = size * nmemb;
    auto* ctx = static_cast<TransferContext*>(userp);
    if (!ctx || ctx->rejection) return 0;

    // Streaming cutoff: Content-Length may be absent or wrong.
    ctx->bytes_received += static_cast<curl_off_t>(chunk);
    if (ctx->bytes_received > static_cast<curl_off_t>(ctx->max_bytes)) {
        ctx->rejection = FetchError::TooLarge(static_cast<std::uint64_t>(ctx->bytes_received));
        return 0;
    }

    try {
        ctx->buffer.append(static_cast<char*>(contents), chunk);
    } catch (const std::bad_alloc&) {
        ctx->rejection = FetchError::TooLarge(static_cast<std::uint64_t>(ctx->bytes_received));
        return 0;
    }
    return chunk;
}

// Helper to create and configure a cURL easy handle
CURL* CreateEasyHandle(const LinkPreview::FetchOptions& options, TransferContext* transfer_ctx) {
    CURL* curl = curl_easy_init();
    if (!curl) return nullptr;

    transfer_ctx->headers = curl_slist_append(transfer_ctx->headers, ("Accept: " + options.accept).c_str());
    transfer_ctx->headers = curl_slist_append(transfer_ctx->headers, ("Accept-Language: " + options.accept_language).c_str());

    curl_easy_setopt(curl, CURLOPT_URL, transfer_ctx->url.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, WriteCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, transfer_ctx);
    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, HeaderCallback);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, transfer_ctx);
    // Proxy CONNECT replies would otherwise reach HeaderCallback as a 2xx block.
    curl_easy_setopt(curl, CURLOPT_SUPPRESS_CONNECT_HEADERS, 1L);
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, transfer_ctx->headers);
    curl_easy_setopt(curl, CURLOPT_USERAGENT, options.user_agent.c_str());
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, options.max_redirects);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, options.timeout_ms);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_ACCEPT_ENCODING, "gzip, deflate");
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 2L);
    curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, transfer_ctx->error_buffer);
    curl_easy_setopt(curl, CURLOPT_PRIVATE, transfer_ctx);

    long allowed_protocols = CURLPROTO_HTTP | CURLPROTO_HTTPS;
    curl_easy_setopt(curl, CURLOPT_PROTOCOLS, allowed_protocols);
    curl_easy_setopt(curl, CURLOPT_REDIR_PROTOCOLS, allowed_protocols);

    return curl;
}

LinkPreview::FetchResult BuildResult(CURL* easy_handle, CURLcode code, TransferContext* ctx) {
    LinkPreview::FetchResult result;

    if (ctx->rejection) {
        result.error = *ctx->rejection;
        return result;
    }
    if (code == CURLE_OPERATION_TIMEDOUT) {
        result.error = FetchError::Timeout();
        return result;
    }
    if (code != CURLE_OK) {
        std::string cause = ctx->error_buffer;
        if (cause.empty()) cause = curl_easy_strerror(code);
        result.error = FetchError::Network(std::move(cause));
        return result;
    }

    curl_easy_getinfo(easy_handle, CURLINFO_RESPONSE_CODE, &result.status_code);
    char* eff_url = nullptr;
    curl_easy_getinfo(easy_handle, CURLINFO_EFFECTIVE_URL, &eff_url);
    if (eff_url) result.effective_url = eff_url;
    char* content_type = nullptr;
    curl_easy_getinfo(easy_handle, CURLINFO_CONTENT_TYPE, &content_type);
    result.content_type = content_type ? std::string(content_type) : ctx->header_content_type;

    // Covers a final 3xx the transport did not follow.
    if (result.status_code < 200 || result.status_code >= 300) {
        result.error = FetchError::HttpStatus(result.status_code);
        return result;
    }
    if (!LinkPreview::IsHtmlContentType(result.content_type)) {
        result.error = FetchError::NotHtml(result.content_type);
        return result;
    }
    result.content = std::move(ctx->buffer);
    return result;
}

} // anonymous namespace

namespace LinkPreview {

bool IsHtmlContentType(const std::string& content_type) {
    return StringUtil::ContainsIgnoreCase(content_type, "text/html") ||
           StringUtil::ContainsIgnoreCase(content_type, "application/xhtml");
}

HTMLFetcher::HTMLFetcher(FetchOptions options) : options_(std::move(options)) {
    multi_handle_ = curl_multi_init();
    if (!multi_handle_) {
        throw std::runtime_error("Failed to initialize cURL multi handle");
    }
    worker_thread_ = std::thread(&HTMLFetcher::Run, this);
}

HTMLFetcher::~HTMLFetcher() {
    {
        std::unique_lock<std::mutex> lock(queue_mutex_);
        stop_ = true;
    }
    cv_.notify_one();
    curl_multi_wakeup(multi_handle_);
    if (worker_thread_.joinable()) {
        worker_thread_.join();
    }
    if (multi_handle_) {
        curl_multi_cleanup(multi_handle_);
    }
}

void HTMLFetcher::Fetch(const std::string& url, Callback cb) {
    {
        std::unique_lock<std::mutex> lock(queue_mutex_);
        pending_requests_.push_back({url, std::move(cb)});
    }
    cv_.notify_one();
    // Interrupts curl_multi_poll so the request starts without waiting for the poll timeout.
    curl_multi_wakeup(multi_handle_);
}

void HTMLFetcher::Run() {
    Logger::Log(LogLevel::Debug, "HTMLFetcher worker thread started.");
    int still_running = 0;

    while (true) {
        std::vector<Request> current_requests;
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            cv_.wait(lock, [this, &still_running] { return stop_ || !pending_requests_.empty() || still_running > 0; });
            if (stop_) break;
            std::swap(current_requests, pending_requests_);
        }

        StartTransfers(current_requests);

        curl_multi_perform(multi_handle_, &still_running);
        DrainCompleted();

        if (still_running > 0) {
            curl_multi_poll(multi_handle_, nullptr, 0, 1000, nullptr);
        }
    }

    AbortAll("fetcher shutting down");
    Logger::Log(LogLevel::Debug, "HTMLFetcher worker thread stopped.");
}

void HTMLFetcher::StartTransfers(std::vector<Request>& requests) {
    for (auto& req : requests) {
        auto* transfer_ctx = new TransferContext();
        transfer_ctx->url = req.url;
        transfer_ctx->max_bytes = options_.max_bytes;
        transfer_ctx->callback = std::move(req.callback);

        CURL* easy_handle = CreateEasyHandle(options_, transfer_ctx);
        if (easy_handle && curl_multi_add_handle(multi_handle_, easy_handle) == CURLM_OK) {
            active_handles_.push_back(easy_handle);
            if (Logger::IsEnabled(LogLevel::Debug)) {
                Logger::Log(LogLevel::Debug, "Added easy handle for URL: " + req.url);
            }
            continue;
        }

        Logger::Log(LogLevel::Error, "Failed to start transfer for: " + req.url);
        FetchResult result;
        result.error = FetchError::Network("could not start transfer");
        if (easy_handle) curl_easy_cleanup(easy_handle);
        Callback cb = std::move(transfer_ctx->callback);
        delete transfer_ctx;
        if (cb) {
            try {
                cb(std::move(result));
            } catch (const std::exception& e) {
                Logger::Log(LogLevel::Error, "Exception in fetch callback: " + std::string(e.what()));
            }
        }
    }
}

void HTMLFetcher::DrainCompleted() {
    int msgs_in_queue = 0;
    CURLMsg* msg = nullptr;
    while ((msg = curl_multi_info_read(multi_handle_, &msgs_in_queue))) {
        if (msg->msg != CURLMSG_DONE) continue;

        CURL* easy_handle = msg->easy_handle;
        const CURLcode code = msg->data.result;
        TransferContext* transfer_ctx = nullptr;
        curl_easy_getinfo(easy_handle, CURLINFO_PRIVATE, &transfer_ctx);

        FetchResult result = BuildResult(easy_handle, code, transfer_ctx);
        if (Logger::IsEnabled(LogLevel::Debug)) {
            Logger::Log(LogLevel::Debug, result.ok()
                ? "Fetched " + std::to_string(result.content.size()) + " bytes from " + transfer_ctx->url
                : "Fetch of " + transfer_ctx->url + " failed: " + result.error->Describe());
        }
        Finish(easy_handle, std::move(result));
    }
}

void HTMLFetcher::AbortAll(const std::string& reason) {
    while (!active_handles_.empty()) {
        FetchResult result;
        result.error = FetchError::Network(reason);
        Finish(active_handles_.back(), std::move(result));
    }

    std::vector<Request> never_started;
    {
        std::unique_lock<std::mutex> lock(queue_mutex_);
        std::swap(never_started, pending_requests_);
    }
    for (auto& req : never_started) {
        FetchResult result;
        result.error = FetchError::Network(reason);
        if (!req.callback) continue;
        try {
            req.callback(std::move(result));
        } catch (const std::exception& e) {
            Logger::Log(LogLevel::Error, "Exception in fetch callback: " + std::string(e.what()));
        }
    }
}

// Detaches the handle, frees its context and runs the callback exactly once.
void HTMLFetcher::Finish(CURL* easy_handle, FetchResult result) {
    TransferContext* transfer_ctx = nullptr;
    curl_easy_getinfo(easy_handle, CURLINFO_PRIVATE, &transfer_ctx);

    active_handles_.erase(std::remove(active_handles_.begin(), active_handles_.end(), easy_handle), active_handles_.end());
    curl_multi_remove_handle(multi_handle_, easy_handle);
    curl_easy_cleanup(easy_handle);

    Callback cb;
    if (transfer_ctx) {
        cb = std::move(transfer_ctx->callback);
        delete transfer_ctx;
    }
    if (!cb) return;
    try {
        cb(std::move(result));
    } catch (const std::exception& e) {
        Logger::Log(LogLevel::Error, "Exception in fetch callback: " + std::string(e.what()));
    }
}

}
