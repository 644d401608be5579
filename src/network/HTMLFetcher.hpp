#pragma once
#include <string>
#include <vector>
#include <mutex>
#include <thread>
#include <condition_variable>
#include <cstddef>
#include "../interfaces/IHTMLFetcher.hpp"

// Forward declare cURL handles
typedef void CURLM;
typedef void CURL;

namespace LinkPreview {

struct FetchOptions {
    long timeout_ms = 10000;
    long max_redirects = 20;
    size_t max_bytes = 5 * 1024 * 1024;
    std::string user_agent = "Mozilla/5.0 (compatible; LinkPreviewer/1.0; +https://github.com/link-previewer/link-previewer)";
    std::string accept = "text/html,application/xhtml+xml,application/xml;q=0.9,*/*;q=0.8";
    std::string accept_language = "en-US,en;q=0.5";
};

// True when a Content-Type value names HTML or XHTML.
bool IsHtmlContentType(const std::string& content_type);

// libcurl multi-handle fetcher. One worker thread drives every transfer,
// callbacks run on that thread. A single attempt per Fetch(), no retries.
class HTMLFetcher : public IHTMLFetcher {
public:
    explicit HTMLFetcher(FetchOptions options = FetchOptions());
    ~HTMLFetcher() override;

    // Non-copyable
    HTMLFetcher(const HTMLFetcher&) = delete;
    HTMLFetcher& operator=(const HTMLFetcher&) = delete;

    void Fetch(const std::string& url, Callback cb) override;

private:
    struct Request {
        std::string url;
        Callback callback;
    };

    void Run();
    void StartTransfers(std::vector<Request>& requests);
    void DrainCompleted();
    void AbortAll(const std::string& reason);
    void Finish(CURL* easy_handle, FetchResult result);

    FetchOptions options_;
    CURLM* multi_handle_ = nullptr;
    std::thread worker_thread_;
    std::mutex queue_mutex_;
    std::condition_variable cv_;
    bool stop_ = false;
    std::vector<Request> pending_requests_;
    std::vector<CURL*> active_handles_; // worker thread only
};

}
