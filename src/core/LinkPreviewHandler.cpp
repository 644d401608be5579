#include "LinkPreviewHandler.hpp"
#include "utils/Logger.hpp"
#include "utils/UrlUtil.hpp"
#include <future>
#include <memory>

namespace LinkPreview {

LinkPreviewHandler::LinkPreviewHandler(ThreadPool& pool, IHTMLFetcher& fetcher, IMetadataExtractor& extractor)
    : thread_pool(pool), html_fetcher_(fetcher), extractor_(extractor) {}

UnfurlResponse LinkPreviewHandler::Unexpected() {
    return UnfurlResponse::Failure(ErrorCode::kUnexpected, "An unexpected error occurred while processing the URL");
}

UnfurlResponse LinkPreviewHandler::FromFetchError(const std::string& url, const FetchError& error) {
    switch (error.kind) {
        case FetchErrorKind::Timeout:
            return UnfurlResponse::Failure(ErrorCode::kTimeout, "Request timed out while fetching " + url);
        case FetchErrorKind::HttpStatus:
            return UnfurlResponse::Failure(ErrorCode::kHttpStatus,
                "HTTP error " + std::to_string(error.status_code) + " while fetching " + url);
        case FetchErrorKind::Network:
            return UnfurlResponse::Failure(ErrorCode::kNetwork, "Failed to connect to " + url + ": " + error.cause);
        case FetchErrorKind::TooLarge:
            return UnfurlResponse::Failure(ErrorCode::kTooLarge,
                "Content too large: " + std::to_string(error.size) + " bytes while fetching " + url);
        case FetchErrorKind::NotHtml:
            return UnfurlResponse::Failure(ErrorCode::kNotHtml,
                "Not HTML content: " + (error.content_type.empty() ? std::string("unknown") : error.content_type) +
                " while fetching " + url);
    }
    return Unexpected();
}

void LinkPreviewHandler::Deliver(const Callback& cb, UnfurlResponse response, const std::string& url) {
    if (!cb) return;
    try {
        cb(std::move(response));
    } catch (const std::exception& e) {
        Logger::Log(LogLevel::Error, "Exception in unfurl callback for " + url + ": " + e.what());
    }
}

void LinkPreviewHandler::UnfurlAsync(const std::string& url, Callback cb) {
    if (!UrlUtil::IsHttpUrl(url)) {
        Logger::Log(LogLevel::Warn, "Rejected invalid URL: " + url);
        Deliver(cb, UnfurlResponse::Failure(ErrorCode::kInvalidUrl, "Invalid URL: " + url), url);
        return;
    }

    Logger::Log(LogLevel::Info, "Unfurling URL: " + url);
    try {
        html_fetcher_.Fetch(url, [this, url, cb](FetchResult result) {
            OnFetchComplete(url, std::move(result), cb);
        });
    } catch (const std::exception& e) {
        Logger::Log(LogLevel::Error, "Unexpected error starting fetch for " + url + ": " + e.what());
        Deliver(cb, Unexpected(), url);
    }
}

void LinkPreviewHandler::OnFetchComplete(const std::string& url, FetchResult result, Callback cb) {
    if (!result.ok()) {
        Logger::Log(LogLevel::Warn, "Failed to fetch " + url + ": " + result.error->Describe());
        Deliver(cb, FromFetchError(url, *result.error), url);
        return;
    }

    if (!result.effective_url.empty() && result.effective_url != url) {
        Logger::Log(LogLevel::Debug, "Redirected " + url + " -> " + result.effective_url);
    }

    // Parsing is CPU-bound; keep it off the fetcher thread.
    bool queued = thread_pool.enqueue([this, url, cb, html = std::move(result.content),
                                       content_type = std::move(result.content_type)]() {
        UnfurlResponse response;
        try {
            response = UnfurlResponse::Success(extractor_.Extract(html, url, content_type));
            Logger::Log(LogLevel::Info, "Unfurled URL: " + url);
        } catch (const std::exception& e) {
            Logger::Log(LogLevel::Error, "Unexpected error processing " + url + ": " + e.what());
            response = Unexpected();
        }
        Deliver(cb, std::move(response), url);
    });

    if (!queued) {
        Logger::Log(LogLevel::Error, "Thread pool rejected parse task for " + url);
        Deliver(cb, Unexpected(), url);
    }
}

UnfurlResponse LinkPreviewHandler::Unfurl(const std::string& url) {
    auto promise = std::make_shared<std::promise<UnfurlResponse>>();
    auto fut = promise->get_future();
    UnfurlAsync(url, [promise](UnfurlResponse response) {
        promise->set_value(std::move(response));
    });
    return fut.get();
}

} // namespace LinkPreview
