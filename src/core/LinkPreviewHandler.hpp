#pragma once
#include <string>
#include <functional>
#include "UnfurlResponse.hpp"
#include "../utils/ThreadPool.hpp"
#include "../interfaces/IHTMLFetcher.hpp"
#include "../interfaces/IMetadataExtractor.hpp"

namespace LinkPreview {
    // Request boundary: one URL in, one UnfurlResponse out. Holds no per-request
    // state, so any number of requests may be in flight at once.
    class LinkPreviewHandler {
    public:
        using Callback = std::function<void(UnfurlResponse)>;

        LinkPreviewHandler(ThreadPool& pool, IHTMLFetcher& fetcher, IMetadataExtractor& extractor);

        // cb runs exactly once, on the fetcher or thread pool thread (or inline for invalid input).
        void UnfurlAsync(const std::string& url, Callback cb);

        // Blocks until UnfurlAsync completes. Must not be called from a fetcher
        // callback or a thread pool task.
        UnfurlResponse Unfurl(const std::string& url);

        static UnfurlResponse FromFetchError(const std::string& url, const FetchError& error);
        static UnfurlResponse Unexpected();

    private:
        void OnFetchComplete(const std::string& url, FetchResult result, Callback cb);
        static void Deliver(const Callback& cb, UnfurlResponse response, const std::string& url);

        ThreadPool& thread_pool;
        IHTMLFetcher& html_fetcher_;
        IMetadataExtractor& extractor_;
    };
}
