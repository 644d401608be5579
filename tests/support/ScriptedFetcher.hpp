#pragma once
#include <chrono>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include "interfaces/IHTMLFetcher.hpp"

namespace LinkPreview {
namespace Testing {

// Answers from a table; unknown URLs fail with Network. Answers inline unless
// a delay is set, in which case each callback runs on its own thread after it.
class ScriptedFetcher : public IHTMLFetcher {
public:
    ~ScriptedFetcher() override {
        for (auto& t : threads_) {
            if (t.joinable()) t.join();
        }
    }

    void Fetch(const std::string& url, Callback cb) override {
        FetchResult result;
        std::chrono::milliseconds delay{0};
        {
            std::lock_guard<std::mutex> lock(mutex_);
            requested_.push_back(url);
            auto it = results_.find(url);
            if (it != results_.end()) {
                result = it->second;
            } else {
                result.error = FetchError::Network("Could not resolve host");
            }
            delay = delay_;
        }
        if (delay.count() == 0) {
            cb(std::move(result));
            return;
        }
        std::lock_guard<std::mutex> lock(mutex_);
        threads_.emplace_back([delay, cb, result]() mutable {
            std::this_thread::sleep_for(delay);
            cb(std::move(result));
        });
    }

    void Html(const std::string& url, const std::string& html, const std::string& content_type = "text/html") {
        FetchResult r;
        r.status_code = 200;
        r.content = html;
        r.content_type = content_type;
        r.effective_url = url;
        std::lock_guard<std::mutex> lock(mutex_);
        results_[url] = r;
    }

    void Fail(const std::string& url, FetchError error) {
        FetchResult r;
        r.error = std::move(error);
        std::lock_guard<std::mutex> lock(mutex_);
        results_[url] = r;
    }

    void SetDelay(std::chrono::milliseconds delay) {
        std::lock_guard<std::mutex> lock(mutex_);
        delay_ = delay;
    }

    std::vector<std::string> requested() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return requested_;
    }

private:
    mutable std::mutex mutex_;
    std::map<std::string, FetchResult> results_;
    std::vector<std::string> requested_;
    std::vector<std::thread> threads_;
    std::chrono::milliseconds delay_{0};
};

}
}
