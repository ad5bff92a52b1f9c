#pragma once

#include <curl/curl.h>
#include <mutex>
#include <string>

struct HttpResponse {
    long status = 0;
    std::string body;

    bool ok() const { return status >= 200 && status < 300; }
};

// Blocking GET over a single curl easy handle. Calls are serialized, every
// request is bounded by the configured timeout.
class HttpClient {
public:
    explicit HttpClient(int timeout_ms = 8000,
                        const std::string& user_agent = "Mozilla/5.0 (compatible; FollowFolio/1.0)");
    ~HttpClient();

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    // Throws MarketDataError(ProviderUnavailable) on transport failure or timeout
    HttpResponse get(const std::string& url);

    static std::string url_encode(const std::string& value);

private:
    int timeout_ms_;
    std::string user_agent_;
    CURL* curl_;
    std::mutex mutex_;

    static size_t write_callback(void* contents, size_t size, size_t nmemb, void* userp);
};
