#pragma once

#include <string>
#include <vector>
#include <utility>
#include <mutex>
#include <curl/curl.h>

struct HttpResult {
    long status = 0;
    std::string body;
    std::string error;
    bool timed_out = false;
};

class HttpClient {
public:
    explicit HttpClient(int timeout_ms = 10000, const std::string& user_agent = "IndicatorGateway/1.0");
    ~HttpClient();

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    HttpResult get(const std::string& url,
                   const std::vector<std::pair<std::string, std::string>>& params,
                   int timeout_ms = 0);
    HttpResult post_json(const std::string& url, const std::string& payload, int timeout_ms = 0);

    std::string escape(const std::string& value);

private:
    int timeout_ms_;
    std::string user_agent_;
    CURL* curl_;
    std::mutex mutex_;

    HttpResult perform(int timeout_ms);

    static size_t write_callback(void* contents, size_t size, size_t nmemb, void* userp);
};
