#include "http_client.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

HttpClient::HttpClient(int timeout_ms, const std::string& user_agent)
    : timeout_ms_(timeout_ms)
    , user_agent_(user_agent)
    , curl_(curl_easy_init())
{
    if (!curl_) {
        throw std::runtime_error("Failed to initialize CURL");
    }
}

HttpClient::~HttpClient() {
    if (curl_) {
        curl_easy_cleanup(curl_);
    }
}

size_t HttpClient::write_callback(void* contents, size_t size, size_t nmemb, void* userp) {
    ((std::string*)userp)->append((char*)contents, size * nmemb);
    return size * nmemb;
}

std::string HttpClient::escape(const std::string& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    char* escaped = curl_easy_escape(curl_, value.c_str(), static_cast<int>(value.size()));
    if (!escaped) {
        return value;
    }
    std::string result(escaped);
    curl_free(escaped);
    return result;
}

HttpResult HttpClient::perform(int timeout_ms) {
    HttpResult result;

    curl_easy_setopt(curl_, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl_, CURLOPT_WRITEDATA, &result.body);
    curl_easy_setopt(curl_, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_ms > 0 ? timeout_ms : timeout_ms_));
    curl_easy_setopt(curl_, CURLOPT_USERAGENT, user_agent_.c_str());
    curl_easy_setopt(curl_, CURLOPT_NOSIGNAL, 1L);

    CURLcode res = curl_easy_perform(curl_);

    if (res != CURLE_OK) {
        result.error = curl_easy_strerror(res);
        result.timed_out = (res == CURLE_OPERATION_TIMEDOUT);
        return result;
    }

    curl_easy_getinfo(curl_, CURLINFO_RESPONSE_CODE, &result.status);
    return result;
}

HttpResult HttpClient::get(const std::string& url,
                           const std::vector<std::pair<std::string, std::string>>& params,
                           int timeout_ms) {
    std::string full_url = url;
    char sep = '?';
    for (const auto& [key, value] : params) {
        full_url += sep;
        full_url += key + "=" + escape(value);
        sep = '&';
    }

    std::lock_guard<std::mutex> lock(mutex_);
    curl_easy_reset(curl_);
    curl_easy_setopt(curl_, CURLOPT_URL, full_url.c_str());
    curl_easy_setopt(curl_, CURLOPT_HTTPGET, 1L);

    auto result = perform(timeout_ms);
    if (!result.error.empty()) {
        spdlog::error("GET {} failed: {}", url, result.error);
    }
    return result;
}

HttpResult HttpClient::post_json(const std::string& url, const std::string& payload, int timeout_ms) {
    std::lock_guard<std::mutex> lock(mutex_);
    curl_easy_reset(curl_);
    curl_easy_setopt(curl_, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl_, CURLOPT_POSTFIELDS, payload.c_str());
    curl_easy_setopt(curl_, CURLOPT_POSTFIELDSIZE, static_cast<long>(payload.size()));

    struct curl_slist* headers = NULL;
    headers = curl_slist_append(headers, "Content-Type: application/json");
    curl_easy_setopt(curl_, CURLOPT_HTTPHEADER, headers);

    auto result = perform(timeout_ms);
    curl_slist_free_all(headers);

    if (!result.error.empty()) {
        spdlog::error("POST {} failed: {}", url, result.error);
    }
    return result;
}
