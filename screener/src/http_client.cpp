#include "http_client.hpp"
#include "errors.hpp"
#include <spdlog/spdlog.h>

CurlHttpClient::CurlHttpClient(int timeout_ms)
    : timeout_ms_(timeout_ms)
    , curl_(curl_easy_init())
{
    if (!curl_) {
        throw std::runtime_error("Failed to initialize CURL");
    }
}

CurlHttpClient::~CurlHttpClient() {
    if (curl_) {
        curl_easy_cleanup(curl_);
    }
}

size_t CurlHttpClient::write_callback(void* contents, size_t size, size_t nmemb, void* userp) {
    static_cast<std::string*>(userp)->append(static_cast<char*>(contents), size * nmemb);
    return size * nmemb;
}

std::string CurlHttpClient::encode(const QueryParams& params) {
    std::string out;
    bool first = true;
    for (const auto& [key, value] : params) {
        if (!first) out += "&";
        first = false;

        char* escaped = curl_easy_escape(curl_, value.c_str(), static_cast<int>(value.length()));
        out += key + "=" + (escaped ? std::string(escaped) : std::string());
        curl_free(escaped);
    }
    return out;
}

HttpResponse CurlHttpClient::perform(const std::string& url, struct curl_slist* headers) {
    HttpResponse response;

    curl_easy_setopt(curl_, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl_, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl_, CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl_, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_ms_));
    curl_easy_setopt(curl_, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl_, CURLOPT_HTTPHEADER, headers);

    CURLcode res = curl_easy_perform(curl_);
    if (res != CURLE_OK) {
        throw HttpError(std::string("HTTP request failed: ") + curl_easy_strerror(res));
    }

    curl_easy_getinfo(curl_, CURLINFO_RESPONSE_CODE, &response.status);
    return response;
}

HttpResponse CurlHttpClient::get(const std::string& url, const QueryParams& params) {
    std::string full_url = url;
    if (!params.empty()) {
        full_url += (url.find('?') == std::string::npos ? "?" : "&") + encode(params);
    }

    spdlog::debug("GET {}", url);

    curl_easy_reset(curl_);
    curl_easy_setopt(curl_, CURLOPT_HTTPGET, 1L);
    return perform(full_url, nullptr);
}

HttpResponse CurlHttpClient::post(const std::string& url, const std::string& body,
                                  const std::string& content_type) {
    struct curl_slist* headers = nullptr;
    headers = curl_slist_append(headers, ("Content-Type: " + content_type).c_str());

    curl_easy_reset(curl_);
    curl_easy_setopt(curl_, CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(curl_, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));

    try {
        HttpResponse response = perform(url, headers);
        curl_slist_free_all(headers);
        return response;
    } catch (const HttpError&) {
        curl_slist_free_all(headers);
        throw;
    }
}

HttpResponse CurlHttpClient::post_form(const std::string& url, const QueryParams& fields) {
    return post(url, encode(fields), "application/x-www-form-urlencoded");
}
