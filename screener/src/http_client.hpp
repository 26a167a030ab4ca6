#pragma once

#include <string>
#include <vector>
#include <utility>
#include <curl/curl.h>

using QueryParams = std::vector<std::pair<std::string, std::string>>;

struct HttpResponse {
    long status = 0;
    std::string body;

    bool ok() const { return status >= 200 && status < 300; }
};

class HttpClient {
public:
    virtual ~HttpClient() = default;

    virtual HttpResponse get(const std::string& url, const QueryParams& params = {}) = 0;
    virtual HttpResponse post(const std::string& url, const std::string& body,
                              const std::string& content_type) = 0;
    virtual HttpResponse post_form(const std::string& url, const QueryParams& fields) = 0;
};

class CurlHttpClient : public HttpClient {
public:
    explicit CurlHttpClient(int timeout_ms = 30000);
    ~CurlHttpClient() override;

    // Disable copy
    CurlHttpClient(const CurlHttpClient&) = delete;
    CurlHttpClient& operator=(const CurlHttpClient&) = delete;

    HttpResponse get(const std::string& url, const QueryParams& params = {}) override;
    HttpResponse post(const std::string& url, const std::string& body,
                      const std::string& content_type) override;
    HttpResponse post_form(const std::string& url, const QueryParams& fields) override;

private:
    int timeout_ms_;
    CURL* curl_;

    std::string encode(const QueryParams& params);
    HttpResponse perform(const std::string& url, struct curl_slist* headers);

    static size_t write_callback(void* contents, size_t size, size_t nmemb, void* userp);
};
