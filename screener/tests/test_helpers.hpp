#pragma once

#include "../src/series.hpp"
#include "../src/clock.hpp"
#include "../src/http_client.hpp"
#include "../src/file_cache.hpp"
#include <fmt/format.h>
#include <nlohmann/json.hpp>
#include <functional>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

// Strictly increasing YYYY-MM-DD labels, one per index
inline std::string day_label(size_t i) {
    return fmt::format("{:04}-{:02}-{:02}", 2000 + i / 336, 1 + (i % 336) / 28, 1 + i % 28);
}

inline Bar make_bar(size_t i, double open, double high, double low, double close, double volume) {
    return Bar{day_label(i), open, high, low, close, volume};
}

inline OhlcvSeries flat_series(size_t n, double close, double high, double low, double volume,
                               const std::string& symbol = "TEST") {
    OhlcvSeries series;
    series.symbol = symbol;
    for (size_t i = 0; i < n; ++i) {
        series.bars.push_back(make_bar(i, close, high, low, close, volume));
    }
    return series;
}

class FakeClock : public Clock {
public:
    explicit FakeClock(double start = 1000.0) : now_(start) {}

    double now() const override { return now_; }
    void sleep_for(double seconds) override {
        sleeps.push_back(seconds);
        now_ += seconds;
    }
    void advance(double seconds) { now_ += seconds; }

    std::vector<double> sleeps;

private:
    double now_;
};

struct RecordedRequest {
    std::string method;
    std::string url;
    QueryParams params;
    std::string body;
    double at;
};

// Serves canned responses; a handler may throw to simulate transport errors.
class FakeHttpClient : public HttpClient {
public:
    using Handler = std::function<HttpResponse(const RecordedRequest&)>;

    explicit FakeHttpClient(const Clock* clock = nullptr) : clock_(clock) {}

    void on_get(Handler handler) { get_handler_ = std::move(handler); }
    void on_post(Handler handler) { post_handler_ = std::move(handler); }

    HttpResponse get(const std::string& url, const QueryParams& params = {}) override {
        RecordedRequest req{"GET", url, params, "", clock_ ? clock_->now() : 0.0};
        requests.push_back(req);
        if (!get_handler_) throw std::runtime_error("unexpected GET " + url);
        return get_handler_(req);
    }

    HttpResponse post(const std::string& url, const std::string& body,
                      const std::string&) override {
        RecordedRequest req{"POST", url, {}, body, clock_ ? clock_->now() : 0.0};
        requests.push_back(req);
        if (!post_handler_) return HttpResponse{200, "ok"};
        return post_handler_(req);
    }

    HttpResponse post_form(const std::string& url, const QueryParams& fields) override {
        RecordedRequest req{"FORM", url, fields, "", clock_ ? clock_->now() : 0.0};
        requests.push_back(req);
        if (!post_handler_) return HttpResponse{200, "ok"};
        return post_handler_(req);
    }

    std::vector<RecordedRequest> requests;

private:
    const Clock* clock_;
    Handler get_handler_;
    Handler post_handler_;
};

class MemoryCache : public CacheStore {
public:
    std::optional<nlohmann::json> get(const std::string& key) override {
        auto it = entries.find(key);
        if (it == entries.end()) return std::nullopt;
        return it->second;
    }
    void set(const std::string& key, const nlohmann::json& value) override {
        entries[key] = value;
    }

    std::map<std::string, nlohmann::json> entries;
};

inline std::string param(const QueryParams& params, const std::string& key) {
    for (const auto& [k, v] : params) {
        if (k == key) return v;
    }
    return "";
}

// Twelve Data payload, newest first like the real API
inline nlohmann::json twelvedata_payload(const OhlcvSeries& series) {
    nlohmann::json values = nlohmann::json::array();
    for (auto it = series.bars.rbegin(); it != series.bars.rend(); ++it) {
        values.push_back({
            {"datetime", it->date},
            {"open", fmt::format("{}", it->open.value_or(0.0))},
            {"high", fmt::format("{}", it->high.value_or(0.0))},
            {"low", fmt::format("{}", it->low.value_or(0.0))},
            {"close", fmt::format("{}", it->close.value_or(0.0))},
            {"volume", fmt::format("{}", it->volume.value_or(0.0))}
        });
    }
    return {{"meta", {{"symbol", series.symbol}}}, {"values", values}, {"status", "ok"}};
}
