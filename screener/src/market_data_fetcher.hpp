#pragma once

#include "providers.hpp"
#include "file_cache.hpp"
#include "clock.hpp"
#include "http_client.hpp"
#include "series.hpp"
#include <memory>
#include <string>
#include <vector>

struct FetcherSettings {
    bool cache_enabled = true;
    int retry_max_attempts = 3;
    double retry_base_delay_seconds = 1.0;
    double retry_max_delay_seconds = 30.0;
    bool rate_limit_enabled = true;
    double rate_limit_min_interval_seconds = 8.0;
};

// Daily OHLCV acquisition with provider fallback, retry/backoff, a global
// inter-call throttle and a response cache. Single-threaded: the cache and
// the last-call timestamp are not synchronized.
class MarketDataFetcher {
public:
    MarketDataFetcher(const FetcherSettings& settings,
                      std::vector<Provider> providers,
                      std::shared_ptr<HttpClient> http,
                      std::shared_ptr<CacheStore> cache,
                      std::shared_ptr<Clock> clock);

    // Throws DataUnavailable carrying the last provider's error
    OhlcvSeries fetch_daily(const std::string& symbol);

    // min(max_delay, base * 2^attempt + jitter), floored at the throttle interval
    double backoff_delay(int attempt, double jitter) const;

private:
    FetcherSettings settings_;
    std::vector<Provider> providers_;
    std::shared_ptr<HttpClient> http_;
    std::shared_ptr<CacheStore> cache_;
    std::shared_ptr<Clock> clock_;
    double last_call_ts_ = 0.0;

    OhlcvSeries fetch_from(const Provider& provider, const std::string& symbol);
    OhlcvSeries parse_payload(const Provider& provider, const std::string& symbol,
                              const nlohmann::json& payload) const;
    // Network fetch with retry/backoff; does not touch the cache
    nlohmann::json download(const Provider& provider, const std::string& symbol);
    nlohmann::json request_once(const Provider& provider, const std::string& symbol);
    void throttle();
};
