#include "market_data_fetcher.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>

MarketDataFetcher::MarketDataFetcher(const FetcherSettings& settings,
                                     std::vector<Provider> providers,
                                     std::shared_ptr<HttpClient> http,
                                     std::shared_ptr<CacheStore> cache,
                                     std::shared_ptr<Clock> clock)
    : settings_(settings)
    , providers_(std::move(providers))
    , http_(std::move(http))
    , cache_(std::move(cache))
    , clock_(std::move(clock))
{}

OhlcvSeries MarketDataFetcher::fetch_daily(const std::string& symbol) {
    std::string last_error = "no data provider configured";

    for (const auto& provider : providers_) {
        try {
            auto series = fetch_from(provider, symbol);
            spdlog::debug("Fetched {} bars for {} from {}",
                          series.size(), symbol, provider_name(provider));
            return series;
        } catch (const std::exception& e) {
            last_error = e.what();
            spdlog::warn("Provider {} failed for {}: {}", provider_name(provider), symbol, e.what());
        }
    }

    throw DataUnavailable(symbol + ": " + last_error);
}

OhlcvSeries MarketDataFetcher::fetch_from(const Provider& provider, const std::string& symbol) {
    std::string name = provider_name(provider);

    bool has_key = std::visit([](const auto& p) { return p.has_api_key(); }, provider);
    if (!has_key) {
        throw ProviderError("API key for " + name + " not set");
    }

    std::string cache_key = name + ":" + symbol;
    bool use_cache = cache_ && settings_.cache_enabled;
    if (use_cache) {
        auto cached = cache_->get(cache_key);
        if (cached.has_value()) {
            // An unusable cached payload is replaced by a fresh download
            try {
                auto series = parse_payload(provider, symbol, *cached);
                if (!series.empty()) {
                    return series;
                }
                spdlog::warn("Cached {} payload for {} has no bars, refetching", name, symbol);
            } catch (const std::exception& e) {
                spdlog::warn("Cached {} payload for {} unusable, refetching: {}", name, symbol, e.what());
            }
        }
    }

    auto payload = download(provider, symbol);
    if (use_cache) {
        cache_->set(cache_key, payload);
    }

    auto series = parse_payload(provider, symbol, payload);
    if (series.empty()) {
        throw ProviderError(name + " returned an empty series for " + symbol);
    }
    return series;
}

OhlcvSeries MarketDataFetcher::parse_payload(const Provider& provider, const std::string& symbol,
                                             const nlohmann::json& payload) const {
    return std::visit([&](const auto& p) { return p.parse(symbol, payload); }, provider);
}

nlohmann::json MarketDataFetcher::download(const Provider& provider, const std::string& symbol) {
    std::string name = provider_name(provider);

    int attempts = std::max(1, settings_.retry_max_attempts);
    std::string last_error;

    for (int attempt = 0; attempt < attempts; ++attempt) {
        try {
            return request_once(provider, symbol);
        } catch (const std::exception& e) {
            last_error = e.what();
            if (attempt + 1 >= attempts) {
                break;
            }
            double delay = backoff_delay(attempt, util::random_jitter(0.0, 0.5));
            spdlog::warn("{} attempt {}/{} for {} failed: {} (retrying in {:.2f}s)",
                         name, attempt + 1, attempts, symbol, e.what(), delay);
            clock_->sleep_for(delay);
        }
    }

    throw ProviderError(name + " failed for " + symbol + " after " +
                        std::to_string(attempts) + " attempts: " + last_error);
}

nlohmann::json MarketDataFetcher::request_once(const Provider& provider,
                                               const std::string& symbol) {
    auto request = std::visit([&](const auto& p) { return p.build_request(symbol); }, provider);

    throttle();
    auto response = http_->get(request.url, request.params);

    if (!response.ok()) {
        throw ProviderError(provider_name(provider) + " HTTP " + std::to_string(response.status));
    }

    auto payload = nlohmann::json::parse(response.body);
    std::visit([&](const auto& p) { p.check_payload(payload); }, provider);
    return payload;
}

void MarketDataFetcher::throttle() {
    if (settings_.rate_limit_enabled) {
        double elapsed = clock_->now() - last_call_ts_;
        double min_interval = settings_.rate_limit_min_interval_seconds;
        if (elapsed < min_interval) {
            spdlog::debug("Throttling for {:.2f}s", min_interval - elapsed);
            clock_->sleep_for(min_interval - elapsed);
        }
    }
    last_call_ts_ = clock_->now();
}

double MarketDataFetcher::backoff_delay(int attempt, double jitter) const {
    double delay = std::min(settings_.retry_max_delay_seconds,
                            settings_.retry_base_delay_seconds * std::pow(2.0, attempt) + jitter);
    if (settings_.rate_limit_enabled) {
        delay = std::max(delay, settings_.rate_limit_min_interval_seconds);
    }
    return delay;
}
