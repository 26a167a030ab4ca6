#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "../src/market_data_fetcher.hpp"
#include "../src/errors.hpp"
#include "test_helpers.hpp"

using Catch::Approx;

namespace {

struct FetcherRig {
    std::shared_ptr<FakeClock> clock = std::make_shared<FakeClock>();
    std::shared_ptr<FakeHttpClient> http = std::make_shared<FakeHttpClient>(clock.get());
    std::shared_ptr<MemoryCache> cache = std::make_shared<MemoryCache>();
    FetcherSettings settings;

    FetcherRig() {
        settings.retry_max_attempts = 3;
        settings.retry_base_delay_seconds = 1.0;
        settings.retry_max_delay_seconds = 30.0;
        settings.rate_limit_enabled = false;
        settings.rate_limit_min_interval_seconds = 8.0;
    }

    MarketDataFetcher make(std::vector<Provider> providers, bool with_cache = true) {
        return MarketDataFetcher(settings, std::move(providers), http,
                                 with_cache ? cache : nullptr, clock);
    }
};

Provider twelvedata(const std::string& key = "td-key") {
    return TwelveDataProvider("https://td.example/time_series", "1day", 300, key);
}

Provider alphavantage(const std::string& key = "av-key") {
    return AlphaVantageProvider("https://av.example/query", "TIME_SERIES_DAILY", "full", key);
}

HttpResponse ok_series(const std::string& symbol, size_t bars = 30) {
    return HttpResponse{200, twelvedata_payload(flat_series(bars, 10.0, 10.5, 9.5, 1000.0, symbol)).dump()};
}

nlohmann::json av_series() {
    return {{"Time Series (Daily)", {
        {"2024-01-02", {{"1. open", "1"}, {"2. high", "2"}, {"3. low", "0.5"},
                        {"4. close", "1.5"}, {"5. volume", "100"}}}
    }}};
}

} // namespace

TEST_CASE("Fetcher happy path and cache", "[fetcher]") {
    FetcherRig rig;
    rig.http->on_get([](const RecordedRequest& req) { return ok_series(param(req.params, "symbol")); });

    SECTION("Returns the primary provider's series") {
        auto fetcher = rig.make({twelvedata(), alphavantage()});
        auto series = fetcher.fetch_daily("AAPL");
        REQUIRE(series.size() == 30);
        REQUIRE(rig.http->requests.size() == 1);
        REQUIRE(rig.http->requests[0].url == "https://td.example/time_series");
    }

    SECTION("Second fetch is served from cache") {
        auto fetcher = rig.make({twelvedata()});
        fetcher.fetch_daily("AAPL");
        auto again = fetcher.fetch_daily("AAPL");
        REQUIRE(again.size() == 30);
        REQUIRE(rig.http->requests.size() == 1);
        REQUIRE(rig.cache->entries.count("twelvedata:AAPL") == 1);
    }

    SECTION("Cache disabled by settings always hits the network") {
        rig.settings.cache_enabled = false;
        auto fetcher = rig.make({twelvedata()});
        fetcher.fetch_daily("AAPL");
        fetcher.fetch_daily("AAPL");
        REQUIRE(rig.http->requests.size() == 2);
        REQUIRE(rig.cache->entries.empty());
    }

    SECTION("Cached payload without bars is refetched and replaced") {
        rig.cache->entries["twelvedata:AAPL"] = {{"values", nlohmann::json::array()}, {"status", "ok"}};
        auto fetcher = rig.make({twelvedata()});
        auto series = fetcher.fetch_daily("AAPL");
        REQUIRE(series.size() == 30);
        REQUIRE(rig.http->requests.size() == 1);
        REQUIRE(rig.cache->entries["twelvedata:AAPL"]["values"].size() == 30);

        fetcher.fetch_daily("AAPL");
        REQUIRE(rig.http->requests.size() == 1);
    }

    SECTION("No cache store configured") {
        auto fetcher = rig.make({twelvedata()}, false);
        fetcher.fetch_daily("AAPL");
        fetcher.fetch_daily("AAPL");
        REQUIRE(rig.http->requests.size() == 2);
    }
}

TEST_CASE("Fetcher retries and fallback", "[fetcher]") {
    FetcherRig rig;

    SECTION("Transient failure is retried with backoff") {
        int calls = 0;
        rig.http->on_get([&](const RecordedRequest& req) {
            if (++calls == 1) throw HttpError("connection reset");
            return ok_series(param(req.params, "symbol"));
        });
        auto fetcher = rig.make({twelvedata()});

        auto series = fetcher.fetch_daily("AAPL");
        REQUIRE_FALSE(series.empty());
        REQUIRE(calls == 2);
        REQUIRE(rig.clock->sleeps.size() == 1);
        REQUIRE(rig.clock->sleeps[0] >= 1.0);
        REQUIRE(rig.clock->sleeps[0] <= 1.5);
    }

    SECTION("Primary exhausts its attempts then the fallback serves") {
        rig.http->on_get([](const RecordedRequest& req) {
            if (req.url.find("td.example") != std::string::npos) {
                return HttpResponse{500, "oops"};
            }
            return HttpResponse{200, av_series().dump()};
        });
        auto fetcher = rig.make({twelvedata(), alphavantage()});

        auto series = fetcher.fetch_daily("MSFT");
        REQUIRE(series.size() == 1);
        REQUIRE(rig.http->requests.size() == 4);
        // no sleep after the final attempt
        REQUIRE(rig.clock->sleeps.size() == 2);
        REQUIRE(rig.cache->entries.count("twelvedata:MSFT") == 0);
        REQUIRE(rig.cache->entries.count("alphavantage:MSFT") == 1);
    }

    SECTION("In-band rate-limit notes count as failures") {
        rig.http->on_get([](const RecordedRequest& req) {
            if (req.url.find("av.example") != std::string::npos) {
                return HttpResponse{200, R"({"Note": "API call frequency exceeded"})"};
            }
            return ok_series(param(req.params, "symbol"));
        });
        auto fetcher = rig.make({alphavantage(), twelvedata()});

        auto series = fetcher.fetch_daily("NVDA");
        REQUIRE(series.size() == 30);
        REQUIRE(rig.cache->entries.count("alphavantage:NVDA") == 0);
    }

    SECTION("Missing API key fails over without a request") {
        rig.http->on_get([](const RecordedRequest&) { return HttpResponse{200, av_series().dump()}; });
        auto fetcher = rig.make({twelvedata(""), alphavantage()});

        auto series = fetcher.fetch_daily("AMZN");
        REQUIRE(series.size() == 1);
        REQUIRE(rig.http->requests.size() == 1);
        REQUIRE(rig.clock->sleeps.empty());
    }

    SECTION("All providers failing reports the last error") {
        rig.settings.retry_max_attempts = 1;
        rig.http->on_get([](const RecordedRequest& req) {
            if (req.url.find("td.example") != std::string::npos) {
                return HttpResponse{503, ""};
            }
            return HttpResponse{200, R"({"Error Message": "Invalid API call"})"};
        });
        auto fetcher = rig.make({twelvedata(), alphavantage()});

        try {
            fetcher.fetch_daily("ZZZZ");
            FAIL("expected DataUnavailable");
        } catch (const DataUnavailable& e) {
            std::string what = e.what();
            REQUIRE(what.find("ZZZZ") != std::string::npos);
            REQUIRE(what.find("Invalid API call") != std::string::npos);
        }
    }

    SECTION("Empty series counts as a provider failure") {
        rig.settings.retry_max_attempts = 1;
        rig.http->on_get([](const RecordedRequest&) {
            return HttpResponse{200, R"({"values": [], "status": "ok"})"};
        });
        auto fetcher = rig.make({twelvedata()});
        REQUIRE_THROWS_AS(fetcher.fetch_daily("AAPL"), DataUnavailable);
    }
}

TEST_CASE("Fetcher throttle", "[fetcher]") {
    FetcherRig rig;
    rig.settings.rate_limit_enabled = true;
    rig.settings.rate_limit_min_interval_seconds = 8.0;
    rig.http->on_get([](const RecordedRequest& req) { return ok_series(param(req.params, "symbol")); });
    auto fetcher = rig.make({twelvedata()});

    SECTION("Consecutive requests are spaced by the minimum interval") {
        fetcher.fetch_daily("AAPL");
        rig.clock->advance(3.0);
        fetcher.fetch_daily("MSFT");
        fetcher.fetch_daily("NVDA");

        REQUIRE(rig.http->requests.size() == 3);
        REQUIRE(rig.http->requests[1].at - rig.http->requests[0].at >= 8.0);
        REQUIRE(rig.http->requests[2].at - rig.http->requests[1].at >= 8.0);
        REQUIRE(rig.clock->sleeps[0] == Approx(5.0));
    }

    SECTION("Cache hits are not throttled") {
        fetcher.fetch_daily("AAPL");
        fetcher.fetch_daily("AAPL");
        REQUIRE(rig.clock->sleeps.empty());
    }
}

TEST_CASE("Backoff delay", "[fetcher]") {
    FetcherRig rig;
    auto fetcher = rig.make({twelvedata()});

    SECTION("Exponential growth capped at the maximum") {
        REQUIRE(fetcher.backoff_delay(0, 0.0) == Approx(1.0));
        REQUIRE(fetcher.backoff_delay(1, 0.25) == Approx(2.25));
        REQUIRE(fetcher.backoff_delay(3, 0.0) == Approx(8.0));
        REQUIRE(fetcher.backoff_delay(10, 0.4) == Approx(30.0));
    }

    SECTION("Never shorter than the throttle interval") {
        rig.settings.rate_limit_enabled = true;
        auto throttled = rig.make({twelvedata()});
        REQUIRE(throttled.backoff_delay(0, 0.0) == Approx(8.0));
        REQUIRE(throttled.backoff_delay(4, 0.0) == Approx(16.0));
    }
}
