#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "../src/conditions_index.hpp"
#include "../src/errors.hpp"
#include "test_helpers.hpp"

using Catch::Approx;

namespace {

const char* kChicagoUrl = "https://chicagofed.example/nfci.csv";
const char* kNfciUrl = "https://fred.example/graph?id=NFCI";
const char* kAnfciUrl = "https://fred.example/graph?id=ANFCI";

} // namespace

TEST_CASE("Conditions index CSV parsing", "[conditions]") {
    auto series = ConditionsIndexFetcher::parse_csv(
        "observation_date,NFCI\n"
        "2024-01-05,-0.48\n"
        "2024-01-12,.\n"
        "2024-01-19,-0.51\n"
        "\n");

    REQUIRE(series.size() == 2);
    REQUIRE(series.at("2024-01-05") == Approx(-0.48));
    REQUIRE(series.count("2024-01-12") == 0);
    REQUIRE(series.rbegin()->first == "2024-01-19");
}

TEST_CASE("Conditions index fetcher", "[conditions]") {
    auto http = std::make_shared<FakeHttpClient>();
    ConditionsIndexFetcher fetcher(http, kChicagoUrl, kNfciUrl, kAnfciUrl);

    SECTION("Full series comes from FRED") {
        http->on_get([](const RecordedRequest& req) {
            REQUIRE(req.url == kNfciUrl);
            return HttpResponse{200, "DATE,NFCI\n2024-01-05,-0.48\n2024-01-12,-0.50\n"};
        });
        auto series = fetcher.fetch_series();
        REQUIRE(series.size() == 2);
    }

    SECTION("Empty series is an error") {
        http->on_get([](const RecordedRequest&) { return HttpResponse{200, "DATE,NFCI\n"}; });
        REQUIRE_THROWS_AS(fetcher.fetch_series(), DataUnavailable);
    }

    SECTION("HTTP failure is an error") {
        http->on_get([](const RecordedRequest&) { return HttpResponse{404, ""}; });
        REQUIRE_THROWS_AS(fetcher.fetch_series(), DataUnavailable);
    }

    SECTION("Latest observation from the Chicago Fed file") {
        http->on_get([](const RecordedRequest&) {
            return HttpResponse{200, "Friday_of_Week,NFCI,ANFCI\n01/05/2024,-0.48,-0.40\n01/12/2024,-0.50,-0.42\n"};
        });
        auto latest = fetcher.fetch_latest();
        REQUIRE(latest.date == "01/12/2024");
        REQUIRE(latest.nfci == Approx(-0.50));
        REQUIRE(*latest.anfci == Approx(-0.42));
        REQUIRE(http->requests.size() == 1);
    }

    SECTION("Falls back to FRED when the Chicago Fed file fails") {
        http->on_get([](const RecordedRequest& req) {
            if (req.url == kChicagoUrl) return HttpResponse{500, ""};
            if (req.url == kNfciUrl) return HttpResponse{200, "DATE,NFCI\n2024-01-05,-0.48\n2024-01-12,-0.50\n"};
            return HttpResponse{200, "DATE,ANFCI\n2024-01-12,-0.42\n"};
        });
        auto latest = fetcher.fetch_latest();
        REQUIRE(latest.date == "2024-01-12");
        REQUIRE(latest.nfci == Approx(-0.50));
        REQUIRE(*latest.anfci == Approx(-0.42));
        REQUIRE(http->requests.size() == 3);
    }
}
