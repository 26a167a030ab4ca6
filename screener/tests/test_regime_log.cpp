#include <catch2/catch_test_macros.hpp>
#include "../src/regime_log.hpp"
#include "test_helpers.hpp"
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

namespace {

RegimeScoreResult sample_regime() {
    RegimeScoreResult r{};
    r.date = "2024-06-03";
    r.trading_date = "2024-05-31";
    r.nfci_L = -0.5;
    r.s_1w = 0.01;
    r.s_4w = -0.02;
    r.price_close = 450.25;
    r.ma50 = 440.0;
    r.ma200 = 410.0;
    r.price_score = 30;
    r.level_score = 29.1666666;
    r.total_score = 65.0;
    r.state = RegimeState::RiskOn;
    r.exposure = ExposureCap::High;
    r.max_exposure = 0.7;
    r.allow_new_entries = true;
    r.notes = "";
    return r;
}

} // namespace

TEST_CASE("Regime log rows", "[regime_log]") {
    auto header = RegimeLog::header();
    auto row = RegimeLog::make_row(sample_regime(), {{"AAPL", 190.126}});

    REQUIRE(header.size() == row.size());
    REQUIRE(header.front() == "date");
    REQUIRE(row[0] == "2024-06-03");
    REQUIRE(row[1] == "RISK_ON");
    REQUIRE(row[2] == "65.000000");
    REQUIRE(row[9] == "30");
    REQUIRE(row[13] == "0.70");
    REQUIRE(row[14] == "True");
    REQUIRE(row[15] == "False");

    auto hits = nlohmann::json::parse(row.back());
    REQUIRE(hits.size() == 1);
    REQUIRE(hits[0]["symbol"] == "AAPL");
    REQUIRE(hits[0]["close"] == "190.13");
}

TEST_CASE("Regime log file", "[regime_log]") {
    auto path = fs::temp_directory_path() / "stockscout_regime_log_test.csv";
    fs::remove(path);

    RegimeLog log(path.string());
    log.append(sample_regime(), {});
    log.append(sample_regime(), {{"MSFT", 410.0}});

    std::ifstream in(path);
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(in, line)) {
        lines.push_back(line);
    }

    REQUIRE(lines.size() == 3);
    REQUIRE(lines[0].rfind("date,state,total_score", 0) == 0);
    REQUIRE(lines[1].rfind("2024-06-03,RISK_ON,", 0) == 0);
    fs::remove(path);
}
