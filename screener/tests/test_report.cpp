#include <catch2/catch_test_macros.hpp>
#include "../src/report.hpp"
#include "test_helpers.hpp"
#include <algorithm>

namespace {

RegimeScoreResult regime_with(RegimeState state, bool allow, double max_exposure) {
    RegimeScoreResult r{};
    r.date = "2024-06-03";
    r.trading_date = "2024-06-03";
    r.state = state;
    r.allow_new_entries = allow;
    r.max_exposure = max_exposure;
    return r;
}

bool has_line(const std::vector<std::string>& lines, const std::string& line) {
    return std::find(lines.begin(), lines.end(), line) != lines.end();
}

size_t index_of(const std::vector<std::string>& lines, const std::string& line) {
    return static_cast<size_t>(std::find(lines.begin(), lines.end(), line) - lines.begin());
}

} // namespace

TEST_CASE("Report title and header", "[report]") {
    REQUIRE(ReportFormatter::title("2024-06-03", "RISK_ON") == "Stock Alerts 2024-06-03 UTC | Regime RISK_ON");
    REQUIRE(ReportFormatter::title("2024-06-03", "ERROR") == "Stock Alerts 2024-06-03 UTC | Regime ERROR");

    ScreenerSettings settings;
    auto summary_lines = ReportFormatter::config_summary(settings);
    REQUIRE(has_line(summary_lines, "Filter: close>=SMA50*(1-0.00)"));
    REQUIRE(has_line(summary_lines, "Filter: dd_peak_N<=dd_max (N=90, dd_max=0.25)"));
    REQUIRE(has_line(summary_lines, "Filter: drawdown_20d_max=0.15"));

    auto lines = ReportFormatter::build_lines(settings, regime_with(RegimeState::RiskOn, true, 0.7), ScanSummary{});
    auto score = std::find_if(lines.begin(), lines.end(),
                              [](const std::string& l) { return l.rfind("RegimeScore: ", 0) == 0; });
    REQUIRE(score != lines.end());
    auto json = nlohmann::json::parse(score->substr(13));
    REQUIRE(json["state"] == "RISK_ON");
}

TEST_CASE("Report bodies", "[report]") {
    ScreenerSettings settings;
    ScanSummary summary;
    summary.eligible_symbols = {"AAPL", "MSFT", "NVDA"};
    summary.count_reason("insufficient_history");

    SECTION("Entries stopped") {
        summary.signals.push_back(Signal{"NVDA", TriggerKind::Breakout20D, 120.5, "2024-06-03"});
        auto regime = regime_with(RegimeState::RiskOff, false, 0.15);
        auto lines = ReportFormatter::build_lines(settings, regime, summary);

        REQUIRE(has_line(lines, "New entries stopped. max_exposure=0.15"));
        REQUIRE(has_line(lines, "eligible_symbols: AAPL, MSFT, NVDA"));
        REQUIRE(has_line(lines, "triggered_symbols: NVDA"));
        REQUIRE(has_line(lines, "top_rejected_reasons: insufficient_history:1"));
        REQUIRE_FALSE(has_line(lines, "No signals."));
        REQUIRE(ReportFormatter::hits(regime, summary).empty());
    }

    SECTION("Entries stopped in a risk-on state lists breakouts only") {
        summary.signals = {
            Signal{"AAPL", TriggerKind::Pullback25, 190.1, "2024-06-03"},
            Signal{"NVDA", TriggerKind::Breakout20D, 120.5, "2024-06-03"}
        };
        auto regime = regime_with(RegimeState::RiskOn, false, 0.40);
        auto lines = ReportFormatter::build_lines(settings, regime, summary);

        REQUIRE(has_line(lines, "New entries stopped. max_exposure=0.40"));
        REQUIRE(has_line(lines, "triggered_symbols: NVDA"));
        REQUIRE_FALSE(has_line(lines, "[PULLBACK_25_BOUNCE]"));
        REQUIRE(ReportFormatter::hits(regime, summary).empty());

        summary.signals = {Signal{"AAPL", TriggerKind::Pullback25, 190.1, "2024-06-03"}};
        lines = ReportFormatter::build_lines(settings, regime, summary);
        REQUIRE(has_line(lines, "triggered_symbols: "));
    }

    SECTION("No signals") {
        summary.skipped = {"ZZZZ"};
        auto lines = ReportFormatter::build_lines(settings, regime_with(RegimeState::RiskOn, true, 0.7), summary);

        REQUIRE(has_line(lines, "No signals."));
        REQUIRE(has_line(lines, "triggered_symbols: []"));
        REQUIRE(has_line(lines, "Skipped symbols: ZZZZ"));
    }

    SECTION("Signals grouped by trigger in order of first appearance") {
        summary.signals = {
            Signal{"MSFT", TriggerKind::Pullback25, 410.0, "2024-06-03"},
            Signal{"NVDA", TriggerKind::Breakout20D, 120.456, "2024-06-03"},
            Signal{"AAPL", TriggerKind::Pullback25, 190.1, "2024-06-03"},
            Signal{"MSFT", TriggerKind::Pullback50, 410.0, "2024-06-03"}
        };
        auto regime = regime_with(RegimeState::RiskOnStrong, true, 1.0);
        auto lines = ReportFormatter::build_lines(settings, regime, summary);

        size_t p25 = index_of(lines, "[PULLBACK_25_BOUNCE]");
        size_t brk = index_of(lines, "[BREAKOUT_20D]");
        size_t p50 = index_of(lines, "[PULLBACK_50_BOUNCE]");
        REQUIRE(p25 < brk);
        REQUIRE(brk < p50);
        REQUIRE(lines[p25 + 1] == "- MSFT close=410.00 date=2024-06-03");
        REQUIRE(lines[p25 + 2] == "- AAPL close=190.10 date=2024-06-03");
        REQUIRE(lines[brk + 1] == "- NVDA close=120.46 date=2024-06-03");
        REQUIRE(has_line(lines, "triggered_symbols: AAPL, MSFT, NVDA"));

        auto hits = ReportFormatter::hits(regime, summary);
        REQUIRE(hits.size() == 4);
        REQUIRE(hits[1].symbol == "NVDA");
    }
}

TEST_CASE("Latest financial conditions line", "[report]") {
    ConditionsSnapshot snapshot{"2024-05-31", -0.5, -0.42};
    REQUIRE(ReportFormatter::conditions_line(snapshot) ==
            "NFCI latest: date=2024-05-31 nfci=-0.5000 anfci=-0.4200");

    snapshot.anfci = std::nullopt;
    REQUIRE(ReportFormatter::conditions_line(snapshot) ==
            "NFCI latest: date=2024-05-31 nfci=-0.5000 anfci=n/a");

    ScreenerSettings settings;
    auto regime = regime_with(RegimeState::RiskOn, true, 0.7);
    auto lines = ReportFormatter::build_lines(settings, regime, ScanSummary{}, snapshot);
    auto score = std::find_if(lines.begin(), lines.end(),
                              [](const std::string& l) { return l.rfind("RegimeScore: ", 0) == 0; });
    REQUIRE(score != lines.end());
    REQUIRE(*(score + 1) == "NFCI latest: date=2024-05-31 nfci=-0.5000 anfci=n/a");

    auto without = ReportFormatter::build_lines(settings, regime, ScanSummary{});
    REQUIRE(std::none_of(without.begin(), without.end(),
                         [](const std::string& l) { return l.rfind("NFCI latest:", 0) == 0; }));
}

TEST_CASE("Top rejected reasons", "[report]") {
    ScanSummary summary;
    for (const char* reason : {"a", "b", "b", "c", "b", "c", "c", "d", "e", "e", "f"}) {
        summary.count_reason(reason);
    }
    REQUIRE(ReportFormatter::top_rejected(summary) == "b:3, c:3, e:2, a:1, d:1");
    REQUIRE(ReportFormatter::top_rejected(ScanSummary{}).empty());
}
