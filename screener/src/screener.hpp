#pragma once

#include "market_data_fetcher.hpp"
#include "regime.hpp"
#include "triggers.hpp"
#include <memory>
#include <string>
#include <utility>
#include <vector>

struct Config;

struct ScreenerSettings {
    double drawdown_20d_max = 0.15;
    double high_52w_max_multiple = 1.0;
    double sma50_tolerance = 0.0;
    double pullback_tolerance = 0.005;

    bool pullback_25_enabled = true;
    bool pullback_50_enabled = true;
    bool breakout_20d_enabled = true;
    double breakout_volume_mult = 1.5;

    size_t dd_window = 90;
    double dd_max = 0.25;

    static ScreenerSettings from_config(const Config& config);
};

struct Signal {
    std::string symbol;
    TriggerKind trigger;
    double close;
    std::string date;
};

struct SymbolEvaluation {
    std::vector<Signal> signals;
    std::vector<std::string> reasons;  // non-empty iff ineligible
};

struct ScanSummary {
    std::vector<Signal> signals;  // fired and allowed by the regime
    std::vector<std::string> eligible_symbols;
    std::vector<std::pair<std::string, int>> rejected_reasons;  // first-seen order
    std::vector<std::string> skipped;

    void count_reason(const std::string& reason);
};

// Per-symbol pipeline: fetch -> indicators -> eligibility -> triggers,
// run strictly sequentially because the fetcher's throttle is global.
class Screener {
public:
    Screener(const ScreenerSettings& settings, std::shared_ptr<MarketDataFetcher> fetcher);

    SymbolEvaluation evaluate_symbol(const std::string& symbol, const OhlcvSeries& series) const;

    // A symbol that fails to fetch or evaluate is skipped, never fatal
    ScanSummary scan(const std::vector<std::string>& symbols, const RegimeScoreResult& regime);

private:
    ScreenerSettings settings_;
    std::shared_ptr<MarketDataFetcher> fetcher_;
};
