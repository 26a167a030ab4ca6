#include "screener.hpp"
#include "config.hpp"
#include "indicators.hpp"
#include "filters.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>

ScreenerSettings ScreenerSettings::from_config(const Config& config) {
    ScreenerSettings s;
    s.drawdown_20d_max = config.drawdown_20d_max;
    s.high_52w_max_multiple = config.high_52w_max_multiple;
    s.sma50_tolerance = config.sma50_tolerance;
    s.pullback_tolerance = config.pullback_tolerance;
    s.pullback_25_enabled = config.pullback_25_enabled;
    s.pullback_50_enabled = config.pullback_50_enabled;
    s.breakout_20d_enabled = config.breakout_20d_enabled;
    s.breakout_volume_mult = config.breakout_volume_mult;
    s.dd_window = static_cast<size_t>(config.dd_window_days);
    s.dd_max = config.dd_max;
    return s;
}

void ScanSummary::count_reason(const std::string& reason) {
    auto it = std::find_if(rejected_reasons.begin(), rejected_reasons.end(),
                           [&](const auto& entry) { return entry.first == reason; });
    if (it == rejected_reasons.end()) {
        rejected_reasons.emplace_back(reason, 1);
    } else {
        it->second++;
    }
}

Screener::Screener(const ScreenerSettings& settings, std::shared_ptr<MarketDataFetcher> fetcher)
    : settings_(settings)
    , fetcher_(std::move(fetcher))
{}

SymbolEvaluation Screener::evaluate_symbol(const std::string& symbol,
                                           const OhlcvSeries& series) const {
    SymbolEvaluation evaluation;

    auto indicators = IndicatorEngine::compute(series);
    auto eligibility = EligibilityFilter::check(series, indicators,
                                                settings_.drawdown_20d_max,
                                                settings_.high_52w_max_multiple,
                                                settings_.sma50_tolerance);
    if (!eligibility.eligible) {
        evaluation.reasons = eligibility.reasons;
        return evaluation;
    }

    std::vector<TriggerResult> results;
    if (settings_.pullback_25_enabled) {
        results.push_back(TriggerEngine::pullback_25_bounce(series, indicators,
                                                            settings_.pullback_tolerance));
    }
    if (settings_.pullback_50_enabled) {
        results.push_back(TriggerEngine::pullback_50_bounce(series, indicators,
                                                            settings_.pullback_tolerance,
                                                            settings_.drawdown_20d_max));
    }
    if (settings_.breakout_20d_enabled) {
        results.push_back(TriggerEngine::breakout_20d(series, indicators,
                                                      settings_.breakout_volume_mult,
                                                      settings_.dd_window,
                                                      settings_.dd_max,
                                                      symbol));
    }

    const Bar& latest = series.latest();
    for (const auto& result : results) {
        if (!result.fired) continue;
        evaluation.signals.push_back(Signal{symbol, result.kind, *latest.close, latest.date});
    }
    return evaluation;
}

ScanSummary Screener::scan(const std::vector<std::string>& symbols,
                           const RegimeScoreResult& regime) {
    ScanSummary summary;

    for (const auto& symbol : symbols) {
        try {
            auto series = fetcher_->fetch_daily(symbol);
            auto evaluation = evaluate_symbol(symbol, series);

            if (!evaluation.reasons.empty()) {
                for (const auto& reason : evaluation.reasons) {
                    summary.count_reason(reason);
                }
                spdlog::debug("{} ineligible: {}", symbol, evaluation.reasons.front());
            } else {
                summary.eligible_symbols.push_back(symbol);
            }

            for (const auto& signal : evaluation.signals) {
                if (regime_allows(regime.state, signal.trigger)) {
                    summary.signals.push_back(signal);
                } else {
                    spdlog::info("{} {} suppressed by regime {}", symbol,
                                 trigger_name(signal.trigger), regime_state_name(regime.state));
                }
            }
        } catch (const std::exception& e) {
            spdlog::warn("SKIP {}: {}", symbol, e.what());
            summary.skipped.push_back(symbol);
        }
    }

    spdlog::info("Scan complete: {} symbols, {} eligible, {} signals, {} skipped",
                 symbols.size(), summary.eligible_symbols.size(),
                 summary.signals.size(), summary.skipped.size());
    return summary;
}
