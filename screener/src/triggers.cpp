#include "triggers.hpp"
#include <spdlog/spdlog.h>
#include <fmt/format.h>

namespace {

constexpr double kBreakoutMaxExtension = 1.05;

TriggerResult make_result(TriggerKind kind, bool fired, const std::string& reason) {
    return TriggerResult{kind, fired, reason, std::nullopt};
}

} // namespace

std::string trigger_name(TriggerKind kind) {
    switch (kind) {
        case TriggerKind::Pullback25: return "PULLBACK_25_BOUNCE";
        case TriggerKind::Pullback50: return "PULLBACK_50_BOUNCE";
        case TriggerKind::Breakout20D: return "BREAKOUT_20D";
        default: return "UNKNOWN";
    }
}

TriggerResult TriggerEngine::pullback_25_bounce(const OhlcvSeries& series,
                                                const IndicatorSet& indicators,
                                                double tol) {
    const auto kind = TriggerKind::Pullback25;
    if (series.empty()) {
        return make_result(kind, false, "no_data");
    }

    size_t idx = series.size() - 1;
    const Bar& latest = series.latest();
    const Value& sma25 = indicators.sma25[idx];
    const Value& vol_ma20 = indicators.vol_ma20[idx];

    if (!sma25 || !vol_ma20 || !latest.low || !latest.close || !latest.volume) {
        return make_result(kind, false, "insufficient_history");
    }

    bool cond = *latest.low <= *sma25 * (1.0 + tol)
             && *latest.close >= *sma25
             && *latest.volume <= *vol_ma20;

    return make_result(kind, cond, trigger_name(kind));
}

TriggerResult TriggerEngine::pullback_50_bounce(const OhlcvSeries& series,
                                                const IndicatorSet& indicators,
                                                double tol,
                                                double drawdown_20d_max) {
    const auto kind = TriggerKind::Pullback50;
    if (series.empty()) {
        return make_result(kind, false, "no_data");
    }

    size_t idx = series.size() - 1;
    const Bar& latest = series.latest();
    const Value& sma50 = indicators.sma50[idx];
    const Value& vol_ma20 = indicators.vol_ma20[idx];
    const Value& drawdown_20d = indicators.drawdown_20d[idx];

    if (!sma50 || !vol_ma20 || !drawdown_20d ||
        !latest.low || !latest.close || !latest.volume) {
        return make_result(kind, false, "insufficient_history");
    }

    bool cond = *latest.low <= *sma50 * (1.0 + tol)
             && *latest.close >= *sma50
             && *latest.volume <= *vol_ma20
             && *drawdown_20d <= drawdown_20d_max;

    return make_result(kind, cond, trigger_name(kind));
}

TriggerResult TriggerEngine::breakout_20d(const OhlcvSeries& series,
                                          const IndicatorSet& indicators,
                                          double volume_mult,
                                          size_t dd_window,
                                          double dd_max,
                                          const std::string& symbol) {
    const auto kind = TriggerKind::Breakout20D;
    if (series.empty()) {
        return make_result(kind, false, "no_data");
    }

    size_t idx = series.size() - 1;
    const Bar& latest = series.latest();
    const Value& high_20d = indicators.high_20d[idx];
    const Value& vol_ma20 = indicators.vol_ma20[idx];
    Value dd_value = IndicatorEngine::drawdown_from_peak(series.closes(), dd_window)[idx];

    DrawdownDiagnostic diagnostic{symbol, dd_window, dd_value, dd_max};
    spdlog::info("DD_METRIC symbol={} dd_metric=peak_N dd_window={} dd_value={}",
                 symbol, dd_window, dd_value ? fmt::format("{:.6f}", *dd_value) : "nan");

    TriggerResult result = make_result(kind, false, trigger_name(kind));
    result.diagnostic = diagnostic;

    if (!high_20d || !vol_ma20 || !latest.close || !latest.volume) {
        result.reason = "insufficient_history";
        return result;
    }

    if (dd_value && *dd_value > dd_max) {
        spdlog::info("EXCLUDE symbol={} exclude_reason_rule_id=FILTER_DD_002 dd_metric=peak_N "
                     "dd_window={} dd_value={:.6f} dd_max={:.6f}",
                     symbol, dd_window, *dd_value, dd_max);
        result.reason = "drawdown_too_large";
        return result;
    }

    result.fired = *latest.close > *high_20d
                && *latest.close <= *high_20d * kBreakoutMaxExtension
                && *latest.volume >= *vol_ma20 * volume_mult;
    return result;
}
