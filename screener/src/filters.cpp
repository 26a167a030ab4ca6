#include "filters.hpp"

EligibilityResult EligibilityFilter::check(const OhlcvSeries& series,
                                           const IndicatorSet& indicators,
                                           double drawdown_max,
                                           double high_52w_max_multiple,
                                           double sma50_tolerance) {
    if (series.empty()) {
        return {false, {"no_data"}};
    }

    size_t idx = series.size() - 1;
    const Value& close = series.latest().close;
    const Value& sma50 = indicators.sma50[idx];
    const Value& sma200 = indicators.sma200[idx];
    const Value& high_52w = indicators.high_52w[idx];
    const Value& drawdown_20d = indicators.drawdown_20d[idx];

    if (!close || !sma50 || !sma200 || !high_52w) {
        return {false, {"insufficient_history"}};
    }

    std::vector<std::string> reasons;

    if (*close < *sma50 * (1.0 - sma50_tolerance)) {
        reasons.push_back("close_below_sma50");
    }
    if (*sma50 < *sma200 * 0.98) {
        reasons.push_back("sma50_below_sma200");
    }
    if (*close > *high_52w * high_52w_max_multiple) {
        reasons.push_back("too_extended_52w");
    }
    // Unknown drawdown cannot exceed the limit
    if (drawdown_20d && *drawdown_20d > drawdown_max) {
        reasons.push_back("drawdown_too_large");
    }

    return {reasons.empty(), reasons};
}
