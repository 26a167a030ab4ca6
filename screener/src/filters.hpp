#pragma once

#include "series.hpp"
#include "indicators.hpp"
#include <string>
#include <vector>

struct EligibilityResult {
    bool eligible;
    std::vector<std::string> reasons;  // no_data, insufficient_history, close_below_sma50, ...
};

class EligibilityFilter {
public:
    // All checks run so every violated reason is reported
    static EligibilityResult check(const OhlcvSeries& series,
                                   const IndicatorSet& indicators,
                                   double drawdown_max,
                                   double high_52w_max_multiple,
                                   double sma50_tolerance);
};
