#pragma once

#include "series.hpp"
#include "indicators.hpp"
#include <string>
#include <optional>

enum class TriggerKind {
    Pullback25,
    Pullback50,
    Breakout20D
};

std::string trigger_name(TriggerKind kind);

// Windowed drawdown-from-peak observed by the breakout trigger (rule FILTER_DD_002)
struct DrawdownDiagnostic {
    std::string symbol;
    size_t window;
    Value value;
    double max;
};

struct TriggerResult {
    TriggerKind kind;
    bool fired;
    std::string reason;  // trigger name when evaluated, else no_data / insufficient_history / drawdown_too_large
    std::optional<DrawdownDiagnostic> diagnostic;
};

class TriggerEngine {
public:
    // low <= sma25*(1+tol), close >= sma25, volume <= vol_ma20
    static TriggerResult pullback_25_bounce(const OhlcvSeries& series,
                                            const IndicatorSet& indicators,
                                            double tol);

    // Same against sma50, plus drawdown_20d <= drawdown_20d_max
    static TriggerResult pullback_50_bounce(const OhlcvSeries& series,
                                            const IndicatorSet& indicators,
                                            double tol,
                                            double drawdown_20d_max);

    // close > high_20d, close <= high_20d*1.05, volume >= vol_ma20*volume_mult.
    // A drawdown from the prior `dd_window`-bar close peak above dd_max rejects first.
    static TriggerResult breakout_20d(const OhlcvSeries& series,
                                      const IndicatorSet& indicators,
                                      double volume_mult,
                                      size_t dd_window,
                                      double dd_max,
                                      const std::string& symbol);
};
