#pragma once

#include "series.hpp"

// Rolling series aligned bar-for-bar with the input OHLCV series.
struct IndicatorSet {
    Column sma25;
    Column sma50;
    Column sma200;
    Column vol_ma20;
    Column high_20d;      // max high of the 20 bars ending the prior bar
    Column high_52w;      // max high of the trailing 252 bars, current included
    Column drawdown_20d;  // (20-bar inclusive high - close) / that high
};

class IndicatorEngine {
public:
    static IndicatorSet compute(const OhlcvSeries& series);

    // Rolling windows need `window` consecutive known values; otherwise unknown
    static Column rolling_mean(const Column& values, size_t window);
    static Column rolling_max(const Column& values, size_t window);

    // Positional shift; the first `periods` entries become unknown
    static Column shift(const Column& values, size_t periods);

    // 1 - close / peak, where peak is the rolling max of the prior `window`
    // closes (the current bar never contributes to its own peak).
    // Unknown where the close or peak is unknown or the peak is zero.
    static Column drawdown_from_peak(const Column& closes, size_t window);
};
