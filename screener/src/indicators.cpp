#include "indicators.hpp"
#include <algorithm>

Column IndicatorEngine::rolling_mean(const Column& values, size_t window) {
    Column out(values.size());
    if (window == 0) return out;

    for (size_t i = window - 1; i < values.size(); ++i) {
        double sum = 0.0;
        bool complete = true;
        for (size_t j = i + 1 - window; j <= i; ++j) {
            if (!values[j]) {
                complete = false;
                break;
            }
            sum += *values[j];
        }
        if (complete) {
            out[i] = sum / static_cast<double>(window);
        }
    }
    return out;
}

Column IndicatorEngine::rolling_max(const Column& values, size_t window) {
    Column out(values.size());
    if (window == 0) return out;

    for (size_t i = window - 1; i < values.size(); ++i) {
        Value best;
        for (size_t j = i + 1 - window; j <= i; ++j) {
            if (!values[j]) {
                best.reset();
                break;
            }
            best = best ? std::max(*best, *values[j]) : *values[j];
        }
        out[i] = best;
    }
    return out;
}

Column IndicatorEngine::shift(const Column& values, size_t periods) {
    Column out(values.size());
    for (size_t i = periods; i < values.size(); ++i) {
        out[i] = values[i - periods];
    }
    return out;
}

Column IndicatorEngine::drawdown_from_peak(const Column& closes, size_t window) {
    Column peak = shift(rolling_max(closes, window), 1);
    Column out(closes.size());

    for (size_t i = 0; i < closes.size(); ++i) {
        if (!closes[i] || !peak[i] || *peak[i] == 0.0) continue;
        out[i] = 1.0 - (*closes[i] / *peak[i]);
    }
    return out;
}

IndicatorSet IndicatorEngine::compute(const OhlcvSeries& series) {
    Column close = series.closes();
    Column high = series.highs();
    Column volume = series.volumes();

    IndicatorSet ind;
    ind.sma25 = rolling_mean(close, 25);
    ind.sma50 = rolling_mean(close, 50);
    ind.sma200 = rolling_mean(close, 200);
    ind.vol_ma20 = rolling_mean(volume, 20);
    ind.high_20d = shift(rolling_max(high, 20), 1);
    ind.high_52w = rolling_max(high, 252);

    Column high_20d_inclusive = rolling_max(high, 20);
    ind.drawdown_20d.resize(close.size());
    for (size_t i = 0; i < close.size(); ++i) {
        const auto& h = high_20d_inclusive[i];
        if (!h || !close[i] || *h == 0.0) continue;
        ind.drawdown_20d[i] = (*h - *close[i]) / *h;
    }

    return ind;
}
