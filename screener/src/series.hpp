#pragma once

#include <string>
#include <vector>
#include <optional>
#include <map>

// nullopt marks missing data; it propagates instead of becoming zero
using Value = std::optional<double>;
using Column = std::vector<Value>;

struct Bar {
    std::string date;  // YYYY-MM-DD
    Value open;
    Value high;
    Value low;
    Value close;
    Value volume;
};

// Daily bars, dates strictly increasing.
struct OhlcvSeries {
    std::string symbol;
    std::vector<Bar> bars;

    bool empty() const { return bars.empty(); }
    size_t size() const { return bars.size(); }
    const Bar& latest() const { return bars.back(); }

    Column closes() const;
    Column highs() const;
    Column lows() const;
    Column volumes() const;

    // Sort ascending by date and drop repeated dates (first one wins)
    void normalize();
};

// Financial-conditions index observations keyed by YYYY-MM-DD
using ConditionsSeries = std::map<std::string, double>;
