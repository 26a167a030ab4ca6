#pragma once

#include "regime.hpp"
#include <string>
#include <vector>

struct SignalHit {
    std::string symbol;
    double close;
};

// Append-only CSV of regime snapshots, one row per run.
class RegimeLog {
public:
    explicit RegimeLog(const std::string& path);

    void append(const RegimeScoreResult& regime, const std::vector<SignalHit>& hits);

    static std::vector<std::string> header();
    static std::vector<std::string> make_row(const RegimeScoreResult& regime,
                                             const std::vector<SignalHit>& hits);

private:
    std::string path_;
};
