#pragma once

#include "conditions_index.hpp"
#include "regime.hpp"
#include "regime_log.hpp"
#include "screener.hpp"
#include <optional>
#include <string>
#include <vector>

class ReportFormatter {
public:
    static std::string title(const std::string& utc_date, const std::string& regime_label);

    static std::vector<std::string> config_summary(const ScreenerSettings& settings);

    // Full run report: config summary, regime score line, the latest published
    // conditions reading when available, then the result body
    static std::vector<std::string> build_lines(const ScreenerSettings& settings,
                                                const RegimeScoreResult& regime,
                                                const ScanSummary& summary,
                                                const std::optional<ConditionsSnapshot>& latest = std::nullopt);

    static std::string conditions_line(const ConditionsSnapshot& snapshot);

    // "reason:count" for the five most common reasons, ties in first-seen order
    static std::string top_rejected(const ScanSummary& summary, size_t limit = 5);

    static std::string triggered_symbols(const std::vector<Signal>& signals);

    // Signals reported to the regime log; empty when entries are stopped
    static std::vector<SignalHit> hits(const RegimeScoreResult& regime,
                                       const ScanSummary& summary);
};
