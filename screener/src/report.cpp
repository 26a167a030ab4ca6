#include "report.hpp"
#include "util.hpp"
#include <fmt/format.h>
#include <algorithm>
#include <set>

namespace {

const char* py_bool(bool value) {
    return value ? "True" : "False";
}

void append_footer(std::vector<std::string>& lines, const ScanSummary& summary,
                   const std::string& triggered) {
    if (!summary.eligible_symbols.empty()) {
        lines.push_back("eligible_symbols: " + util::join(summary.eligible_symbols, ", "));
    }
    lines.push_back("triggered_symbols: " + triggered);

    auto top = ReportFormatter::top_rejected(summary);
    if (!top.empty()) {
        lines.push_back("top_rejected_reasons: " + top);
    }
    if (!summary.skipped.empty()) {
        lines.push_back("Skipped symbols: " + util::join(summary.skipped, ", "));
    }
}

} // namespace

std::string ReportFormatter::title(const std::string& utc_date, const std::string& regime_label) {
    return fmt::format("Stock Alerts {} UTC | Regime {}", utc_date, regime_label);
}

std::vector<std::string> ReportFormatter::config_summary(const ScreenerSettings& s) {
    return {
        "Legend: eligible_symbols=symbols passing all filters, triggered_symbols=symbols with a signal",
        fmt::format("Filter: close>=SMA50*(1-{:.2f})", s.sma50_tolerance),
        "Filter: SMA50>=SMA200*0.98",
        fmt::format("Filter: dd_peak_N<=dd_max (N={}, dd_max={})", s.dd_window, s.dd_max),
        fmt::format("Filter: drawdown_20d_max={:.2f}", s.drawdown_20d_max),
        fmt::format("Trigger: PULLBACK_25={} (low<=SMA25*(1+tol), close>=SMA25, volume<=vol_ma20)",
                    py_bool(s.pullback_25_enabled)),
        fmt::format("Trigger: PULLBACK_50={} (low<=SMA50*(1+tol), close>=SMA50, volume<=vol_ma20, drawdown_20d<=max)",
                    py_bool(s.pullback_50_enabled)),
        fmt::format("Trigger: BREAKOUT_20D={} (close>high_20d, close<=high_20d*1.05, volume>=vol_ma20*{:.2f})",
                    py_bool(s.breakout_20d_enabled), s.breakout_volume_mult),
    };
}

std::string ReportFormatter::top_rejected(const ScanSummary& summary, size_t limit) {
    auto ranked = summary.rejected_reasons;
    std::stable_sort(ranked.begin(), ranked.end(),
                     [](const auto& a, const auto& b) { return a.second > b.second; });
    if (ranked.size() > limit) {
        ranked.resize(limit);
    }

    std::vector<std::string> parts;
    for (const auto& [reason, count] : ranked) {
        parts.push_back(fmt::format("{}:{}", reason, count));
    }
    return util::join(parts, ", ");
}

std::string ReportFormatter::triggered_symbols(const std::vector<Signal>& signals) {
    std::set<std::string> unique;
    for (const auto& signal : signals) {
        unique.insert(signal.symbol);
    }
    return util::join(std::vector<std::string>(unique.begin(), unique.end()), ", ");
}

std::string ReportFormatter::conditions_line(const ConditionsSnapshot& snapshot) {
    return fmt::format("NFCI latest: date={} nfci={:.4f} anfci={}", snapshot.date, snapshot.nfci,
                       snapshot.anfci ? fmt::format("{:.4f}", *snapshot.anfci) : "n/a");
}

std::vector<std::string> ReportFormatter::build_lines(const ScreenerSettings& settings,
                                                      const RegimeScoreResult& regime,
                                                      const ScanSummary& summary,
                                                      const std::optional<ConditionsSnapshot>& latest) {
    auto lines = config_summary(settings);
    lines.push_back("RegimeScore: " + nlohmann::json(regime).dump());
    if (latest) {
        lines.push_back(conditions_line(*latest));
    }

    if (!regime.allow_new_entries) {
        lines.push_back(fmt::format("New entries stopped. max_exposure={:.2f}", regime.max_exposure));
        // Only regime-independent breakouts survive an entry stop
        std::vector<Signal> breakouts;
        for (const auto& signal : summary.signals) {
            if (signal.trigger == TriggerKind::Breakout20D) {
                breakouts.push_back(signal);
            }
        }
        append_footer(lines, summary, triggered_symbols(breakouts));
        return lines;
    }

    if (summary.signals.empty()) {
        lines.push_back("No signals.");
        append_footer(lines, summary, "[]");
        return lines;
    }

    // Group by trigger, groups in order of first appearance
    std::vector<TriggerKind> order;
    for (const auto& signal : summary.signals) {
        if (std::find(order.begin(), order.end(), signal.trigger) == order.end()) {
            order.push_back(signal.trigger);
        }
    }
    for (auto kind : order) {
        lines.push_back(fmt::format("[{}]", trigger_name(kind)));
        for (const auto& signal : summary.signals) {
            if (signal.trigger != kind) continue;
            lines.push_back(fmt::format("- {} close={:.2f} date={}",
                                        signal.symbol, signal.close, signal.date));
        }
    }
    append_footer(lines, summary, triggered_symbols(summary.signals));
    return lines;
}

std::vector<SignalHit> ReportFormatter::hits(const RegimeScoreResult& regime,
                                             const ScanSummary& summary) {
    std::vector<SignalHit> result;
    if (!regime.allow_new_entries) {
        return result;
    }
    for (const auto& signal : summary.signals) {
        result.push_back(SignalHit{signal.symbol, signal.close});
    }
    return result;
}
