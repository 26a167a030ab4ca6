#include "regime.hpp"
#include "indicators.hpp"
#include "errors.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>

namespace {

constexpr size_t kOneWeek = 5;
constexpr size_t kFourWeeks = 20;
constexpr double kTriggerWeekly = 0.05;
constexpr double kTriggerMonthly = 0.10;

Column diff(const Column& values, size_t periods) {
    Column lagged = IndicatorEngine::shift(values, periods);
    Column out(values.size());
    for (size_t i = 0; i < values.size(); ++i) {
        if (values[i] && lagged[i]) {
            out[i] = *values[i] - *lagged[i];
        }
    }
    return out;
}

} // namespace

std::string regime_state_name(RegimeState state) {
    switch (state) {
        case RegimeState::RiskOnStrong: return "RISK_ON_STRONG";
        case RegimeState::RiskOn: return "RISK_ON";
        case RegimeState::Neutral: return "NEUTRAL";
        case RegimeState::RiskOff: return "RISK_OFF";
        case RegimeState::RiskOffStrong: return "RISK_OFF_STRONG";
        default: return "UNKNOWN";
    }
}

double exposure_value(ExposureCap cap) {
    switch (cap) {
        case ExposureCap::Full: return 1.00;
        case ExposureCap::High: return 0.70;
        case ExposureCap::Medium: return 0.40;
        case ExposureCap::Low: return 0.15;
        case ExposureCap::Minimal: return 0.05;
        default: return 0.0;
    }
}

ExposureCap step_down(ExposureCap cap) {
    if (cap == ExposureCap::Minimal) return cap;
    return static_cast<ExposureCap>(static_cast<int>(cap) + 1);
}

ExposureCap step_up(ExposureCap cap) {
    if (cap == ExposureCap::Full) return cap;
    return static_cast<ExposureCap>(static_cast<int>(cap) - 1);
}

void to_json(nlohmann::json& j, const RegimeScoreResult& r) {
    j = nlohmann::json{
        {"date", r.date},
        {"trading_date", r.trading_date},
        {"nfci_L", r.nfci_L},
        {"s_1w", r.s_1w},
        {"s_4w", r.s_4w},
        {"s_1w_prev", r.s_1w_prev},
        {"price_close", r.price_close},
        {"ma50", r.ma50},
        {"ma200", r.ma200},
        {"price_score", r.price_score},
        {"level_score", r.level_score},
        {"trend_score", r.trend_score},
        {"abs_penalty", r.abs_penalty},
        {"total_score", r.total_score},
        {"risk_off_trigger", r.risk_off_trigger},
        {"risk_on_trigger", r.risk_on_trigger},
        {"state", regime_state_name(r.state)},
        {"max_exposure", r.max_exposure},
        {"allow_new_entries", r.allow_new_entries},
        {"notes", r.notes}
    };
}

double RegimeClassifier::clip01(double value) {
    return std::max(0.0, std::min(1.0, value));
}

int RegimeClassifier::price_score(double price, double ma50, double ma200) {
    if (price > ma50 && ma50 > ma200) return 30;
    if (price > ma50 && ma50 <= ma200) return 15;
    if (price <= ma50 && price > ma200) return 5;
    return 0;
}

StateAssignment RegimeClassifier::state_from_score(double score) {
    if (score >= 80) return {RegimeState::RiskOnStrong, ExposureCap::Full, true};
    if (score >= 60) return {RegimeState::RiskOn, ExposureCap::High, true};
    if (score >= 40) return {RegimeState::Neutral, ExposureCap::Medium, false};
    if (score >= 20) return {RegimeState::RiskOff, ExposureCap::Low, false};
    return {RegimeState::RiskOffStrong, ExposureCap::Minimal, false};
}

Column RegimeClassifier::align_to_calendar(const ConditionsSeries& conditions,
                                           const OhlcvSeries& benchmark) {
    Column aligned(benchmark.size());
    Value carry;
    for (size_t i = 0; i < benchmark.size(); ++i) {
        auto it = conditions.find(benchmark.bars[i].date);
        if (it != conditions.end() && std::isfinite(it->second)) {
            carry = it->second;
        }
        aligned[i] = carry;
    }
    return aligned;
}

RegimeScoreResult RegimeClassifier::classify(const ConditionsSeries& conditions,
                                             const OhlcvSeries& benchmark,
                                             const std::string& as_of_date) {
    OhlcvSeries bench = benchmark;
    bench.normalize();

    auto after = std::upper_bound(bench.bars.begin(), bench.bars.end(), as_of_date,
                                  [](const std::string& date, const Bar& bar) {
                                      return date < bar.date;
                                  });
    if (after == bench.bars.begin()) {
        throw NoTradingDay("No " + (bench.symbol.empty() ? std::string("benchmark") : bench.symbol) +
                           " trading day on or before " + as_of_date);
    }
    size_t idx = static_cast<size_t>(std::distance(bench.bars.begin(), after)) - 1;

    Column close = bench.closes();
    Column ma50 = IndicatorEngine::rolling_mean(close, 50);
    Column ma200 = IndicatorEngine::rolling_mean(close, 200);

    Column level = align_to_calendar(conditions, bench);
    bool any_aligned = std::any_of(level.begin(), level.begin() + idx + 1,
                                   [](const Value& v) { return v.has_value(); });
    if (!any_aligned) {
        throw AlignmentFailure("Conditions index has no observation on the benchmark calendar "
                               "up to " + bench.bars[idx].date);
    }

    Column s_1w = diff(level, kOneWeek);
    Column s_4w = diff(level, kFourWeeks);
    Column s_1w_prev = IndicatorEngine::shift(s_1w, kOneWeek);

    for (const Column* required : {&level, &s_1w, &s_4w, &s_1w_prev, &ma50, &ma200}) {
        if (!(*required)[idx]) {
            throw InsufficientHistory("Insufficient history for regime score calculation at " +
                                      bench.bars[idx].date);
        }
    }

    RegimeScoreResult r;
    r.date = as_of_date;
    r.trading_date = bench.bars[idx].date;
    r.nfci_L = *level[idx];
    r.s_1w = *s_1w[idx];
    r.s_4w = *s_4w[idx];
    r.s_1w_prev = *s_1w_prev[idx];
    r.price_close = *close[idx];
    r.ma50 = *ma50[idx];
    r.ma200 = *ma200[idx];

    r.risk_off_trigger = (r.s_1w > kTriggerWeekly && r.s_1w_prev > kTriggerWeekly) ||
                         (r.s_4w > kTriggerMonthly);
    r.risk_on_trigger = (r.s_1w < -kTriggerWeekly && r.s_1w_prev < -kTriggerWeekly) ||
                        (r.s_4w < -kTriggerMonthly);

    r.price_score = price_score(r.price_close, r.ma50, r.ma200);
    r.level_score = 35.0 * clip01((-r.nfci_L + 0.5) / 1.2);
    double trend_raw = 0.6 * r.s_1w + 0.4 * (r.s_4w / 4.0);
    r.trend_score = 35.0 * clip01((-trend_raw + 0.03) / 0.10);
    r.abs_penalty = 15.0 * clip01((std::abs(r.nfci_L) - 0.3) / 0.7);

    double total = r.level_score + r.trend_score + r.price_score - r.abs_penalty;
    r.total_score = std::max(0.0, std::min(100.0, total));

    auto assignment = state_from_score(r.total_score);
    r.state = assignment.state;
    r.exposure = assignment.exposure;
    r.allow_new_entries = assignment.allow_new_entries;

    if (r.risk_off_trigger) {
        r.allow_new_entries = false;
        r.exposure = step_down(r.exposure);
        r.notes = "risk_off_trigger: max_exposure lowered";
    } else if (r.risk_on_trigger) {
        r.notes = "risk_on_trigger: no exposure boost";
    }
    r.max_exposure = exposure_value(r.exposure);

    spdlog::info("Regime {} on {}: score={:.2f} (level={:.2f} trend={:.2f} price={} penalty={:.2f}) "
                 "max_exposure={:.2f} allow_new_entries={}",
                 regime_state_name(r.state), r.trading_date, r.total_score, r.level_score,
                 r.trend_score, r.price_score, r.abs_penalty, r.max_exposure, r.allow_new_entries);

    return r;
}

bool regime_allows(RegimeState state, TriggerKind trigger) {
    if (state == RegimeState::RiskOnStrong || state == RegimeState::RiskOn) {
        return true;
    }
    return trigger == TriggerKind::Breakout20D;
}
