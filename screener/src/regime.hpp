#pragma once

#include "series.hpp"
#include "triggers.hpp"
#include <string>
#include <nlohmann/json.hpp>

enum class RegimeState {
    RiskOnStrong,   // score >= 80
    RiskOn,         // score >= 60
    Neutral,        // score >= 40
    RiskOff,        // score >= 20
    RiskOffStrong   // score < 20
};

// Fixed exposure ladder, highest rung first: 1.00, 0.70, 0.40, 0.15, 0.05
enum class ExposureCap {
    Full,
    High,
    Medium,
    Low,
    Minimal
};

std::string regime_state_name(RegimeState state);
double exposure_value(ExposureCap cap);
ExposureCap step_down(ExposureCap cap);
ExposureCap step_up(ExposureCap cap);

struct StateAssignment {
    RegimeState state;
    ExposureCap exposure;
    bool allow_new_entries;
};

struct RegimeScoreResult {
    std::string date;          // requested evaluation date
    std::string trading_date;  // benchmark bar actually scored
    double nfci_L;
    double s_1w;
    double s_4w;
    double s_1w_prev;
    double price_close;
    double ma50;
    double ma200;
    int price_score;
    double level_score;
    double trend_score;
    double abs_penalty;
    double total_score;
    bool risk_off_trigger;
    bool risk_on_trigger;
    RegimeState state;
    ExposureCap exposure;
    double max_exposure;
    bool allow_new_entries;
    std::string notes;
};

void to_json(nlohmann::json& j, const RegimeScoreResult& r);

class RegimeClassifier {
public:
    // Scores the latest benchmark trading day on or before as_of_date (YYYY-MM-DD).
    // Throws NoTradingDay, AlignmentFailure or InsufficientHistory.
    static RegimeScoreResult classify(const ConditionsSeries& conditions,
                                      const OhlcvSeries& benchmark,
                                      const std::string& as_of_date);

    static int price_score(double price, double ma50, double ma200);
    static StateAssignment state_from_score(double score);
    static double clip01(double value);

    // Conditions index reindexed onto the benchmark calendar, forward-filled
    static Column align_to_calendar(const ConditionsSeries& conditions,
                                    const OhlcvSeries& benchmark);
};

// Entries are allowed in RISK_ON states; breakouts are regime independent
bool regime_allows(RegimeState state, TriggerKind trigger);
