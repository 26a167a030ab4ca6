#include "regime_log.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <nlohmann/json.hpp>
#include <filesystem>
#include <fstream>

namespace {

std::string csv_line(const std::vector<std::string>& fields) {
    std::string line;
    for (size_t i = 0; i < fields.size(); ++i) {
        if (i > 0) line += ',';
        line += util::csv_escape(fields[i]);
    }
    return line;
}

std::string bool_str(bool value) {
    return value ? "True" : "False";
}

} // namespace

RegimeLog::RegimeLog(const std::string& path) : path_(path) {}

std::vector<std::string> RegimeLog::header() {
    return {
        "date", "state", "total_score", "nfci_L", "s_1w", "s_4w",
        "price_close", "ma50", "ma200", "price_score", "level_score",
        "trend_score", "abs_penalty", "max_exposure", "allow_new_entries",
        "risk_off_trigger", "risk_on_trigger", "notes", "regime_json", "hits_json"
    };
}

std::vector<std::string> RegimeLog::make_row(const RegimeScoreResult& regime,
                                             const std::vector<SignalHit>& hits) {
    nlohmann::json hits_json = nlohmann::json::array();
    for (const auto& hit : hits) {
        hits_json.push_back({{"symbol", hit.symbol}, {"close", fmt::format("{:.2f}", hit.close)}});
    }

    return {
        regime.date,
        regime_state_name(regime.state),
        fmt::format("{:.6f}", regime.total_score),
        fmt::format("{:.6f}", regime.nfci_L),
        fmt::format("{:.6f}", regime.s_1w),
        fmt::format("{:.6f}", regime.s_4w),
        fmt::format("{:.6f}", regime.price_close),
        fmt::format("{:.6f}", regime.ma50),
        fmt::format("{:.6f}", regime.ma200),
        std::to_string(regime.price_score),
        fmt::format("{:.6f}", regime.level_score),
        fmt::format("{:.6f}", regime.trend_score),
        fmt::format("{:.6f}", regime.abs_penalty),
        fmt::format("{:.2f}", regime.max_exposure),
        bool_str(regime.allow_new_entries),
        bool_str(regime.risk_off_trigger),
        bool_str(regime.risk_on_trigger),
        regime.notes,
        nlohmann::json(regime).dump(),
        hits_json.dump()
    };
}

void RegimeLog::append(const RegimeScoreResult& regime, const std::vector<SignalHit>& hits) {
    std::error_code ec;
    bool fresh = !std::filesystem::exists(path_, ec) || std::filesystem::file_size(path_, ec) == 0;

    std::ofstream out(path_, std::ios::app);
    if (!out) {
        spdlog::error("Failed to open regime log {}", path_);
        return;
    }

    if (fresh) {
        out << csv_line(header()) << '\n';
    }
    out << csv_line(make_row(regime, hits)) << '\n';
    spdlog::info("Appended regime snapshot for {} to {}", regime.date, path_);
}
