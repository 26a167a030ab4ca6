#include "conditions_index.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <sstream>

ConditionsIndexFetcher::ConditionsIndexFetcher(std::shared_ptr<HttpClient> http,
                                               const std::string& csv_url,
                                               const std::string& fred_nfci_url,
                                               const std::string& fred_anfci_url)
    : http_(std::move(http))
    , csv_url_(csv_url)
    , fred_nfci_url_(fred_nfci_url)
    , fred_anfci_url_(fred_anfci_url)
{}

std::string ConditionsIndexFetcher::download(const std::string& url) {
    auto response = http_->get(url);
    if (!response.ok()) {
        throw DataUnavailable("HTTP " + std::to_string(response.status) + " from " + url);
    }
    return response.body;
}

ConditionsSeries ConditionsIndexFetcher::parse_csv(const std::string& body) {
    ConditionsSeries series;
    std::istringstream in(body);
    std::string line;

    while (std::getline(in, line)) {
        auto fields = util::split(line, ',');
        if (fields.size() < 2) continue;

        auto date = util::normalize_date(fields[0]);
        auto value = util::parse_double(fields[1]);
        if (!date || !value) continue;  // header, blanks, FRED's "." placeholder

        series[*date] = *value;
    }
    return series;
}

ConditionsSeries ConditionsIndexFetcher::fetch_series() {
    auto series = parse_csv(download(fred_nfci_url_));
    if (series.empty()) {
        throw DataUnavailable("NFCI series empty");
    }
    spdlog::info("Loaded {} conditions-index observations ({} .. {})",
                 series.size(), series.begin()->first, series.rbegin()->first);
    return series;
}

ConditionsSnapshot ConditionsIndexFetcher::fetch_latest() {
    try {
        return fetch_chicagofed();
    } catch (const std::exception& e) {
        spdlog::warn("Chicago Fed NFCI fetch failed, falling back to FRED: {}", e.what());
    }
    return fetch_fred();
}

ConditionsSnapshot ConditionsIndexFetcher::fetch_chicagofed() {
    std::istringstream in(download(csv_url_));
    std::string line;
    std::vector<std::string> latest;

    // Chicago Fed layout: date, NFCI, ANFCI, ... ; keep the last data row
    bool header = true;
    while (std::getline(in, line)) {
        if (util::trim(line).empty()) continue;
        if (header) {
            header = false;
            continue;
        }
        latest = util::split(line, ',');
    }

    if (latest.size() < 2) {
        throw DataUnavailable("NFCI CSV empty");
    }
    auto nfci = util::parse_double(latest[1]);
    if (!nfci) {
        throw DataUnavailable("NFCI CSV has no value in its last row");
    }

    ConditionsSnapshot snapshot;
    snapshot.date = latest[0];
    snapshot.nfci = *nfci;
    if (latest.size() >= 3) {
        snapshot.anfci = util::parse_double(latest[2]);
    }
    return snapshot;
}

ConditionsSnapshot ConditionsIndexFetcher::fetch_fred() {
    auto nfci = parse_csv(download(fred_nfci_url_));
    auto anfci = parse_csv(download(fred_anfci_url_));
    if (nfci.empty()) {
        throw DataUnavailable("FRED NFCI data empty");
    }

    const auto& [date, value] = *nfci.rbegin();
    ConditionsSnapshot snapshot;
    snapshot.date = date;
    snapshot.nfci = value;

    auto it = anfci.find(date);
    if (it != anfci.end()) {
        snapshot.anfci = it->second;
    }
    return snapshot;
}
