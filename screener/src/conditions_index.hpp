#pragma once

#include "http_client.hpp"
#include "series.hpp"
#include <memory>
#include <optional>
#include <string>

struct ConditionsSnapshot {
    std::string date;
    double nfci;
    std::optional<double> anfci;
};

// NFCI-style financial-conditions index published as (date, value) CSV.
class ConditionsIndexFetcher {
public:
    ConditionsIndexFetcher(std::shared_ptr<HttpClient> http,
                           const std::string& csv_url,
                           const std::string& fred_nfci_url,
                           const std::string& fred_anfci_url);

    // Full NFCI history from FRED. Throws DataUnavailable when empty.
    ConditionsSeries fetch_series();

    // Latest observation: Chicago Fed CSV first, FRED NFCI/ANFCI as fallback
    ConditionsSnapshot fetch_latest();

    // First column date, second column value; header row and "." values skipped
    static ConditionsSeries parse_csv(const std::string& body);

private:
    std::shared_ptr<HttpClient> http_;
    std::string csv_url_;
    std::string fred_nfci_url_;
    std::string fred_anfci_url_;

    std::string download(const std::string& url);
    ConditionsSnapshot fetch_chicagofed();
    ConditionsSnapshot fetch_fred();
};
