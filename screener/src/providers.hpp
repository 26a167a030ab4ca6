#pragma once

#include "http_client.hpp"
#include "series.hpp"
#include <string>
#include <variant>
#include <nlohmann/json.hpp>

struct Config;

struct ProviderRequest {
    std::string url;
    QueryParams params;
};

// Twelve Data /time_series: {"values": [{"datetime", "open", ...}]}, newest first
class TwelveDataProvider {
public:
    TwelveDataProvider(const std::string& base_url, const std::string& interval,
                       int outputsize, const std::string& api_key);

    std::string name() const { return "twelvedata"; }
    bool has_api_key() const { return !api_key_.empty(); }

    ProviderRequest build_request(const std::string& symbol) const;
    void check_payload(const nlohmann::json& payload) const;
    OhlcvSeries parse(const std::string& symbol, const nlohmann::json& payload) const;

private:
    std::string base_url_;
    std::string interval_;
    int outputsize_;
    std::string api_key_;
};

// Alpha Vantage /query: {"Time Series (Daily)": {"YYYY-MM-DD": {"1. open", ...}}}
class AlphaVantageProvider {
public:
    AlphaVantageProvider(const std::string& base_url, const std::string& function,
                         const std::string& outputsize, const std::string& api_key);

    std::string name() const { return "alphavantage"; }
    bool has_api_key() const { return !api_key_.empty(); }

    ProviderRequest build_request(const std::string& symbol) const;
    void check_payload(const nlohmann::json& payload) const;
    OhlcvSeries parse(const std::string& symbol, const nlohmann::json& payload) const;

private:
    std::string base_url_;
    std::string function_;
    std::string outputsize_;
    std::string api_key_;
};

using Provider = std::variant<TwelveDataProvider, AlphaVantageProvider>;

std::string provider_name(const Provider& provider);

// Throws ConfigError for an unknown provider name
Provider make_provider(const std::string& name, const Config& config);

namespace providers {
    // Numbers may arrive as JSON numbers or strings; anything else is unknown
    Value to_value(const nlohmann::json& field);
}
