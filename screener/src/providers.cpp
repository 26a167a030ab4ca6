#include "providers.hpp"
#include "config.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>

namespace providers {

Value to_value(const nlohmann::json& field) {
    if (field.is_number()) {
        return field.get<double>();
    }
    if (field.is_string()) {
        return util::parse_double(field.get<std::string>());
    }
    return std::nullopt;
}

} // namespace providers

namespace {

Value field_or_unknown(const nlohmann::json& row, const char* key) {
    if (!row.is_object() || !row.contains(key)) return std::nullopt;
    return providers::to_value(row[key]);
}

std::string truncate(const std::string& text, size_t max_len = 200) {
    return text.size() > max_len ? text.substr(0, max_len) : text;
}

} // namespace

TwelveDataProvider::TwelveDataProvider(const std::string& base_url, const std::string& interval,
                                       int outputsize, const std::string& api_key)
    : base_url_(base_url)
    , interval_(interval)
    , outputsize_(outputsize)
    , api_key_(api_key)
{}

ProviderRequest TwelveDataProvider::build_request(const std::string& symbol) const {
    return ProviderRequest{
        base_url_,
        {
            {"symbol", symbol},
            {"interval", interval_},
            {"outputsize", std::to_string(outputsize_)},
            {"apikey", api_key_}
        }
    };
}

void TwelveDataProvider::check_payload(const nlohmann::json& payload) const {
    if (!payload.is_object()) {
        throw ProviderError("Twelve Data returned a non-object payload");
    }
    if (payload.value("status", "") == "error" ||
        (payload.contains("code") && !payload.contains("values"))) {
        throw ProviderError("Twelve Data error: " + truncate(payload.dump()));
    }
}

OhlcvSeries TwelveDataProvider::parse(const std::string& symbol,
                                      const nlohmann::json& payload) const {
    if (!payload.contains("values") || !payload["values"].is_array()) {
        throw ProviderError("Unexpected Twelve Data response for " + symbol);
    }

    OhlcvSeries series;
    series.symbol = symbol;

    for (const auto& row : payload["values"]) {
        if (!row.is_object() || !row.contains("datetime") || !row["datetime"].is_string()) {
            continue;
        }
        auto date = util::normalize_date(row["datetime"].get<std::string>());
        if (!date) {
            spdlog::warn("Skipping Twelve Data row with bad date for {}", symbol);
            continue;
        }

        Bar bar;
        bar.date = *date;
        bar.open = field_or_unknown(row, "open");
        bar.high = field_or_unknown(row, "high");
        bar.low = field_or_unknown(row, "low");
        bar.close = field_or_unknown(row, "close");
        bar.volume = field_or_unknown(row, "volume");
        series.bars.push_back(bar);
    }

    series.normalize();
    return series;
}

AlphaVantageProvider::AlphaVantageProvider(const std::string& base_url,
                                           const std::string& function,
                                           const std::string& outputsize,
                                           const std::string& api_key)
    : base_url_(base_url)
    , function_(function)
    , outputsize_(outputsize)
    , api_key_(api_key)
{}

ProviderRequest AlphaVantageProvider::build_request(const std::string& symbol) const {
    return ProviderRequest{
        base_url_,
        {
            {"function", function_},
            {"symbol", symbol},
            {"outputsize", outputsize_},
            {"apikey", api_key_}
        }
    };
}

void AlphaVantageProvider::check_payload(const nlohmann::json& payload) const {
    if (!payload.is_object()) {
        throw ProviderError("Alpha Vantage returned a non-object payload");
    }

    // Rate limiting is reported in-band with HTTP 200
    for (const char* marker : {"Note", "Information"}) {
        if (payload.contains(marker)) {
            const auto& note = payload[marker];
            throw ProviderError("Alpha Vantage: " +
                                truncate(note.is_string() ? note.get<std::string>() : note.dump()));
        }
    }
    if (payload.contains("Error Message")) {
        throw ProviderError("Alpha Vantage error: " + truncate(payload.dump()));
    }
}

OhlcvSeries AlphaVantageProvider::parse(const std::string& symbol,
                                        const nlohmann::json& payload) const {
    auto it = payload.find("Time Series (Daily)");
    if (it == payload.end() || !it->is_object()) {
        throw ProviderError("Unexpected Alpha Vantage response for " + symbol);
    }

    OhlcvSeries series;
    series.symbol = symbol;

    for (const auto& [date_str, row] : it->items()) {
        auto date = util::normalize_date(date_str);
        if (!date) {
            spdlog::warn("Skipping Alpha Vantage row with bad date for {}", symbol);
            continue;
        }

        Bar bar;
        bar.date = *date;
        bar.open = field_or_unknown(row, "1. open");
        bar.high = field_or_unknown(row, "2. high");
        bar.low = field_or_unknown(row, "3. low");
        bar.close = field_or_unknown(row, "4. close");

        // Adjusted endpoint puts volume at 6, the plain daily endpoint at 5
        bool has_adjusted_volume = row.contains("6. volume") && !row["6. volume"].is_null() &&
                                   !(row["6. volume"].is_string() &&
                                     row["6. volume"].get<std::string>().empty());
        bar.volume = field_or_unknown(row, has_adjusted_volume ? "6. volume" : "5. volume");
        series.bars.push_back(bar);
    }

    series.normalize();
    return series;
}

std::string provider_name(const Provider& provider) {
    return std::visit([](const auto& p) { return p.name(); }, provider);
}

Provider make_provider(const std::string& name, const Config& config) {
    if (name == "twelvedata") {
        return TwelveDataProvider(config.twelvedata_base_url, config.twelvedata_interval,
                                  config.twelvedata_outputsize, config.twelve_data_api_key);
    }
    if (name == "alphavantage") {
        return AlphaVantageProvider(config.alphavantage_base_url, config.alphavantage_function,
                                    config.alphavantage_outputsize, config.alpha_vantage_api_key);
    }
    throw ConfigError("Unsupported provider: " + name);
}
