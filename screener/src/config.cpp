#include "config.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>

std::string Config::get_env(const char* name, const std::string& default_val) {
    const char* val = std::getenv(name);
    return val ? std::string(val) : default_val;
}

int Config::get_env_int(const char* name, int default_val) {
    const char* val = std::getenv(name);
    if (!val) return default_val;
    try {
        return std::stoi(val);
    } catch (const std::exception&) {
        spdlog::warn("Invalid integer for {}, using default {}", name, default_val);
        return default_val;
    }
}

double Config::get_env_double(const char* name, double default_val) {
    const char* val = std::getenv(name);
    if (!val) return default_val;
    auto parsed = util::parse_double(val);
    if (!parsed) {
        spdlog::warn("Invalid number for {}, using default {}", name, default_val);
        return default_val;
    }
    return *parsed;
}

bool Config::get_env_bool(const char* name, bool default_val) {
    const char* val = std::getenv(name);
    if (!val) return default_val;

    std::string s = util::trim(val);
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (s == "1" || s == "true" || s == "yes" || s == "on") return true;
    if (s == "0" || s == "false" || s == "no" || s == "off") return false;

    spdlog::warn("Invalid boolean for {}, using default {}", name, default_val);
    return default_val;
}

Config Config::from_env() {
    Config cfg;

    for (const auto& symbol : util::split(get_env("SYMBOLS", "AAPL,MSFT,NVDA,AMZN,GOOGL,META"), ',')) {
        if (!symbol.empty()) cfg.symbols.push_back(symbol);
    }
    cfg.benchmark_symbol = get_env("BENCHMARK_SYMBOL", "QQQ");
    cfg.as_of_date = get_env("AS_OF_DATE");

    cfg.provider_primary = get_env("PROVIDER_PRIMARY", "twelvedata");
    cfg.provider_fallback = get_env("PROVIDER_FALLBACK", "alphavantage");
    cfg.twelvedata_base_url = get_env("TWELVEDATA_BASE_URL", "https://api.twelvedata.com/time_series");
    cfg.twelvedata_interval = get_env("TWELVEDATA_INTERVAL", "1day");
    cfg.twelvedata_outputsize = get_env_int("TWELVEDATA_OUTPUTSIZE", 300);
    cfg.twelve_data_api_key = get_env("TWELVE_DATA_API_KEY");
    cfg.alphavantage_base_url = get_env("ALPHAVANTAGE_BASE_URL", "https://www.alphavantage.co/query");
    cfg.alphavantage_function = get_env("ALPHAVANTAGE_FUNCTION", "TIME_SERIES_DAILY_ADJUSTED");
    cfg.alphavantage_outputsize = get_env("ALPHAVANTAGE_OUTPUTSIZE", "full");
    cfg.alpha_vantage_api_key = get_env("ALPHA_VANTAGE_API_KEY");
    cfg.request_timeout_ms = get_env_int("REQUEST_TIMEOUT_MS", 30000);

    cfg.cache_enabled = get_env_bool("CACHE_ENABLED", true);
    cfg.cache_dir = get_env("CACHE_DIR", ".cache");
    cfg.cache_ttl_seconds = get_env_int("CACHE_TTL_SECONDS", 21600);

    cfg.retry_max_attempts = get_env_int("RETRY_MAX_ATTEMPTS", 3);
    cfg.retry_base_delay_seconds = get_env_double("RETRY_BASE_DELAY_SECONDS", 1.0);
    cfg.retry_max_delay_seconds = get_env_double("RETRY_MAX_DELAY_SECONDS", 30.0);
    cfg.rate_limit_enabled = get_env_bool("RATE_LIMIT_ENABLED", true);
    cfg.rate_limit_min_interval_seconds = get_env_double("RATE_LIMIT_MIN_INTERVAL_SECONDS", 8.0);

    cfg.drawdown_20d_max = get_env_double("FILTER_DRAWDOWN_20D_MAX", 0.15);
    cfg.high_52w_max_multiple = get_env_double("FILTER_HIGH_52W_MAX_MULTIPLE", 1.0);
    cfg.sma50_tolerance = get_env_double("FILTER_SMA50_TOLERANCE", 0.0);
    cfg.pullback_tolerance = get_env_double("FILTER_TOLERANCE", 0.005);

    cfg.pullback_25_enabled = get_env_bool("TRIGGER_PULLBACK_25_ENABLED", true);
    cfg.pullback_50_enabled = get_env_bool("TRIGGER_PULLBACK_50_ENABLED", true);
    cfg.breakout_20d_enabled = get_env_bool("TRIGGER_BREAKOUT_20D_ENABLED", true);
    cfg.breakout_volume_mult = get_env_double("TRIGGER_BREAKOUT_VOLUME_MULT", 1.5);

    cfg.dd_window_days = get_env_int("DD_WINDOW_DAYS", 90);
    cfg.dd_max = get_env_double("DD_MAX", 0.25);

    cfg.nfci_csv_url = get_env("NFCI_CSV_URL",
        "https://www.chicagofed.org/-/media/publications/nfci/nfci-data-series-csv.csv");
    cfg.nfci_fred_url = get_env("NFCI_FRED_URL",
        "https://fred.stlouisfed.org/graph/fredgraph.csv?id=NFCI");
    cfg.anfci_fred_url = get_env("ANFCI_FRED_URL",
        "https://fred.stlouisfed.org/graph/fredgraph.csv?id=ANFCI");

    cfg.slack_enabled = get_env_bool("NOTIFY_SLACK_ENABLED", true);
    cfg.pushover_enabled = get_env_bool("NOTIFY_PUSHOVER_ENABLED", true);
    cfg.email_enabled = get_env_bool("NOTIFY_EMAIL_ENABLED", true);
    cfg.slack_webhook_url = get_env("SLACK_WEBHOOK_URL");
    cfg.pushover_user_key = get_env("PUSHOVER_USER_KEY");
    cfg.pushover_app_token = get_env("PUSHOVER_APP_TOKEN");
    cfg.smtp_host = get_env("SMTP_HOST");
    cfg.smtp_port = get_env_int("SMTP_PORT", 587);
    cfg.smtp_user = get_env("SMTP_USER");
    cfg.smtp_password = get_env("SMTP_PASSWORD");
    cfg.smtp_from = get_env("SMTP_FROM", cfg.smtp_user);
    cfg.smtp_tls = get_env_bool("SMTP_TLS", true);
    cfg.mail_to = get_env("MAIL_ADDRESS_NOTIFICATION_TO");

    cfg.regime_log_path = get_env("REGIME_LOG_PATH");

    cfg.service_name = get_env("SERVICE_NAME", "stockscout");
    cfg.log_level = get_env("LOG_LEVEL", "info");

    return cfg;
}

void Config::validate() const {
    if (symbols.empty()) {
        throw ConfigError("SYMBOLS must list at least one symbol");
    }
    if (benchmark_symbol.empty()) {
        throw ConfigError("BENCHMARK_SYMBOL is required");
    }
    for (const auto& provider : {provider_primary, provider_fallback}) {
        if (provider != "twelvedata" && provider != "alphavantage") {
            throw ConfigError("Unsupported provider: " + provider);
        }
    }
    if (!as_of_date.empty() && !util::normalize_date(as_of_date)) {
        throw ConfigError("AS_OF_DATE must be YYYY-MM-DD");
    }
    if (retry_max_attempts < 1) {
        throw ConfigError("RETRY_MAX_ATTEMPTS must be >= 1");
    }
    if (retry_base_delay_seconds < 0 || retry_max_delay_seconds < 0 ||
        rate_limit_min_interval_seconds < 0) {
        throw ConfigError("Retry and rate-limit delays must be non-negative");
    }
    if (dd_window_days < 1) {
        throw ConfigError("DD_WINDOW_DAYS must be >= 1");
    }
    if (twelve_data_api_key.empty() && alpha_vantage_api_key.empty()) {
        spdlog::warn("Neither TWELVE_DATA_API_KEY nor ALPHA_VANTAGE_API_KEY is set");
    }

    spdlog::info("Configuration validated successfully");
    spdlog::info("  Universe: {} symbols, benchmark {}", symbols.size(), benchmark_symbol);
    spdlog::info("  Providers: {} -> {}", provider_primary, provider_fallback);
    spdlog::info("  Filters: drawdown_20d_max={} high_52w_max_multiple={} sma50_tolerance={}",
                 drawdown_20d_max, high_52w_max_multiple, sma50_tolerance);
    spdlog::info("  FILTER_DD_002: window={} dd_max={}", dd_window_days, dd_max);
}
