#pragma once

#include <string>
#include <vector>
#include <cstdlib>

struct Config {
    // Universe
    std::vector<std::string> symbols;
    std::string benchmark_symbol;
    std::string as_of_date;  // empty = today (local time, TZ)

    // Providers
    std::string provider_primary;
    std::string provider_fallback;
    std::string twelvedata_base_url;
    std::string twelvedata_interval;
    int twelvedata_outputsize;
    std::string twelve_data_api_key;
    std::string alphavantage_base_url;
    std::string alphavantage_function;
    std::string alphavantage_outputsize;
    std::string alpha_vantage_api_key;
    int request_timeout_ms;

    // Cache
    bool cache_enabled;
    std::string cache_dir;
    int cache_ttl_seconds;

    // Retry / rate limit
    int retry_max_attempts;
    double retry_base_delay_seconds;
    double retry_max_delay_seconds;
    bool rate_limit_enabled;
    double rate_limit_min_interval_seconds;

    // Eligibility filters
    double drawdown_20d_max;
    double high_52w_max_multiple;
    double sma50_tolerance;
    double pullback_tolerance;

    // Triggers
    bool pullback_25_enabled;
    bool pullback_50_enabled;
    bool breakout_20d_enabled;
    double breakout_volume_mult;

    // FILTER_DD_002: windowed drawdown-from-peak for breakouts
    int dd_window_days;
    double dd_max;

    // Conditions index
    std::string nfci_csv_url;
    std::string nfci_fred_url;
    std::string anfci_fred_url;

    // Notifications
    bool slack_enabled;
    bool pushover_enabled;
    bool email_enabled;
    std::string slack_webhook_url;
    std::string pushover_user_key;
    std::string pushover_app_token;
    std::string smtp_host;
    int smtp_port;
    std::string smtp_user;
    std::string smtp_password;
    std::string smtp_from;
    bool smtp_tls;
    std::string mail_to;

    // Regime log (CSV), empty disables
    std::string regime_log_path;

    // Service
    std::string service_name;
    std::string log_level;

    static Config from_env();
    void validate() const;

private:
    static std::string get_env(const char* name, const std::string& default_val = "");
    static int get_env_int(const char* name, int default_val);
    static double get_env_double(const char* name, double default_val);
    static bool get_env_bool(const char* name, bool default_val);
};
