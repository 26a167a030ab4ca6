#include "config.hpp"
#include "clock.hpp"
#include "http_client.hpp"
#include "file_cache.hpp"
#include "providers.hpp"
#include "market_data_fetcher.hpp"
#include "conditions_index.hpp"
#include "regime.hpp"
#include "screener.hpp"
#include "report.hpp"
#include "notifier.hpp"
#include "regime_log.hpp"
#include "util.hpp"
#include <curl/curl.h>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <memory>
#include <optional>

void setup_logging(const std::string& logger_name, const std::string& log_level) {
    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>(logger_name, console_sink);

    if (log_level == "debug") {
        logger->set_level(spdlog::level::debug);
    } else if (log_level == "warn") {
        logger->set_level(spdlog::level::warn);
    } else if (log_level == "error") {
        logger->set_level(spdlog::level::err);
    } else {
        logger->set_level(spdlog::level::info);
    }

    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
    spdlog::set_default_logger(logger);
    spdlog::info("Logging initialized at level: {}", log_level);
}

namespace {

NotifierSettings notifier_settings(const Config& config) {
    NotifierSettings s;
    s.slack_enabled = config.slack_enabled;
    s.pushover_enabled = config.pushover_enabled;
    s.email_enabled = config.email_enabled;
    s.slack_webhook_url = config.slack_webhook_url;
    s.pushover_user_key = config.pushover_user_key;
    s.pushover_app_token = config.pushover_app_token;
    s.smtp_host = config.smtp_host;
    s.smtp_port = config.smtp_port;
    s.smtp_user = config.smtp_user;
    s.smtp_password = config.smtp_password;
    s.smtp_from = config.smtp_from;
    s.smtp_tls = config.smtp_tls;
    s.mail_to = config.mail_to;
    return s;
}

FetcherSettings fetcher_settings(const Config& config) {
    FetcherSettings s;
    s.cache_enabled = config.cache_enabled;
    s.retry_max_attempts = config.retry_max_attempts;
    s.retry_base_delay_seconds = config.retry_base_delay_seconds;
    s.retry_max_delay_seconds = config.retry_max_delay_seconds;
    s.rate_limit_enabled = config.rate_limit_enabled;
    s.rate_limit_min_interval_seconds = config.rate_limit_min_interval_seconds;
    return s;
}

} // namespace

int main() {
    curl_global_init(CURL_GLOBAL_DEFAULT);
    try {
        Config config = Config::from_env();
        setup_logging(config.service_name, config.log_level);
        config.validate();

        spdlog::info("Starting {} with {} symbols (benchmark {})",
                     config.service_name, config.symbols.size(), config.benchmark_symbol);

        auto clock = std::make_shared<SystemClock>();
        auto http = std::make_shared<CurlHttpClient>(config.request_timeout_ms);

        std::shared_ptr<CacheStore> cache;
        if (config.cache_enabled) {
            cache = std::make_shared<FileCache>(config.cache_dir, config.cache_ttl_seconds, clock);
        }

        std::vector<Provider> providers;
        providers.push_back(make_provider(config.provider_primary, config));
        if (!config.provider_fallback.empty() && config.provider_fallback != config.provider_primary) {
            providers.push_back(make_provider(config.provider_fallback, config));
        }

        auto fetcher = std::make_shared<MarketDataFetcher>(fetcher_settings(config), providers,
                                                           http, cache, clock);
        Notifier notifier(notifier_settings(config), http);

        std::string as_of = config.as_of_date.empty() ? util::current_local_date()
                                                      : config.as_of_date;

        ConditionsIndexFetcher conditions_fetcher(http, config.nfci_csv_url,
                                                  config.nfci_fred_url, config.anfci_fred_url);

        std::optional<RegimeScoreResult> regime;
        try {
            auto conditions = conditions_fetcher.fetch_series();
            auto benchmark = fetcher->fetch_daily(config.benchmark_symbol);
            regime = RegimeClassifier::classify(conditions, benchmark, as_of);
        } catch (const std::exception& e) {
            spdlog::error("Regime calculation failed: {}", e.what());
            notifier.notify_batch(ReportFormatter::title(util::current_utc_date(), "ERROR"),
                                  {std::string("Regime calculation failed: ") + e.what()});
            curl_global_cleanup();
            return 0;
        }

        spdlog::info("Regime {} score={:.1f} exposure={:.2f} entries={}",
                     regime_state_name(regime->state), regime->total_score,
                     regime->max_exposure, regime->allow_new_entries);

        // Latest published reading is informational; the report goes out without it
        std::optional<ConditionsSnapshot> latest_conditions;
        try {
            latest_conditions = conditions_fetcher.fetch_latest();
        } catch (const std::exception& e) {
            spdlog::warn("Latest NFCI snapshot unavailable: {}", e.what());
        }

        auto settings = ScreenerSettings::from_config(config);
        Screener screener(settings, fetcher);
        auto summary = screener.scan(config.symbols, *regime);

        auto title = ReportFormatter::title(util::current_utc_date(),
                                            regime_state_name(regime->state));
        notifier.notify_batch(title, ReportFormatter::build_lines(settings, *regime, summary,
                                                                  latest_conditions));

        if (!config.regime_log_path.empty()) {
            try {
                RegimeLog(config.regime_log_path).append(*regime, ReportFormatter::hits(*regime, summary));
            } catch (const std::exception& e) {
                spdlog::error("Failed to append regime log: {}", e.what());
            }
        }

        spdlog::info("{} finished", config.service_name);
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        curl_global_cleanup();
        return 1;
    }

    curl_global_cleanup();
    return 0;
}
