#include "notifier.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <nlohmann/json.hpp>
#include <curl/curl.h>
#include <cstring>
#include <algorithm>

namespace {

struct MailPayload {
    std::string data;
    size_t offset = 0;
};

size_t read_callback(char* buffer, size_t size, size_t nitems, void* userp) {
    auto* payload = static_cast<MailPayload*>(userp);
    size_t room = size * nitems;
    size_t left = payload->data.size() - payload->offset;
    size_t n = std::min(room, left);
    if (n > 0) {
        std::memcpy(buffer, payload->data.data() + payload->offset, n);
        payload->offset += n;
    }
    return n;
}

} // namespace

Notifier::Notifier(const NotifierSettings& settings, std::shared_ptr<HttpClient> http)
    : settings_(settings)
    , http_(std::move(http))
{}

bool Notifier::notify(const NotificationMessage& message) {
    bool sent = false;

    // Each channel is independent; one failing does not stop the others
    if (settings_.slack_enabled) {
        try {
            sent = send_slack(message) || sent;
        } catch (const std::exception& e) {
            spdlog::error("Slack notification failed: {}", e.what());
        }
    }
    if (settings_.pushover_enabled) {
        try {
            sent = send_pushover(message) || sent;
        } catch (const std::exception& e) {
            spdlog::error("Pushover notification failed: {}", e.what());
        }
    }
    if (settings_.email_enabled) {
        try {
            sent = send_email(message) || sent;
        } catch (const std::exception& e) {
            spdlog::error("Email notification failed: {}", e.what());
        }
    }

    if (!sent) {
        fmt::print("{}\n", format_stdout(message));
    }
    return sent;
}

bool Notifier::notify_batch(const std::string& title, const std::vector<std::string>& lines) {
    return notify(NotificationMessage{title, util::join(lines, "\n")});
}

std::string Notifier::format_stdout(const NotificationMessage& message) {
    return message.title + "\n" + message.body;
}

bool Notifier::send_slack(const NotificationMessage& message) {
    if (settings_.slack_webhook_url.empty()) {
        return false;
    }

    nlohmann::json payload = {
        {"text", "*" + message.title + "*\n" + message.body}
    };
    auto response = http_->post(settings_.slack_webhook_url, payload.dump(), "application/json");
    if (response.status >= 300) {
        spdlog::error("Slack webhook returned HTTP {}", response.status);
        return false;
    }
    return true;
}

bool Notifier::send_pushover(const NotificationMessage& message) {
    if (settings_.pushover_user_key.empty() || settings_.pushover_app_token.empty()) {
        return false;
    }

    auto response = http_->post_form(settings_.pushover_url, {
        {"token", settings_.pushover_app_token},
        {"user", settings_.pushover_user_key},
        {"title", message.title},
        {"message", message.body}
    });
    if (response.status >= 300) {
        spdlog::error("Pushover returned HTTP {}", response.status);
        return false;
    }
    return true;
}

bool Notifier::send_email(const NotificationMessage& message) {
    const auto& s = settings_;
    std::string from = s.smtp_from.empty() ? s.smtp_user : s.smtp_from;
    if (s.mail_to.empty() || s.smtp_host.empty() || s.smtp_user.empty() ||
        s.smtp_password.empty() || from.empty()) {
        return false;
    }

    CURL* curl = curl_easy_init();
    if (!curl) {
        throw std::runtime_error("Failed to initialize CURL for SMTP");
    }

    MailPayload payload;
    payload.data = fmt::format(
        "To: {}\r\nFrom: {}\r\nSubject: {}\r\n"
        "Content-Type: text/plain; charset=utf-8\r\n\r\n{}\r\n",
        s.mail_to, from, message.title, message.body);

    std::string url = fmt::format("smtp://{}:{}", s.smtp_host, s.smtp_port);
    struct curl_slist* recipients = curl_slist_append(nullptr, s.mail_to.c_str());

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_USERNAME, s.smtp_user.c_str());
    curl_easy_setopt(curl, CURLOPT_PASSWORD, s.smtp_password.c_str());
    curl_easy_setopt(curl, CURLOPT_MAIL_FROM, from.c_str());
    curl_easy_setopt(curl, CURLOPT_MAIL_RCPT, recipients);
    curl_easy_setopt(curl, CURLOPT_READFUNCTION, read_callback);
    curl_easy_setopt(curl, CURLOPT_READDATA, &payload);
    curl_easy_setopt(curl, CURLOPT_UPLOAD, 1L);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, 20L);
    if (s.smtp_tls) {
        curl_easy_setopt(curl, CURLOPT_USE_SSL, static_cast<long>(CURLUSESSL_ALL));
    }

    CURLcode res = curl_easy_perform(curl);
    curl_slist_free_all(recipients);
    curl_easy_cleanup(curl);

    if (res != CURLE_OK) {
        spdlog::error("SMTP delivery failed: {}", curl_easy_strerror(res));
        return false;
    }
    return true;
}
