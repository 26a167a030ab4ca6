#pragma once

#include "http_client.hpp"
#include <memory>
#include <string>
#include <vector>

struct NotificationMessage {
    std::string title;
    std::string body;
};

struct NotifierSettings {
    bool slack_enabled = false;
    bool pushover_enabled = false;
    bool email_enabled = false;

    std::string slack_webhook_url;
    std::string pushover_url = "https://api.pushover.net/1/messages.json";
    std::string pushover_user_key;
    std::string pushover_app_token;

    std::string smtp_host;
    int smtp_port = 587;
    std::string smtp_user;
    std::string smtp_password;
    std::string smtp_from;
    bool smtp_tls = true;
    std::string mail_to;
};

// Fans a message out to every enabled channel with credentials; prints to
// stdout when nothing was delivered.
class Notifier {
public:
    Notifier(const NotifierSettings& settings, std::shared_ptr<HttpClient> http);

    // true if at least one channel accepted the message
    bool notify(const NotificationMessage& message);
    bool notify_batch(const std::string& title, const std::vector<std::string>& lines);

    static std::string format_stdout(const NotificationMessage& message);

private:
    NotifierSettings settings_;
    std::shared_ptr<HttpClient> http_;

    bool send_slack(const NotificationMessage& message);
    bool send_pushover(const NotificationMessage& message);
    bool send_email(const NotificationMessage& message);
};
