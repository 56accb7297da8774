#pragma once
#include "alert_sink.hpp"
#include "config.hpp"
#include <string>
#include <nlohmann/json.hpp>

// Sends alerts through the Telegram Bot API
class TelegramAlertSink : public AlertSink {
public:
    explicit TelegramAlertSink(const Config& config);

    bool send(const Alert& alert) override;

    bool send_message(const std::string& text);

private:
    nlohmann::json make_request(const std::string& method, const nlohmann::json& params);

    const Config& config_;
    std::string api_base_url_;
};
