#include "telegram_alert_sink.hpp"
#include <cpr/cpr.h>
#include <spdlog/spdlog.h>

TelegramAlertSink::TelegramAlertSink(const Config& config)
    : config_(config), api_base_url_("https://api.telegram.org/bot" + config.telegram_bot_token) {}

bool TelegramAlertSink::send(const Alert& alert) {
    return send_message(alert.text);
}

bool TelegramAlertSink::send_message(const std::string& text) {
    nlohmann::json params = {
        {"chat_id", config_.telegram_chat_id},
        {"text", text},
        {"parse_mode", "HTML"},
        {"disable_web_page_preview", true}
    };

    auto response = make_request("sendMessage", params);
    bool success = response.value("ok", false);

    if (!success) {
        spdlog::error("Failed to send Telegram message: {}", response.dump());
    }

    return success;
}

nlohmann::json TelegramAlertSink::make_request(const std::string& method, const nlohmann::json& params) {
    std::string url = api_base_url_ + "/" + method;

    try {
        auto response = cpr::Post(
            cpr::Url{url},
            cpr::Header{{"Content-Type", "application/json"}},
            cpr::Body{params.dump()},
            cpr::Timeout{10000}
        );

        if (response.status_code == 200) {
            return nlohmann::json::parse(response.text);
        }

        spdlog::error("Telegram HTTP error {}: {}", response.status_code,
                      response.error ? response.error.message : response.text);
        return nlohmann::json{{"ok", false}, {"error", "HTTP error"}};
    } catch (const std::exception& e) {
        spdlog::error("Telegram request failed: {}", e.what());
        return nlohmann::json{{"ok", false}, {"error", "Request failed"}};
    }
}
