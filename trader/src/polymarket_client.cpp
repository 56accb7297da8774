#include "polymarket_client.hpp"
#include "backoff_manager.hpp"
#include "rate_limiter.hpp"
#include "util.hpp"
#include <cpr/cpr.h>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <initializer_list>
#include <thread>

namespace {

const char* kUserAgent = "SpeedScout/1.0";

// "btcusdt" -> {"BTC", "BITCOIN"}
std::vector<std::string> asset_terms(const std::string& symbol) {
    std::string asset = util::to_upper(symbol);
    for (const char* quote : {"USDT", "USDC", "USD"}) {
        std::string suffix(quote);
        if (asset.size() > suffix.size() &&
            asset.compare(asset.size() - suffix.size(), suffix.size(), suffix) == 0) {
            asset.erase(asset.size() - suffix.size());
            break;
        }
    }

    std::vector<std::string> terms{asset};
    if (asset == "BTC") terms.push_back("BITCOIN");
    if (asset == "ETH") terms.push_back("ETHEREUM");
    return terms;
}

bool is_short_window(const std::string& upper_question) {
    for (const char* term : {"5 MINUTE", "5-MINUTE", "5M", "5 MIN"}) {
        if (upper_question.find(term) != std::string::npos) {
            return true;
        }
    }
    return false;
}

// outcomePrices arrives either as an array or as a JSON-encoded string
std::vector<double> read_outcome_prices(const nlohmann::json& j) {
    std::vector<double> prices;
    const char* keys[] = {"outcomePrices", "outcome_prices"};
    for (const char* key : keys) {
        if (!j.contains(key)) continue;

        nlohmann::json raw = j.at(key);
        if (raw.is_string()) {
            raw = nlohmann::json::parse(raw.get<std::string>(), nullptr, false);
        }
        if (!raw.is_array()) continue;

        for (const auto& item : raw) {
            if (item.is_string()) {
                prices.push_back(util::safe_parse_double(item.get<std::string>(), -1.0));
            } else if (item.is_number()) {
                prices.push_back(item.get<double>());
            }
        }
        break;
    }
    return prices;
}

std::string read_string(const nlohmann::json& j, std::initializer_list<const char*> keys) {
    for (const char* key : keys) {
        if (j.contains(key) && j.at(key).is_string()) {
            return j.at(key).get<std::string>();
        }
    }
    return "";
}

} // namespace

class PolymarketClient::Impl {
public:
    explicit Impl(const Config& config)
        : config_(config),
          limiter_(RateLimit{config.venue_rate_per_sec, config.venue_rate_burst}) {}

    std::optional<std::vector<MarketDescriptor>> list_active_markets(const std::string& symbol) {
        auto response = get_with_retry("markets", config_.gamma_api_url + "/markets",
                                       cpr::Parameters{{"active", "true"}, {"closed", "false"}, {"limit", "200"}});
        if (response.error || response.status_code != 200) {
            spdlog::warn("Market listing failed: status={} error={}",
                         response.status_code, response.error.message);
            return std::nullopt;
        }

        auto body = nlohmann::json::parse(response.text, nullptr, false);
        if (body.is_discarded()) {
            spdlog::error("Market listing returned malformed JSON");
            return std::nullopt;
        }

        const nlohmann::json& items = body.is_array() ? body : body.value("data", nlohmann::json::array());
        auto now = Clock::now();

        std::vector<MarketDescriptor> markets;
        for (const auto& item : items) {
            try {
                auto market = PolymarketClient::parse_market(item, symbol, now);
                if (market) {
                    markets.push_back(*market);
                }
            } catch (const nlohmann::json::exception& e) {
                spdlog::warn("Skipping malformed market entry: {}", e.what());
            }
        }

        spdlog::debug("Venue listed {} active {} markets out of {}", markets.size(), symbol, items.size());
        return markets;
    }

    OrderAck submit_order(const OrderRequest& request) {
        OrderAck ack;

        nlohmann::json payload = {
            {"client_order_id", request.client_order_id},
            {"market", request.market_id},
            {"side", "BUY"},
            {"outcome", to_string(request.direction)},
            {"size", request.size_usd},
            {"price", request.limit_price},
            {"type", "FOK"}
        };

        if (!limiter_.acquire("orders", std::chrono::milliseconds(config_.venue_timeout_ms))) {
            ack.status = OrderStatus::Rejected;
            ack.cause = "order rate limit reached";
            return ack;
        }

        // Orders are never retried; a duplicate fill is worse than a missed one
        auto response = cpr::Post(
            cpr::Url{config_.polymarket_api_url + "/order"},
            auth_headers(),
            cpr::Body{payload.dump()},
            cpr::Timeout{config_.venue_timeout_ms}
        );

        if (response.error) {
            if (response.error.code == cpr::ErrorCode::OPERATION_TIMEDOUT) {
                ack.status = OrderStatus::Timeout;
                ack.cause = fmt::format("no acknowledgement within {} ms", config_.venue_timeout_ms);
            } else {
                ack.status = OrderStatus::Rejected;
                ack.cause = "transport error: " + response.error.message;
            }
            return ack;
        }

        auto body = nlohmann::json::parse(response.text, nullptr, false);
        if (response.status_code != 200 && response.status_code != 201) {
            ack.status = OrderStatus::Rejected;
            ack.cause = fmt::format("HTTP {}: {}", response.status_code,
                                    body.is_object() ? body.value("errorMsg", response.text) : response.text);
            return ack;
        }

        if (body.is_discarded() || !body.is_object()) {
            ack.status = OrderStatus::Rejected;
            ack.cause = "malformed order response";
            return ack;
        }

        if (!body.value("success", false)) {
            ack.status = OrderStatus::Rejected;
            ack.cause = body.value("errorMsg", std::string("order not accepted"));
            return ack;
        }

        ack.status = OrderStatus::Accepted;
        ack.order_id = read_string(body, {"orderID", "orderId", "order_id"});
        ack.fill_price = body.contains("price") && body["price"].is_number()
            ? body["price"].get<double>() : request.limit_price;
        return ack;
    }

    Settlement query_settlement(const std::string& market_id) {
        auto response = get_with_retry("settlement:" + market_id,
                                       config_.gamma_api_url + "/markets/" + market_id, {});

        Settlement settlement;
        if (!response.error && response.status_code == 404) {
            settlement.status = SettlementStatus::Unknown;
            settlement.detail = "market not listed";
            return settlement;
        }
        if (response.error || response.status_code != 200) {
            settlement.status = SettlementStatus::Unavailable;
            settlement.detail = fmt::format("HTTP {} {}", response.status_code, response.error.message);
            return settlement;
        }

        auto body = nlohmann::json::parse(response.text, nullptr, false);
        if (body.is_discarded() || !body.is_object()) {
            settlement.status = SettlementStatus::Unavailable;
            settlement.detail = "malformed market payload";
            return settlement;
        }

        try {
            return PolymarketClient::parse_settlement(body);
        } catch (const nlohmann::json::exception& e) {
            settlement.status = SettlementStatus::Unavailable;
            settlement.detail = std::string("unexpected market payload: ") + e.what();
            return settlement;
        }
    }

    AuthStatus check_credentials() {
        if (!limiter_.acquire("reads", std::chrono::milliseconds(config_.venue_timeout_ms))) {
            return AuthStatus::Unreachable;
        }
        auto response = cpr::Get(
            cpr::Url{config_.polymarket_api_url + "/auth/api-keys"},
            auth_headers(),
            cpr::Timeout{config_.venue_timeout_ms}
        );

        if (response.status_code == 401 || response.status_code == 403) {
            return AuthStatus::Unauthorized;
        }
        if (response.error || response.status_code != 200) {
            spdlog::warn("Venue credential check inconclusive: status={} error={}",
                         response.status_code, response.error.message);
            return AuthStatus::Unreachable;
        }
        return AuthStatus::Ok;
    }

private:
    cpr::Header auth_headers() const {
        return cpr::Header{
            {"Content-Type", "application/json"},
            {"User-Agent", kUserAgent},
            {"POLY_API_KEY", config_.polymarket_api_key}
        };
    }

    // Idempotent reads only
    cpr::Response get_with_retry(const std::string& endpoint, const std::string& url,
                                 const cpr::Parameters& params) {
        auto wait = backoff_.time_until_allowed(endpoint);
        if (wait.count() > 0) {
            spdlog::debug("{} endpoint backing off for another {} ms", endpoint, wait.count());
            cpr::Response skipped;
            skipped.status_code = 0;
            skipped.error.code = cpr::ErrorCode::INTERNAL_ERROR;
            skipped.error.message = "endpoint in backoff";
            return skipped;
        }

        cpr::Response response;
        for (int attempt = 1; attempt <= config_.venue_max_attempts; ++attempt) {
            if (!limiter_.acquire("reads", std::chrono::milliseconds(config_.venue_timeout_ms))) {
                spdlog::warn("{} request dropped by the venue rate limit", endpoint);
                response = cpr::Response();
                response.status_code = 0;
                response.error.code = cpr::ErrorCode::INTERNAL_ERROR;
                response.error.message = "rate limited";
                return response;
            }
            response = cpr::Get(
                cpr::Url{url},
                params,
                cpr::Header{{"User-Agent", kUserAgent}},
                cpr::Timeout{config_.venue_timeout_ms}
            );

            if (!response.error && response.status_code == 200) {
                backoff_.record_success(endpoint);
                return response;
            }

            if (!util::should_retry_request(static_cast<int>(response.status_code), attempt,
                                            config_.venue_max_attempts)) {
                break;
            }

            auto delay = backoff_.delay_for_attempt(attempt);
            spdlog::debug("{} request failed (status {}), retrying in {} ms (attempt {}/{})",
                          endpoint, response.status_code, delay.count(), attempt, config_.venue_max_attempts);
            std::this_thread::sleep_for(delay);
        }

        if (util::is_network_error(static_cast<int>(response.status_code))) {
            auto cooldown = backoff_.record_failure(endpoint);
            spdlog::warn("{} unreachable (status {}), cooling down for {} ms",
                         endpoint, response.status_code, cooldown.count());
        }
        return response;
    }

    const Config& config_;
    BackoffManager backoff_;
    RateLimiter limiter_;
};

PolymarketClient::PolymarketClient(const Config& config) : pImpl_(std::make_unique<Impl>(config)) {}
PolymarketClient::~PolymarketClient() = default;

std::optional<std::vector<MarketDescriptor>> PolymarketClient::list_active_markets(const std::string& symbol) {
    return pImpl_->list_active_markets(symbol);
}

OrderAck PolymarketClient::submit_order(const OrderRequest& request) {
    return pImpl_->submit_order(request);
}

Settlement PolymarketClient::query_settlement(const std::string& market_id) {
    return pImpl_->query_settlement(market_id);
}

AuthStatus PolymarketClient::check_credentials() {
    return pImpl_->check_credentials();
}

std::optional<MarketDescriptor> PolymarketClient::parse_market(const nlohmann::json& j,
                                                               const std::string& symbol,
                                                               TimePoint now) {
    if (!j.is_object() || j.value("closed", false)) {
        return std::nullopt;
    }

    std::string question = read_string(j, {"question", "title"});
    std::string upper = util::to_upper(question);

    auto terms = asset_terms(symbol);
    bool matches_asset = std::any_of(terms.begin(), terms.end(), [&](const std::string& term) {
        return upper.find(term) != std::string::npos;
    });
    if (!matches_asset || !is_short_window(upper)) {
        return std::nullopt;
    }

    auto baseline = util::extract_dollar_amount(question);
    if (!baseline) {
        spdlog::debug("No baseline price in market question: {}", question);
        return std::nullopt;
    }

    try {
        MarketDescriptor market;
        market.market_id = read_string(j, {"id", "condition_id", "conditionId"});
        if (market.market_id.empty() && j.contains("id") && j["id"].is_number()) {
            market.market_id = std::to_string(j["id"].get<int64_t>());
        }
        if (market.market_id.empty()) {
            return std::nullopt;
        }

        market.question = question;
        market.baseline_price = *baseline;

        auto prices = read_outcome_prices(j);
        market.yes_price = prices.empty() ? j.value("yes_price", 0.5) : prices.front();
        if (market.yes_price <= 0.0 || market.yes_price >= 1.0) {
            return std::nullopt;
        }

        std::string created = read_string(j, {"createdAt", "created_at", "startDate"});
        std::string expires = read_string(j, {"endDate", "end_date_iso", "endDateIso"});
        if (expires.empty()) {
            return std::nullopt;
        }
        market.expires_at = util::parse_iso8601(expires);
        market.created_at = created.empty() ? market.expires_at - std::chrono::minutes(5)
                                            : util::parse_iso8601(created);

        if (market.is_expired(now) || now - market.created_at > std::chrono::hours(1)) {
            return std::nullopt;
        }
        return market;
    } catch (const std::exception& e) {
        spdlog::warn("Skipping unparseable market entry: {}", e.what());
        return std::nullopt;
    }
}

Settlement PolymarketClient::parse_settlement(const nlohmann::json& j) {
    Settlement settlement;

    bool closed = j.value("closed", false) || j.value("resolved", false);
    if (!closed) {
        settlement.status = SettlementStatus::Pending;
        settlement.detail = "market not yet resolved";
        return settlement;
    }

    auto side_from_label = [](const std::string& label) -> std::optional<MarketSide> {
        auto upper = util::to_upper(label);
        if (upper == "YES" || upper == "UP") return MarketSide::Yes;
        if (upper == "NO" || upper == "DOWN") return MarketSide::No;
        return std::nullopt;
    };

    for (const char* key : {"outcome", "winning_outcome", "winningOutcome"}) {
        if (j.contains(key) && j.at(key).is_string()) {
            if (auto side = side_from_label(j.at(key).get<std::string>())) {
                settlement.status = SettlementStatus::Resolved;
                settlement.winner = *side;
                settlement.detail = key;
                return settlement;
            }
        }
    }

    if (j.contains("tokens") && j["tokens"].is_array()) {
        const auto& tokens = j["tokens"];
        for (std::size_t i = 0; i < tokens.size() && i < 2; ++i) {
            if (tokens[i].value("winner", false) || tokens[i].value("is_winner", false)) {
                settlement.status = SettlementStatus::Resolved;
                settlement.winner = i == 0 ? MarketSide::Yes : MarketSide::No;
                settlement.detail = "token winner flag";
                return settlement;
            }
        }
    }

    auto prices = read_outcome_prices(j);
    if (prices.size() == 2) {
        settlement.detail = "final outcome prices";
        if (prices[0] > 0.9) {
            settlement.status = SettlementStatus::Resolved;
            settlement.winner = MarketSide::Yes;
            return settlement;
        }
        if (prices[1] > 0.9) {
            settlement.status = SettlementStatus::Resolved;
            settlement.winner = MarketSide::No;
            return settlement;
        }
        if (prices[0] == 0.5 && prices[1] == 0.5) {
            settlement.status = SettlementStatus::Resolved;
            settlement.winner = MarketSide::Void;
            return settlement;
        }
    }

    // Closed but the winner is not published yet
    settlement.status = SettlementStatus::Pending;
    settlement.detail = "closed, outcome not determined";
    return settlement;
}
