#pragma once

#include "types.hpp"
#include <optional>
#include <string>
#include <vector>

struct OrderRequest {
    std::string client_order_id;
    std::string market_id;
    Direction direction = Direction::Yes;
    double size_usd = 0.0;
    double limit_price = 0.0;
};

enum class OrderStatus { Accepted, Rejected, Timeout };

struct OrderAck {
    OrderStatus status = OrderStatus::Rejected;
    std::string order_id;
    double fill_price = 0.0;
    std::string cause;
};

// Unavailable is transient (timeouts, 5xx, backoff); Unknown means the
// venue has no such market and never will
enum class SettlementStatus { Resolved, Pending, Unavailable, Unknown };

struct Settlement {
    SettlementStatus status = SettlementStatus::Unavailable;
    MarketSide winner = MarketSide::Void;
    std::string detail;
};

enum class AuthStatus { Ok, Unauthorized, Unreachable };

std::string to_string(OrderStatus status);
std::string to_string(SettlementStatus status);

// Order and query surface of a prediction-market venue
class Venue {
public:
    virtual ~Venue() = default;

    // Active short-duration markets for the symbol; nullopt when the venue could not be read
    virtual std::optional<std::vector<MarketDescriptor>> list_active_markets(const std::string& symbol) = 0;

    virtual OrderAck submit_order(const OrderRequest& request) = 0;

    virtual Settlement query_settlement(const std::string& market_id) = 0;

    virtual AuthStatus check_credentials() = 0;
};
