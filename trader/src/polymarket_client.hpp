#pragma once

#include "config.hpp"
#include "venue.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

// REST client for the prediction-market venue (market listing, orders, settlement)
class PolymarketClient : public Venue {
public:
    explicit PolymarketClient(const Config& config);
    ~PolymarketClient() override;

    std::optional<std::vector<MarketDescriptor>> list_active_markets(const std::string& symbol) override;
    OrderAck submit_order(const OrderRequest& request) override;
    Settlement query_settlement(const std::string& market_id) override;
    AuthStatus check_credentials() override;

    // Maps one market listing entry; nullopt when it is not a live short-window market for the symbol
    static std::optional<MarketDescriptor> parse_market(const nlohmann::json& j,
                                                        const std::string& symbol,
                                                        TimePoint now);

    // Reads the winning side out of a market detail payload
    static Settlement parse_settlement(const nlohmann::json& j);

    // Non-copyable
    PolymarketClient(const PolymarketClient&) = delete;
    PolymarketClient& operator=(const PolymarketClient&) = delete;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl_;
};
