#include "venue.hpp"

std::string to_string(OrderStatus status) {
    switch (status) {
        case OrderStatus::Accepted: return "accepted";
        case OrderStatus::Rejected: return "rejected";
        case OrderStatus::Timeout: return "timeout";
    }
    return "unknown";
}

std::string to_string(SettlementStatus status) {
    switch (status) {
        case SettlementStatus::Resolved: return "resolved";
        case SettlementStatus::Pending: return "pending";
        case SettlementStatus::Unavailable: return "unavailable";
        case SettlementStatus::Unknown: return "unknown_market";
    }
    return "unknown";
}
