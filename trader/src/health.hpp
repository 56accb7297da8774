#pragma once

#include "config.hpp"
#include <functional>
#include <memory>
#include <nlohmann/json.hpp>

// Serves GET /health and /ready. The status provider reports component
// state; a "status" other than "healthy" answers 503.
class HealthServer {
public:
    using StatusProvider = std::function<nlohmann::json()>;

    HealthServer(const Config& config, StatusProvider provider);
    ~HealthServer();

    void start();
    void stop();
    bool is_running() const;

    HealthServer(const HealthServer&) = delete;
    HealthServer& operator=(const HealthServer&) = delete;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl_;
};
