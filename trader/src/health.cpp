#include "health.hpp"
#include "util.hpp"
#include <httplib.h>
#include <spdlog/spdlog.h>
#include <atomic>
#include <thread>

class HealthServer::Impl {
public:
    Impl(const Config& config, StatusProvider provider)
        : config_(config), provider_(std::move(provider)), running_(false) {}

    ~Impl() {
        stop();
    }

    void start() {
        if (running_) {
            spdlog::warn("Health server already running");
            return;
        }

        setup_routes();
        running_ = true;
        server_thread_ = std::thread([this]() {
            spdlog::info("Health server listening on {}:{}", config_.health_host, config_.health_port);
            if (!server_.listen(config_.health_host.c_str(), config_.health_port)) {
                spdlog::error("Failed to start health server on {}:{}", config_.health_host, config_.health_port);
            }
        });
    }

    void stop() {
        if (!running_) return;

        running_ = false;
        server_.stop();
        if (server_thread_.joinable()) {
            server_thread_.join();
        }
        spdlog::info("Health server stopped");
    }

    bool is_running() const {
        return running_;
    }

private:
    void setup_routes() {
        server_.Get("/health", [this](const httplib::Request&, httplib::Response& res) {
            nlohmann::json health_status;
            try {
                health_status = provider_ ? provider_() : nlohmann::json::object();
            } catch (const std::exception& e) {
                spdlog::error("Health status provider failed: {}", e.what());
                health_status["status"] = "unhealthy";
                health_status["error"] = e.what();
            }

            health_status["service"] = config_.service_name;
            health_status["timestamp"] = util::current_iso8601();
            if (!health_status.contains("status")) {
                health_status["status"] = "healthy";
            }

            res.status = health_status["status"] == "healthy" ? 200 : 503;
            res.set_content(health_status.dump(2), "application/json");
        });

        server_.Get("/ready", [this](const httplib::Request&, httplib::Response& res) {
            nlohmann::json ready = {{"status", "ready"}, {"service", config_.service_name}};
            res.set_content(ready.dump(), "application/json");
        });
    }

    const Config& config_;
    StatusProvider provider_;
    httplib::Server server_;
    std::atomic<bool> running_;
    std::thread server_thread_;
};

HealthServer::HealthServer(const Config& config, StatusProvider provider)
    : pImpl_(std::make_unique<Impl>(config, std::move(provider))) {}

HealthServer::~HealthServer() = default;

void HealthServer::start() {
    pImpl_->start();
}

void HealthServer::stop() {
    pImpl_->stop();
}

bool HealthServer::is_running() const {
    return pImpl_->is_running();
}
