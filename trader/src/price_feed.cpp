#include "price_feed.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>
#include <openssl/err.h>
#include <openssl/ssl.h>
#include <algorithm>
#include <atomic>
#include <mutex>
#include <thread>

namespace asio = boost::asio;
namespace ssl = asio::ssl;
namespace beast = boost::beast;
namespace websocket = beast::websocket;
using tcp = asio::ip::tcp;

namespace {
constexpr auto kReadPoll = std::chrono::milliseconds(250);
constexpr auto kStopPoll = std::chrono::milliseconds(50);
}

class PriceFeed::Impl {
public:
    explicit Impl(const Config& config) : config_(config) {}

    ~Impl() {
        stop();
    }

    void start(TickHandler on_tick) {
        if (running_.exchange(true)) {
            spdlog::warn("Price feed already running");
            return;
        }
        on_tick_ = std::move(on_tick);
        worker_ = std::thread([this]() { connect_loop(); });
    }

    void stop() {
        if (running_.exchange(false)) {
            spdlog::info("Stopping price feed...");
        }
        if (worker_.joinable()) {
            worker_.join();
            spdlog::info("Price feed stopped after {} reconnects", reconnects_.load());
        }
    }

    std::optional<PriceTick> latest() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return latest_;
    }

    bool is_connected() const { return connected_.load(); }
    int reconnect_count() const { return reconnects_.load(); }

private:
    void connect_loop() {
        ssl::context ctx{ssl::context::tls_client};
        ctx.set_default_verify_paths();

        std::string path = "/ws/" + util::to_lower(config_.symbol) + "@trade";
        bool first_attempt = true;

        while (running_) {
            if (!first_attempt) {
                reconnects_++;
            }
            first_attempt = false;

            try {
                asio::io_context ioc;
                tcp::resolver resolver(ioc);
                websocket::stream<ssl::stream<tcp::socket>> ws(ioc, ctx);

                auto const results = resolver.resolve(config_.price_ws_host, config_.price_ws_port);
                asio::connect(ws.next_layer().next_layer(), results.begin(), results.end());

                ws.next_layer().set_verify_mode(ssl::verify_peer);
                if (!SSL_set_tlsext_host_name(ws.next_layer().native_handle(), config_.price_ws_host.c_str())) {
                    throw beast::system_error{beast::error_code(static_cast<int>(::ERR_get_error()),
                                                                asio::error::get_ssl_category())};
                }
                ws.next_layer().handshake(ssl::stream_base::client);
                ws.handshake(config_.price_ws_host, path);

                connected_ = true;
                spdlog::info("Price feed connected to wss://{}:{}{}",
                             config_.price_ws_host, config_.price_ws_port, path);

                read_loop(ioc, ws);
            } catch (const std::exception& e) {
                if (running_) {
                    spdlog::warn("Price feed disconnected: {}. Reconnecting in {}ms",
                                 e.what(), config_.reconnect_delay_ms);
                }
            }
            connected_ = false;

            sleep_while_running(std::chrono::milliseconds(config_.reconnect_delay_ms));
        }
    }

    void read_loop(asio::io_context& ioc, websocket::stream<ssl::stream<tcp::socket>>& ws) {
        beast::flat_buffer buffer;

        while (running_) {
            bool done = false;
            beast::error_code read_ec;
            buffer.clear();

            ws.async_read(buffer, [&](beast::error_code ec, std::size_t) {
                read_ec = ec;
                done = true;
            });

            ioc.restart();
            while (!done && running_) {
                ioc.run_for(kReadPoll);
            }

            if (!done) {
                // Stopping with a read in flight: abort it and drain the handler
                beast::error_code ignored;
                ws.next_layer().next_layer().close(ignored);
                ioc.restart();
                ioc.run();
                return;
            }

            if (read_ec) {
                throw beast::system_error{read_ec};
            }

            handle_message(beast::buffers_to_string(buffer.data()));
        }

        beast::error_code ignored;
        ws.close(websocket::close_code::normal, ignored);
    }

    void handle_message(const std::string& text) {
        auto receipt = Clock::now();
        std::optional<PriceTick> tick;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            // Receipt times never go backwards, even across reconnects
            if (receipt < last_receipt_) {
                receipt = last_receipt_;
            }
            last_receipt_ = receipt;

            tick = parse_trade_message(text, receipt, config_.stale_tick_ms);
            if (!tick) {
                return;
            }
            latest_ = tick;
        }

        if (tick->stale) {
            spdlog::debug("Stale tick: {:.2f} latency {:.0f}ms", tick->price, tick->latency_ms());
        }

        if (on_tick_) {
            try {
                on_tick_(*tick);
            } catch (const std::exception& e) {
                spdlog::error("Tick handler failed: {}", e.what());
            }
        }
    }

    void sleep_while_running(std::chrono::milliseconds delay) {
        auto wake_up_time = std::chrono::steady_clock::now() + delay;
        while (running_ && std::chrono::steady_clock::now() < wake_up_time) {
            std::this_thread::sleep_for(kStopPoll);
        }
    }

    const Config& config_;
    TickHandler on_tick_;

    std::atomic<bool> running_{false};
    std::atomic<bool> connected_{false};
    std::atomic<int> reconnects_{0};
    std::thread worker_;

    mutable std::mutex mutex_;
    std::optional<PriceTick> latest_;
    TimePoint last_receipt_{};
};

PriceFeed::PriceFeed(const Config& config)
    : pImpl_(std::make_unique<Impl>(config)) {}

PriceFeed::~PriceFeed() = default;

void PriceFeed::start(TickHandler on_tick) {
    pImpl_->start(std::move(on_tick));
}

void PriceFeed::stop() {
    pImpl_->stop();
}

std::optional<PriceTick> PriceFeed::latest() const {
    return pImpl_->latest();
}

std::optional<double> PriceFeed::latency_ms() const {
    auto tick = pImpl_->latest();
    if (!tick) {
        return std::nullopt;
    }
    return tick->latency_ms();
}

bool PriceFeed::is_connected() const {
    return pImpl_->is_connected();
}

int PriceFeed::reconnect_count() const {
    return pImpl_->reconnect_count();
}

std::optional<PriceTick> PriceFeed::parse_trade_message(const std::string& text,
                                                        TimePoint receipt_time,
                                                        int stale_ceiling_ms) {
    nlohmann::json message;
    try {
        message = nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
        spdlog::warn("Dropping malformed feed frame: {}", e.what());
        return std::nullopt;
    }

    if (message.is_object() && message.contains("stream") && message.contains("data")) {
        message = message["data"];
    }
    if (!message.is_object() || message.value("e", "") != "trade") {
        return std::nullopt;
    }

    try {
        double price = 0.0;
        const auto& p = message.at("p");
        if (p.is_string()) {
            price = util::safe_parse_double(p.get<std::string>());
        } else {
            price = p.get<double>();
        }
        if (price <= 0.0) {
            spdlog::warn("Dropping trade frame with price {}", price);
            return std::nullopt;
        }

        int64_t trade_time_ms = message.contains("T") ? message["T"].get<int64_t>()
                                                      : message.at("E").get<int64_t>();

        PriceTick tick;
        tick.price = price;
        tick.receipt_time = receipt_time;
        // Exchange clock ahead of ours: treat as zero latency
        tick.source_time = std::min(util::from_epoch_ms(trade_time_ms), receipt_time);
        tick.stale = tick.latency_ms() > stale_ceiling_ms;
        return tick;
    } catch (const nlohmann::json::exception& e) {
        spdlog::warn("Dropping trade frame with bad fields: {}", e.what());
        return std::nullopt;
    }
}
