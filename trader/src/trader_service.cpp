#include "trader_service.hpp"
#include "execution_engine.hpp"
#include "paper_trader.hpp"
#include "polymarket_client.hpp"
#include "redis_alert_sink.hpp"
#include "telegram_alert_sink.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace {
constexpr auto kTickPollTimeout = std::chrono::milliseconds(200);

std::shared_ptr<FanoutAlertSink> build_alert_fanout(const Config& config) {
    auto fanout = std::make_shared<FanoutAlertSink>();
    fanout->add(std::make_unique<LogAlertSink>());

    if (!config.telegram_bot_token.empty() && !config.telegram_chat_id.empty()) {
        fanout->add(std::make_unique<TelegramAlertSink>(config));
        spdlog::info("Telegram alerts enabled for chat {}", config.telegram_chat_id);
    }
    if (!config.redis_url.empty()) {
        fanout->add(std::make_unique<RedisAlertSink>(config));
        spdlog::info("Redis alerts enabled on stream {}", config.alert_stream);
    }
    return fanout;
}
}

TraderService::TraderService(const Config& config)
    : TraderService(config,
                    std::make_unique<PolymarketClient>(config),
                    std::make_unique<TradeStore>(config)) {}

TraderService::TraderService(const Config& config,
                             std::unique_ptr<Venue> venue,
                             std::unique_ptr<TradeStore> store,
                             LatencySource latency_source)
    : config_(config),
      run_id_(util::generate_uuid()),
      venue_(std::move(venue)),
      store_(std::move(store)),
      async_alerts_(std::make_shared<AsyncAlertSink>(build_alert_fanout(config))),
      alerts_(std::make_shared<ThrottledAlertSink>(async_alerts_,
                                                   std::chrono::seconds(config.alert_interval_sec))),
      brain_(config),
      catalog_(config, *venue_),
      detector_(config),
      feed_(config),
      channel_(static_cast<std::size_t>(config.tick_queue_capacity)),
      latency_source_(std::move(latency_source)),
      last_summary_(std::chrono::steady_clock::now()) {

    LatencySource source = latency_source_;
    if (!source) {
        source = [this]() { return feed_latency(); };
    }

    if (config_.is_live()) {
        auto engine = std::make_unique<ExecutionEngine>(config_, *venue_, brain_, store_.get(),
                                                        alerts_.get(), source);
        live_ = engine.get();
        executor_ = std::move(engine);
    } else {
        oracle_ = make_settlement_oracle(config_, *venue_);
        auto paper = std::make_unique<PaperTrader>(config_, *oracle_, brain_, store_.get(),
                                                   alerts_.get(), source);
        paper_ = paper.get();
        executor_ = std::move(paper);
    }

    brain_.set_transition_listener([this](const TierTransition& transition, const SurvivalState& state) {
        notify(alerts::kSurvival,
               fmt::format("Tier {} -> {} after {}: min edge {:.2f}%, kelly x{:.2f}, "
                           "win rate {:.0f}%, streak W{}/L{}",
                           to_string(transition.from), to_string(transition.to), transition.trade_id,
                           state.edge_threshold, state.kelly_multiplier, state.win_rate() * 100.0,
                           state.consecutive_wins, state.consecutive_losses),
               true);
    });

    health_ = std::make_unique<HealthServer>(config_, [this]() { return status(); });

    spdlog::info("Trader service initialised: mode={} executor={} run={}",
                 to_string(config_.mode), executor_->name(), run_id_);
}

TraderService::~TraderService() {
    stop();
    shutdown();
}

void TraderService::run() {
    running_ = true;
    startup();
    // Only a successful startup has anything to tear down or report
    started_ = true;

    health_->start();
    feed_.start([this](const PriceTick& tick) { channel_.push(tick); });
    resolver_thread_ = std::thread([this]() { resolver_loop(); });

    notify(alerts::kSystem,
           fmt::format("{} started in {} mode: capital ${:.2f}, {} open positions, tier {}",
                       config_.service_name, to_string(config_.mode), executor_->available_capital(),
                       executor_->open_positions(), to_string(brain_.tier())),
           true);

    decision_loop();
    shutdown();
}

void TraderService::stop() {
    if (running_.exchange(false)) {
        spdlog::info("Stopping trader service...");
        channel_.close();
        std::lock_guard<std::mutex> lock(resolver_mutex_);
        resolver_cv_.notify_all();
    }
}

void TraderService::startup() {
    if (config_.is_live()) {
        switch (venue_->check_credentials()) {
            case AuthStatus::Unauthorized:
                throw std::runtime_error("Venue rejected POLYMARKET_API_KEY");
            case AuthStatus::Unreachable:
                spdlog::warn("Venue unreachable during credential check; continuing");
                break;
            case AuthStatus::Ok:
                spdlog::info("Venue credentials accepted");
                break;
        }
    }

    auto resolved = executor_->recover();

    std::vector<OutcomeRecord> outcomes;
    for (const auto& trade : resolved) {
        if (!trade.outcome || !trade.pnl || *trade.outcome == Outcome::Push) {
            continue;
        }
        outcomes.push_back(outcome_record(trade));
    }
    brain_.restore(outcomes);

    if (auto previous = store_->latest_summary()) {
        previous_run_ = *previous;
        spdlog::info("Previous run summary: {}", previous_run_.dump());
    }

    auto state = brain_.snapshot();
    spdlog::info("Startup complete: {} outcomes replayed, tier {}, min edge {:.2f}%, kelly x{:.2f}",
                 outcomes.size(), to_string(state.tier), state.edge_threshold, state.kelly_multiplier);
}

void TraderService::decision_loop() {
    spdlog::info("Decision loop started for {}", config_.symbol);
    auto budget = std::chrono::milliseconds(config_.decision_budget_ms);

    while (running_) {
        auto tick = channel_.pop(kTickPollTimeout);
        if (!tick) {
            continue;
        }

        if (Clock::now() - tick->receipt_time > budget) {
            ticks_dropped_++;
            spdlog::debug("Dropping tick older than {}ms", config_.decision_budget_ms);
            continue;
        }

        try {
            process_tick(*tick);
        } catch (const std::exception& e) {
            spdlog::error("Error processing tick: {}", e.what());
        }
    }
    spdlog::info("Decision loop finished");
}

void TraderService::process_tick(const PriceTick& tick) {
    ticks_processed_++;
    auto now = Clock::now();

    auto markets = catalog_.active_markets();
    if (markets.empty()) {
        return;
    }

    auto signals = detector_.scan(tick, markets, brain_.edge_threshold(), now);
    for (const auto& signal : signals) {
        auto approval = brain_.approve(signal, executor_->open_positions());
        if (!approval.approved) {
            spdlog::debug("Signal on {} ({:+.2f}%) not approved: {}",
                          signal.market_id, signal.edge_pct, approval.reason);
            continue;
        }

        auto result = executor_->submit(signal, approval.size_fraction);
        if (result.filled()) {
            trades_opened_++;
        } else if (result.status == SubmitStatus::LatencyBreach) {
            // Same feed for every market in this pass
            break;
        }
    }
}

void TraderService::resolver_loop() {
    spdlog::info("Resolver started, interval {}s", config_.resolve_interval_sec);
    std::unique_lock<std::mutex> lock(resolver_mutex_);

    while (running_) {
        resolver_cv_.wait_for(lock, std::chrono::seconds(config_.resolve_interval_sec),
                              [this]() { return !running_; });
        if (!running_) {
            break;
        }

        lock.unlock();
        try {
            resolve_cycle(Clock::now());
        } catch (const std::exception& e) {
            spdlog::error("Error in resolver cycle: {}", e.what());
        }
        lock.lock();
    }
    spdlog::info("Resolver finished");
}

void TraderService::resolve_cycle(TimePoint now) {
    auto resolved = executor_->resolve_due(now);
    if (!resolved.empty()) {
        spdlog::info("Resolved {} trades, {} still open, capital ${:.2f}",
                     resolved.size(), executor_->open_positions(), executor_->available_capital());
    }

    auto since_summary = std::chrono::steady_clock::now() - last_summary_;
    if (since_summary >= std::chrono::seconds(config_.summary_interval_sec)) {
        write_summary();
    }
}

void TraderService::shutdown() {
    if (!started_.load() || shut_down_.exchange(true)) {
        return;
    }

    feed_.stop();
    channel_.close();
    {
        std::lock_guard<std::mutex> lock(resolver_mutex_);
        resolver_cv_.notify_all();
    }
    if (resolver_thread_.joinable()) {
        resolver_thread_.join();
    }

    write_summary();
    if (!store_->flush()) {
        spdlog::warn("Trade store flush failed during shutdown");
    }

    notify(alerts::kSystem,
           fmt::format("{} stopped: {} ticks processed, {} dropped, {} trades opened, {} still open",
                       config_.service_name, ticks_processed_.load(), ticks_dropped_.load(),
                       trades_opened_.load(), executor_->open_positions()),
           true);

    health_->stop();
    async_alerts_->stop();
    spdlog::info("Trader service shut down");
}

void TraderService::write_summary() {
    last_summary_ = std::chrono::steady_clock::now();

    if (paper_) {
        paper_->write_summary(run_id_);
        return;
    }

    auto report = summary();
    if (!store_->record_summary(run_id_, report)) {
        spdlog::error("Failed to persist run summary for {}", run_id_);
    }
    notify(alerts::kDailySummary,
           fmt::format("Live summary: capital ${:.2f}, {} open, tier {}, avg execution {:.1f}ms, "
                       "{} breaker trips",
                       report["available_capital"].get<double>(), report["open_positions"].get<int>(),
                       report["survival"]["tier"].get<std::string>(),
                       report["avg_execution_ms"].get<double>(), report["breaker_trips"].get<int>()));
}

nlohmann::json TraderService::summary() const {
    nlohmann::json report;
    if (paper_) {
        report = paper_->summary();
    } else {
        nlohmann::json journey = nlohmann::json::array();
        for (const auto& transition : brain_.transitions()) {
            journey.push_back(transition.to_json());
        }
        report = {
            {"generated_at", util::current_iso8601()},
            {"starting_capital", config_.initial_capital},
            {"available_capital", executor_->available_capital()},
            {"open_positions", executor_->open_positions()},
            {"avg_execution_ms", live_ ? live_->avg_execution_ms() : 0.0},
            {"breaker_trips", live_ ? live_->breaker_trips() : 0},
            {"survival", brain_.snapshot().to_json()},
            {"tier_transitions", journey}
        };
    }
    report["mode"] = to_string(config_.mode);
    report["run_id"] = run_id_;
    report["ticks_processed"] = ticks_processed_.load();
    report["ticks_dropped"] = ticks_dropped_.load();
    return report;
}

nlohmann::json TraderService::status() const {
    bool store_ok = store_->is_healthy();
    auto latency = feed_latency();

    nlohmann::json feed = {
        {"connected", feed_.is_connected()},
        {"reconnects", feed_.reconnect_count()},
        {"ticks_dropped", ticks_dropped_.load()},
        {"queue_dropped", channel_.dropped()}
    };
    feed["latency_ms"] = latency ? nlohmann::json(*latency) : nlohmann::json(nullptr);

    return {
        {"status", store_ok ? "healthy" : "unhealthy"},
        {"mode", to_string(config_.mode)},
        {"tier", to_string(brain_.tier())},
        {"open_positions", executor_->open_positions()},
        {"available_capital", executor_->available_capital()},
        {"previous_run", previous_run_},
        {"components", {
            {"trade_store", store_ok ? "healthy" : "unhealthy"},
            {"price_feed", feed},
            {"market_catalog", catalog_.last_refresh_failed() ? "stale" : "fresh"}
        }}
    };
}

std::optional<double> TraderService::feed_latency() const {
    if (!feed_.is_connected()) {
        return std::nullopt;
    }
    auto tick = feed_.latest();
    if (!tick) {
        return std::nullopt;
    }
    // A silent feed is as bad as a slow one
    auto since_receipt = std::chrono::duration<double, std::milli>(Clock::now() - tick->receipt_time).count();
    if (since_receipt > config_.stale_tick_ms) {
        return std::nullopt;
    }
    return tick->latency_ms();
}

void TraderService::notify(const std::string& category, const std::string& text, bool force) {
    Alert alert;
    alert.category = category;
    alert.text = text;
    alert.force = force;
    alerts_->send(alert);
}
