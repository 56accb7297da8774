#include "trade_store.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <sqlite3.h>
#include <algorithm>
#include <map>
#include <mutex>
#include <stdexcept>

namespace {
const char* kOpenEvent = "OPEN";
const char* kResolveEvent = "RESOLVE";
}

class TradeStore::Impl {
public:
    Impl(const Config& config) : db_path_(config.db_path), db_(nullptr) {
        if (!initialize()) {
            if (db_) {
                sqlite3_close(db_);
                db_ = nullptr;
            }
            throw std::runtime_error("Failed to initialize trade store at " + db_path_);
        }
    }

    ~Impl() {
        if (db_) {
            sqlite3_close(db_);
        }
    }

    bool initialize() {
        int rc = sqlite3_open(db_path_.c_str(), &db_);
        if (rc != SQLITE_OK) {
            spdlog::error("Cannot open database: {}", sqlite3_errmsg(db_));
            return false;
        }

        // WAL keeps readers off the writer's back; FULL sync makes each commit durable
        if (!exec("PRAGMA journal_mode=WAL") || !exec("PRAGMA synchronous=FULL")) {
            return false;
        }

        if (!create_tables()) {
            return false;
        }

        spdlog::info("Trade store initialized at: {}", db_path_);
        return true;
    }

    bool append_event(const Trade& trade, const char* kind, bool must_be_new) {
        std::lock_guard<std::mutex> lock(db_mutex_);

        const char* sql =
            "INSERT OR IGNORE INTO trade_events (trade_id, kind, paper, payload, recorded_at) "
            "VALUES (?, ?, ?, ?, ?)";
        sqlite3_stmt* stmt;

        if (!exec("BEGIN IMMEDIATE")) {
            return false;
        }

        if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            spdlog::error("Failed to prepare statement: {}", sqlite3_errmsg(db_));
            exec("ROLLBACK");
            return false;
        }

        std::string payload = trade.to_json().dump();
        std::string recorded_at = util::current_iso8601();
        sqlite3_bind_text(stmt, 1, trade.id.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 2, kind, -1, SQLITE_STATIC);
        sqlite3_bind_int(stmt, 3, trade.paper ? 1 : 0);
        sqlite3_bind_text(stmt, 4, payload.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 5, recorded_at.c_str(), -1, SQLITE_TRANSIENT);

        int rc = sqlite3_step(stmt);
        sqlite3_finalize(stmt);

        if (rc != SQLITE_DONE) {
            spdlog::error("Failed to append {} event for {}: {}", kind, trade.id, sqlite3_errmsg(db_));
            exec("ROLLBACK");
            return false;
        }

        if (sqlite3_changes(db_) == 0) {
            if (must_be_new) {
                spdlog::error("{} event for {} already recorded, trade id reused", kind, trade.id);
                exec("ROLLBACK");
                return false;
            }
            spdlog::debug("{} event for {} already recorded", kind, trade.id);
        }

        return exec("COMMIT");
    }

    LoadResult load(bool paper) {
        std::lock_guard<std::mutex> lock(db_mutex_);
        LoadResult result;

        struct RawEvent {
            int64_t seq;
            std::string trade_id;
            std::string kind;
            std::string payload;
        };
        std::vector<RawEvent> events;

        const char* sql =
            "SELECT seq, trade_id, kind, payload FROM trade_events WHERE paper = ? ORDER BY seq";
        sqlite3_stmt* stmt;

        if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            spdlog::error("Failed to prepare statement: {}", sqlite3_errmsg(db_));
            return result;
        }

        sqlite3_bind_int(stmt, 1, paper ? 1 : 0);
        while (sqlite3_step(stmt) == SQLITE_ROW) {
            RawEvent event;
            event.seq = sqlite3_column_int64(stmt, 0);
            auto id = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 1));
            auto kind = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 2));
            auto payload = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 3));
            event.trade_id = id ? id : "";
            event.kind = kind ? kind : "";
            event.payload = payload ? payload : "";
            events.push_back(std::move(event));
        }
        sqlite3_finalize(stmt);

        // Latest readable event wins per trade id
        std::map<std::string, Trade> trades;
        for (const auto& event : events) {
            std::optional<Trade> trade;
            auto j = nlohmann::json::parse(event.payload, nullptr, false);
            if (!j.is_discarded()) {
                trade = Trade::from_json(j);
            }

            std::string reason;
            if (!trade) {
                reason = "unreadable payload";
            } else if (trade->id != event.trade_id) {
                reason = "payload id does not match row";
            } else if (event.kind == kResolveEvent && trade->status != TradeStatus::Resolved) {
                reason = "resolve event without resolution";
            }

            if (!reason.empty()) {
                spdlog::warn("Quarantining trade event #{} ({} {}): {}",
                             event.seq, event.kind, event.trade_id, reason);
                quarantine(event.seq, reason);
                result.quarantined++;
                continue;
            }

            auto existing = trades.find(trade->id);
            if (existing != trades.end() && existing->second.status == TradeStatus::Resolved) {
                continue;
            }
            trades[trade->id] = *trade;
        }

        for (auto& [id, trade] : trades) {
            if (trade.status == TradeStatus::Resolved) {
                result.resolved.push_back(std::move(trade));
            } else {
                result.pending.push_back(std::move(trade));
            }
        }

        // Oldest first so replay into the brain follows resolution order
        std::sort(result.resolved.begin(), result.resolved.end(), [](const Trade& a, const Trade& b) {
            return a.resolved_at.value_or(a.opened_at) < b.resolved_at.value_or(b.opened_at);
        });
        std::sort(result.pending.begin(), result.pending.end(), [](const Trade& a, const Trade& b) {
            return a.opened_at < b.opened_at;
        });

        spdlog::info("Loaded {} {} trades from store: {} pending, {} resolved, {} quarantined",
                     trades.size(), paper ? "paper" : "live",
                     result.pending.size(), result.resolved.size(), result.quarantined);
        return result;
    }

    int highest_trade_sequence(const std::string& prefix) {
        std::lock_guard<std::mutex> lock(db_mutex_);

        // Quarantined rows still own their ids
        const char* sql =
            "SELECT MAX(CAST(substr(trade_id, ?1 + 1) AS INTEGER)) FROM ("
            "  SELECT trade_id FROM trade_events WHERE substr(trade_id, 1, ?1) = ?2"
            "  UNION"
            "  SELECT trade_id FROM quarantined_events WHERE substr(trade_id, 1, ?1) = ?2"
            ")";
        sqlite3_stmt* stmt;

        if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            spdlog::error("Failed to prepare statement: {}", sqlite3_errmsg(db_));
            return 0;
        }

        sqlite3_bind_int(stmt, 1, static_cast<int>(prefix.size()));
        sqlite3_bind_text(stmt, 2, prefix.c_str(), -1, SQLITE_TRANSIENT);

        int highest = 0;
        if (sqlite3_step(stmt) == SQLITE_ROW && sqlite3_column_type(stmt, 0) != SQLITE_NULL) {
            highest = sqlite3_column_int(stmt, 0);
        }
        sqlite3_finalize(stmt);
        return highest;
    }

    bool record_summary(const std::string& run_id, const nlohmann::json& summary) {
        std::lock_guard<std::mutex> lock(db_mutex_);

        const char* sql = "INSERT INTO run_summaries (run_id, payload, recorded_at) VALUES (?, ?, ?)";
        sqlite3_stmt* stmt;

        if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            spdlog::error("Failed to prepare statement: {}", sqlite3_errmsg(db_));
            return false;
        }

        std::string payload = summary.dump();
        std::string recorded_at = util::current_iso8601();
        sqlite3_bind_text(stmt, 1, run_id.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 2, payload.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 3, recorded_at.c_str(), -1, SQLITE_TRANSIENT);

        int rc = sqlite3_step(stmt);
        sqlite3_finalize(stmt);

        if (rc != SQLITE_DONE) {
            spdlog::error("Failed to insert run summary: {}", sqlite3_errmsg(db_));
            return false;
        }
        return true;
    }

    std::optional<nlohmann::json> latest_summary() {
        std::lock_guard<std::mutex> lock(db_mutex_);

        const char* sql = "SELECT payload FROM run_summaries ORDER BY id DESC LIMIT 1";
        sqlite3_stmt* stmt;

        if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            spdlog::error("Failed to prepare statement: {}", sqlite3_errmsg(db_));
            return std::nullopt;
        }

        std::optional<nlohmann::json> summary;
        if (sqlite3_step(stmt) == SQLITE_ROW) {
            auto text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 0));
            auto j = nlohmann::json::parse(text ? text : "", nullptr, false);
            if (!j.is_discarded()) {
                summary = j;
            }
        }
        sqlite3_finalize(stmt);
        return summary;
    }

    bool flush() {
        std::lock_guard<std::mutex> lock(db_mutex_);
        return exec("PRAGMA wal_checkpoint(TRUNCATE)");
    }

    bool is_healthy() const {
        std::lock_guard<std::mutex> lock(db_mutex_);

        if (!db_) {
            return false;
        }

        const char* sql = "SELECT 1 FROM trade_events LIMIT 1";
        sqlite3_stmt* stmt;

        if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            return false;
        }

        int rc = sqlite3_step(stmt);
        sqlite3_finalize(stmt);

        return rc == SQLITE_ROW || rc == SQLITE_DONE;
    }

private:
    bool exec(const char* sql) {
        char* err_msg = nullptr;
        if (sqlite3_exec(db_, sql, nullptr, nullptr, &err_msg) != SQLITE_OK) {
            spdlog::error("SQL '{}' failed: {}", sql, err_msg ? err_msg : "unknown error");
            sqlite3_free(err_msg);
            return false;
        }
        return true;
    }

    // Moves one event out of the live log; caller holds db_mutex_
    void quarantine(int64_t seq, const std::string& reason) {
        if (!exec("BEGIN IMMEDIATE")) {
            return;
        }

        const char* copy_sql =
            "INSERT INTO quarantined_events (seq, trade_id, kind, payload, reason, quarantined_at) "
            "SELECT seq, trade_id, kind, payload, ?, ? FROM trade_events WHERE seq = ?";
        const char* delete_sql = "DELETE FROM trade_events WHERE seq = ?";

        std::string now = util::current_iso8601();
        sqlite3_stmt* stmt;
        bool ok = sqlite3_prepare_v2(db_, copy_sql, -1, &stmt, nullptr) == SQLITE_OK;
        if (ok) {
            sqlite3_bind_text(stmt, 1, reason.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_text(stmt, 2, now.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_int64(stmt, 3, seq);
            ok = sqlite3_step(stmt) == SQLITE_DONE;
            sqlite3_finalize(stmt);
        }

        if (ok && sqlite3_prepare_v2(db_, delete_sql, -1, &stmt, nullptr) == SQLITE_OK) {
            sqlite3_bind_int64(stmt, 1, seq);
            ok = sqlite3_step(stmt) == SQLITE_DONE;
            sqlite3_finalize(stmt);
        } else {
            ok = false;
        }

        if (!ok) {
            spdlog::error("Failed to quarantine event #{}: {}", seq, sqlite3_errmsg(db_));
            exec("ROLLBACK");
            return;
        }
        exec("COMMIT");
    }

    bool create_tables() {
        const char* create_trade_events = R"(
            CREATE TABLE IF NOT EXISTS trade_events (
                seq INTEGER PRIMARY KEY AUTOINCREMENT,
                trade_id TEXT NOT NULL,
                kind TEXT NOT NULL,
                paper INTEGER NOT NULL,
                payload TEXT NOT NULL,
                recorded_at TEXT NOT NULL,
                UNIQUE(trade_id, kind)
            )
        )";

        const char* create_quarantine = R"(
            CREATE TABLE IF NOT EXISTS quarantined_events (
                seq INTEGER PRIMARY KEY,
                trade_id TEXT,
                kind TEXT,
                payload TEXT,
                reason TEXT NOT NULL,
                quarantined_at TEXT NOT NULL
            )
        )";

        const char* create_run_summaries = R"(
            CREATE TABLE IF NOT EXISTS run_summaries (
                id INTEGER PRIMARY KEY AUTOINCREMENT,
                run_id TEXT NOT NULL,
                payload TEXT NOT NULL,
                recorded_at TEXT NOT NULL
            )
        )";

        const char* create_indices = R"(
            CREATE INDEX IF NOT EXISTS idx_trade_events_trade_id ON trade_events(trade_id);
            CREATE INDEX IF NOT EXISTS idx_run_summaries_run_id ON run_summaries(run_id);
        )";

        return exec(create_trade_events) &&
               exec(create_quarantine) &&
               exec(create_run_summaries) &&
               exec(create_indices);
    }

    std::string db_path_;
    sqlite3* db_;
    mutable std::mutex db_mutex_;
};

// Public interface implementation
TradeStore::TradeStore(const Config& config)
    : pImpl_(std::make_unique<Impl>(config)) {}

TradeStore::~TradeStore() = default;

bool TradeStore::record_open(const Trade& trade) {
    return pImpl_->append_event(trade, kOpenEvent, true);
}

bool TradeStore::record_resolution(const Trade& trade) {
    return pImpl_->append_event(trade, kResolveEvent, false);
}

TradeStore::LoadResult TradeStore::load(bool paper) {
    return pImpl_->load(paper);
}

int TradeStore::highest_trade_sequence(const std::string& prefix) {
    return pImpl_->highest_trade_sequence(prefix);
}

bool TradeStore::record_summary(const std::string& run_id, const nlohmann::json& summary) {
    return pImpl_->record_summary(run_id, summary);
}

std::optional<nlohmann::json> TradeStore::latest_summary() {
    return pImpl_->latest_summary();
}

bool TradeStore::flush() {
    return pImpl_->flush();
}

bool TradeStore::is_healthy() const {
    return pImpl_->is_healthy();
}
