#include "storage/job_store.hpp"

#include "logging.hpp"

#include <chrono>
#include <filesystem>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

double system_now() {
    return std::chrono::duration<double>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

} // namespace

JobStore::JobStore() : JobStore(system_now) {}

JobStore::JobStore(Clock clock) : clock_(std::move(clock)) {}

JobStore::~JobStore() {
    close();
}

std::string JobStore::key_for(const std::string& request_id) {
    return "stt:job:" + request_id;
}

std::expected<void, Error> JobStore::open(const std::string& path) {
    std::lock_guard lock(mutex_);

    if (path != ":memory:") {
        fs::path p(path);
        std::error_code ec;
        if (p.has_parent_path()) fs::create_directories(p.parent_path(), ec);
    }

    int rc = sqlite3_open_v2(path.c_str(), &db_,
                             SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX,
                             nullptr);
    if (rc != SQLITE_OK) {
        auto err = storage_error("open");
        sqlite3_close(db_);
        db_ = nullptr;
        return std::unexpected(err);
    }

    sqlite3_exec(db_, "PRAGMA journal_mode=WAL;", nullptr, nullptr, nullptr);
    sqlite3_busy_timeout(db_, 5000);

    if (!create_tables()) return std::unexpected(storage_error("create table"));

    const char* upsert_sql =
        "INSERT INTO jobs (key, state, expires_at) VALUES (?, ?, ?) "
        "ON CONFLICT(key) DO UPDATE SET state = excluded.state, expires_at = excluded.expires_at";
    const char* select_sql = "SELECT state, expires_at FROM jobs WHERE key = ?";
    const char* delete_sql = "DELETE FROM jobs WHERE key = ?";

    if (sqlite3_prepare_v2(db_, upsert_sql, -1, &upsert_stmt_, nullptr) != SQLITE_OK ||
        sqlite3_prepare_v2(db_, select_sql, -1, &select_stmt_, nullptr) != SQLITE_OK ||
        sqlite3_prepare_v2(db_, delete_sql, -1, &delete_stmt_, nullptr) != SQLITE_OK) {
        return std::unexpected(storage_error("prepare"));
    }

    logging::info("Job store opened at {}", path);
    return {};
}

void JobStore::close() {
    std::lock_guard lock(mutex_);
    if (upsert_stmt_) { sqlite3_finalize(upsert_stmt_); upsert_stmt_ = nullptr; }
    if (select_stmt_) { sqlite3_finalize(select_stmt_); select_stmt_ = nullptr; }
    if (delete_stmt_) { sqlite3_finalize(delete_stmt_); delete_stmt_ = nullptr; }
    if (db_) { sqlite3_close(db_); db_ = nullptr; }
}

Error JobStore::storage_error(const char* what) const {
    return Error{ErrorKind::Storage,
                 std::string("job store ") + what + " failed: " +
                     (db_ ? sqlite3_errmsg(db_) : "database not open")};
}

std::expected<void, Error> JobStore::set_state(const std::string& request_id,
                                               const json& state, uint32_t ttl_s) {
    std::lock_guard lock(mutex_);
    if (!upsert_stmt_) return std::unexpected(storage_error("set"));

    auto key = key_for(request_id);
    auto doc = state.dump(-1, ' ', false, json::error_handler_t::replace);

    sqlite3_reset(upsert_stmt_);
    sqlite3_bind_text(upsert_stmt_, 1, key.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(upsert_stmt_, 2, doc.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_double(upsert_stmt_, 3, clock_() + ttl_s);

    if (sqlite3_step(upsert_stmt_) != SQLITE_DONE) {
        auto err = storage_error("set");
        logging::error("{}", err.message);
        return std::unexpected(err);
    }
    return {};
}

std::expected<std::optional<json>, Error> JobStore::get_state(const std::string& request_id) {
    std::lock_guard lock(mutex_);
    if (!select_stmt_) return std::unexpected(storage_error("get"));

    auto key = key_for(request_id);
    sqlite3_reset(select_stmt_);
    sqlite3_bind_text(select_stmt_, 1, key.c_str(), -1, SQLITE_TRANSIENT);

    int rc = sqlite3_step(select_stmt_);
    if (rc == SQLITE_DONE) return std::nullopt;
    if (rc != SQLITE_ROW) return std::unexpected(storage_error("get"));

    auto* text = sqlite3_column_text(select_stmt_, 0);
    std::string doc = text ? reinterpret_cast<const char*>(text) : "";
    double expires_at = sqlite3_column_double(select_stmt_, 1);
    sqlite3_reset(select_stmt_);

    if (expires_at <= clock_()) {
        sqlite3_reset(delete_stmt_);
        sqlite3_bind_text(delete_stmt_, 1, key.c_str(), -1, SQLITE_TRANSIENT);
        if (sqlite3_step(delete_stmt_) != SQLITE_DONE) {
            logging::warn("{}", storage_error("expire").message);
        }
        return std::nullopt;
    }

    try {
        return std::optional<json>(std::in_place, json::parse(doc));
    } catch (const json::exception& e) {
        return std::unexpected(Error{ErrorKind::Storage,
            "corrupt job state for " + request_id + ": " + e.what()});
    }
}

bool JobStore::exists(const std::string& request_id) {
    auto state = get_state(request_id);
    return state && state->has_value();
}

bool JobStore::remove(const std::string& request_id) {
    std::lock_guard lock(mutex_);
    if (!delete_stmt_) return false;

    auto key = key_for(request_id);
    sqlite3_reset(delete_stmt_);
    sqlite3_bind_text(delete_stmt_, 1, key.c_str(), -1, SQLITE_TRANSIENT);
    if (sqlite3_step(delete_stmt_) != SQLITE_DONE) return false;
    return sqlite3_changes(db_) > 0;
}

bool JobStore::ping() {
    std::lock_guard lock(mutex_);
    if (!db_) return false;
    return sqlite3_exec(db_, "SELECT 1", nullptr, nullptr, nullptr) == SQLITE_OK;
}

int JobStore::purge_expired() {
    std::lock_guard lock(mutex_);
    if (!db_) return 0;

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, "DELETE FROM jobs WHERE expires_at <= ?", -1, &stmt, nullptr) != SQLITE_OK) {
        logging::warn("{}", storage_error("purge").message);
        return 0;
    }
    sqlite3_bind_double(stmt, 1, clock_());
    int removed = sqlite3_step(stmt) == SQLITE_DONE ? sqlite3_changes(db_) : 0;
    sqlite3_finalize(stmt);
    if (removed > 0) logging::debug("Purged {} expired jobs", removed);
    return removed;
}

bool JobStore::create_tables() {
    const char* sql = R"(
        CREATE TABLE IF NOT EXISTS jobs (
            key TEXT PRIMARY KEY,
            state TEXT NOT NULL,
            expires_at REAL NOT NULL
        );
    )";

    char* err = nullptr;
    int rc = sqlite3_exec(db_, sql, nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        logging::error("job store: create table failed: {}", err ? err : "unknown");
        sqlite3_free(err);
        return false;
    }
    return true;
}
