#pragma once

#include "errors.hpp"

#include <expected>
#include <functional>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <sqlite3.h>
#include <string>

// Job state documents keyed by request id, each with its own expiry. Keys
// follow the stt:job:{request_id} convention.
class JobStore {
public:
    using Clock = std::function<double()>; // seconds since epoch

    JobStore();
    explicit JobStore(Clock clock);
    ~JobStore();

    JobStore(const JobStore&) = delete;
    JobStore& operator=(const JobStore&) = delete;

    // ":memory:" opens a private in-memory store.
    std::expected<void, Error> open(const std::string& path);
    void close();

    std::expected<void, Error> set_state(const std::string& request_id,
                                         const nlohmann::json& state, uint32_t ttl_s);

    // Expired rows are deleted and reported as absent.
    std::expected<std::optional<nlohmann::json>, Error> get_state(const std::string& request_id);

    bool exists(const std::string& request_id);
    bool remove(const std::string& request_id);
    bool ping();
    int purge_expired();

    static std::string key_for(const std::string& request_id);

private:
    bool create_tables();
    Error storage_error(const char* what) const;

    Clock clock_;
    std::mutex mutex_;
    sqlite3* db_ = nullptr;
    sqlite3_stmt* upsert_stmt_ = nullptr;
    sqlite3_stmt* select_stmt_ = nullptr;
    sqlite3_stmt* delete_stmt_ = nullptr;
};
