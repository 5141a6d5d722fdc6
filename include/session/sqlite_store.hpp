#pragma once

#include "session/session_store.hpp"

#include <sqlite3.h>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

namespace session
{

/**
 * Durable backend: one row per token holding the JSON payload, the owning
 * subject (indexed for listing) and the physical expiry in epoch ms.
 * The connection is opened serialized, so one instance may be shared by
 * all request threads. busy_timeout is the backend timeout; hitting it
 * surfaces as store_errc::unavailable.
 */
class SqliteSessionStore final : public SessionStore
{
public:
    using clock_fn = std::function<Clock::time_point()>;

    [[nodiscard]] static std::expected<std::unique_ptr<SqliteSessionStore>, std::string> open(
        std::string_view db_path,
        std::chrono::milliseconds busy_timeout,
        clock_fn clock = [] { return Clock::now(); }
    );
    ~SqliteSessionStore() override;

    SqliteSessionStore(const SqliteSessionStore&) = delete;
    SqliteSessionStore& operator=(const SqliteSessionStore&) = delete;

    [[nodiscard]] std::expected<void, store_errc> put(const SessionRecord& record,
                                                      std::chrono::milliseconds ttl,
                                                      put_mode mode) override;
    [[nodiscard]] std::expected<std::optional<SessionRecord>, store_errc> get(std::string_view token) override;
    [[nodiscard]] std::expected<void, store_errc> remove(std::string_view token) override;
    [[nodiscard]] std::expected<std::vector<SessionRecord>, store_errc> list_by_subject(std::string_view subject_id) override;
    [[nodiscard]] std::expected<void, store_errc> refresh_ttl(std::string_view token,
                                                              std::chrono::milliseconds ttl) override;
    [[nodiscard]] std::expected<size_t, store_errc> sweep() override;

private:
    SqliteSessionStore(sqlite3* db, clock_fn clock);

    [[nodiscard]] bool init_schema();
    [[nodiscard]] store_errc classify(int rc, std::string_view op) const;

    sqlite3* db;
    clock_fn clock;
    // sqlite3_changes() and multi-statement writes need the connection to ourselves
    std::mutex mtx;
};

} // namespace session
