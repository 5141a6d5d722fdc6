#include "session/sqlite_store.hpp"
#include "session/session_codec.hpp"
#include "crypto/utils.hpp"
#include "logger.hpp"

namespace session
{

namespace
{

struct stmt_deleter
{
    void operator()(sqlite3_stmt* s) const { sqlite3_finalize(s); }
};

using stmt_ptr = std::unique_ptr<sqlite3_stmt, stmt_deleter>;

stmt_ptr prepare(sqlite3* db, const char* sql, int& rc)
{
    sqlite3_stmt* raw = nullptr;
    rc = sqlite3_prepare_v2(db, sql, -1, &raw, nullptr);
    return stmt_ptr(raw);
}

void bind_text(sqlite3_stmt* stmt, int idx, std::string_view text)
{
    sqlite3_bind_text(stmt, idx, text.data(), static_cast<int>(text.size()), SQLITE_TRANSIENT);
}

} // namespace

std::expected<std::unique_ptr<SqliteSessionStore>, std::string> SqliteSessionStore::open(
    std::string_view db_path,
    std::chrono::milliseconds busy_timeout,
    clock_fn clock)
{
    sqlite3* handle = nullptr;
    int rc = sqlite3_open_v2(std::string(db_path).c_str(), &handle,
                             SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX,
                             nullptr);
    if (rc != SQLITE_OK)
    {
        std::string err = handle ? sqlite3_errmsg(handle) : sqlite3_errstr(rc);
        sqlite3_close(handle);
        return std::unexpected(err);
    }

    std::unique_ptr<SqliteSessionStore> store(new SqliteSessionStore(handle, std::move(clock)));

    sqlite3_busy_timeout(handle, static_cast<int>(busy_timeout.count()));
    sqlite3_exec(handle, "PRAGMA journal_mode=WAL;", nullptr, nullptr, nullptr);
    sqlite3_exec(handle, "PRAGMA synchronous=NORMAL;", nullptr, nullptr, nullptr);

    if (!store->init_schema())
    {
        return std::unexpected(std::string("Failed to create sessions schema: ") + sqlite3_errmsg(handle));
    }
    return store;
}

SqliteSessionStore::SqliteSessionStore(sqlite3* handle, clock_fn clock)
    : db(handle)
    , clock(std::move(clock))
{
}

SqliteSessionStore::~SqliteSessionStore()
{
    if (db)
    {
        sqlite3_close(db);
    }
}

bool SqliteSessionStore::init_schema()
{
    const char* sql = R"(
        CREATE TABLE IF NOT EXISTS sessions (
            token TEXT PRIMARY KEY,
            subject_id TEXT NOT NULL,
            payload TEXT NOT NULL,
            last_active_at INTEGER NOT NULL,
            expires_at INTEGER NOT NULL
        ) WITHOUT ROWID;

        CREATE INDEX IF NOT EXISTS idx_sessions_subject ON sessions(subject_id);
        CREATE INDEX IF NOT EXISTS idx_sessions_expires ON sessions(expires_at);
    )";

    char* err = nullptr;
    int rc = sqlite3_exec(db, sql, nullptr, nullptr, std::addressof(err));
    if (err)
    {
        LOG_ERROR("sessions schema: {}", err);
        sqlite3_free(err);
    }
    return rc == SQLITE_OK;
}

store_errc SqliteSessionStore::classify(int rc, std::string_view op) const
{
    LOG_ERROR("Session store {} failed: {} ({})", op, sqlite3_errstr(rc), sqlite3_errmsg(db));
    return store_errc::unavailable;
}

std::expected<void, store_errc> SqliteSessionStore::put(const SessionRecord& record,
                                                        std::chrono::milliseconds ttl,
                                                        put_mode mode)
{
    std::lock_guard<std::mutex> lock(mtx);
    const int64_t now = codec::to_millis(clock());
    const int64_t expires = now + ttl.count();
    const int64_t last_active = codec::to_millis(record.last_active_at);
    const std::string payload = codec::encode(record);
    int rc = SQLITE_OK;

    if (mode == put_mode::create)
    {
        // a physically expired row with the same key may linger until swept
        auto purge = prepare(db, "DELETE FROM sessions WHERE token = ? AND expires_at < ?;", rc);
        if (rc != SQLITE_OK)
        {
            return std::unexpected(classify(rc, "put"));
        }
        bind_text(purge.get(), 1, record.token);
        sqlite3_bind_int64(purge.get(), 2, now);
        if (rc = sqlite3_step(purge.get()); rc != SQLITE_DONE)
        {
            return std::unexpected(classify(rc, "put"));
        }

        auto stmt = prepare(db, "INSERT INTO sessions (token, subject_id, payload, last_active_at, expires_at) VALUES (?, ?, ?, ?, ?);", rc);
        if (rc != SQLITE_OK)
        {
            return std::unexpected(classify(rc, "put"));
        }
        bind_text(stmt.get(), 1, record.token);
        bind_text(stmt.get(), 2, record.subject_id);
        bind_text(stmt.get(), 3, payload);
        sqlite3_bind_int64(stmt.get(), 4, last_active);
        sqlite3_bind_int64(stmt.get(), 5, expires);

        rc = sqlite3_step(stmt.get());
        if ((rc & 0xFF) == SQLITE_CONSTRAINT)
        {
            return std::unexpected(store_errc::already_exists);
        }
        if (rc != SQLITE_DONE)
        {
            return std::unexpected(classify(rc, "put"));
        }
        return {};
    }

    const char* sql = mode == put_mode::renew
        ? "UPDATE sessions SET subject_id = ?, payload = ?, last_active_at = ?, expires_at = ? "
          "WHERE token = ? AND expires_at >= ? AND last_active_at <= ?;"
        : "UPDATE sessions SET subject_id = ?, payload = ?, last_active_at = ?, expires_at = ? "
          "WHERE token = ? AND expires_at >= ?;";
    auto stmt = prepare(db, sql, rc);
    if (rc != SQLITE_OK)
    {
        return std::unexpected(classify(rc, "put"));
    }
    bind_text(stmt.get(), 1, record.subject_id);
    bind_text(stmt.get(), 2, payload);
    sqlite3_bind_int64(stmt.get(), 3, last_active);
    sqlite3_bind_int64(stmt.get(), 4, expires);
    bind_text(stmt.get(), 5, record.token);
    sqlite3_bind_int64(stmt.get(), 6, now);
    if (mode == put_mode::renew)
    {
        sqlite3_bind_int64(stmt.get(), 7, last_active);
    }

    if (rc = sqlite3_step(stmt.get()); rc != SQLITE_DONE)
    {
        return std::unexpected(classify(rc, "put"));
    }
    if (sqlite3_changes(db) != 0)
    {
        return {};
    }
    if (mode != put_mode::renew)
    {
        return std::unexpected(store_errc::not_found);
    }

    // Nothing changed: either the token is gone or a later renewal already landed.
    auto exists = prepare(db, "SELECT 1 FROM sessions WHERE token = ? AND expires_at >= ?;", rc);
    if (rc != SQLITE_OK)
    {
        return std::unexpected(classify(rc, "put"));
    }
    bind_text(exists.get(), 1, record.token);
    sqlite3_bind_int64(exists.get(), 2, now);
    rc = sqlite3_step(exists.get());
    if (rc == SQLITE_ROW)
    {
        return {};
    }
    if (rc != SQLITE_DONE)
    {
        return std::unexpected(classify(rc, "put"));
    }
    return std::unexpected(store_errc::not_found);
}

std::expected<std::optional<SessionRecord>, store_errc> SqliteSessionStore::get(std::string_view token)
{
    std::lock_guard<std::mutex> lock(mtx);
    int rc = SQLITE_OK;
    auto stmt = prepare(db, "SELECT payload FROM sessions WHERE token = ? AND expires_at >= ?;", rc);
    if (rc != SQLITE_OK)
    {
        return std::unexpected(classify(rc, "get"));
    }
    bind_text(stmt.get(), 1, token);
    sqlite3_bind_int64(stmt.get(), 2, codec::to_millis(clock()));

    rc = sqlite3_step(stmt.get());
    if (rc == SQLITE_DONE)
    {
        return std::optional<SessionRecord>{};
    }
    if (rc != SQLITE_ROW)
    {
        return std::unexpected(classify(rc, "get"));
    }

    const auto* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt.get(), 0));
    const int len = sqlite3_column_bytes(stmt.get(), 0);
    auto rec = codec::decode(std::string_view(text ? text : "", text ? static_cast<size_t>(len) : 0));
    if (!rec)
    {
        LOG_ERROR("Session {} has a corrupt payload", crypto::redact(token));
        return std::unexpected(rec.error());
    }
    if (rec->token != token)
    {
        LOG_ERROR("Session {} payload names a different token", crypto::redact(token));
        return std::unexpected(store_errc::corrupt_payload);
    }
    return std::optional<SessionRecord>{std::move(*rec)};
}

std::expected<void, store_errc> SqliteSessionStore::remove(std::string_view token)
{
    std::lock_guard<std::mutex> lock(mtx);
    int rc = SQLITE_OK;
    auto stmt = prepare(db, "DELETE FROM sessions WHERE token = ?;", rc);
    if (rc != SQLITE_OK)
    {
        return std::unexpected(classify(rc, "remove"));
    }
    bind_text(stmt.get(), 1, token);
    if (rc = sqlite3_step(stmt.get()); rc != SQLITE_DONE)
    {
        return std::unexpected(classify(rc, "remove"));
    }
    return {};
}

std::expected<std::vector<SessionRecord>, store_errc> SqliteSessionStore::list_by_subject(std::string_view subject_id)
{
    std::lock_guard<std::mutex> lock(mtx);
    int rc = SQLITE_OK;
    auto stmt = prepare(db, "SELECT payload FROM sessions WHERE subject_id = ? AND expires_at >= ?;", rc);
    if (rc != SQLITE_OK)
    {
        return std::unexpected(classify(rc, "list"));
    }
    bind_text(stmt.get(), 1, subject_id);
    sqlite3_bind_int64(stmt.get(), 2, codec::to_millis(clock()));

    std::vector<SessionRecord> out;
    while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW)
    {
        const auto* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt.get(), 0));
        const int len = sqlite3_column_bytes(stmt.get(), 0);
        auto rec = codec::decode(std::string_view(text ? text : "", text ? static_cast<size_t>(len) : 0));
        if (!rec)
        {
            // skip the row, keep the listing usable for revoke_all
            LOG_ERROR("Skipping corrupt session payload for subject {}", subject_id);
            continue;
        }
        out.push_back(std::move(*rec));
    }
    if (rc != SQLITE_DONE)
    {
        return std::unexpected(classify(rc, "list"));
    }
    return out;
}

std::expected<void, store_errc> SqliteSessionStore::refresh_ttl(std::string_view token, std::chrono::milliseconds ttl)
{
    std::lock_guard<std::mutex> lock(mtx);
    const int64_t now = codec::to_millis(clock());
    int rc = SQLITE_OK;
    auto stmt = prepare(db, "UPDATE sessions SET expires_at = ? WHERE token = ? AND expires_at >= ?;", rc);
    if (rc != SQLITE_OK)
    {
        return std::unexpected(classify(rc, "refresh_ttl"));
    }
    sqlite3_bind_int64(stmt.get(), 1, now + ttl.count());
    bind_text(stmt.get(), 2, token);
    sqlite3_bind_int64(stmt.get(), 3, now);

    if (rc = sqlite3_step(stmt.get()); rc != SQLITE_DONE)
    {
        return std::unexpected(classify(rc, "refresh_ttl"));
    }
    if (sqlite3_changes(db) == 0)
    {
        return std::unexpected(store_errc::not_found);
    }
    return {};
}

std::expected<size_t, store_errc> SqliteSessionStore::sweep()
{
    std::lock_guard<std::mutex> lock(mtx);
    int rc = SQLITE_OK;
    auto stmt = prepare(db, "DELETE FROM sessions WHERE expires_at < ?;", rc);
    if (rc != SQLITE_OK)
    {
        return std::unexpected(classify(rc, "sweep"));
    }
    sqlite3_bind_int64(stmt.get(), 1, codec::to_millis(clock()));
    if (rc = sqlite3_step(stmt.get()); rc != SQLITE_DONE)
    {
        return std::unexpected(classify(rc, "sweep"));
    }
    return static_cast<size_t>(sqlite3_changes(db));
}

} // namespace session
