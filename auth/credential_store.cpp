#include "auth/credential_store.hpp"
#include "logger.hpp"

#include <ctime>

namespace auth
{

std::expected<std::unique_ptr<SqliteCredentialStore>, std::string> SqliteCredentialStore::open(std::string_view db_path)
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
    
    std::unique_ptr<SqliteCredentialStore> store(new SqliteCredentialStore(handle));
    
    sqlite3_exec(handle, "PRAGMA journal_mode=WAL;", nullptr, nullptr, nullptr);
    sqlite3_exec(handle, "PRAGMA synchronous=NORMAL;", nullptr, nullptr, nullptr);
    
    if (!store->init_schema())
    {
        return std::unexpected(std::string("Failed to create principals schema: ") + sqlite3_errmsg(handle));
    }
    return store;
}

SqliteCredentialStore::SqliteCredentialStore(sqlite3* handle)
    : db(handle)
{
}

SqliteCredentialStore::~SqliteCredentialStore()
{
    if (db)
    {
        sqlite3_close(db);
    }
}

bool SqliteCredentialStore::init_schema()
{
    const char* sql = R"(
        CREATE TABLE IF NOT EXISTS principals (
            principal TEXT PRIMARY KEY,
            credential TEXT NOT NULL,
            created_at INTEGER DEFAULT (strftime('%s', 'now')),
            updated_at INTEGER DEFAULT (strftime('%s', 'now')),
            active INTEGER DEFAULT 1
        ) WITHOUT ROWID;
    )";
    
    char* err = nullptr;
    int rc = sqlite3_exec(db, sql, nullptr, nullptr, std::addressof(err));
    if (err)
    {
        LOG_ERROR("principals schema: {}", err);
        sqlite3_free(err);
    }
    return rc == SQLITE_OK;
}

std::expected<std::optional<std::string>, errc> SqliteCredentialStore::find(std::string_view principal)
{
    std::lock_guard<std::mutex> lock(mtx);
    const char* sql = "SELECT credential FROM principals WHERE principal = ? AND active = 1;";
    sqlite3_stmt* stmt = nullptr;
    
    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK)
    {
        LOG_ERROR("Identity lookup prepare failed: {}", sqlite3_errmsg(db));
        return std::unexpected(errc::identity_store_error);
    }
    
    sqlite3_bind_text(stmt, 1, principal.data(), static_cast<int>(principal.size()), SQLITE_STATIC);
    
    std::optional<std::string> result;
    int rc = sqlite3_step(stmt);
    if (rc == SQLITE_ROW)
    {
        const char* val = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 0));
        if (val)
        {
            result = std::string(val);
        }
    }
    sqlite3_finalize(stmt);
    
    if (rc != SQLITE_ROW && rc != SQLITE_DONE)
    {
        LOG_ERROR("Identity lookup failed: {}", sqlite3_errstr(rc));
        return std::unexpected(errc::identity_store_error);
    }
    return result;
}

std::expected<void, errc> SqliteCredentialStore::create(std::string_view principal, std::string_view encoded)
{
    std::lock_guard<std::mutex> lock(mtx);
    const char* sql = "INSERT INTO principals (principal, credential) VALUES (?, ?);";
    sqlite3_stmt* stmt = nullptr;
    
    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK)
    {
        return std::unexpected(errc::identity_store_error);
    }
    
    sqlite3_bind_text(stmt, 1, principal.data(), static_cast<int>(principal.size()), SQLITE_STATIC);
    sqlite3_bind_text(stmt, 2, encoded.data(), static_cast<int>(encoded.size()), SQLITE_STATIC);
    
    int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    
    if ((rc & 0xFF) == SQLITE_CONSTRAINT)
    {
        return std::unexpected(errc::already_exists);
    }
    if (rc != SQLITE_DONE)
    {
        LOG_ERROR("Identity insert failed: {}", sqlite3_errstr(rc));
        return std::unexpected(errc::identity_store_error);
    }
    return {};
}

std::expected<void, errc> SqliteCredentialStore::update(std::string_view principal, std::string_view encoded)
{
    std::lock_guard<std::mutex> lock(mtx);
    const char* sql = "UPDATE principals SET credential = ?, updated_at = ? WHERE principal = ?;";
    sqlite3_stmt* stmt = nullptr;
    
    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK)
    {
        return std::unexpected(errc::identity_store_error);
    }
    
    sqlite3_bind_text(stmt, 1, encoded.data(), static_cast<int>(encoded.size()), SQLITE_STATIC);
    sqlite3_bind_int64(stmt, 2, std::time(nullptr));
    sqlite3_bind_text(stmt, 3, principal.data(), static_cast<int>(principal.size()), SQLITE_STATIC);
    
    int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    
    if (rc != SQLITE_DONE)
    {
        LOG_ERROR("Identity update failed: {}", sqlite3_errstr(rc));
        return std::unexpected(errc::identity_store_error);
    }
    if (sqlite3_changes(db) == 0)
    {
        return std::unexpected(errc::identity_store_error);
    }
    return {};
}

bool SqliteCredentialStore::set_active(std::string_view principal, bool active)
{
    std::lock_guard<std::mutex> lock(mtx);
    const char* sql = "UPDATE principals SET active = ? WHERE principal = ?;";
    sqlite3_stmt* stmt = nullptr;
    
    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK)
    {
        return false;
    }
    
    sqlite3_bind_int(stmt, 1, active ? 1 : 0);
    sqlite3_bind_text(stmt, 2, principal.data(), static_cast<int>(principal.size()), SQLITE_STATIC);
    
    int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    return rc == SQLITE_DONE && sqlite3_changes(db) > 0;
}

std::vector<PrincipalInfo> SqliteCredentialStore::list_principals()
{
    std::lock_guard<std::mutex> lock(mtx);
    const char* sql = "SELECT principal, created_at, updated_at, active FROM principals ORDER BY principal;";
    sqlite3_stmt* stmt = nullptr;
    
    std::vector<PrincipalInfo> out;
    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK)
    {
        return out;
    }
    
    while (sqlite3_step(stmt) == SQLITE_ROW)
    {
        PrincipalInfo info;
        info.principal = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 0));
        info.created_at = sqlite3_column_int64(stmt, 1);
        info.updated_at = sqlite3_column_int64(stmt, 2);
        info.active = sqlite3_column_int(stmt, 3) != 0;
        out.push_back(std::move(info));
    }
    
    sqlite3_finalize(stmt);
    return out;
}

}
