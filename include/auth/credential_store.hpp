#pragma once

#include "auth/errc.hpp"

#include <sqlite3.h>
#include <cstdint>
#include <expected>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace auth
{

// Identity store seam: principal -> encoded credential record.
class CredentialStore
{
public:
    virtual ~CredentialStore() = default;

    [[nodiscard]] virtual std::expected<std::optional<std::string>, errc> find(std::string_view principal) = 0;
    // already_exists if the principal is taken
    [[nodiscard]] virtual std::expected<void, errc> create(std::string_view principal, std::string_view encoded) = 0;
    // identity_store_error if the principal is unknown
    [[nodiscard]] virtual std::expected<void, errc> update(std::string_view principal, std::string_view encoded) = 0;
};

struct PrincipalInfo
{
    std::string principal;
    int64_t created_at;
    int64_t updated_at;
    bool active;
};

class SqliteCredentialStore final : public CredentialStore
{
public:
    [[nodiscard]] static std::expected<std::unique_ptr<SqliteCredentialStore>, std::string> open(std::string_view db_path);
    ~SqliteCredentialStore() override;

    SqliteCredentialStore(const SqliteCredentialStore&) = delete;
    SqliteCredentialStore& operator=(const SqliteCredentialStore&) = delete;

    [[nodiscard]] std::expected<std::optional<std::string>, errc> find(std::string_view principal) override;
    [[nodiscard]] std::expected<void, errc> create(std::string_view principal, std::string_view encoded) override;
    [[nodiscard]] std::expected<void, errc> update(std::string_view principal, std::string_view encoded) override;

    [[nodiscard]] bool set_active(std::string_view principal, bool active);
    [[nodiscard]] std::vector<PrincipalInfo> list_principals();

private:
    explicit SqliteCredentialStore(sqlite3* db);

    [[nodiscard]] bool init_schema();

    sqlite3* db;
    std::mutex mtx;
};

} // namespace auth
