#pragma once

#include "auth/credential_hasher.hpp"
#include "guard/request_guard.hpp"
#include "session/session_manager.hpp"

#include <boost/json.hpp>
#include <string>
#include <expected>
#include <cstdint>
#include <chrono>

namespace json = boost::json;

/**
 * Authentication core configuration loaded from JSON file.
 * Load-once at startup, immutable thereafter.
 */
class Config
{
public:
    struct HashingCfg
    {
        auth::algorithm alg = auth::algorithm::argon2id;
        auth::CostParams params{};
        size_t max_concurrent_ops = 4;
        size_t max_queued_ops = 64;
        std::chrono::milliseconds timeout{5000};
    };

    struct SessionCfg
    {
        std::chrono::seconds idle_timeout{1800};
        std::chrono::seconds max_lifetime{43200};
        size_t token_entropy_bits = 256;
        std::string cookie_name = "__Host-sid";
        bool bind_fingerprint = false;
    };

    enum class Backend : uint8_t
    {
        Memory,
        Sqlite,
    };

    struct StoreCfg
    {
        Backend backend = Backend::Memory;
        std::string path = "sessions.db";
        std::chrono::milliseconds busy_timeout{2000};
    };

    struct IdentityCfg
    {
        std::string path = "users.db";
    };

    struct LoggingCfg
    {
        std::string level = "info";
        std::string file = "";
        size_t max_size_mb = 100;
        bool enable_console = true;
    };

    [[nodiscard]] static std::expected<Config, std::string> load(const std::string& filepath);
    [[nodiscard]] static Config load_defaults();
    [[nodiscard]] static Config load_or_defaults(const std::string& filepath);

    [[nodiscard]] const HashingCfg& hashing() const { return hash; }
    [[nodiscard]] const SessionCfg& session() const { return sess; }
    [[nodiscard]] const StoreCfg& store() const { return st; }
    [[nodiscard]] const IdentityCfg& identity() const { return id; }
    [[nodiscard]] const LoggingCfg& logging() const { return log; }

    // Views in the shapes the components take
    [[nodiscard]] auth::CredentialHasher::Target hash_target() const { return {hash.alg, hash.params}; }
    [[nodiscard]] session::SessionPolicy session_policy() const;
    [[nodiscard]] guard::GuardOptions guard_options() const;

private:
    HashingCfg hash;
    SessionCfg sess;
    StoreCfg st;
    IdentityCfg id;
    LoggingCfg log;

    [[nodiscard]] static std::expected<Config, std::string> parse(const json::value& jv);
};
