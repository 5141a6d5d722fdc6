#include "auth/authenticator.hpp"
#include "auth/credential_store.hpp"
#include "auth/credential_hasher.hpp"
#include "config.hpp"
#include "crypto/utils.hpp"
#include "guard/request_guard.hpp"
#include "logger.hpp"
#include "logger/metrics.hpp"
#include "session/session_manager.hpp"
#include "session/session_codec.hpp"
#include "session/store_factory.hpp"
#include "threadpool/threadpool.hpp"

#include <memory>
#include <optional>
#include <print>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace
{

void print_usage(const char* prog)
{
    std::println("Usage: {} [--config <file>] <command> [args]", prog);
    std::println("Commands:");
    std::println("  add <principal> <secret>          Enroll principal");
    std::println("  passwd <principal> <old> <new>    Change secret, end other sessions");
    std::println("  list                              List principals");
    std::println("  disable <principal>               Deactivate principal");
    std::println("  enable <principal>                Reactivate principal");
    std::println("  login <principal> <secret>        Authenticate and print a session cookie");
    std::println("  check <token>                     Validate a session token");
    std::println("  sessions <principal>              List live sessions");
    std::println("  revoke <token>                    End one session");
    std::println("  revoke-all <principal>            End every session of a principal");
    std::println("  sweep                             Reclaim expired session rows");
}

struct Core
{
    Config cfg;
    AuthMetrics metrics;
    std::unique_ptr<auth::SqliteCredentialStore> identities;
    std::unique_ptr<session::SessionStore> store;
    std::optional<auth::CredentialHasher> hasher;
    std::optional<session::SessionManager> sessions;
};

int cmd_add(auth::Authenticator& authn, std::string_view principal, std::string_view secret)
{
    if (!auth::acceptable_secret(secret))
    {
        std::println(stderr, "Secret too short (min 8 chars)");
        return 1;
    }
    if (auto r = authn.enroll(principal, secret); !r)
    {
        std::println(stderr, "Failed to enroll '{}': {}", principal, auth::to_string(r.error()));
        return 1;
    }
    std::println("Principal '{}' enrolled", principal);
    return 0;
}

int cmd_passwd(auth::Authenticator& authn, std::string_view principal, std::string_view old_secret, std::string_view new_secret)
{
    if (auto r = authn.change_secret(principal, old_secret, new_secret); !r)
    {
        std::println(stderr, "Failed to change secret: {}", auth::to_string(r.error()));
        return 1;
    }
    std::println("Secret changed for '{}'", principal);
    return 0;
}

int cmd_list(auth::SqliteCredentialStore& ids)
{
    auto principals = ids.list_principals();
    if (principals.empty())
    {
        std::println("No principals found");
        return 0;
    }
    
    std::println("{:<24} {:<10} {}", "Principal", "Status", "Updated");
    std::println("{}", std::string(50, '-'));
    for (const auto& p : principals)
    {
        std::println("{:<24} {:<10} {}", p.principal, p.active ? "active" : "disabled", p.updated_at);
    }
    return 0;
}

int cmd_set_active(auth::SqliteCredentialStore& ids, std::string_view principal, bool active)
{
    if (ids.set_active(principal, active))
    {
        std::println("Principal '{}' {}", principal, active ? "enabled" : "disabled");
        return 0;
    }
    std::println(stderr, "Principal '{}' not found", principal);
    return 1;
}

int cmd_login(auth::Authenticator& authn, guard::RequestGuard& guard, std::string_view principal, std::string_view secret)
{
    auto res = authn.login(principal, secret);
    if (!res)
    {
        // same message for unknown principal and wrong secret
        std::println(stderr, "Invalid credentials");
        return 1;
    }
    std::println("Set-Cookie: {}", guard.set_cookie(res->token));
    if (res->rehashed)
    {
        std::println("(stored credential upgraded to current parameters)");
    }
    return 0;
}

int cmd_check(guard::RequestGuard& guard, std::string_view token)
{
    auto id = guard.admit(guard::Request{.bearer_token = token});
    if (!id)
    {
        std::println(stderr, "Rejected");
        return 1;
    }
    std::println("Subject: {}", id->subject_id);
    for (const auto& [k, v] : id->attributes)
    {
        std::println("  {} = {}", k, v);
    }
    return 0;
}

int cmd_sessions(session::SessionManager& sessions, std::string_view principal)
{
    auto list = sessions.list(principal);
    if (!list)
    {
        std::println(stderr, "Failed to list sessions: {}", auth::to_string(list.error()));
        return 1;
    }
    if (list->empty())
    {
        std::println("No live sessions for '{}'", principal);
        return 0;
    }
    std::println("{:<12} {:<16} {:<16} {}", "Token", "Created", "Last active", "Expires");
    for (const auto& rec : *list)
    {
        std::println("{:<12} {:<16} {:<16} {}", crypto::redact(rec.token),
                     session::codec::to_millis(rec.created_at) / 1000,
                     session::codec::to_millis(rec.last_active_at) / 1000,
                     session::codec::to_millis(rec.absolute_expires_at) / 1000);
    }
    return 0;
}

int cmd_revoke(session::SessionManager& sessions, std::string_view token)
{
    if (auto r = sessions.revoke(token); !r)
    {
        std::println(stderr, "Failed to revoke: {}", auth::to_string(r.error()));
        return 1;
    }
    std::println("Revoked");
    return 0;
}

int cmd_revoke_all(session::SessionManager& sessions, std::string_view principal)
{
    auto n = sessions.revoke_all(principal);
    if (!n)
    {
        std::println(stderr, "Failed to revoke sessions: {}", auth::to_string(n.error()));
        return 1;
    }
    std::println("Revoked {} session(s) of '{}'", *n, principal);
    return 0;
}

int cmd_sweep(session::SessionStore& store)
{
    auto n = store.sweep();
    if (!n)
    {
        std::println(stderr, "Sweep failed: {}", session::to_string(n.error()));
        return 1;
    }
    std::println("Reclaimed {} expired session(s)", *n);
    return 0;
}

} // namespace

int main(int argc, char** argv)
{
    std::vector<std::string_view> args(argv + 1, argv + argc);
    std::string config_path = "turnstile.json";
    if (args.size() >= 2 && args[0] == "--config")
    {
        config_path = std::string(args[1]);
        args.erase(args.begin(), args.begin() + 2);
    }
    if (args.empty())
    {
        print_usage(argv[0]);
        return 1;
    }
    
    auto cfg_res = Config::load(config_path);
    if (!cfg_res)
    {
        std::println(stderr, "Using defaults: {}", cfg_res.error());
    }
    Core core{.cfg = cfg_res ? *cfg_res : Config::load_defaults()};
    
    const auto& log_cfg = core.cfg.logging();
    if (auto r = Logger::init(log_cfg.level, log_cfg.file, log_cfg.max_size_mb, log_cfg.enable_console); !r)
    {
        std::println(stderr, "Failed to initialize logger: {}", r.error());
        return 1;
    }
    
    auto ids = auth::SqliteCredentialStore::open(core.cfg.identity().path);
    if (!ids)
    {
        std::println(stderr, "Failed to open {}: {}", core.cfg.identity().path, ids.error());
        return 1;
    }
    core.identities = std::move(*ids);
    
    auto store = session::make_session_store(core.cfg.store());
    if (!store)
    {
        std::println(stderr, "Failed to open session store: {}", store.error());
        return 1;
    }
    core.store = std::move(*store);
    
    auto hasher = auth::CredentialHasher::create(core.cfg.hash_target());
    if (!hasher)
    {
        std::println(stderr, "Hasher unavailable: {}", auth::to_string(hasher.error()));
        return 1;
    }
    core.hasher.emplace(std::move(*hasher));
    
    auto sessions = session::SessionManager::make(*core.store, core.cfg.session_policy(),
                                                  crypto::system_random(), &core.metrics);
    if (!sessions)
    {
        std::println(stderr, "Session manager: {}", sessions.error());
        return 1;
    }
    core.sessions.emplace(std::move(*sessions));
    
    int rc = 1;
    {
        // pool goes first so no job outlives the hasher
        ThreadPool pool(core.cfg.hashing().max_concurrent_ops, core.cfg.hashing().max_queued_ops);
        auth::Authenticator authn(*core.identities, *core.hasher, pool, *core.sessions,
                                  core.cfg.hashing().timeout, &core.metrics);
        guard::RequestGuard guard(*core.sessions, core.cfg.guard_options());
        
        const auto& cmd = args[0];
        const size_t n = args.size();
        
        if (cmd == "add" && n == 3)
        {
            rc = cmd_add(authn, args[1], args[2]);
        }
        else if (cmd == "passwd" && n == 4)
        {
            rc = cmd_passwd(authn, args[1], args[2], args[3]);
        }
        else if (cmd == "list" && n == 1)
        {
            rc = cmd_list(*core.identities);
        }
        else if (cmd == "disable" && n == 2)
        {
            rc = cmd_set_active(*core.identities, args[1], false);
        }
        else if (cmd == "enable" && n == 2)
        {
            rc = cmd_set_active(*core.identities, args[1], true);
        }
        else if (cmd == "login" && n == 3)
        {
            rc = cmd_login(authn, guard, args[1], args[2]);
        }
        else if (cmd == "check" && n == 2)
        {
            rc = cmd_check(guard, args[1]);
        }
        else if (cmd == "sessions" && n == 2)
        {
            rc = cmd_sessions(*core.sessions, args[1]);
        }
        else if (cmd == "revoke" && n == 2)
        {
            rc = cmd_revoke(*core.sessions, args[1]);
        }
        else if (cmd == "revoke-all" && n == 2)
        {
            rc = cmd_revoke_all(*core.sessions, args[1]);
        }
        else if (cmd == "sweep" && n == 1)
        {
            rc = cmd_sweep(*core.store);
        }
        else
        {
            print_usage(argv[0]);
        }
    }
    
    LOG_DEBUG("{}", core.metrics);
    Logger::shutdown();
    return rc;
}
