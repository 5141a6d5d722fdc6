#pragma once

#include "auth/credential_hasher.hpp"
#include "auth/credential_store.hpp"
#include "logger/metrics.hpp"
#include "session/session_manager.hpp"
#include "threadpool/threadpool.hpp"

#include <chrono>
#include <expected>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace auth
{

// Consulted before any expensive hash; returning false vetoes the attempt.
using ThrottleCheck = std::function<bool(std::string_view principal)>;

struct LoginResult
{
    std::string token;
    bool rehashed;
};

/**
 * Login flow: throttle veto, credential verification on the hash pool,
 * opportunistic rehash, then a fresh session replacing whatever token the
 * client presented. Unknown principals are verified against the hasher's
 * dummy record so they cost the same and fail the same way.
 *
 * The hasher must outlive the pool: jobs abandoned on timeout still use it.
 */
class Authenticator
{
public:
    Authenticator(
        CredentialStore& identities,
        const CredentialHasher& hasher,
        ThreadPool& cpu_pool,
        session::SessionManager& sessions,
        std::chrono::milliseconds hash_timeout,
        AuthMetrics* metrics = nullptr
    );
    
    void set_throttle(ThrottleCheck check) { throttle = std::move(check); }
    
    [[nodiscard]] std::expected<void, errc> enroll(std::string_view principal, std::string_view secret);
    
    [[nodiscard]] std::expected<LoginResult, errc> login(
        std::string_view principal,
        std::string_view secret,
        session::attributes_t attributes = {},
        std::optional<std::string_view> presented_token = std::nullopt
    );
    
    // Replaces the credential and ends every other session of the principal.
    [[nodiscard]] std::expected<void, errc> change_secret(
        std::string_view principal,
        std::string_view current,
        std::string_view replacement,
        std::optional<std::string_view> keep_token = std::nullopt
    );
    
    [[nodiscard]] std::expected<void, errc> logout(std::string_view token);

private:
    // matched == false for unknown principals
    [[nodiscard]] std::expected<AuthenticationOutcome, errc> check_secret(std::string_view principal, std::string_view secret);
    [[nodiscard]] std::expected<AuthenticationOutcome, errc> verify_on_pool(std::string_view secret, CredentialRecord record);
    [[nodiscard]] std::expected<CredentialRecord, errc> hash_on_pool(std::string_view secret);
    [[nodiscard]] errc pool_failure(errc e);
    
    std::reference_wrapper<CredentialStore> identities;
    std::reference_wrapper<const CredentialHasher> hasher;
    std::reference_wrapper<ThreadPool> cpu_pool;
    std::reference_wrapper<session::SessionManager> sessions;
    std::chrono::milliseconds hash_timeout;
    AuthMetrics* metrics;
    ThrottleCheck throttle;
};

}
