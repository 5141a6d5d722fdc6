#include "auth/authenticator.hpp"
#include "crypto/utils.hpp"
#include "logger.hpp"

#include <memory>

namespace auth
{

Authenticator::Authenticator(
    CredentialStore& identities,
    const CredentialHasher& hasher,
    ThreadPool& cpu_pool,
    session::SessionManager& sessions,
    std::chrono::milliseconds hash_timeout,
    AuthMetrics* metrics
)
    : identities(identities)
    , hasher(hasher)
    , cpu_pool(cpu_pool)
    , sessions(sessions)
    , hash_timeout(hash_timeout)
    , metrics(metrics)
{
}

errc Authenticator::pool_failure(errc e)
{
    if (e == errc::hash_capacity)
    {
        bump(metrics, &AuthMetrics::hash_rejected_capacity);
        LOG_WARN("Hash pool saturated ({} in flight), rejecting", cpu_pool.get().in_flight());
    }
    else if (e == errc::hash_timeout)
    {
        bump(metrics, &AuthMetrics::hash_timeouts);
        LOG_WARN("Hash exceeded {} ms, abandoning", hash_timeout.count());
    }
    return e;
}

std::expected<AuthenticationOutcome, errc> Authenticator::verify_on_pool(std::string_view secret, CredentialRecord record)
{
    auto buf = std::make_shared<crypto::SecretBuffer>(secret);
    const CredentialHasher* h = std::addressof(hasher.get());
    
    auto res = cpu_pool.get().run([h, buf, rec = std::move(record)] {
        return h->verify(buf->view(), rec);
    }, hash_timeout);
    
    if (!res)
    {
        return std::unexpected(pool_failure(res.error()));
    }
    bump(metrics, &AuthMetrics::hashes_computed);
    return *res;
}

std::expected<CredentialRecord, errc> Authenticator::hash_on_pool(std::string_view secret)
{
    auto buf = std::make_shared<crypto::SecretBuffer>(secret);
    const CredentialHasher* h = std::addressof(hasher.get());
    
    auto res = cpu_pool.get().run([h, buf] {
        return h->hash(buf->view());
    }, hash_timeout);
    
    if (!res)
    {
        return std::unexpected(pool_failure(res.error()));
    }
    if (!*res)
    {
        return std::unexpected(res->error());
    }
    bump(metrics, &AuthMetrics::hashes_computed);
    return std::move(**res);
}

std::expected<AuthenticationOutcome, errc> Authenticator::check_secret(std::string_view principal, std::string_view secret)
{
    auto encoded = identities.get().find(principal);
    if (!encoded)
    {
        return std::unexpected(encoded.error());
    }
    
    bool known = false;
    CredentialRecord record = hasher.get().dummy_record();
    if (encoded->has_value())
    {
        if (auto decoded = CredentialHasher::decode(**encoded); decoded)
        {
            record = std::move(*decoded);
            known = true;
        }
        else
        {
            LOG_ERROR("Stored credential for {} is malformed", principal);
        }
    }
    
    auto outcome = verify_on_pool(secret, std::move(record));
    if (!outcome)
    {
        return outcome;
    }
    if (!known)
    {
        return AuthenticationOutcome{false, false};
    }
    return outcome;
}

std::expected<void, errc> Authenticator::enroll(std::string_view principal, std::string_view secret)
{
    if (principal.empty() || !acceptable_secret(secret))
    {
        return std::unexpected(errc::invalid_params);
    }
    
    auto rec = hash_on_pool(secret);
    if (!rec)
    {
        return std::unexpected(rec.error());
    }
    
    if (auto r = identities.get().create(principal, CredentialHasher::encode(*rec)); !r)
    {
        return r;
    }
    LOG_INFO("Enrolled {}", principal);
    return {};
}

std::expected<LoginResult, errc> Authenticator::login(
    std::string_view principal,
    std::string_view secret,
    session::attributes_t attributes,
    std::optional<std::string_view> presented_token
)
{
    if (throttle && !throttle(principal))
    {
        bump(metrics, &AuthMetrics::logins_throttled);
        LOG_INFO("Login for {} vetoed by throttle", principal);
        return std::unexpected(errc::rate_exceeded);
    }
    
    auto outcome = check_secret(principal, secret);
    if (!outcome)
    {
        return std::unexpected(outcome.error());
    }
    
    if (!outcome->matched)
    {
        bump(metrics, &AuthMetrics::logins_failed);
        LOG_INFO("Login failed for {}", principal);
        return std::unexpected(errc::credential_mismatch);
    }
    
    bool rehashed = false;
    if (outcome->needs_rehash)
    {
        // best effort: the login already succeeded with the old record
        if (auto rec = hash_on_pool(secret); rec)
        {
            if (auto r = identities.get().update(principal, CredentialHasher::encode(*rec)); r)
            {
                rehashed = true;
                bump(metrics, &AuthMetrics::rehashes);
                LOG_INFO("Upgraded stored credential of {}", principal);
            }
            else
            {
                LOG_WARN("Could not store upgraded credential of {}: {}", principal, to_string(r.error()));
            }
        }
        else
        {
            LOG_WARN("Rehash of {} failed: {}", principal, to_string(rec.error()));
        }
    }
    
    auto token = sessions.get().create(principal, std::move(attributes), presented_token);
    if (!token)
    {
        return std::unexpected(token.error());
    }
    
    bump(metrics, &AuthMetrics::logins_successful);
    return LoginResult{std::move(*token), rehashed};
}

std::expected<void, errc> Authenticator::change_secret(
    std::string_view principal,
    std::string_view current,
    std::string_view replacement,
    std::optional<std::string_view> keep_token
)
{
    auto outcome = check_secret(principal, current);
    if (!outcome)
    {
        return std::unexpected(outcome.error());
    }
    if (!outcome->matched)
    {
        return std::unexpected(errc::credential_mismatch);
    }
    if (!acceptable_secret(replacement))
    {
        return std::unexpected(errc::invalid_params);
    }
    
    auto rec = hash_on_pool(replacement);
    if (!rec)
    {
        return std::unexpected(rec.error());
    }
    if (auto r = identities.get().update(principal, CredentialHasher::encode(*rec)); !r)
    {
        return r;
    }
    
    auto revoked = sessions.get().revoke_all(principal, keep_token);
    if (!revoked)
    {
        return std::unexpected(revoked.error());
    }
    LOG_INFO("Credential of {} changed, {} other session(s) ended", principal, *revoked);
    return {};
}

std::expected<void, errc> Authenticator::logout(std::string_view token)
{
    return sessions.get().revoke(token);
}

}
