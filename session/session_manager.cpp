#include "session/session_manager.hpp"
#include "crypto/utils.hpp"
#include "logger.hpp"

#include <algorithm>
#include <format>

namespace session
{

namespace
{

constexpr size_t min_entropy_bits = 128;
constexpr int token_attempts = 4;
// physical ttl outlives the logical bounds so expiry is observed, not just absence
constexpr std::chrono::milliseconds reclaim_grace{60'000};

Clock::time_point normalize(Clock::time_point tp)
{
    // the durable backend keeps millisecond precision
    return std::chrono::floor<std::chrono::milliseconds>(tp);
}

} // namespace

std::expected<SessionManager, std::string> SessionManager::make(
    SessionStore& store,
    SessionPolicy policy,
    crypto::RandomSource& rng,
    AuthMetrics* metrics)
{
    if (policy.token_entropy_bits < min_entropy_bits || policy.token_entropy_bits % 8 != 0)
    {
        return std::unexpected(std::format("token_entropy_bits must be a multiple of 8 and at least {}", min_entropy_bits));
    }
    if (policy.idle_timeout <= std::chrono::seconds::zero() || policy.max_lifetime <= std::chrono::seconds::zero())
    {
        return std::unexpected("idle_timeout and max_lifetime must be positive");
    }
    if (policy.max_lifetime < policy.idle_timeout)
    {
        return std::unexpected("max_lifetime must not be shorter than idle_timeout");
    }
    return SessionManager(store, policy, rng, metrics);
}

SessionManager::SessionManager(SessionStore& store, SessionPolicy policy, crypto::RandomSource& rng, AuthMetrics* metrics)
    : store(store)
    , pol(policy)
    , rng(rng)
    , metrics(metrics)
{
}

std::expected<std::string, auth::errc> SessionManager::generate_token() const
{
    std::vector<uint8_t> raw(pol.token_entropy_bits / 8);
    if (auto r = rng.get().fill(raw); !r)
    {
        return std::unexpected(r.error());
    }
    auto token = crypto::b64_encode(raw, crypto::b64_variant::urlsafe_nopad);
    crypto::secure_clear(raw);
    return token;
}

bool SessionManager::is_dead(const SessionRecord& rec, Clock::time_point now) const
{
    return now - rec.last_active_at > pol.idle_timeout || now > rec.absolute_expires_at;
}

std::chrono::milliseconds SessionManager::ttl_for(const SessionRecord& rec, Clock::time_point now) const
{
    auto to_ceiling = std::chrono::duration_cast<std::chrono::milliseconds>(rec.absolute_expires_at - now);
    auto idle = std::chrono::duration_cast<std::chrono::milliseconds>(pol.idle_timeout);
    return std::max(std::chrono::milliseconds::zero(), std::min(idle, to_ceiling)) + reclaim_grace;
}

auth::errc SessionManager::store_failure(store_errc e, std::string_view op)
{
    switch (e)
    {
        case store_errc::not_found:
            return auth::errc::session_not_found;
        case store_errc::already_exists:
            return auth::errc::already_exists;
        case store_errc::corrupt_payload:
            bump(metrics, &AuthMetrics::store_errors);
            LOG_ERROR("Session store returned a corrupt record during {}", op);
            return auth::errc::session_not_found;
        case store_errc::unavailable:
            break;
    }
    bump(metrics, &AuthMetrics::store_errors);
    LOG_ERROR("Session store unavailable during {}", op);
    return auth::errc::store_unavailable;
}

std::expected<std::string, auth::errc> SessionManager::insert_fresh(SessionRecord rec, Clock::time_point now)
{
    for (int attempt = 0; attempt < token_attempts; ++attempt)
    {
        auto token = generate_token();
        if (!token)
        {
            return std::unexpected(token.error());
        }
        rec.token = std::move(*token);

        auto put = store.get().put(rec, ttl_for(rec, now), put_mode::create);
        if (put)
        {
            return rec.token;
        }
        if (put.error() != store_errc::already_exists)
        {
            return std::unexpected(store_failure(put.error(), "create"));
        }
        LOG_WARN("Token collision on insert, drawing again");
    }
    LOG_ERROR("Could not obtain an unused session token after {} attempts", token_attempts);
    return std::unexpected(auth::errc::weak_random_source);
}

std::expected<std::string, auth::errc> SessionManager::create(
    std::string_view subject_id,
    attributes_t attributes,
    std::optional<std::string_view> previous_token)
{
    return create(subject_id, std::move(attributes), previous_token, Clock::now());
}

std::expected<std::string, auth::errc> SessionManager::create(
    std::string_view subject_id,
    attributes_t attributes,
    std::optional<std::string_view> previous_token,
    Clock::time_point now)
{
    now = normalize(now);

    if (previous_token && !previous_token->empty())
    {
        if (auto r = store.get().remove(*previous_token); !r)
        {
            return std::unexpected(store_failure(r.error(), "create"));
        }
        LOG_DEBUG("Dropped presented session {} before re-authentication", crypto::redact(*previous_token));
    }

    SessionRecord rec;
    rec.subject_id = std::string(subject_id);
    rec.created_at = now;
    rec.last_active_at = now;
    rec.absolute_expires_at = now + pol.max_lifetime;
    rec.attributes = std::move(attributes);

    auto token = insert_fresh(std::move(rec), now);
    if (!token)
    {
        return token;
    }

    bump(metrics, &AuthMetrics::sessions_created);
    LOG_INFO("Session {} created for {}", crypto::redact(*token), subject_id);
    return token;
}

std::expected<SessionRecord, auth::errc> SessionManager::load_live(std::string_view token, Clock::time_point now)
{
    auto got = store.get().get(token);
    if (!got)
    {
        return std::unexpected(store_failure(got.error(), "validate"));
    }
    if (!got->has_value())
    {
        return std::unexpected(auth::errc::session_not_found);
    }

    SessionRecord rec = std::move(**got);
    if (is_dead(rec, now))
    {
        bump(metrics, &AuthMetrics::sessions_expired);
        LOG_DEBUG("Session {} of {} expired", crypto::redact(token), rec.subject_id);
        if (auto r = store.get().remove(token); !r)
        {
            // still expired for the caller; the backend ttl reclaims it later
            (void)store_failure(r.error(), "expire");
        }
        return std::unexpected(auth::errc::session_expired);
    }

    rec.last_active_at = std::max(rec.last_active_at, now);
    // renew keeps a later renewal that landed since the read
    if (auto r = store.get().put(rec, ttl_for(rec, now), put_mode::renew); !r)
    {
        // not_found here means a concurrent revoke won; do not resurrect
        return std::unexpected(store_failure(r.error(), "renew"));
    }
    return rec;
}

std::expected<SessionContext, auth::errc> SessionManager::validate(std::string_view token)
{
    return validate(token, Clock::now());
}

std::expected<SessionContext, auth::errc> SessionManager::validate(std::string_view token, Clock::time_point now)
{
    auto rec = load_live(token, normalize(now));
    if (!rec)
    {
        bump(metrics, &AuthMetrics::sessions_rejected);
        return std::unexpected(rec.error());
    }
    bump(metrics, &AuthMetrics::sessions_validated);
    return SessionContext{std::move(rec->subject_id), std::move(rec->attributes)};
}

std::expected<std::string, auth::errc> SessionManager::regenerate(std::string_view token, const attributes_t& extra)
{
    return regenerate(token, extra, Clock::now());
}

std::expected<std::string, auth::errc> SessionManager::regenerate(std::string_view token,
                                                                  const attributes_t& extra,
                                                                  Clock::time_point now)
{
    now = normalize(now);

    auto rec = load_live(token, now);
    if (!rec)
    {
        bump(metrics, &AuthMetrics::sessions_rejected);
        return std::unexpected(rec.error());
    }

    // old token dies first: a failure below leaves the caller logged out, never doubled
    if (auto r = store.get().remove(token); !r)
    {
        return std::unexpected(store_failure(r.error(), "regenerate"));
    }

    for (const auto& [k, v] : extra)
    {
        rec->attributes.insert_or_assign(k, v);
    }
    rec->last_active_at = now;

    auto fresh = insert_fresh(std::move(*rec), now);
    if (!fresh)
    {
        return fresh;
    }

    LOG_INFO("Session {} regenerated as {}", crypto::redact(token), crypto::redact(*fresh));
    return fresh;
}

std::expected<void, auth::errc> SessionManager::revoke(std::string_view token)
{
    if (auto r = store.get().remove(token); !r)
    {
        return std::unexpected(store_failure(r.error(), "revoke"));
    }
    bump(metrics, &AuthMetrics::sessions_revoked);
    LOG_INFO("Session {} revoked", crypto::redact(token));
    return {};
}

std::expected<size_t, auth::errc> SessionManager::revoke_all(std::string_view subject_id,
                                                             std::optional<std::string_view> except)
{
    auto records = store.get().list_by_subject(subject_id);
    if (!records)
    {
        return std::unexpected(store_failure(records.error(), "revoke_all"));
    }

    size_t removed = 0;
    bool failed = false;
    for (const auto& rec : *records)
    {
        if (except && rec.token == *except)
        {
            continue;
        }
        if (auto r = store.get().remove(rec.token); !r)
        {
            (void)store_failure(r.error(), "revoke_all");
            failed = true;
            continue;
        }
        bump(metrics, &AuthMetrics::sessions_revoked);
        ++removed;
    }

    LOG_INFO("Revoked {} session(s) of {}", removed, subject_id);
    if (failed)
    {
        return std::unexpected(auth::errc::store_unavailable);
    }
    return removed;
}

std::expected<std::vector<SessionRecord>, auth::errc> SessionManager::list(std::string_view subject_id)
{
    return list(subject_id, Clock::now());
}

std::expected<std::vector<SessionRecord>, auth::errc> SessionManager::list(std::string_view subject_id,
                                                                           Clock::time_point now)
{
    auto records = store.get().list_by_subject(subject_id);
    if (!records)
    {
        return std::unexpected(store_failure(records.error(), "list"));
    }
    now = normalize(now);
    std::erase_if(*records, [&](const SessionRecord& r) { return is_dead(r, now); });
    return std::move(*records);
}

} // namespace session
