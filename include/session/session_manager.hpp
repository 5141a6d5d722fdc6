#pragma once

#include "auth/errc.hpp"
#include "crypto/random.hpp"
#include "logger/metrics.hpp"
#include "session/session_store.hpp"

#include <chrono>
#include <expected>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace session
{

struct SessionPolicy
{
    std::chrono::seconds idle_timeout{1800};
    std::chrono::seconds max_lifetime{43200};
    size_t token_entropy_bits = 256;
};

// What a validated session hands upward; never the record or the store.
struct SessionContext
{
    std::string subject_id;
    attributes_t attributes;
};

/**
 * Owns every SessionRecord through the injected store.
 *
 * Per record: ACTIVE until either bound is crossed. A validation that finds
 * last_active_at + idle_timeout or absolute_expires_at behind it deletes the
 * record and reports session_expired; revoked records are simply absent.
 * Both bounds are checked on every validation, not just at creation.
 */
class SessionManager
{
public:
    [[nodiscard]] static std::expected<SessionManager, std::string> make(
        SessionStore& store,
        SessionPolicy policy,
        crypto::RandomSource& rng = crypto::system_random(),
        AuthMetrics* metrics = nullptr
    );

    // Deletes previous_token first when given (re-authentication); the new
    // token never equals it.
    [[nodiscard]] std::expected<std::string, auth::errc> create(
        std::string_view subject_id,
        attributes_t attributes,
        std::optional<std::string_view> previous_token = std::nullopt
    );
    [[nodiscard]] std::expected<std::string, auth::errc> create(
        std::string_view subject_id,
        attributes_t attributes,
        std::optional<std::string_view> previous_token,
        Clock::time_point now
    );

    // Slides last_active_at to now on success.
    [[nodiscard]] std::expected<SessionContext, auth::errc> validate(std::string_view token);
    [[nodiscard]] std::expected<SessionContext, auth::errc> validate(std::string_view token, Clock::time_point now);

    // New token for the same session (privilege change); the absolute
    // ceiling carries over, extra attributes overwrite existing keys.
    [[nodiscard]] std::expected<std::string, auth::errc> regenerate(std::string_view token, const attributes_t& extra);
    [[nodiscard]] std::expected<std::string, auth::errc> regenerate(std::string_view token,
                                                                    const attributes_t& extra,
                                                                    Clock::time_point now);

    [[nodiscard]] std::expected<void, auth::errc> revoke(std::string_view token);

    // Returns the number of sessions removed.
    [[nodiscard]] std::expected<size_t, auth::errc> revoke_all(std::string_view subject_id,
                                                               std::optional<std::string_view> except = std::nullopt);

    [[nodiscard]] std::expected<std::vector<SessionRecord>, auth::errc> list(std::string_view subject_id);
    [[nodiscard]] std::expected<std::vector<SessionRecord>, auth::errc> list(std::string_view subject_id,
                                                                             Clock::time_point now);

    [[nodiscard]] std::expected<std::string, auth::errc> generate_token() const;

    [[nodiscard]] const SessionPolicy& policy() const { return pol; }

private:
    SessionManager(SessionStore& store, SessionPolicy policy, crypto::RandomSource& rng, AuthMetrics* metrics);

    [[nodiscard]] bool is_dead(const SessionRecord& rec, Clock::time_point now) const;
    [[nodiscard]] std::chrono::milliseconds ttl_for(const SessionRecord& rec, Clock::time_point now) const;
    [[nodiscard]] std::expected<SessionRecord, auth::errc> load_live(std::string_view token, Clock::time_point now);
    [[nodiscard]] std::expected<std::string, auth::errc> insert_fresh(SessionRecord rec, Clock::time_point now);
    [[nodiscard]] auth::errc store_failure(store_errc e, std::string_view op);

    std::reference_wrapper<SessionStore> store;
    SessionPolicy pol;
    std::reference_wrapper<crypto::RandomSource> rng;
    AuthMetrics* metrics;
};

} // namespace session
