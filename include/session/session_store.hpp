#pragma once

#include "session/session_record.hpp"

#include <chrono>
#include <expected>
#include <optional>
#include <string_view>
#include <vector>

namespace session
{

enum class put_mode : uint8_t
{
    create,   // fails with already_exists if the token is present
    replace,  // fails with not_found if the token is absent
    renew,    // as replace, but keeps a stored record whose last_active_at is later
};

/**
 * Key-value contract behind the session manager. Every operation is atomic
 * for a single token; nothing is promised across tokens. The backend
 * reclaims entries whose ttl has run out, but callers still check the
 * record's own expiry fields.
 */
class SessionStore
{
public:
    virtual ~SessionStore() = default;

    [[nodiscard]] virtual std::expected<void, store_errc> put(const SessionRecord& record,
                                                              std::chrono::milliseconds ttl,
                                                              put_mode mode) = 0;
    [[nodiscard]] virtual std::expected<std::optional<SessionRecord>, store_errc> get(std::string_view token) = 0;
    // Idempotent: removing an absent token succeeds.
    [[nodiscard]] virtual std::expected<void, store_errc> remove(std::string_view token) = 0;
    [[nodiscard]] virtual std::expected<std::vector<SessionRecord>, store_errc> list_by_subject(std::string_view subject_id) = 0;
    [[nodiscard]] virtual std::expected<void, store_errc> refresh_ttl(std::string_view token,
                                                                      std::chrono::milliseconds ttl) = 0;
    // Physically drops entries past their ttl; returns how many went.
    [[nodiscard]] virtual std::expected<size_t, store_errc> sweep() = 0;
};

} // namespace session
