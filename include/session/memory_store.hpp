#pragma once

#include "session/session_store.hpp"

#include <functional>
#include <mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>

namespace session
{

// In-process backend for single-instance deployments.
class MemorySessionStore final : public SessionStore
{
public:
    using clock_fn = std::function<Clock::time_point()>;

    explicit MemorySessionStore(clock_fn clock = [] { return Clock::now(); });

    [[nodiscard]] std::expected<void, store_errc> put(const SessionRecord& record,
                                                      std::chrono::milliseconds ttl,
                                                      put_mode mode) override;
    [[nodiscard]] std::expected<std::optional<SessionRecord>, store_errc> get(std::string_view token) override;
    [[nodiscard]] std::expected<void, store_errc> remove(std::string_view token) override;
    [[nodiscard]] std::expected<std::vector<SessionRecord>, store_errc> list_by_subject(std::string_view subject_id) override;
    [[nodiscard]] std::expected<void, store_errc> refresh_ttl(std::string_view token,
                                                              std::chrono::milliseconds ttl) override;
    [[nodiscard]] std::expected<size_t, store_errc> sweep() override;

    [[nodiscard]] size_t size() const;

private:
    struct Entry
    {
        SessionRecord record;
        Clock::time_point expires_at;
    };

    using entries_t = std::unordered_map<std::string, Entry>;

    // callers hold mtx
    void erase_locked(entries_t::iterator it);
    entries_t::iterator find_live_locked(std::string_view token, Clock::time_point now);

    clock_fn clock;
    mutable std::mutex mtx;
    entries_t entries;
    std::unordered_map<std::string, std::unordered_set<std::string>> by_subject;
};

} // namespace session
