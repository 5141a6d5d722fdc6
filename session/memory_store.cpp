#include "session/memory_store.hpp"

namespace session
{

MemorySessionStore::MemorySessionStore(clock_fn clock)
    : clock(std::move(clock))
{
}

void MemorySessionStore::erase_locked(entries_t::iterator it)
{
    if (auto sub = by_subject.find(it->second.record.subject_id); sub != by_subject.end())
    {
        sub->second.erase(it->first);
        if (sub->second.empty())
        {
            by_subject.erase(sub);
        }
    }
    entries.erase(it);
}

MemorySessionStore::entries_t::iterator MemorySessionStore::find_live_locked(std::string_view token, Clock::time_point now)
{
    auto it = entries.find(std::string(token));
    if (it != entries.end() && now > it->second.expires_at)
    {
        erase_locked(it);
        return entries.end();
    }
    return it;
}

std::expected<void, store_errc> MemorySessionStore::put(const SessionRecord& record,
                                                        std::chrono::milliseconds ttl,
                                                        put_mode mode)
{
    const auto now = clock();
    std::lock_guard<std::mutex> lock(mtx);

    auto it = find_live_locked(record.token, now);
    if (mode == put_mode::create && it != entries.end())
    {
        return std::unexpected(store_errc::already_exists);
    }
    if (mode != put_mode::create && it == entries.end())
    {
        return std::unexpected(store_errc::not_found);
    }
    if (mode == put_mode::renew && it->second.record.last_active_at > record.last_active_at)
    {
        return {};
    }

    if (it != entries.end() && it->second.record.subject_id != record.subject_id)
    {
        erase_locked(it);
    }

    entries.insert_or_assign(record.token, Entry{record, now + ttl});
    by_subject[record.subject_id].insert(record.token);
    return {};
}

std::expected<std::optional<SessionRecord>, store_errc> MemorySessionStore::get(std::string_view token)
{
    const auto now = clock();
    std::lock_guard<std::mutex> lock(mtx);

    auto it = find_live_locked(token, now);
    if (it == entries.end())
    {
        return std::optional<SessionRecord>{};
    }
    return std::optional<SessionRecord>{it->second.record};
}

std::expected<void, store_errc> MemorySessionStore::remove(std::string_view token)
{
    std::lock_guard<std::mutex> lock(mtx);
    if (auto it = entries.find(std::string(token)); it != entries.end())
    {
        erase_locked(it);
    }
    return {};
}

std::expected<std::vector<SessionRecord>, store_errc> MemorySessionStore::list_by_subject(std::string_view subject_id)
{
    const auto now = clock();
    std::lock_guard<std::mutex> lock(mtx);

    std::vector<SessionRecord> out;
    auto sub = by_subject.find(std::string(subject_id));
    if (sub == by_subject.end())
    {
        return out;
    }
    for (const auto& token : sub->second)
    {
        auto it = entries.find(token);
        if (it != entries.end() && now <= it->second.expires_at)
        {
            out.push_back(it->second.record);
        }
    }
    return out;
}

std::expected<void, store_errc> MemorySessionStore::refresh_ttl(std::string_view token, std::chrono::milliseconds ttl)
{
    const auto now = clock();
    std::lock_guard<std::mutex> lock(mtx);

    auto it = find_live_locked(token, now);
    if (it == entries.end())
    {
        return std::unexpected(store_errc::not_found);
    }
    it->second.expires_at = now + ttl;
    return {};
}

std::expected<size_t, store_errc> MemorySessionStore::sweep()
{
    const auto now = clock();
    std::lock_guard<std::mutex> lock(mtx);

    size_t removed = 0;
    for (auto it = entries.begin(); it != entries.end();)
    {
        if (now > it->second.expires_at)
        {
            auto victim = it++;
            erase_locked(victim);
            ++removed;
        }
        else
        {
            ++it;
        }
    }
    return removed;
}

size_t MemorySessionStore::size() const
{
    std::lock_guard<std::mutex> lock(mtx);
    return entries.size();
}

} // namespace session
