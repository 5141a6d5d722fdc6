#pragma once
#include <atomic>
#include <chrono>
#include <algorithm>
#include <cstdint>
#include <format>
#include <ranges>
#include <string>
#include <vector>

struct AuthMetrics
{
    std::atomic<uint64_t> logins_successful{0};
    std::atomic<uint64_t> logins_failed{0};
    std::atomic<uint64_t> logins_throttled{0};
    std::atomic<uint64_t> hashes_computed{0};
    std::atomic<uint64_t> rehashes{0};
    std::atomic<uint64_t> hash_rejected_capacity{0};
    std::atomic<uint64_t> hash_timeouts{0};
    std::atomic<uint64_t> sessions_created{0};
    std::atomic<uint64_t> sessions_validated{0};
    std::atomic<uint64_t> sessions_rejected{0};
    std::atomic<uint64_t> sessions_expired{0};
    std::atomic<uint64_t> sessions_revoked{0};
    std::atomic<uint64_t> store_errors{0};

    std::chrono::steady_clock::time_point start_time{std::chrono::steady_clock::now()};

    AuthMetrics() = default;

    void reset()
    {
        start_time = std::chrono::steady_clock::now();
        logins_successful = 0;
        logins_failed = 0;
        logins_throttled = 0;
        hashes_computed = 0;
        rehashes = 0;
        hash_rejected_capacity = 0;
        hash_timeouts = 0;
        sessions_created = 0;
        sessions_validated = 0;
        sessions_rejected = 0;
        sessions_expired = 0;
        sessions_revoked = 0;
        store_errors = 0;
    }
};

// Null-safe increment for components that take an optional metrics sink
inline void bump(AuthMetrics* m, std::atomic<uint64_t> AuthMetrics::* counter)
{
    if (m)
    {
        (m->*counter).fetch_add(1, std::memory_order_relaxed);
    }
}

template<>
struct std::formatter<AuthMetrics>
{
    constexpr auto parse(std::format_parse_context& fpc)
    {
        return fpc.begin();
    }

    auto format(const AuthMetrics& s, std::format_context& fc) const
    {
        auto now = std::chrono::steady_clock::now();
        auto uptime = std::chrono::duration_cast<std::chrono::seconds>(now - s.start_time).count();

        uint64_t login_ok = s.logins_successful.load();
        uint64_t login_fail = s.logins_failed.load();
        uint64_t validated = s.sessions_validated.load();
        uint64_t rejected = s.sessions_rejected.load();

        std::vector<std::string> lines;

        lines.push_back(std::format(""));
        lines.push_back(std::format("============================================================"));
        lines.push_back(std::format("AUTHENTICATION METRICS REPORT"));
        lines.push_back(std::format("============================================================"));
        lines.push_back(std::format("Uptime: {}s ({:.2f}h)", uptime, uptime / 3600.0));
        lines.push_back(std::format(""));
        lines.push_back(std::format("--- LOGINS ---"));
        lines.push_back(std::format("  Successful:      {}", login_ok));
        lines.push_back(std::format("  Failed:          {}", login_fail));
        lines.push_back(std::format("  Throttled:       {}", s.logins_throttled.load()));
        lines.push_back(std::format("  Success Rate:    {:.1f}%", login_ok + login_fail > 0 ?
                    (login_ok * 100.0 / (login_ok + login_fail)) : 0.0));
        lines.push_back(std::format(""));
        lines.push_back(std::format("--- HASHING ---"));
        lines.push_back(std::format("  Computed:        {}", s.hashes_computed.load()));
        lines.push_back(std::format("  Rehashed:        {}", s.rehashes.load()));
        lines.push_back(std::format("  Over capacity:   {}", s.hash_rejected_capacity.load()));
        lines.push_back(std::format("  Timed out:       {}", s.hash_timeouts.load()));
        lines.push_back(std::format(""));
        lines.push_back(std::format("--- SESSIONS ---"));
        lines.push_back(std::format("  Created:         {}", s.sessions_created.load()));
        lines.push_back(std::format("  Validated:       {}", validated));
        lines.push_back(std::format("  Rejected:        {}", rejected));
        lines.push_back(std::format("  Expired:         {}", s.sessions_expired.load()));
        lines.push_back(std::format("  Revoked:         {}", s.sessions_revoked.load()));
        lines.push_back(std::format("  Accept Rate:     {:.1f}%", validated + rejected > 0 ?
                    (validated * 100.0 / (validated + rejected)) : 0.0));
        lines.push_back(std::format(""));
        lines.push_back(std::format("--- ERRORS ---"));
        lines.push_back(std::format("  Store errors:    {}", s.store_errors.load()));
        lines.push_back(std::format("============================================================"));

        return std::ranges::copy(lines | std::views::join_with('\n'), fc.out()).out;
    }
};
