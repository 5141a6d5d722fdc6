#include <catch2/catch_test_macros.hpp>

#include "session/memory_store.hpp"
#include "session/session_manager.hpp"
#include "test_support.hpp"

#include <algorithm>
#include <functional>
#include <unordered_set>

using namespace session;
using namespace std::chrono_literals;

namespace
{

SessionPolicy test_policy()
{
    SessionPolicy pol;
    pol.idle_timeout = 30min;
    pol.max_lifetime = 2h;
    pol.token_entropy_bits = 256;
    return pol;
}

SessionManager make_manager(SessionStore& store,
                            crypto::RandomSource& rng = crypto::system_random(),
                            AuthMetrics* metrics = nullptr)
{
    auto mgr = SessionManager::make(store, test_policy(), rng, metrics);
    REQUIRE(mgr.has_value());
    return std::move(*mgr);
}

bool url_safe(std::string_view token)
{
    return std::ranges::all_of(token, [](char c) {
        return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '-' || c == '_';
    });
}

// Every call fails as if the backend were down.
class DownStore final : public SessionStore
{
public:
    std::expected<void, store_errc> put(const SessionRecord&, std::chrono::milliseconds, put_mode) override
    {
        return std::unexpected(store_errc::unavailable);
    }
    std::expected<std::optional<SessionRecord>, store_errc> get(std::string_view) override
    {
        return std::unexpected(store_errc::unavailable);
    }
    std::expected<void, store_errc> remove(std::string_view) override
    {
        return std::unexpected(store_errc::unavailable);
    }
    std::expected<std::vector<SessionRecord>, store_errc> list_by_subject(std::string_view) override
    {
        return std::unexpected(store_errc::unavailable);
    }
    std::expected<void, store_errc> refresh_ttl(std::string_view, std::chrono::milliseconds) override
    {
        return std::unexpected(store_errc::unavailable);
    }
    std::expected<size_t, store_errc> sweep() override
    {
        return std::unexpected(store_errc::unavailable);
    }
};

// Runs `after_read` against the backing store between a get and the caller's next step,
// standing in for a request on another thread.
class InterleavedStore final : public SessionStore
{
public:
    explicit InterleavedStore(SessionStore& inner) : inner(inner) {}

    std::expected<void, store_errc> put(const SessionRecord& r, std::chrono::milliseconds ttl, put_mode mode) override
    {
        return inner.put(r, ttl, mode);
    }
    std::expected<std::optional<SessionRecord>, store_errc> get(std::string_view token) override
    {
        auto got = inner.get(token);
        if (after_read)
        {
            after_read(inner, token);
        }
        return got;
    }
    std::expected<void, store_errc> remove(std::string_view token) override
    {
        return inner.remove(token);
    }
    std::expected<std::vector<SessionRecord>, store_errc> list_by_subject(std::string_view subject) override
    {
        return inner.list_by_subject(subject);
    }
    std::expected<void, store_errc> refresh_ttl(std::string_view token, std::chrono::milliseconds ttl) override
    {
        return inner.refresh_ttl(token, ttl);
    }
    std::expected<size_t, store_errc> sweep() override
    {
        return inner.sweep();
    }

    SessionStore& inner;
    std::function<void(SessionStore&, std::string_view)> after_read;
};

} // namespace

TEST_CASE("SessionManager::make rejects unsafe policies")
{
    MemorySessionStore store;

    auto pol = test_policy();
    pol.token_entropy_bits = 120;
    CHECK_FALSE(SessionManager::make(store, pol).has_value());

    pol.token_entropy_bits = 132;
    CHECK_FALSE(SessionManager::make(store, pol).has_value());

    pol = test_policy();
    pol.max_lifetime = 10min;
    CHECK_FALSE(SessionManager::make(store, pol).has_value());

    pol = test_policy();
    pol.idle_timeout = 0s;
    CHECK_FALSE(SessionManager::make(store, pol).has_value());

    CHECK(SessionManager::make(store, test_policy()).has_value());
}

TEST_CASE("SessionManager::create issues a token that validates to its context")
{
    test_support::FakeClock clock;
    MemorySessionStore store(clock.fn());
    AuthMetrics metrics;
    auto mgr = make_manager(store, crypto::system_random(), &metrics);

    auto token = mgr.create("alice", {{"role", "admin"}}, std::nullopt, clock.now);
    REQUIRE(token.has_value());
    CHECK(token->size() == 43);
    CHECK(url_safe(*token));

    auto ctx = mgr.validate(*token, clock.now);
    REQUIRE(ctx.has_value());
    CHECK(ctx->subject_id == "alice");
    CHECK(ctx->attributes.at("role") == "admin");

    CHECK(metrics.sessions_created.load() == 1);
    CHECK(metrics.sessions_validated.load() == 1);
}

TEST_CASE("SessionManager::validate rejects an unknown token")
{
    MemorySessionStore store;
    auto mgr = make_manager(store);

    auto ctx = mgr.validate("not-a-session");
    REQUIRE_FALSE(ctx.has_value());
    CHECK(ctx.error() == auth::errc::session_not_found);
}

TEST_CASE("SessionManager slides activity but never past the absolute ceiling")
{
    test_support::FakeClock clock;
    MemorySessionStore store(clock.fn());
    auto mgr = make_manager(store);

    auto token = mgr.create("alice", {}, std::nullopt, clock.now);
    REQUIRE(token.has_value());

    // regular activity inside the idle window keeps it alive to the ceiling
    for (int i = 0; i < 6; ++i)
    {
        clock.advance(20min);
        INFO("after " << (i + 1) * 20 << " minutes");
        REQUIRE(mgr.validate(*token, clock.now).has_value());
    }

    clock.advance(1s);
    auto late = mgr.validate(*token, clock.now);
    REQUIRE_FALSE(late.has_value());
    CHECK(late.error() == auth::errc::session_expired);

    auto gone = mgr.validate(*token, clock.now);
    REQUIRE_FALSE(gone.has_value());
    CHECK(gone.error() == auth::errc::session_not_found);
}

TEST_CASE("SessionManager expires an idle session and deletes it")
{
    test_support::FakeClock clock;
    MemorySessionStore store(clock.fn());
    auto mgr = make_manager(store);

    auto token = mgr.create("alice", {}, std::nullopt, clock.now);
    REQUIRE(token.has_value());

    SECTION("exactly at the idle bound it is still active")
    {
        clock.advance(30min);
        CHECK(mgr.validate(*token, clock.now).has_value());
    }

    SECTION("past the idle bound it expires once, then is absent")
    {
        clock.advance(30min + 1s);
        auto first = mgr.validate(*token, clock.now);
        REQUIRE_FALSE(first.has_value());
        CHECK(first.error() == auth::errc::session_expired);
        CHECK(store.size() == 0);

        auto second = mgr.validate(*token, clock.now);
        REQUIRE_FALSE(second.has_value());
        CHECK(second.error() == auth::errc::session_not_found);
    }
}

TEST_CASE("SessionManager::create drops the presented token on re-authentication")
{
    test_support::FakeClock clock;
    MemorySessionStore store(clock.fn());
    auto mgr = make_manager(store);

    // token planted before authentication
    auto planted = mgr.create("anonymous", {}, std::nullopt, clock.now);
    REQUIRE(planted.has_value());

    auto fresh = mgr.create("alice", {}, *planted, clock.now);
    REQUIRE(fresh.has_value());
    CHECK(*fresh != *planted);

    auto old = mgr.validate(*planted, clock.now);
    REQUIRE_FALSE(old.has_value());
    CHECK(old.error() == auth::errc::session_not_found);
    CHECK(mgr.validate(*fresh, clock.now).has_value());
}

TEST_CASE("SessionManager::revoke takes effect immediately and is idempotent")
{
    test_support::FakeClock clock;
    MemorySessionStore store(clock.fn());
    auto mgr = make_manager(store);

    auto token = mgr.create("alice", {}, std::nullopt, clock.now);
    REQUIRE(token.has_value());

    REQUIRE(mgr.revoke(*token).has_value());
    auto after = mgr.validate(*token, clock.now);
    REQUIRE_FALSE(after.has_value());
    CHECK(after.error() == auth::errc::session_not_found);

    CHECK(mgr.revoke(*token).has_value());
    CHECK(mgr.revoke("never-issued").has_value());
}

TEST_CASE("SessionManager::revoke_all spares the excepted token and other subjects")
{
    test_support::FakeClock clock;
    MemorySessionStore store(clock.fn());
    auto mgr = make_manager(store);

    auto a1 = mgr.create("alice", {}, std::nullopt, clock.now);
    auto a2 = mgr.create("alice", {}, std::nullopt, clock.now);
    auto a3 = mgr.create("alice", {}, std::nullopt, clock.now);
    auto b1 = mgr.create("bob", {}, std::nullopt, clock.now);
    REQUIRE((a1 && a2 && a3 && b1));

    auto removed = mgr.revoke_all("alice", *a2);
    REQUIRE(removed.has_value());
    CHECK(*removed == 2);

    CHECK_FALSE(mgr.validate(*a1, clock.now).has_value());
    CHECK(mgr.validate(*a2, clock.now).has_value());
    CHECK_FALSE(mgr.validate(*a3, clock.now).has_value());
    CHECK(mgr.validate(*b1, clock.now).has_value());

    auto all = mgr.revoke_all("alice");
    REQUIRE(all.has_value());
    CHECK(*all == 1);

    auto none = mgr.revoke_all("carol");
    REQUIRE(none.has_value());
    CHECK(*none == 0);
}

TEST_CASE("SessionManager::regenerate swaps the token and keeps the ceiling")
{
    test_support::FakeClock clock;
    MemorySessionStore store(clock.fn());
    auto mgr = make_manager(store);

    const auto started = clock.now;
    auto token = mgr.create("alice", {{"role", "user"}, {"lang", "en"}}, std::nullopt, clock.now);
    REQUIRE(token.has_value());

    clock.advance(20min);
    auto fresh = mgr.regenerate(*token, {{"role", "admin"}}, clock.now);
    REQUIRE(fresh.has_value());
    CHECK(*fresh != *token);

    auto old = mgr.validate(*token, clock.now);
    REQUIRE_FALSE(old.has_value());
    CHECK(old.error() == auth::errc::session_not_found);

    auto ctx = mgr.validate(*fresh, clock.now);
    REQUIRE(ctx.has_value());
    CHECK(ctx->subject_id == "alice");
    CHECK(ctx->attributes.at("role") == "admin");
    CHECK(ctx->attributes.at("lang") == "en");

    auto listed = mgr.list("alice", clock.now);
    REQUIRE(listed.has_value());
    REQUIRE(listed->size() == 1);
    CHECK(listed->front().created_at == started);
    CHECK(listed->front().absolute_expires_at == started + 2h);
}

TEST_CASE("SessionManager::regenerate refuses a dead token")
{
    test_support::FakeClock clock;
    MemorySessionStore store(clock.fn());
    auto mgr = make_manager(store);

    auto token = mgr.create("alice", {}, std::nullopt, clock.now);
    REQUIRE(token.has_value());

    clock.advance(31min);
    auto fresh = mgr.regenerate(*token, {}, clock.now);
    REQUIRE_FALSE(fresh.has_value());
    CHECK(fresh.error() == auth::errc::session_expired);
    CHECK(store.size() == 0);
}

TEST_CASE("SessionManager::list leaves out logically dead records")
{
    test_support::FakeClock clock;
    MemorySessionStore store(clock.fn());
    auto mgr = make_manager(store);

    auto stale = mgr.create("alice", {}, std::nullopt, clock.now);
    clock.advance(20min);
    auto live = mgr.create("alice", {}, std::nullopt, clock.now);
    REQUIRE((stale && live));

    // stale is past idle but still inside the backend's reclaim grace
    clock.advance(11min);
    auto listed = mgr.list("alice", clock.now);
    REQUIRE(listed.has_value());
    REQUIRE(listed->size() == 1);
    CHECK(listed->front().token == *live);
}

TEST_CASE("SessionManager tokens do not repeat")
{
    MemorySessionStore store;
    auto mgr = make_manager(store);

    constexpr size_t samples = 1'000'000;
    std::unordered_set<std::string> seen;
    seen.reserve(samples);
    for (size_t i = 0; i < samples; ++i)
    {
        auto token = mgr.generate_token();
        REQUIRE(token.has_value());
        REQUIRE(token->size() == 43);
        seen.insert(std::move(*token));
    }
    CHECK(seen.size() == samples);
}

TEST_CASE("SessionManager fails closed without randomness")
{
    MemorySessionStore store;
    test_support::ExhaustibleRandom rng(0);
    auto mgr = make_manager(store, rng);

    auto token = mgr.create("alice", {});
    REQUIRE_FALSE(token.has_value());
    CHECK(token.error() == auth::errc::weak_random_source);
    CHECK(store.size() == 0);
}

TEST_CASE("SessionManager gives up on repeated token collisions")
{
    MemorySessionStore store;
    test_support::StuckRandom rng;
    auto mgr = make_manager(store, rng);

    auto first = mgr.create("alice", {});
    REQUIRE(first.has_value());

    auto second = mgr.create("bob", {});
    REQUIRE_FALSE(second.has_value());
    CHECK(second.error() == auth::errc::weak_random_source);

    // the colliding create never touched alice's record
    auto ctx = mgr.validate(*first);
    REQUIRE(ctx.has_value());
    CHECK(ctx->subject_id == "alice");
}

TEST_CASE("SessionManager reports an unreachable store as store_unavailable")
{
    DownStore store;
    AuthMetrics metrics;
    auto mgr = make_manager(store, crypto::system_random(), &metrics);

    auto created = mgr.create("alice", {});
    REQUIRE_FALSE(created.has_value());
    CHECK(created.error() == auth::errc::store_unavailable);

    auto validated = mgr.validate("some-token");
    REQUIRE_FALSE(validated.has_value());
    CHECK(validated.error() == auth::errc::store_unavailable);

    auto revoked = mgr.revoke("some-token");
    REQUIRE_FALSE(revoked.has_value());
    CHECK(revoked.error() == auth::errc::store_unavailable);

    auto all = mgr.revoke_all("alice");
    REQUIRE_FALSE(all.has_value());
    CHECK(all.error() == auth::errc::store_unavailable);

    CHECK(metrics.store_errors.load() >= 4);
}

TEST_CASE("SessionManager renewal does not resurrect a concurrently revoked session")
{
    test_support::FakeClock clock;
    MemorySessionStore inner(clock.fn());
    InterleavedStore store(inner);
    auto mgr = make_manager(store);

    auto token = mgr.create("alice", {}, std::nullopt, clock.now);
    REQUIRE(token.has_value());

    store.after_read = [](SessionStore& s, std::string_view t) { (void)s.remove(t); };
    clock.advance(1min);
    auto ctx = mgr.validate(*token, clock.now);
    REQUIRE_FALSE(ctx.has_value());
    CHECK(ctx.error() == auth::errc::session_not_found);

    store.after_read = nullptr;
    auto got = inner.get(*token);
    REQUIRE(got.has_value());
    CHECK_FALSE(got->has_value());
}

TEST_CASE("SessionManager renewal never moves last activity backwards")
{
    test_support::FakeClock clock;
    MemorySessionStore inner(clock.fn());
    InterleavedStore store(inner);
    auto mgr = make_manager(store);

    auto token = mgr.create("alice", {}, std::nullopt, clock.now);
    REQUIRE(token.has_value());

    clock.advance(1min);
    const auto earlier = clock.now;
    const auto later = clock.now + 10s;

    // a request seen at `later` renews between this validate's read and its write
    store.after_read = [&](SessionStore& s, std::string_view t) {
        auto cur = s.get(t);
        REQUIRE((cur && cur->has_value()));
        auto rec = **cur;
        rec.last_active_at = later;
        REQUIRE(s.put(rec, 31min, put_mode::renew).has_value());
    };
    auto ctx = mgr.validate(*token, earlier);
    REQUIRE(ctx.has_value());
    store.after_read = nullptr;

    auto got = inner.get(*token);
    REQUIRE(got.has_value());
    REQUIRE(got->has_value());
    CHECK((*got)->last_active_at == later);

    // idle time still counts from the later request
    auto ok = mgr.validate(*token, later + 30min);
    CHECK(ok.has_value());
}
