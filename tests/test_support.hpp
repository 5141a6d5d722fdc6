#pragma once

#include "crypto/random.hpp"
#include "session/session_record.hpp"

#include <chrono>
#include <cstring>
#include <functional>

namespace test_support
{

// Manually advanced wall clock shared by a store and the code under test.
struct FakeClock
{
    session::Clock::time_point now{std::chrono::sys_days{std::chrono::year{2030} / 1 / 1}};

    std::function<session::Clock::time_point()> fn()
    {
        return [this] { return now; };
    }

    void advance(std::chrono::milliseconds d) { now += d; }
};

// Serves `budget` fills from the system CSPRNG, then reports itself unseeded.
class ExhaustibleRandom final : public crypto::RandomSource
{
public:
    explicit ExhaustibleRandom(int budget) : budget(budget) {}

    std::expected<void, auth::errc> fill(std::span<uint8_t> out) override
    {
        if (budget <= 0)
        {
            return std::unexpected(auth::errc::weak_random_source);
        }
        --budget;
        return crypto::system_random().fill(out);
    }

    int budget;
};

// Always returns the same bytes: forces token collisions.
class StuckRandom final : public crypto::RandomSource
{
public:
    std::expected<void, auth::errc> fill(std::span<uint8_t> out) override
    {
        std::memset(out.data(), 0x5A, out.size());
        return {};
    }
};

} // namespace test_support
