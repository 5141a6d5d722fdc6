#pragma once
#include "auth/errc.hpp"
#include <cstdint>
#include <expected>
#include <span>

namespace crypto
{

// CSPRNG seam. The hasher (salts) and the session manager (tokens) draw from
// one of these; a source that cannot vouch for its state must fail with
// weak_random_source instead of producing bytes.
class RandomSource
{
public:
    virtual ~RandomSource() = default;

    [[nodiscard]] virtual std::expected<void, auth::errc> fill(std::span<uint8_t> out) = 0;
};

// OpenSSL DRBG, refused while RAND_status() reports it unseeded
class SystemRandom final : public RandomSource
{
public:
    [[nodiscard]] std::expected<void, auth::errc> fill(std::span<uint8_t> out) override;
};

[[nodiscard]] RandomSource& system_random();

} // namespace crypto
