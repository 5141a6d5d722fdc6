#include "crypto/random.hpp"
#include "logger.hpp"

#include <openssl/err.h>
#include <openssl/rand.h>
#include <climits>

namespace crypto
{

std::expected<void, auth::errc> SystemRandom::fill(std::span<uint8_t> out)
{
    if (out.empty())
    {
        return {};
    }
    if (out.size() > static_cast<size_t>(INT_MAX))
    {
        return std::unexpected(auth::errc::invalid_params);
    }
    if (RAND_status() != 1)
    {
        LOG_ERROR("CSPRNG not seeded, refusing to generate {} bytes", out.size());
        return std::unexpected(auth::errc::weak_random_source);
    }
    if (RAND_bytes(out.data(), static_cast<int>(out.size())) != 1)
    {
        LOG_ERROR("RAND_bytes failed: {}", ERR_get_error());
        return std::unexpected(auth::errc::weak_random_source);
    }
    return {};
}

RandomSource& system_random()
{
    static SystemRandom rng;
    return rng;
}

} // namespace crypto
