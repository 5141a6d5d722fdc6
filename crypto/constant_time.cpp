#include "crypto/constant_time.hpp"

namespace crypto
{

bool ct_equal(std::span<const uint8_t> a, std::span<const uint8_t> b, CompareTrace* trace) noexcept
{
    if (a.size() != b.size())
    {
        return false;
    }

    volatile uint8_t acc = 0;
    size_t ops = 0;
    for (size_t i = 0; i < a.size(); ++i)
    {
        acc = acc | static_cast<uint8_t>(a[i] ^ b[i]);
        ++ops;
    }

    if (trace)
    {
        trace->byte_ops += ops;
    }

    // single inspection after the full scan
    return acc == 0;
}

} // namespace crypto
