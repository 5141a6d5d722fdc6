#pragma once
#include <cstddef>
#include <cstdint>
#include <span>

namespace crypto
{

// Counts the byte pairs folded into the accumulator. Lets tests check the
// work done is a function of the length only.
struct CompareTrace
{
    size_t byte_ops = 0;
};

// Byte-wise equality with timing independent of the first mismatch position.
// Unequal lengths return false immediately: every caller compares digests
// whose length is fixed and public.
[[nodiscard]] bool ct_equal(std::span<const uint8_t> a,
                            std::span<const uint8_t> b,
                            CompareTrace* trace = nullptr) noexcept;

} // namespace crypto
