#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

namespace auth
{

// Declared weakest first; the ordering is used for rehash decisions.
enum class algorithm : uint8_t
{
    argon2i,
    argon2id,
};

constexpr std::string_view to_string(algorithm a)
{
    return a == algorithm::argon2id ? "argon2id" : "argon2i";
}

constexpr std::optional<algorithm> parse_algorithm(std::string_view s)
{
    if (s == "argon2id") return algorithm::argon2id;
    if (s == "argon2i") return algorithm::argon2i;
    return std::nullopt;
}

// Both variants produce a fixed 32 byte digest
constexpr size_t digest_length(algorithm)
{
    return 32;
}

constexpr size_t salt_length = 16;

struct CostParams
{
    uint32_t memory_kib = 65536;
    uint32_t time_cost = 3;
    uint32_t parallelism = 1;

    bool operator==(const CostParams&) const = default;
};

struct CredentialRecord
{
    algorithm alg = algorithm::argon2id;
    std::vector<uint8_t> salt;
    CostParams params;
    std::vector<uint8_t> digest;
};

struct AuthenticationOutcome
{
    bool matched = false;
    bool needs_rehash = false;
};

} // namespace auth
