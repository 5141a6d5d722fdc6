#include "auth/credential_hasher.hpp"
#include "crypto/constant_time.hpp"
#include "crypto/utils.hpp"
#include "logger.hpp"

#include <sodium.h>
#include <charconv>
#include <format>
#include <ranges>

namespace auth
{

namespace
{

constexpr uint32_t phc_version = 19;
constexpr uint32_t max_memory_kib = 4 * 1024 * 1024;
constexpr uint32_t max_time_cost = 64;

int sodium_alg(algorithm alg)
{
    return alg == algorithm::argon2id ? crypto_pwhash_ALG_ARGON2ID13 : crypto_pwhash_ALG_ARGON2I13;
}

uint32_t min_time_cost(algorithm alg)
{
    return alg == algorithm::argon2id ? crypto_pwhash_argon2id_OPSLIMIT_MIN : crypto_pwhash_argon2i_OPSLIMIT_MIN;
}

// Pure over its arguments: an abandoned call leaves nothing behind.
std::expected<std::vector<uint8_t>, errc> derive(std::string_view secret,
                                                 algorithm alg,
                                                 std::span<const uint8_t> salt,
                                                 const CostParams& params)
{
    static_assert(salt_length == crypto_pwhash_SALTBYTES);
    if (salt.size() != salt_length)
    {
        return std::unexpected(errc::invalid_record);
    }

    std::vector<uint8_t> out(digest_length(alg));
    int rc = crypto_pwhash(
        out.data(), out.size(),
        secret.data(), secret.size(),
        salt.data(),
        params.time_cost,
        static_cast<size_t>(params.memory_kib) * 1024,
        sodium_alg(alg)
    );
    if (rc != 0)
    {
        LOG_ERROR("crypto_pwhash failed (m={} KiB, t={})", params.memory_kib, params.time_cost);
        return std::unexpected(errc::invalid_params);
    }
    return out;
}

template<std::unsigned_integral Ty>
std::optional<Ty> parse_uint(std::string_view s)
{
    Ty val = 0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), val);
    if (ec != std::errc{} || ptr != s.data() + s.size())
    {
        return std::nullopt;
    }
    return val;
}

// "m=65536,t=3,p=1", fixed order
std::optional<CostParams> parse_params(std::string_view s)
{
    auto parts = s | std::views::split(',')
                   | std::views::transform([](auto&& r) { return std::string_view(r.begin(), r.end()); })
                   | std::ranges::to<std::vector<std::string_view>>();
    if (parts.size() != 3
        || !parts[0].starts_with("m=") || !parts[1].starts_with("t=") || !parts[2].starts_with("p="))
    {
        return std::nullopt;
    }
    auto m = parse_uint<uint32_t>(parts[0].substr(2));
    auto t = parse_uint<uint32_t>(parts[1].substr(2));
    auto p = parse_uint<uint32_t>(parts[2].substr(2));
    if (!m || !t || !p)
    {
        return std::nullopt;
    }
    return CostParams{*m, *t, *p};
}

} // namespace

std::expected<CredentialHasher, errc> CredentialHasher::create(Target target, crypto::RandomSource& rng)
{
    if (sodium_init() < 0)
    {
        LOG_ERROR("Failed to initialize libsodium");
        return std::unexpected(errc::weak_random_source);
    }
    if (auto ok = check_params(target.alg, target.params); !ok)
    {
        return std::unexpected(ok.error());
    }

    CredentialRecord dummy;
    dummy.alg = target.alg;
    dummy.params = target.params;
    dummy.salt.resize(salt_length);
    dummy.digest.resize(digest_length(target.alg));
    if (auto r = rng.fill(dummy.salt); !r)
    {
        return std::unexpected(r.error());
    }
    // A random digest no secret maps to in practice; verify still pays the full cost.
    if (auto r = rng.fill(dummy.digest); !r)
    {
        return std::unexpected(r.error());
    }

    return CredentialHasher(target, rng, std::move(dummy));
}

CredentialHasher::CredentialHasher(Target target, crypto::RandomSource& rng, CredentialRecord dummy)
    : tgt(target)
    , rng(rng)
    , dummy(std::move(dummy))
{
}

std::expected<void, errc> CredentialHasher::check_params(algorithm alg, const CostParams& params)
{
    if (params.parallelism != 1)
    {
        return std::unexpected(errc::invalid_params);
    }
    if (params.time_cost < min_time_cost(alg) || params.time_cost > max_time_cost)
    {
        return std::unexpected(errc::invalid_params);
    }
    const size_t mem_bytes = static_cast<size_t>(params.memory_kib) * 1024;
    if (mem_bytes < crypto_pwhash_MEMLIMIT_MIN || params.memory_kib > max_memory_kib)
    {
        return std::unexpected(errc::invalid_params);
    }
    return {};
}

std::expected<std::vector<uint8_t>, errc> CredentialHasher::make_salt() const
{
    std::vector<uint8_t> salt(salt_length);
    if (auto r = rng.get().fill(salt); !r)
    {
        return std::unexpected(r.error());
    }
    return salt;
}

std::expected<CredentialRecord, errc> CredentialHasher::hash(std::string_view secret) const
{
    return hash(secret, tgt.params);
}

std::expected<CredentialRecord, errc> CredentialHasher::hash(std::string_view secret, const CostParams& params) const
{
    if (auto ok = check_params(tgt.alg, params); !ok)
    {
        return std::unexpected(ok.error());
    }

    auto salt = make_salt();
    if (!salt)
    {
        return std::unexpected(salt.error());
    }

    auto digest = derive(secret, tgt.alg, *salt, params);
    if (!digest)
    {
        return std::unexpected(digest.error());
    }

    return CredentialRecord{tgt.alg, std::move(*salt), params, std::move(*digest)};
}

AuthenticationOutcome CredentialHasher::verify(std::string_view secret,
                                               const CredentialRecord& record,
                                               crypto::CompareTrace* trace) const
{
    if (!check_params(record.alg, record.params)
        || record.salt.size() < salt_length
        || record.digest.size() != digest_length(record.alg))
    {
        // Unusable record: fall back to the dummy so the caller still pays a full derivation.
        LOG_WARN("Credential record with unusable parameters, verifying against dummy");
        auto scratch = derive(secret, dummy.alg, dummy.salt, dummy.params);
        if (scratch)
        {
            (void)crypto::ct_equal(*scratch, dummy.digest, trace);
            crypto::secure_clear(*scratch);
        }
        return AuthenticationOutcome{false, false};
    }

    if (record.salt.size() != salt_length)
    {
        return AuthenticationOutcome{verify_encoded(secret, record), needs_rehash(record)};
    }

    auto computed = derive(secret, record.alg, record.salt, record.params);
    if (!computed)
    {
        return AuthenticationOutcome{false, false};
    }

    bool matched = crypto::ct_equal(*computed, record.digest, trace);
    crypto::secure_clear(*computed);

    return AuthenticationOutcome{matched, needs_rehash(record)};
}

// crypto_pwhash takes a fixed salt size; longer salts go through the PHC string verifier,
// which derives with the record's own salt and compares with sodium_memcmp.
bool CredentialHasher::verify_encoded(std::string_view secret, const CredentialRecord& record)
{
    const std::string encoded = encode(record);
    int rc = record.alg == algorithm::argon2id
        ? crypto_pwhash_argon2id_str_verify(encoded.c_str(), secret.data(), secret.size())
        : crypto_pwhash_argon2i_str_verify(encoded.c_str(), secret.data(), secret.size());
    return rc == 0;
}

bool CredentialHasher::needs_rehash(const CredentialRecord& record) const
{
    const auto& cur = record.params;
    const auto& want = tgt.params;
    return record.alg < tgt.alg
        || cur.memory_kib < want.memory_kib
        || cur.time_cost < want.time_cost
        || cur.parallelism < want.parallelism;
}

std::string CredentialHasher::encode(const CredentialRecord& record)
{
    return std::format("${}$v={}$m={},t={},p={}${}${}",
                       to_string(record.alg), phc_version,
                       record.params.memory_kib, record.params.time_cost, record.params.parallelism,
                       crypto::b64_encode(record.salt, crypto::b64_variant::standard_nopad),
                       crypto::b64_encode(record.digest, crypto::b64_variant::standard_nopad));
}

std::expected<CredentialRecord, errc> CredentialHasher::decode(std::string_view encoded)
{
    auto fields = encoded | std::views::split('$')
                          | std::views::transform([](auto&& r) { return std::string_view(r.begin(), r.end()); })
                          | std::ranges::to<std::vector<std::string_view>>();

    // leading '$' yields an empty first field
    if (fields.size() != 6 || !fields[0].empty())
    {
        return std::unexpected(errc::invalid_record);
    }

    auto alg = parse_algorithm(fields[1]);
    if (!alg || fields[2] != std::format("v={}", phc_version))
    {
        return std::unexpected(errc::invalid_record);
    }

    auto params = parse_params(fields[3]);
    if (!params || params->memory_kib == 0 || params->time_cost == 0 || params->parallelism == 0)
    {
        return std::unexpected(errc::invalid_record);
    }

    auto salt = crypto::b64_decode(fields[4], crypto::b64_variant::standard_nopad);
    auto digest = crypto::b64_decode(fields[5], crypto::b64_variant::standard_nopad);
    if (!salt || !digest || salt->size() < salt_length || digest->size() != digest_length(*alg))
    {
        return std::unexpected(errc::invalid_record);
    }

    return CredentialRecord{*alg, std::move(*salt), *params, std::move(*digest)};
}

bool acceptable_secret(std::string_view secret)
{
    return secret.size() >= 8;
}

} // namespace auth
