#pragma once

#include "auth/credential_record.hpp"
#include "auth/errc.hpp"
#include "crypto/constant_time.hpp"
#include "crypto/random.hpp"

#include <expected>
#include <functional>
#include <string>
#include <string_view>

namespace auth
{

/**
 * Argon2 (libsodium) over a per-record CSPRNG salt.
 * Stateless apart from the live target and the dummy record, so one
 * instance is shared by every worker thread.
 */
class CredentialHasher
{
public:
    struct Target
    {
        algorithm alg = algorithm::argon2id;
        CostParams params;
    };

    [[nodiscard]] static std::expected<CredentialHasher, errc> create(
        Target target,
        crypto::RandomSource& rng = crypto::system_random()
    );

    // Hash at the live target
    [[nodiscard]] std::expected<CredentialRecord, errc> hash(std::string_view secret) const;
    [[nodiscard]] std::expected<CredentialRecord, errc> hash(std::string_view secret, const CostParams& params) const;

    // Always runs the full derivation, whatever the record holds. Salts longer
    // than salt_length are accepted from foreign records.
    [[nodiscard]] AuthenticationOutcome verify(std::string_view secret,
                                               const CredentialRecord& record,
                                               crypto::CompareTrace* trace = nullptr) const;

    [[nodiscard]] bool needs_rehash(const CredentialRecord& record) const;

    // Verified against when the principal is unknown; never matches.
    [[nodiscard]] const CredentialRecord& dummy_record() const { return dummy; }

    [[nodiscard]] std::expected<std::vector<uint8_t>, errc> make_salt() const;

    [[nodiscard]] const Target& target() const { return tgt; }

    // $argon2id$v=19$m=65536,t=3,p=1$<salt>$<digest>
    [[nodiscard]] static std::string encode(const CredentialRecord& record);
    [[nodiscard]] static std::expected<CredentialRecord, errc> decode(std::string_view encoded);

    [[nodiscard]] static std::expected<void, errc> check_params(algorithm alg, const CostParams& params);

private:
    CredentialHasher(Target target, crypto::RandomSource& rng, CredentialRecord dummy);

    static bool verify_encoded(std::string_view secret, const CredentialRecord& record);

    Target tgt;
    std::reference_wrapper<crypto::RandomSource> rng;
    CredentialRecord dummy;
};

// Minimum length for newly set secrets; existing records are never re-judged.
[[nodiscard]] bool acceptable_secret(std::string_view secret);

} // namespace auth
