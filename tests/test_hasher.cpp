#include <catch2/catch_test_macros.hpp>

#include "auth/credential_hasher.hpp"
#include "test_support.hpp"

#include <string>
#include <unordered_set>

using namespace auth;

namespace
{

// Cheap parameters so the suite stays fast; the scenario test uses real ones.
constexpr CostParams fast_params{8192, 1, 1};

CredentialHasher make_hasher(CostParams params = fast_params, algorithm alg = algorithm::argon2id)
{
    auto h = CredentialHasher::create({alg, params});
    REQUIRE(h.has_value());
    return std::move(*h);
}

std::string salt_key(const std::vector<uint8_t>& salt)
{
    return std::string(salt.begin(), salt.end());
}

} // namespace

TEST_CASE("CredentialHasher hash then verify matches the same secret")
{
    auto hasher = make_hasher();
    
    auto rec = hasher.hash("s3cret-passphrase");
    REQUIRE(rec.has_value());
    CHECK(rec->salt.size() == salt_length);
    CHECK(rec->digest.size() == digest_length(algorithm::argon2id));
    CHECK(rec->params == fast_params);
    
    auto out = hasher.verify("s3cret-passphrase", *rec);
    CHECK(out.matched);
    CHECK_FALSE(out.needs_rehash);
}

TEST_CASE("CredentialHasher rejects different and partially matching secrets")
{
    auto hasher = make_hasher();
    auto rec = hasher.hash("abcdefghijkl");
    REQUIRE(rec.has_value());
    
    CHECK_FALSE(hasher.verify("abcdefghijkm", *rec).matched);
    CHECK_FALSE(hasher.verify("abcdefghijk", *rec).matched);
    CHECK_FALSE(hasher.verify("abcdefghijkl ", *rec).matched);
    CHECK_FALSE(hasher.verify("", *rec).matched);
    CHECK_FALSE(hasher.verify("zbcdefghijkl", *rec).matched);
}

TEST_CASE("CredentialHasher comparison work does not depend on how much of the secret matches")
{
    auto hasher = make_hasher();
    const std::string stored = "correct horse battery staple";
    auto rec = hasher.hash(stored);
    REQUIRE(rec.has_value());
    
    // shares no leading byte, then every byte but the last
    std::string none = stored;
    none[0] = 'C';
    std::string most = stored;
    most.back() = 'E';
    
    crypto::CompareTrace none_trace;
    crypto::CompareTrace most_trace;
    crypto::CompareTrace unknown_trace;
    CHECK_FALSE(hasher.verify(none, *rec, &none_trace).matched);
    CHECK_FALSE(hasher.verify(most, *rec, &most_trace).matched);
    CHECK_FALSE(hasher.verify(stored, hasher.dummy_record(), &unknown_trace).matched);
    
    CHECK(none_trace.byte_ops == digest_length(algorithm::argon2id));
    CHECK(most_trace.byte_ops == none_trace.byte_ops);
    CHECK(unknown_trace.byte_ops == none_trace.byte_ops);
    
    // an unusable record still folds a full digest
    auto broken = *rec;
    broken.salt.resize(8);
    crypto::CompareTrace broken_trace;
    CHECK_FALSE(hasher.verify(stored, broken, &broken_trace).matched);
    CHECK(broken_trace.byte_ops == none_trace.byte_ops);
}

TEST_CASE("CredentialHasher verifies a known Argon2id record")
{
    auto hasher = make_hasher();
    auto rec = CredentialHasher::decode(
        "$argon2id$v=19$m=32,t=2,p=1$AAECAwQFBgcICQoLDA0ODw$HlV5obuNkDiQBJurs6lcYHbXLAVJCxn179ei/j7GuSQ");
    REQUIRE(rec.has_value());
    CHECK(rec->salt.size() == salt_length);
    
    auto out = hasher.verify("correct horse battery staple", *rec);
    CHECK(out.matched);
    // m=32 KiB is below the live target
    CHECK(out.needs_rehash);
    CHECK_FALSE(hasher.verify("Correct Horse Battery Staple", *rec).matched);
}

TEST_CASE("CredentialHasher verifies records carrying a 32 byte salt")
{
    const std::string text =
        "$argon2id$v=19$m=32,t=2,p=1$AAECAwQFBgcICQoLDA0ODxAREhMUFRYXGBkaGxwdHh8$CyHvqGbXUpRnhK6bo8kzQuMUuj4ZyoUX+72RtyKPjtE";
    auto hasher = make_hasher();
    auto rec = CredentialHasher::decode(text);
    REQUIRE(rec.has_value());
    CHECK(rec->salt.size() == 32);
    CHECK(CredentialHasher::encode(*rec) == text);
    
    auto out = hasher.verify("correct horse battery staple", *rec);
    CHECK(out.matched);
    CHECK(out.needs_rehash);
    CHECK_FALSE(hasher.verify("correct horse battery stapl", *rec).matched);
    CHECK_FALSE(hasher.verify("", *rec).matched);
    
    SECTION("at the live target it needs no upgrade")
    {
        auto at_target = make_hasher(CostParams{32, 2, 1});
        auto same = at_target.verify("correct horse battery staple", *rec);
        CHECK(same.matched);
        CHECK_FALSE(same.needs_rehash);
    }
}

TEST_CASE("CredentialHasher scenario: 64 MiB, t=3, p=1")
{
    auto hasher = make_hasher(CostParams{65536, 3, 1});
    
    auto rec = hasher.hash("correct horse battery staple", CostParams{65536, 3, 1});
    REQUIRE(rec.has_value());
    
    auto ok = hasher.verify("correct horse battery staple", *rec);
    CHECK(ok.matched);
    CHECK_FALSE(ok.needs_rehash);
    
    auto bad = hasher.verify("Correct Horse Battery Staple", *rec);
    CHECK_FALSE(bad.matched);
}

TEST_CASE("CredentialHasher flags records weaker than the target")
{
    auto weak = make_hasher(CostParams{8192, 1, 1});
    auto strong = make_hasher(CostParams{16384, 2, 1});
    
    auto rec = weak.hash("upgrade-me-please");
    REQUIRE(rec.has_value());
    
    auto out = strong.verify("upgrade-me-please", *rec);
    CHECK(out.matched);
    CHECK(out.needs_rehash);
    
    auto fresh = strong.hash("upgrade-me-please");
    REQUIRE(fresh.has_value());
    CHECK_FALSE(strong.needs_rehash(*fresh));
    // a stronger record is never downgraded
    CHECK_FALSE(weak.needs_rehash(*fresh));
}

TEST_CASE("CredentialHasher treats argon2i records as legacy under an argon2id target")
{
    auto legacy = make_hasher(CostParams{8192, 3, 1}, algorithm::argon2i);
    auto current = make_hasher(CostParams{8192, 3, 1}, algorithm::argon2id);
    
    auto rec = legacy.hash("old-school-secret");
    REQUIRE(rec.has_value());
    CHECK(rec->alg == algorithm::argon2i);
    
    auto out = current.verify("old-school-secret", *rec);
    CHECK(out.matched);
    CHECK(out.needs_rehash);
}

TEST_CASE("CredentialHasher encode produces a PHC string that decodes back")
{
    auto hasher = make_hasher();
    auto rec = hasher.hash("phc-format-check");
    REQUIRE(rec.has_value());
    
    auto text = CredentialHasher::encode(*rec);
    CHECK(text.starts_with("$argon2id$v=19$m=8192,t=1,p=1$"));
    
    auto back = CredentialHasher::decode(text);
    REQUIRE(back.has_value());
    CHECK(back->alg == rec->alg);
    CHECK(back->salt == rec->salt);
    CHECK(back->params == rec->params);
    CHECK(back->digest == rec->digest);
    CHECK(hasher.verify("phc-format-check", *back).matched);
}

TEST_CASE("CredentialHasher decode rejects malformed records")
{
    auto hasher = make_hasher();
    auto rec = hasher.hash("whatever-secret");
    REQUIRE(rec.has_value());
    auto good = CredentialHasher::encode(*rec);
    
    auto fields_from = [&](std::string_view replace_alg) {
        return std::string("$") + std::string(replace_alg) + good.substr(good.find("$v="));
    };
    
    CHECK_FALSE(CredentialHasher::decode("").has_value());
    CHECK_FALSE(CredentialHasher::decode("plaintext").has_value());
    CHECK_FALSE(CredentialHasher::decode(fields_from("scrypt")).has_value());
    CHECK_FALSE(CredentialHasher::decode(fields_from("argon2d")).has_value());
    CHECK_FALSE(CredentialHasher::decode(good.substr(1)).has_value());
    CHECK_FALSE(CredentialHasher::decode(good + "$extra").has_value());
    CHECK_FALSE(CredentialHasher::decode("$argon2id$v=16$m=8192,t=1,p=1$AAAAAAAAAAAAAAAAAAAAAA$" + good.substr(good.rfind('$') + 1)).has_value());
    CHECK_FALSE(CredentialHasher::decode("$argon2id$v=19$t=1,m=8192,p=1$AAAAAAAAAAAAAAAAAAAAAA$" + good.substr(good.rfind('$') + 1)).has_value());
    CHECK_FALSE(CredentialHasher::decode("$argon2id$v=19$m=0,t=1,p=1$AAAAAAAAAAAAAAAAAAAAAA$" + good.substr(good.rfind('$') + 1)).has_value());
    // salt too short
    CHECK_FALSE(CredentialHasher::decode("$argon2id$v=19$m=8192,t=1,p=1$AAAA$" + good.substr(good.rfind('$') + 1)).has_value());
    // digest of the wrong length
    CHECK_FALSE(CredentialHasher::decode(good.substr(0, good.rfind('$') + 1) + "AAAA").has_value());
}

TEST_CASE("CredentialHasher salts never repeat")
{
    auto hasher = make_hasher();
    std::unordered_set<std::string> seen;
    constexpr size_t samples = 100000;
    seen.reserve(samples);
    
    for (size_t i = 0; i < samples; ++i)
    {
        auto salt = hasher.make_salt();
        REQUIRE(salt.has_value());
        REQUIRE(salt->size() >= 16);
        seen.insert(salt_key(*salt));
    }
    
    CHECK(seen.size() == samples);
}

TEST_CASE("CredentialHasher hashing the same secret twice yields distinct records")
{
    auto hasher = make_hasher();
    auto a = hasher.hash("same secret twice");
    auto b = hasher.hash("same secret twice");
    REQUIRE(a.has_value());
    REQUIRE(b.has_value());
    
    CHECK(a->salt != b->salt);
    CHECK(a->digest != b->digest);
}

TEST_CASE("CredentialHasher refuses to run on a weak random source")
{
    SECTION("at construction")
    {
        test_support::ExhaustibleRandom rng(0);
        auto h = CredentialHasher::create({algorithm::argon2id, fast_params}, rng);
        REQUIRE_FALSE(h.has_value());
        CHECK(h.error() == errc::weak_random_source);
    }
    SECTION("when salting")
    {
        // two fills for the dummy record, then the source dries up
        test_support::ExhaustibleRandom rng(2);
        auto h = CredentialHasher::create({algorithm::argon2id, fast_params}, rng);
        REQUIRE(h.has_value());
        
        auto rec = h->hash("never-hashed");
        REQUIRE_FALSE(rec.has_value());
        CHECK(rec.error() == errc::weak_random_source);
    }
}

TEST_CASE("CredentialHasher validates cost parameters")
{
    CHECK(CredentialHasher::check_params(algorithm::argon2id, CostParams{65536, 3, 1}).has_value());
    CHECK_FALSE(CredentialHasher::check_params(algorithm::argon2id, CostParams{65536, 3, 4}).has_value());
    CHECK_FALSE(CredentialHasher::check_params(algorithm::argon2id, CostParams{65536, 0, 1}).has_value());
    CHECK_FALSE(CredentialHasher::check_params(algorithm::argon2id, CostParams{4, 3, 1}).has_value());
    // argon2i needs at least three passes
    CHECK_FALSE(CredentialHasher::check_params(algorithm::argon2i, CostParams{65536, 2, 1}).has_value());
    
    auto hasher = make_hasher();
    auto rec = hasher.hash("secret", CostParams{8192, 1, 2});
    REQUIRE_FALSE(rec.has_value());
    CHECK(rec.error() == errc::invalid_params);
}

TEST_CASE("CredentialHasher dummy record never matches")
{
    auto hasher = make_hasher();
    const auto& dummy = hasher.dummy_record();
    
    CHECK(dummy.params == hasher.target().params);
    CHECK(dummy.salt.size() == salt_length);
    CHECK_FALSE(hasher.verify("", dummy).matched);
    CHECK_FALSE(hasher.verify("correct horse battery staple", dummy).matched);
}

TEST_CASE("CredentialHasher fails closed on records it cannot use")
{
    auto hasher = make_hasher();
    auto rec = hasher.hash("unusable-later");
    REQUIRE(rec.has_value());
    
    auto broken = *rec;
    broken.params.parallelism = 8;
    CHECK_FALSE(hasher.verify("unusable-later", broken).matched);
    
    broken = *rec;
    broken.salt.resize(8);
    CHECK_FALSE(hasher.verify("unusable-later", broken).matched);
    
    broken = *rec;
    broken.digest.pop_back();
    CHECK_FALSE(hasher.verify("unusable-later", broken).matched);
}

TEST_CASE("acceptable_secret enforces a minimum length")
{
    CHECK_FALSE(acceptable_secret("short"));
    CHECK(acceptable_secret("long enough"));
}
