#pragma once
#include <openssl/crypto.h>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace crypto
{

template<class T>
void secure_clear(T& cont)
{
    if constexpr (requires { cont.data(); cont.size(); })
    {
        if (cont.size() != 0)
        {
            OPENSSL_cleanse(cont.data(), cont.size() * sizeof(*cont.data()));
        }
    }
    else
    {
        OPENSSL_cleanse(std::addressof(cont), sizeof(cont));
    }
}

// Owns a copy of a secret for work that may outlive the caller's buffer
// (hash jobs abandoned on timeout). Wiped on destruction.
class SecretBuffer
{
public:
    explicit SecretBuffer(std::string_view secret) : buf(secret) {}
    ~SecretBuffer() { secure_clear(buf); }

    SecretBuffer(const SecretBuffer&) = delete;
    SecretBuffer& operator=(const SecretBuffer&) = delete;

    [[nodiscard]] std::string_view view() const { return buf; }

private:
    std::string buf;
};

enum class b64_variant : uint8_t
{
    standard_nopad,
    urlsafe_nopad,
};

// libsodium base64 wrappers; decode returns nullopt on any malformed input
[[nodiscard]] std::string b64_encode(std::span<const uint8_t> data, b64_variant v);
[[nodiscard]] std::optional<std::vector<uint8_t>> b64_decode(std::string_view text, b64_variant v);

// Short, non-reversible form of a token for log lines
[[nodiscard]] std::string redact(std::string_view token);

} // namespace crypto
