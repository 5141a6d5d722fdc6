#include "crypto/utils.hpp"

#include <sodium.h>

namespace crypto
{

namespace
{

int sodium_variant(b64_variant v)
{
    return v == b64_variant::urlsafe_nopad
        ? sodium_base64_VARIANT_URLSAFE_NO_PADDING
        : sodium_base64_VARIANT_ORIGINAL_NO_PADDING;
}

} // namespace

std::string b64_encode(std::span<const uint8_t> data, b64_variant v)
{
    const int variant = sodium_variant(v);
    std::string out(sodium_base64_encoded_len(data.size(), variant), '\0');
    sodium_bin2base64(out.data(), out.size(), data.data(), data.size(), variant);
    // encoded_len counts the terminating NUL
    out.resize(out.size() - 1);
    return out;
}

std::optional<std::vector<uint8_t>> b64_decode(std::string_view text, b64_variant v)
{
    std::vector<uint8_t> out(text.size() * 3 / 4 + 1);
    size_t out_len = 0;
    const char* end = nullptr;
    int rc = sodium_base642bin(out.data(), out.size(),
                               text.data(), text.size(),
                               nullptr, &out_len, &end,
                               sodium_variant(v));
    if (rc != 0 || end != text.data() + text.size())
    {
        return std::nullopt;
    }
    out.resize(out_len);
    return out;
}

std::string redact(std::string_view token)
{
    constexpr size_t shown = 6;
    if (token.size() <= shown)
    {
        return "***";
    }
    return std::string(token.substr(0, shown)) + "...";
}

} // namespace crypto
