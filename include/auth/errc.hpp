#pragma once

#include <cstdint>
#include <string_view>

namespace auth
{

// Failure taxonomy shared by the hasher, the session layer and the login flow.
// Callers outside the core only ever see the guard's uniform denial or
// credential_mismatch; the finer codes are for logs and tests.
enum class errc : uint8_t
{
    credential_mismatch,
    weak_random_source,
    session_expired,
    session_not_found,
    store_unavailable,
    rate_exceeded,
    hash_timeout,
    hash_capacity,
    invalid_params,
    invalid_record,
    identity_store_error,
    already_exists,
};

constexpr std::string_view to_string(errc e)
{
    switch (e)
    {
        case errc::credential_mismatch:  return "credential_mismatch";
        case errc::weak_random_source:   return "weak_random_source";
        case errc::session_expired:      return "session_expired";
        case errc::session_not_found:    return "session_not_found";
        case errc::store_unavailable:    return "store_unavailable";
        case errc::rate_exceeded:        return "rate_exceeded";
        case errc::hash_timeout:         return "hash_timeout";
        case errc::hash_capacity:        return "hash_capacity";
        case errc::invalid_params:       return "invalid_params";
        case errc::invalid_record:       return "invalid_record";
        case errc::identity_store_error: return "identity_store_error";
        case errc::already_exists:       return "already_exists";
    }
    return "unknown";
}

} // namespace auth
