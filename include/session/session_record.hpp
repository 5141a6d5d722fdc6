#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <string>
#include <string_view>

namespace session
{

using Clock = std::chrono::system_clock;
using attributes_t = std::map<std::string, std::string>;

struct SessionRecord
{
    std::string token;
    std::string subject_id;
    Clock::time_point created_at;
    Clock::time_point last_active_at;
    Clock::time_point absolute_expires_at;
    attributes_t attributes;

    bool operator==(const SessionRecord&) const = default;
};

enum class store_errc : uint8_t
{
    not_found,
    already_exists,
    unavailable,
    corrupt_payload,
};

constexpr std::string_view to_string(store_errc e)
{
    switch (e)
    {
        case store_errc::not_found:       return "not_found";
        case store_errc::already_exists:  return "already_exists";
        case store_errc::unavailable:     return "unavailable";
        case store_errc::corrupt_payload: return "corrupt_payload";
    }
    return "unknown";
}

} // namespace session
