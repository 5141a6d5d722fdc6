#pragma once

#include "session/session_record.hpp"

#include <cstdint>
#include <expected>
#include <string>
#include <string_view>

namespace session::codec
{

constexpr int64_t schema_version = 1;

// {"v":1,"token":..,"subject":..,"created_at":ms,"last_active_at":ms,
//  "absolute_expires_at":ms,"attributes":{"k":"v",..}}
[[nodiscard]] std::string encode(const SessionRecord& record);

// Anything off-schema (other version, extra or missing keys, wrong types,
// non-string attribute values, broken time ordering) is corrupt_payload.
[[nodiscard]] std::expected<SessionRecord, store_errc> decode(std::string_view payload);

[[nodiscard]] int64_t to_millis(Clock::time_point tp);
[[nodiscard]] Clock::time_point from_millis(int64_t ms);

} // namespace session::codec
