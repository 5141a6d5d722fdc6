#include "session/session_codec.hpp"
#include "fundamentals/json_utils.hpp"
#include "logger.hpp"

#include <array>
#include <algorithm>

namespace json = boost::json;

namespace session::codec
{

namespace
{

constexpr std::array<std::string_view, 7> schema_keys
{
    "v", "token", "subject", "created_at", "last_active_at", "absolute_expires_at", "attributes"
};

} // namespace

int64_t to_millis(Clock::time_point tp)
{
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

Clock::time_point from_millis(int64_t ms)
{
    return Clock::time_point(std::chrono::milliseconds(ms));
}

std::string encode(const SessionRecord& record)
{
    json::object attrs;
    for (const auto& [k, v] : record.attributes)
    {
        attrs[k] = v;
    }

    json::object obj;
    obj["v"] = schema_version;
    obj["token"] = record.token;
    obj["subject"] = record.subject_id;
    obj["created_at"] = to_millis(record.created_at);
    obj["last_active_at"] = to_millis(record.last_active_at);
    obj["absolute_expires_at"] = to_millis(record.absolute_expires_at);
    obj["attributes"] = std::move(attrs);
    return json::serialize(obj);
}

std::expected<SessionRecord, store_errc> decode(std::string_view payload)
{
    boost::system::error_code ec;
    json::value jv = json::parse(payload, ec);
    if (ec || !jv.is_object())
    {
        LOG_WARN("Session payload rejected: not a JSON object");
        return std::unexpected(store_errc::corrupt_payload);
    }

    const auto& obj = jv.as_object();
    if (obj.size() != schema_keys.size()
        || !std::ranges::all_of(schema_keys, [&](std::string_view k) { return obj.contains(k); }))
    {
        LOG_WARN("Session payload rejected: key set does not match schema");
        return std::unexpected(store_errc::corrupt_payload);
    }

    auto version = json_utils::extract_int(obj, "v");
    if (!version || *version != schema_version)
    {
        LOG_WARN("Session payload rejected: unsupported schema version");
        return std::unexpected(store_errc::corrupt_payload);
    }

    auto token = json_utils::extract_str(obj, "token");
    auto subject = json_utils::extract_str(obj, "subject");
    auto created = json_utils::extract_int(obj, "created_at");
    auto active = json_utils::extract_int(obj, "last_active_at");
    auto expires = json_utils::extract_int(obj, "absolute_expires_at");
    if (!token || !subject || !created || !active || !expires)
    {
        LOG_WARN("Session payload rejected: field type mismatch");
        return std::unexpected(store_errc::corrupt_payload);
    }
    if (token->empty() || subject->empty() || *created > *active || *active > *expires)
    {
        LOG_WARN("Session payload rejected: inconsistent fields");
        return std::unexpected(store_errc::corrupt_payload);
    }

    const auto& attrs_val = obj.at("attributes");
    if (!attrs_val.is_object())
    {
        return std::unexpected(store_errc::corrupt_payload);
    }

    SessionRecord rec;
    for (const auto& kv : attrs_val.as_object())
    {
        if (!kv.value().is_string())
        {
            LOG_WARN("Session payload rejected: attribute '{}' is not a string", std::string_view(kv.key()));
            return std::unexpected(store_errc::corrupt_payload);
        }
        rec.attributes.emplace(std::string(kv.key()), std::string(kv.value().as_string()));
    }

    rec.token = std::move(*token);
    rec.subject_id = std::move(*subject);
    rec.created_at = from_millis(*created);
    rec.last_active_at = from_millis(*active);
    rec.absolute_expires_at = from_millis(*expires);
    return rec;
}

} // namespace session::codec
