#pragma once
#include <boost/json.hpp>
#include <cstdint>
#include <expected>
#include <format>
#include <string>
#include <string_view>

namespace json_utils
{

inline std::expected<std::string, std::string> extract_str(const boost::json::object& obj, std::string_view key)
{
    auto it = obj.find(key);
    if (it == obj.end())
    {
        return std::unexpected(std::format("\"{}\" field required", key));
    }
    if (!it->value().is_string())
    {
        return std::unexpected(std::format("\"{}\" must be a string", key));
    }

    return static_cast<std::string>(it->value().as_string());
}

inline std::expected<int64_t, std::string> extract_int(const boost::json::object& obj, std::string_view key)
{
    auto it = obj.find(key);
    if (it == obj.end())
    {
        return std::unexpected(std::format("\"{}\" field required", key));
    }
    if (!it->value().is_int64())
    {
        return std::unexpected(std::format("\"{}\" must be an integer", key));
    }

    return it->value().as_int64();
}

} // namespace json_utils
