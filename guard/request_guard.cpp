#include "guard/request_guard.hpp"
#include "crypto/utils.hpp"
#include "logger.hpp"

#include <algorithm>
#include <format>
#include <ranges>

namespace guard
{

namespace
{

std::string_view trim(std::string_view s)
{
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t'))
    {
        s.remove_prefix(1);
    }
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t'))
    {
        s.remove_suffix(1);
    }
    return s;
}

bool is_token_char(char c)
{
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '-' || c == '_';
}

} // namespace

RequestGuard::RequestGuard(session::SessionManager& sessions, GuardOptions opts)
    : sessions(sessions)
    , opts(std::move(opts))
{
}

bool RequestGuard::well_formed(std::string_view token) const
{
    return !token.empty() && token.size() <= opts.max_token_length && std::ranges::all_of(token, is_token_char);
}

std::optional<std::string_view> RequestGuard::extract_token(const Request& req) const
{
    if (req.bearer_token)
    {
        return trim(*req.bearer_token);
    }
    if (!req.cookie_header)
    {
        return std::nullopt;
    }

    std::optional<std::string_view> found;
    for (auto part : *req.cookie_header | std::views::split(';'))
    {
        auto pair = trim(std::string_view(part.begin(), part.end()));
        auto eq = pair.find('=');
        if (eq == std::string_view::npos || trim(pair.substr(0, eq)) != opts.cookie_name)
        {
            continue;
        }
        if (found)
        {
            // duplicate session cookie: ambiguous, possibly planted
            return std::nullopt;
        }
        auto value = trim(pair.substr(eq + 1));
        if (value.size() >= 2 && value.front() == '"' && value.back() == '"')
        {
            value = value.substr(1, value.size() - 2);
        }
        found = value;
    }
    return found;
}

std::expected<Identity, Denied> RequestGuard::admit(const Request& req)
{
    return admit(req, session::Clock::now());
}

std::expected<Identity, Denied> RequestGuard::admit(const Request& req, session::Clock::time_point now)
{
    auto token = extract_token(req);
    if (!token || !well_formed(*token))
    {
        return std::unexpected(Denied{});
    }

    auto ctx = sessions.get().validate(*token, now);
    if (!ctx)
    {
        if (ctx.error() == auth::errc::store_unavailable)
        {
            LOG_WARN("Denying request for {}: session store unavailable", crypto::redact(*token));
        }
        else
        {
            LOG_DEBUG("Denying request for {}: {}", crypto::redact(*token), auth::to_string(ctx.error()));
        }
        return std::unexpected(Denied{});
    }

    if (opts.bind_fingerprint)
    {
        auto bound = ctx->attributes.find(std::string(fingerprint_attribute));
        if (bound != ctx->attributes.end()
            && (!req.client_fingerprint || *req.client_fingerprint != bound->second))
        {
            // The validate above already renewed the session; a replayed token is not left alive.
            LOG_WARN("Revoking {}: client fingerprint changed", crypto::redact(*token));
            if (auto r = sessions.get().revoke(*token); !r)
            {
                LOG_WARN("Failed to revoke {}: {}", crypto::redact(*token), auth::to_string(r.error()));
            }
            return std::unexpected(Denied{});
        }
    }

    return Identity{std::move(ctx->subject_id), std::move(ctx->attributes)};
}

std::string RequestGuard::set_cookie(std::string_view token) const
{
    return std::format("{}={}; Path=/; Max-Age={}; Secure; HttpOnly; SameSite=Strict",
                       opts.cookie_name, token, sessions.get().policy().max_lifetime.count());
}

std::string RequestGuard::clear_cookie() const
{
    return std::format("{}=; Path=/; Max-Age=0; Secure; HttpOnly; SameSite=Strict", opts.cookie_name);
}

} // namespace guard
