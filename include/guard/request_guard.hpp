#pragma once

#include "session/session_manager.hpp"

#include <chrono>
#include <expected>
#include <optional>
#include <string>
#include <string_view>

namespace guard
{

// Per-request inputs the transport hands over verbatim.
struct Request
{
    std::optional<std::string_view> cookie_header;
    std::optional<std::string_view> bearer_token;
    std::optional<std::string_view> client_fingerprint;
};

struct Identity
{
    std::string subject_id;
    session::attributes_t attributes;
};

// Carries no reason: missing, expired, revoked, mismatched and
// backend failures all look the same from outside.
struct Denied
{
};

struct GuardOptions
{
    std::string cookie_name = "__Host-sid";
    bool bind_fingerprint = false;
    size_t max_token_length = 256;
};

class RequestGuard
{
public:
    static constexpr std::string_view fingerprint_attribute = "client_fingerprint";

    RequestGuard(session::SessionManager& sessions, GuardOptions opts);

    [[nodiscard]] std::expected<Identity, Denied> admit(const Request& req);
    [[nodiscard]] std::expected<Identity, Denied> admit(const Request& req, session::Clock::time_point now);

    // Bearer value wins over the cookie; a cookie header naming the session
    // cookie twice yields nothing.
    [[nodiscard]] std::optional<std::string_view> extract_token(const Request& req) const;

    // Set-Cookie values with the attributes the transport must honour.
    [[nodiscard]] std::string set_cookie(std::string_view token) const;
    [[nodiscard]] std::string clear_cookie() const;

    [[nodiscard]] const GuardOptions& options() const { return opts; }

private:
    [[nodiscard]] bool well_formed(std::string_view token) const;

    std::reference_wrapper<session::SessionManager> sessions;
    GuardOptions opts;
};

} // namespace guard
