#pragma once

#include "config.hpp"
#include "session/session_store.hpp"

#include <expected>
#include <memory>
#include <string>

namespace session
{

// Picks the backend once at startup from the store section.
[[nodiscard]] std::expected<std::unique_ptr<SessionStore>, std::string> make_session_store(const Config::StoreCfg& cfg);

} // namespace session
