#include "session/store_factory.hpp"
#include "session/memory_store.hpp"
#include "session/sqlite_store.hpp"
#include "logger.hpp"

namespace session
{

std::expected<std::unique_ptr<SessionStore>, std::string> make_session_store(const Config::StoreCfg& cfg)
{
    switch (cfg.backend)
    {
        case Config::Backend::Memory:
            LOG_INFO("Session store: in-process memory");
            return std::make_unique<MemorySessionStore>();
        case Config::Backend::Sqlite:
        {
            auto store = SqliteSessionStore::open(cfg.path, cfg.busy_timeout);
            if (!store)
            {
                return std::unexpected(store.error());
            }
            LOG_INFO("Session store: sqlite at {}", cfg.path);
            return std::unique_ptr<SessionStore>(std::move(*store));
        }
    }
    return std::unexpected("unknown session store backend");
}

} // namespace session
