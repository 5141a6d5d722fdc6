#include "config.hpp"

#include <fstream>
#include <sstream>
#include <format>

namespace {

constexpr uint64_t day_sec = 86400;

template<std::unsigned_integral Ty>
std::expected<Ty, std::string> get_uint(const json::object& obj, std::string_view key,
                                        Ty min_val, Ty max_val, Ty default_val)
{
    auto it = obj.find(key);
    if (it == obj.end())
    {
        return default_val;
    }
    if (!it->value().is_int64() && !it->value().is_uint64())
    {
        return std::unexpected(std::format("'{}' must be an integer", key));
    }
    if (it->value().is_int64() && it->value().as_int64() < 0)
    {
        return std::unexpected(std::format("'{}' must be between {} and {}", key, min_val, max_val));
    }
    auto val = it->value().to_number<uint64_t>();
    if (val < static_cast<uint64_t>(min_val) || val > static_cast<uint64_t>(max_val))
    {
        return std::unexpected(std::format("'{}' must be between {} and {}",
                                           key, min_val, max_val));
    }
    return static_cast<Ty>(val);
}

std::string get_string(const json::object& obj, std::string_view key, std::string_view default_val)
{
    auto it = obj.find(key);
    if (it == obj.end() || !it->value().is_string())
    {
        return std::string(default_val);
    }
    return std::string(it->value().as_string());
}

bool get_bool(const json::object& obj, std::string_view key, bool default_val)
{
    auto it = obj.find(key);
    if (it == obj.end() || !it->value().is_bool())
    {
        return default_val;
    }
    return it->value().as_bool();
}

const json::object* section(const json::object& root, std::string_view name)
{
    auto it = root.find(name);
    if (it == root.end() || !it->value().is_object())
    {
        return nullptr;
    }
    return &it->value().as_object();
}

} // namespace

std::expected<Config, std::string> Config::load(const std::string& filepath)
{
    std::ifstream file(filepath);
    if (!file.is_open())
    {
        return std::unexpected(std::format("Failed to open config file: {}", filepath));
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    json::value jv;
    try
    {
        jv = json::parse(buffer.str());
    }
    catch (const std::exception& e)
    {
        return std::unexpected(std::format("JSON parse error: {}", e.what()));
    }
    return parse(jv);
}

Config Config::load_defaults()
{
    return Config{};
}

Config Config::load_or_defaults(const std::string& filepath)
{
    auto result = load(filepath);
    if (result)
    {
        return *result;
    }
    return load_defaults();
}

session::SessionPolicy Config::session_policy() const
{
    return session::SessionPolicy{sess.idle_timeout, sess.max_lifetime, sess.token_entropy_bits};
}

guard::GuardOptions Config::guard_options() const
{
    guard::GuardOptions opts;
    opts.cookie_name = sess.cookie_name;
    opts.bind_fingerprint = sess.bind_fingerprint;
    return opts;
}

std::expected<Config, std::string> Config::parse(const json::value& jv)
{
    if (!jv.is_object())
    {
        return std::unexpected("Config root must be a JSON object");
    }
    const auto& root = jv.as_object();
    Config config;
    if (const auto* h = section(root, "hashing"))
    {
        auto alg_name = get_string(*h, "algorithm", "argon2id");
        auto alg = auth::parse_algorithm(alg_name);
        if (!alg)
        {
            return std::unexpected(std::format("'algorithm' must be argon2id or argon2i, got '{}'", alg_name));
        }
        config.hash.alg = *alg;

        if (auto mem = get_uint<uint32_t>(*h, "memory_kib", 8, 4 * 1024 * 1024, 65536); mem)
        {
            config.hash.params.memory_kib = *mem;
        }
        else
        {
            return std::unexpected(mem.error());
        }
        if (auto tc = get_uint<uint32_t>(*h, "time_cost", 1, 64, 3); tc)
        {
            config.hash.params.time_cost = *tc;
        }
        else
        {
            return std::unexpected(tc.error());
        }
        if (auto par = get_uint<uint32_t>(*h, "parallelism", 1, 1, 1); par)
        {
            config.hash.params.parallelism = *par;
        }
        else
        {
            return std::unexpected(par.error());
        }
        if (auto conc = get_uint<size_t>(*h, "max_concurrent_ops", 1, 256, 4); conc)
        {
            config.hash.max_concurrent_ops = *conc;
        }
        else
        {
            return std::unexpected(conc.error());
        }
        if (auto queued = get_uint<size_t>(*h, "max_queued_ops", 0, 65536, 64); queued)
        {
            config.hash.max_queued_ops = *queued;
        }
        else
        {
            return std::unexpected(queued.error());
        }
        if (auto to = get_uint<uint64_t>(*h, "timeout_ms", 10, 600000, 5000); to)
        {
            config.hash.timeout = std::chrono::milliseconds(*to);
        }
        else
        {
            return std::unexpected(to.error());
        }

        if (auto ok = auth::CredentialHasher::check_params(config.hash.alg, config.hash.params); !ok)
        {
            return std::unexpected(std::format("hashing parameters rejected for {}", alg_name));
        }
    }
    if (const auto* s = section(root, "session"))
    {
        if (auto idle = get_uint<uint64_t>(*s, "idle_timeout_sec", 1, day_sec * 30, 1800); idle)
        {
            config.sess.idle_timeout = std::chrono::seconds(*idle);
        }
        else
        {
            return std::unexpected(idle.error());
        }
        if (auto life = get_uint<uint64_t>(*s, "max_lifetime_sec", 1, day_sec * 365, 43200); life)
        {
            config.sess.max_lifetime = std::chrono::seconds(*life);
        }
        else
        {
            return std::unexpected(life.error());
        }
        if (config.sess.max_lifetime < config.sess.idle_timeout)
        {
            return std::unexpected("'max_lifetime_sec' must not be shorter than 'idle_timeout_sec'");
        }
        if (auto bits = get_uint<size_t>(*s, "token_entropy_bits", 128, 1024, 256); bits)
        {
            if (*bits % 8 != 0)
            {
                return std::unexpected("'token_entropy_bits' must be a multiple of 8");
            }
            config.sess.token_entropy_bits = *bits;
        }
        else
        {
            return std::unexpected(bits.error());
        }
        config.sess.cookie_name = get_string(*s, "cookie_name", "__Host-sid");
        if (config.sess.cookie_name.empty())
        {
            return std::unexpected("'cookie_name' must not be empty");
        }
        config.sess.bind_fingerprint = get_bool(*s, "bind_fingerprint", false);
    }
    if (const auto* st = section(root, "store"))
    {
        auto backend = get_string(*st, "backend", "memory");
        if (backend == "memory")
        {
            config.st.backend = Backend::Memory;
        }
        else if (backend == "sqlite")
        {
            config.st.backend = Backend::Sqlite;
        }
        else
        {
            return std::unexpected(std::format("'backend' must be memory or sqlite, got '{}'", backend));
        }
        config.st.path = get_string(*st, "path", "sessions.db");
        if (auto busy = get_uint<uint64_t>(*st, "busy_timeout_ms", 1, 60000, 2000); busy)
        {
            config.st.busy_timeout = std::chrono::milliseconds(*busy);
        }
        else
        {
            return std::unexpected(busy.error());
        }
    }
    if (const auto* idn = section(root, "identity"))
    {
        config.id.path = get_string(*idn, "path", "users.db");
    }
    if (const auto* lg = section(root, "logging"))
    {
        config.log.level = get_string(*lg, "level", "info");
        config.log.file = get_string(*lg, "file", "");
        if (auto max_size = get_uint<size_t>(*lg, "max_size_mb", 1, 10000, 100); max_size)
        {
            config.log.max_size_mb = *max_size;
        }
        else
        {
            return std::unexpected(max_size.error());
        }
        config.log.enable_console = get_bool(*lg, "enable_console", true);
    }
    return config;
}
