#include "config.h"
#include "command_hashing.h"
#include "tls_context.h"
#include "../store/memory_backend.h"
#include "../store/resp_connection.h"

#include <tagcache/cache_provider.h>

#include <sol/sol.hpp>

namespace tagcache {

namespace {

bool read_table(const sol::table& t, store_config& out, std::string& error)
{
    sol::optional<std::string> backend = t["backend"];
    if (backend)
    {
        switch (fnv1a_lower(*backend))
        {
            case fnv1a("resp"):
            case fnv1a("redis"):
                out.backend = backend_resp;
                break;
            case fnv1a("memory"):
                out.backend = backend_memory;
                break;
            default:
                error = "unknown backend: " + *backend;
                return false;
        }
    }

    out.host = t["host"].get_or(out.host);
    out.username = t["username"].get_or(out.username);
    out.password = t["password"].get_or(out.password);
    out.tls = t["tls"].get_or(out.tls);
    out.ca = t["ca"].get_or(out.ca);
    out.cert = t["cert"].get_or(out.cert);
    out.key = t["key"].get_or(out.key);
    out.tag_prefix = t["tag_prefix"].get_or(out.tag_prefix);

    sol::optional<int> port = t["port"];
    if (port)
    {
        if (*port <= 0 || *port > 65535)
        {
            error = "port out of range: " + std::to_string(*port);
            return false;
        }
        out.port = static_cast<uint16_t>(*port);
    }

    sol::optional<int> database = t["database"];
    if (database)
    {
        if (*database < 0)
        {
            error = "database must not be negative";
            return false;
        }
        out.database = *database;
    }

    sol::optional<int> pool_size = t["pool_size"];
    if (pool_size)
    {
        if (*pool_size <= 0)
        {
            error = "pool_size must be positive";
            return false;
        }
        out.pool_size = static_cast<uint32_t>(*pool_size);
    }

    sol::optional<int> connect_timeout = t["connect_timeout_ms"];
    if (connect_timeout)
        out.connect_timeout_ms = static_cast<uint32_t>(*connect_timeout < 0 ? 0 : *connect_timeout);

    sol::optional<int> io_timeout = t["io_timeout_ms"];
    if (io_timeout)
        out.io_timeout_ms = static_cast<uint32_t>(*io_timeout < 0 ? 0 : *io_timeout);

    sol::optional<int> page = t["scan_page_size"];
    if (page)
    {
        if (*page <= 0)
        {
            error = "scan_page_size must be positive";
            return false;
        }
        out.scan_page_size = static_cast<uint32_t>(*page);
    }

    sol::optional<std::string> scan = t["scan"];
    if (scan && !parse_scan_strategy(*scan, out.scan))
    {
        error = "unknown scan strategy: " + *scan;
        return false;
    }

    sol::optional<std::string> level = t["log_level"];
    if (level && !logger::parse_level(*level, out.level))
    {
        error = "unknown log level: " + *level;
        return false;
    }

    if (out.tag_prefix.empty())
    {
        error = "tag_prefix must not be empty";
        return false;
    }

    return true;
}

bool run_script(sol::state& lua, sol::load_result& script, store_config& out, std::string& error)
{
    if (!script.valid())
    {
        sol::error err = script;
        error = std::string("failed to load config: ") + err.what();
        return false;
    }

    sol::protected_function_result result = script();
    if (!result.valid())
    {
        sol::error err = result;
        error = std::string("error executing config: ") + err.what();
        return false;
    }

    sol::optional<sol::table> returned;
    if (result.return_count() > 0)
        returned = result.get<sol::optional<sol::table>>();

    sol::optional<sol::table> global = lua["tagcache"];
    sol::optional<sol::table> table = returned ? returned : global;
    if (!table)
        return true;

    return read_table(*table, out, error);
}

} // namespace

bool load_config(const std::string& path, store_config& out, std::string& error)
{
    sol::state lua;
    lua.open_libraries(sol::lib::base, sol::lib::package, sol::lib::table, sol::lib::string);

    sol::load_result script = lua.load_file(path);
    if (!run_script(lua, script, out, error))
    {
        TAGCACHE_LOG_ERROR(path + ": " + error);
        return false;
    }
    return true;
}

bool load_config_string(std::string_view text, store_config& out, std::string& error)
{
    sol::state lua;
    lua.open_libraries(sol::lib::base, sol::lib::package, sol::lib::table, sol::lib::string);

    sol::load_result script = lua.load(text);
    if (!run_script(lua, script, out, error))
    {
        TAGCACHE_LOG_ERROR(error);
        return false;
    }
    return true;
}

std::shared_ptr<connection_pool> make_pool(const store_config& config,
                                           std::shared_ptr<memory_keyspace> keyspace)
{
    if (config.backend == backend_memory)
    {
        if (!keyspace)
            keyspace = std::make_shared<memory_keyspace>();

        return std::make_shared<connection_pool>(
            [keyspace]() -> std::unique_ptr<store_backend>
            {
                return std::make_unique<memory_backend>(keyspace);
            },
            config.pool_size);
    }

    resp_endpoint ep;
    ep.host = config.host;
    ep.port = config.port;
    ep.username = config.username;
    ep.password = config.password;
    ep.database = config.database;
    ep.connect_timeout_ms = config.connect_timeout_ms;
    ep.io_timeout_ms = config.io_timeout_ms;

    if (config.tls)
    {
        auto tls = std::make_shared<tls_context>();
        if (!tls->init_client(config.ca, config.cert, config.key))
            throw store_error("TLS setup failed: " + tls_context::last_error());
        ep.tls = std::move(tls);
    }

    return std::make_shared<connection_pool>(
        [ep]() -> std::unique_ptr<store_backend>
        {
            auto conn = std::make_unique<resp_connection>();
            if (!conn->connect(ep))
                throw store_error("cannot connect to " + ep.host + ":" + std::to_string(ep.port) +
                                  ": " + conn->last_error());
            return conn;
        },
        config.pool_size);
}

provider_options make_provider_options(const store_config& config)
{
    provider_options opts;
    opts.tag_prefix = config.tag_prefix;
    opts.scan = config.scan;
    opts.scan_page_size = config.scan_page_size;
    return opts;
}

} // namespace tagcache
