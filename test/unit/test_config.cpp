#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>
#include "../../tagcache/shared/config.h"
#include "../../tagcache/store/memory_backend.h"

#include <tagcache/cache_provider.h>

#include <cstdio>
#include <fstream>

using namespace tagcache;

TEST_CASE("defaults without a script")
{
    store_config cfg;
    CHECK(cfg.backend == backend_resp);
    CHECK(cfg.host == "127.0.0.1");
    CHECK(cfg.port == 6379);
    CHECK(cfg.pool_size == 4);
    CHECK(cfg.tag_prefix == "_tag:");
    CHECK(cfg.scan == scan_auto);
    CHECK(cfg.level == log_info);
}

TEST_CASE("returned table")
{
    store_config cfg;
    std::string error;
    bool ok = load_config_string(R"(
        return {
            backend = "memory",
            host = "cache.internal",
            port = 6380,
            database = 2,
            password = "secret",
            pool_size = 8,
            io_timeout_ms = 500,
            tag_prefix = "app:",
            scan = "full",
            scan_page_size = 100,
            log_level = "warn",
        }
    )", cfg, error);

    REQUIRE_MESSAGE(ok, error);
    CHECK(cfg.backend == backend_memory);
    CHECK(cfg.host == "cache.internal");
    CHECK(cfg.port == 6380);
    CHECK(cfg.database == 2);
    CHECK(cfg.password == "secret");
    CHECK(cfg.pool_size == 8);
    CHECK(cfg.io_timeout_ms == 500);
    CHECK(cfg.connect_timeout_ms == 2000);
    CHECK(cfg.tag_prefix == "app:");
    CHECK(cfg.scan == scan_full);
    CHECK(cfg.scan_page_size == 100);
    CHECK(cfg.level == log_warn);
}

TEST_CASE("global table and computed values")
{
    store_config cfg;
    std::string error;
    bool ok = load_config_string(R"(
        local base = 6000
        tagcache = { port = base + 379, tls = true, ca = "/etc/ssl/ca.pem" }
    )", cfg, error);

    REQUIRE_MESSAGE(ok, error);
    CHECK(cfg.port == 6379);
    CHECK(cfg.tls);
    CHECK(cfg.ca == "/etc/ssl/ca.pem");
}

TEST_CASE("a script without a table keeps defaults")
{
    store_config cfg;
    std::string error;
    CHECK(load_config_string("local x = 1", cfg, error));
    CHECK(cfg.port == 6379);
}

TEST_CASE("invalid values are rejected")
{
    auto rejects = [](const char* script, const char* expected)
    {
        store_config cfg;
        std::string error;
        CHECK_FALSE(load_config_string(script, cfg, error));
        CHECK_MESSAGE(error.find(expected) != std::string::npos, error);
    };

    rejects("return { backend = 'postgres' }", "unknown backend");
    rejects("return { port = 0 }", "port out of range");
    rejects("return { port = 70000 }", "port out of range");
    rejects("return { database = -1 }", "database");
    rejects("return { pool_size = 0 }", "pool_size");
    rejects("return { scan_page_size = -5 }", "scan_page_size");
    rejects("return { scan = 'sideways' }", "scan strategy");
    rejects("return { log_level = 'loud' }", "log level");
    rejects("return { tag_prefix = '' }", "tag_prefix");
}

TEST_CASE("script errors are reported")
{
    store_config cfg;
    std::string error;
    CHECK_FALSE(load_config_string("return {", cfg, error));
    CHECK(error.find("failed to load config") != std::string::npos);

    CHECK_FALSE(load_config_string("error('boom')", cfg, error));
    CHECK(error.find("boom") != std::string::npos);

    CHECK_FALSE(load_config("/nonexistent/tagcache.lua", cfg, error));
}

TEST_CASE("config file")
{
    const char* path = "tagcache_test_config.lua";
    {
        std::ofstream out(path);
        out << "return { backend = 'memory', pool_size = 2 }\n";
    }

    store_config cfg;
    std::string error;
    bool ok = load_config(path, cfg, error);
    std::remove(path);

    REQUIRE_MESSAGE(ok, error);
    CHECK(cfg.backend == backend_memory);
    CHECK(cfg.pool_size == 2);
}

TEST_CASE("make_pool for the memory backend")
{
    store_config cfg;
    cfg.backend = backend_memory;
    cfg.pool_size = 2;
    cfg.tag_prefix = "t:";
    cfg.scan = scan_full;

    auto keyspace = std::make_shared<memory_keyspace>();
    auto pool = make_pool(cfg, keyspace);
    CHECK(pool->max_size() == 2);

    cache_provider cache(pool, make_provider_options(cfg));
    CHECK(cache.tags().prefix() == "t:");
    CHECK(cache.scanner().strategy() == scan_full);

    cache.set_object("k", 1, tag_list{"x"});
    CHECK(keyspace->size() == 3);   // value, tag set, entry record

    // a second pool over the same keyspace sees the same data
    cache_provider other(make_pool(cfg, keyspace), make_provider_options(cfg));
    CHECK(other.get_object<int>("k") == 1);
}

TEST_CASE("make_pool for an unreachable store")
{
    store_config cfg;
    cfg.host = "127.0.0.1";
    cfg.port = 1;
    cfg.connect_timeout_ms = 200;

    auto pool = make_pool(cfg);
    cache_client client(pool);
    CHECK_THROWS_AS(client.ping(), store_error);
}
