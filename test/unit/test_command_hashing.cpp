#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>
#include "../../tagcache/shared/command_hashing.h"

#include <string>
#include <unordered_set>

using namespace tagcache;

TEST_CASE("FNV-1a basic correctness")
{
    CHECK(fnv1a("") == 2166136261u);
    CHECK(fnv1a("get") != fnv1a("set"));
    CHECK(fnv1a("get") != fnv1a("GET"));
    CHECK(fnv1a("invalidate") != fnv1a("in-tag"));
}

TEST_CASE("FNV-1a usable at compile time")
{
    static_assert(fnv1a("ping") == fnv1a("ping"));
    static_assert(fnv1a_lower("PING") == fnv1a("ping"));
    CHECK(true);
}

TEST_CASE("FNV-1a case-insensitive variant")
{
    CHECK(fnv1a_lower("GET") == fnv1a("get"));
    CHECK(fnv1a_lower("HScan") == fnv1a("hscan"));
    CHECK(fnv1a_lower("PEXPIREAT") == fnv1a("pexpireat"));
    CHECK(fnv1a_lower("ZScore") == fnv1a("zscore"));
    // Only ASCII letters are folded
    CHECK(fnv1a_lower("in-tag") == fnv1a("in-tag"));
}

TEST_CASE("FNV-1a store commands unique")
{
    // Commands dispatched by the memory backend must not collide
    uint32_t hashes[] = {
        fnv1a("ping"), fnv1a("auth"), fnv1a("select"),
        fnv1a("get"), fnv1a("set"), fnv1a("getset"), fnv1a("exists"), fnv1a("del"),
        fnv1a("unlink"), fnv1a("type"),
        fnv1a("expire"), fnv1a("pexpire"), fnv1a("expireat"), fnv1a("pexpireat"),
        fnv1a("ttl"), fnv1a("pttl"), fnv1a("persist"),
        fnv1a("keys"), fnv1a("scan"), fnv1a("hscan"), fnv1a("dbsize"),
        fnv1a("flushall"), fnv1a("flushdb"),
        fnv1a("hget"), fnv1a("hset"), fnv1a("hsetnx"), fnv1a("hexists"), fnv1a("hmget"),
        fnv1a("hgetall"), fnv1a("hdel"), fnv1a("hlen"),
        fnv1a("sadd"), fnv1a("srem"), fnv1a("sismember"), fnv1a("smembers"), fnv1a("scard"),
        fnv1a("zadd"), fnv1a("zrem"), fnv1a("zscore"), fnv1a("zcard"), fnv1a("zrange"),
        fnv1a("pfadd"), fnv1a("pfcount"),
        fnv1a("nx"), fnv1a("xx"), fnv1a("px"), fnv1a("ex"), fnv1a("match"), fnv1a("count"),
        fnv1a("withscores")
    };

    size_t count = sizeof(hashes) / sizeof(hashes[0]);
    for (size_t i = 0; i < count; i++)
        for (size_t j = i + 1; j < count; j++)
            CHECK(hashes[i] != hashes[j]);
}

TEST_CASE("FNV-1a CLI commands unique")
{
    uint32_t hashes[] = {
        fnv1a("ping"), fnv1a("keys"), fnv1a("get"), fnv1a("del"), fnv1a("ttl"),
        fnv1a("fields"), fnv1a("tags"), fnv1a("tagged"), fnv1a("in-tag"),
        fnv1a("invalidate"), fnv1a("flush"),
        fnv1a("--config"), fnv1a("-c"), fnv1a("--help"), fnv1a("-h"), fnv1a("--version")
    };

    size_t count = sizeof(hashes) / sizeof(hashes[0]);
    for (size_t i = 0; i < count; i++)
        for (size_t j = i + 1; j < count; j++)
            CHECK(hashes[i] != hashes[j]);
}

TEST_CASE("FNV-1a 64-bit variant")
{
    CHECK(fnv1a_64("a") == fnv1a_64("a"));
    CHECK(fnv1a_64("a") != fnv1a_64("b"));
    CHECK(fnv1a_64("") != 0);
}

TEST_CASE("FNV-1a 64-bit low bits spread over short keys")
{
    // HyperLogLog picks its register from the low 14 bits
    std::unordered_set<uint64_t> buckets;
    for (int i = 0; i < 4096; ++i)
        buckets.insert(fnv1a_64("k" + std::to_string(i)) & 0x3fff);
    // 4096 uniform draws over 16384 buckets land in ~3625 distinct ones
    CHECK(buckets.size() > 3400);
}
