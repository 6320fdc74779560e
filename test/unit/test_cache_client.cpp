#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>
#include "../../tagcache/client/cache_client.h"
#include "test_helpers.h"

#include <algorithm>
#include <thread>

using namespace tagcache;
using namespace std::chrono_literals;

TEST_CASE("cache_client strings")
{
    auto ks = std::make_shared<memory_keyspace>();
    cache_client client(make_memory_pool(ks));

    SUBCASE("get misses are nullopt")
    {
        CHECK_FALSE(client.get("k").has_value());
        CHECK(client.set("k", "v"));
        CHECK(client.get("k") == "v");
    }

    SUBCASE("write conditions")
    {
        CHECK_FALSE(client.set("k", "v", {}, when_exists));
        CHECK(client.set("k", "v1", {}, when_not_exists));
        CHECK_FALSE(client.set("k", "v2", {}, when_not_exists));
        CHECK(client.set("k", "v3", {}, when_exists));
        CHECK(client.get("k") == "v3");
    }

    SUBCASE("ttl")
    {
        CHECK_FALSE(client.ttl("k").has_value());
        client.set("k", "v", 60s);
        auto ttl = client.ttl("k");
        REQUIRE(ttl.has_value());
        CHECK(*ttl > 50s);
        CHECK(client.persist("k"));
        CHECK_FALSE(client.ttl("k").has_value());

        CHECK(client.expire("k", 30s));
        CHECK(client.ttl("k").has_value());
        CHECK(client.expire_at("k", std::chrono::system_clock::now() + 1h));
        CHECK(*client.ttl("k") > 50min);
        CHECK_FALSE(client.expire("missing", 1s));
    }

    SUBCASE("getset, exists, del, type")
    {
        CHECK_FALSE(client.getset("k", "a").has_value());
        CHECK(client.getset("k", "b") == "a");
        CHECK(client.exists("k"));
        CHECK(client.type("k") == "string");
        CHECK(client.del("k"));
        CHECK_FALSE(client.del("k"));

        client.set("a", "1");
        client.set("b", "2");
        CHECK(client.del(std::vector<std::string>{"a", "b", "c"}) == 2);
        CHECK(client.del(std::vector<std::string>{}) == 0);
    }

    SUBCASE("error replies throw")
    {
        client.sadd("s", "m");
        CHECK_THROWS_AS(client.get("s"), store_error);
        CHECK_THROWS_AS(client.run({"NOSUCH"}), store_error);
    }
}

TEST_CASE("cache_client hashes")
{
    auto ks = std::make_shared<memory_keyspace>();
    cache_client client(make_memory_pool(ks));

    SUBCASE("hset conditions")
    {
        CHECK_FALSE(client.hset("h", "f", "v", {}, when_exists));
        CHECK_FALSE(client.hexists("h", "f"));
        CHECK(client.hset("h", "f", "v1", {}, when_not_exists));
        CHECK_FALSE(client.hset("h", "f", "v2", {}, when_not_exists));
        CHECK(client.hset("h", "f", "v3", {}, when_exists));
        CHECK(client.hget("h", "f") == "v3");
    }

    SUBCASE("ttl covers the whole hash")
    {
        client.hset("h", "a", "1", 60s);
        CHECK(client.ttl("h").has_value());
        client.hset("h", "b", "2");
        CHECK(client.ttl("h").has_value());
    }

    SUBCASE("batched hset, hmget, hgetall")
    {
        CHECK(client.hset("h", {{"a", "1"}, {"b", "2"}}) == 2);
        auto values = client.hmget("h", {"b", "zz", "a"});
        REQUIRE(values.size() == 3);
        CHECK(values[0] == "2");
        CHECK_FALSE(values[1].has_value());
        CHECK(values[2] == "1");

        auto all = client.hgetall("h");
        std::sort(all.begin(), all.end());
        REQUIRE(all.size() == 2);
        CHECK(all[0].first == "a");
        CHECK(all[1].second == "2");

        CHECK(client.hdel("h", "a"));
        CHECK_FALSE(client.hdel("h", "a"));
    }

    SUBCASE("conditional batch counts written fields")
    {
        client.hset("h", "a", "1");
        CHECK(client.hset("h", {{"a", "x"}, {"b", "2"}}, {}, when_not_exists) == 1);
        CHECK(client.hget("h", "a") == "1");
    }
}

TEST_CASE("cache_client sets, sorted sets, hyperloglog")
{
    auto ks = std::make_shared<memory_keyspace>();
    cache_client client(make_memory_pool(ks));

    SUBCASE("sets")
    {
        CHECK(client.sadd("s", "a"));
        CHECK_FALSE(client.sadd("s", "a", 60s));
        CHECK(client.ttl("s").has_value());
        CHECK(client.sismember("s", "a"));
        CHECK(client.smembers("s") == std::vector<std::string>{"a"});
        CHECK(client.srem("s", "a"));
        CHECK_FALSE(client.srem("s", "a"));
    }

    SUBCASE("sorted sets")
    {
        CHECK(client.zadd("z", 2.5, "b"));
        CHECK(client.zadd("z", -1, "a"));
        auto score = client.zscore("z", "b");
        REQUIRE(score.has_value());
        CHECK(*score == doctest::Approx(2.5));
        CHECK_FALSE(client.zscore("z", "x").has_value());
        CHECK(client.zrange("z", 0, -1) == std::vector<std::string>{"a", "b"});
        CHECK(client.zrem("z", "a"));
    }

    SUBCASE("hyperloglog")
    {
        CHECK(client.pfcount("p") == 0);
        CHECK(client.pfadd("p", {"x", "y", "z"}));
        CHECK_FALSE(client.pfadd("p", {"x"}));
        CHECK(client.pfcount("p") == 3);
    }
}

TEST_CASE("cache_client enumeration")
{
    auto ks = std::make_shared<memory_keyspace>();
    cache_client client(make_memory_pool(ks));
    for (int i = 0; i < 12; ++i)
        client.set("k" + std::to_string(i), "v");

    auto keys = client.keys("k1*");
    CHECK(keys.size() == 3);   // k1, k10, k11

    size_t seen = 0;
    uint64_t cursor = 0;
    do
    {
        auto page = client.scan(cursor, "*", 5);
        seen += page.keys.size();
        cursor = page.cursor;
    } while (cursor != 0);
    CHECK(seen == 12);

    client.hset("h", {{"a", "1"}, {"b", "2"}});
    auto page = client.hscan("h", 0, "a", 10);
    CHECK(page.cursor == 0);
    REQUIRE(page.fields.size() == 1);
    CHECK(page.fields[0].second == "1");
}

namespace {

// Needs a pool of at least two so a writer can get in mid-transaction
void check_watched_exec(std::shared_ptr<connection_pool> pool)
{
    cache_client client(std::move(pool));
    client.sadd("s", "a");

    auto copy_into_t = [](const resp::reply& members)
    {
        std::vector<command> cmds;
        for (const auto& m : members.elements)
            cmds.push_back({"SADD", "t", m.str});
        return cmds;
    };

    SUBCASE("commits when the key is left alone")
    {
        auto replies = client.watched_exec("s", {"SMEMBERS", "s"}, copy_into_t);
        REQUIRE(replies.has_value());
        REQUIRE(replies->size() == 1);
        CHECK((*replies)[0].integer == 1);
        CHECK(client.sismember("t", "a"));
    }

    SUBCASE("aborts when another writer gets in between")
    {
        auto replies = client.watched_exec("s", {"SMEMBERS", "s"},
            [&](const resp::reply& members)
            {
                client.sadd("s", "b");   // second connection
                return copy_into_t(members);
            });
        CHECK_FALSE(replies.has_value());
        CHECK_FALSE(client.exists("t"));
        CHECK(client.smembers("s").size() == 2);
    }

    SUBCASE("nothing to queue skips EXEC")
    {
        auto replies = client.watched_exec("s", {"SMEMBERS", "s"},
            [](const resp::reply&) { return std::vector<command>{}; });
        REQUIRE(replies.has_value());
        CHECK(replies->empty());
    }

    SUBCASE("an error reply to the read throws")
    {
        client.set("str", "v");
        CHECK_THROWS_AS(client.watched_exec("str", {"SMEMBERS", "str"}, copy_into_t), store_error);
        // the connection came back usable
        CHECK(client.watched_exec("s", {"SMEMBERS", "s"}, copy_into_t).has_value());
    }
}

} // namespace

TEST_CASE("cache_client watched_exec on memory backends")
{
    auto ks = std::make_shared<memory_keyspace>();
    check_watched_exec(make_memory_pool(ks, 2));
}

TEST_CASE("cache_client watched_exec over RESP")
{
    auto ks = std::make_shared<memory_keyspace>();
    fake_resp_server server(ks);
    check_watched_exec(make_resp_pool(server, 2));
}

TEST_CASE("cache_client over a RESP connection")
{
    auto ks = std::make_shared<memory_keyspace>();
    fake_resp_server server(ks);
    cache_client client(make_resp_pool(server));

    CHECK(client.ping());
    CHECK(client.set("k", "v", 10s));
    CHECK(client.get("k") == "v");

    auto replies = client.pipeline({{"SADD", "s", "a"}, {"GET", "s"}, {"SCARD", "s"}});
    REQUIRE(replies.size() == 3);
    CHECK(replies[1].is_error());
    CHECK(replies[2].integer == 1);

    SUBCASE("a dropped connection surfaces as store_error and is replaced")
    {
        server.drop_all();
        CHECK_THROWS_AS(client.get("k"), store_error);
        CHECK(client.pool().size() == 0);
        CHECK(client.get("k") == "v");
    }

    client.flushall();
    CHECK_FALSE(client.exists("k"));
}
