#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>
#include "../../tagcache/store/resp_connection.h"
#include "fake_resp_server.h"

#include <tagcache/types.h>

using namespace tagcache;

TEST_CASE("resp_connection round trips")
{
    auto ks = std::make_shared<memory_keyspace>();
    fake_resp_server server(ks);

    resp_connection conn;
    REQUIRE(conn.adopt(server.connect()));
    CHECK(conn.is_healthy());

    SUBCASE("single commands")
    {
        CHECK(conn.execute({"PING"}).str == "PONG");
        CHECK(conn.execute({"SET", "k", "hello world"}).str == "OK");
        CHECK(conn.execute({"GET", "k"}).str == "hello world");
        CHECK(conn.execute({"GET", "missing"}).is_nil());
    }

    SUBCASE("binary-safe values")
    {
        std::string value("a\r\nb\0c", 6);
        conn.execute({"SET", "bin", value});
        CHECK(conn.execute({"GET", "bin"}).str == value);
    }

    SUBCASE("large values span several reads")
    {
        std::string value(100000, 'x');
        conn.execute({"SET", "big", value});
        CHECK(conn.execute({"GET", "big"}).str.size() == value.size());
    }

    SUBCASE("pipelined batch keeps order")
    {
        auto replies = conn.execute_batch({
            {"SADD", "s", "a", "b"},
            {"SISMEMBER", "s", "a"},
            {"NOSUCH"},
            {"SCARD", "s"},
        });
        REQUIRE(replies.size() == 4);
        CHECK(replies[0].integer == 2);
        CHECK(replies[1].integer == 1);
        CHECK(replies[2].is_error());
        CHECK(replies[3].integer == 2);
        CHECK(conn.is_healthy());
    }

    SUBCASE("error replies do not break the connection")
    {
        conn.execute({"SET", "k", "v"});
        CHECK(conn.execute({"SADD", "k", "m"}).is_error());
        CHECK(conn.is_healthy());
        CHECK(conn.execute({"GET", "k"}).str == "v");
    }
}

TEST_CASE("resp_connection transport failures")
{
    auto ks = std::make_shared<memory_keyspace>();
    fake_resp_server server(ks);

    resp_connection conn;
    REQUIRE(conn.adopt(server.connect()));

    SUBCASE("peer closes")
    {
        server.drop_all();
        CHECK_THROWS_AS(conn.execute({"PING"}), store_error);
        CHECK_FALSE(conn.is_healthy());
        CHECK_FALSE(conn.last_error().empty());
        CHECK_THROWS_AS(conn.execute({"PING"}), store_error);
    }

    SUBCASE("protocol violation")
    {
        server.send_garbage(true);
        CHECK_THROWS_AS(conn.execute({"PING"}), store_error);
        CHECK_FALSE(conn.is_healthy());
    }

    SUBCASE("closed connection")
    {
        conn.close();
        CHECK_FALSE(conn.is_healthy());
        CHECK_THROWS_AS(conn.execute({"PING"}), store_error);
    }
}

TEST_CASE("resp_connection connect failures")
{
    resp_connection conn;
    resp_endpoint ep;
    ep.host = "127.0.0.1";
    ep.port = 1;    // nothing listens on tcpmux
    ep.connect_timeout_ms = 500;

    CHECK_FALSE(conn.connect(ep));
    CHECK_FALSE(conn.is_healthy());
    CHECK(conn.last_error().find("127.0.0.1") != std::string::npos);

    ep.host = "no-such-host.invalid";
    CHECK_FALSE(conn.connect(ep));
}
