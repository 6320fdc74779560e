#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>
#include "../../tagcache/store/resp_protocol.h"

using namespace tagcache;

TEST_CASE("RESP encoding")
{
    std::string buf;

    SUBCASE("simple and error")
    {
        resp::encode_simple_into(buf, "PONG");
        resp::encode_error_into(buf, "ERR boom");
        CHECK(buf == "+PONG\r\n-ERR boom\r\n");
    }

    SUBCASE("integer")
    {
        resp::encode_integer_into(buf, 42);
        resp::encode_integer_into(buf, -1);
        CHECK(buf == ":42\r\n:-1\r\n");
    }

    SUBCASE("bulk")
    {
        resp::encode_bulk_into(buf, "hello");
        resp::encode_bulk_into(buf, "");
        resp::encode_bulk_into(buf, "0123456789ab");
        CHECK(buf == "$5\r\nhello\r\n$0\r\n\r\n$12\r\n0123456789ab\r\n");
    }

    SUBCASE("null")
    {
        resp::encode_null_into(buf);
        CHECK(buf == "$-1\r\n");
    }

    SUBCASE("command")
    {
        CHECK(resp::encode_command({"SET", "key", "value"}) ==
              "*3\r\n$3\r\nSET\r\n$3\r\nkey\r\n$5\r\nvalue\r\n");
    }

    SUBCASE("nested reply")
    {
        auto r = resp::reply::make_array({resp::reply::make_bulk("0"),
                                          resp::reply::make_array({resp::reply::make_bulk("a")})});
        resp::encode_reply_into(buf, r);
        CHECK(buf == "*2\r\n$1\r\n0\r\n*1\r\n$1\r\na\r\n");
    }
}

TEST_CASE("RESP request parsing")
{
    std::vector<std::string> args;
    size_t consumed = 0;

    SUBCASE("SET command")
    {
        std::string buf = "*3\r\n$3\r\nSET\r\n$3\r\nkey\r\n$5\r\nvalue\r\n";
        CHECK(resp::parse_message(buf, args, consumed) == resp::parse_result::ok);
        CHECK(consumed == buf.size());
        REQUIRE(args.size() == 3);
        CHECK(args[0] == "SET");
        CHECK(args[2] == "value");
    }

    SUBCASE("incomplete message")
    {
        std::string buf = "*2\r\n$3\r\nGET\r\n$3\r\nke";
        CHECK(resp::parse_message(buf, args, consumed) == resp::parse_result::incomplete);
    }

    SUBCASE("empty buffer")
    {
        CHECK(resp::parse_message("", args, consumed) == resp::parse_result::incomplete);
    }

    SUBCASE("pipelined messages")
    {
        std::string buf = "*1\r\n$4\r\nPING\r\n*2\r\n$3\r\nGET\r\n$3\r\nkey\r\n";
        CHECK(resp::parse_message(buf, args, consumed) == resp::parse_result::ok);
        REQUIRE(args.size() == 1);
        CHECK(consumed < buf.size());

        std::string_view remaining(buf.data() + consumed, buf.size() - consumed);
        CHECK(resp::parse_message(remaining, args, consumed) == resp::parse_result::ok);
        REQUIRE(args.size() == 2);
        CHECK(args[0] == "GET");
    }

    SUBCASE("inline commands are rejected")
    {
        CHECK(resp::parse_message("set key value\r\n", args, consumed) == resp::parse_result::error);
    }
}

TEST_CASE("RESP reply parsing")
{
    resp::reply r;
    size_t consumed = 0;

    SUBCASE("simple string")
    {
        REQUIRE(resp::parse_reply("+OK\r\n", r, consumed) == resp::parse_result::ok);
        CHECK(r.type == resp::reply_type::simple);
        CHECK(r.str == "OK");
        CHECK(consumed == 5);
    }

    SUBCASE("error keeps the full message")
    {
        REQUIRE(resp::parse_reply("-WRONGTYPE Operation against a key\r\n", r, consumed) == resp::parse_result::ok);
        CHECK(r.is_error());
        CHECK(r.str == "WRONGTYPE Operation against a key");
    }

    SUBCASE("integer")
    {
        REQUIRE(resp::parse_reply(":-2\r\n", r, consumed) == resp::parse_result::ok);
        CHECK(r.integer == -2);
        CHECK(resp::parse_reply(":12x\r\n", r, consumed) == resp::parse_result::error);
    }

    SUBCASE("bulk with embedded CRLF")
    {
        std::string buf = "$4\r\na\r\nb\r\n";
        REQUIRE(resp::parse_reply(buf, r, consumed) == resp::parse_result::ok);
        CHECK(r.str == "a\r\nb");
        CHECK(consumed == buf.size());
    }

    SUBCASE("nil bulk and nil array")
    {
        REQUIRE(resp::parse_reply("$-1\r\n", r, consumed) == resp::parse_result::ok);
        CHECK(r.is_nil());
        REQUIRE(resp::parse_reply("*-1\r\n", r, consumed) == resp::parse_result::ok);
        CHECK(r.is_nil());
    }

    SUBCASE("scan reply")
    {
        std::string buf = "*2\r\n$2\r\n17\r\n*2\r\n$1\r\na\r\n$1\r\nb\r\n";
        REQUIRE(resp::parse_reply(buf, r, consumed) == resp::parse_result::ok);
        REQUIRE(r.elements.size() == 2);
        CHECK(r.elements[0].str == "17");
        REQUIRE(r.elements[1].elements.size() == 2);
        CHECK(r.elements[1].elements[1].str == "b");
    }

    SUBCASE("partial reply")
    {
        CHECK(resp::parse_reply("*2\r\n$1\r\na\r\n", r, consumed) == resp::parse_result::incomplete);
        CHECK(resp::parse_reply("$5\r\nhel", r, consumed) == resp::parse_result::incomplete);
        CHECK(consumed == 0);
    }

    SUBCASE("nesting limit")
    {
        std::string buf;
        for (int i = 0; i <= resp::RESP_MAX_DEPTH + 1; ++i)
            buf += "*1\r\n";
        buf += ":1\r\n";
        CHECK(resp::parse_reply(buf, r, consumed) == resp::parse_result::error);
    }

    SUBCASE("unknown marker")
    {
        CHECK(resp::parse_reply("!oops\r\n", r, consumed) == resp::parse_result::error);
    }

    SUBCASE("as_bool")
    {
        CHECK(resp::reply::make_integer(1).as_bool());
        CHECK_FALSE(resp::reply::make_integer(0).as_bool());
        CHECK(resp::reply::make_bulk("1").as_bool());
        CHECK_FALSE(resp::reply::make_nil().as_bool());
    }
}
