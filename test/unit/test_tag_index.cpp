#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>
#include "../../tagcache/client/tag_index.h"
#include "test_helpers.h"

#include <algorithm>
#include <set>

using namespace tagcache;

namespace {

struct fixture
{
    std::shared_ptr<memory_keyspace> ks = std::make_shared<memory_keyspace>();
    cache_client client{make_memory_pool(ks)};
    pattern_scanner scanner{client, scan_cursor, 3};
    tag_index tags{client, scanner};
};

std::set<std::string> sorted(std::vector<std::string> v)
{
    return {v.begin(), v.end()};
}

} // namespace

TEST_CASE("tag_entry encoding")
{
    SUBCASE("every kind decodes back")
    {
        std::vector<tag_entry> samples{
            tag_entry::string_key("cart:1"),
            tag_entry::hash_field("h", "f"),
            tag_entry::set_member("s:1", ":member:"),
            tag_entry::sorted_set_member("", "m"),
        };
        for (const auto& e : samples)
        {
            tag_entry back;
            REQUIRE(tag_entry::decode(e.encode(), back));
            CHECK(back == e);
        }
    }

    SUBCASE("key length keeps key and field apart")
    {
        auto a = tag_entry::hash_field("ab", "c");
        auto b = tag_entry::hash_field("a", "bc");
        CHECK(a.encode() != b.encode());
        CHECK(a.encode() == "h:2:abc");
    }

    SUBCASE("malformed input")
    {
        tag_entry out;
        CHECK_FALSE(tag_entry::decode("", out));
        CHECK_FALSE(tag_entry::decode("x:1:a", out));
        CHECK_FALSE(tag_entry::decode("s:9:a", out));
        CHECK_FALSE(tag_entry::decode("s::a", out));
        CHECK_FALSE(tag_entry::decode("s:1a", out));
        CHECK_FALSE(tag_entry::decode("s:1:ab", out));   // string keys carry no field
        CHECK(tag_entry::decode("s:0:", out));
    }
}

TEST_CASE("key layout")
{
    fixture f;
    CHECK(f.tags.prefix() == "_tag:");
    CHECK(f.tags.set_key("news") == "_tag:set:news");
    CHECK(f.tags.record_key(tag_entry::string_key("k")) == "_tag:entry:s:1:k");
}

TEST_CASE("associate replaces the tag set")
{
    fixture f;
    auto entry = tag_entry::string_key("cart:1");
    f.client.set("cart:1", "v");

    f.tags.associate(entry, {"a", "b", "a"});
    CHECK(sorted(f.tags.tags_of(entry)) == std::set<std::string>{"a", "b"});
    CHECK(f.client.smembers("_tag:set:a") == std::vector<std::string>{entry.encode()});

    f.tags.associate(entry, {"b", "c"});
    CHECK(sorted(f.tags.tags_of(entry)) == std::set<std::string>{"b", "c"});
    CHECK_FALSE(f.tags.is_in_tag(entry, {"a"}));
    CHECK(f.tags.is_in_tag(entry, {"c"}));
    CHECK_FALSE(f.client.exists("_tag:set:a"));

    SUBCASE("empty list keeps existing tags")
    {
        f.tags.associate(entry, {});
        CHECK(f.tags.tags_of(entry).size() == 2);
    }
}

TEST_CASE("is_in_tag")
{
    fixture f;
    auto entry = tag_entry::string_key("k");
    f.client.set("k", "v");
    f.tags.associate(entry, {"x"});

    CHECK(f.tags.is_in_tag(entry, {"y", "x"}));
    CHECK_FALSE(f.tags.is_in_tag(entry, {"y"}));
    CHECK_FALSE(f.tags.is_in_tag(entry, {}));
    CHECK_FALSE(f.tags.is_in_tag(tag_entry::string_key("other"), {"x"}));

    SUBCASE("dead entries report false and are dropped")
    {
        f.client.del("k");
        CHECK_FALSE(f.tags.is_in_tag(entry, {"x"}));
        CHECK_FALSE(f.client.exists("_tag:set:x"));
        CHECK_FALSE(f.client.exists(f.tags.record_key(entry)));

        // recreating the value does not resurrect the tag
        f.client.set("k", "v");
        CHECK_FALSE(f.tags.is_in_tag(entry, {"x"}));
    }

    SUBCASE("a key of another type counts as dead")
    {
        auto field = tag_entry::hash_field("k", "f");
        f.tags.associate(field, {"x"});
        CHECK_FALSE(f.tags.is_in_tag(field, {"x"}));
        CHECK(f.tags.is_in_tag(entry, {"x"}));
    }
}

TEST_CASE("liveness per entry kind")
{
    fixture f;
    f.client.hset("h", "f", "1");
    f.client.sadd("s", "m");
    f.client.zadd("z", 0, "m");

    auto field = tag_entry::hash_field("h", "f");
    auto member = tag_entry::set_member("s", "m");
    auto scored = tag_entry::sorted_set_member("z", "m");
    for (const auto& e : {field, member, scored})
        f.tags.associate(e, {"t"});

    CHECK(f.tags.entries({"t"}).size() == 3);

    f.client.hdel("h", "f");
    f.client.srem("s", "m");
    CHECK(f.tags.entries({"t"}) == std::vector<tag_entry>{scored});

    f.client.zrem("z", "m");
    CHECK_FALSE(f.tags.is_in_tag(scored, {"t"}));
    CHECK(f.tags.entries({"t"}).empty());
}

TEST_CASE("entries")
{
    fixture f;
    for (int i = 0; i < 5; ++i)
    {
        std::string key = "k" + std::to_string(i);
        f.client.set(key, "v");
        f.tags.associate(tag_entry::string_key(key), {i % 2 ? "odd" : "even", "all"});
    }

    CHECK(f.tags.entries({"odd"}).size() == 2);
    CHECK(f.tags.entries({"odd", "even"}).size() == 5);
    CHECK(f.tags.entries({"all", "odd", "all"}).size() == 5);
    CHECK(f.tags.entries({"none"}).empty());
    CHECK(f.tags.entries({}).empty());

    SUBCASE("dead entries are dropped from every tag")
    {
        f.client.del("k1");
        CHECK(f.tags.entries({"odd"}).size() == 1);
        CHECK(f.client.smembers("_tag:set:all").size() == 4);
    }

    SUBCASE("malformed members are removed")
    {
        f.client.sadd("_tag:set:odd", "garbage");
        CHECK(f.tags.entries({"odd"}).size() == 2);
        CHECK_FALSE(f.client.sismember("_tag:set:odd", "garbage"));
    }
}

TEST_CASE("remove_tags")
{
    fixture f;
    auto entry = tag_entry::string_key("k");
    f.client.set("k", "v");
    f.tags.associate(entry, {"a", "b", "c"});

    f.tags.remove_tags(entry, {"a", "c", "zz"});
    CHECK(f.tags.tags_of(entry) == std::vector<std::string>{"b"});
    CHECK_FALSE(f.tags.is_in_tag(entry, {"a", "c"}));
    CHECK(f.tags.is_in_tag(entry, {"b"}));
    CHECK(f.client.exists("k"));
}

TEST_CASE("invalidate")
{
    fixture f;
    f.client.set("s1", "v");
    f.client.set("s2", "v");
    f.client.hset("h", {{"f1", "1"}, {"f2", "2"}});
    f.client.sadd("set", "m");
    f.client.zadd("z", 1, "m");

    f.tags.associate(tag_entry::string_key("s1"), {"t"});
    f.tags.associate(tag_entry::string_key("s2"), {"other"});
    f.tags.associate(tag_entry::hash_field("h", "f1"), {"t"});
    f.tags.associate(tag_entry::set_member("set", "m"), {"t", "other"});
    f.tags.associate(tag_entry::sorted_set_member("z", "m"), {"t"});

    f.client.set("stale", "v");
    f.tags.associate(tag_entry::string_key("stale"), {"t"});
    f.client.del("stale");

    CHECK(f.tags.invalidate({"t"}) == 4);

    CHECK_FALSE(f.client.exists("s1"));
    CHECK(f.client.exists("s2"));
    CHECK_FALSE(f.client.hexists("h", "f1"));
    CHECK(f.client.hexists("h", "f2"));
    CHECK_FALSE(f.client.sismember("set", "m"));
    CHECK_FALSE(f.client.zscore("z", "m").has_value());

    CHECK_FALSE(f.client.exists("_tag:set:t"));
    // the set member is gone, so it no longer shows under its other tag
    CHECK(f.client.smembers("_tag:set:other") == std::vector<std::string>{tag_entry::string_key("s2").encode()});
    CHECK(f.tags.invalidate({"t"}) == 0);
    CHECK(f.tags.invalidate({}) == 0);
}

TEST_CASE("all_tags")
{
    fixture f;
    f.client.set("a", "v");
    f.client.set("b", "v");
    f.tags.associate(tag_entry::string_key("a"), {"news", "sport"});
    f.tags.associate(tag_entry::string_key("b"), {"weather"});
    f.client.set("_tag:settings", "not a tag");

    CHECK(sorted(f.tags.all_tags()) == std::set<std::string>{"news", "sport", "weather"});
}

TEST_CASE("custom prefix isolates indexes")
{
    auto ks = std::make_shared<memory_keyspace>();
    cache_client client(make_memory_pool(ks));
    pattern_scanner scanner(client);
    tag_index first(client, scanner, "app1:");
    tag_index second(client, scanner, "app2:");

    client.set("k", "v");
    auto entry = tag_entry::string_key("k");
    first.associate(entry, {"t"});

    CHECK(first.set_key("t") == "app1:set:t");
    CHECK(first.is_in_tag(entry, {"t"}));
    CHECK_FALSE(second.is_in_tag(entry, {"t"}));
    CHECK(first.all_tags() == std::vector<std::string>{"t"});
    CHECK(second.all_tags().empty());

    tag_index fallback(client, scanner, "");
    CHECK(fallback.prefix() == "_tag:");
}
