#include "cache_client.h"

#include <charconv>
#include <limits>

namespace tagcache {

// ─── Helpers ───

void check_reply(const resp::reply& r, std::string_view context)
{
    if (!r.is_error())
        return;
    std::string msg(context);
    msg += ": ";
    msg += r.str;
    throw store_error(msg);
}

bool parse_double(std::string_view s, double& out)
{
    if (s == "inf" || s == "+inf") { out = std::numeric_limits<double>::infinity(); return true; }
    if (s == "-inf") { out = -std::numeric_limits<double>::infinity(); return true; }
    auto [p, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
    return ec == std::errc{} && p == s.data() + s.size();
}

namespace {

std::string format_double(double d)
{
    char buf[32];
    auto [end, ec] = std::to_chars(buf, buf + sizeof(buf), d);
    return std::string(buf, static_cast<size_t>(end - buf));
}

std::optional<std::string> optional_string(resp::reply&& r)
{
    if (!r.is_string())
        return std::nullopt;
    return std::move(r.str);
}

uint64_t parse_cursor(const resp::reply& r)
{
    uint64_t cursor = 0;
    if (r.is_string())
        std::from_chars(r.str.data(), r.str.data() + r.str.size(), cursor);
    else if (r.type == resp::reply_type::integer)
        cursor = static_cast<uint64_t>(r.integer);
    return cursor;
}

// SCAN/HSCAN reply: [cursor, [items...]]
const resp::reply& scan_items(const resp::reply& r, uint64_t& cursor)
{
    if (r.type != resp::reply_type::array || r.elements.size() != 2 ||
        r.elements[1].type != resp::reply_type::array)
        throw store_error("malformed scan reply");
    cursor = parse_cursor(r.elements[0]);
    return r.elements[1];
}

} // namespace

cache_client::cache_client(std::shared_ptr<connection_pool> pool)
    : m_pool(std::move(pool))
{
}

resp::reply cache_client::run(const command& cmd)
{
    resp::reply r;
    {
        auto conn = m_pool->acquire();
        r = conn->execute(cmd);
    }
    check_reply(r, cmd.empty() ? std::string_view("command") : std::string_view(cmd[0]));
    return r;
}

std::vector<resp::reply> cache_client::pipeline(const std::vector<command>& cmds)
{
    if (cmds.empty())
        return {};
    auto conn = m_pool->acquire();
    return conn->execute_batch(cmds);
}

std::optional<std::vector<resp::reply>> cache_client::watched_exec(
    std::string_view key, const command& read,
    const std::function<std::vector<command>(const resp::reply&)>& build)
{
    auto conn = m_pool->acquire();
    check_reply(conn->execute({"WATCH", std::string(key)}), "WATCH");

    resp::reply current = conn->execute(read);
    std::vector<command> queued;
    if (!current.is_error())
        queued = build(current);
    if (queued.empty())
    {
        check_reply(conn->execute({"UNWATCH"}), "UNWATCH");
        check_reply(current, read.empty() ? std::string_view("command") : std::string_view(read[0]));
        return std::vector<resp::reply>{};
    }

    std::vector<command> batch;
    batch.reserve(queued.size() + 2);
    batch.push_back({"MULTI"});
    for (auto& c : queued)
        batch.push_back(std::move(c));
    batch.push_back({"EXEC"});

    auto replies = conn->execute_batch(batch);
    if (replies.size() != batch.size())
        throw store_error("EXEC: short reply batch");
    for (size_t i = 0; i + 1 < replies.size(); ++i)
        check_reply(replies[i], i == 0 ? "MULTI" : "queued command");

    resp::reply& exec = replies.back();
    check_reply(exec, "EXEC");
    if (exec.is_nil())
        return std::nullopt;
    return std::move(exec.elements);
}

resp::reply cache_client::write_with_ttl(command write, std::string_view key, ttl_option ttl)
{
    if (!ttl)
        return run(write);

    std::string name = write[0];
    auto replies = pipeline({std::move(write),
                             {"PEXPIRE", std::string(key), std::to_string(ttl->count())}});
    check_reply(replies[0], name);
    check_reply(replies[1], "PEXPIRE");
    return std::move(replies[0]);
}

bool cache_client::ping()
{
    return run({"PING"}).is_string();
}

void cache_client::flushall()
{
    run({"FLUSHALL"});
}

// ─── Strings / keys ───

std::optional<std::string> cache_client::get(std::string_view key)
{
    return optional_string(run({"GET", std::string(key)}));
}

bool cache_client::set(std::string_view key, std::string_view value, ttl_option ttl, write_condition when)
{
    command cmd{"SET", std::string(key), std::string(value)};
    if (ttl)
    {
        cmd.emplace_back("PX");
        cmd.push_back(std::to_string(ttl->count()));
    }
    if (when == when_not_exists)
        cmd.emplace_back("NX");
    else if (when == when_exists)
        cmd.emplace_back("XX");

    // Conditional SET answers nil when the condition rejected the write
    return !run(cmd).is_nil();
}

std::optional<std::string> cache_client::getset(std::string_view key, std::string_view value)
{
    return optional_string(run({"GETSET", std::string(key), std::string(value)}));
}

bool cache_client::exists(std::string_view key)
{
    return run({"EXISTS", std::string(key)}).integer > 0;
}

bool cache_client::del(std::string_view key)
{
    return run({"DEL", std::string(key)}).integer > 0;
}

int64_t cache_client::del(const std::vector<std::string>& keys)
{
    if (keys.empty())
        return 0;
    command cmd{"DEL"};
    cmd.insert(cmd.end(), keys.begin(), keys.end());
    return run(cmd).integer;
}

bool cache_client::expire(std::string_view key, std::chrono::milliseconds ttl)
{
    return run({"PEXPIRE", std::string(key), std::to_string(ttl.count())}).as_bool();
}

bool cache_client::expire_at(std::string_view key, std::chrono::system_clock::time_point when)
{
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(when.time_since_epoch()).count();
    return run({"PEXPIREAT", std::string(key), std::to_string(ms)}).as_bool();
}

std::optional<std::chrono::milliseconds> cache_client::ttl(std::string_view key)
{
    int64_t ms = run({"PTTL", std::string(key)}).integer;
    if (ms < 0)
        return std::nullopt;
    return std::chrono::milliseconds(ms);
}

bool cache_client::persist(std::string_view key)
{
    return run({"PERSIST", std::string(key)}).as_bool();
}

std::string cache_client::type(std::string_view key)
{
    return run({"TYPE", std::string(key)}).str;
}

// ─── Hashes ───

std::optional<std::string> cache_client::hget(std::string_view key, std::string_view field)
{
    return optional_string(run({"HGET", std::string(key), std::string(field)}));
}

bool cache_client::hset(std::string_view key, std::string_view field, std::string_view value,
                        ttl_option ttl, write_condition when)
{
    switch (when)
    {
        case when_not_exists:
        {
            bool written = run({"HSETNX", std::string(key), std::string(field), std::string(value)}).as_bool();
            if (written && ttl)
                expire(key, *ttl);
            return written;
        }
        case when_exists:
            // Not atomic: the field may disappear between the check and the write
            if (!hexists(key, field))
                return false;
            [[fallthrough]];
        default:
            write_with_ttl({"HSET", std::string(key), std::string(field), std::string(value)}, key, ttl);
            return true;
    }
}

int64_t cache_client::hset(std::string_view key, const std::vector<std::pair<std::string, std::string>>& pairs,
                           ttl_option ttl, write_condition when)
{
    if (pairs.empty())
        return 0;

    if (when != when_always)
    {
        int64_t written = 0;
        for (const auto& [field, value] : pairs)
            written += hset(key, field, value, {}, when) ? 1 : 0;
        if (written > 0 && ttl)
            expire(key, *ttl);
        return written;
    }

    command cmd{"HSET", std::string(key)};
    cmd.reserve(2 + pairs.size() * 2);
    for (const auto& [field, value] : pairs)
    {
        cmd.push_back(field);
        cmd.push_back(value);
    }
    write_with_ttl(std::move(cmd), key, ttl);
    return static_cast<int64_t>(pairs.size());
}

bool cache_client::hexists(std::string_view key, std::string_view field)
{
    return run({"HEXISTS", std::string(key), std::string(field)}).as_bool();
}

std::vector<std::optional<std::string>> cache_client::hmget(std::string_view key, const std::vector<std::string>& fields)
{
    std::vector<std::optional<std::string>> out;
    if (fields.empty())
        return out;

    command cmd{"HMGET", std::string(key)};
    cmd.insert(cmd.end(), fields.begin(), fields.end());
    resp::reply r = run(cmd);

    out.reserve(fields.size());
    for (auto& e : r.elements)
        out.push_back(optional_string(std::move(e)));
    out.resize(fields.size());
    return out;
}

std::vector<std::pair<std::string, std::string>> cache_client::hgetall(std::string_view key)
{
    resp::reply r = run({"HGETALL", std::string(key)});
    std::vector<std::pair<std::string, std::string>> out;
    out.reserve(r.elements.size() / 2);
    for (size_t i = 0; i + 1 < r.elements.size(); i += 2)
        out.emplace_back(std::move(r.elements[i].str), std::move(r.elements[i + 1].str));
    return out;
}

bool cache_client::hdel(std::string_view key, std::string_view field)
{
    return run({"HDEL", std::string(key), std::string(field)}).integer > 0;
}

// ─── Sets ───

bool cache_client::sadd(std::string_view key, std::string_view member, ttl_option ttl)
{
    return write_with_ttl({"SADD", std::string(key), std::string(member)}, key, ttl).integer > 0;
}

bool cache_client::srem(std::string_view key, std::string_view member)
{
    return run({"SREM", std::string(key), std::string(member)}).integer > 0;
}

bool cache_client::sismember(std::string_view key, std::string_view member)
{
    return run({"SISMEMBER", std::string(key), std::string(member)}).as_bool();
}

std::vector<std::string> cache_client::smembers(std::string_view key)
{
    resp::reply r = run({"SMEMBERS", std::string(key)});
    std::vector<std::string> out;
    out.reserve(r.elements.size());
    for (auto& e : r.elements)
        out.push_back(std::move(e.str));
    return out;
}

// ─── Sorted sets ───

bool cache_client::zadd(std::string_view key, double score, std::string_view member, ttl_option ttl)
{
    return write_with_ttl({"ZADD", std::string(key), format_double(score), std::string(member)},
                          key, ttl).integer > 0;
}

bool cache_client::zrem(std::string_view key, std::string_view member)
{
    return run({"ZREM", std::string(key), std::string(member)}).integer > 0;
}

std::optional<double> cache_client::zscore(std::string_view key, std::string_view member)
{
    resp::reply r = run({"ZSCORE", std::string(key), std::string(member)});
    if (!r.is_string())
        return std::nullopt;
    double score = 0;
    if (!parse_double(r.str, score))
        throw store_error("ZSCORE: malformed score '" + r.str + "'");
    return score;
}

std::vector<std::string> cache_client::zrange(std::string_view key, int64_t start, int64_t stop)
{
    resp::reply r = run({"ZRANGE", std::string(key), std::to_string(start), std::to_string(stop)});
    std::vector<std::string> out;
    out.reserve(r.elements.size());
    for (auto& e : r.elements)
        out.push_back(std::move(e.str));
    return out;
}

// ─── HyperLogLog ───

bool cache_client::pfadd(std::string_view key, const std::vector<std::string>& items)
{
    command cmd{"PFADD", std::string(key)};
    cmd.insert(cmd.end(), items.begin(), items.end());
    return run(cmd).as_bool();
}

int64_t cache_client::pfcount(std::string_view key)
{
    return run({"PFCOUNT", std::string(key)}).integer;
}

// ─── Enumeration ───

std::vector<std::string> cache_client::keys(std::string_view pattern)
{
    resp::reply r = run({"KEYS", std::string(pattern)});
    std::vector<std::string> out;
    out.reserve(r.elements.size());
    for (auto& e : r.elements)
        out.push_back(std::move(e.str));
    return out;
}

scan_page cache_client::scan(uint64_t cursor, std::string_view pattern, size_t count)
{
    resp::reply r = run({"SCAN", std::to_string(cursor), "MATCH", std::string(pattern),
                         "COUNT", std::to_string(count)});
    scan_page page;
    const resp::reply& items = scan_items(r, page.cursor);
    page.keys.reserve(items.elements.size());
    for (const auto& e : items.elements)
        page.keys.push_back(e.str);
    return page;
}

hash_scan_page cache_client::hscan(std::string_view key, uint64_t cursor, std::string_view pattern, size_t count)
{
    resp::reply r = run({"HSCAN", std::string(key), std::to_string(cursor), "MATCH", std::string(pattern),
                         "COUNT", std::to_string(count)});
    hash_scan_page page;
    const resp::reply& items = scan_items(r, page.cursor);
    page.fields.reserve(items.elements.size() / 2);
    for (size_t i = 0; i + 1 < items.elements.size(); i += 2)
        page.fields.emplace_back(items.elements[i].str, items.elements[i + 1].str);
    return page;
}

} // namespace tagcache
