#include "memory_backend.h"
#include "../shared/command_hashing.h"

#include <charconv>
#include <chrono>
#include <limits>
#include <string>

namespace tagcache {

namespace {

constexpr std::string_view WRONGTYPE = "WRONGTYPE Operation against a key holding the wrong kind of value";

bool parse_int(std::string_view s, int64_t& out)
{
    auto [p, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
    return ec == std::errc{} && p == s.data() + s.size();
}

bool parse_score(std::string_view s, double& out)
{
    if (s == "+inf" || s == "inf") { out = std::numeric_limits<double>::infinity(); return true; }
    if (s == "-inf") { out = -std::numeric_limits<double>::infinity(); return true; }
    auto [p, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
    return ec == std::errc{} && p == s.data() + s.size();
}

std::string format_score(double d)
{
    char buf[32];
    auto [end, ec] = std::to_chars(buf, buf + sizeof(buf), d);
    return std::string(buf, static_cast<size_t>(end - buf));
}

resp::reply wrong_args(std::string_view cmd)
{
    std::string msg = "ERR wrong number of arguments for '";
    msg.append(cmd.data(), cmd.size());
    msg += "' command";
    return resp::reply::make_error(msg);
}

bool wrong_type(const memory_store& store, std::string_view key, std::string_view wanted)
{
    std::string_view t = store.type(key);
    return t != "none" && t != wanted;
}

resp::reply ok()
{
    return resp::reply::make_simple("OK");
}

resp::reply bulk_or_nil(const std::string* s)
{
    return s ? resp::reply::make_bulk(*s) : resp::reply::make_nil();
}

} // namespace

void memory_keyspace::disable_command(std::string_view name)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_disabled.insert(fnv1a_lower(name));
}

uint32_t memory_keyspace::size()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_store.sweep_expired();
    return m_store.size();
}

resp::reply memory_keyspace::execute(const command& cmd)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return apply(cmd);
}

std::vector<resp::reply> memory_keyspace::execute_batch(const std::vector<command>& cmds)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<resp::reply> out;
    out.reserve(cmds.size());
    for (const auto& c : cmds)
        out.push_back(apply(c));
    return out;
}

// ─── Optimistic transactions ───

uint64_t memory_keyspace::watch(const std::string& key)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    watch_slot& slot = m_watches[key];
    ++slot.watchers;
    return slot.version;
}

void memory_keyspace::unwatch(const watch_list& watched)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    release_watches(watched);
}

resp::reply memory_keyspace::exec(const watch_list& watched, const std::vector<command>& queued)
{
    std::lock_guard<std::mutex> lock(m_mutex);

    bool dirty = false;
    for (const auto& [key, version] : watched)
    {
        auto it = m_watches.find(key);
        if (it == m_watches.end() || it->second.version != version)
        {
            dirty = true;
            break;
        }
    }
    release_watches(watched);
    if (dirty)
        return resp::reply::make_nil();

    std::vector<resp::reply> out;
    out.reserve(queued.size());
    for (const auto& c : queued)
        out.push_back(apply(c));
    return resp::reply::make_array(std::move(out));
}

void memory_keyspace::release_watches(const watch_list& watched)
{
    for (const auto& entry : watched)
    {
        auto it = m_watches.find(entry.first);
        if (it != m_watches.end() && --it->second.watchers == 0)
            m_watches.erase(it);
    }
}

resp::reply memory_keyspace::apply(const command& cmd)
{
    resp::reply r = dispatch(cmd);
    if (!m_watches.empty() && !r.is_error())
        touch_written(cmd);
    return r;
}

// Bumps the version of every watched key `cmd` may have written
void memory_keyspace::touch_written(const command& cmd)
{
    auto bump = [this](const std::string& key)
    {
        auto it = m_watches.find(key);
        if (it != m_watches.end())
            ++it->second.version;
    };

    switch (fnv1a_lower(cmd[0]))
    {
        case fnv1a("del"):
        case fnv1a("unlink"):
            for (size_t i = 1; i < cmd.size(); ++i)
                bump(cmd[i]);
            break;
        case fnv1a("flushall"):
        case fnv1a("flushdb"):
            for (auto& [key, slot] : m_watches)
                ++slot.version;
            break;
        case fnv1a("set"):
        case fnv1a("getset"):
        case fnv1a("expire"):
        case fnv1a("pexpire"):
        case fnv1a("expireat"):
        case fnv1a("pexpireat"):
        case fnv1a("persist"):
        case fnv1a("hset"):
        case fnv1a("hsetnx"):
        case fnv1a("hdel"):
        case fnv1a("sadd"):
        case fnv1a("srem"):
        case fnv1a("zadd"):
        case fnv1a("zrem"):
        case fnv1a("pfadd"):
            bump(cmd[1]);
            break;
        default:
            break;
    }
}

resp::reply memory_keyspace::dispatch(const command& cmd)
{
    if (cmd.empty())
        return resp::reply::make_error("ERR empty command");

    const std::string& name = cmd[0];
    const size_t argc = cmd.size();
    uint32_t h = fnv1a_lower(name);

    if (!m_disabled.empty() && m_disabled.count(h))
        return resp::reply::make_error("ERR unknown command '" + name + "'");

    // Lazily expire the key the command touches
    if (argc > 1)
        m_store.check_expiry(cmd[1]);

    switch (h)
    {
        // ─── Connection ───

        case fnv1a("ping"):
            return argc > 1 ? resp::reply::make_bulk(cmd[1]) : resp::reply::make_simple("PONG");
        case fnv1a("auth"):
        case fnv1a("select"):
        case fnv1a("unwatch"):
            return ok();

        // ─── Strings ───

        case fnv1a("get"):
        {
            if (argc != 2) return wrong_args(name);
            if (wrong_type(m_store, cmd[1], "string"))
                return resp::reply::make_error(WRONGTYPE);
            return bulk_or_nil(m_store.get_ptr(cmd[1]));
        }
        case fnv1a("set"):
        {
            if (argc < 3) return wrong_args(name);
            const auto& key = cmd[1];
            int64_t ttl_ms = 0;
            bool nx = false, xx = false;
            for (size_t i = 3; i < argc; ++i)
            {
                switch (fnv1a_lower(cmd[i]))
                {
                    case fnv1a("nx"): nx = true; break;
                    case fnv1a("xx"): xx = true; break;
                    case fnv1a("px"):
                    case fnv1a("ex"):
                    {
                        bool seconds = fnv1a_lower(cmd[i]) == fnv1a("ex");
                        if (i + 1 >= argc || !parse_int(cmd[i + 1], ttl_ms) || ttl_ms <= 0)
                            return resp::reply::make_error("ERR invalid expire time in 'set' command");
                        if (seconds)
                            ttl_ms *= 1000;
                        ++i;
                        break;
                    }
                    default:
                        return resp::reply::make_error("ERR syntax error");
                }
            }
            if (nx && xx)
                return resp::reply::make_error("ERR syntax error");

            bool present = m_store.exists(key);
            if ((nx && present) || (xx && !present))
                return resp::reply::make_nil();

            m_store.set(key, cmd[2]);
            if (ttl_ms > 0)
                m_store.set_expiry_ms(key, ttl_ms);
            return ok();
        }
        case fnv1a("getset"):
        {
            if (argc != 3) return wrong_args(name);
            std::string old;
            bool had_old = false;
            if (!m_store.getset(cmd[1], cmd[2], old, had_old))
                return resp::reply::make_error(WRONGTYPE);
            return had_old ? resp::reply::make_bulk(old) : resp::reply::make_nil();
        }
        case fnv1a("exists"):
        {
            if (argc < 2) return wrong_args(name);
            int64_t n = 0;
            for (size_t i = 1; i < argc; ++i)
            {
                m_store.check_expiry(cmd[i]);
                n += m_store.exists(cmd[i]) ? 1 : 0;
            }
            return resp::reply::make_integer(n);
        }
        case fnv1a("del"):
        case fnv1a("unlink"):
        {
            if (argc < 2) return wrong_args(name);
            int64_t n = 0;
            for (size_t i = 1; i < argc; ++i)
            {
                m_store.check_expiry(cmd[i]);
                n += m_store.del(cmd[i]) ? 1 : 0;
            }
            return resp::reply::make_integer(n);
        }
        case fnv1a("type"):
        {
            if (argc != 2) return wrong_args(name);
            return resp::reply::make_simple(m_store.type(cmd[1]));
        }

        // ─── TTL / Expiry ───

        case fnv1a("expire"):
        case fnv1a("pexpire"):
        {
            if (argc != 3) return wrong_args(name);
            int64_t n = 0;
            if (!parse_int(cmd[2], n))
                return resp::reply::make_error("ERR value is not an integer or out of range");
            if (h == fnv1a("expire"))
                n *= 1000;
            return resp::reply::make_integer(m_store.set_expiry_ms(cmd[1], n) ? 1 : 0);
        }
        case fnv1a("expireat"):
        case fnv1a("pexpireat"):
        {
            if (argc != 3) return wrong_args(name);
            int64_t n = 0;
            if (!parse_int(cmd[2], n))
                return resp::reply::make_error("ERR value is not an integer or out of range");
            std::chrono::system_clock::time_point when{};
            if (h == fnv1a("expireat"))
                when += std::chrono::seconds(n);
            else
                when += std::chrono::milliseconds(n);
            return resp::reply::make_integer(m_store.set_expiry_at(cmd[1], when) ? 1 : 0);
        }
        case fnv1a("ttl"):
        case fnv1a("pttl"):
        {
            if (argc != 2) return wrong_args(name);
            int64_t ms = m_store.get_pttl(cmd[1]);
            if (ms >= 0 && h == fnv1a("ttl"))
                ms = (ms + 500) / 1000;
            return resp::reply::make_integer(ms);
        }
        case fnv1a("persist"):
        {
            if (argc != 2) return wrong_args(name);
            return resp::reply::make_integer(m_store.persist(cmd[1]) ? 1 : 0);
        }

        // ─── Keyspace ───

        case fnv1a("keys"):
        {
            if (argc != 2) return wrong_args(name);
            m_store.sweep_expired();
            std::vector<std::string_view> keys;
            m_store.keys(cmd[1], keys);
            std::vector<resp::reply> items;
            items.reserve(keys.size());
            for (auto k : keys)
                items.push_back(resp::reply::make_bulk(k));
            return resp::reply::make_array(std::move(items));
        }
        case fnv1a("scan"):
        case fnv1a("hscan"):
        {
            bool hash_scan = h == fnv1a("hscan");
            size_t first_opt = hash_scan ? 3 : 2;
            if (argc < first_opt) return wrong_args(name);

            int64_t cursor = 0;
            if (!parse_int(cmd[first_opt - 1], cursor) || cursor < 0)
                return resp::reply::make_error("ERR invalid cursor");

            std::string_view pattern = "*";
            int64_t count = 10;
            for (size_t i = first_opt; i + 1 < argc; i += 2)
            {
                switch (fnv1a_lower(cmd[i]))
                {
                    case fnv1a("match"): pattern = cmd[i + 1]; break;
                    case fnv1a("count"):
                        if (!parse_int(cmd[i + 1], count) || count <= 0)
                            return resp::reply::make_error("ERR syntax error");
                        break;
                    default:
                        return resp::reply::make_error("ERR syntax error");
                }
            }
            if ((argc - first_opt) % 2 != 0)
                return resp::reply::make_error("ERR syntax error");

            std::vector<resp::reply> items;
            uint64_t next = 0;
            if (hash_scan)
            {
                if (wrong_type(m_store, cmd[1], "hash"))
                    return resp::reply::make_error(WRONGTYPE);
                std::vector<std::pair<std::string_view, std::string_view>> pairs;
                next = m_store.hscan(cmd[1], static_cast<uint64_t>(cursor), pattern,
                                     static_cast<size_t>(count), pairs);
                for (const auto& [f, v] : pairs)
                {
                    items.push_back(resp::reply::make_bulk(f));
                    items.push_back(resp::reply::make_bulk(v));
                }
            }
            else
            {
                m_store.sweep_expired();
                std::vector<std::string_view> keys;
                next = m_store.scan(static_cast<uint64_t>(cursor), pattern,
                                    static_cast<size_t>(count), keys);
                for (auto k : keys)
                    items.push_back(resp::reply::make_bulk(k));
            }

            std::vector<resp::reply> result;
            result.push_back(resp::reply::make_bulk(std::to_string(next)));
            result.push_back(resp::reply::make_array(std::move(items)));
            return resp::reply::make_array(std::move(result));
        }
        case fnv1a("dbsize"):
            m_store.sweep_expired();
            return resp::reply::make_integer(m_store.size());
        case fnv1a("flushall"):
        case fnv1a("flushdb"):
            m_store.flush();
            return ok();

        // ─── Hashes ───

        case fnv1a("hget"):
        {
            if (argc != 3) return wrong_args(name);
            if (wrong_type(m_store, cmd[1], "hash"))
                return resp::reply::make_error(WRONGTYPE);
            return bulk_or_nil(m_store.hget(cmd[1], cmd[2]));
        }
        case fnv1a("hset"):
        {
            if (argc < 4 || (argc - 2) % 2 != 0) return wrong_args(name);
            int64_t added = 0;
            for (size_t i = 2; i + 1 < argc; i += 2)
            {
                int rc = m_store.hset(cmd[1], cmd[i], cmd[i + 1]);
                if (rc < 0)
                    return resp::reply::make_error(WRONGTYPE);
                added += rc;
            }
            return resp::reply::make_integer(added);
        }
        case fnv1a("hsetnx"):
        {
            if (argc != 4) return wrong_args(name);
            if (wrong_type(m_store, cmd[1], "hash"))
                return resp::reply::make_error(WRONGTYPE);
            if (m_store.hget(cmd[1], cmd[2]))
                return resp::reply::make_integer(0);
            m_store.hset(cmd[1], cmd[2], cmd[3]);
            return resp::reply::make_integer(1);
        }
        case fnv1a("hexists"):
        {
            if (argc != 3) return wrong_args(name);
            if (wrong_type(m_store, cmd[1], "hash"))
                return resp::reply::make_error(WRONGTYPE);
            return resp::reply::make_integer(m_store.hget(cmd[1], cmd[2]) ? 1 : 0);
        }
        case fnv1a("hmget"):
        {
            if (argc < 3) return wrong_args(name);
            if (wrong_type(m_store, cmd[1], "hash"))
                return resp::reply::make_error(WRONGTYPE);
            std::vector<resp::reply> items;
            for (size_t i = 2; i < argc; ++i)
                items.push_back(bulk_or_nil(m_store.hget(cmd[1], cmd[i])));
            return resp::reply::make_array(std::move(items));
        }
        case fnv1a("hgetall"):
        {
            if (argc != 2) return wrong_args(name);
            if (wrong_type(m_store, cmd[1], "hash"))
                return resp::reply::make_error(WRONGTYPE);
            std::vector<resp::reply> items;
            if (const hash_inner* hp = m_store.hash_ptr(cmd[1]))
            {
                for (const auto& [f, v] : *hp)
                {
                    items.push_back(resp::reply::make_bulk(f));
                    items.push_back(resp::reply::make_bulk(v));
                }
            }
            return resp::reply::make_array(std::move(items));
        }
        case fnv1a("hdel"):
        {
            if (argc < 3) return wrong_args(name);
            int64_t n = 0;
            for (size_t i = 2; i < argc; ++i)
                n += m_store.hdel(cmd[1], cmd[i]) ? 1 : 0;
            return resp::reply::make_integer(n);
        }
        case fnv1a("hlen"):
        {
            if (argc != 2) return wrong_args(name);
            return resp::reply::make_integer(m_store.hlen(cmd[1]));
        }

        // ─── Sets ───

        case fnv1a("sadd"):
        {
            if (argc < 3) return wrong_args(name);
            int64_t added = 0;
            for (size_t i = 2; i < argc; ++i)
            {
                int rc = m_store.sadd(cmd[1], cmd[i]);
                if (rc < 0)
                    return resp::reply::make_error(WRONGTYPE);
                added += rc;
            }
            return resp::reply::make_integer(added);
        }
        case fnv1a("srem"):
        {
            if (argc < 3) return wrong_args(name);
            if (wrong_type(m_store, cmd[1], "set"))
                return resp::reply::make_error(WRONGTYPE);
            int64_t n = 0;
            for (size_t i = 2; i < argc; ++i)
                n += m_store.srem(cmd[1], cmd[i]) ? 1 : 0;
            return resp::reply::make_integer(n);
        }
        case fnv1a("sismember"):
        {
            if (argc != 3) return wrong_args(name);
            if (wrong_type(m_store, cmd[1], "set"))
                return resp::reply::make_error(WRONGTYPE);
            return resp::reply::make_integer(m_store.sismember(cmd[1], cmd[2]) ? 1 : 0);
        }
        case fnv1a("smembers"):
        {
            if (argc != 2) return wrong_args(name);
            if (wrong_type(m_store, cmd[1], "set"))
                return resp::reply::make_error(WRONGTYPE);
            std::vector<resp::reply> items;
            if (const set_inner* sp = m_store.set_ptr(cmd[1]))
            {
                for (const auto& m : *sp)
                    items.push_back(resp::reply::make_bulk(m));
            }
            return resp::reply::make_array(std::move(items));
        }
        case fnv1a("scard"):
        {
            if (argc != 2) return wrong_args(name);
            return resp::reply::make_integer(m_store.scard(cmd[1]));
        }

        // ─── Sorted sets ───

        case fnv1a("zadd"):
        {
            if (argc < 4 || (argc - 2) % 2 != 0) return wrong_args(name);
            // Validate every score before touching the set
            std::vector<double> scores;
            for (size_t i = 2; i + 1 < argc; i += 2)
            {
                double score = 0;
                if (!parse_score(cmd[i], score))
                    return resp::reply::make_error("ERR value is not a valid float");
                scores.push_back(score);
            }
            int64_t added = 0;
            for (size_t i = 2, s = 0; i + 1 < argc; i += 2, ++s)
            {
                int rc = m_store.zadd(cmd[1], scores[s], cmd[i + 1]);
                if (rc < 0)
                    return resp::reply::make_error(WRONGTYPE);
                added += rc;
            }
            return resp::reply::make_integer(added);
        }
        case fnv1a("zrem"):
        {
            if (argc < 3) return wrong_args(name);
            if (wrong_type(m_store, cmd[1], "zset"))
                return resp::reply::make_error(WRONGTYPE);
            int64_t n = 0;
            for (size_t i = 2; i < argc; ++i)
                n += m_store.zrem(cmd[1], cmd[i]) ? 1 : 0;
            return resp::reply::make_integer(n);
        }
        case fnv1a("zscore"):
        {
            if (argc != 3) return wrong_args(name);
            if (wrong_type(m_store, cmd[1], "zset"))
                return resp::reply::make_error(WRONGTYPE);
            const double* score = m_store.zscore(cmd[1], cmd[2]);
            return score ? resp::reply::make_bulk(format_score(*score)) : resp::reply::make_nil();
        }
        case fnv1a("zcard"):
        {
            if (argc != 2) return wrong_args(name);
            return resp::reply::make_integer(m_store.zcard(cmd[1]));
        }
        case fnv1a("zrange"):
        {
            if (argc != 4 && argc != 5) return wrong_args(name);
            int64_t start = 0, stop = 0;
            if (!parse_int(cmd[2], start) || !parse_int(cmd[3], stop))
                return resp::reply::make_error("ERR value is not an integer or out of range");
            bool with_scores = argc == 5 && fnv1a_lower(cmd[4]) == fnv1a("withscores");
            if (argc == 5 && !with_scores)
                return resp::reply::make_error("ERR syntax error");
            std::vector<resp::reply> items;
            for (auto& [member, score] : m_store.zrange(cmd[1], start, stop))
            {
                items.push_back(resp::reply::make_bulk(member));
                if (with_scores)
                    items.push_back(resp::reply::make_bulk(format_score(score)));
            }
            return resp::reply::make_array(std::move(items));
        }

        // ─── HyperLogLog ───

        case fnv1a("pfadd"):
        {
            if (argc < 2) return wrong_args(name);
            std::vector<std::string_view> items(cmd.begin() + 2, cmd.end());
            int rc = m_store.pfadd(cmd[1], items);
            if (rc < 0)
                return resp::reply::make_error(WRONGTYPE);
            return resp::reply::make_integer(rc);
        }
        case fnv1a("pfcount"):
        {
            if (argc != 2) return wrong_args(name);
            return resp::reply::make_integer(m_store.pfcount(cmd[1]));
        }

        default:
            return resp::reply::make_error("ERR unknown command '" + name + "'");
    }
}

// ─── memory_backend ───

namespace {

bool is_transaction_command(uint32_t h)
{
    switch (h)
    {
        case fnv1a("watch"):
        case fnv1a("unwatch"):
        case fnv1a("multi"):
        case fnv1a("exec"):
        case fnv1a("discard"):
            return true;
        default:
            return false;
    }
}

} // namespace

memory_backend::~memory_backend()
{
    reset_transaction();
}

void memory_backend::reset_transaction()
{
    if (!m_watched.empty())
        m_keyspace->unwatch(m_watched);
    m_watched.clear();
    m_queued.clear();
    m_in_multi = false;
}

resp::reply memory_backend::execute(const command& cmd)
{
    if (cmd.empty())
        return m_keyspace->execute(cmd);

    uint32_t h = fnv1a_lower(cmd[0]);
    if (m_in_multi && !is_transaction_command(h))
    {
        m_queued.push_back(cmd);
        return resp::reply::make_simple("QUEUED");
    }

    switch (h)
    {
        case fnv1a("watch"):
        {
            if (cmd.size() < 2) return wrong_args(cmd[0]);
            if (m_in_multi)
                return resp::reply::make_error("ERR WATCH inside MULTI is not allowed");
            for (size_t i = 1; i < cmd.size(); ++i)
                m_watched.emplace_back(cmd[i], m_keyspace->watch(cmd[i]));
            return ok();
        }
        case fnv1a("unwatch"):
            if (m_in_multi)
            {
                m_queued.push_back(cmd);
                return resp::reply::make_simple("QUEUED");
            }
            reset_transaction();
            return ok();
        case fnv1a("multi"):
            if (m_in_multi)
                return resp::reply::make_error("ERR MULTI calls can not be nested");
            m_in_multi = true;
            return ok();
        case fnv1a("discard"):
            if (!m_in_multi)
                return resp::reply::make_error("ERR DISCARD without MULTI");
            reset_transaction();
            return ok();
        case fnv1a("exec"):
        {
            if (!m_in_multi)
                return resp::reply::make_error("ERR EXEC without MULTI");
            resp::reply r = m_keyspace->exec(m_watched, m_queued);
            m_watched.clear();
            m_queued.clear();
            m_in_multi = false;
            return r;
        }
        default:
            return m_keyspace->execute(cmd);
    }
}

std::vector<resp::reply> memory_backend::execute_batch(const std::vector<command>& cmds)
{
    bool plain = !m_in_multi;
    for (size_t i = 0; plain && i < cmds.size(); ++i)
        plain = cmds[i].empty() || !is_transaction_command(fnv1a_lower(cmds[i][0]));
    if (plain)
        return m_keyspace->execute_batch(cmds);

    std::vector<resp::reply> out;
    out.reserve(cmds.size());
    for (const auto& c : cmds)
        out.push_back(execute(c));
    return out;
}

} // namespace tagcache
