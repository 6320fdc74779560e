#pragma once
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <tagcache/types.h>
#include "../store/connection_pool.h"

namespace tagcache {

struct scan_page
{
    uint64_t cursor = 0;                // 0 = sweep finished
    std::vector<std::string> keys;
};

struct hash_scan_page
{
    uint64_t cursor = 0;
    std::vector<std::pair<std::string, std::string>> fields;
};

// Typed primitive operations over the pool. Every call leases a backend for
// the duration of one command (or one pipelined batch). Misses come back as
// nullopt/false/empty; error replies and transport failures throw
// store_error.
class cache_client
{
public:
    explicit cache_client(std::shared_ptr<connection_pool> pool);

    // One command; error replies throw
    resp::reply run(const command& cmd);

    // Pipelined batch; error replies are returned in place
    std::vector<resp::reply> pipeline(const std::vector<command>& cmds);

    // Optimistic check-and-set on one leased connection: WATCH `key`, run
    // `read`, then queue what `build` derives from its reply in MULTI/EXEC.
    // Returns EXEC's replies (errors in place), or nullopt when another
    // writer touched `key` in between. An empty build skips the EXEC.
    std::optional<std::vector<resp::reply>> watched_exec(
        std::string_view key, const command& read,
        const std::function<std::vector<command>(const resp::reply&)>& build);

    bool ping();
    void flushall();

    // ─── Strings / keys ───
    std::optional<std::string> get(std::string_view key);
    bool set(std::string_view key, std::string_view value,
             ttl_option ttl = {}, write_condition when = when_always);
    std::optional<std::string> getset(std::string_view key, std::string_view value);
    bool exists(std::string_view key);
    bool del(std::string_view key);
    int64_t del(const std::vector<std::string>& keys);
    bool expire(std::string_view key, std::chrono::milliseconds ttl);
    bool expire_at(std::string_view key, std::chrono::system_clock::time_point when);
    std::optional<std::chrono::milliseconds> ttl(std::string_view key);  // nullopt: no key or no expiry
    bool persist(std::string_view key);
    std::string type(std::string_view key);

    // ─── Hashes ───
    std::optional<std::string> hget(std::string_view key, std::string_view field);
    bool hset(std::string_view key, std::string_view field, std::string_view value,
              ttl_option ttl = {}, write_condition when = when_always);
    // Returns the number of fields written
    int64_t hset(std::string_view key, const std::vector<std::pair<std::string, std::string>>& pairs,
                 ttl_option ttl = {}, write_condition when = when_always);
    bool hexists(std::string_view key, std::string_view field);
    std::vector<std::optional<std::string>> hmget(std::string_view key, const std::vector<std::string>& fields);
    std::vector<std::pair<std::string, std::string>> hgetall(std::string_view key);
    bool hdel(std::string_view key, std::string_view field);

    // ─── Sets ───
    bool sadd(std::string_view key, std::string_view member, ttl_option ttl = {});
    bool srem(std::string_view key, std::string_view member);
    bool sismember(std::string_view key, std::string_view member);
    std::vector<std::string> smembers(std::string_view key);

    // ─── Sorted sets ───
    bool zadd(std::string_view key, double score, std::string_view member, ttl_option ttl = {});
    bool zrem(std::string_view key, std::string_view member);
    std::optional<double> zscore(std::string_view key, std::string_view member);
    std::vector<std::string> zrange(std::string_view key, int64_t start, int64_t stop);

    // ─── HyperLogLog ───
    bool pfadd(std::string_view key, const std::vector<std::string>& items);
    int64_t pfcount(std::string_view key);

    // ─── Enumeration ───
    std::vector<std::string> keys(std::string_view pattern);
    scan_page scan(uint64_t cursor, std::string_view pattern, size_t count);
    hash_scan_page hscan(std::string_view key, uint64_t cursor, std::string_view pattern, size_t count);

    connection_pool& pool() { return *m_pool; }

private:
    // Runs `write` and, when it wrote and a ttl is given, refreshes the key's
    // expiry in the same round trip
    resp::reply write_with_ttl(command write, std::string_view key, ttl_option ttl);

    std::shared_ptr<connection_pool> m_pool;
};

// Throws store_error when `r` is an error reply
void check_reply(const resp::reply& r, std::string_view context);

// Parses a score reply ("1.5", "inf", "-inf")
bool parse_double(std::string_view s, double& out);

} // namespace tagcache
