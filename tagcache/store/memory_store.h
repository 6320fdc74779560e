#pragma once
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <vector>
#include <utility>
#include <cstdint>
#include <functional>
#include <chrono>

#include "hyperloglog.h"

namespace tagcache {

// Transparent hash for heterogeneous lookup (avoids string copies on find/erase)
struct string_hash
{
    using is_transparent = void;

    size_t operator()(std::string_view sv) const noexcept
    {
        return std::hash<std::string_view>{}(sv);
    }

    size_t operator()(const std::string& s) const noexcept
    {
        return std::hash<std::string_view>{}(s);
    }
};

struct string_equal
{
    using is_transparent = void;

    bool operator()(std::string_view lhs, std::string_view rhs) const noexcept
    {
        return lhs == rhs;
    }
};

using string_map = std::unordered_map<std::string, std::string, string_hash, string_equal>;
using set_inner = std::unordered_set<std::string, string_hash, string_equal>;
using set_map = std::unordered_map<std::string, set_inner, string_hash, string_equal>;
using hash_inner = std::unordered_map<std::string, std::string, string_hash, string_equal>;
using hash_map = std::unordered_map<std::string, hash_inner, string_hash, string_equal>;
using zset_inner = std::unordered_map<std::string, double, string_hash, string_equal>;
using zset_map = std::unordered_map<std::string, zset_inner, string_hash, string_equal>;
using hll_map = std::unordered_map<std::string, hyperloglog, string_hash, string_equal>;
using expiry_map = std::unordered_map<std::string, std::chrono::steady_clock::time_point, string_hash, string_equal>;

// Single-threaded keyspace with the data types the cache layer uses. Callers
// serialize access (see memory_backend).
class memory_store
{
public:
    memory_store()
    {
        m_data.reserve(1024);
    }

    // --- Strings ---
    bool set(std::string_view key, std::string_view value);
    bool get(std::string_view key, std::string& out) const;
    const std::string* get_ptr(std::string_view key) const;
    // Returns false on type conflict; `had_old` tells whether `oldval` is meaningful
    bool getset(std::string_view key, std::string_view newval, std::string& oldval, bool& had_old);

    // --- Sets ---
    // Returns: 1 = added, 0 = already exists, -1 = type conflict
    int sadd(std::string_view key, std::string_view member);
    bool srem(std::string_view key, std::string_view member);
    bool sismember(std::string_view key, std::string_view member) const;
    int scard(std::string_view key) const;
    const set_inner* set_ptr(std::string_view key) const;

    // --- Hashes ---
    // Returns: 1 = new field, 0 = updated, -1 = type conflict
    int hset(std::string_view key, std::string_view field, std::string_view val);
    const std::string* hget(std::string_view key, std::string_view field) const;
    bool hdel(std::string_view key, std::string_view field);
    int hlen(std::string_view key) const;
    const hash_inner* hash_ptr(std::string_view key) const;

    // --- Sorted sets ---
    // Returns: 1 = added, 0 = score updated, -1 = type conflict
    int zadd(std::string_view key, double score, std::string_view member);
    bool zrem(std::string_view key, std::string_view member);
    const double* zscore(std::string_view key, std::string_view member) const;
    int zcard(std::string_view key) const;
    // Ascending by score, ties by member; negative indexes count from the end
    std::vector<std::pair<std::string, double>> zrange(std::string_view key, int64_t start, int64_t stop) const;

    // --- HyperLogLog ---
    // Returns: 1 = a register changed (or the structure was created), 0 = unchanged, -1 = type conflict
    int pfadd(std::string_view key, const std::vector<std::string_view>& items);
    int64_t pfcount(std::string_view key) const;  // 0 if missing

    // --- TTL / Expiry (millisecond precision) ---
    bool set_expiry_ms(std::string_view key, int64_t ms);
    bool set_expiry_at(std::string_view key, std::chrono::system_clock::time_point when);
    int64_t get_pttl(std::string_view key) const;  // ms; -1 = no ttl, -2 = not found
    bool persist(std::string_view key);
    void check_expiry(std::string_view key);
    std::vector<std::string> sweep_expired();  // removes expired keys, returns their names

    // --- Type / Keys ---
    // returns "string", "set", "hash", "zset", or "none"
    std::string_view type(std::string_view key) const;
    void keys(std::string_view pattern, std::vector<std::string_view>& out) const;

    // --- Cursor scans (stateless offset cursor; returns next cursor, 0=done) ---
    uint64_t scan(uint64_t cursor, std::string_view pattern,
                  size_t count, std::vector<std::string_view>& out) const;
    uint64_t hscan(std::string_view key, uint64_t cursor, std::string_view pattern,
                   size_t count, std::vector<std::pair<std::string_view, std::string_view>>& out) const;

    // --- General ---
    bool del(std::string_view key);
    uint32_t size() const;
    bool exists(std::string_view key) const;
    void flush();


private:
    bool has_type_conflict(std::string_view key, std::string_view wanted) const;
    void drop_expiry(std::string_view key);

    string_map m_data;
    set_map m_sets;
    hash_map m_hashes;
    zset_map m_zsets;
    hll_map m_hlls;
    expiry_map m_expiry;
};

} // namespace tagcache
