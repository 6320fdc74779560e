#include "memory_store.h"
#include <algorithm>
#include "../shared/glob.h"

namespace tagcache {

// ─── Type conflict checks (fast-path: empty() avoids hash lookups) ───

bool memory_store::has_type_conflict(std::string_view key, std::string_view wanted) const
{
    if (wanted != "string" && !m_data.empty() && m_data.count(key)) return true;
    if (wanted != "set" && !m_sets.empty() && m_sets.count(key)) return true;
    if (wanted != "hash" && !m_hashes.empty() && m_hashes.count(key)) return true;
    if (wanted != "zset" && !m_zsets.empty() && m_zsets.count(key)) return true;
    if (wanted != "hll" && !m_hlls.empty() && m_hlls.count(key)) return true;
    return false;
}

void memory_store::drop_expiry(std::string_view key)
{
    if (auto eit = m_expiry.find(key); eit != m_expiry.end())
        m_expiry.erase(eit);
}

// ─── Strings ───

bool memory_store::set(std::string_view key, std::string_view value)
{
    // A plain SET replaces whatever the key held and clears its expiry
    auto it = m_data.find(key);
    if (__builtin_expect(it != m_data.end(), 1))
    {
        it->second.assign(value.data(), value.size());
        drop_expiry(key);
        return true;
    }

    if (has_type_conflict(key, "string"))
        del(key);
    else
        drop_expiry(key);

    m_data.try_emplace(std::string(key), std::string(value));
    return true;
}

bool memory_store::get(std::string_view key, std::string& out) const
{
    auto it = m_data.find(key);
    if (it == m_data.end())
        return false;

    out = it->second;
    return true;
}

const std::string* memory_store::get_ptr(std::string_view key) const
{
    auto it = m_data.find(key);
    if (__builtin_expect(it == m_data.end(), 0))
        return nullptr;
    return &it->second;
}

bool memory_store::getset(std::string_view key, std::string_view newval, std::string& oldval, bool& had_old)
{
    check_expiry(key);
    if (has_type_conflict(key, "string"))
        return false;

    auto it = m_data.find(key);
    had_old = it != m_data.end();
    oldval = had_old ? it->second : std::string{};
    return set(key, newval);
}

// ─── Sets ───

int memory_store::sadd(std::string_view key, std::string_view member)
{
    auto it = m_sets.find(key);
    if (it != m_sets.end())
    {
        auto [_, inserted] = it->second.emplace(member);
        return inserted ? 1 : 0;
    }

    if (has_type_conflict(key, "set"))
        return -1;

    auto& s = m_sets.emplace(std::string(key), set_inner{}).first->second;
    s.emplace(member);
    return 1;
}

bool memory_store::srem(std::string_view key, std::string_view member)
{
    auto it = m_sets.find(key);
    if (it == m_sets.end())
        return false;

    auto mit = it->second.find(member);
    if (mit == it->second.end())
        return false;

    it->second.erase(mit);

    // Empty aggregates cease to exist, like in the real store
    if (it->second.empty())
    {
        m_sets.erase(it);
        drop_expiry(key);
    }
    return true;
}

bool memory_store::sismember(std::string_view key, std::string_view member) const
{
    auto it = m_sets.find(key);
    if (it == m_sets.end())
        return false;
    return it->second.count(member) > 0;
}

int memory_store::scard(std::string_view key) const
{
    auto it = m_sets.find(key);
    if (it == m_sets.end())
        return 0;
    return static_cast<int>(it->second.size());
}

const set_inner* memory_store::set_ptr(std::string_view key) const
{
    auto it = m_sets.find(key);
    if (it == m_sets.end())
        return nullptr;
    return &it->second;
}

// ─── Hashes ───

int memory_store::hset(std::string_view key, std::string_view field, std::string_view val)
{
    auto it = m_hashes.find(key);
    if (it != m_hashes.end())
    {
        auto fit = it->second.find(field);
        if (fit != it->second.end())
        {
            fit->second.assign(val.data(), val.size());
            return 0;
        }
        it->second.emplace(std::string(field), std::string(val));
        return 1;
    }

    if (has_type_conflict(key, "hash"))
        return -1;

    auto& h = m_hashes.emplace(std::string(key), hash_inner{}).first->second;
    h.emplace(std::string(field), std::string(val));
    return 1;
}

const std::string* memory_store::hget(std::string_view key, std::string_view field) const
{
    auto it = m_hashes.find(key);
    if (it == m_hashes.end())
        return nullptr;

    auto fit = it->second.find(field);
    if (fit == it->second.end())
        return nullptr;

    return &fit->second;
}

bool memory_store::hdel(std::string_view key, std::string_view field)
{
    auto it = m_hashes.find(key);
    if (it == m_hashes.end())
        return false;

    auto fit = it->second.find(field);
    if (fit == it->second.end())
        return false;

    it->second.erase(fit);

    if (it->second.empty())
    {
        m_hashes.erase(it);
        drop_expiry(key);
    }
    return true;
}

int memory_store::hlen(std::string_view key) const
{
    auto it = m_hashes.find(key);
    if (it == m_hashes.end())
        return 0;
    return static_cast<int>(it->second.size());
}

const hash_inner* memory_store::hash_ptr(std::string_view key) const
{
    auto it = m_hashes.find(key);
    if (it == m_hashes.end())
        return nullptr;
    return &it->second;
}

// ─── Sorted sets ───

int memory_store::zadd(std::string_view key, double score, std::string_view member)
{
    auto it = m_zsets.find(key);
    if (it == m_zsets.end())
    {
        if (has_type_conflict(key, "zset"))
            return -1;
        it = m_zsets.emplace(std::string(key), zset_inner{}).first;
    }

    auto mit = it->second.find(member);
    if (mit != it->second.end())
    {
        mit->second = score;
        return 0;
    }
    it->second.emplace(std::string(member), score);
    return 1;
}

bool memory_store::zrem(std::string_view key, std::string_view member)
{
    auto it = m_zsets.find(key);
    if (it == m_zsets.end())
        return false;

    auto mit = it->second.find(member);
    if (mit == it->second.end())
        return false;

    it->second.erase(mit);

    if (it->second.empty())
    {
        m_zsets.erase(it);
        drop_expiry(key);
    }
    return true;
}

const double* memory_store::zscore(std::string_view key, std::string_view member) const
{
    auto it = m_zsets.find(key);
    if (it == m_zsets.end())
        return nullptr;

    auto mit = it->second.find(member);
    if (mit == it->second.end())
        return nullptr;
    return &mit->second;
}

int memory_store::zcard(std::string_view key) const
{
    auto it = m_zsets.find(key);
    if (it == m_zsets.end())
        return 0;
    return static_cast<int>(it->second.size());
}

std::vector<std::pair<std::string, double>> memory_store::zrange(std::string_view key,
                                                                 int64_t start, int64_t stop) const
{
    std::vector<std::pair<std::string, double>> out;
    auto it = m_zsets.find(key);
    if (it == m_zsets.end())
        return out;

    std::vector<std::pair<std::string, double>> sorted(it->second.begin(), it->second.end());
    std::sort(sorted.begin(), sorted.end(), [](const auto& a, const auto& b) {
        if (a.second != b.second)
            return a.second < b.second;
        return a.first < b.first;
    });

    auto len = static_cast<int64_t>(sorted.size());
    if (start < 0) start += len;
    if (stop < 0) stop += len;
    if (start < 0) start = 0;
    if (stop >= len) stop = len - 1;
    if (start > stop)
        return out;

    for (int64_t i = start; i <= stop; ++i)
        out.push_back(std::move(sorted[static_cast<size_t>(i)]));
    return out;
}

// ─── HyperLogLog ───

int memory_store::pfadd(std::string_view key, const std::vector<std::string_view>& items)
{
    auto it = m_hlls.find(key);
    bool created = false;
    if (it == m_hlls.end())
    {
        if (has_type_conflict(key, "hll"))
            return -1;
        it = m_hlls.emplace(std::string(key), hyperloglog{}).first;
        created = true;
    }

    bool altered = false;
    for (auto item : items)
        altered |= it->second.add(item);
    return (altered || created) ? 1 : 0;
}

int64_t memory_store::pfcount(std::string_view key) const
{
    auto it = m_hlls.find(key);
    if (it == m_hlls.end())
        return 0;
    return static_cast<int64_t>(it->second.count());
}

// ─── TTL / Expiry ───

bool memory_store::set_expiry_ms(std::string_view key, int64_t ms)
{
    if (!exists(key))
        return false;

    // A non-positive TTL deletes the key immediately
    if (ms <= 0)
    {
        del(key);
        return true;
    }

    auto tp = std::chrono::steady_clock::now() + std::chrono::milliseconds(ms);
    auto it = m_expiry.find(key);
    if (it != m_expiry.end())
        it->second = tp;
    else
        m_expiry.emplace(std::string(key), tp);
    return true;
}

bool memory_store::set_expiry_at(std::string_view key, std::chrono::system_clock::time_point when)
{
    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
        when - std::chrono::system_clock::now());
    return set_expiry_ms(key, remaining.count());
}

int64_t memory_store::get_pttl(std::string_view key) const
{
    if (!exists(key))
        return -2;

    auto it = m_expiry.find(key);
    if (it == m_expiry.end())
        return -1;

    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
        it->second - std::chrono::steady_clock::now());
    return remaining.count() < 0 ? 0 : remaining.count();
}

bool memory_store::persist(std::string_view key)
{
    auto it = m_expiry.find(key);
    if (it == m_expiry.end())
        return false;
    m_expiry.erase(it);
    return true;
}

void memory_store::check_expiry(std::string_view key)
{
    // Fast early-out: most workloads have no TTLs at all
    if (__builtin_expect(m_expiry.empty(), 1))
        return;

    auto it = m_expiry.find(key);
    if (__builtin_expect(it == m_expiry.end(), 1))
        return;

    if (__builtin_expect(std::chrono::steady_clock::now() < it->second, 1))
        return;

    del(key);
}

std::vector<std::string> memory_store::sweep_expired()
{
    std::vector<std::string> expired;
    if (__builtin_expect(m_expiry.empty(), 1))
        return expired;

    auto now = std::chrono::steady_clock::now();
    for (const auto& [key, tp] : m_expiry)
    {
        if (now >= tp)
            expired.push_back(key);
    }
    for (const auto& key : expired)
        del(key);
    return expired;
}

// ─── Type / Keys ───

std::string_view memory_store::type(std::string_view key) const
{
    if (m_data.count(key)) return "string";
    if (!m_sets.empty() && m_sets.count(key)) return "set";
    if (!m_hashes.empty() && m_hashes.count(key)) return "hash";
    if (!m_zsets.empty() && m_zsets.count(key)) return "zset";
    if (!m_hlls.empty() && m_hlls.count(key)) return "string";
    return "none";
}

void memory_store::keys(std::string_view pattern, std::vector<std::string_view>& out) const
{
    auto match = [&](std::string_view key) { return glob_match(pattern, key); };

    for (const auto& [key, _] : m_data)
        if (match(key)) out.push_back(key);
    for (const auto& [key, _] : m_sets)
        if (match(key)) out.push_back(key);
    for (const auto& [key, _] : m_hashes)
        if (match(key)) out.push_back(key);
    for (const auto& [key, _] : m_zsets)
        if (match(key)) out.push_back(key);
    for (const auto& [key, _] : m_hlls)
        if (match(key)) out.push_back(key);
}

uint64_t memory_store::scan(uint64_t cursor, std::string_view pattern,
                            size_t count, std::vector<std::string_view>& out) const
{
    bool match_all = (pattern.empty() || pattern == "*");
    auto match = [&](std::string_view k) -> bool {
        return match_all || glob_match(pattern, k);
    };

    uint64_t pos = 0;
    auto try_add = [&](std::string_view k) -> bool {
        if (pos++ < cursor) return true;  // skip already-seen
        if (match(k)) out.push_back(k);
        return out.size() < count;        // stop when count reached
    };

    for (const auto& [k, _] : m_data)   if (!try_add(k)) return pos;
    for (const auto& [k, _] : m_sets)   if (!try_add(k)) return pos;
    for (const auto& [k, _] : m_hashes) if (!try_add(k)) return pos;
    for (const auto& [k, _] : m_zsets)  if (!try_add(k)) return pos;
    for (const auto& [k, _] : m_hlls)   if (!try_add(k)) return pos;
    return 0;  // exhausted all keys
}

uint64_t memory_store::hscan(std::string_view key, uint64_t cursor, std::string_view pattern,
                             size_t count, std::vector<std::pair<std::string_view, std::string_view>>& out) const
{
    auto it = m_hashes.find(key);
    if (it == m_hashes.end())
        return 0;

    bool match_all = (pattern.empty() || pattern == "*");
    uint64_t pos = 0;
    for (const auto& [f, v] : it->second)
    {
        if (pos++ < cursor)
            continue;
        if (match_all || glob_match(pattern, f))
            out.emplace_back(f, v);
        if (out.size() >= count)
            return pos;
    }
    return 0;
}

// ─── General ───

bool memory_store::del(std::string_view key)
{
    drop_expiry(key);

    if (auto it = m_data.find(key); it != m_data.end())
    {
        m_data.erase(it);
        return true;
    }
    if (auto it = m_sets.find(key); it != m_sets.end())
    {
        m_sets.erase(it);
        return true;
    }
    if (auto it = m_hashes.find(key); it != m_hashes.end())
    {
        m_hashes.erase(it);
        return true;
    }
    if (auto it = m_zsets.find(key); it != m_zsets.end())
    {
        m_zsets.erase(it);
        return true;
    }
    if (auto it = m_hlls.find(key); it != m_hlls.end())
    {
        m_hlls.erase(it);
        return true;
    }
    return false;
}

uint32_t memory_store::size() const
{
    return static_cast<uint32_t>(m_data.size() + m_sets.size() + m_hashes.size() +
                                 m_zsets.size() + m_hlls.size());
}

bool memory_store::exists(std::string_view key) const
{
    return m_data.count(key) || m_sets.count(key) || m_hashes.count(key) ||
           m_zsets.count(key) || m_hlls.count(key);
}

void memory_store::flush()
{
    m_data.clear();
    m_sets.clear();
    m_hashes.clear();
    m_zsets.clear();
    m_hlls.clear();
    m_expiry.clear();
}

} // namespace tagcache
