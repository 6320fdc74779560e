// tagcache/cache_provider.h — Cache-aside facade with tag-indexed invalidation
#pragma once
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <vector>

#include <tagcache/types.h>
#include <tagcache/value_codec.h>

#include "tagcache/client/cache_client.h"
#include "tagcache/client/pattern_scanner.h"
#include "tagcache/client/tag_index.h"
#include "tagcache/shared/logging.h"

namespace tagcache {

// Derives the tags of a freshly produced value
template <typename T>
using tag_builder = std::function<tag_list(const T&)>;

// Builder that ignores the value: fetch_object(key, load, with_tags({"a", "b"}))
inline auto with_tags(tag_list tags)
{
    return [tags = std::move(tags)](const auto&) { return tags; };
}

struct provider_options
{
    std::string tag_prefix = std::string(tag_index::DEFAULT_PREFIX);
    scan_strategy scan = scan_auto;
    size_t scan_page_size = 250;
};

class cache_provider
{
public:
    explicit cache_provider(std::shared_ptr<connection_pool> pool, provider_options options = {});

    cache_provider(const cache_provider&) = delete;
    cache_provider& operator=(const cache_provider&) = delete;

    // ─── Fetch-or-compute ───

    // Returns the cached value at `key`, or runs `producer` once, stores its
    // result with `ttl` and tags it. A producer exception propagates and
    // nothing is written.
    template <typename Producer, typename T = std::remove_cvref_t<std::invoke_result_t<Producer&>>>
        requires cache_value<T>
    T fetch_object(std::string_view key, Producer&& producer,
                   std::type_identity_t<tag_builder<T>> tags = {}, ttl_option ttl = {})
    {
        if (auto hit = m_client.get(key))
            return decode_value<T>(*hit);

        TAGCACHE_LOG_DEBUG("miss on " + std::string(key) + ", producing");
        T value = std::invoke(producer);
        tag_list names = tags ? tags(value) : tag_list{};

        m_client.set(key, encode_value(value), ttl);
        if (!names.empty())
            m_tags.associate(tag_entry::string_key(key), names);
        return value;
    }

    template <typename Producer, typename T = std::remove_cvref_t<std::invoke_result_t<Producer&>>>
        requires cache_value<T>
    T fetch_object(std::string_view key, Producer&& producer, ttl_option ttl)
    {
        return fetch_object(key, std::forward<Producer>(producer), tag_builder<T>{}, ttl);
    }

    // Hash flavour: the ttl applies to the whole hash
    template <encodable_value F, typename Producer,
              typename T = std::remove_cvref_t<std::invoke_result_t<Producer&>>>
        requires cache_value<T>
    T fetch_hashed(std::string_view key, const F& field, Producer&& producer,
                   std::type_identity_t<tag_builder<T>> tags = {}, ttl_option ttl = {})
    {
        std::string encoded_field = encode_value(field);
        if (auto hit = m_client.hget(key, encoded_field))
            return decode_value<T>(*hit);

        TAGCACHE_LOG_DEBUG("miss on " + std::string(key) + "/" + encoded_field + ", producing");
        T value = std::invoke(producer);
        tag_list names = tags ? tags(value) : tag_list{};

        m_client.hset(key, encoded_field, encode_value(value), ttl);
        if (!names.empty())
            m_tags.associate(tag_entry::hash_field(key, encoded_field), names);
        return value;
    }

    template <encodable_value F, typename Producer,
              typename T = std::remove_cvref_t<std::invoke_result_t<Producer&>>>
        requires cache_value<T>
    T fetch_hashed(std::string_view key, const F& field, Producer&& producer, ttl_option ttl)
    {
        return fetch_hashed(key, field, std::forward<Producer>(producer), tag_builder<T>{}, ttl);
    }

    // ─── Plain values ───

    // Returns false when `when` rejected the write; tags are then left alone
    template <encodable_value T>
    bool set_object(std::string_view key, const T& value, ttl_option ttl = {},
                    write_condition when = when_always)
    {
        return m_client.set(key, encode_value(value), ttl, when);
    }

    template <encodable_value T>
    bool set_object(std::string_view key, const T& value, const tag_list& tags,
                    ttl_option ttl = {}, write_condition when = when_always)
    {
        if (!m_client.set(key, encode_value(value), ttl, when))
            return false;
        if (!tags.empty())
            m_tags.associate(tag_entry::string_key(key), tags);
        return true;
    }

    template <cache_value T>
    std::optional<T> get_set_object(std::string_view key, const T& value)
    {
        auto previous = m_client.getset(key, encode_value(value));
        if (!previous)
            return std::nullopt;
        return decode_value<T>(*previous);
    }

    // Default-constructed T on a miss
    template <cache_value T>
    T get_object(std::string_view key)
    {
        auto hit = m_client.get(key);
        return hit ? decode_value<T>(*hit) : T{};
    }

    template <cache_value T>
    bool try_get_object(std::string_view key, T& out)
    {
        auto hit = m_client.get(key);
        if (!hit)
            return false;
        out = decode_value<T>(*hit);
        return true;
    }

    // ─── Keys ───

    scan_range<std::string> get_keys_by_pattern(std::string pattern);
    bool key_exists(std::string_view key);
    bool key_expire(std::string_view key, std::chrono::system_clock::time_point when);
    bool key_time_to_live(std::string_view key, std::chrono::milliseconds ttl);
    std::optional<std::chrono::milliseconds> key_time_to_live(std::string_view key);
    bool key_persist(std::string_view key);
    bool remove(std::string_view key);
    int64_t remove(const std::vector<std::string>& keys);
    void flush_all();

    // ─── Hashes ───

    template <encodable_value F, encodable_value V>
    bool set_hashed(std::string_view key, const F& field, const V& value,
                    ttl_option ttl = {}, write_condition when = when_always)
    {
        return m_client.hset(key, encode_value(field), encode_value(value), ttl, when);
    }

    template <encodable_value F, encodable_value V>
    bool set_hashed(std::string_view key, const F& field, const V& value, const tag_list& tags,
                    ttl_option ttl = {}, write_condition when = when_always)
    {
        std::string encoded_field = encode_value(field);
        if (!m_client.hset(key, encoded_field, encode_value(value), ttl, when))
            return false;
        if (!tags.empty())
            m_tags.associate(tag_entry::hash_field(key, encoded_field), tags);
        return true;
    }

    // Several fields at once; returns how many were written
    template <typename Map>
        requires encodable_value<typename Map::key_type> && encodable_value<typename Map::mapped_type>
    int64_t set_hashed(std::string_view key, const Map& values, ttl_option ttl = {},
                       write_condition when = when_always)
    {
        std::vector<std::pair<std::string, std::string>> pairs;
        pairs.reserve(values.size());
        for (const auto& [field, value] : values)
            pairs.emplace_back(encode_value(field), encode_value(value));
        return m_client.hset(key, pairs, ttl, when);
    }

    template <cache_value V, encodable_value F>
    V get_hashed(std::string_view key, const F& field)
    {
        auto hit = m_client.hget(key, encode_value(field));
        return hit ? decode_value<V>(*hit) : V{};
    }

    // Aligned with `fields`; missing fields are V{}
    template <cache_value V, encodable_value F>
    std::vector<V> get_hashed(std::string_view key, const std::vector<F>& fields)
    {
        std::vector<std::string> encoded;
        encoded.reserve(fields.size());
        for (const auto& f : fields)
            encoded.push_back(encode_value(f));

        std::vector<V> out;
        out.reserve(fields.size());
        for (auto& hit : m_client.hmget(key, encoded))
            out.push_back(hit ? decode_value<V>(*hit) : V{});
        return out;
    }

    template <encodable_value F, cache_value V>
    bool try_get_hashed(std::string_view key, const F& field, V& out)
    {
        auto hit = m_client.hget(key, encode_value(field));
        if (!hit)
            return false;
        out = decode_value<V>(*hit);
        return true;
    }

    template <encodable_value F>
    bool remove_hashed(std::string_view key, const F& field)
    {
        return m_client.hdel(key, encode_value(field));
    }

    template <cache_value V>
    std::unordered_map<std::string, V> get_hashed_all(std::string_view key)
    {
        std::unordered_map<std::string, V> out;
        for (auto& [field, value] : m_client.hgetall(key))
            out.emplace(std::move(field), decode_value<V>(value));
        return out;
    }

    // Lazy; fields are decoded page by page as the range is walked
    template <cache_value V>
    scan_range<std::pair<std::string, V>> scan_hashed(std::string key, std::string pattern)
    {
        return scan_range<std::pair<std::string, V>>(
            [this, key = std::move(key), pattern = std::move(pattern)](
                uint64_t cursor, std::vector<std::pair<std::string, V>>& out)
            {
                std::vector<std::pair<std::string, std::string>> raw;
                uint64_t next = m_scanner.field_page(key, pattern, cursor, raw);
                out.reserve(raw.size());
                for (auto& [field, value] : raw)
                    out.emplace_back(std::move(field), decode_value<V>(value));
                return next;
            });
    }

    // ─── Sets / sorted sets ───

    template <encodable_value M>
    bool add_to_set(std::string_view key, const M& member, const tag_list& tags = {}, ttl_option ttl = {})
    {
        std::string encoded = encode_value(member);
        bool added = m_client.sadd(key, encoded, ttl);
        if (!tags.empty())
            m_tags.associate(tag_entry::set_member(key, encoded), tags);
        return added;
    }

    template <encodable_value M>
    bool remove_from_set(std::string_view key, const M& member)
    {
        return m_client.srem(key, encode_value(member));
    }

    template <encodable_value M>
    bool add_to_sorted_set(std::string_view key, double score, const M& member,
                           const tag_list& tags = {}, ttl_option ttl = {})
    {
        std::string encoded = encode_value(member);
        bool added = m_client.zadd(key, score, encoded, ttl);
        if (!tags.empty())
            m_tags.associate(tag_entry::sorted_set_member(key, encoded), tags);
        return added;
    }

    template <encodable_value M>
    bool remove_from_sorted_set(std::string_view key, const M& member)
    {
        return m_client.zrem(key, encode_value(member));
    }

    // ─── HyperLogLog ───

    template <encodable_value T>
    bool hyperloglog_add(std::string_view key, const T& item)
    {
        return m_client.pfadd(key, {encode_value(item)});
    }

    template <encodable_value T>
    bool hyperloglog_add(std::string_view key, const std::vector<T>& items)
    {
        std::vector<std::string> encoded;
        encoded.reserve(items.size());
        for (const auto& item : items)
            encoded.push_back(encode_value(item));
        return m_client.pfadd(key, encoded);
    }

    int64_t hyperloglog_count(std::string_view key);

    // ─── Tags ───

    bool is_string_key_in_tag(std::string_view key, const tag_list& tags);

    template <encodable_value F>
    bool is_hash_field_in_tag(std::string_view key, const F& field, const tag_list& tags)
    {
        return m_tags.is_in_tag(tag_entry::hash_field(key, encode_value(field)), tags);
    }

    // Matches members of a set or of a sorted set
    template <encodable_value M>
    bool is_set_member_in_tag(std::string_view key, const M& member, const tag_list& tags)
    {
        std::string encoded = encode_value(member);
        return m_tags.is_in_tag(tag_entry::set_member(key, encoded), tags) ||
               m_tags.is_in_tag(tag_entry::sorted_set_member(key, encoded), tags);
    }

    std::vector<tag_entry> get_tagged_entries(const tag_list& tags);

    // Distinct keys holding a live entry of any of `tags`
    std::vector<std::string> get_keys_by_tag(const tag_list& tags);

    // Values of the plain keys tagged with any of `tags`. Other entry kinds,
    // and tagged keys since rewritten as another type, are skipped.
    template <cache_value T>
    std::vector<T> get_objects_by_tag(const tag_list& tags)
    {
        std::vector<command> gets;
        for (const auto& entry : m_tags.entries(tags))
        {
            if (entry.kind == entry_string)
                gets.push_back({"GET", entry.key});
        }

        std::vector<T> out;
        for (const auto& r : m_client.pipeline(gets))
        {
            // WRONGTYPE: the key still exists but no longer holds a value
            if (r.is_string())
                out.push_back(decode_value<T>(r.str));
        }
        return out;
    }

    int64_t invalidate_tags(const tag_list& tags);
    void remove_tags_from_key(std::string_view key, const tag_list& tags);
    std::vector<std::string> get_all_tags();

    cache_client& client() { return m_client; }
    tag_index& tags() { return m_tags; }
    pattern_scanner& scanner() { return m_scanner; }

private:
    std::shared_ptr<connection_pool> m_pool;
    cache_client m_client;
    pattern_scanner m_scanner;
    tag_index m_tags;
};

} // namespace tagcache
