#include <tagcache/cache_provider.h>

#include <unordered_set>

namespace tagcache {

cache_provider::cache_provider(std::shared_ptr<connection_pool> pool, provider_options options)
    : m_pool(std::move(pool)),
      m_client(m_pool),
      m_scanner(m_client, options.scan, options.scan_page_size),
      m_tags(m_client, m_scanner, std::move(options.tag_prefix))
{
}

// ─── Keys ───

scan_range<std::string> cache_provider::get_keys_by_pattern(std::string pattern)
{
    return m_scanner.keys(std::move(pattern));
}

bool cache_provider::key_exists(std::string_view key)
{
    return m_client.exists(key);
}

bool cache_provider::key_expire(std::string_view key, std::chrono::system_clock::time_point when)
{
    return m_client.expire_at(key, when);
}

bool cache_provider::key_time_to_live(std::string_view key, std::chrono::milliseconds ttl)
{
    return m_client.expire(key, ttl);
}

std::optional<std::chrono::milliseconds> cache_provider::key_time_to_live(std::string_view key)
{
    return m_client.ttl(key);
}

bool cache_provider::key_persist(std::string_view key)
{
    return m_client.persist(key);
}

bool cache_provider::remove(std::string_view key)
{
    return m_client.del(key);
}

int64_t cache_provider::remove(const std::vector<std::string>& keys)
{
    return m_client.del(keys);
}

void cache_provider::flush_all()
{
    m_client.flushall();
}

int64_t cache_provider::hyperloglog_count(std::string_view key)
{
    return m_client.pfcount(key);
}

// ─── Tags ───

bool cache_provider::is_string_key_in_tag(std::string_view key, const tag_list& tags)
{
    return m_tags.is_in_tag(tag_entry::string_key(key), tags);
}

std::vector<tag_entry> cache_provider::get_tagged_entries(const tag_list& tags)
{
    return m_tags.entries(tags);
}

std::vector<std::string> cache_provider::get_keys_by_tag(const tag_list& tags)
{
    std::vector<std::string> out;
    std::unordered_set<std::string> seen;
    for (auto& entry : m_tags.entries(tags))
    {
        if (seen.insert(entry.key).second)
            out.push_back(std::move(entry.key));
    }
    return out;
}

int64_t cache_provider::invalidate_tags(const tag_list& tags)
{
    return m_tags.invalidate(tags);
}

void cache_provider::remove_tags_from_key(std::string_view key, const tag_list& tags)
{
    m_tags.remove_tags(tag_entry::string_key(key), tags);
}

std::vector<std::string> cache_provider::get_all_tags()
{
    return m_tags.all_tags();
}

} // namespace tagcache
