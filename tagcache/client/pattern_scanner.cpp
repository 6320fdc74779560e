#include "pattern_scanner.h"
#include "../shared/glob.h"
#include "../shared/logging.h"

namespace tagcache {

bool parse_scan_strategy(std::string_view name, scan_strategy& out)
{
    if (name == "auto")   { out = scan_auto;   return true; }
    if (name == "cursor") { out = scan_cursor; return true; }
    if (name == "full")   { out = scan_full;   return true; }
    return false;
}

pattern_scanner::pattern_scanner(cache_client& client, scan_strategy strategy, size_t page_size)
    : m_client(client), m_strategy(strategy), m_page_size(page_size == 0 ? 250 : page_size)
{
}

bool pattern_scanner::use_cursor() const
{
    switch (m_strategy)
    {
        case scan_cursor: return true;
        case scan_full:   return false;
        default:          return !degraded();
    }
}

bool pattern_scanner::degrade(const store_error& e, std::string_view cmd)
{
    if (m_strategy != scan_auto)
        return false;
    if (std::string_view(e.what()).find("unknown command") == std::string_view::npos)
        return false;

    if (!m_degraded.exchange(true))
    {
        TAGCACHE_LOG_WARN("store does not support " + std::string(cmd) +
                          ", falling back to full listings");
    }
    return true;
}

uint64_t pattern_scanner::key_page(const std::string& pattern, uint64_t cursor, std::vector<std::string>& out)
{
    if (use_cursor())
    {
        try
        {
            scan_page page = m_client.scan(cursor, pattern, m_page_size);
            out = std::move(page.keys);
            return page.cursor;
        }
        catch (const store_error& e)
        {
            if (!degrade(e, "SCAN"))
                throw;
        }
    }

    out = m_client.keys(pattern);
    return 0;
}

uint64_t pattern_scanner::field_page(const std::string& key, const std::string& pattern, uint64_t cursor,
                                     std::vector<std::pair<std::string, std::string>>& out)
{
    if (use_cursor())
    {
        try
        {
            hash_scan_page page = m_client.hscan(key, cursor, pattern, m_page_size);
            out = std::move(page.fields);
            return page.cursor;
        }
        catch (const store_error& e)
        {
            if (!degrade(e, "HSCAN"))
                throw;
        }
    }

    for (auto& entry : m_client.hgetall(key))
    {
        if (glob_match(pattern, entry.first))
            out.push_back(std::move(entry));
    }
    return 0;
}

scan_range<std::string> pattern_scanner::keys(std::string pattern)
{
    return scan_range<std::string>(
        [this, pattern = std::move(pattern)](uint64_t cursor, std::vector<std::string>& out)
        {
            return key_page(pattern, cursor, out);
        });
}

scan_range<std::pair<std::string, std::string>> pattern_scanner::fields(std::string key, std::string pattern)
{
    return scan_range<std::pair<std::string, std::string>>(
        [this, key = std::move(key), pattern = std::move(pattern)](
            uint64_t cursor, std::vector<std::pair<std::string, std::string>>& out)
        {
            return field_page(key, pattern, cursor, out);
        });
}

} // namespace tagcache
