#pragma once
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <iterator>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "cache_client.h"

namespace tagcache {

enum scan_strategy : uint8_t
{
    scan_auto   = 0,   // cursor sweep, full listing when the store lacks it
    scan_cursor = 1,   // SCAN / HSCAN only
    scan_full   = 2    // KEYS / HGETALL only
};

// Lazy, finite sequence pulled page by page. Every begin() starts a fresh
// sweep, so a range can be iterated more than once; each pass reflects the
// store at the time it runs.
template <typename T>
class scan_range
{
public:
    // Fills `out` with the page at `cursor` and returns the next cursor (0 = last page)
    using page_source = std::function<uint64_t(uint64_t cursor, std::vector<T>& out)>;

    class iterator
    {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = T;
        using difference_type = std::ptrdiff_t;
        using pointer = const T*;
        using reference = const T&;

        iterator() = default;

        explicit iterator(const page_source* source)
            : m_state(std::make_shared<state>())
        {
            m_state->source = source;
            fill();
        }

        reference operator*() const { return m_state->page[m_state->pos]; }
        pointer operator->() const { return &m_state->page[m_state->pos]; }

        iterator& operator++()
        {
            ++m_state->pos;
            fill();
            return *this;
        }

        void operator++(int) { ++*this; }

        bool operator==(const iterator& other) const { return at_end() == other.at_end(); }

    private:
        struct state
        {
            const page_source* source = nullptr;
            std::vector<T> page;
            size_t pos = 0;
            uint64_t cursor = 0;
            bool last_page = false;
        };

        bool at_end() const { return !m_state || m_state->pos >= m_state->page.size(); }

        // Pull pages until one has items or the sweep is over; pages may be empty
        void fill()
        {
            state& s = *m_state;
            while (s.pos >= s.page.size() && !s.last_page)
            {
                s.page.clear();
                s.pos = 0;
                s.cursor = (*s.source)(s.cursor, s.page);
                s.last_page = s.cursor == 0;
            }
        }

        std::shared_ptr<state> m_state;
    };

    explicit scan_range(page_source source) : m_source(std::move(source)) {}

    iterator begin() const { return iterator(&m_source); }
    iterator end() const { return iterator(); }

    std::vector<T> to_vector() const
    {
        std::vector<T> out;
        for (const auto& item : *this)
            out.push_back(item);
        return out;
    }

private:
    page_source m_source;
};

// Enumerates keys of the flat namespace, or fields of one hash, matching a
// glob pattern. Ranges keep a reference to the scanner; the scanner must
// outlive them.
class pattern_scanner
{
public:
    explicit pattern_scanner(cache_client& client, scan_strategy strategy = scan_auto,
                             size_t page_size = 250);

    scan_range<std::string> keys(std::string pattern);
    scan_range<std::pair<std::string, std::string>> fields(std::string key, std::string pattern);

    // True once scan_auto fell back to full listings
    bool degraded() const { return m_degraded.load(std::memory_order_relaxed); }
    scan_strategy strategy() const { return m_strategy; }

    // One page of keys() / fields(); returns the next cursor
    uint64_t key_page(const std::string& pattern, uint64_t cursor, std::vector<std::string>& out);
    uint64_t field_page(const std::string& key, const std::string& pattern, uint64_t cursor,
                        std::vector<std::pair<std::string, std::string>>& out);

private:
    bool use_cursor() const;
    // Records the capability mismatch; returns false when `e` is a different failure
    bool degrade(const store_error& e, std::string_view cmd);

    cache_client& m_client;
    scan_strategy m_strategy;
    size_t m_page_size;
    std::atomic<bool> m_degraded{false};
};

bool parse_scan_strategy(std::string_view name, scan_strategy& out);

} // namespace tagcache
