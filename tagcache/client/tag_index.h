#pragma once
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include <tagcache/types.h>
#include "cache_client.h"
#include "pattern_scanner.h"

namespace tagcache {

// Tag membership kept in the store itself:
//   <prefix>set:<tag>          set of encoded entries carrying the tag
//   <prefix>entry:<encoded>    set of tags currently on that entry
// Entries are never removed when their value disappears; queries check
// liveness and drop the dead entries they run into.
class tag_index
{
public:
    static constexpr std::string_view DEFAULT_PREFIX = "_tag:";
    // WATCH/EXEC rounds a retag may lose to concurrent writers before giving up
    static constexpr int ASSOCIATE_ATTEMPTS = 32;

    tag_index(cache_client& client, pattern_scanner& scanner,
              std::string prefix = std::string(DEFAULT_PREFIX));

    // Replaces the entry's tags with `tags` as one transaction; of two
    // concurrent replacements the later commit wins. An empty list is a no-op.
    void associate(const tag_entry& entry, const tag_list& tags);

    // True when the entry is live and carries at least one of `tags`
    bool is_in_tag(const tag_entry& entry, const tag_list& tags);

    // Live entries carrying any of `tags`, without duplicates
    std::vector<tag_entry> entries(const tag_list& tags);

    std::vector<std::string> tags_of(const tag_entry& entry);
    void remove_tags(const tag_entry& entry, const tag_list& tags);

    // Removes every live entry of `tags` from the store, then the tags
    // themselves. Returns the number of entries removed.
    int64_t invalidate(const tag_list& tags);

    std::vector<std::string> all_tags();

    std::string set_key(std::string_view tag) const;
    std::string record_key(const tag_entry& entry) const;
    const std::string& prefix() const { return m_prefix; }

private:
    static command liveness_command(const tag_entry& entry);
    static bool is_live_reply(const tag_entry& entry, const resp::reply& r);

    // Detaches a dead entry from every tag it is recorded under (plus `also`)
    void forget(const tag_entry& entry, const tag_list& also);

    cache_client& m_client;
    pattern_scanner& m_scanner;
    std::string m_prefix;
};

} // namespace tagcache
