#include "tag_index.h"
#include "../shared/glob.h"
#include "../shared/logging.h"

#include <charconv>
#include <unordered_set>

namespace tagcache {

// ─── tag_entry encoding ───

namespace {

constexpr char KIND_CHARS[] = {'s', 'h', 'e', 'z'};

void check_all(const std::vector<resp::reply>& replies, std::string_view context)
{
    for (const auto& r : replies)
        check_reply(r, context);
}

tag_list unique_tags(const tag_list& tags)
{
    tag_list out;
    std::unordered_set<std::string_view> seen;
    out.reserve(tags.size());
    for (const auto& t : tags)
    {
        if (seen.insert(t).second)
            out.push_back(t);
    }
    return out;
}

} // namespace

std::string tag_entry::encode() const
{
    std::string out;
    out.reserve(key.size() + field.size() + 16);
    out += KIND_CHARS[kind];
    out += ':';
    out += std::to_string(key.size());
    out += ':';
    out += key;
    out += field;
    return out;
}

bool tag_entry::decode(std::string_view text, tag_entry& out)
{
    if (text.size() < 4 || text[1] != ':')
        return false;

    switch (text[0])
    {
        case 's': out.kind = entry_string; break;
        case 'h': out.kind = entry_hash_field; break;
        case 'e': out.kind = entry_set_member; break;
        case 'z': out.kind = entry_sorted_set_member; break;
        default: return false;
    }

    size_t len = 0;
    const char* begin = text.data() + 2;
    const char* end = text.data() + text.size();
    auto [p, ec] = std::from_chars(begin, end, len);
    if (ec != std::errc{} || p == begin || p == end || *p != ':')
        return false;

    size_t offset = static_cast<size_t>(p - text.data()) + 1;
    if (len > text.size() - offset)
        return false;

    out.key.assign(text.substr(offset, len));
    out.field.assign(text.substr(offset + len));
    if (out.kind == entry_string && !out.field.empty())
        return false;
    return true;
}

// ─── tag_index ───

tag_index::tag_index(cache_client& client, pattern_scanner& scanner, std::string prefix)
    : m_client(client), m_scanner(scanner), m_prefix(std::move(prefix))
{
    if (m_prefix.empty())
        m_prefix = DEFAULT_PREFIX;
}

std::string tag_index::set_key(std::string_view tag) const
{
    std::string out;
    out.reserve(m_prefix.size() + 4 + tag.size());
    out += m_prefix;
    out += "set:";
    out += tag;
    return out;
}

std::string tag_index::record_key(const tag_entry& entry) const
{
    return m_prefix + "entry:" + entry.encode();
}

command tag_index::liveness_command(const tag_entry& entry)
{
    switch (entry.kind)
    {
        case entry_hash_field:        return {"HEXISTS", entry.key, entry.field};
        case entry_set_member:        return {"SISMEMBER", entry.key, entry.field};
        case entry_sorted_set_member: return {"ZSCORE", entry.key, entry.field};
        default:                      return {"EXISTS", entry.key};
    }
}

bool tag_index::is_live_reply(const tag_entry& entry, const resp::reply& r)
{
    // WRONGTYPE and other error replies: the entry no longer points at what it was tagged as
    if (r.is_error())
        return false;
    if (entry.kind == entry_sorted_set_member)
        return r.is_string();
    return r.as_bool();
}

void tag_index::associate(const tag_entry& entry, const tag_list& tags)
{
    if (tags.empty())
        return;

    tag_list wanted = unique_tags(tags);
    std::string encoded = entry.encode();
    std::string record = record_key(entry);
    std::unordered_set<std::string_view> keep(wanted.begin(), wanted.end());

    // The record is watched while it is read and rewritten, so a concurrent
    // retag of the same entry aborts one side, which then starts over
    auto rewrite = [&](const resp::reply& previous)
    {
        std::vector<command> cmds;
        cmds.reserve(previous.elements.size() + wanted.size() + 2);
        for (const auto& old : previous.elements)
        {
            if (!keep.count(old.str))
                cmds.push_back({"SREM", set_key(old.str), encoded});
        }
        for (const auto& t : wanted)
            cmds.push_back({"SADD", set_key(t), encoded});

        cmds.push_back({"DEL", record});
        command members{"SADD", record};
        members.insert(members.end(), wanted.begin(), wanted.end());
        cmds.push_back(std::move(members));
        return cmds;
    };

    for (int attempt = 0; attempt < ASSOCIATE_ATTEMPTS; ++attempt)
    {
        auto replies = m_client.watched_exec(record, {"SMEMBERS", record}, rewrite);
        if (replies)
        {
            check_all(*replies, "associate tags");
            return;
        }
    }
    throw store_error("associate tags: " + record + " kept changing underneath");
}

bool tag_index::is_in_tag(const tag_entry& entry, const tag_list& tags)
{
    if (tags.empty())
        return false;

    std::string encoded = entry.encode();
    std::vector<command> cmds;
    cmds.reserve(tags.size() + 1);
    for (const auto& t : tags)
        cmds.push_back({"SISMEMBER", set_key(t), encoded});
    // Liveness rides along in the same round trip
    cmds.push_back(liveness_command(entry));

    auto replies = m_client.pipeline(cmds);

    bool member = false;
    for (size_t i = 0; i < tags.size(); ++i)
    {
        check_reply(replies[i], "SISMEMBER");
        member |= replies[i].as_bool();
    }
    if (!member)
        return false;

    if (is_live_reply(entry, replies.back()))
        return true;

    TAGCACHE_LOG_DEBUG("dropping dangling tag entry " + encoded);
    forget(entry, tags);
    return false;
}

void tag_index::forget(const tag_entry& entry, const tag_list& also)
{
    std::string encoded = entry.encode();
    std::string record = record_key(entry);

    std::vector<std::string> recorded = m_client.smembers(record);
    std::unordered_set<std::string> tags(recorded.begin(), recorded.end());
    tags.insert(also.begin(), also.end());

    std::vector<command> cmds;
    cmds.reserve(tags.size() + 1);
    for (const auto& t : tags)
        cmds.push_back({"SREM", set_key(t), encoded});
    cmds.push_back({"DEL", record});

    check_all(m_client.pipeline(cmds), "drop tag entry");
}

std::vector<tag_entry> tag_index::entries(const tag_list& tags)
{
    std::vector<tag_entry> out;
    if (tags.empty())
        return out;

    tag_list names = unique_tags(tags);
    std::vector<command> cmds;
    cmds.reserve(names.size());
    for (const auto& t : names)
        cmds.push_back({"SMEMBERS", set_key(t)});
    auto members = m_client.pipeline(cmds);

    std::vector<tag_entry> candidates;
    std::unordered_set<std::string> seen;
    for (size_t i = 0; i < names.size(); ++i)
    {
        check_reply(members[i], "SMEMBERS");
        for (const auto& e : members[i].elements)
        {
            if (!seen.insert(e.str).second)
                continue;

            tag_entry entry;
            if (!tag_entry::decode(e.str, entry))
            {
                TAGCACHE_LOG_WARN("removing malformed tag entry from " + names[i]);
                m_client.srem(set_key(names[i]), e.str);
                continue;
            }
            candidates.push_back(std::move(entry));
        }
    }

    if (candidates.empty())
        return out;

    std::vector<command> checks;
    checks.reserve(candidates.size());
    for (const auto& entry : candidates)
        checks.push_back(liveness_command(entry));
    auto live = m_client.pipeline(checks);

    for (size_t i = 0; i < candidates.size(); ++i)
    {
        if (is_live_reply(candidates[i], live[i]))
        {
            out.push_back(std::move(candidates[i]));
        }
        else
        {
            TAGCACHE_LOG_DEBUG("dropping dangling tag entry " + candidates[i].encode());
            forget(candidates[i], names);
        }
    }
    return out;
}

std::vector<std::string> tag_index::tags_of(const tag_entry& entry)
{
    return m_client.smembers(record_key(entry));
}

void tag_index::remove_tags(const tag_entry& entry, const tag_list& tags)
{
    if (tags.empty())
        return;

    std::string encoded = entry.encode();
    std::vector<command> cmds;
    cmds.reserve(tags.size() + 1);
    for (const auto& t : tags)
        cmds.push_back({"SREM", set_key(t), encoded});

    command untag{"SREM", record_key(entry)};
    untag.insert(untag.end(), tags.begin(), tags.end());
    cmds.push_back(std::move(untag));

    check_all(m_client.pipeline(cmds), "remove tags");
}

int64_t tag_index::invalidate(const tag_list& tags)
{
    if (tags.empty())
        return 0;

    std::vector<tag_entry> live = entries(tags);

    int64_t removed = 0;
    if (!live.empty())
    {
        std::vector<command> cmds;
        cmds.reserve(live.size());
        for (const auto& entry : live)
        {
            switch (entry.kind)
            {
                case entry_hash_field:        cmds.push_back({"HDEL", entry.key, entry.field}); break;
                case entry_set_member:        cmds.push_back({"SREM", entry.key, entry.field}); break;
                case entry_sorted_set_member: cmds.push_back({"ZREM", entry.key, entry.field}); break;
                default:                      cmds.push_back({"DEL", entry.key}); break;
            }
        }

        auto replies = m_client.pipeline(cmds);
        for (const auto& r : replies)
        {
            check_reply(r, "invalidate");
            removed += r.integer > 0 ? 1 : 0;
        }

        for (const auto& entry : live)
            forget(entry, tags);
    }

    std::vector<std::string> set_keys;
    set_keys.reserve(tags.size());
    for (const auto& t : tags)
        set_keys.push_back(set_key(t));
    m_client.del(set_keys);

    TAGCACHE_LOG_INFO("invalidated " + std::to_string(removed) + " entries across " +
                      std::to_string(tags.size()) + " tags");
    return removed;
}

std::vector<std::string> tag_index::all_tags()
{
    std::string head = m_prefix + "set:";
    std::vector<std::string> out;
    for (const auto& key : m_scanner.keys(escape_glob(head) + "*"))
    {
        if (key.size() > head.size())
            out.push_back(key.substr(head.size()));
    }
    return out;
}

} // namespace tagcache
