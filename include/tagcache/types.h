// tagcache/types.h — Shared vocabulary of the tag-indexed cache
#pragma once
#include <chrono>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace tagcache {

// ─── Errors ─────────────────────────────────────────────────────────────────

class cache_error : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

// Store unreachable, transport/protocol failure, or an error reply
class store_error : public cache_error
{
public:
    using cache_error::cache_error;
};

// Value could not be encoded or decoded by the value codec
class serialization_error : public cache_error
{
public:
    using cache_error::cache_error;
};

// ─── Write conditions / TTL ─────────────────────────────────────────────────

enum write_condition : uint8_t
{
    when_always     = 0,
    when_exists     = 1,
    when_not_exists = 2
};

// Expiry applied to a whole top-level key; nullopt keeps the current expiry
using ttl_option = std::optional<std::chrono::milliseconds>;

using tag_list = std::vector<std::string>;

// ─── Tag entries ────────────────────────────────────────────────────────────

enum entry_kind : uint8_t
{
    entry_string            = 0,
    entry_hash_field        = 1,
    entry_set_member        = 2,
    entry_sorted_set_member = 3
};

// Non-owning reference to something a tag groups. `field` holds the encoded
// hash field or set/sorted-set member and is empty for string keys.
struct tag_entry
{
    entry_kind kind = entry_string;
    std::string key;
    std::string field;

    static tag_entry string_key(std::string_view key)
    {
        return {entry_string, std::string(key), {}};
    }

    static tag_entry hash_field(std::string_view key, std::string_view field)
    {
        return {entry_hash_field, std::string(key), std::string(field)};
    }

    static tag_entry set_member(std::string_view key, std::string_view member)
    {
        return {entry_set_member, std::string(key), std::string(member)};
    }

    static tag_entry sorted_set_member(std::string_view key, std::string_view member)
    {
        return {entry_sorted_set_member, std::string(key), std::string(member)};
    }

    // "<kind>:<key length>:<key><field>", unambiguous for any key/field bytes
    std::string encode() const;
    static bool decode(std::string_view text, tag_entry& out);

    bool operator==(const tag_entry&) const = default;
};

} // namespace tagcache
