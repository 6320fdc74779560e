#pragma once
#include <cstdint>
#include <string_view>

namespace tagcache {

constexpr uint32_t fnv1a(std::string_view sv)
{
    uint32_t hash = 2166136261u;
    for (char c : sv)
        hash = (hash ^ static_cast<uint8_t>(c)) * 16777619u;
    return hash;
}

// Case-insensitive hash (converts to lowercase on the fly, no allocation)
constexpr uint32_t fnv1a_lower(std::string_view sv)
{
    uint32_t hash = 2166136261u;
    for (char c : sv)
    {
        char lower = (c >= 'A' && c <= 'Z') ? static_cast<char>(c + 32) : c;
        hash = (hash ^ static_cast<uint8_t>(lower)) * 16777619u;
    }
    return hash;
}

// 64-bit variant used for HyperLogLog register selection
constexpr uint64_t fnv1a_64(std::string_view sv)
{
    uint64_t hash = 14695981039346656037ull;
    for (char c : sv)
        hash = (hash ^ static_cast<uint8_t>(c)) * 1099511628211ull;
    // Finalizer mixes the high bits into the low ones; FNV alone leaves
    // poorly distributed low bits for short inputs.
    hash ^= hash >> 33;
    hash *= 0xff51afd7ed558ccdull;
    hash ^= hash >> 33;
    hash *= 0xc4ceb9fe1a85ec53ull;
    hash ^= hash >> 33;
    return hash;
}

} // namespace tagcache
