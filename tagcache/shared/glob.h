#pragma once
#include <fnmatch.h>
#include <string>
#include <string_view>

namespace tagcache {

// fnmatch(3) semantics: *, ?, [...] and backslash escapes
inline bool glob_match(std::string_view pattern, std::string_view text)
{
    if (pattern.empty() || pattern == "*")
        return true;
    // fnmatch requires null-terminated strings
    std::string pat_str(pattern);
    std::string text_str(text);
    return fnmatch(pat_str.c_str(), text_str.c_str(), 0) == 0;
}

// Escapes glob metacharacters so `literal` matches only itself
inline std::string escape_glob(std::string_view literal)
{
    std::string out;
    out.reserve(literal.size() + 4);
    for (char c : literal)
    {
        switch (c)
        {
            case '*': case '?': case '[': case ']': case '\\':
                out += '\\';
                [[fallthrough]];
            default:
                out += c;
        }
    }
    return out;
}

} // namespace tagcache
