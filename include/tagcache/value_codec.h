// tagcache/value_codec.h — Text encoding of cached values
#pragma once
#include <charconv>
#include <concepts>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

#include <tagcache/types.h>

namespace tagcache {

// Specialize for user types:
//
//   template <> struct tagcache::value_codec<point>
//   {
//       static std::string encode(const point& p);
//       static point decode(std::string_view text);  // throws serialization_error
//   };
template <typename T>
struct value_codec {};

template <typename T>
concept cache_value = requires(const T& value, std::string_view text)
{
    { value_codec<T>::encode(value) } -> std::convertible_to<std::string>;
    { value_codec<T>::decode(text) } -> std::same_as<T>;
};

// Anything that can be written: every cache_value plus string literals and
// views, which are never read back
template <typename T>
concept encodable_value = requires(const T& value)
{
    { value_codec<std::decay_t<const T>>::encode(value) } -> std::convertible_to<std::string>;
};

// ─── Built-in codecs ───

template <>
struct value_codec<std::string>
{
    static std::string encode(const std::string& value) { return value; }
    static std::string decode(std::string_view text) { return std::string(text); }
};

template <>
struct value_codec<const char*>
{
    static std::string encode(const char* value) { return value; }
};

template <>
struct value_codec<std::string_view>
{
    static std::string encode(std::string_view value) { return std::string(value); }
};

template <>
struct value_codec<bool>
{
    static std::string encode(bool value) { return value ? "true" : "false"; }

    static bool decode(std::string_view text)
    {
        if (text == "true" || text == "1")
            return true;
        if (text == "false" || text == "0")
            return false;
        throw serialization_error("not a boolean: '" + std::string(text) + "'");
    }
};

template <typename T>
    requires std::integral<T> && (!std::same_as<T, bool>)
struct value_codec<T>
{
    static std::string encode(T value) { return std::to_string(value); }

    static T decode(std::string_view text)
    {
        T value{};
        auto [p, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
        if (ec != std::errc{} || p != text.data() + text.size())
            throw serialization_error("not an integer in range: '" + std::string(text) + "'");
        return value;
    }
};

template <std::floating_point T>
struct value_codec<T>
{
    static std::string encode(T value)
    {
        char buf[64];
        auto [end, ec] = std::to_chars(buf, buf + sizeof(buf), value);
        if (ec != std::errc{})
            throw serialization_error("floating point value could not be formatted");
        return std::string(buf, static_cast<size_t>(end - buf));
    }

    static T decode(std::string_view text)
    {
        T value{};
        auto [p, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
        if (ec != std::errc{} || p != text.data() + text.size())
            throw serialization_error("not a number: '" + std::string(text) + "'");
        return value;
    }
};

namespace detail {

inline void json_escape_into(std::string& out, std::string_view s)
{
    for (char c : s)
    {
        switch (c)
        {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n";  break;
            case '\r': out += "\\r";  break;
            case '\t': out += "\\t";  break;
            default:   out += c;      break;
        }
    }
}

// Reads a quoted string starting at text[pos] == '"'; pos ends past the closing quote
inline bool json_read_string(std::string_view text, size_t& pos, std::string& out)
{
    if (pos >= text.size() || text[pos] != '"')
        return false;

    out.clear();
    for (++pos; pos < text.size(); ++pos)
    {
        char c = text[pos];
        if (c == '"')
        {
            ++pos;
            return true;
        }
        if (c != '\\')
        {
            out += c;
            continue;
        }
        if (++pos >= text.size())
            return false;
        switch (text[pos])
        {
            case '"':  out += '"';  break;
            case '\\': out += '\\'; break;
            case 'n':  out += '\n'; break;
            case 'r':  out += '\r'; break;
            case 't':  out += '\t'; break;
            default:   return false;
        }
    }
    return false;
}

} // namespace detail

// Array of element encodings: ["a","b\"c"]
template <cache_value T>
struct value_codec<std::vector<T>>
{
    static std::string encode(const std::vector<T>& values)
    {
        std::string out = "[";
        for (size_t i = 0; i < values.size(); ++i)
        {
            if (i)
                out += ',';
            out += '"';
            detail::json_escape_into(out, value_codec<T>::encode(values[i]));
            out += '"';
        }
        out += ']';
        return out;
    }

    static std::vector<T> decode(std::string_view text)
    {
        if (text.size() < 2 || text.front() != '[' || text.back() != ']')
            throw serialization_error("not an array");

        std::vector<T> out;
        size_t pos = 1;
        size_t last = text.size() - 1;
        std::string element;
        while (pos < last)
        {
            if (!detail::json_read_string(text, pos, element) || pos > last)
                throw serialization_error("malformed array element");
            out.push_back(value_codec<T>::decode(element));
            if (pos < last)
            {
                if (text[pos] != ',')
                    throw serialization_error("expected ',' between array elements");
                ++pos;
                if (pos == last)
                    throw serialization_error("trailing ',' in array");
            }
        }
        return out;
    }
};

template <encodable_value T>
std::string encode_value(const T& value)
{
    return value_codec<std::decay_t<const T>>::encode(value);
}

template <cache_value T>
T decode_value(std::string_view text)
{
    return value_codec<T>::decode(text);
}

} // namespace tagcache
