#pragma once
#include <string>
#include <string_view>
#include <vector>
#include <cstdint>
#include <cstring>
#include <charconv>

// RESP2 protocol: command encoding and reply decoding for the store client,
// request decoding and reply encoding for in-process servers.

namespace tagcache::resp {

// Safety limits to prevent resource exhaustion
constexpr int RESP_MAX_ARRAY_SIZE = 1024 * 1024;
constexpr int RESP_MAX_BULK_LEN = 512 * 1024 * 1024;
constexpr int RESP_MAX_DEPTH = 8;

// ─── Fast \r\n scanner ───
// Uses memchr for the first byte, then checks second byte.
inline const char* find_crlf(const char* data, size_t len) noexcept
{
    const char* end = data + len;
    while (true)
    {
        const char* p = static_cast<const char*>(std::memchr(data, '\r', static_cast<size_t>(end - data)));
        if (__builtin_expect(!p || p + 1 >= end, 0))
            return nullptr;
        if (__builtin_expect(p[1] == '\n', 1))
            return p;
        data = p + 1;
    }
}

// ─── Replies ───

enum class reply_type : uint8_t { simple, error, integer, bulk, nil, array };

struct reply
{
    reply_type type = reply_type::nil;
    std::string str;             // simple, error, bulk
    int64_t integer = 0;
    std::vector<reply> elements; // array

    bool is_nil() const { return type == reply_type::nil; }
    bool is_error() const { return type == reply_type::error; }
    bool is_string() const { return type == reply_type::bulk || type == reply_type::simple; }

    // Integer replies and "1"/"0" bulk replies (some servers answer booleans as strings)
    bool as_bool() const
    {
        if (type == reply_type::integer)
            return integer != 0;
        if (type == reply_type::bulk || type == reply_type::simple)
            return str == "1" || str == "OK";
        return false;
    }

    static reply make_simple(std::string_view s) { reply r; r.type = reply_type::simple; r.str = s; return r; }
    static reply make_error(std::string_view s) { reply r; r.type = reply_type::error; r.str = s; return r; }
    static reply make_integer(int64_t n) { reply r; r.type = reply_type::integer; r.integer = n; return r; }
    static reply make_bulk(std::string_view s) { reply r; r.type = reply_type::bulk; r.str = s; return r; }
    static reply make_nil() { return reply{}; }
    static reply make_array(std::vector<reply> items)
    {
        reply r;
        r.type = reply_type::array;
        r.elements = std::move(items);
        return r;
    }
};

// ─── Zero-allocation encoding (appends directly to caller's buffer) ───

inline void encode_error_into(std::string& buf, std::string_view msg)
{
    buf += '-';
    buf.append(msg.data(), msg.size());
    buf.append("\r\n", 2);
}

inline void encode_simple_into(std::string& buf, std::string_view msg)
{
    buf += '+';
    buf.append(msg.data(), msg.size());
    buf.append("\r\n", 2);
}

inline void encode_integer_into(std::string& buf, int64_t n)
{
    char tmp[24];
    auto [end, ec] = std::to_chars(tmp, tmp + sizeof(tmp), n);
    buf += ':';
    buf.append(tmp, static_cast<size_t>(end - tmp));
    buf.append("\r\n", 2);
}

inline void encode_null_into(std::string& buf)
{
    buf.append("$-1\r\n", 5);
}

inline void encode_bulk_into(std::string& buf, std::string_view str)
{
    // Fast-path for single-digit lengths (0-9)
    size_t sz = str.size();
    if (__builtin_expect(sz <= 9, 1))
    {
        char hdr[4] = { '$', static_cast<char>('0' + sz), '\r', '\n' };
        buf.append(hdr, 4);
        buf.append(str.data(), sz);
        buf.append("\r\n", 2);
        return;
    }
    char tmp[24];
    auto [end, ec] = std::to_chars(tmp, tmp + sizeof(tmp), sz);
    buf += '$';
    buf.append(tmp, static_cast<size_t>(end - tmp));
    buf.append("\r\n", 2);
    buf.append(str.data(), sz);
    buf.append("\r\n", 2);
}

inline void encode_array_header_into(std::string& buf, size_t n)
{
    if (__builtin_expect(n <= 9, 1))
    {
        char hdr[4] = { '*', static_cast<char>('0' + n), '\r', '\n' };
        buf.append(hdr, 4);
        return;
    }
    char tmp[24];
    auto [end, ec] = std::to_chars(tmp, tmp + sizeof(tmp), n);
    buf += '*';
    buf.append(tmp, static_cast<size_t>(end - tmp));
    buf.append("\r\n", 2);
}

// Commands always travel as arrays of bulk strings
inline void encode_command_into(std::string& buf, const std::vector<std::string>& args)
{
    encode_array_header_into(buf, args.size());
    for (const auto& a : args)
        encode_bulk_into(buf, a);
}

inline std::string encode_command(const std::vector<std::string>& args)
{
    std::string out;
    encode_command_into(out, args);
    return out;
}

inline void encode_reply_into(std::string& buf, const reply& r)
{
    switch (r.type)
    {
        case reply_type::simple:  encode_simple_into(buf, r.str); break;
        case reply_type::error:   encode_error_into(buf, r.str); break;
        case reply_type::integer: encode_integer_into(buf, r.integer); break;
        case reply_type::bulk:    encode_bulk_into(buf, r.str); break;
        case reply_type::nil:     encode_null_into(buf); break;
        case reply_type::array:
            encode_array_header_into(buf, r.elements.size());
            for (const auto& e : r.elements)
                encode_reply_into(buf, e);
            break;
    }
}

// ─── Decoding ───

enum class parse_result { ok, incomplete, error };

// Parse a single RESP request (array of bulk strings) from a partial buffer.
// `consumed` is set to how many bytes were consumed from `buf`.
inline parse_result parse_message(std::string_view buf, std::vector<std::string>& args, size_t& consumed)
{
    args.clear();
    consumed = 0;

    const char* data = buf.data();
    size_t sz = buf.size();

    if (__builtin_expect(sz == 0, 0))
        return parse_result::incomplete;

    if (__builtin_expect(data[0] != '*', 0))
        return parse_result::error;

    const char* crlf = find_crlf(data + 1, sz - 1);
    if (__builtin_expect(!crlf, 0))
        return parse_result::incomplete;

    int count = 0;
    auto [ptr, ec] = std::from_chars(data + 1, crlf, count);
    if (ec != std::errc{} || count < 0 || count > RESP_MAX_ARRAY_SIZE)
        return parse_result::error;

    size_t offset = static_cast<size_t>(crlf - data) + 2;

    for (int i = 0; i < count; i++)
    {
        if (offset >= sz)
            return parse_result::incomplete;

        if (data[offset] != '$')
            return parse_result::error;

        const char* end_crlf = find_crlf(data + offset + 1, sz - offset - 1);
        if (!end_crlf)
            return parse_result::incomplete;

        int len = 0;
        auto [p2, e2] = std::from_chars(data + offset + 1, end_crlf, len);
        if (e2 != std::errc{} || len < 0 || len > RESP_MAX_BULK_LEN)
            return parse_result::error;

        offset = static_cast<size_t>(end_crlf - data) + 2;

        if (offset + static_cast<size_t>(len) + 2 > sz)
            return parse_result::incomplete;

        args.emplace_back(data + offset, static_cast<size_t>(len));
        offset += static_cast<size_t>(len) + 2;
    }

    consumed = offset;
    return parse_result::ok;
}

namespace detail {

inline parse_result parse_reply_at(std::string_view buf, size_t& offset, reply& out, int depth)
{
    const char* data = buf.data();
    size_t sz = buf.size();

    if (offset >= sz)
        return parse_result::incomplete;
    if (depth > RESP_MAX_DEPTH)
        return parse_result::error;

    char marker = data[offset];
    const char* crlf = find_crlf(data + offset + 1, sz - offset - 1);
    if (!crlf)
        return parse_result::incomplete;

    std::string_view line(data + offset + 1, static_cast<size_t>(crlf - (data + offset + 1)));
    size_t next = static_cast<size_t>(crlf - data) + 2;

    switch (marker)
    {
        case '+':
            out = reply::make_simple(line);
            offset = next;
            return parse_result::ok;
        case '-':
            out = reply::make_error(line);
            offset = next;
            return parse_result::ok;
        case ':':
        {
            int64_t n = 0;
            auto [p, ec] = std::from_chars(line.data(), line.data() + line.size(), n);
            if (ec != std::errc{} || p != line.data() + line.size())
                return parse_result::error;
            out = reply::make_integer(n);
            offset = next;
            return parse_result::ok;
        }
        case '$':
        {
            int64_t len = 0;
            auto [p, ec] = std::from_chars(line.data(), line.data() + line.size(), len);
            if (ec != std::errc{} || len < -1 || len > RESP_MAX_BULK_LEN)
                return parse_result::error;
            if (len == -1)
            {
                out = reply::make_nil();
                offset = next;
                return parse_result::ok;
            }
            if (next + static_cast<size_t>(len) + 2 > sz)
                return parse_result::incomplete;
            if (data[next + len] != '\r' || data[next + len + 1] != '\n')
                return parse_result::error;
            out = reply::make_bulk(std::string_view(data + next, static_cast<size_t>(len)));
            offset = next + static_cast<size_t>(len) + 2;
            return parse_result::ok;
        }
        case '*':
        {
            int64_t count = 0;
            auto [p, ec] = std::from_chars(line.data(), line.data() + line.size(), count);
            if (ec != std::errc{} || count < -1 || count > RESP_MAX_ARRAY_SIZE)
                return parse_result::error;
            if (count == -1)
            {
                out = reply::make_nil();
                offset = next;
                return parse_result::ok;
            }
            std::vector<reply> items;
            items.resize(static_cast<size_t>(count));
            size_t pos = next;
            for (auto& item : items)
            {
                parse_result pr = parse_reply_at(buf, pos, item, depth + 1);
                if (pr != parse_result::ok)
                    return pr;
            }
            out = reply::make_array(std::move(items));
            offset = pos;
            return parse_result::ok;
        }
        default:
            return parse_result::error;
    }
}

} // namespace detail

// Parse one complete reply of any type from the front of `buf`.
inline parse_result parse_reply(std::string_view buf, reply& out, size_t& consumed)
{
    consumed = 0;
    size_t offset = 0;
    parse_result pr = detail::parse_reply_at(buf, offset, out, 0);
    if (pr == parse_result::ok)
        consumed = offset;
    return pr;
}

} // namespace tagcache::resp
