#pragma once

#include <string>
#include <string_view>
#include <cstdint>
#include <cstddef>


namespace lcr {
namespace json {


// Appends s as a JSON string literal body (no surrounding quotes).
// Quotes, backslashes and control characters are escaped; UTF-8 passes through.
inline void append_escaped(std::string& out, std::string_view s) {
    static constexpr char hex[] = "0123456789abcdef";
    out.reserve(out.size() + s.size() + 2);
    for (char c : s) {
        switch (c) {
            case '\"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\b': out += "\\b";  break;
            case '\f': out += "\\f";  break;
            case '\n': out += "\\n";  break;
            case '\r': out += "\\r";  break;
            case '\t': out += "\\t";  break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    out += "\\u00";
                    out += hex[(c >> 4) & 0x0F];
                    out += hex[c & 0x0F];
                } else {
                    out += c;
                }
        }
    }
}

inline std::string escape(std::string_view s) {
    std::string out;
    append_escaped(out, s);
    return out;
}

// Fast integer → string formatter
inline void append(std::string& out, std::uint64_t value)
{
    char buf[32];
    char* p = buf + sizeof(buf);

    do {
        *(--p) = static_cast<char>('0' + (value % 10));
        value /= 10;
    } while (value > 0);

    out.append(p, buf + sizeof(buf) - p);
}

// Signed variant (handles INT64_MIN without overflow)
inline void append(std::string& out, std::int64_t value)
{
    if (value < 0) {
        out += '-';
        append(out, static_cast<std::uint64_t>(0) - static_cast<std::uint64_t>(value));
    } else {
        append(out, static_cast<std::uint64_t>(value));
    }
}

inline void append(std::string& out, std::int32_t value) {
    append(out, static_cast<std::int64_t>(value));
}

inline void append(std::string& out, bool value) {
    out += value ? "true" : "false";
}

// Newline followed by depth * width spaces
inline void append_indent(std::string& out, std::size_t depth, std::size_t width) {
    out += '\n';
    out.append(depth * width, ' ');
}

// "key": (pretty form, with a space after the colon)
inline void append_key(std::string& out, std::string_view key) {
    out += '\"';
    append_escaped(out, key);
    out += "\": ";
}

} // namespace json
} // namespace lcr
