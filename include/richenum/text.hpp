#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>


namespace richenum {

// ===============================================================
// TEXT COMPARISON MODE
// ===============================================================
enum class TextComparison : std::uint8_t {
    Ordinal,     // byte-exact
    IgnoreCase   // ASCII case folding
};

[[nodiscard]] inline constexpr std::string_view to_string(TextComparison c) noexcept {
    switch (c) {
        case TextComparison::Ordinal:    return "ordinal";
        case TextComparison::IgnoreCase: return "ignore_case";
        default:                         return "unknown";
    }
}

namespace text {

[[nodiscard]] inline constexpr bool is_space(char c) noexcept {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

[[nodiscard]] inline constexpr char to_lower(char c) noexcept {
    return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
}

// Strips leading and trailing whitespace (no allocation)
[[nodiscard]] inline constexpr std::string_view trim(std::string_view s) noexcept {
    while (!s.empty() && is_space(s.front())) s.remove_prefix(1);
    while (!s.empty() && is_space(s.back()))  s.remove_suffix(1);
    return s;
}

// Empty or whitespace-only
[[nodiscard]] inline constexpr bool is_blank(std::string_view s) noexcept {
    return trim(s).empty();
}

[[nodiscard]] inline constexpr bool equals(std::string_view a, std::string_view b, TextComparison mode) noexcept {
    if (a.size() != b.size()) return false;
    if (mode == TextComparison::Ordinal) return a == b;
    for (std::size_t i = 0; i < a.size(); ++i) {
        if (to_lower(a[i]) != to_lower(b[i])) return false;
    }
    return true;
}

} // namespace text
} // namespace richenum
