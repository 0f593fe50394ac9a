#pragma once

#include <cstdint>
#include <string_view>

#include "richenum/member.hpp"
#include "richenum/oid.hpp"
#include "richenum/text.hpp"

/*
================================================================================
richenum Lookup & Parse Engine
================================================================================

Stateless scans over a registration-order sequence of member pointers.
Registry runs them on its own list while holding its lock, so the member
fields they read cannot change under them.

  • Return nullptr when nothing matches, never throw
  • First match in registration order wins
  • Do not log

parse() resolves free-form input in this order, first match wins:
  1. blank input               → nullptr (nothing else is tried)
  2. oid literal               → by_oid
  3. signed decimal integer    → by_value
  4. anything else             → by_text with the given comparison mode
A step whose literal parses but does not match falls through to the next one.
================================================================================
*/

namespace richenum::lookup {

// Signed decimal int32 with optional surrounding whitespace and leading '+'.
// Leaves out untouched on failure (including overflow).
[[nodiscard]] bool parse_int32(std::string_view s, std::int32_t& out) noexcept;

template <typename Items>
[[nodiscard]] const Member* by_oid(const Items& items, const Oid& id) noexcept {
    for (const Member* m : items) {
        if (m->oid() == id) return m;
    }
    return nullptr;
}

template <typename Items>
[[nodiscard]] const Member* by_value(const Items& items, std::int32_t value) noexcept {
    for (const Member* m : items) {
        if (m->value() == value) return m;
    }
    return nullptr;
}

// Blank text never matches
template <typename Items>
[[nodiscard]] const Member* by_text(const Items& items, std::string_view label, TextComparison mode) noexcept {
    if (text::is_blank(label)) {
        return nullptr;
    }
    for (const Member* m : items) {
        if (text::equals(m->text(), label, mode)) return m;
    }
    return nullptr;
}

template <typename Items>
[[nodiscard]] const Member* parse(const Items& items, std::string_view input, TextComparison mode) noexcept {
    if (text::is_blank(input)) {
        return nullptr;
    }
    // 1) oid literal
    Oid id;
    if (oid::try_parse(input, id)) {
        if (const Member* m = by_oid(items, id)) return m;
    }
    // 2) integer value
    std::int32_t value;
    if (parse_int32(input, value)) {
        if (const Member* m = by_value(items, value)) return m;
    }
    // 3) text
    return by_text(items, input, mode);
}

} // namespace richenum::lookup
