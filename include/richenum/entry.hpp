#pragma once

#include <cstdint>
#include <iosfwd>
#include <string>

#include "richenum/oid.hpp"


namespace richenum {

// -----------------------------
// Detached entry record
// -----------------------------
// Plain copy of one member's five fields. Returned by cloned_entries() and
// consumed/produced by the JSON codec; holding one gives no access to the
// live registry.
struct EnumEntry {
    std::string  text;
    std::int32_t value{0};
    std::int32_t index{0};
    Oid          oid{};
    bool         is_visible{true};

    [[nodiscard]] const std::string& to_string() const noexcept { return text; }

    friend bool operator==(const EnumEntry&, const EnumEntry&) = default;
};


std::ostream& operator<<(std::ostream&, const EnumEntry&);

} // namespace richenum
