#pragma once

#include <string>
#include <string_view>

#include <boost/uuid/uuid.hpp>


namespace richenum {

// 128-bit opaque identifier of an enumeration member.
// Used for external correlation only, never for ordering or equality.
using Oid = boost::uuids::uuid;

namespace oid {

// Fresh random (version 4) identifier. Thread-safe.
[[nodiscard]] Oid generate();

// Accepts the canonical 8-4-4-4-12 form, the 32 hex digit form and either of
// them wrapped in braces, case-insensitive, surrounding whitespace ignored.
// Leaves out untouched on failure.
[[nodiscard]] bool try_parse(std::string_view literal, Oid& out) noexcept;

// Same as try_parse but throws richenum::error(invalid_argument)
[[nodiscard]] Oid parse(std::string_view literal);

// Canonical lowercase 8-4-4-4-12 form
[[nodiscard]] std::string to_string(const Oid& id);

} // namespace oid
} // namespace richenum
