#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace richenum {

/*
===============================================================================
richenum Error Model
===============================================================================

Strict operations report failure by throwing richenum::error, which carries
an error_code. Every strict lookup has a try_* twin that reports "not found"
through a bool instead.

[duplicate_value] / [duplicate_index] an explicit value or index collides with
one already registered for the same enumeration type. The construction is
aborted and the registry is left unchanged. This is a misconfigured type and
cannot be recovered from at the call site.

[exhausted_value_space] / [exhausted_index_space] auto-numbering reached
INT32_MAX without finding a free number.

[not_found] a strict lookup (by oid, value or text) found no member, or a JSON
file to read does not exist.

[invalid_argument] blank text passed to a strict text lookup, a malformed oid
literal passed to the strict oid lookup, or an empty file path.

[default_already_set] the default member of a type was designated twice.

[invalid_json] a JSON document could not be decoded into an entry list.

[io_failure] a stream or file could not be read or written.
===============================================================================
*/

enum class error_code : std::uint8_t {
    duplicate_value,
    duplicate_index,
    exhausted_value_space,
    exhausted_index_space,
    not_found,
    invalid_argument,
    default_already_set,
    invalid_json,
    io_failure
};

[[nodiscard]] std::string_view to_string(error_code code) noexcept;

class error : public std::runtime_error {
public:
    error(error_code code, const std::string& message)
        : std::runtime_error(message)
        , code_(code)
    {}

    [[nodiscard]] error_code code() const noexcept { return code_; }

private:
    error_code code_;
};

} // namespace richenum
