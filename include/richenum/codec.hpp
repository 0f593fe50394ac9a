#pragma once

#include <cstdint>
#include <filesystem>
#include <iosfwd>
#include <string>
#include <string_view>
#include <vector>

#include "richenum/entry.hpp"

/*
================================================================================
richenum JSON Codec
================================================================================

Serializes detached entry lists (EnumEntry) to and from JSON:

  [
    {
      "text": "Shipped",
      "value": 42,
      "index": -2147483646,
      "oid": "3fa85f64-5717-4562-b3fc-2c963f66afa6",
      "isVisible": true
    }
  ]

Encoding is pretty-printed (2-space indent), oids in canonical lowercase form.
Texts must be valid UTF-8; encode() refuses anything decode() would reject.
Decoding is backed by simdjson DOM parsing:
  • Field names are matched case-insensitively
  • All five fields are required, unknown fields are ignored
  • value/index must fit in int32, oid must be a valid UUID literal

decode() reports failures through Result and never throws for malformed
input. The stream/file wrappers log and throw richenum::error.
================================================================================
*/

namespace richenum::codec {

// ===============================================
// DECODE RESULT
// ===============================================
enum class Result : std::uint8_t {
    Ok            = 0,
    InvalidJson   = 1,   // Structural failure (including empty input)
    InvalidSchema = 2,   // Not an array of objects, missing field, wrong type
    InvalidValue  = 3    // Field present but out of range / malformed oid
};

[[nodiscard]]
inline constexpr std::string_view to_string(Result r) noexcept {
    switch (r) {
        case Result::Ok:            return "Ok";
        case Result::InvalidJson:   return "InvalidJson";
        case Result::InvalidSchema: return "InvalidSchema";
        case Result::InvalidValue:  return "InvalidValue";
        default:                    return "unknown";
    }
}

// ---------------------------------------------------------------------------
// In-memory
// ---------------------------------------------------------------------------

// invalid_argument if a text is not valid UTF-8
[[nodiscard]] std::string encode(const std::vector<EnumEntry>& entries);

// out is only assigned on Result::Ok
[[nodiscard]] Result decode(std::string_view json, std::vector<EnumEntry>& out);

// ---------------------------------------------------------------------------
// Streams and files (throw richenum::error)
// ---------------------------------------------------------------------------

// invalid_argument as encode(), io_failure if the stream goes bad
void write(std::ostream& os, const std::vector<EnumEntry>& entries);

// invalid_argument for an empty path or as encode() (the file is left
// untouched), io_failure if the file cannot be written
void write_file(const std::filesystem::path& file, const std::vector<EnumEntry>& entries);

// invalid_json for malformed or empty input, io_failure on read errors
[[nodiscard]] std::vector<EnumEntry> read(std::istream& is);

// not_found if the file does not exist, otherwise as read()
[[nodiscard]] std::vector<EnumEntry> read_file(const std::filesystem::path& file);

} // namespace richenum::codec
