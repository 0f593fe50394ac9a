#include "richenum/codec.hpp"

#include <fstream>
#include <istream>
#include <iterator>
#include <limits>
#include <ostream>
#include <string>
#include <system_error>

#include "simdjson.h"

#include "richenum/config.hpp"
#include "richenum/error.hpp"
#include "lcr/json.hpp"
#include "lcr/log/logger.hpp"


namespace richenum::codec {

namespace {

// Field names as written; decoding matches them case-insensitively
constexpr std::string_view KEY_TEXT       = "text";
constexpr std::string_view KEY_VALUE      = "value";
constexpr std::string_view KEY_INDEX      = "index";
constexpr std::string_view KEY_OID        = "oid";
constexpr std::string_view KEY_IS_VISIBLE = "isVisible";

// ============================================================================
// DECODE HELPERS (no logging, no throwing)
// ============================================================================

[[nodiscard]]
Result parse_string_field(const simdjson::dom::object& obj, std::string_view key, std::string_view& out) noexcept {
    if (obj.at_key_case_insensitive(key).get(out)) {
        return Result::InvalidSchema; // missing or not a string
    }
    return Result::Ok;
}

[[nodiscard]]
Result parse_int32_field(const simdjson::dom::object& obj, std::string_view key, std::int32_t& out) noexcept {
    simdjson::dom::element field;
    if (obj.at_key_case_insensitive(key).get(field)) {
        return Result::InvalidSchema;
    }
    if (!field.is_number()) {
        return Result::InvalidSchema;
    }
    std::int64_t v;
    if (field.get(v)) {
        return Result::InvalidValue; // fractional or beyond int64
    }
    if (v < std::numeric_limits<std::int32_t>::min() || v > std::numeric_limits<std::int32_t>::max()) {
        return Result::InvalidValue;
    }
    out = static_cast<std::int32_t>(v);
    return Result::Ok;
}

[[nodiscard]]
Result parse_bool_field(const simdjson::dom::object& obj, std::string_view key, bool& out) noexcept {
    if (obj.at_key_case_insensitive(key).get(out)) {
        return Result::InvalidSchema;
    }
    return Result::Ok;
}

[[nodiscard]]
Result parse_entry(const simdjson::dom::element& item, EnumEntry& out) {
    simdjson::dom::object obj;
    if (item.get_object().get(obj)) {
        return Result::InvalidSchema;
    }

    std::string_view text;
    auto r = parse_string_field(obj, KEY_TEXT, text);
    if (r != Result::Ok) return r;

    std::int32_t value;
    r = parse_int32_field(obj, KEY_VALUE, value);
    if (r != Result::Ok) return r;

    std::int32_t index;
    r = parse_int32_field(obj, KEY_INDEX, index);
    if (r != Result::Ok) return r;

    std::string_view oid_literal;
    r = parse_string_field(obj, KEY_OID, oid_literal);
    if (r != Result::Ok) return r;
    Oid id;
    if (!oid::try_parse(oid_literal, id)) {
        return Result::InvalidValue;
    }

    bool is_visible;
    r = parse_bool_field(obj, KEY_IS_VISIBLE, is_visible);
    if (r != Result::Ok) return r;

    out.text = std::string(text);
    out.value = value;
    out.index = index;
    out.oid = id;
    out.is_visible = is_visible;
    return Result::Ok;
}

} // namespace

// ============================================================================
// In-memory
// ============================================================================

std::string encode(const std::vector<EnumEntry>& entries) {
    using namespace lcr::json;
    constexpr std::size_t w = config::JSON_INDENT_WIDTH;

    std::string out;
    if (entries.empty()) {
        out = "[]";
        return out;
    }
    for (const EnumEntry& e : entries) {
        if (!simdjson::validate_utf8(e.text.data(), e.text.size())) {
            RE_ERROR("[CODEC] entry " << e.value << " has a text that is not valid UTF-8");
            throw error(error_code::invalid_argument,
                        "text of entry " + std::to_string(e.value) + " is not valid UTF-8");
        }
    }
    out.reserve(entries.size() * 160);

    out += '[';
    for (std::size_t i = 0; i < entries.size(); ++i) {
        const EnumEntry& e = entries[i];
        append_indent(out, 1, w);
        out += '{';

        append_indent(out, 2, w);
        append_key(out, KEY_TEXT);
        out += '\"';
        append_escaped(out, e.text);
        out += "\",";

        append_indent(out, 2, w);
        append_key(out, KEY_VALUE);
        append(out, e.value);
        out += ',';

        append_indent(out, 2, w);
        append_key(out, KEY_INDEX);
        append(out, e.index);
        out += ',';

        append_indent(out, 2, w);
        append_key(out, KEY_OID);
        out += '\"';
        out += oid::to_string(e.oid);
        out += "\",";

        append_indent(out, 2, w);
        append_key(out, KEY_IS_VISIBLE);
        append(out, e.is_visible);

        append_indent(out, 1, w);
        out += '}';
        if (i + 1 < entries.size()) {
            out += ',';
        }
    }
    append_indent(out, 0, w);
    out += ']';
    return out;
}

Result decode(std::string_view json, std::vector<EnumEntry>& out) {
    if (json.empty()) {
        return Result::InvalidJson;
    }
    simdjson::dom::parser parser;
    simdjson::dom::element root;
    if (parser.parse(json.data(), json.size()).get(root)) {
        return Result::InvalidJson;
    }
    simdjson::dom::array items;
    if (root.get_array().get(items)) {
        return Result::InvalidSchema;
    }

    std::vector<EnumEntry> entries;
    entries.reserve(items.size());
    for (simdjson::dom::element item : items) {
        EnumEntry e;
        auto r = parse_entry(item, e);
        if (r != Result::Ok) {
            return r;
        }
        entries.push_back(std::move(e));
    }
    out = std::move(entries);
    return Result::Ok;
}

// ============================================================================
// Streams and files
// ============================================================================

namespace {

void put_encoded(std::ostream& os, const std::string& json, std::size_t count) {
    os << json;
    os.flush();
    if (!os) {
        RE_ERROR("[CODEC] failed to write " << count << " entries to stream");
        throw error(error_code::io_failure, "failed to write JSON to stream");
    }
}

} // namespace

void write(std::ostream& os, const std::vector<EnumEntry>& entries) {
    put_encoded(os, encode(entries), entries.size());
}

void write_file(const std::filesystem::path& file, const std::vector<EnumEntry>& entries) {
    if (file.empty()) {
        throw error(error_code::invalid_argument, "file name cannot be empty");
    }
    // encode before truncating: a rejected list leaves the file as it was
    const std::string json = encode(entries);
    std::ofstream os(file, std::ios::binary | std::ios::trunc);
    if (!os) {
        RE_ERROR("[CODEC] cannot open " << file << " for writing");
        throw error(error_code::io_failure, "cannot open " + file.string() + " for writing");
    }
    put_encoded(os, json, entries.size());
    RE_DEBUG("[CODEC] wrote " << entries.size() << " entries to " << file);
}

std::vector<EnumEntry> read(std::istream& is) {
    std::string buffer{std::istreambuf_iterator<char>(is), std::istreambuf_iterator<char>()};
    if (is.bad()) {
        RE_ERROR("[CODEC] stream read failure");
        throw error(error_code::io_failure, "failed to read JSON from stream");
    }
    std::vector<EnumEntry> entries;
    const Result r = decode(buffer, entries);
    if (r != Result::Ok) {
        RE_WARN("[CODEC] cannot decode entry list: " << to_string(r) << " (" << buffer.size() << " bytes)");
        throw error(error_code::invalid_json, "cannot decode entry list: " + std::string(to_string(r)));
    }
    return entries;
}

std::vector<EnumEntry> read_file(const std::filesystem::path& file) {
    std::error_code ec;
    const bool exists = std::filesystem::exists(file, ec);
    if (ec) {
        throw error(error_code::io_failure, "cannot access " + file.string() + ": " + ec.message());
    }
    if (!exists) {
        throw error(error_code::not_found, "JSON file not found: " + file.string());
    }
    std::ifstream is(file, std::ios::binary);
    if (!is) {
        RE_ERROR("[CODEC] cannot open " << file << " for reading");
        throw error(error_code::io_failure, "cannot open " + file.string() + " for reading");
    }
    auto entries = read(is);
    RE_DEBUG("[CODEC] read " << entries.size() << " entries from " << file);
    return entries;
}

} // namespace richenum::codec
