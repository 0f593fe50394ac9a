#include "richenum/oid.hpp"

#include <cctype>
#include <stdexcept>

#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/string_generator.hpp>
#include <boost/uuid/uuid_io.hpp>

#include "richenum/error.hpp"
#include "richenum/text.hpp"


namespace richenum::oid {

namespace {

[[nodiscard]] inline bool is_hex(char c) noexcept {
    return std::isxdigit(static_cast<unsigned char>(c)) != 0;
}

// Shape check before handing the text to boost, so that plain labels
// ("Shipped", "42") are rejected without going through an exception.
[[nodiscard]] bool has_uuid_shape(std::string_view s) noexcept {
    // {32 hex} or {8-4-4-4-12}
    if (s.size() == 34 || s.size() == 38) {
        if (s.front() != '{' || s.back() != '}') return false;
        s = s.substr(1, s.size() - 2);
    }
    if (s.size() == 32) {
        for (char c : s) {
            if (!is_hex(c)) return false;
        }
        return true;
    }
    if (s.size() != 36) return false;
    for (std::size_t i = 0; i < s.size(); ++i) {
        const bool dash_slot = (i == 8 || i == 13 || i == 18 || i == 23);
        if (dash_slot ? s[i] != '-' : !is_hex(s[i])) return false;
    }
    return true;
}

} // namespace

Oid generate() {
    // boost generators are not thread-safe: one per thread
    thread_local boost::uuids::random_generator gen;
    return gen();
}

bool try_parse(std::string_view literal, Oid& out) noexcept {
    const std::string_view s = text::trim(literal);
    if (!has_uuid_shape(s)) {
        return false;
    }
    try {
        boost::uuids::string_generator gen;
        out = gen(s.begin(), s.end());
        return true;
    } catch (const std::runtime_error&) {
        // string_generator reports malformed input this way
        return false;
    }
}

Oid parse(std::string_view literal) {
    Oid id;
    if (!try_parse(literal, id)) {
        throw error(error_code::invalid_argument, "malformed oid literal: '" + std::string(literal) + "'");
    }
    return id;
}

std::string to_string(const Oid& id) {
    return boost::uuids::to_string(id);
}

} // namespace richenum::oid
