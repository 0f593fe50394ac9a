#include "richenum/lookup.hpp"

#include <charconv>
#include <system_error>


namespace richenum::lookup {

bool parse_int32(std::string_view s, std::int32_t& out) noexcept {
    s = text::trim(s);
    if (!s.empty() && s.front() == '+') {
        s.remove_prefix(1);
        // "+-5" is not a number
        if (!s.empty() && s.front() == '-') return false;
    }
    if (s.empty()) {
        return false;
    }
    std::int32_t v = 0;
    const char* first = s.data();
    const char* last = s.data() + s.size();
    auto [ptr, ec] = std::from_chars(first, last, v);
    if (ec != std::errc{} || ptr != last) {
        return false;
    }
    out = v;
    return true;
}

} // namespace richenum::lookup
