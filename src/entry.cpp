#include "richenum/entry.hpp"

#include <ostream>


namespace richenum {

// ---------------------------------
// Debug / logging helper
// ---------------------------------

std::ostream& operator<<(std::ostream& os, const EnumEntry& e) {
    os << "[EnumEntry] {"
       << "text=" << e.text
       << ", value=" << e.value
       << ", index=" << e.index
       << ", oid=" << oid::to_string(e.oid)
       << ", visible=" << (e.is_visible ? "true" : "false")
       << "}";

    return os;
}

} // namespace richenum
