#include "richenum/member.hpp"

#include <ostream>
#include <typeinfo>


namespace richenum {

EnumEntry Member::clone() const {
    return EnumEntry{text_, value_, index_, oid_, is_visible_};
}

bool Member::equals(const Member& other) const noexcept {
    if (this == &other) {
        return true;
    }
    // Members of different enumeration types never compare equal
    if (typeid(*this) != typeid(other)) {
        return false;
    }
    return value_ == other.value_;
}

std::ostream& operator<<(std::ostream& os, const Member& m) {
    return os << m.text();
}

} // namespace richenum
