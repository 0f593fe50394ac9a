#pragma once

#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <string>

#include "richenum/entry.hpp"
#include "richenum/oid.hpp"


namespace richenum {

class Registry;

/*
===============================================================================
richenum::Member
===============================================================================

Type-erased base of every live enumeration member. Holds the five fields
assigned by the registry and implements the value-based identity rules:

  - equals(): same dynamic type AND same value
  - hash():   the value itself
  - as_int(): numeric projection, also usable as `member == 42`

Members are registered by address, so they are neither copyable nor movable.
Fields are written only by the owning Registry.
===============================================================================
*/
class Member {
public:
    Member(const Member&) = delete;
    Member& operator=(const Member&) = delete;
    Member(Member&&) = delete;
    Member& operator=(Member&&) = delete;

    [[nodiscard]] const std::string& text() const noexcept { return text_; }
    [[nodiscard]] std::int32_t value() const noexcept { return value_; }
    [[nodiscard]] std::int32_t index() const noexcept { return index_; }
    [[nodiscard]] const Oid& oid() const noexcept { return oid_; }
    [[nodiscard]] bool is_visible() const noexcept { return is_visible_; }

    [[nodiscard]] std::int32_t as_int() const noexcept { return value_; }
    [[nodiscard]] const std::string& to_string() const noexcept { return text_; }

    // Detached copy of the five fields
    [[nodiscard]] EnumEntry clone() const;

    [[nodiscard]] bool equals(const Member& other) const noexcept;

    [[nodiscard]] std::size_t hash() const noexcept { return static_cast<std::size_t>(value_); }

    friend bool operator==(const Member& m, std::int32_t v) noexcept { return m.value_ == v; }

protected:
    Member() = default;
    virtual ~Member() = default;

private:
    friend class Registry;

    std::string  text_;
    std::int32_t value_{0};
    std::int32_t index_{0};
    Oid          oid_{};
    bool         is_visible_{true};
};


// Hash functor for unordered containers of members
struct MemberHash {
    [[nodiscard]] std::size_t operator()(const Member& m) const noexcept { return m.hash(); }
    [[nodiscard]] std::size_t operator()(const Member* m) const noexcept { return m ? m->hash() : 0; }
};


// Streams text()
std::ostream& operator<<(std::ostream&, const Member&);

} // namespace richenum
