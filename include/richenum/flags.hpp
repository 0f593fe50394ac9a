#pragma once

#include <concepts>
#include <cstdint>
#include <type_traits>

#include "richenum/member.hpp"

/*
===============================================================================
richenum Flag Algebra
===============================================================================

Bitwise helpers over member values, for enumeration types whose values are
bit masks. All of them:

  - treat an absent operand (nullptr) as the all-zero mask
  - return plain masks or booleans, never new members
  - accept two operands of the SAME enumeration type only (the second
    parameter is not deduced, so `nullptr` can be passed there directly)
===============================================================================
*/

namespace richenum::flags {

template <typename T>
concept Enumeration = std::derived_from<T, Member>;

template <Enumeration T>
[[nodiscard]] inline std::int32_t bits(const T* e) noexcept {
    return e ? e->value() : 0;
}

// True iff a and b share at least one bit; false if either is absent
template <Enumeration T>
[[nodiscard]] inline bool shares_bit(const T* a, std::type_identity_t<const T*> b) noexcept {
    if (a == nullptr || b == nullptr) return false;
    return (a->value() & b->value()) != 0;
}

template <Enumeration T>
[[nodiscard]] inline std::int32_t combine(const T* a, std::type_identity_t<const T*> b) noexcept {
    return bits(a) | bits(b);
}

template <Enumeration T>
[[nodiscard]] inline std::int32_t complement(const T* a) noexcept {
    return ~bits(a);
}

// True iff every bit of flag is set in a; false if flag is absent
template <Enumeration T>
[[nodiscard]] inline bool has_flag(const T* a, std::type_identity_t<const T*> flag) noexcept {
    if (flag == nullptr) return false;
    return (bits(a) & flag->value()) == flag->value();
}

// Reference forms
template <Enumeration T>
[[nodiscard]] inline bool shares_bit(const T& a, const std::type_identity_t<T>& b) noexcept {
    return shares_bit(&a, &b);
}

template <Enumeration T>
[[nodiscard]] inline std::int32_t combine(const T& a, const std::type_identity_t<T>& b) noexcept {
    return combine(&a, &b);
}

template <Enumeration T>
[[nodiscard]] inline std::int32_t complement(const T& a) noexcept {
    return complement(&a);
}

template <Enumeration T>
[[nodiscard]] inline bool has_flag(const T& a, const std::type_identity_t<T>& flag) noexcept {
    return has_flag(&a, &flag);
}

} // namespace richenum::flags
