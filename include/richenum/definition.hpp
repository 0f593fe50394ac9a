#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "richenum/oid.hpp"


namespace richenum {

// -----------------------------
// Member definition (construction input)
// -----------------------------
// Omitted value/index are auto-assigned by the registry, an omitted oid is
// freshly generated. Field order allows designated initializers:
//
//     OrderStatus shipped{{.text = "Shipped", .value = 42}};
//
struct Definition {
    std::optional<Oid>          oid{};
    std::string                 text{};
    std::optional<std::int32_t> value{};
    std::optional<std::int32_t> index{};
    bool                        is_visible{true};
};

} // namespace richenum
