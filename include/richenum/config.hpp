#pragma once

#include <cstddef>
#include <cstdint>
#include <limits>


namespace richenum::config {

/*
===============================================================================
richenum compile-time configuration
===============================================================================

All tunables live here as constants.

  - No magic numbers scattered across the codebase
  - Nothing is read at runtime except the log level environment variable
===============================================================================
*/

// -----------------------------------------------------------------------------
// Auto-numbering
// -----------------------------------------------------------------------------
// Running maximum an empty registry starts from. The first auto-assigned
// value/index is AUTO_NUMBER_FLOOR + 1.
inline constexpr static std::int32_t AUTO_NUMBER_FLOOR = std::numeric_limits<std::int32_t>::min();

// -----------------------------------------------------------------------------
// Registry storage
// -----------------------------------------------------------------------------
inline constexpr static std::size_t REGISTRY_RESERVE = 32; // typical enums are small

// -----------------------------------------------------------------------------
// JSON encoding
// -----------------------------------------------------------------------------
inline constexpr static std::size_t JSON_INDENT_WIDTH = 2;

// -----------------------------------------------------------------------------
// Logging
// -----------------------------------------------------------------------------
inline constexpr static const char* LOG_LEVEL_ENV = "RICHENUM_LOG_LEVEL";
inline constexpr static const char* DEFAULT_LOG_LEVEL = "warn";

} // namespace richenum::config
