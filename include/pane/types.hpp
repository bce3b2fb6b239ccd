#pragma once

#include <cstdint>

/**
 * @file types.hpp
 * @brief Core type aliases and basic geometric types for the pane library.
 */

namespace pane {

using i32 = int32_t;   ///< Signed 32-bit integer.
using u32 = uint32_t;  ///< Unsigned 32-bit integer.
using u64 = uint64_t;  ///< Unsigned 64-bit integer.
using u8 = uint8_t;    ///< Unsigned 8-bit integer.

/// @brief Width and height of a surface in pixels.
struct Size {
    i32 width = 0;   ///< Width in pixels.
    i32 height = 0;  ///< Height in pixels.

    /// @brief True if both dimensions are strictly positive.
    bool valid() const { return width > 0 && height > 0; }

    bool operator==(const Size& o) const { return width == o.width && height == o.height; }
    bool operator!=(const Size& o) const { return !(*this == o); }
};

}
