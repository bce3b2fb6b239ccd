#pragma once

/**
 * @file pixel_format.hpp
 * @brief Pixel formats a pbuffer surface can be allocated with.
 */

#include "pane/types.hpp"

namespace pane {

/// @brief Pixel format enumeration.
enum class PixelFormat {
    RGBA8888,  ///< Red-Green-Blue-Alpha, 8 bits each.
    BGRA8888,  ///< Blue-Green-Red-Alpha, 8 bits each.
    RGB888,    ///< Red-Green-Blue, 8 bits each, no alpha channel.
};

/// @brief True if the format carries an alpha channel.
inline bool hasAlpha(PixelFormat fmt) {
    return fmt != PixelFormat::RGB888;
}

/// @brief Bits per color channel (red, green and blue are always equal).
inline i32 colorBits(PixelFormat) { return 8; }

/// @brief Bits in the alpha channel, 0 for opaque formats.
inline i32 alphaBits(PixelFormat fmt) { return hasAlpha(fmt) ? 8 : 0; }

/// @brief Bytes per pixel of the pbuffer storage.
///
/// Pbuffer storage is padded to 32 bits, so this is 4 for every format.
inline i32 bytesPerPixel(PixelFormat) { return 4; }

/// @brief Short human-readable name ("RGBA8888", ...).
const char* formatName(PixelFormat fmt);

}
