#pragma once

/**
 * @file config_selector.hpp
 * @brief Derives EGL config attributes for a pbuffer and picks one config.
 */

#include "pane/api_version.hpp"
#include "pane/error.hpp"
#include "pane/pixel_format.hpp"
#include <EGL/egl.h>
#include <vector>

namespace pane {

class DisplayConnection;

/**
 * Renderable-type bit for an API type and version:
 *
 *   GL   any  -> EGL_OPENGL_BIT
 *   GLES <2   -> EGL_OPENGL_ES_BIT
 *   GLES 2    -> EGL_OPENGL_ES2_BIT
 *   GLES >=3  -> EGL_OPENGL_ES3_BIT
 *
 * Returns 0 for an ApiType outside the enum.
 */
EGLint renderableType(ApiType type, ApiVersion version);

/**
 * EGL_NONE-terminated attribute list requesting a pbuffer-capable,
 * texture-bindable config with 8-bit RGB and the format's alpha depth.
 * Empty if the renderable type is unmapped.
 */
std::vector<EGLint> configAttributes(ApiType type, ApiVersion version, PixelFormat fmt);

/**
 * Choose exactly one config for `fmt`. Returns nullptr and sets
 * Error::NoCompatibleConfiguration if the display has none.
 */
EGLConfig chooseConfig(DisplayConnection& display, ApiType type, ApiVersion version,
                       PixelFormat fmt, Error* error = nullptr);

/// Same as above with an opaque (0-bit alpha) RGB request.
EGLConfig chooseConfig(DisplayConnection& display, ApiType type, ApiVersion version,
                       Error* error = nullptr);

} // namespace pane
