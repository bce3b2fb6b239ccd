#pragma once

/**
 * @file error.hpp
 * @brief Failure kinds reported by surface and texture factories.
 *
 * Factories return an invalid Surface or nullptr on failure. Callers that
 * need the reason pass an Error* which is filled in on every call
 * (Error::None on success).
 */

namespace pane {

enum class Error {
    None,
    InvalidSize,                ///< width or height was not positive
    InvalidSurface,             ///< an invalid (empty) Surface was passed in
    NoCompatibleConfiguration,  ///< the display offered no matching EGLConfig
    SurfaceAllocationFailed,    ///< eglCreatePbufferSurface returned EGL_NO_SURFACE
    TextureAllocationFailed,    ///< the GL returned texture name 0
    ImageBindFailed,            ///< eglBindTexImage failed
};

/// @brief Name of an error value, e.g. "ImageBindFailed".
const char* errorString(Error error);

/// Store `value` in `out` when the caller asked for it.
inline void setError(Error* out, Error value) {
    if (out) *out = value;
}

} // namespace pane
