#pragma once

#include "pane/types.hpp"
#include <memory>

namespace pane {

/**
 * GraphicsApi - the texture entry points of the GL context that surfaces
 * are bound into.
 *
 * Enum arguments are raw GL values (GL_TEXTURE_2D, GL_TEXTURE_MIN_FILTER...).
 * Every call acts on the context current on the calling thread, so an
 * instance must only be used from that thread.
 *
 * The GL implementation is created with GraphicsApis::MakeGL()
 * (include <pane/gl/gl_api.hpp>).
 */
class GraphicsApi {
public:
    virtual ~GraphicsApi() = default;

    /// Generate one texture name. Returns 0 on failure.
    virtual u32 genTexture() = 0;

    virtual void bindTexture(u32 target, u32 texture) = 0;

    virtual void texParameteri(u32 target, u32 pname, i32 param) = 0;

    virtual void deleteTexture(u32 texture) = 0;

    /// glGetError(); only used to check postconditions.
    virtual u32 getError() = 0;
};

} // namespace pane
