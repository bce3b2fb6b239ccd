#pragma once

/**
 * @file surface_texture.hpp
 * @brief A Surface bound to a GL texture object.
 */

#include "pane/error.hpp"
#include "pane/surface.hpp"
#include "pane/types.hpp"
#include <memory>

namespace pane {

class GraphicsApi;

/// @brief Binds a Surface's color buffer to a GL_TEXTURE_2D texture.
///
/// Lifecycle: Make() creates and binds the texture, release() unbinds it and
/// hands the Surface back. An instance is single-use; bind the returned
/// Surface again to get a new texture.
///
/// @note GL binding state belongs to the current context. All calls on an
///       instance must happen on the thread where that context is current.
///       Neither destroy() nor release() may be skipped: the destructor has
///       no context to issue GL calls with and only reports the leak.
class SurfaceTexture {
public:
    /// @brief Create a texture and bind `surface` to it.
    ///
    /// The texture gets nearest filtering and edge clamping, and
    /// GL_TEXTURE_2D is left unbound afterwards.
    ///
    /// @param gl Texture API of the current context.
    /// @param surface Surface to bind. Consumed; on failure it is dropped.
    /// @param error Optional; receives the failure reason or Error::None.
    /// @return The binding, or nullptr on failure (no texture is leaked).
    static std::unique_ptr<SurfaceTexture> Make(GraphicsApi& gl,
                                                Surface surface,
                                                Error* error = nullptr);

    ~SurfaceTexture();

    SurfaceTexture(const SurfaceTexture&) = delete;
    SurfaceTexture& operator=(const SurfaceTexture&) = delete;

    /// @brief Release the image binding and delete the texture.
    ///
    /// Calling it twice is a programmer error; the second call is
    /// reported and does nothing.
    void destroy(GraphicsApi& gl);

    /// @brief destroy() and give the Surface back to the caller.
    Surface release(GraphicsApi& gl);

    /// @brief The bound surface. Only meaningful while bound().
    const Surface& surface() const { return surface_; }

    /// @brief GL texture name, 0 once destroyed.
    u32 texture() const { return texture_; }

    /// @brief Always GL_TEXTURE_2D.
    u32 textureTarget() const;

    bool bound() const { return texture_ != 0; }

private:
    SurfaceTexture(Surface surface, u32 texture);

    Surface surface_;
    u32 texture_ = 0;
};

} // namespace pane
