#include "pane/surface_texture.hpp"
#include "pane/display.hpp"
#include "pane/graphics_api.hpp"

#include <GL/gl.h>
#include <cassert>
#include <cstdio>

namespace pane {

SurfaceTexture::SurfaceTexture(Surface surface, u32 texture)
    : surface_(std::move(surface)), texture_(texture) {
}

SurfaceTexture::~SurfaceTexture() {
    if (texture_ != 0) {
        std::fprintf(stderr, "pane SurfaceTexture: texture %u of surface %u leaked, "
                     "call release() before dropping it\n", texture_, surface_.id());
    }
}

std::unique_ptr<SurfaceTexture> SurfaceTexture::Make(GraphicsApi& gl, Surface surface, Error* error) {
    if (!surface.valid()) {
        std::fprintf(stderr, "pane SurfaceTexture: cannot bind an invalid surface\n");
        setError(error, Error::InvalidSurface);
        return nullptr;
    }

    u32 texture = gl.genTexture();
    if (texture == 0) {
        std::fprintf(stderr, "pane SurfaceTexture: glGenTextures returned 0\n");
        setError(error, Error::TextureAllocationFailed);
        return nullptr;
    }

    gl.bindTexture(GL_TEXTURE_2D, texture);

    DisplayConnection* display = surface.display();
    if (!display->bindTexImage(surface.nativeSurface())) {
        std::fprintf(stderr, "pane SurfaceTexture: eglBindTexImage on surface %u failed (0x%04x)\n",
                     surface.id(), static_cast<unsigned>(display->lastError()));
        gl.bindTexture(GL_TEXTURE_2D, 0);
        gl.deleteTexture(texture);
        setError(error, Error::ImageBindFailed);
        return nullptr;
    }

    // The pbuffer has no mipmap chain and must not be sampled past its edges.
    gl.texParameteri(GL_TEXTURE_2D, GL_TEXTURE_MAG_FILTER, GL_NEAREST);
    gl.texParameteri(GL_TEXTURE_2D, GL_TEXTURE_MIN_FILTER, GL_NEAREST);
    gl.texParameteri(GL_TEXTURE_2D, GL_TEXTURE_WRAP_S, GL_CLAMP_TO_EDGE);
    gl.texParameteri(GL_TEXTURE_2D, GL_TEXTURE_WRAP_T, GL_CLAMP_TO_EDGE);

    gl.bindTexture(GL_TEXTURE_2D, 0);

    assert(gl.getError() == GL_NO_ERROR);

    setError(error, Error::None);
    return std::unique_ptr<SurfaceTexture>(new SurfaceTexture(std::move(surface), texture));
}

void SurfaceTexture::destroy(GraphicsApi& gl) {
    if (texture_ == 0) {
        std::fprintf(stderr, "pane SurfaceTexture: destroy() called on a released texture\n");
        return;
    }

    DisplayConnection* display = surface_.display();
    if (!display->releaseTexImage(surface_.nativeSurface())) {
        std::fprintf(stderr, "pane SurfaceTexture: eglReleaseTexImage on surface %u failed (0x%04x)\n",
                     surface_.id(), static_cast<unsigned>(display->lastError()));
    }

    gl.deleteTexture(texture_);
    texture_ = 0;
}

Surface SurfaceTexture::release(GraphicsApi& gl) {
    destroy(gl);
    return std::move(surface_);
}

u32 SurfaceTexture::textureTarget() const {
    return GL_TEXTURE_2D;
}

} // namespace pane
