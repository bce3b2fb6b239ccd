#include "pane/surface.hpp"
#include "pane/config_selector.hpp"
#include "pane/display.hpp"
#include <cstdint>
#include <cstdio>

namespace pane {

// Owns one native pbuffer. Shared by every Surface copy; the destructor runs
// once, when the last copy is dropped.
class Surface::Native {
public:
    Native(std::shared_ptr<DisplayConnection> display, EGLSurface surface)
        : display_(std::move(display)), surface_(surface) {}

    ~Native() {
        if (!display_->destroySurface(surface_)) {
            std::fprintf(stderr, "pane Surface: eglDestroySurface failed (0x%04x)\n",
                         static_cast<unsigned>(display_->lastError()));
        }
    }

    Native(const Native&) = delete;
    Native& operator=(const Native&) = delete;

    DisplayConnection* display() const { return display_.get(); }
    EGLSurface surface() const { return surface_; }

private:
    std::shared_ptr<DisplayConnection> display_;
    EGLSurface surface_;
};

Surface Surface::Make(std::shared_ptr<DisplayConnection> display,
                      EGLConfig config,
                      ApiType type,
                      ApiVersion version,
                      Size size,
                      PixelFormat fmt,
                      Error* error) {
    if (!size.valid()) {
        std::fprintf(stderr, "pane Surface: invalid size %dx%d\n", size.width, size.height);
        setError(error, Error::InvalidSize);
        return Surface();
    }

    const EGLint attribs[] = {
        EGL_WIDTH, size.width,
        EGL_HEIGHT, size.height,
        EGL_TEXTURE_FORMAT, hasAlpha(fmt) ? EGL_TEXTURE_RGBA : EGL_TEXTURE_RGB,
        EGL_TEXTURE_TARGET, EGL_TEXTURE_2D,
        EGL_NONE,
    };

    EGLSurface native = display->createPbufferSurface(config, attribs);
    if (native == EGL_NO_SURFACE) {
        std::fprintf(stderr, "pane Surface: eglCreatePbufferSurface %dx%d %s failed (0x%04x)\n",
                     size.width, size.height, formatName(fmt),
                     static_cast<unsigned>(display->lastError()));
        setError(error, Error::SurfaceAllocationFailed);
        return Surface();
    }

    Surface surface;
    surface.native_ = std::make_shared<Native>(std::move(display), native);
    surface.config_ = config;
    surface.apiType_ = type;
    surface.apiVersion_ = version;
    surface.size_ = size;
    surface.format_ = fmt;
    setError(error, Error::None);
    return surface;
}

Surface Surface::Make(std::shared_ptr<DisplayConnection> display,
                      ApiType type,
                      ApiVersion version,
                      Size size,
                      PixelFormat fmt,
                      Error* error) {
    if (!size.valid()) {
        std::fprintf(stderr, "pane Surface: invalid size %dx%d\n", size.width, size.height);
        setError(error, Error::InvalidSize);
        return Surface();
    }

    EGLConfig config = chooseConfig(*display, type, version, fmt, error);
    if (!config) return Surface();
    return Make(std::move(display), config, type, version, size, fmt, error);
}

EGLSurface Surface::nativeSurface() const {
    return native_ ? native_->surface() : EGL_NO_SURFACE;
}

DisplayConnection* Surface::display() const {
    return native_ ? native_->display() : nullptr;
}

u32 Surface::id() const {
    return static_cast<u32>(reinterpret_cast<uintptr_t>(nativeSurface()));
}

} // namespace pane
