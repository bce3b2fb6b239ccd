#include "pane/config_selector.hpp"
#include "pane/display.hpp"
#include <cstdio>

namespace pane {

EGLint renderableType(ApiType type, ApiVersion version) {
    switch (type) {
        case ApiType::GL:
            return EGL_OPENGL_BIT;
        case ApiType::GLES:
            if (version.major < 2) return EGL_OPENGL_ES_BIT;
            if (version.major == 2) return EGL_OPENGL_ES2_BIT;
            return EGL_OPENGL_ES3_BIT;
    }
    return 0;
}

std::vector<EGLint> configAttributes(ApiType type, ApiVersion version, PixelFormat fmt) {
    const EGLint renderable = renderableType(type, version);
    if (renderable == 0) return {};

    // EGL_TEXTURE_TARGET is a surface attribute, not a config attribute;
    // Surface::Make requests the 2D target on the pbuffer itself.
    return {
        EGL_SURFACE_TYPE, EGL_PBUFFER_BIT,
        EGL_RENDERABLE_TYPE, renderable,
        hasAlpha(fmt) ? EGL_BIND_TO_TEXTURE_RGBA : EGL_BIND_TO_TEXTURE_RGB, EGL_TRUE,
        EGL_RED_SIZE, colorBits(fmt),
        EGL_GREEN_SIZE, colorBits(fmt),
        EGL_BLUE_SIZE, colorBits(fmt),
        EGL_ALPHA_SIZE, alphaBits(fmt),
        EGL_NONE,
    };
}

EGLConfig chooseConfig(DisplayConnection& display, ApiType type, ApiVersion version,
                       PixelFormat fmt, Error* error) {
    const std::vector<EGLint> attribs = configAttributes(type, version, fmt);
    if (attribs.empty()) {
        std::fprintf(stderr, "pane ConfigSelector: no renderable type for api %d version %d.%d\n",
                     static_cast<int>(type), version.major, version.minor);
        setError(error, Error::NoCompatibleConfiguration);
        return nullptr;
    }

    EGLConfig config = nullptr;
    EGLint found = 0;
    if (!display.chooseConfig(attribs.data(), &config, 1, &found)) {
        std::fprintf(stderr, "pane ConfigSelector: eglChooseConfig failed (0x%04x)\n",
                     static_cast<unsigned>(display.lastError()));
        setError(error, Error::NoCompatibleConfiguration);
        return nullptr;
    }
    if (found == 0) {
        std::fprintf(stderr, "pane ConfigSelector: no EGL config for %s\n", formatName(fmt));
        setError(error, Error::NoCompatibleConfiguration);
        return nullptr;
    }

    setError(error, Error::None);
    return config;
}

EGLConfig chooseConfig(DisplayConnection& display, ApiType type, ApiVersion version,
                       Error* error) {
    return chooseConfig(display, type, version, PixelFormat::RGB888, error);
}

} // namespace pane
