/**
 * example_pbuffer.cpp - bind an offscreen pbuffer as a GL texture
 *
 * Demonstrates:
 *   - Sharing the process-wide display via Display::Get()
 *   - Creating a Surface with Surface::Make(display, type, version, size, fmt)
 *   - Binding it with SurfaceTexture::Make() and releasing it again
 *
 * Build:
 *   cmake -B build -DPANE_BUILD_EXAMPLES=ON -DPANE_ENABLE_GL=ON && cmake --build build
 *   ./build/example_pbuffer
 */

#include <pane/pane.hpp>
#include <pane/gl/gl_api.hpp>
#include <cstdio>

int main() {
    auto display = pane::Display::Get();
    EGLDisplay eglDisplay = pane::Display::native();
    std::printf("EGL %d.%d\n", pane::Display::majorVersion(), pane::Display::minorVersion());

    // ---- Host-side context: a 1x1 pbuffer made current with desktop GL ----
    const pane::ApiType apiType = pane::ApiType::GL;
    const pane::ApiVersion apiVersion{3, 3};

    pane::Error err = pane::Error::None;
    EGLConfig config = pane::chooseConfig(*display, apiType, apiVersion,
                                          pane::PixelFormat::RGBA8888, &err);
    if (!config) {
        std::printf("No EGL config: %s\n", pane::errorString(err));
        return 1;
    }

    pane::Surface hostSurface = pane::Surface::Make(display, config, apiType, apiVersion,
                                                    {1, 1}, pane::PixelFormat::RGBA8888, &err);
    if (!hostSurface) {
        std::printf("Host surface failed: %s\n", pane::errorString(err));
        return 1;
    }

    eglBindAPI(EGL_OPENGL_API);
    EGLContext eglCtx = eglCreateContext(eglDisplay, config, EGL_NO_CONTEXT, nullptr);
    if (eglCtx == EGL_NO_CONTEXT) {
        std::printf("eglCreateContext failed\n");
        return 1;
    }
    eglMakeCurrent(eglDisplay, hostSurface.nativeSurface(), hostSurface.nativeSurface(), eglCtx);

    auto gl = pane::GraphicsApis::MakeGL();
    if (!gl) {
        std::printf("Failed to create GL texture API\n");
        eglMakeCurrent(eglDisplay, EGL_NO_SURFACE, EGL_NO_SURFACE, EGL_NO_CONTEXT);
        eglDestroyContext(eglDisplay, eglCtx);
        return 1;
    }

    // ---- The offscreen surface we actually want to sample ----
    pane::Surface surface = pane::Surface::Make(display, apiType, apiVersion,
                                                {64, 64}, pane::PixelFormat::RGBA8888, &err);
    if (!surface) {
        std::printf("Surface failed: %s\n", pane::errorString(err));
        eglMakeCurrent(eglDisplay, EGL_NO_SURFACE, EGL_NO_SURFACE, EGL_NO_CONTEXT);
        eglDestroyContext(eglDisplay, eglCtx);
        return 1;
    }
    std::printf("Surface %u: %dx%d %s\n", surface.id(), surface.width(), surface.height(),
                pane::formatName(surface.format()));

    auto texture = pane::SurfaceTexture::Make(*gl, surface, &err);
    if (!texture) {
        std::printf("Bind failed: %s\n", pane::errorString(err));
    } else {
        std::printf("Bound to texture %u (target 0x%04x)\n",
                    texture->texture(), texture->textureTarget());
        surface = texture->release(*gl);
        std::printf("Released, surface %u back with %ld owner(s)\n",
                    surface.id(), surface.useCount());
    }

    // Cleanup
    texture.reset();
    surface = pane::Surface();
    gl.reset();

    eglMakeCurrent(eglDisplay, EGL_NO_SURFACE, EGL_NO_SURFACE, EGL_NO_CONTEXT);
    eglDestroyContext(eglDisplay, eglCtx);

    return err == pane::Error::None ? 0 : 1;
}
