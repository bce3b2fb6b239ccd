#pragma once

/**
 * @file display.hpp
 * @brief Connection to the EGL display and the process-wide registry for it.
 */

#include "pane/types.hpp"
#include <EGL/egl.h>
#include <memory>

namespace pane {

/**
 * DisplayConnection - the subset of an initialized EGL display that the
 * surface manager needs.
 *
 * The production implementation forwards straight to libEGL on the display
 * returned by Display::Get(). Tests substitute a mock that counts calls.
 *
 * Implementations must tolerate destroySurface() being called from any
 * thread; Surface values can be dropped on a thread other than the one that
 * created them.
 */
class DisplayConnection {
public:
    virtual ~DisplayConnection() = default;

    /**
     * Select up to `maxConfigs` configs matching an EGL_NONE-terminated
     * attribute list. Returns false if the query itself failed.
     */
    virtual bool chooseConfig(const EGLint* attribs, EGLConfig* configs,
                              EGLint maxConfigs, EGLint* numConfigs) = 0;

    /// Returns EGL_NO_SURFACE on failure.
    virtual EGLSurface createPbufferSurface(EGLConfig config, const EGLint* attribs) = 0;

    virtual bool destroySurface(EGLSurface surface) = 0;

    /**
     * Bind the surface's color buffer to the texture currently bound on the
     * active GL texture unit.
     */
    virtual bool bindTexImage(EGLSurface surface) = 0;

    virtual bool releaseTexImage(EGLSurface surface) = 0;

    /// Last error code on the calling thread, for diagnostics only.
    virtual EGLint lastError() const { return EGL_SUCCESS; }
};

/**
 * Display - process-wide registry of the default EGL display.
 *
 * Usage:
 *   auto display = pane::Display::Get();
 *   auto surface = pane::Surface::Make(display, pane::ApiType::GLES, {3, 0},
 *                                      {64, 64}, pane::PixelFormat::RGBA8888);
 */
class Display {
public:
    /**
     * Return the connection to EGL_DEFAULT_DISPLAY, opening and initializing
     * it on the first call from any thread. Every call returns the same
     * instance, which is never terminated.
     *
     * Aborts the process if the display cannot be opened or initialized.
     */
    static std::shared_ptr<DisplayConnection> Get();

    /// EGL version reported by eglInitialize() for the registry display.
    static i32 majorVersion();
    static i32 minorVersion();

    /// Raw EGLDisplay behind Get(), for hosts that create their own contexts.
    static EGLDisplay native();

    Display() = delete;
};

} // namespace pane
