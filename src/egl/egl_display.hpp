#pragma once

// EGL-backed DisplayConnection.
// Internal implementation - not part of public API.

#include "pane/display.hpp"
#include <memory>

namespace pane {

class EglDisplayConnection : public DisplayConnection {
public:
    /**
     * Open and initialize `nativeDisplay`.
     * Returns nullptr if eglGetDisplay or eglInitialize fails.
     */
    static std::shared_ptr<EglDisplayConnection> Open(EGLNativeDisplayType nativeDisplay);

    // eglTerminate is never called: other EGL users in the process may share
    // the display, and it lives until process exit.
    ~EglDisplayConnection() override = default;

    bool chooseConfig(const EGLint* attribs, EGLConfig* configs,
                      EGLint maxConfigs, EGLint* numConfigs) override;
    EGLSurface createPbufferSurface(EGLConfig config, const EGLint* attribs) override;
    bool destroySurface(EGLSurface surface) override;
    bool bindTexImage(EGLSurface surface) override;
    bool releaseTexImage(EGLSurface surface) override;
    EGLint lastError() const override;

    EGLDisplay native() const { return display_; }
    EGLint majorVersion() const { return major_; }
    EGLint minorVersion() const { return minor_; }

private:
    EglDisplayConnection(EGLDisplay display, EGLint major, EGLint minor)
        : display_(display), major_(major), minor_(minor) {}

    EGLDisplay display_ = EGL_NO_DISPLAY;
    EGLint major_ = 0;
    EGLint minor_ = 0;
};

} // namespace pane
