// EglDisplayConnection - thin forwarding layer over libEGL.

#include "egl_display.hpp"
#include <cstdio>

namespace pane {

std::shared_ptr<EglDisplayConnection> EglDisplayConnection::Open(EGLNativeDisplayType nativeDisplay) {
    EGLDisplay display = eglGetDisplay(nativeDisplay);
    if (display == EGL_NO_DISPLAY) {
        std::fprintf(stderr, "pane Display: no EGL display found\n");
        return nullptr;
    }

    EGLint major = 0, minor = 0;
    if (eglInitialize(display, &major, &minor) != EGL_TRUE) {
        std::fprintf(stderr, "pane Display: eglInitialize failed (0x%04x)\n",
                     static_cast<unsigned>(eglGetError()));
        return nullptr;
    }

    return std::shared_ptr<EglDisplayConnection>(new EglDisplayConnection(display, major, minor));
}

bool EglDisplayConnection::chooseConfig(const EGLint* attribs, EGLConfig* configs,
                                        EGLint maxConfigs, EGLint* numConfigs) {
    return eglChooseConfig(display_, attribs, configs, maxConfigs, numConfigs) == EGL_TRUE;
}

EGLSurface EglDisplayConnection::createPbufferSurface(EGLConfig config, const EGLint* attribs) {
    return eglCreatePbufferSurface(display_, config, attribs);
}

bool EglDisplayConnection::destroySurface(EGLSurface surface) {
    return eglDestroySurface(display_, surface) == EGL_TRUE;
}

bool EglDisplayConnection::bindTexImage(EGLSurface surface) {
    return eglBindTexImage(display_, surface, EGL_BACK_BUFFER) == EGL_TRUE;
}

bool EglDisplayConnection::releaseTexImage(EGLSurface surface) {
    return eglReleaseTexImage(display_, surface, EGL_BACK_BUFFER) == EGL_TRUE;
}

EGLint EglDisplayConnection::lastError() const {
    return eglGetError();
}

} // namespace pane
