// Display - process-wide registry of the default EGL display.

#include "pane/display.hpp"
#include "egl/egl_display.hpp"
#include <cstdio>
#include <cstdlib>

namespace pane {

namespace {

// Opened on first use. C++11 guarantees the initializer runs exactly once even
// when several threads race to the first call. Intentionally leaked so that
// surfaces released during static destruction still find their display.
const std::shared_ptr<EglDisplayConnection>& registryDisplay() {
    static const auto* instance = [] {
        auto display = EglDisplayConnection::Open(EGL_DEFAULT_DISPLAY);
        if (!display) {
            std::fprintf(stderr, "pane Display: cannot open the default EGL display, aborting\n");
            std::abort();
        }
        return new std::shared_ptr<EglDisplayConnection>(std::move(display));
    }();
    return *instance;
}

} // namespace

std::shared_ptr<DisplayConnection> Display::Get() {
    return registryDisplay();
}

i32 Display::majorVersion() { return registryDisplay()->majorVersion(); }
i32 Display::minorVersion() { return registryDisplay()->minorVersion(); }
EGLDisplay Display::native() { return registryDisplay()->native(); }

} // namespace pane
