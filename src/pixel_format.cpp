#include "pane/pixel_format.hpp"

namespace pane {

const char* formatName(PixelFormat fmt) {
    switch (fmt) {
        case PixelFormat::RGBA8888: return "RGBA8888";
        case PixelFormat::BGRA8888: return "BGRA8888";
        case PixelFormat::RGB888: return "RGB888";
    }
    return "Unknown";
}

} // namespace pane
