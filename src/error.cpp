#include "pane/error.hpp"

namespace pane {

const char* errorString(Error error) {
    switch (error) {
        case Error::None: return "None";
        case Error::InvalidSize: return "InvalidSize";
        case Error::InvalidSurface: return "InvalidSurface";
        case Error::NoCompatibleConfiguration: return "NoCompatibleConfiguration";
        case Error::SurfaceAllocationFailed: return "SurfaceAllocationFailed";
        case Error::TextureAllocationFailed: return "TextureAllocationFailed";
        case Error::ImageBindFailed: return "ImageBindFailed";
    }
    return "Unknown";
}

} // namespace pane
