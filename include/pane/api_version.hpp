#pragma once

#include "pane/types.hpp"

namespace pane {

/// Which flavour of GL a surface will be rendered with.
enum class ApiType {
    GL,    ///< Desktop OpenGL.
    GLES,  ///< OpenGL ES.
};

/// Negotiated API version, e.g. {3, 0} for GLES 3.0.
struct ApiVersion {
    i32 major = 0;
    i32 minor = 0;

    bool operator==(const ApiVersion& o) const { return major == o.major && minor == o.minor; }
    bool operator!=(const ApiVersion& o) const { return !(*this == o); }
};

} // namespace pane
