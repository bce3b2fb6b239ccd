#pragma once

#include "pane/graphics_api.hpp"

// This header is only usable when PANE_HAS_GL is defined.
// Including it without GL support will cause a compile error.

#if !PANE_HAS_GL
#error "GL backend not available. Build with -DPANE_ENABLE_GL=ON"
#endif

namespace pane {

/**
 * GL-specific GraphicsApi factory functions.
 *
 * Usage:
 *   #include <pane/gl/gl_api.hpp>
 *   auto gl = GraphicsApis::MakeGL();
 */
namespace GraphicsApis {

/**
 * Create a GraphicsApi bound to the currently active GL context.
 * Host must have created and made current a GL context before calling.
 * Returns nullptr if no GL context is current or GLEW init fails.
 */
std::shared_ptr<GraphicsApi> MakeGL();

} // namespace GraphicsApis

} // namespace pane
