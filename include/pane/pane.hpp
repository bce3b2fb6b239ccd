#pragma once

/**
 * Pane - offscreen EGL surfaces bindable as GL textures
 *
 * Usage:
 *
 *   #include <pane/pane.hpp>
 *   auto display = pane::Display::Get();
 *   auto surface = pane::Surface::Make(display, pane::ApiType::GLES, {3, 0},
 *                                      {256, 256}, pane::PixelFormat::RGBA8888);
 *
 *   auto gl = pane::GraphicsApis::MakeGL();   // needs a current context
 *   auto texture = pane::SurfaceTexture::Make(*gl, surface);
 *   // ... sample texture->texture() ...
 *   surface = texture->release(*gl);
 */

// Version
#include "pane/version.hpp"

// Core types
#include "pane/types.hpp"
#include "pane/pixel_format.hpp"
#include "pane/api_version.hpp"
#include "pane/error.hpp"

// Display connection and config selection
#include "pane/display.hpp"
#include "pane/config_selector.hpp"

// Surfaces and texture binding
#include "pane/surface.hpp"
#include "pane/graphics_api.hpp"
#include "pane/surface_texture.hpp"

// GL texture API (conditional - include <pane/gl/gl_api.hpp> explicitly)
#if PANE_HAS_GL
#include "pane/gl/gl_api.hpp"
#endif
