#pragma once

/**
 * @file surface.hpp
 * @brief Reference-counted offscreen EGL pbuffer.
 */

#include "pane/api_version.hpp"
#include "pane/error.hpp"
#include "pane/pixel_format.hpp"
#include "pane/types.hpp"
#include <EGL/egl.h>
#include <memory>

namespace pane {

class DisplayConnection;

/// @brief An offscreen pixel buffer allocated on a display.
///
/// Surface is a cheap value type: copies share one native pbuffer, which is
/// released through the display exactly once, when the last copy goes away.
/// Size and format never change after creation.
///
/// Surfaces may be copied, moved and dropped on any thread.
class Surface {
public:
    /// @brief Allocate a pbuffer with an already chosen config.
    /// @param display Display the config belongs to. Kept alive by the surface.
    /// @param config Config returned by chooseConfig().
    /// @param type API the surface will be rendered with.
    /// @param version Negotiated API version.
    /// @param size Width and height, both must be > 0.
    /// @param fmt Pixel format; selects the texture format of the pbuffer.
    /// @param error Optional; receives the failure reason or Error::None.
    /// @return The new surface, or an invalid one on failure.
    static Surface Make(std::shared_ptr<DisplayConnection> display,
                        EGLConfig config,
                        ApiType type,
                        ApiVersion version,
                        Size size,
                        PixelFormat fmt,
                        Error* error = nullptr);

    /// @brief Choose a config for `fmt` and allocate a pbuffer with it.
    static Surface Make(std::shared_ptr<DisplayConnection> display,
                        ApiType type,
                        ApiVersion version,
                        Size size,
                        PixelFormat fmt,
                        Error* error = nullptr);

    /// @brief An invalid surface.
    Surface() = default;

    Size size() const { return size_; }
    i32 width() const { return size_.width; }
    i32 height() const { return size_.height; }
    PixelFormat format() const { return format_; }
    ApiType apiType() const { return apiType_; }
    ApiVersion apiVersion() const { return apiVersion_; }
    EGLConfig config() const { return config_; }

    /// @brief The native pbuffer handle, or EGL_NO_SURFACE if invalid.
    EGLSurface nativeSurface() const;

    /// @brief Display the pbuffer was allocated on, or nullptr if invalid.
    DisplayConnection* display() const;

    /// @brief Numeric id derived from the native handle.
    ///
    /// Stable for the lifetime of the pbuffer and useful for logging.
    /// Not guaranteed unique across displays.
    u32 id() const;

    /// @brief Number of Surface values sharing the native pbuffer.
    long useCount() const { return native_.use_count(); }

    bool valid() const { return native_ != nullptr; }
    explicit operator bool() const { return valid(); }

    /// @brief True if both values refer to the same native pbuffer.
    bool operator==(const Surface& o) const { return native_ == o.native_; }
    bool operator!=(const Surface& o) const { return native_ != o.native_; }

private:
    class Native;

    std::shared_ptr<Native> native_;
    EGLConfig config_ = nullptr;
    ApiType apiType_ = ApiType::GL;
    ApiVersion apiVersion_;
    Size size_;
    PixelFormat format_ = PixelFormat::RGBA8888;
};

} // namespace pane
