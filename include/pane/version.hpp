#pragma once

/// @file version.hpp
/// @brief Library version information.

#define PANE_VERSION_MAJOR 0
#define PANE_VERSION_MINOR 1
#define PANE_VERSION_PATCH 0

namespace pane {

/// @brief Return the library version string (e.g. "0.1.0").
/// @return Null-terminated version string in "major.minor.patch" format.
inline const char* version() {
    return "0.1.0";
}

/// @brief Return the major version number.
inline int versionMajor() { return PANE_VERSION_MAJOR; }
/// @brief Return the minor version number.
inline int versionMinor() { return PANE_VERSION_MINOR; }
/// @brief Return the patch version number.
inline int versionPatch() { return PANE_VERSION_PATCH; }

} // namespace pane
