#pragma once

/// @file version.hpp
/// @brief Library version information.

#define SPRITEFX_VERSION_MAJOR 0
#define SPRITEFX_VERSION_MINOR 1
#define SPRITEFX_VERSION_PATCH 0

namespace spritefx {

/// @brief Return the library version string (e.g. "0.1.0").
/// @return Null-terminated version string in "major.minor.patch" format.
inline const char* version() {
    return "0.1.0";
}

/// @brief Return the major version number.
inline int versionMajor() { return SPRITEFX_VERSION_MAJOR; }
/// @brief Return the minor version number.
inline int versionMinor() { return SPRITEFX_VERSION_MINOR; }
/// @brief Return the patch version number.
inline int versionPatch() { return SPRITEFX_VERSION_PATCH; }

} // namespace spritefx
