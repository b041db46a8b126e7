/**
 * AE Render - Version Management
 *
 * Single source of truth for the library, CLI and C API version.
 *
 * Version Format: MAJOR.MINOR.PATCH[-PRERELEASE]
 * - MAJOR: Breaking API changes
 * - MINOR: New features, backward compatible
 * - PATCH: Bug fixes, backward compatible
 */

#ifndef AE_RENDER_VERSION_H
#define AE_RENDER_VERSION_H

// =============================================================================
// VERSION NUMBERS - Update these for releases
// =============================================================================

#define AE_RENDER_VERSION_MAJOR 1
#define AE_RENDER_VERSION_MINOR 2
#define AE_RENDER_VERSION_PATCH 0

// Set to 1 to enable prerelease, 0 for stable release
#define AE_RENDER_HAS_PRERELEASE 0
#define AE_RENDER_VERSION_PRERELEASE ""

// =============================================================================
// DERIVED VERSION STRINGS - Do not edit manually
// =============================================================================

#define AE_RENDER_STRINGIFY_(x) #x
#define AE_RENDER_STRINGIFY(x) AE_RENDER_STRINGIFY_(x)

// Core version string: "1.2.0"
#define AE_RENDER_VERSION_CORE \
    AE_RENDER_STRINGIFY(AE_RENDER_VERSION_MAJOR) "." \
    AE_RENDER_STRINGIFY(AE_RENDER_VERSION_MINOR) "." \
    AE_RENDER_STRINGIFY(AE_RENDER_VERSION_PATCH)

#if AE_RENDER_HAS_PRERELEASE
    #define AE_RENDER_VERSION_STRING AE_RENDER_VERSION_CORE "-" AE_RENDER_VERSION_PRERELEASE
#else
    #define AE_RENDER_VERSION_STRING AE_RENDER_VERSION_CORE
#endif

#define AE_RENDER_VERSION AE_RENDER_VERSION_STRING

// =============================================================================
// BUILD INFORMATION
// =============================================================================

#ifdef NDEBUG
    #define AE_RENDER_BUILD_TYPE "Release"
#else
    #define AE_RENDER_BUILD_TYPE "Debug"
#endif

#define AE_RENDER_NAME "AE Render"
#define AE_RENDER_DESCRIPTION "Keyframed raster layer compositor with coverage mask output"

// =============================================================================
// C++ INTERFACE (when included from C++)
// =============================================================================

#ifdef __cplusplus
#include <string>
#include <sstream>

namespace AERenderVersion {

// Short version line (for --version output)
inline std::string getVersionBanner() {
    std::ostringstream oss;
    oss << AE_RENDER_NAME << " v" << AE_RENDER_VERSION << " (" << AE_RENDER_BUILD_TYPE << ")\n"
        << AE_RENDER_DESCRIPTION;
    return oss.str();
}

} // namespace AERenderVersion
#endif // __cplusplus

#endif // AE_RENDER_VERSION_H
