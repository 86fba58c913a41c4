#pragma once

/**
 * @file Perspec.h
 * @brief Main header file for Perspec
 *
 * Perspec computes the projective transform that maps one quadrilateral
 * onto another, e.g. the detected corners of a photographed page onto an
 * upright rectangle.
 */

// Configuration and export macros
#include <Perspec/PerspecConfig.h>
#include <Perspec/Core/Export.h>

// Core types and utilities
#include <Perspec/Core/Types.h>
#include <Perspec/Core/Exception.h>
#include <Perspec/Core/Matrix3x3.h>
#include <Perspec/Core/Log.h>

// Feature modules
#include <Perspec/Transform/Perspective.h>

namespace Perspec {

/**
 * @brief Get library version string
 * @return Version string in format "major.minor.patch"
 */
inline const char* GetVersion() {
    return PERSPEC_VERSION_STRING;
}

/**
 * @brief Get library version as integers
 */
inline void GetVersion(int& major, int& minor, int& patch) {
    major = PERSPEC_VERSION_MAJOR;
    minor = PERSPEC_VERSION_MINOR;
    patch = PERSPEC_VERSION_PATCH;
}

} // namespace Perspec
