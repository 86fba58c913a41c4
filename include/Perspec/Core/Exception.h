#pragma once

#include <Perspec/Core/Export.h>

/**
 * @file Exception.h
 * @brief Exception classes for Perspec
 *
 * The homography computation itself never throws; these are raised by
 * core type construction and element access only.
 */

#include <stdexcept>
#include <string>

namespace Perspec {

/**
 * @brief Base exception class for Perspec
 */
class PERSPEC_API Exception : public std::runtime_error {
public:
    explicit Exception(const std::string& message)
        : std::runtime_error(message) {}

    explicit Exception(const char* message)
        : std::runtime_error(message) {}
};

/**
 * @brief Invalid argument exception
 */
class PERSPEC_API InvalidArgumentException : public Exception {
public:
    explicit InvalidArgumentException(const std::string& message)
        : Exception("Invalid argument: " + message) {}
};

/**
 * @brief Out of range exception
 */
class PERSPEC_API OutOfRangeException : public Exception {
public:
    explicit OutOfRangeException(const std::string& message)
        : Exception("Out of range: " + message) {}
};

} // namespace Perspec
