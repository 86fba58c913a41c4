#pragma once

/**
 * @file Log.h
 * @brief Library logger for Perspec
 *
 * All library diagnostics go through a single spdlog logger named
 * "perspec". It writes to stderr at level Warn unless the environment
 * variable PERSPEC_LOG_LEVEL (trace, debug, info, warn, error, off)
 * says otherwise. Applications may replace the logger or change its level
 * at any time; logging never influences computed results.
 */

#include <Perspec/Core/Export.h>

#include <spdlog/logger.h>

#include <memory>
#include <string>

namespace Perspec::Log {

/// Name of the library logger
constexpr const char* LOGGER_NAME = "perspec";

/// Environment variable consulted on first use
constexpr const char* LEVEL_ENV_VAR = "PERSPEC_LOG_LEVEL";

enum class Level {
    Trace,
    Debug,
    Info,
    Warn,
    Error,
    Off
};

/// Current library logger (created on first call)
PERSPEC_API std::shared_ptr<spdlog::logger> Get();

/**
 * @brief Replace the library logger
 *
 * Passing nullptr restores the default stderr logger.
 */
PERSPEC_API void SetLogger(std::shared_ptr<spdlog::logger> logger);

PERSPEC_API void SetLevel(Level level);
PERSPEC_API Level GetLevel();

/// True if messages at this level would currently be emitted
PERSPEC_API bool IsEnabled(Level level);

/**
 * @brief Parse a level name (case-insensitive)
 * @return false if name is not a known level; level is left untouched
 */
PERSPEC_API bool ParseLevel(const std::string& name, Level& level);

PERSPEC_API const char* LevelName(Level level);

} // namespace Perspec::Log
