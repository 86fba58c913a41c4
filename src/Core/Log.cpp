#include <Perspec/Core/Log.h>

#include <spdlog/sinks/stdout_color_sinks.h>

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <memory>

namespace Perspec::Log {

namespace {

spdlog::level::level_enum ToSpdlog(Level level) {
    switch (level) {
        case Level::Trace: return spdlog::level::trace;
        case Level::Debug: return spdlog::level::debug;
        case Level::Info:  return spdlog::level::info;
        case Level::Warn:  return spdlog::level::warn;
        case Level::Error: return spdlog::level::err;
        case Level::Off:   return spdlog::level::off;
    }
    return spdlog::level::warn;
}

Level FromSpdlog(spdlog::level::level_enum level) {
    switch (level) {
        case spdlog::level::trace:    return Level::Trace;
        case spdlog::level::debug:    return Level::Debug;
        case spdlog::level::info:     return Level::Info;
        case spdlog::level::warn:     return Level::Warn;
        case spdlog::level::err:      return Level::Error;
        case spdlog::level::critical: return Level::Error;
        default:                      return Level::Off;
    }
}

Level InitialLevel() {
    Level level = Level::Warn;
    const char* env = std::getenv(LEVEL_ENV_VAR);
    if (env && !ParseLevel(env, level)) {
        std::fprintf(stderr, "perspec: ignoring unknown %s value '%s'\n", LEVEL_ENV_VAR, env);
        level = Level::Warn;
    }
    return level;
}

std::shared_ptr<spdlog::logger> CreateDefaultLogger() {
    auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>(LOGGER_NAME, std::move(sink));
    logger->set_pattern("[%H:%M:%S.%e] [%n] [%l] %v");
    logger->set_level(ToSpdlog(InitialLevel()));
    return logger;
}

// Initialized once; later replaced only through atomic stores
std::shared_ptr<spdlog::logger>& LoggerSlot() {
    static std::shared_ptr<spdlog::logger> logger = CreateDefaultLogger();
    return logger;
}

} // anonymous namespace

std::shared_ptr<spdlog::logger> Get() {
    return std::atomic_load(&LoggerSlot());
}

void SetLogger(std::shared_ptr<spdlog::logger> logger) {
    if (!logger) {
        logger = CreateDefaultLogger();
    }
    std::atomic_store(&LoggerSlot(), std::move(logger));
}

void SetLevel(Level level) {
    Get()->set_level(ToSpdlog(level));
}

Level GetLevel() {
    return FromSpdlog(Get()->level());
}

bool IsEnabled(Level level) {
    return level != Level::Off && Get()->should_log(ToSpdlog(level));
}

bool ParseLevel(const std::string& name, Level& level) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return std::tolower(c); });

    if (lower == "trace") {
        level = Level::Trace;
    } else if (lower == "debug") {
        level = Level::Debug;
    } else if (lower == "info") {
        level = Level::Info;
    } else if (lower == "warn" || lower == "warning") {
        level = Level::Warn;
    } else if (lower == "error") {
        level = Level::Error;
    } else if (lower == "off" || lower == "none") {
        level = Level::Off;
    } else {
        return false;
    }
    return true;
}

const char* LevelName(Level level) {
    switch (level) {
        case Level::Trace: return "trace";
        case Level::Debug: return "debug";
        case Level::Info:  return "info";
        case Level::Warn:  return "warn";
        case Level::Error: return "error";
        case Level::Off:   return "off";
    }
    return "unknown";
}

} // namespace Perspec::Log
