#pragma once

/// @file logging.h
/// @brief Process-wide spdlog logger for the RunLens daemon and its engines
///
/// One logger named "runlens" is registered with spdlog. It always writes to
/// the console and, when LogConfig::file_path is set, also to a rotating file.
/// Code that logs before InitLogging() gets a console logger at info level.

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>

#include <absl/status/status.h>
#include <absl/status/statusor.h>
#include <spdlog/spdlog.h>

namespace runlens {

enum class LogLevel {
    kTrace = spdlog::level::trace,
    kDebug = spdlog::level::debug,
    kInfo = spdlog::level::info,
    kWarn = spdlog::level::warn,
    kError = spdlog::level::err,
    kOff = spdlog::level::off
};

/// @brief Sinks and verbosity of the daemon logger
struct LogConfig {
    LogLevel level = LogLevel::kInfo;

    /// Rotating log file; empty keeps logging on the console only
    std::string file_path;
    size_t max_file_bytes = 16 * 1024 * 1024;
    size_t max_files = 3;
};

/// @brief Parse a level name as written in the YAML config or on the CLI
///
/// Accepts trace, debug, info, warn (or warning), error and off in any case.
/// @return InvalidArgument for anything else
absl::StatusOr<LogLevel> ParseLogLevel(std::string_view name);

/// @brief (Re)build the "runlens" logger from @p config
/// @return Unavailable when the log file cannot be opened
absl::Status InitLogging(const LogConfig& config);

std::shared_ptr<spdlog::logger> GetLogger();

void SetLogLevel(LogLevel level);

/// @brief Flush pending messages and drop every spdlog logger
void ShutdownLogging();

#define RUNLENS_LOG_TRACE(...) SPDLOG_LOGGER_TRACE(::runlens::GetLogger(), __VA_ARGS__)
#define RUNLENS_LOG_DEBUG(...) SPDLOG_LOGGER_DEBUG(::runlens::GetLogger(), __VA_ARGS__)
#define RUNLENS_LOG_INFO(...) SPDLOG_LOGGER_INFO(::runlens::GetLogger(), __VA_ARGS__)
#define RUNLENS_LOG_WARN(...) SPDLOG_LOGGER_WARN(::runlens::GetLogger(), __VA_ARGS__)
#define RUNLENS_LOG_ERROR(...) SPDLOG_LOGGER_ERROR(::runlens::GetLogger(), __VA_ARGS__)

}  // namespace runlens
