#include "logging.h"

#include <vector>

#include <absl/strings/ascii.h>
#include <absl/strings/str_cat.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace runlens {

namespace {

constexpr char kLoggerName[] = "runlens";
constexpr char kPattern[] = "%Y-%m-%dT%H:%M:%S.%e %^%-5l%$ [%t] %v";

spdlog::level::level_enum ToSpdlog(LogLevel level) {
    return static_cast<spdlog::level::level_enum>(level);
}

}  // namespace

absl::StatusOr<LogLevel> ParseLogLevel(std::string_view name) {
    const std::string lower = absl::AsciiStrToLower(name);
    if (lower == "trace") return LogLevel::kTrace;
    if (lower == "debug") return LogLevel::kDebug;
    if (lower == "info") return LogLevel::kInfo;
    if (lower == "warn" || lower == "warning") return LogLevel::kWarn;
    if (lower == "error") return LogLevel::kError;
    if (lower == "off") return LogLevel::kOff;
    return absl::InvalidArgumentError(absl::StrCat("Unknown log level '", name, "'"));
}

absl::Status InitLogging(const LogConfig& config) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());

    if (!config.file_path.empty()) {
        try {
            sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                config.file_path, config.max_file_bytes, config.max_files));
        } catch (const spdlog::spdlog_ex& e) {
            return absl::UnavailableError(
                absl::StrCat("Cannot open log file ", config.file_path, ": ", e.what()));
        }
    }

    auto logger = std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());
    logger->set_pattern(kPattern);
    logger->set_level(ToSpdlog(config.level));
    logger->flush_on(spdlog::level::warn);

    // Replaces any logger registered under the same name
    spdlog::set_default_logger(std::move(logger));
    return absl::OkStatus();
}

std::shared_ptr<spdlog::logger> GetLogger() {
    auto logger = spdlog::get(kLoggerName);
    if (logger) {
        return logger;
    }
    // Console-only logger, which cannot fail to open
    InitLogging(LogConfig{}).IgnoreError();
    return spdlog::get(kLoggerName);
}

void SetLogLevel(LogLevel level) {
    GetLogger()->set_level(ToSpdlog(level));
}

void ShutdownLogging() {
    if (auto logger = spdlog::get(kLoggerName)) {
        logger->flush();
    }
    spdlog::shutdown();
}

}  // namespace runlens
