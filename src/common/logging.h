#pragma once

/// @file logging.h
/// @brief Diagnostic and audit logging on top of spdlog
///
/// Diagnostics go to stderr so that stdout stays reserved for verdicts
/// printed by the command-line tool. The audit log is a separate, optional
/// rotating file holding one JSON record per verdict.

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>

#include <absl/status/status.h>
#include <absl/status/statusor.h>
#include <spdlog/spdlog.h>

namespace promptguard {

/// @brief Log levels matching spdlog levels
enum class LogLevel {
    kTrace = spdlog::level::trace,
    kDebug = spdlog::level::debug,
    kInfo = spdlog::level::info,
    kWarn = spdlog::level::warn,
    kError = spdlog::level::err,
    kCritical = spdlog::level::critical,
    kOff = spdlog::level::off
};

/// @brief Diagnostic logger configuration
struct LogConfig {
    std::string name = "promptguard";
    LogLevel level = LogLevel::kInfo;
    std::string pattern = "[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v";
};

/// @brief Audit log configuration
struct AuditLogConfig {
    std::string path = "promptguard-audit.log";
    size_t max_file_size = 10 * 1024 * 1024;  // 10 MB
    size_t max_files = 5;
};

/// @brief Initialize the diagnostic logger
///
/// Only the first call takes effect. GetLogger() calls it with defaults.
void InitLogging(const LogConfig& config = {});

std::shared_ptr<spdlog::logger> GetLogger();

/// @brief Set the diagnostic log level on the logger and all its sinks
void SetLogLevel(LogLevel level);

/// @brief Parse a level name ("trace", "debug", "info", "warn", "error",
///        "critical", "off"), case-insensitive
absl::StatusOr<LogLevel> ParseLogLevel(std::string_view name);

/// @brief Open the rotating audit file and start writing records to it
/// @return InvalidArgument if the file cannot be opened
absl::Status EnableAuditLog(const AuditLogConfig& config);

/// @brief Stop writing audit records; the file is flushed and closed
void DisableAuditLog();

bool AuditLogEnabled();

/// @brief Append one record (a single line) to the audit log, if enabled
void WriteAuditRecord(std::string_view record);

/// @brief Flush diagnostic and audit logs
void FlushLogs();

/// @brief Flush everything and release spdlog's registry
void ShutdownLogging();

#define PROMPTGUARD_LOG_TRACE(...) SPDLOG_LOGGER_TRACE(::promptguard::GetLogger(), __VA_ARGS__)
#define PROMPTGUARD_LOG_DEBUG(...) SPDLOG_LOGGER_DEBUG(::promptguard::GetLogger(), __VA_ARGS__)
#define PROMPTGUARD_LOG_INFO(...) SPDLOG_LOGGER_INFO(::promptguard::GetLogger(), __VA_ARGS__)
#define PROMPTGUARD_LOG_WARN(...) SPDLOG_LOGGER_WARN(::promptguard::GetLogger(), __VA_ARGS__)
#define PROMPTGUARD_LOG_ERROR(...) SPDLOG_LOGGER_ERROR(::promptguard::GetLogger(), __VA_ARGS__)
#define PROMPTGUARD_LOG_CRITICAL(...) SPDLOG_LOGGER_CRITICAL(::promptguard::GetLogger(), __VA_ARGS__)

}  // namespace promptguard
