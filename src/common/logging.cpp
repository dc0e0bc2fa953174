#include "common/logging.h"

#include <atomic>
#include <mutex>

#include <absl/strings/ascii.h>
#include <absl/strings/str_cat.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace promptguard {

namespace {

std::shared_ptr<spdlog::logger> g_logger;
std::once_flag g_init_flag;

// Swapped at runtime while validations read it; always accessed atomically
std::shared_ptr<spdlog::logger> g_audit_logger;

spdlog::level::level_enum ToSpdlog(LogLevel level) {
    return static_cast<spdlog::level::level_enum>(level);
}

}  // namespace

void InitLogging(const LogConfig& config) {
    std::call_once(g_init_flag, [&config]() {
        auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        console_sink->set_level(ToSpdlog(config.level));

        g_logger = std::make_shared<spdlog::logger>(config.name, console_sink);
        g_logger->set_level(ToSpdlog(config.level));
        g_logger->set_pattern(config.pattern);
        g_logger->flush_on(spdlog::level::warn);

        spdlog::set_default_logger(g_logger);
    });
}

std::shared_ptr<spdlog::logger> GetLogger() {
    InitLogging();
    return g_logger;
}

void SetLogLevel(LogLevel level) {
    auto logger = GetLogger();
    logger->set_level(ToSpdlog(level));
    for (auto& sink : logger->sinks()) {
        sink->set_level(ToSpdlog(level));
    }
}

absl::StatusOr<LogLevel> ParseLogLevel(std::string_view name) {
    std::string lowered(name);
    absl::AsciiStrToLower(&lowered);
    if (lowered == "trace") return LogLevel::kTrace;
    if (lowered == "debug") return LogLevel::kDebug;
    if (lowered == "info") return LogLevel::kInfo;
    if (lowered == "warn" || lowered == "warning") return LogLevel::kWarn;
    if (lowered == "error") return LogLevel::kError;
    if (lowered == "critical") return LogLevel::kCritical;
    if (lowered == "off") return LogLevel::kOff;
    return absl::InvalidArgumentError(absl::StrCat("Unknown log level: ", std::string(name)));
}

absl::Status EnableAuditLog(const AuditLogConfig& config) {
    std::shared_ptr<spdlog::logger> audit;
    try {
        auto sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            config.path, config.max_file_size, config.max_files);
        audit = std::make_shared<spdlog::logger>("promptguard-audit", sink);
    } catch (const spdlog::spdlog_ex& e) {
        return absl::InvalidArgumentError(
            absl::StrCat("Cannot open audit log ", config.path, ": ", e.what()));
    }

    // Records are self-describing JSON lines
    audit->set_pattern("%v");
    audit->set_level(spdlog::level::info);
    audit->flush_on(spdlog::level::info);

    std::atomic_store(&g_audit_logger, std::move(audit));
    return absl::OkStatus();
}

void DisableAuditLog() {
    auto previous = std::atomic_exchange(&g_audit_logger, std::shared_ptr<spdlog::logger>());
    if (previous) {
        previous->flush();
    }
}

bool AuditLogEnabled() {
    return std::atomic_load(&g_audit_logger) != nullptr;
}

void WriteAuditRecord(std::string_view record) {
    if (auto audit = std::atomic_load(&g_audit_logger)) {
        audit->info(record);
    }
}

void FlushLogs() {
    if (g_logger) {
        g_logger->flush();
    }
    if (auto audit = std::atomic_load(&g_audit_logger)) {
        audit->flush();
    }
}

void ShutdownLogging() {
    FlushLogs();
    DisableAuditLog();
    spdlog::shutdown();
}

}  // namespace promptguard
