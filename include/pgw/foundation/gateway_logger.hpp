#pragma once

/// @file gateway_logger.hpp
/// @brief GatewayLogger wrapping kcenon common_system logging with
///        per-category levels and structured context.

#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

#include "pgw/foundation/gateway_result.hpp"

namespace pgw::foundation {

/// Log severity levels.
///
/// Maps to kcenon::common::interfaces::log_level internally.
enum class LogLevel : uint8_t {
    Trace    = 0,
    Debug    = 1,
    Info     = 2,
    Warning  = 3,
    Error    = 4,
    Critical = 5,
    Off      = 6
};

/// Subsystem categories, each with its own minimum level.
enum class LogCategory : uint8_t {
    Core    = 0, ///< Startup, shutdown, wiring
    Breaker = 1, ///< Circuit breaker transitions
    Quota   = 2, ///< Rate limiting decisions
    Routing = 3, ///< Model selection and fallback
    Health  = 4, ///< Provider probes and health cache
    Store   = 5, ///< Shared counting/caching store
    Config  = 6, ///< Configuration and catalog loading
    Network = 7  ///< Status server and probe transport
};

inline constexpr std::size_t kLogCategoryCount = 8;

constexpr std::string_view logCategoryName(LogCategory cat) {
    constexpr std::array<std::string_view, kLogCategoryCount> names = {
        "Core", "Breaker", "Quota", "Routing", "Health", "Store", "Config", "Network"
    };
    auto idx = static_cast<std::size_t>(cat);
    return idx < kLogCategoryCount ? names[idx] : "Unknown";
}

constexpr std::string_view logLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::Trace:    return "TRACE";
        case LogLevel::Debug:    return "DEBUG";
        case LogLevel::Info:     return "INFO";
        case LogLevel::Warning:  return "WARNING";
        case LogLevel::Error:    return "ERROR";
        case LogLevel::Critical: return "CRITICAL";
        case LogLevel::Off:      return "OFF";
    }
    return "UNKNOWN";
}

/// Structured fields appended to a log line.
///
/// Example:
/// @code
///   LogContext ctx;
///   ctx.provider = "groq";
///   ctx.extra["timeout_s"] = "120";
///   logger.logWithContext(LogLevel::Warning, LogCategory::Breaker,
///                         "circuit reopened", ctx);
/// @endcode
struct LogContext {
    std::optional<std::string> provider;
    std::optional<std::string> identifier;
    std::optional<std::string> modelId;
    std::optional<std::string> traceId;
    std::unordered_map<std::string, std::string> extra;
};

/// Category-aware logger over kcenon's GlobalLoggerRegistry.
///
/// Each category resolves to a named logger "pgw.<Category>" and falls
/// back to the registry's default logger. PIMPL keeps kcenon headers out
/// of the public API.
///
/// Default levels: Routing is Debug, every other category is Info.
class GatewayLogger {
public:
    GatewayLogger();
    ~GatewayLogger();

    GatewayLogger(const GatewayLogger&) = delete;
    GatewayLogger& operator=(const GatewayLogger&) = delete;
    GatewayLogger(GatewayLogger&&) noexcept;
    GatewayLogger& operator=(GatewayLogger&&) noexcept;

    /// Log a message under the given category.
    /// No-op if the level is below the category's minimum level.
    void log(LogLevel level, LogCategory cat, std::string_view msg);

    /// Log a message with structured context appended as {key=val, ...}.
    void logWithContext(LogLevel level, LogCategory cat,
                        std::string_view msg, const LogContext& ctx);

    void setCategoryLevel(LogCategory cat, LogLevel minLevel);

    [[nodiscard]] LogLevel getCategoryLevel(LogCategory cat) const;

    [[nodiscard]] bool isEnabled(LogLevel level, LogCategory cat) const;

    /// Flush the default logger.
    GatewayResult<void> flush();

    /// Process-wide logger used by the PGW_LOG macros.
    static GatewayLogger& instance();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace pgw::foundation

// ---------------------------------------------------------------------------
// Convenience macros (global, outside the namespace)
// ---------------------------------------------------------------------------

/// PGW_MIN_LOG_LEVEL strips calls below the threshold at compile time.
/// Values: 0=Trace, 1=Debug, 2=Info, 3=Warning, 4=Error, 5=Critical, 6=Off
#ifndef PGW_MIN_LOG_LEVEL
    #define PGW_MIN_LOG_LEVEL 0
#endif

#define PGW_LOG(level, cat, msg)                                                    \
    do {                                                                            \
        _Pragma("GCC diagnostic push")                                              \
        _Pragma("GCC diagnostic ignored \"-Wtype-limits\"")                         \
        if (static_cast<int>(level) >= PGW_MIN_LOG_LEVEL &&                         \
            ::pgw::foundation::GatewayLogger::instance().isEnabled((level), (cat)))  \
        {                                                                           \
            ::pgw::foundation::GatewayLogger::instance().log((level), (cat), (msg)); \
        }                                                                           \
        _Pragma("GCC diagnostic pop")                                               \
    } while (0)

#define PGW_LOG_DEBUG(cat, msg) \
    PGW_LOG(::pgw::foundation::LogLevel::Debug, (cat), (msg))

#define PGW_LOG_INFO(cat, msg) \
    PGW_LOG(::pgw::foundation::LogLevel::Info, (cat), (msg))

#define PGW_LOG_WARN(cat, msg) \
    PGW_LOG(::pgw::foundation::LogLevel::Warning, (cat), (msg))

#define PGW_LOG_ERROR(cat, msg) \
    PGW_LOG(::pgw::foundation::LogLevel::Error, (cat), (msg))
