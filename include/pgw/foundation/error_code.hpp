#pragma once

/// @file error_code.hpp
/// @brief Categorized error codes for the provider gateway.

#include <cstdint>
#include <string_view>

namespace pgw::foundation {

/// Error codes categorized by subsystem using hex ranges.
///
/// Each subsystem occupies a 256-value range (0x100), so the source of an
/// error can be read off the code value alone.
enum class ErrorCode : uint32_t {
    // General (0x0000 - 0x00FF)
    Success = 0x0000,
    Unknown = 0x0001,
    InvalidArgument = 0x0002,
    NotFound = 0x0003,

    // Circuit breaker (0x0100 - 0x01FF)
    BreakerOpen = 0x0100,
    OperationFailed = 0x0101,

    // Quota (0x0200 - 0x02FF)
    QuotaExceeded = 0x0200,

    // Routing (0x0300 - 0x03FF)
    NoCandidates = 0x0300,
    UnknownModel = 0x0301,
    UnknownExecutionMode = 0x0302,
    NoAvailableProvider = 0x0303,
    InvalidPreset = 0x0304,

    // Health (0x0400 - 0x04FF)
    ProbeFailed = 0x0400,
    ProbeTimeout = 0x0401,
    UnknownProvider = 0x0402,

    // Shared store (0x0500 - 0x05FF)
    StoreError = 0x0500,
    StoreValueMalformed = 0x0501,

    // Config (0x0600 - 0x06FF)
    ConfigLoadFailed = 0x0600,
    ConfigKeyNotFound = 0x0601,
    ConfigTypeMismatch = 0x0602,
    CatalogInvalid = 0x0603,

    // Thread (0x0700 - 0x07FF)
    ThreadError = 0x0700,
    JobScheduleFailed = 0x0701,
    JobNotFound = 0x0702,

    // Logger (0x0800 - 0x08FF)
    LoggerError = 0x0800,
    LoggerFlushFailed = 0x0801,

    // Network (0x0900 - 0x09FF)
    NetworkError = 0x0900,
    ListenFailed = 0x0901,
};

/// Return the subsystem name for a given error code.
constexpr std::string_view errorSubsystem(ErrorCode code) {
    auto value = static_cast<uint32_t>(code);
    auto category = value & 0xFF00;
    switch (category) {
        case 0x0000: return "General";
        case 0x0100: return "Breaker";
        case 0x0200: return "Quota";
        case 0x0300: return "Routing";
        case 0x0400: return "Health";
        case 0x0500: return "Store";
        case 0x0600: return "Config";
        case 0x0700: return "Thread";
        case 0x0800: return "Logger";
        case 0x0900: return "Network";
        default: return "Unknown";
    }
}

} // namespace pgw::foundation
