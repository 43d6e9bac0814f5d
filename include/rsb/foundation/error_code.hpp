#pragma once

/// @file error_code.hpp
/// @brief Categorized error codes for the resilient service bridge.

#include <cstdint>
#include <string_view>

namespace rsb::foundation {

/// Error codes categorized by subsystem using hex ranges.
///
/// Each subsystem occupies a 256-value range (0x100), making it possible
/// to determine the error source from the code value alone.
enum class ErrorCode : uint32_t {
    // General (0x0000 - 0x00FF)
    Success = 0x0000,
    Unknown = 0x0001,
    InvalidArgument = 0x0002,
    NotFound = 0x0003,
    AlreadyExists = 0x0004,
    NotImplemented = 0x0005,

    // Admission (0x0100 - 0x01FF)
    AdmissionRejected = 0x0100,

    // Breaker (0x0200 - 0x02FF)
    BreakerOpen = 0x0200,

    // Backend (0x0300 - 0x03FF)
    BackendFailure = 0x0300,
    BackendTimeout = 0x0301,
    BackendCancelled = 0x0302,
    StageFailed = 0x0303,

    // Cache (0x0400 - 0x04FF)
    FingerprintFailed = 0x0400,

    // Config (0x0600 - 0x06FF)
    ConfigLoadFailed = 0x0600,
    ConfigKeyNotFound = 0x0601,
    ConfigTypeMismatch = 0x0602,

    // Thread (0x0700 - 0x07FF)
    ThreadError = 0x0700,
    JobScheduleFailed = 0x0701,
    JobNotFound = 0x0702,
    JobCancelled = 0x0703,

    // Logger (0x0800 - 0x08FF)
    LoggerError = 0x0800,
    LoggerFlushFailed = 0x0801,
};

/// Return the subsystem name for a given error code.
constexpr std::string_view errorSubsystem(ErrorCode code) {
    auto value = static_cast<uint32_t>(code);
    auto category = value & 0xFF00;
    switch (category) {
        case 0x0000: return "General";
        case 0x0100: return "Admission";
        case 0x0200: return "Breaker";
        case 0x0300: return "Backend";
        case 0x0400: return "Cache";
        case 0x0600: return "Config";
        case 0x0700: return "Thread";
        case 0x0800: return "Logger";
        default: return "Unknown";
    }
}

/// Short stable identifier for an error code, suitable for replies and labels.
constexpr std::string_view errorCodeName(ErrorCode code) {
    switch (code) {
        case ErrorCode::Success:           return "success";
        case ErrorCode::Unknown:           return "unknown";
        case ErrorCode::InvalidArgument:   return "invalid_argument";
        case ErrorCode::NotFound:          return "not_found";
        case ErrorCode::AlreadyExists:     return "already_exists";
        case ErrorCode::NotImplemented:    return "not_implemented";
        case ErrorCode::AdmissionRejected: return "admission_rejected";
        case ErrorCode::BreakerOpen:       return "breaker_open";
        case ErrorCode::BackendFailure:    return "backend_failure";
        case ErrorCode::BackendTimeout:    return "backend_timeout";
        case ErrorCode::BackendCancelled:  return "backend_cancelled";
        case ErrorCode::StageFailed:       return "stage_failed";
        case ErrorCode::FingerprintFailed: return "fingerprint_failed";
        case ErrorCode::ConfigLoadFailed:  return "config_load_failed";
        case ErrorCode::ConfigKeyNotFound: return "config_key_not_found";
        case ErrorCode::ConfigTypeMismatch: return "config_type_mismatch";
        case ErrorCode::ThreadError:       return "thread_error";
        case ErrorCode::JobScheduleFailed: return "job_schedule_failed";
        case ErrorCode::JobNotFound:       return "job_not_found";
        case ErrorCode::JobCancelled:      return "job_cancelled";
        case ErrorCode::LoggerError:       return "logger_error";
        case ErrorCode::LoggerFlushFailed: return "logger_flush_failed";
    }
    return "unknown";
}

} // namespace rsb::foundation
