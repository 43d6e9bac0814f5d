#pragma once

/// @file service_error.hpp
/// @brief Error value carried by ServiceResult: a code plus a detail message.

#include <string>
#include <string_view>
#include <utility>

#include "rsb/foundation/error_code.hpp"

namespace rsb::foundation {

/// Error reported by a bridge component.
///
/// The code drives behaviour (breaker accounting, reply error names);
/// the message is free text for logs and failed responses.
class ServiceError {
public:
    ServiceError() = default;

    explicit ServiceError(ErrorCode code) : code_(code) {}

    ServiceError(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }
    [[nodiscard]] std::string_view message() const noexcept { return message_; }

    /// Subsystem owning the code, e.g. "Backend" or "Config".
    [[nodiscard]] std::string_view subsystem() const noexcept { return errorSubsystem(code_); }

    [[nodiscard]] bool isSuccess() const noexcept { return code_ == ErrorCode::Success; }

    /// True for failures that say nothing about the request itself and may
    /// succeed if submitted again later: admission rejection, an open
    /// breaker, a backend timeout or a cancelled backend result.
    [[nodiscard]] bool isTransient() const noexcept {
        return code_ == ErrorCode::AdmissionRejected || code_ == ErrorCode::BreakerOpen ||
               code_ == ErrorCode::BackendTimeout || code_ == ErrorCode::BackendCancelled;
    }

    /// "Subsystem/code_name: message", or without ": message" when empty.
    [[nodiscard]] std::string describe() const {
        std::string out(subsystem());
        out += '/';
        out += errorCodeName(code_);
        if (!message_.empty()) {
            out += ": ";
            out += message_;
        }
        return out;
    }

private:
    ErrorCode code_ = ErrorCode::Unknown;
    std::string message_;
};

} // namespace rsb::foundation
