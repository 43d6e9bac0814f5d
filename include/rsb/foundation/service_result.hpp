#pragma once

/// @file service_result.hpp
/// @brief ServiceResult<T> type alias for bridge error handling.

#include "rsb/core/result.hpp"
#include "rsb/foundation/service_error.hpp"

namespace rsb::foundation {

/// Result type specialized with ServiceError for bridge operations.
///
/// Example:
/// @code
///   ServiceResult<double> parseRate(double raw) {
///       if (raw < 0.0) {
///           return ServiceResult<double>::err(
///               ServiceError(ErrorCode::InvalidArgument, "negative refill rate"));
///       }
///       return ServiceResult<double>::ok(raw);
///   }
/// @endcode
template <typename T>
using ServiceResult = rsb::Result<T, ServiceError>;

}  // namespace rsb::foundation
