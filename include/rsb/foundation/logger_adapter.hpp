#pragma once

/// @file logger_adapter.hpp
/// @brief Aggregate header for kcenon-backed structured logging with
///        category filtering and JSON output.

#include "rsb/foundation/json_log_formatter.hpp"
#include "rsb/foundation/service_logger.hpp"
