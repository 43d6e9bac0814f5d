#pragma once

/// @file common_adapter.hpp
/// @brief Aggregate header for error types, Result aliases, IDs, time
///        sources and configuration management.

#include "rsb/foundation/config_manager.hpp"
#include "rsb/foundation/error_code.hpp"
#include "rsb/foundation/service_error.hpp"
#include "rsb/foundation/service_result.hpp"
#include "rsb/foundation/types.hpp"
