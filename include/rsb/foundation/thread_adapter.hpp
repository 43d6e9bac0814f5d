#pragma once

/// @file thread_adapter.hpp
/// @brief Aggregate header for the kcenon thread_system job scheduler.

#include "rsb/foundation/job_scheduler.hpp"
