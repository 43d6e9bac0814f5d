#pragma once

/// @file rsb.hpp
/// @brief Umbrella header: version information and the core Result type.

#include "rsb/core/result.hpp"
#include "rsb/version.hpp"
