#pragma once

/// @file monitoring_adapter.hpp
/// @brief Aggregate header for the ServiceMetrics counters, gauges,
///        histograms and text export.

#include "rsb/foundation/service_metrics.hpp"
