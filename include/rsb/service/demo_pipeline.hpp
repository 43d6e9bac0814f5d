#pragma once

/// @file demo_pipeline.hpp
/// @brief Keyword-routing stages used by the rsb_bridge demo backend.

#include "rsb/foundation/service_result.hpp"
#include "rsb/service/staged_backend.hpp"

#include <map>
#include <string>
#include <string_view>

namespace rsb::service {

/// Reply used when no routing keyword matches.
inline constexpr std::string_view kFallbackReply =
    "Thanks for your message. Could you tell me a little more?";

/// Trim, collapse whitespace and lowercase. Fails on blank input.
[[nodiscard]] foundation::ServiceResult<std::string> normalizeText(std::string_view input);

/// Return the reply of the first keyword (in map order) contained in
/// @p input, or kFallbackReply.
[[nodiscard]] std::string routeText(std::string_view input,
                                    const std::map<std::string, std::string>& routes);

/// Install the "parser", "router" and "generator" stages on @p backend.
void installDemoStages(StagedBackend& backend, std::map<std::string, std::string> routes);

}  // namespace rsb::service
