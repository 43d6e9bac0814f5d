/// @file demo_pipeline.cpp
/// @brief Demo keyword-routing stages.

#include "rsb/service/demo_pipeline.hpp"

#include <cctype>
#include <memory>
#include <utility>

namespace rsb::service {

using namespace rsb::foundation;

ServiceResult<std::string> normalizeText(std::string_view input) {
    std::string out;
    out.reserve(input.size());
    bool pendingSpace = false;
    for (char c : input) {
        auto uc = static_cast<unsigned char>(c);
        if (std::isspace(uc)) {
            pendingSpace = !out.empty();
            continue;
        }
        if (pendingSpace) {
            out += ' ';
            pendingSpace = false;
        }
        out += static_cast<char>(std::tolower(uc));
    }
    if (out.empty()) {
        return ServiceResult<std::string>::err(
            ServiceError(ErrorCode::StageFailed, "empty message"));
    }
    return ServiceResult<std::string>::ok(std::move(out));
}

std::string routeText(std::string_view input, const std::map<std::string, std::string>& routes) {
    for (const auto& [keyword, reply] : routes) {
        if (!keyword.empty() && input.find(keyword) != std::string_view::npos) {
            return reply;
        }
    }
    return std::string(kFallbackReply);
}

void installDemoStages(StagedBackend& backend, std::map<std::string, std::string> routes) {
    auto table = std::make_shared<const std::map<std::string, std::string>>(std::move(routes));

    backend.addStage("parser", [](std::string_view in) { return normalizeText(in); });

    backend.addStage("router", [table](std::string_view in) {
        return ServiceResult<std::string>::ok(routeText(in, *table));
    });

    backend.addStage("generator", [](std::string_view in) {
        std::string out(in);
        if (!out.empty()) {
            out[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(out[0])));
            auto last = out.back();
            if (last != '.' && last != '!' && last != '?') {
                out += '.';
            }
        }
        return ServiceResult<std::string>::ok(std::move(out));
    });
}

}  // namespace rsb::service
