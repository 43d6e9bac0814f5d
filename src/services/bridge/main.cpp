/// @file main.cpp
/// @brief rsb_bridge entry point.
///
/// Runs messages through a resilient bridge in front of the keyword-routing
/// demo backend. Messages come from stdin (one per line) or, with --demo,
/// from a built-in script. Each reply is printed as JSON, followed by the
/// metrics report, the health report and the metrics scrape.

#include <cstdlib>
#include <iostream>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "rsb/foundation/config_manager.hpp"
#include "rsb/foundation/job_scheduler.hpp"
#include "rsb/foundation/service_logger.hpp"
#include "rsb/foundation/service_metrics.hpp"
#include "rsb/service/demo_pipeline.hpp"
#include "rsb/service/message_service.hpp"
#include "rsb/service/resilient_bridge.hpp"
#include "rsb/service/service_runner.hpp"
#include "rsb/service/staged_backend.hpp"
#include "rsb/version.hpp"

namespace {

const std::vector<rsb::service::MessageRequest> kDemoScript = {
    {.content = "Hello, I need help with my order", .userId = "alice"},
    {.content = "Where is my refund?", .userId = "bob"},
    {.content = "Hello, I need help with my order", .userId = "carol"},
    {.content = "   ", .userId = "dave"},
    {.content = "Can you track my shipment", .userId = "alice"},
};

const std::map<std::string, std::string> kDefaultRoutes = {
    {"order", "I can help with your order. Please share the order number"},
    {"refund", "Refunds are processed within five business days"},
    {"track", "You can follow your shipment from the tracking page"},
};

void printUsage() {
    std::cout << "rsb_bridge " << rsb::Version::string << "\n"
              << "Usage: rsb_bridge [--config <path>] [--demo]\n"
              << "  --config <path>  YAML configuration file\n"
              << "  --demo           run the built-in demo script instead of stdin\n";
}

} // namespace

int main(int argc, char* argv[]) {
    using namespace rsb;

    auto options = service::parseArgs(argc, argv);
    if (options.help) {
        printUsage();
        return EXIT_SUCCESS;
    }

    service::SignalHandler signals;

    foundation::ConfigManager config;
    auto loadResult = service::loadConfig(config, options.configPath);
    if (!loadResult) {
        if (!options.configPath.empty()) {
            std::cerr << "Failed to load config: " << loadResult.error().describe() << "\n";
            return EXIT_FAILURE;
        }
        RSB_LOG_WARN(foundation::LogCategory::Config,
                     "no configuration file, using defaults: " +
                         loadResult.error().describe());
    }

    auto logResult = service::applyLoggingConfig(config);
    if (!logResult) {
        std::cerr << "Invalid logging config: " << logResult.error().describe() << "\n";
        return EXIT_FAILURE;
    }

    auto bridgeCfg = service::buildBridgeConfig(config);
    if (!bridgeCfg) {
        std::cerr << "Invalid bridge config: " << bridgeCfg.error().describe() << "\n";
        return EXIT_FAILURE;
    }

    auto scheduler = std::make_shared<foundation::JobScheduler>(service::backendWorkers(config));
    auto backend = std::make_shared<service::StagedBackend>(
        service::buildBackendConfig(config), scheduler);

    auto routes = service::buildRoutes(config);
    service::installDemoStages(*backend, routes.empty() ? kDefaultRoutes : std::move(routes));

    auto bridge = service::ResilientBridge::create(std::move(bridgeCfg).value(), backend);
    if (!bridge) {
        std::cerr << "Failed to create bridge: " << bridge.error().describe() << "\n";
        return EXIT_FAILURE;
    }

    service::MessageService messages(*bridge.value());

    if (options.demo) {
        for (const auto& request : kDemoScript) {
            if (signals.shutdownRequested()) {
                break;
            }
            std::cout << service::MessageService::toJson(messages.handleMessage(request)) << "\n";
        }
    } else {
        std::string line;
        while (!signals.shutdownRequested() && std::getline(std::cin, line)) {
            std::cout << service::MessageService::toJson(
                             messages.handleMessage({.content = line}))
                      << "\n";
        }
    }

    bridge.value()->flushTelemetry();

    std::cout << service::HealthReporter::toJson(messages.metrics()) << "\n";
    std::cout << service::MessageService::toJson(messages.health()) << "\n";
    std::cout << foundation::ServiceMetrics::instance().scrape();

    auto flushResult = foundation::ServiceLogger::instance().flush();
    if (!flushResult) {
        std::cerr << "Failed to flush logs: " << flushResult.error().describe() << "\n";
    }
    return EXIT_SUCCESS;
}
