/// @file service_runner.cpp
/// @brief Implementation of the bridge entry-point utilities.

#include "rsb/service/service_runner.hpp"

#include "rsb/foundation/service_logger.hpp"

#include <csignal>
#include <cstdlib>
#include <string_view>

namespace rsb::service {

using namespace rsb::foundation;

// -- SignalHandler -----------------------------------------------------------

std::atomic<bool> SignalHandler::shutdownFlag_{false};

void SignalHandler::handler(int /*signal*/) {
    shutdownFlag_.store(true, std::memory_order_relaxed);
}

SignalHandler::SignalHandler() {
    shutdownFlag_.store(false, std::memory_order_relaxed);
    std::signal(SIGINT, &SignalHandler::handler);
    std::signal(SIGTERM, &SignalHandler::handler);
}

SignalHandler::~SignalHandler() {
#if defined(__GNUC__) || defined(__clang__)
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wold-style-cast"
#endif
    std::signal(SIGINT, SIG_DFL);
    std::signal(SIGTERM, SIG_DFL);
#if defined(__GNUC__) || defined(__clang__)
#pragma GCC diagnostic pop
#endif
}

bool SignalHandler::shutdownRequested() const noexcept {
    return shutdownFlag_.load(std::memory_order_relaxed);
}

// -- CLI ---------------------------------------------------------------------

CliOptions parseArgs(int argc, char* argv[]) {
    CliOptions options;
    for (int i = 1; i < argc; ++i) {
        std::string_view arg(argv[i]);  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        if (arg == "--config" && i + 1 < argc) {
            options.configPath = argv[++i];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        } else if (arg == "--demo") {
            options.demo = true;
        } else if (arg == "--help" || arg == "-h") {
            options.help = true;
        }
    }
    return options;
}

// -- Config loading ----------------------------------------------------------

std::filesystem::path resolveConfigPath(const std::filesystem::path& cliPath) {
    if (!cliPath.empty()) {
        return cliPath;
    }
    const char* envPath = std::getenv("RSB_CONFIG_PATH");
    if (envPath != nullptr && *envPath != '\0') {
        return envPath;
    }
    return kDefaultConfigPath;
}

ServiceResult<void> loadConfig(ConfigManager& config, const std::filesystem::path& cliPath) {
    auto path = resolveConfigPath(cliPath);
    auto result = config.load(path);
    if (result.hasValue()) {
        RSB_LOG_INFO(LogCategory::Config, "loaded configuration from " + path.string());
    }
    return result;
}

// -- Config translation ------------------------------------------------------

ServiceResult<BridgeConfig> buildBridgeConfig(const ConfigManager& config) {
    BridgeConfig cfg;

    auto capacity = config.get<double>("bridge.admission.capacity");
    if (capacity) {
        cfg.admission.capacity = capacity.value();
    }

    auto refillRate = config.get<double>("bridge.admission.refill_rate");
    if (refillRate) {
        cfg.admission.refillRate = refillRate.value();
    }

    auto threshold = config.get<unsigned int>("bridge.breaker.failure_threshold");
    if (threshold) {
        cfg.breaker.failureThreshold = threshold.value();
    }

    auto recovery = config.get<long long>("bridge.breaker.recovery_timeout_ms");
    if (recovery) {
        cfg.breaker.recoveryTimeout = std::chrono::milliseconds(recovery.value());
    }

    auto breakerName = config.get<std::string>("bridge.breaker.name");
    if (breakerName) {
        cfg.breaker.name = std::move(breakerName).value();
    }

    auto cacheEnabled = config.get<bool>("bridge.cache.enabled");
    if (cacheEnabled) {
        cfg.cache.enabled = cacheEnabled.value();
    }

    auto ttl = config.get<long long>("bridge.cache.ttl_ms");
    if (ttl) {
        cfg.cache.ttl = std::chrono::milliseconds(ttl.value());
    }

    auto maxEntries = config.get<unsigned int>("bridge.cache.max_entries");
    if (maxEntries) {
        cfg.cache.maxEntries = static_cast<std::size_t>(maxEntries.value());
    }

    auto scope = config.get<std::string>("bridge.cache.scope");
    if (scope) {
        if (scope.value() == toString(CacheScope::Global)) {
            cfg.cache.scope = CacheScope::Global;
        } else if (scope.value() == toString(CacheScope::PerRequester)) {
            cfg.cache.scope = CacheScope::PerRequester;
        } else {
            return ServiceResult<BridgeConfig>::err(ServiceError(
                ErrorCode::InvalidArgument, "unknown cache scope: " + scope.value()));
        }
    }

    auto flushThreshold = config.get<unsigned int>("bridge.telemetry.flush_threshold");
    if (flushThreshold) {
        cfg.telemetry.flushThreshold = static_cast<std::size_t>(flushThreshold.value());
    }

    auto prefix = config.get<std::string>("bridge.telemetry.metric_prefix");
    if (prefix) {
        cfg.telemetry.metricPrefix = std::move(prefix).value();
    }

    auto backendTimeout = config.get<long long>("bridge.backend_timeout_ms");
    if (backendTimeout) {
        cfg.backendTimeout = std::chrono::milliseconds(backendTimeout.value());
    }

    if (auto valid = cfg.validate(); valid.hasError()) {
        return ServiceResult<BridgeConfig>::err(valid.error());
    }
    return ServiceResult<BridgeConfig>::ok(std::move(cfg));
}

StagedBackendConfig buildBackendConfig(const ConfigManager& config) {
    StagedBackendConfig cfg;

    auto name = config.get<std::string>("backend.name");
    if (name) {
        cfg.name = std::move(name).value();
    }

    auto confidence = config.get<double>("backend.confidence");
    if (confidence) {
        cfg.confidence = confidence.value();
    }

    auto delay = config.get<long long>("backend.stage_delay_ms");
    if (delay && delay.value() > 0) {
        cfg.stageDelay = std::chrono::milliseconds(delay.value());
    }

    return cfg;
}

std::size_t backendWorkers(const ConfigManager& config) {
    auto workers = config.get<unsigned int>("backend.workers");
    if (workers && workers.value() > 0) {
        return workers.value();
    }
    return 2;
}

std::map<std::string, std::string> buildRoutes(const ConfigManager& config) {
    std::map<std::string, std::string> routes;
    for (const auto& keyword : config.childKeys("backend.routes")) {
        auto reply = config.get<std::string>("backend.routes." + keyword);
        if (reply) {
            routes.emplace(keyword, std::move(reply).value());
        }
    }
    return routes;
}

ServiceResult<void> applyLoggingConfig(const ConfigManager& config) {
    auto& logger = ServiceLogger::instance();

    auto level = config.get<std::string>("logging.level");
    if (level) {
        auto parsed = parseLogLevel(level.value());
        if (!parsed) {
            return ServiceResult<void>::err(ServiceError(
                ErrorCode::InvalidArgument, "unknown log level: " + level.value()));
        }
        logger.setAllLevels(*parsed);
    }

    auto format = config.get<std::string>("logging.format");
    if (format) {
        if (format.value() == "json") {
            logger.setFormat(LogFormat::Json);
        } else if (format.value() == "text") {
            logger.setFormat(LogFormat::Text);
        } else {
            return ServiceResult<void>::err(ServiceError(
                ErrorCode::InvalidArgument, "unknown log format: " + format.value()));
        }
    }

    return ServiceResult<void>::ok();
}

} // namespace rsb::service
