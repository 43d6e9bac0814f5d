#pragma once

/// @file service_runner.hpp
/// @brief Shared utilities for the bridge entry point.
///
/// Provides signal handling, configuration file resolution and loading,
/// CLI argument parsing, and translation of YAML settings into the
/// bridge, backend and logging configuration structs.

#include <atomic>
#include <filesystem>
#include <map>
#include <string>

#include "rsb/foundation/config_manager.hpp"
#include "rsb/foundation/service_result.hpp"
#include "rsb/service/resilient_bridge.hpp"
#include "rsb/service/staged_backend.hpp"

namespace rsb::service {

/// Config file used when neither --config nor RSB_CONFIG_PATH is given.
inline constexpr const char* kDefaultConfigPath = "/etc/rsb/bridge.yaml";

/// Installs SIGINT and SIGTERM handlers and exposes a shutdown flag.
///
/// Only one SignalHandler instance should exist per process. The handler
/// performs a relaxed store on a lock-free atomic, which is
/// async-signal-safe. Default handlers are restored on destruction.
class SignalHandler {
public:
    SignalHandler();
    ~SignalHandler();

    SignalHandler(const SignalHandler&) = delete;
    SignalHandler& operator=(const SignalHandler&) = delete;

    /// Returns true after SIGINT or SIGTERM is received.
    [[nodiscard]] bool shutdownRequested() const noexcept;

private:
    static std::atomic<bool> shutdownFlag_;
    static void handler(int signal);
};

/// Parsed command-line options of rsb_bridge.
struct CliOptions {
    std::filesystem::path configPath;  ///< Empty if --config was not given.
    bool demo = false;                 ///< Run the built-in demo script.
    bool help = false;
};

/// Parse `--config <path>`, `--demo` and `--help`.
[[nodiscard]] CliOptions parseArgs(int argc, char* argv[]);

/// Resolve the config file path.
///
/// Order: @p cliPath if non-empty, then the RSB_CONFIG_PATH environment
/// variable, then kDefaultConfigPath.
[[nodiscard]] std::filesystem::path resolveConfigPath(const std::filesystem::path& cliPath);

/// Load the YAML file selected by resolveConfigPath() into @p config.
///
/// @return Success or ConfigLoadFailed.
[[nodiscard]] foundation::ServiceResult<void>
loadConfig(foundation::ConfigManager& config, const std::filesystem::path& cliPath);

/// Build a BridgeConfig from `bridge.*` keys. Missing keys keep defaults.
///
/// @return InvalidArgument for an unknown cache scope, or any error
///         reported by BridgeConfig::validate().
[[nodiscard]] foundation::ServiceResult<BridgeConfig>
buildBridgeConfig(const foundation::ConfigManager& config);

/// Build a StagedBackendConfig from `backend.*` keys.
[[nodiscard]] StagedBackendConfig buildBackendConfig(const foundation::ConfigManager& config);

/// Number of scheduler workers from `backend.workers` (default 2).
[[nodiscard]] std::size_t backendWorkers(const foundation::ConfigManager& config);

/// Read the keyword routing table under `backend.routes`.
///
/// Each child key is a lowercase keyword and its value the reply template.
[[nodiscard]] std::map<std::string, std::string>
buildRoutes(const foundation::ConfigManager& config);

/// Apply `logging.level` and `logging.format` to ServiceLogger::instance().
///
/// @return InvalidArgument for an unknown level or format name.
[[nodiscard]] foundation::ServiceResult<void>
applyLoggingConfig(const foundation::ConfigManager& config);

} // namespace rsb::service
