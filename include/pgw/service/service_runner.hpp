#pragma once

/// @file service_runner.hpp
/// @brief Shared utilities for the gateway entry point.
///
/// Provides signal handling, graceful shutdown coordination, configuration
/// loading and CLI argument parsing.

#include <atomic>
#include <chrono>
#include <filesystem>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

#include "pgw/foundation/config_manager.hpp"
#include "pgw/foundation/gateway_result.hpp"

namespace pgw::service {

/// Installs SIGINT and SIGTERM handlers and exposes a shutdown flag.
///
/// Only one SignalHandler instance should exist per process. The handler
/// does a relaxed store on a lock-free atomic, which is async-signal-safe.
/// The destructor restores the default handlers so that a second signal
/// terminates the process immediately.
class SignalHandler {
public:
    SignalHandler();
    ~SignalHandler();

    SignalHandler(const SignalHandler&) = delete;
    SignalHandler& operator=(const SignalHandler&) = delete;

    /// Returns true after SIGINT or SIGTERM is received.
    [[nodiscard]] bool shutdownRequested() const noexcept;

    /// Sleep up to @p timeout, waking early on a shutdown signal.
    /// @return true if shutdown was requested.
    bool waitFor(std::chrono::milliseconds timeout) const;

    /// Block the calling thread until a shutdown signal arrives.
    void waitForShutdown() const;

private:
    static std::atomic<bool> shutdownFlag_;
    static void handler(int signal);
};

using ShutdownHook = std::function<void()>;

/// Runs named shutdown hooks in registration order.
///
/// A hook that throws is logged and the remaining hooks still run. Hooks
/// that finish after the drain timeout are reported.
///
/// Usage:
/// @code
///   GracefulShutdown shutdown;
///   shutdown.addHook("ready",  [&]() { status.setReady(false); });
///   shutdown.addHook("status", [&]() { status.stop(); });
///   shutdown.addHook("logger", [&]() { (void)GatewayLogger::instance().flush(); });
///   shutdown.execute();
/// @endcode
class GracefulShutdown {
public:
    void addHook(std::string name, ShutdownHook hook);

    void execute();

    [[nodiscard]] std::size_t hookCount() const;

    void setDrainTimeout(std::chrono::seconds timeout);

private:
    struct Hook {
        std::string name;
        ShutdownHook callback;
    };
    std::vector<Hook> hooks_;
    std::chrono::seconds drainTimeout_{30};
};

/// Load a YAML configuration file into @p config.
///
/// The path is resolved in order:
///   1. PGW_CONFIG_PATH environment variable (if set)
///   2. @p defaultPath
///
/// @return Success or ConfigLoadFailed.
[[nodiscard]] foundation::GatewayResult<void> loadConfig(foundation::ConfigManager& config,
                                                         const std::filesystem::path& defaultPath);

/// Parse `--config <path>` from command-line arguments.
/// @return The path, or an empty path if not given.
[[nodiscard]] std::filesystem::path parseConfigArg(int argc, char* argv[]);

}  // namespace pgw::service
