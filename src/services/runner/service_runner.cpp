/// @file service_runner.cpp
/// @brief Implementation of shared entry-point utilities.

#include "pgw/service/service_runner.hpp"

#include <algorithm>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <exception>
#include <string_view>
#include <thread>

#include "pgw/foundation/gateway_logger.hpp"

namespace pgw::service {

using foundation::GatewayLogger;
using foundation::LogCategory;
using foundation::LogContext;
using foundation::LogLevel;

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

bool SignalHandler::waitFor(std::chrono::milliseconds timeout) const {
    using namespace std::chrono_literals;
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!shutdownFlag_.load(std::memory_order_relaxed)) {
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            return false;
        }
        std::this_thread::sleep_for(
            std::min<std::chrono::steady_clock::duration>(100ms, deadline - now));
    }
    return true;
}

void SignalHandler::waitForShutdown() const {
    using namespace std::chrono_literals;
    while (!shutdownFlag_.load(std::memory_order_relaxed)) {
        std::this_thread::sleep_for(100ms);
    }
}

// -- GracefulShutdown --------------------------------------------------------

void GracefulShutdown::addHook(std::string name, ShutdownHook hook) {
    hooks_.push_back(Hook{std::move(name), std::move(hook)});
}

void GracefulShutdown::execute() {
    auto deadline = std::chrono::steady_clock::now() + drainTimeout_;

    for (const auto& hook : hooks_) {
        LogContext ctx;
        ctx.extra["hook"] = hook.name;
        try {
            hook.callback();
        } catch (const std::exception& e) {
            ctx.extra["error"] = e.what();
            GatewayLogger::instance().logWithContext(LogLevel::Error, LogCategory::Core,
                                                     "shutdown hook failed", ctx);
        }

        if (std::chrono::steady_clock::now() > deadline) {
            GatewayLogger::instance().logWithContext(LogLevel::Warning, LogCategory::Core,
                                                     "shutdown exceeded drain timeout", ctx);
        }
    }
}

std::size_t GracefulShutdown::hookCount() const {
    return hooks_.size();
}

void GracefulShutdown::setDrainTimeout(std::chrono::seconds timeout) {
    drainTimeout_ = timeout;
}

// -- Config loading ----------------------------------------------------------

foundation::GatewayResult<void> loadConfig(foundation::ConfigManager& config,
                                           const std::filesystem::path& defaultPath) {
    std::filesystem::path configPath = defaultPath;

    const char* envPath = std::getenv("PGW_CONFIG_PATH");
    if (envPath != nullptr) {
        configPath = envPath;
    }

    return config.load(configPath);
}

// -- CLI argument parsing ----------------------------------------------------

std::filesystem::path parseConfigArg(int argc, char* argv[]) {
    for (int i = 1; i < argc - 1; ++i) {
        if (std::string_view(argv[i]) == "--config") {  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
            return argv[i + 1];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        }
    }
    return {};
}

} // namespace pgw::service
