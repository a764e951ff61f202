// EN: Implementation of the SignalHandler class. Graceful shutdown through registered cleanup callbacks.
// FR: Implémentation de la classe SignalHandler. Arrêt propre via les callbacks de nettoyage enregistrés.

#include "infrastructure/system/signal_handler.hpp"
#include "infrastructure/logging/logger.hpp"

#include <signal.h>

#include <cstring>
#include <stdexcept>

namespace CDO {

volatile std::sig_atomic_t SignalHandler::pending_signal_ = 0;

SignalHandler& SignalHandler::getInstance() {
    static SignalHandler instance;
    return instance;
}

SignalHandler::SignalHandler() {
    stats_.created_at = std::chrono::system_clock::now();
}

// EN: Destructor - stops the watcher and restores default handlers.
// FR: Destructeur - arrête le thread de surveillance et restaure les handlers par défaut.
SignalHandler::~SignalHandler() {
    stop_watcher_ = true;
    if (watcher_thread_.joinable()) {
        watcher_thread_.join();
    }
    if (shutdown_thread_.joinable()) {
        shutdown_thread_.join();
    }
    if (initialized_) {
        signal(SIGINT, SIG_DFL);
        signal(SIGTERM, SIG_DFL);
    }
}

void SignalHandler::configure(const SignalHandlerConfig& config) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (shutting_down_.load()) {
        LOG_WARN("signal_handler", "Cannot configure during shutdown");
        return;
    }
    config_ = config;
}

void SignalHandler::initialize() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (initialized_.load()) {
        LOG_WARN("signal_handler", "SignalHandler already initialized");
        return;
    }
    if (!enabled_.load()) {
        LOG_WARN("signal_handler", "SignalHandler is disabled, skipping initialization");
        return;
    }

    struct sigaction action;
    std::memset(&action, 0, sizeof(action));
    action.sa_handler = &SignalHandler::signalCallback;
    sigemptyset(&action.sa_mask);

    if (sigaction(SIGINT, &action, nullptr) != 0) {
        throw std::runtime_error("Failed to register SIGINT handler");
    }
    if (sigaction(SIGTERM, &action, nullptr) != 0) {
        signal(SIGINT, SIG_DFL);
        throw std::runtime_error("Failed to register SIGTERM handler");
    }

    stop_watcher_ = false;
    watcher_thread_ = std::thread(&SignalHandler::watchSignals, this);
    initialized_ = true;

    LOG_DEBUG("signal_handler", "SIGINT and SIGTERM handlers registered");
}

void SignalHandler::registerCleanupCallback(const std::string& name, CleanupCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (shutting_down_.load()) {
        LOG_WARN("signal_handler", "Cannot register cleanup callback during shutdown: " + name);
        return;
    }

    cleanup_callbacks_[name] = std::move(callback);
    stats_.cleanup_callbacks_registered = cleanup_callbacks_.size();
}

void SignalHandler::unregisterCleanupCallback(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (cleanup_callbacks_.erase(name) == 0) {
        LOG_WARN("signal_handler", "Cleanup callback not found for unregistration: " + name);
        return;
    }
    stats_.cleanup_callbacks_registered = cleanup_callbacks_.size();
}

void SignalHandler::triggerShutdown(int signal_number) {
    LOG_INFO("signal_handler", "Manual shutdown triggered with signal: " + std::to_string(signal_number));
    handleSignal(signal_number);
}

bool SignalHandler::waitForShutdown(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    return shutdown_cv_.wait_for(lock, timeout, [this] { return shutdown_complete_; });
}

SignalHandlerStats SignalHandler::getStats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stats_;
}

void SignalHandler::reset() {
    if (shutdown_thread_.joinable()) {
        shutdown_thread_.join();
    }

    std::lock_guard<std::mutex> lock(mutex_);
    cleanup_callbacks_.clear();
    shutdown_requested_ = false;
    shutting_down_ = false;
    shutdown_complete_ = false;
    pending_signal_ = 0;

    stats_ = SignalHandlerStats{};
    stats_.created_at = std::chrono::system_clock::now();
}

void SignalHandler::setEnabled(bool enabled) {
    enabled_ = enabled;
}

// EN: Async-signal-safe: only records the signal number.
// FR: Async-signal-safe : enregistre seulement le numéro du signal.
void SignalHandler::signalCallback(int signal_number) {
    pending_signal_ = signal_number;
}

void SignalHandler::watchSignals() {
    while (!stop_watcher_.load()) {
        const int signal_number = pending_signal_;
        if (signal_number != 0) {
            pending_signal_ = 0;
            if (enabled_.load()) {
                handleSignal(signal_number);
            }
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
}

void SignalHandler::handleSignal(int signal_number) {
    shutdown_requested_ = true;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        stats_.signals_received++;
        stats_.signal_counts[signal_number]++;
    }

    if (shutting_down_.exchange(true)) {
        LOG_WARN("signal_handler", "Signal received during shutdown, ignoring: " + std::to_string(signal_number));
        return;
    }

    if (config_.log_signal_details) {
        const std::string signal_name = (signal_number == SIGINT) ? "SIGINT" :
                                        (signal_number == SIGTERM) ? "SIGTERM" :
                                        "SIGNAL_" + std::to_string(signal_number);
        LOG_INFO("signal_handler", "Received signal: " + signal_name + " - initiating graceful shutdown");
    }

    if (shutdown_thread_.joinable()) {
        shutdown_thread_.join();
    }
    shutdown_thread_ = std::thread(&SignalHandler::executeShutdown, this, signal_number);
}

void SignalHandler::executeShutdown(int /* signal_number */) {
    const auto shutdown_start = std::chrono::steady_clock::now();

    executeCleanupCallbacks();

    const auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - shutdown_start);

    {
        std::lock_guard<std::mutex> lock(mutex_);
        stats_.successful_shutdowns++;
        stats_.last_shutdown_duration = duration;
        shutdown_complete_ = true;
    }
    shutdown_cv_.notify_all();

    LOG_INFO("signal_handler", "Graceful shutdown completed in " + std::to_string(duration.count()) + "ms");
    Logger::getInstance().flush();
}

// EN: Callbacks run without holding the mutex.
// FR: Les callbacks s'exécutent sans tenir le mutex.
void SignalHandler::executeCleanupCallbacks() {
    std::vector<std::pair<std::string, CleanupCallback>> callbacks_copy;
    std::chrono::milliseconds timeout;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        callbacks_copy.assign(cleanup_callbacks_.begin(), cleanup_callbacks_.end());
        timeout = config_.shutdown_timeout;
    }

    const auto deadline = std::chrono::steady_clock::now() + timeout;

    for (const auto& [name, callback] : callbacks_copy) {
        if (std::chrono::steady_clock::now() >= deadline) {
            LOG_WARN("signal_handler", "Cleanup timeout reached, skipping remaining callbacks");
            break;
        }

        try {
            LOG_DEBUG("signal_handler", "Executing cleanup callback: " + name);
            callback();
        } catch (const std::exception& e) {
            std::lock_guard<std::mutex> lock(mutex_);
            stats_.failed_callbacks++;
            LOG_ERROR("signal_handler", "Cleanup callback failed: " + name + " - " + e.what());
        }
    }
}

} // namespace CDO
