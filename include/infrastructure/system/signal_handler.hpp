// EN: Signal Handler for cdoctl - graceful shutdown that cancels active pipeline runs
// FR: Gestionnaire de signaux pour cdoctl - arrêt propre qui annule les runs de pipeline actifs

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <csignal>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace CDO {

// EN: Callback function type for cleanup operations
// FR: Type de fonction callback pour les opérations de nettoyage
using CleanupCallback = std::function<void()>;

struct SignalHandlerConfig {
    std::chrono::milliseconds shutdown_timeout{5000};  // EN: Max time for cleanup callbacks / FR: Temps max pour les callbacks
    bool log_signal_details{true};
};

struct SignalHandlerStats {
    std::chrono::system_clock::time_point created_at;
    size_t signals_received{0};
    size_t cleanup_callbacks_registered{0};
    size_t successful_shutdowns{0};
    size_t failed_callbacks{0};
    std::chrono::milliseconds last_shutdown_duration{0};
    std::unordered_map<int, size_t> signal_counts;
};

// EN: Thread-safe signal handler. The OS handler only records the signal; a watcher
//     thread runs the registered cleanup callbacks outside signal context.
// FR: Gestionnaire de signaux thread-safe. Le handler OS enregistre seulement le signal; un
//     thread de surveillance exécute les callbacks de nettoyage hors du contexte de signal.
class SignalHandler {
public:
    static SignalHandler& getInstance();

    void configure(const SignalHandlerConfig& config);

    // EN: Initialize signal handling (registers SIGINT, SIGTERM handlers)
    // FR: Initialise la gestion des signaux (enregistre les handlers SIGINT, SIGTERM)
    void initialize();

    // EN: Register a cleanup callback to be called during shutdown
    // FR: Enregistre un callback de nettoyage à appeler lors de l'arrêt
    void registerCleanupCallback(const std::string& name, CleanupCallback callback);
    void unregisterCleanupCallback(const std::string& name);

    // EN: Manually trigger graceful shutdown (useful for testing)
    // FR: Déclenche manuellement un arrêt propre (utile pour les tests)
    void triggerShutdown(int signal_number = SIGTERM);

    bool isShutdownRequested() const { return shutdown_requested_.load(); }
    bool isShuttingDown() const { return shutting_down_.load(); }

    // EN: Block until the cleanup callbacks have completed, or the timeout expires
    // FR: Bloque jusqu'à la fin des callbacks de nettoyage, ou l'expiration du timeout
    bool waitForShutdown(std::chrono::milliseconds timeout = std::chrono::milliseconds(10000));

    SignalHandlerStats getStats() const;

    // EN: Reset the signal handler (mainly for testing)
    // FR: Remet à zéro le gestionnaire de signaux (principalement pour les tests)
    void reset();

    // EN: Enable/disable signal handling (for testing purposes)
    // FR: Active/désactive la gestion des signaux (pour les tests)
    void setEnabled(bool enabled);

    ~SignalHandler();

private:
    SignalHandler();
    SignalHandler(const SignalHandler&) = delete;
    SignalHandler& operator=(const SignalHandler&) = delete;

    static void signalCallback(int signal_number);

    void watchSignals();
    void handleSignal(int signal_number);
    void executeShutdown(int signal_number);
    void executeCleanupCallbacks();

    mutable std::mutex mutex_;
    SignalHandlerConfig config_;
    SignalHandlerStats stats_;

    std::atomic<bool> initialized_{false};
    std::atomic<bool> enabled_{true};
    std::atomic<bool> shutdown_requested_{false};
    std::atomic<bool> shutting_down_{false};
    bool shutdown_complete_{false};
    std::condition_variable shutdown_cv_;

    std::unordered_map<std::string, CleanupCallback> cleanup_callbacks_;

    std::thread watcher_thread_;
    std::thread shutdown_thread_;
    std::atomic<bool> stop_watcher_{false};

    static volatile std::sig_atomic_t pending_signal_;
};

} // namespace CDO
