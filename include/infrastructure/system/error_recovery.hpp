// EN: Error Recovery for the release transport - auto-retry with exponential backoff on network failures
// FR: Récupération d'erreurs pour le transport des releases - auto-retry avec backoff exponentiel sur échecs réseau

#pragma once

#include <atomic>
#include <chrono>
#include <exception>
#include <functional>
#include <mutex>
#include <random>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace CDO {

// EN: Error types that can be recovered from
// FR: Types d'erreurs qui peuvent être récupérés
enum class RecoverableErrorType {
    NETWORK_TIMEOUT,        // EN: Network timeout error / FR: Erreur de timeout réseau
    CONNECTION_REFUSED,     // EN: Connection refused / FR: Connexion refusée
    DNS_RESOLUTION,         // EN: DNS resolution failure / FR: Échec de résolution DNS
    SSL_HANDSHAKE,          // EN: SSL handshake failure / FR: Échec du handshake SSL
    HTTP_5XX,               // EN: HTTP 5xx server errors / FR: Erreurs serveur HTTP 5xx
    HTTP_429,               // EN: HTTP 429 rate limit / FR: HTTP 429 limite de débit
    SOCKET_ERROR,           // EN: General socket error / FR: Erreur de socket générale
    TEMPORARY_FAILURE,      // EN: Temporary service failure / FR: Échec temporaire du service
    CUSTOM                  // EN: Unclassified error / FR: Erreur non classifiée
};

// EN: Retry strategy configuration
// FR: Configuration de la stratégie de retry
struct RetryConfig {
    size_t max_attempts{3};                          // EN: Maximum number of attempts / FR: Nombre maximum de tentatives
    std::chrono::milliseconds initial_delay{100};    // EN: Delay before first retry / FR: Délai avant le premier retry
    std::chrono::milliseconds max_delay{30000};      // EN: Maximum delay between retries / FR: Délai maximum entre retries
    double backoff_multiplier{2.0};
    double jitter_factor{0.1};                       // EN: Jitter factor (0-1) / FR: Facteur de jitter (0-1)
    bool enable_jitter{true};
    std::unordered_set<RecoverableErrorType> recoverable_errors;

    // EN: Polled while waiting between attempts; returning true aborts the retry loop.
    // FR: Interrogé pendant l'attente entre tentatives; retourner true interrompt la boucle.
    std::function<bool()> abort_requested;
};

// EN: Retry attempt information for monitoring and logging
// FR: Information de tentative de retry pour monitoring et logging
struct RetryAttempt {
    size_t attempt_number{0};
    std::chrono::milliseconds delay{0};
    std::chrono::system_clock::time_point timestamp;
    std::string error_message;
    RecoverableErrorType error_type{RecoverableErrorType::CUSTOM};
};

struct RetryStatistics {
    std::chrono::system_clock::time_point created_at;
    size_t total_operations{0};
    size_t successful_operations{0};
    size_t failed_operations{0};
    size_t total_retries{0};
    std::unordered_map<RecoverableErrorType, size_t> error_counts;
};

// EN: Retry context for tracking individual operations
// FR: Contexte de retry pour suivre les opérations individuelles
class RetryContext {
public:
    explicit RetryContext(const std::string& operation_name, const RetryConfig& config = {});

    void recordAttempt(RecoverableErrorType error_type, const std::string& error_message);

    size_t getCurrentAttempt() const { return current_attempt_; }

    // EN: Check if more attempts are allowed
    // FR: Vérifie si plus de tentatives sont autorisées
    bool canRetry() const;

    // EN: Exponential delay for the next attempt, capped and jittered
    // FR: Délai exponentiel pour la prochaine tentative, plafonné et avec jitter
    std::chrono::milliseconds getNextDelay() const;

    const std::string& getOperationName() const { return operation_name_; }
    const std::vector<RetryAttempt>& getAttempts() const { return attempts_; }
    const RetryConfig& getConfig() const { return config_; }

private:
    std::chrono::milliseconds calculateDelayWithJitter(std::chrono::milliseconds base_delay) const;

    RetryConfig config_;
    std::string operation_name_;
    size_t current_attempt_{0};
    std::vector<RetryAttempt> attempts_;
    mutable std::mt19937 jitter_generator_;
};

// EN: Exception for non-recoverable errors
// FR: Exception pour les erreurs non récupérables
class NonRecoverableError : public std::runtime_error {
public:
    explicit NonRecoverableError(const std::string& message) : std::runtime_error(message) {}
};

// EN: Exception for retry exhaustion
// FR: Exception pour l'épuisement des retries
class RetryExhaustedException : public std::runtime_error {
public:
    RetryExhaustedException(const std::string& operation, size_t attempts, const std::string& last_error)
        : std::runtime_error("Retry exhausted for operation '" + operation + "' after " +
                             std::to_string(attempts) + " attempts: " + last_error) {}
};

// EN: Thrown when abort_requested fires during the wait between attempts
// FR: Lancée quand abort_requested se déclenche pendant l'attente entre tentatives
class RetryAbortedException : public std::runtime_error {
public:
    explicit RetryAbortedException(const std::string& operation)
        : std::runtime_error("Retry aborted for operation '" + operation + "'") {}
};

// EN: Transport failure carrying the HTTP status code that caused it
// FR: Échec de transport portant le code HTTP qui l'a causé
class HttpStatusError : public std::runtime_error {
public:
    HttpStatusError(int status_code, const std::string& message)
        : std::runtime_error(message), status_code_(status_code) {}

    int statusCode() const { return status_code_; }

private:
    int status_code_;
};

// EN: Error Recovery Manager - handles retries with exponential backoff
// FR: Gestionnaire de récupération d'erreurs - gère les retries avec backoff exponentiel
class ErrorRecoveryManager {
public:
    static ErrorRecoveryManager& getInstance();

    void configure(const RetryConfig& config);
    RetryConfig getDefaultConfig() const;

    // EN: Execute operation with automatic retry
    // FR: Exécute l'opération avec retry automatique
    template<typename Func>
    auto executeWithRetry(const std::string& operation_name, Func&& func) -> decltype(func());

    template<typename Func>
    auto executeWithRetry(const std::string& operation_name, const RetryConfig& config,
                          Func&& func) -> decltype(func());

    bool isRecoverable(RecoverableErrorType error_type) const;

    void addErrorClassifier(std::function<RecoverableErrorType(const std::exception&)> classifier);

    RetryStatistics getStatistics() const;
    void resetStatistics();

    void setDetailedLogging(bool enabled) { detailed_logging_.store(enabled); }

    // EN: Circuit breaker: retries are refused after N consecutive exhausted operations
    // FR: Circuit breaker : les retries sont refusés après N opérations épuisées consécutives
    void setCircuitBreakerThreshold(size_t threshold);
    bool isCircuitBreakerOpen() const { return circuit_breaker_open_.load(); }
    void resetCircuitBreaker();

    RecoverableErrorType classifyError(const std::exception& error) const;

private:
    ErrorRecoveryManager();
    ErrorRecoveryManager(const ErrorRecoveryManager&) = delete;
    ErrorRecoveryManager& operator=(const ErrorRecoveryManager&) = delete;

    template<typename Func>
    auto executeWithRetryInternal(const std::string& operation_name, const RetryConfig& config,
                                  Func&& func) -> decltype(func());

    void updateStatistics(const RetryContext& context, bool success);
    void recordExhaustion();
    void logRetryAttempt(const RetryContext& context, const RetryAttempt& attempt) const;

    // EN: Sleep in small increments; returns false when aborted
    // FR: Dort par petits incréments; retourne false en cas d'interruption
    bool interruptibleSleep(std::chrono::milliseconds duration,
                            const std::function<bool()>& abort_requested) const;

    mutable std::mutex mutex_;
    RetryConfig default_config_;
    RetryStatistics statistics_;
    std::vector<std::function<RecoverableErrorType(const std::exception&)>> error_classifiers_;
    std::atomic<bool> detailed_logging_{true};
    std::atomic<size_t> circuit_breaker_threshold_{100};
    std::atomic<size_t> consecutive_failures_{0};
    std::atomic<bool> circuit_breaker_open_{false};
};

namespace ErrorRecoveryUtils {

    // EN: Configuration for HTTP operations
    // FR: Configuration pour les opérations HTTP
    RetryConfig createHttpRetryConfig();

    RetryConfig createNetworkRetryConfig();

    // EN: Classify HTTP status codes
    // FR: Classifie les codes de statut HTTP
    RecoverableErrorType classifyHttpError(int status_code);

    const char* errorTypeToString(RecoverableErrorType type);

} // namespace ErrorRecoveryUtils

template<typename Func>
auto ErrorRecoveryManager::executeWithRetry(const std::string& operation_name, Func&& func)
    -> decltype(func()) {
    return executeWithRetryInternal(operation_name, getDefaultConfig(), std::forward<Func>(func));
}

template<typename Func>
auto ErrorRecoveryManager::executeWithRetry(const std::string& operation_name, const RetryConfig& config,
                                            Func&& func) -> decltype(func()) {
    return executeWithRetryInternal(operation_name, config, std::forward<Func>(func));
}

template<typename Func>
auto ErrorRecoveryManager::executeWithRetryInternal(const std::string& operation_name,
                                                    const RetryConfig& config,
                                                    Func&& func) -> decltype(func()) {
    if (isCircuitBreakerOpen()) {
        throw NonRecoverableError("Circuit breaker is open for operation: " + operation_name);
    }

    RetryContext context(operation_name, config);

    while (true) {
        try {
            if constexpr (std::is_void_v<decltype(func())>) {
                func();
                updateStatistics(context, true);
                consecutive_failures_.store(0);
                return;
            } else {
                auto result = func();
                updateStatistics(context, true);
                consecutive_failures_.store(0);
                return result;
            }

        } catch (const NonRecoverableError&) {
            updateStatistics(context, false);
            throw;

        } catch (const std::exception& e) {
            const RecoverableErrorType error_type = classifyError(e);
            const auto& recoverable = context.getConfig().recoverable_errors;

            if (recoverable.find(error_type) == recoverable.end()) {
                updateStatistics(context, false);
                throw NonRecoverableError("Non-recoverable error in operation '" + operation_name +
                                          "': " + e.what());
            }

            context.recordAttempt(error_type, e.what());

            if (!context.canRetry()) {
                updateStatistics(context, false);
                recordExhaustion();
                throw RetryExhaustedException(operation_name, context.getCurrentAttempt(), e.what());
            }

            if (detailed_logging_.load()) {
                logRetryAttempt(context, context.getAttempts().back());
            }

            if (!interruptibleSleep(context.getNextDelay(), context.getConfig().abort_requested)) {
                updateStatistics(context, false);
                throw RetryAbortedException(operation_name);
            }
        }
    }
}

} // namespace CDO
