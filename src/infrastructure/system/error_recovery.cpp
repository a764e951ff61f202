// EN: Error Recovery implementation - auto-retry with exponential backoff
// FR: Implémentation Error Recovery - auto-retry avec backoff exponentiel

#include "infrastructure/system/error_recovery.hpp"
#include "infrastructure/logging/logger.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <regex>
#include <sstream>
#include <thread>

namespace CDO {

namespace {

std::unordered_set<RecoverableErrorType> defaultRecoverableErrors() {
    return {
        RecoverableErrorType::NETWORK_TIMEOUT,
        RecoverableErrorType::CONNECTION_REFUSED,
        RecoverableErrorType::HTTP_5XX,
        RecoverableErrorType::HTTP_429,
        RecoverableErrorType::TEMPORARY_FAILURE
    };
}

// EN: Message-based classification for transport errors that carry no status code
// FR: Classification par message pour les erreurs de transport sans code de statut
RecoverableErrorType classifyByMessage(const std::exception& e) {
    std::string message = e.what();
    std::transform(message.begin(), message.end(), message.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    auto contains = [&message](const char* needle) {
        return message.find(needle) != std::string::npos;
    };

    if (contains("timeout") || contains("timed out")) {
        return RecoverableErrorType::NETWORK_TIMEOUT;
    }
    if (contains("connection refused") || contains("connection reset") || contains("couldn't connect")) {
        return RecoverableErrorType::CONNECTION_REFUSED;
    }
    if (contains("could not resolve") || contains("host not found") || contains("dns")) {
        return RecoverableErrorType::DNS_RESOLUTION;
    }
    if (contains("ssl") || contains("tls") || contains("handshake")) {
        return RecoverableErrorType::SSL_HANDSHAKE;
    }
    if (contains("socket")) {
        return RecoverableErrorType::SOCKET_ERROR;
    }

    static const std::regex status_regex(R"(\bhttp (5[0-9]{2}|429)\b)");
    std::smatch match;
    if (std::regex_search(message, match, status_regex)) {
        return ErrorRecoveryUtils::classifyHttpError(std::stoi(match[1].str()));
    }

    if (contains("temporar") || contains("unavailable")) {
        return RecoverableErrorType::TEMPORARY_FAILURE;
    }
    return RecoverableErrorType::CUSTOM;
}

} // namespace

// EN: RetryContext implementation
// FR: Implémentation de RetryContext
RetryContext::RetryContext(const std::string& operation_name, const RetryConfig& config)
    : config_(config), operation_name_(operation_name), jitter_generator_(std::random_device{}()) {
    if (config_.recoverable_errors.empty()) {
        config_.recoverable_errors = defaultRecoverableErrors();
    }
    if (config_.max_attempts == 0) {
        config_.max_attempts = 1;
    }
}

void RetryContext::recordAttempt(RecoverableErrorType error_type, const std::string& error_message) {
    RetryAttempt attempt;
    attempt.attempt_number = ++current_attempt_;
    attempt.timestamp = std::chrono::system_clock::now();
    attempt.error_message = error_message;
    attempt.error_type = error_type;
    attempt.delay = getNextDelay();

    attempts_.push_back(attempt);
}

bool RetryContext::canRetry() const {
    return current_attempt_ < config_.max_attempts;
}

std::chrono::milliseconds RetryContext::getNextDelay() const {
    if (current_attempt_ == 0) {
        return std::chrono::milliseconds{0};
    }

    double delay_ms = static_cast<double>(config_.initial_delay.count()) *
                      std::pow(config_.backoff_multiplier, static_cast<double>(current_attempt_ - 1));
    delay_ms = std::min(delay_ms, static_cast<double>(config_.max_delay.count()));

    auto base_delay = std::chrono::milliseconds(static_cast<long long>(delay_ms));
    if (config_.enable_jitter) {
        return calculateDelayWithJitter(base_delay);
    }
    return base_delay;
}

std::chrono::milliseconds RetryContext::calculateDelayWithJitter(std::chrono::milliseconds base_delay) const {
    if (config_.jitter_factor <= 0.0 || base_delay.count() == 0) {
        return base_delay;
    }

    double jitter_range = static_cast<double>(base_delay.count()) * config_.jitter_factor;
    std::uniform_real_distribution<double> jitter_dist(-jitter_range, jitter_range);

    double jittered_delay = static_cast<double>(base_delay.count()) + jitter_dist(jitter_generator_);
    jittered_delay = std::max(0.0, jittered_delay);

    return std::chrono::milliseconds(static_cast<long long>(jittered_delay));
}

// EN: ErrorRecoveryManager implementation
// FR: Implémentation d'ErrorRecoveryManager
ErrorRecoveryManager& ErrorRecoveryManager::getInstance() {
    static ErrorRecoveryManager instance;
    return instance;
}

ErrorRecoveryManager::ErrorRecoveryManager() {
    default_config_.recoverable_errors = defaultRecoverableErrors();
    default_config_.recoverable_errors.insert(RecoverableErrorType::DNS_RESOLUTION);
    statistics_.created_at = std::chrono::system_clock::now();
}

void ErrorRecoveryManager::configure(const RetryConfig& config) {
    std::lock_guard<std::mutex> lock(mutex_);
    default_config_ = config;

    LOG_DEBUG("error_recovery", "Configured - Max attempts: " + std::to_string(config.max_attempts) +
              ", Initial delay: " + std::to_string(config.initial_delay.count()) + "ms" +
              ", Max delay: " + std::to_string(config.max_delay.count()) + "ms");
}

RetryConfig ErrorRecoveryManager::getDefaultConfig() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return default_config_;
}

bool ErrorRecoveryManager::isRecoverable(RecoverableErrorType error_type) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return default_config_.recoverable_errors.count(error_type) > 0;
}

void ErrorRecoveryManager::addErrorClassifier(std::function<RecoverableErrorType(const std::exception&)> classifier) {
    std::lock_guard<std::mutex> lock(mutex_);
    error_classifiers_.push_back(std::move(classifier));
}

RetryStatistics ErrorRecoveryManager::getStatistics() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return statistics_;
}

void ErrorRecoveryManager::resetStatistics() {
    std::lock_guard<std::mutex> lock(mutex_);
    statistics_ = RetryStatistics{};
    statistics_.created_at = std::chrono::system_clock::now();
}

void ErrorRecoveryManager::setCircuitBreakerThreshold(size_t threshold) {
    circuit_breaker_threshold_.store(threshold);
}

void ErrorRecoveryManager::resetCircuitBreaker() {
    circuit_breaker_open_.store(false);
    consecutive_failures_.store(0);
    LOG_INFO("error_recovery", "Circuit breaker reset");
}

// EN: Status-carrying errors first, then custom classifiers, then the message heuristics.
// FR: Erreurs portant un statut d'abord, puis classificateurs personnalisés, puis heuristiques de message.
RecoverableErrorType ErrorRecoveryManager::classifyError(const std::exception& error) const {
    if (const auto* http_error = dynamic_cast<const HttpStatusError*>(&error)) {
        return ErrorRecoveryUtils::classifyHttpError(http_error->statusCode());
    }

    std::vector<std::function<RecoverableErrorType(const std::exception&)>> classifiers;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        classifiers = error_classifiers_;
    }
    for (const auto& classifier : classifiers) {
        RecoverableErrorType type = classifier(error);
        if (type != RecoverableErrorType::CUSTOM) {
            return type;
        }
    }

    return classifyByMessage(error);
}

void ErrorRecoveryManager::updateStatistics(const RetryContext& context, bool success) {
    std::lock_guard<std::mutex> lock(mutex_);

    statistics_.total_operations++;
    if (success) {
        statistics_.successful_operations++;
    } else {
        statistics_.failed_operations++;
    }

    const auto& attempts = context.getAttempts();
    statistics_.total_retries += attempts.size();
    for (const auto& attempt : attempts) {
        statistics_.error_counts[attempt.error_type]++;
    }
}

void ErrorRecoveryManager::recordExhaustion() {
    const size_t failures = consecutive_failures_.fetch_add(1) + 1;
    if (failures >= circuit_breaker_threshold_.load() && !circuit_breaker_open_.exchange(true)) {
        LOG_ERROR("error_recovery", "Circuit breaker opened after " + std::to_string(failures) +
                  " consecutive exhausted operations");
    }
}

void ErrorRecoveryManager::logRetryAttempt(const RetryContext& context, const RetryAttempt& attempt) const {
    std::ostringstream oss;
    oss << "Retry attempt " << attempt.attempt_number
        << " for operation '" << context.getOperationName()
        << "' - Error: " << attempt.error_message;

    LOG_WARN_META("error_recovery", oss.str(), (Logger::Metadata{
        {"error_type", ErrorRecoveryUtils::errorTypeToString(attempt.error_type)},
        {"delay_ms", std::to_string(attempt.delay.count())}
    }));
}

bool ErrorRecoveryManager::interruptibleSleep(std::chrono::milliseconds duration,
                                              const std::function<bool()>& abort_requested) const {
    const auto sleep_increment = std::chrono::milliseconds(20);
    auto remaining = duration;

    while (true) {
        if (abort_requested && abort_requested()) {
            return false;
        }
        if (remaining <= std::chrono::milliseconds(0)) {
            return true;
        }
        auto sleep_time = std::min(remaining, sleep_increment);
        std::this_thread::sleep_for(sleep_time);
        remaining -= sleep_time;
    }
}

namespace ErrorRecoveryUtils {

RetryConfig createNetworkRetryConfig() {
    RetryConfig config;
    config.max_attempts = 3;
    config.initial_delay = std::chrono::milliseconds(200);
    config.max_delay = std::chrono::milliseconds(10000);
    config.backoff_multiplier = 2.0;
    config.jitter_factor = 0.15;

    config.recoverable_errors = {
        RecoverableErrorType::NETWORK_TIMEOUT,
        RecoverableErrorType::CONNECTION_REFUSED,
        RecoverableErrorType::DNS_RESOLUTION,
        RecoverableErrorType::SOCKET_ERROR,
        RecoverableErrorType::TEMPORARY_FAILURE
    };
    return config;
}

RetryConfig createHttpRetryConfig() {
    RetryConfig config;
    config.max_attempts = 5;
    config.initial_delay = std::chrono::milliseconds(500);
    config.max_delay = std::chrono::milliseconds(30000);
    config.backoff_multiplier = 2.5;
    config.jitter_factor = 0.2;

    config.recoverable_errors = {
        RecoverableErrorType::NETWORK_TIMEOUT,
        RecoverableErrorType::CONNECTION_REFUSED,
        RecoverableErrorType::HTTP_5XX,
        RecoverableErrorType::HTTP_429,
        RecoverableErrorType::SSL_HANDSHAKE,
        RecoverableErrorType::TEMPORARY_FAILURE
    };
    return config;
}

RecoverableErrorType classifyHttpError(int status_code) {
    if (status_code >= 500 && status_code < 600) {
        if (status_code == 502 || status_code == 503 || status_code == 504) {
            return RecoverableErrorType::TEMPORARY_FAILURE;
        }
        return RecoverableErrorType::HTTP_5XX;
    }
    if (status_code == 429) {
        return RecoverableErrorType::HTTP_429;
    }
    // EN: Other 4xx are caller errors.
    // FR: Les autres 4xx sont des erreurs de l'appelant.
    return RecoverableErrorType::CUSTOM;
}

const char* errorTypeToString(RecoverableErrorType type) {
    switch (type) {
        case RecoverableErrorType::NETWORK_TIMEOUT:    return "network_timeout";
        case RecoverableErrorType::CONNECTION_REFUSED: return "connection_refused";
        case RecoverableErrorType::DNS_RESOLUTION:     return "dns_resolution";
        case RecoverableErrorType::SSL_HANDSHAKE:      return "ssl_handshake";
        case RecoverableErrorType::HTTP_5XX:           return "http_5xx";
        case RecoverableErrorType::HTTP_429:           return "http_429";
        case RecoverableErrorType::SOCKET_ERROR:       return "socket_error";
        case RecoverableErrorType::TEMPORARY_FAILURE:  return "temporary_failure";
        case RecoverableErrorType::CUSTOM:             return "custom";
    }
    return "unknown";
}

} // namespace ErrorRecoveryUtils

} // namespace CDO
