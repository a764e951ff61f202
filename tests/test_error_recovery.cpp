// EN: Unit tests for the Error Recovery system used by the release transport
// FR: Tests unitaires pour le système Error Recovery utilisé par le transport des releases

#include <gtest/gtest.h>
#include "infrastructure/system/error_recovery.hpp"
#include "infrastructure/logging/logger.hpp"

#include <atomic>
#include <chrono>
#include <stdexcept>

using namespace CDO;
using namespace std::chrono_literals;

// EN: Test fixture for Error Recovery tests
// FR: Fixture de test pour les tests Error Recovery
class ErrorRecoveryTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::getInstance().setConsoleOutput(false);
        error_recovery_ = &ErrorRecoveryManager::getInstance();
        error_recovery_->resetStatistics();
        error_recovery_->resetCircuitBreaker();
        error_recovery_->setCircuitBreakerThreshold(100);
        error_recovery_->setDetailedLogging(false);

        config_.max_attempts = 3;
        config_.initial_delay = 5ms;
        config_.max_delay = 50ms;
        config_.backoff_multiplier = 2.0;
        config_.enable_jitter = false;
        config_.recoverable_errors = {RecoverableErrorType::NETWORK_TIMEOUT, RecoverableErrorType::HTTP_5XX,
                                      RecoverableErrorType::TEMPORARY_FAILURE};
    }

    void TearDown() override {
        error_recovery_->resetStatistics();
        error_recovery_->resetCircuitBreaker();
        error_recovery_->setCircuitBreakerThreshold(100);
    }

    ErrorRecoveryManager* error_recovery_{nullptr};
    RetryConfig config_;
};

TEST_F(ErrorRecoveryTest, SucceedsWithoutRetry) {
    int calls = 0;
    int result = error_recovery_->executeWithRetry("release.find", config_, [&calls]() {
        ++calls;
        return 42;
    });

    EXPECT_EQ(result, 42);
    EXPECT_EQ(calls, 1);
    auto stats = error_recovery_->getStatistics();
    EXPECT_EQ(stats.successful_operations, 1u);
    EXPECT_EQ(stats.total_retries, 0u);
}

TEST_F(ErrorRecoveryTest, RetriesRecoverableErrorsUntilSuccess) {
    int calls = 0;
    error_recovery_->executeWithRetry("release.upload", config_, [&calls]() {
        if (++calls < 3) {
            throw std::runtime_error("operation timed out");
        }
    });

    EXPECT_EQ(calls, 3);
    auto stats = error_recovery_->getStatistics();
    EXPECT_EQ(stats.total_retries, 2u);
    EXPECT_EQ(stats.error_counts[RecoverableErrorType::NETWORK_TIMEOUT], 2u);
}

TEST_F(ErrorRecoveryTest, ThrowsRetryExhaustedAfterMaxAttempts) {
    int calls = 0;
    EXPECT_THROW(error_recovery_->executeWithRetry("release.create", config_, [&calls]() {
        ++calls;
        throw HttpStatusError(500, "HTTP 500 from release host");
    }), RetryExhaustedException);
    EXPECT_EQ(calls, 3);
}

// EN: A 4xx status is the caller's fault and is never retried
// FR: Un statut 4xx est une erreur de l'appelant et n'est jamais réessayé
TEST_F(ErrorRecoveryTest, ClientErrorsAreNotRetried) {
    int calls = 0;
    EXPECT_THROW(error_recovery_->executeWithRetry("release.create", config_, [&calls]() {
        ++calls;
        throw HttpStatusError(422, "HTTP 422 validation failed");
    }), NonRecoverableError);
    EXPECT_EQ(calls, 1);
}

TEST_F(ErrorRecoveryTest, NonRecoverableErrorPassesThrough) {
    EXPECT_THROW(error_recovery_->executeWithRetry("release.delete", config_, []() {
        throw NonRecoverableError("malformed response");
    }), NonRecoverableError);
}

TEST_F(ErrorRecoveryTest, AbortRequestedStopsWaitingBetweenAttempts) {
    std::atomic<bool> abort{false};
    config_.initial_delay = 2000ms;
    config_.max_delay = 2000ms;
    config_.abort_requested = [&abort]() { return abort.load(); };

    int calls = 0;
    auto start = std::chrono::steady_clock::now();
    EXPECT_THROW(error_recovery_->executeWithRetry("release.upload", config_, [&calls, &abort]() {
        ++calls;
        abort = true;
        throw std::runtime_error("service temporarily unavailable");
    }), RetryAbortedException);

    EXPECT_EQ(calls, 1);
    EXPECT_LT(std::chrono::steady_clock::now() - start, 1000ms);
}

TEST_F(ErrorRecoveryTest, CircuitBreakerOpensAfterConsecutiveExhaustion) {
    error_recovery_->setCircuitBreakerThreshold(2);
    config_.max_attempts = 1;

    for (int i = 0; i < 2; ++i) {
        EXPECT_THROW(error_recovery_->executeWithRetry("release.find", config_, []() {
            throw std::runtime_error("timeout");
        }), RetryExhaustedException);
    }
    EXPECT_TRUE(error_recovery_->isCircuitBreakerOpen());
    EXPECT_THROW(error_recovery_->executeWithRetry("release.find", config_, []() { return 1; }),
                 NonRecoverableError);

    error_recovery_->resetCircuitBreaker();
    EXPECT_EQ(error_recovery_->executeWithRetry("release.find", config_, []() { return 1; }), 1);
}

TEST_F(ErrorRecoveryTest, CustomClassifierIsConsulted) {
    struct QuotaError : std::runtime_error {
        QuotaError() : std::runtime_error("quota") {}
    };
    error_recovery_->addErrorClassifier([](const std::exception& e) {
        return dynamic_cast<const QuotaError*>(&e) ? RecoverableErrorType::TEMPORARY_FAILURE
                                                   : RecoverableErrorType::CUSTOM;
    });

    EXPECT_EQ(error_recovery_->classifyError(QuotaError()), RecoverableErrorType::TEMPORARY_FAILURE);
    EXPECT_EQ(error_recovery_->classifyError(std::runtime_error("connection refused")),
              RecoverableErrorType::CONNECTION_REFUSED);
    EXPECT_EQ(error_recovery_->classifyError(std::runtime_error("something odd")), RecoverableErrorType::CUSTOM);
}

TEST(RetryContextTest, DelaysGrowExponentiallyAndAreCapped) {
    RetryConfig config;
    config.max_attempts = 5;
    config.initial_delay = 100ms;
    config.max_delay = 300ms;
    config.backoff_multiplier = 2.0;
    config.enable_jitter = false;

    RetryContext context("op", config);
    EXPECT_EQ(context.getNextDelay(), 0ms);
    context.recordAttempt(RecoverableErrorType::HTTP_5XX, "500");
    EXPECT_EQ(context.getNextDelay(), 100ms);
    context.recordAttempt(RecoverableErrorType::HTTP_5XX, "500");
    EXPECT_EQ(context.getNextDelay(), 200ms);
    context.recordAttempt(RecoverableErrorType::HTTP_5XX, "500");
    EXPECT_EQ(context.getNextDelay(), 300ms);
    EXPECT_TRUE(context.canRetry());
    context.recordAttempt(RecoverableErrorType::HTTP_5XX, "500");
    context.recordAttempt(RecoverableErrorType::HTTP_5XX, "500");
    EXPECT_FALSE(context.canRetry());
}

TEST(ErrorRecoveryUtilsTest, ClassifiesHttpStatusCodes) {
    EXPECT_EQ(ErrorRecoveryUtils::classifyHttpError(500), RecoverableErrorType::HTTP_5XX);
    EXPECT_EQ(ErrorRecoveryUtils::classifyHttpError(503), RecoverableErrorType::TEMPORARY_FAILURE);
    EXPECT_EQ(ErrorRecoveryUtils::classifyHttpError(429), RecoverableErrorType::HTTP_429);
    EXPECT_EQ(ErrorRecoveryUtils::classifyHttpError(404), RecoverableErrorType::CUSTOM);

    auto http = ErrorRecoveryUtils::createHttpRetryConfig();
    EXPECT_EQ(http.max_attempts, 5u);
    EXPECT_TRUE(http.recoverable_errors.count(RecoverableErrorType::HTTP_429));
    EXPECT_STREQ(ErrorRecoveryUtils::errorTypeToString(RecoverableErrorType::HTTP_5XX), "http_5xx");
}
