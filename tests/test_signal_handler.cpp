// EN: Unit tests for SignalHandler (graceful cancellation of active runs)
// FR: Tests unitaires pour SignalHandler (annulation propre des runs actifs)

#include <gtest/gtest.h>
#include "infrastructure/system/signal_handler.hpp"
#include "infrastructure/logging/logger.hpp"

#include <atomic>
#include <chrono>
#include <stdexcept>

#include <signal.h>

using namespace CDO;
using namespace std::chrono_literals;

// EN: Test fixture for SignalHandler tests
// FR: Fixture de test pour les tests SignalHandler
class SignalHandlerTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::getInstance().setConsoleOutput(false);
        signal_handler_ = &SignalHandler::getInstance();
        signal_handler_->reset();
        signal_handler_->setEnabled(true);
        signal_handler_->configure(SignalHandlerConfig{});
    }

    void TearDown() override {
        signal_handler_->reset();
    }

    SignalHandler* signal_handler_{nullptr};
};

TEST_F(SignalHandlerTest, SingletonPattern) {
    EXPECT_EQ(&SignalHandler::getInstance(), signal_handler_);
    EXPECT_FALSE(signal_handler_->isShutdownRequested());
    EXPECT_FALSE(signal_handler_->isShuttingDown());
}

TEST_F(SignalHandlerTest, ManualShutdownRunsCallbacks) {
    std::atomic<int> cancelled_runs{0};
    signal_handler_->registerCleanupCallback("cancel-runs", [&cancelled_runs]() { cancelled_runs += 3; });
    signal_handler_->registerCleanupCallback("flush-logs", []() { Logger::getInstance().flush(); });

    signal_handler_->triggerShutdown(SIGINT);

    ASSERT_TRUE(signal_handler_->waitForShutdown(2000ms));
    EXPECT_TRUE(signal_handler_->isShutdownRequested());
    EXPECT_EQ(cancelled_runs.load(), 3);

    auto stats = signal_handler_->getStats();
    EXPECT_EQ(stats.signals_received, 1u);
    EXPECT_EQ(stats.signal_counts[SIGINT], 1u);
    EXPECT_EQ(stats.successful_shutdowns, 1u);
    EXPECT_EQ(stats.cleanup_callbacks_registered, 2u);
}

TEST_F(SignalHandlerTest, UnregisteredCallbackIsNotCalled) {
    std::atomic<bool> called{false};
    signal_handler_->registerCleanupCallback("cancel-runs", [&called]() { called = true; });
    signal_handler_->unregisterCleanupCallback("cancel-runs");
    signal_handler_->unregisterCleanupCallback("never-registered");

    signal_handler_->triggerShutdown();
    ASSERT_TRUE(signal_handler_->waitForShutdown(2000ms));
    EXPECT_FALSE(called.load());
    EXPECT_EQ(signal_handler_->getStats().cleanup_callbacks_registered, 0u);
}

// EN: A throwing callback is counted and the others still run
// FR: Un callback qui lève est compté et les autres s'exécutent quand même
TEST_F(SignalHandlerTest, FailingCallbackDoesNotStopOthers) {
    std::atomic<bool> second_called{false};
    signal_handler_->registerCleanupCallback("broken", []() { throw std::runtime_error("boom"); });
    signal_handler_->registerCleanupCallback("healthy", [&second_called]() { second_called = true; });

    signal_handler_->triggerShutdown();
    ASSERT_TRUE(signal_handler_->waitForShutdown(2000ms));
    EXPECT_TRUE(second_called.load());
    EXPECT_EQ(signal_handler_->getStats().failed_callbacks, 1u);
}

TEST_F(SignalHandlerTest, SecondSignalDuringShutdownIsIgnored) {
    std::atomic<int> calls{0};
    signal_handler_->registerCleanupCallback("cancel-runs", [&calls]() {
        calls++;
        std::this_thread::sleep_for(50ms);
    });

    signal_handler_->triggerShutdown(SIGTERM);
    signal_handler_->triggerShutdown(SIGTERM);
    ASSERT_TRUE(signal_handler_->waitForShutdown(2000ms));

    EXPECT_EQ(calls.load(), 1);
    EXPECT_EQ(signal_handler_->getStats().signals_received, 2u);
}

TEST_F(SignalHandlerTest, ResetClearsShutdownState) {
    signal_handler_->triggerShutdown();
    ASSERT_TRUE(signal_handler_->waitForShutdown(2000ms));

    signal_handler_->reset();
    EXPECT_FALSE(signal_handler_->isShutdownRequested());
    EXPECT_FALSE(signal_handler_->waitForShutdown(10ms));
    EXPECT_EQ(signal_handler_->getStats().signals_received, 0u);
}

TEST_F(SignalHandlerTest, RealSignalIsDeliveredToCallbacks) {
    std::atomic<bool> called{false};
    signal_handler_->initialize();
    signal_handler_->registerCleanupCallback("cancel-runs", [&called]() { called = true; });

    ASSERT_EQ(::raise(SIGTERM), 0);

    ASSERT_TRUE(signal_handler_->waitForShutdown(2000ms));
    EXPECT_TRUE(called.load());
    EXPECT_EQ(signal_handler_->getStats().signal_counts[SIGTERM], 1u);
}
