#include "error_classifier.hpp"
#include "contract_errors.hpp"
#include "test_support.hpp"
#include <gtest/gtest.h>
#include <thread>

using namespace std::chrono;
using test_support::SimulatedEnvironment;

TEST(ErrorClassifierTest, ParsesCustomCode) {
    auto result = ErrorClassifier::classify(
        "Transaction simulation failed: Error processing Instruction 0: custom program error: Custom(1015)");
    EXPECT_EQ(result.kind, ErrorKind::InsufficientFunds);
    ASSERT_TRUE(result.code.has_value());
    EXPECT_EQ(*result.code, 1015);
    EXPECT_TRUE(result.recovered);
}

TEST(ErrorClassifierTest, ParsesHexWithDecimalCode) {
    auto result = ErrorClassifier::classify("custom program error: 0x3fe (1022)");
    ASSERT_TRUE(result.code.has_value());
    EXPECT_EQ(*result.code, 1022);
    EXPECT_EQ(result.kind, ErrorKind::Unknown);
}

TEST(ErrorClassifierTest, MapsRecoverableCodes) {
    EXPECT_EQ(ErrorClassifier::kind_for_code(1004), ErrorKind::SystemPaused);
    EXPECT_EQ(ErrorClassifier::kind_for_code(1005), ErrorKind::PoolPaused);
    EXPECT_EQ(ErrorClassifier::kind_for_code(1014), ErrorKind::InvalidTokenAccount);
    EXPECT_EQ(ErrorClassifier::kind_for_code(1020), ErrorKind::InsufficientLiquidity);
    EXPECT_EQ(ErrorClassifier::kind_for_code(1021), ErrorKind::InvalidLpTokenType);
    EXPECT_EQ(ErrorClassifier::kind_for_code(1026), ErrorKind::SlippageExceeded);
    EXPECT_EQ(ErrorClassifier::kind_for_code(1030), ErrorKind::PoolSwapsPaused);
    EXPECT_EQ(ErrorClassifier::kind_for_code(1042), ErrorKind::Unknown);
}

TEST(ErrorClassifierTest, UnparseableMessageIsUnknownWithoutCode) {
    auto result = ErrorClassifier::classify("connection reset by peer");
    EXPECT_EQ(result.kind, ErrorKind::Unknown);
    EXPECT_FALSE(result.code.has_value());
    EXPECT_FALSE(result.recovered);
}

TEST(ErrorClassifierTest, ProgramLogRoundTrips) {
    auto result = ErrorClassifier::classify(contract_error::program_log(contract_error::PoolPaused));
    EXPECT_EQ(result.kind, ErrorKind::PoolPaused);
}

class ErrorRecoveryTest : public ::testing::Test {
protected:
    void SetUp() override {
        policy_ = test_support::fast_pool_options().recovery;
        context_.worker_id = "deposit_test";
        context_.kind = WorkerKind::Deposit;
        context_.pool_id = env_.pool.pool_id;
        context_.wallet = env_.chain.generate_wallet();
        context_.mint_authority = env_.core;
    }

    ErrorClassification classified(int code) {
        return ErrorClassifier::classify(contract_error::program_log(code));
    }

    SimulatedEnvironment env_;
    RecoveryPolicy policy_;
    WorkerContext context_;
    CancellationSource source_;
};

TEST_F(ErrorRecoveryTest, PoolPauseRetriesOnceUnpaused) {
    env_.chain.set_pool_paused(env_.pool.pool_id, true);
    std::thread unpause([this]() {
        std::this_thread::sleep_for(milliseconds(50));
        env_.chain.set_pool_paused(env_.pool.pool_id, false);
    });

    ErrorRecovery recovery(env_.chain, policy_);
    auto outcome = recovery.handle(classified(contract_error::PoolPaused), context_, source_.token());
    unpause.join();

    EXPECT_EQ(outcome.verdict, RecoveryVerdict::Retry);
    EXPECT_FALSE(outcome.error_to_record.has_value());
}

TEST_F(ErrorRecoveryTest, PoolPauseFailsAfterPollCap) {
    env_.chain.set_pool_paused(env_.pool.pool_id, true);
    policy_.pool_pause_max_polls = 3;

    ErrorRecovery recovery(env_.chain, policy_);
    auto outcome = recovery.handle(classified(contract_error::PoolPaused), context_, source_.token());

    EXPECT_EQ(outcome.verdict, RecoveryVerdict::Fail);
    ASSERT_TRUE(outcome.error_to_record.has_value());
    EXPECT_NE(outcome.error_to_record->find("unpause"), std::string::npos);
    EXPECT_EQ(env_.chain.call_count("is_pool_paused"), 4u);
}

TEST_F(ErrorRecoveryTest, CancellationInterruptsLongPoll) {
    env_.chain.set_system_paused(true);
    policy_.poll_interval = seconds(30);

    std::thread canceller([this]() {
        std::this_thread::sleep_for(milliseconds(50));
        source_.cancel();
    });

    auto started = steady_clock::now();
    ErrorRecovery recovery(env_.chain, policy_);
    auto outcome = recovery.handle(classified(contract_error::SystemPaused), context_, source_.token());
    canceller.join();

    EXPECT_EQ(outcome.verdict, RecoveryVerdict::Cancelled);
    EXPECT_LT(steady_clock::now() - started, seconds(5));
}

TEST_F(ErrorRecoveryTest, SlippageGrowsToleranceUpToCap) {
    ErrorRecovery recovery(env_.chain, policy_);
    auto outcome = recovery.handle(classified(contract_error::SlippageExceeded), context_, source_.token());

    EXPECT_EQ(outcome.verdict, RecoveryVerdict::Retry);
    EXPECT_DOUBLE_EQ(context_.slippage_tolerance, 0.015);

    for (int i = 0; i < 10; ++i) {
        recovery.handle(classified(contract_error::SlippageExceeded), context_, source_.token());
    }
    EXPECT_DOUBLE_EQ(context_.slippage_tolerance, 0.1);
}

TEST_F(ErrorRecoveryTest, UnknownErrorRetriesThenFails) {
    ErrorRecovery recovery(env_.chain, policy_);
    auto unknown = ErrorClassifier::classify("socket closed");

    for (int i = 1; i <= policy_.unknown_error_max_retries; ++i) {
        auto outcome = recovery.handle(unknown, context_, source_.token());
        EXPECT_EQ(outcome.verdict, RecoveryVerdict::Retry);
        EXPECT_EQ(context_.retry_count, i);
    }

    auto outcome = recovery.handle(unknown, context_, source_.token());
    EXPECT_EQ(outcome.verdict, RecoveryVerdict::Fail);
    ASSERT_TRUE(outcome.error_to_record.has_value());
    EXPECT_EQ(context_.retry_count, 0);
}

TEST_F(ErrorRecoveryTest, InsufficientFundsRefillsWhenEnabled) {
    context_.auto_refill = true;
    context_.initial_amount = 500000;

    ErrorRecovery recovery(env_.chain, policy_);
    auto outcome = recovery.handle(classified(contract_error::InsufficientFunds), context_, source_.token());

    EXPECT_EQ(outcome.verdict, RecoveryVerdict::Retry);
    EXPECT_EQ(env_.chain.get_token_balance(context_.wallet.public_key, env_.pool.token_a_mint), 500000u);
}

TEST_F(ErrorRecoveryTest, InsufficientFundsWithoutRefillJustWaits) {
    ErrorRecovery recovery(env_.chain, policy_);
    auto outcome = recovery.handle(classified(contract_error::InsufficientFunds), context_, source_.token());

    EXPECT_EQ(outcome.verdict, RecoveryVerdict::Retry);
    EXPECT_EQ(env_.chain.call_count("mint_tokens"), 0u);
}

TEST_F(ErrorRecoveryTest, ConfigurationErrorsFailImmediately) {
    ErrorRecovery recovery(env_.chain, policy_);
    auto outcome = recovery.handle(classified(contract_error::InvalidTokenAccount), context_, source_.token());
    EXPECT_EQ(outcome.verdict, RecoveryVerdict::Fail);
    EXPECT_TRUE(outcome.error_to_record.has_value());
}

TEST_F(ErrorRecoveryTest, LiquidityErrorOnDepositFails) {
    ErrorRecovery recovery(env_.chain, policy_);
    auto outcome = recovery.handle(classified(contract_error::InsufficientLiquidity), context_, source_.token());
    EXPECT_EQ(outcome.verdict, RecoveryVerdict::Fail);

    context_.kind = WorkerKind::Withdrawal;
    outcome = recovery.handle(classified(contract_error::InsufficientLiquidity), context_, source_.token());
    EXPECT_EQ(outcome.verdict, RecoveryVerdict::Retry);
}

TEST_F(ErrorRecoveryTest, SwapsPausedOnlyBlocksSwapWorkers) {
    env_.chain.set_swaps_paused(env_.pool.pool_id, true);
    ErrorRecovery recovery(env_.chain, policy_);

    auto outcome = recovery.handle(classified(contract_error::PoolSwapsPaused), context_, source_.token());
    EXPECT_EQ(outcome.verdict, RecoveryVerdict::Fail);
    EXPECT_FALSE(outcome.error_to_record.has_value());
    EXPECT_EQ(env_.chain.call_count("are_swaps_paused"), 0u);
}

TEST_F(ErrorRecoveryTest, SwapWorkerPollsSwapPauseUntilCap) {
    env_.chain.set_swaps_paused(env_.pool.pool_id, true);
    context_.kind = WorkerKind::Swap;
    context_.swap_direction = SwapDirection::AToB;
    policy_.poll_interval = milliseconds(1);
    ASSERT_EQ(policy_.swaps_pause_max_polls, 60);

    ErrorRecovery recovery(env_.chain, policy_);
    auto outcome = recovery.handle(classified(contract_error::PoolSwapsPaused), context_, source_.token());

    EXPECT_EQ(outcome.verdict, RecoveryVerdict::Fail);
    ASSERT_TRUE(outcome.error_to_record.has_value());
    EXPECT_NE(outcome.error_to_record->find("swaps on pool"), std::string::npos);
    EXPECT_EQ(env_.chain.call_count("are_swaps_paused"), 61u);
}

TEST_F(ErrorRecoveryTest, SwapWorkerRetriesWhenSwapsResume) {
    env_.chain.set_swaps_paused(env_.pool.pool_id, true);
    context_.kind = WorkerKind::Swap;
    context_.swap_direction = SwapDirection::BToA;
    std::thread resume([this]() {
        std::this_thread::sleep_for(milliseconds(50));
        env_.chain.set_swaps_paused(env_.pool.pool_id, false);
    });

    ErrorRecovery recovery(env_.chain, policy_);
    auto outcome = recovery.handle(classified(contract_error::PoolSwapsPaused), context_, source_.token());
    resume.join();

    EXPECT_EQ(outcome.verdict, RecoveryVerdict::Retry);
    EXPECT_FALSE(outcome.error_to_record.has_value());
}

TEST_F(ErrorRecoveryTest, SystemPauseFailsAfterDefaultCap) {
    env_.chain.set_system_paused(true);
    policy_.poll_interval = milliseconds(1);
    ASSERT_EQ(policy_.system_pause_max_polls, 240);

    ErrorRecovery recovery(env_.chain, policy_);
    auto outcome = recovery.handle(classified(contract_error::SystemPaused), context_, source_.token());

    EXPECT_EQ(outcome.verdict, RecoveryVerdict::Fail);
    ASSERT_TRUE(outcome.error_to_record.has_value());
    EXPECT_NE(outcome.error_to_record->find("system"), std::string::npos);
    EXPECT_EQ(env_.chain.call_count("is_system_paused"), 241u);
}

TEST_F(ErrorRecoveryTest, CancelledTokenShortCircuits) {
    source_.cancel();
    ErrorRecovery recovery(env_.chain, policy_);
    auto outcome = recovery.handle(classified(contract_error::SlippageExceeded), context_, source_.token());
    EXPECT_EQ(outcome.verdict, RecoveryVerdict::Cancelled);
}
