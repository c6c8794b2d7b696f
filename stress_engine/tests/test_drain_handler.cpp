#include "drain_handler.hpp"
#include "contract_errors.hpp"
#include "test_support.hpp"
#include <gtest/gtest.h>

using test_support::SimulatedEnvironment;
using test_support::wait_until;

class DrainHandlerTest : public ::testing::Test {
protected:
    DrainHandlerTest() : drainer_(*env_.workers, env_.chain, DrainOptions{}) {}

    // Gives the worker a wallet with native funds and `tokens` of `mint`
    void fund(const std::string& worker_id, const std::string& mint, uint64_t tokens) {
        auto owner = env_.workers->get_config(worker_id).wallet.public_key;
        env_.chain.request_airdrop(owner, kLamportsPerSol);
        if (tokens > 0) {
            env_.chain.mint_tokens(env_.core, mint, owner, tokens);
        }
    }

    SimulatedEnvironment env_;
    DrainHandler drainer_;
};

TEST_F(DrainHandlerTest, NothingToDrainSkipsBurnAndOperation) {
    auto id = env_.create_worker(WorkerKind::Deposit);

    auto result = drainer_.drain(id);

    EXPECT_TRUE(result.nothing_to_drain);
    EXPECT_EQ(result.burned_amount, 0u);
    EXPECT_FALSE(result.operation_attempted);
    EXPECT_EQ(env_.chain.call_count("transfer_tokens"), 0u);
    EXPECT_EQ(env_.chain.call_count("deposit"), 0u);
}

TEST_F(DrainHandlerTest, BurnStandsWhenTerminalOperationFails) {
    auto id = env_.create_worker(WorkerKind::Deposit);
    fund(id, env_.pool.token_a_mint, 400000);
    auto owner = env_.workers->get_config(id).wallet.public_key;

    auto result = drainer_.drain(id);

    EXPECT_FALSE(result.nothing_to_drain);
    EXPECT_EQ(result.burned_amount, 400000u);
    EXPECT_FALSE(result.burn_signature.empty());
    EXPECT_TRUE(result.operation_attempted);
    EXPECT_FALSE(result.operation_succeeded);
    EXPECT_NE(result.operation_error.find("Custom(" + std::to_string(contract_error::InsufficientFunds) + ")"),
              std::string::npos);
    EXPECT_EQ(env_.chain.get_token_balance(owner, env_.pool.token_a_mint), 0u);
    EXPECT_EQ(env_.chain.get_token_balance(kBurnAddress, env_.pool.token_a_mint), 400000u);
}

TEST_F(DrainHandlerTest, ScriptedOperationFailureIsReported) {
    auto id = env_.create_worker(WorkerKind::Deposit);
    fund(id, env_.pool.token_a_mint, 1000);
    env_.chain.fail_next_with_code("deposit", contract_error::PoolPaused);

    auto result = drainer_.drain(id);

    EXPECT_EQ(result.burned_amount, 1000u);
    EXPECT_FALSE(result.operation_succeeded);
    EXPECT_NE(result.operation_error.find("Custom(1005)"), std::string::npos);
}

TEST_F(DrainHandlerTest, SweepsNativeBackLeavingFeeReserve) {
    auto id = env_.create_worker(WorkerKind::Deposit);
    fund(id, env_.pool.token_a_mint, 5000);
    auto owner = env_.workers->get_config(id).wallet.public_key;
    uint64_t core_before = env_.chain.get_native_balance(env_.core.public_key);

    auto result = drainer_.drain(id);

    EXPECT_GT(result.swept_lamports, 0u);
    EXPECT_TRUE(result.sweep_error.empty());
    EXPECT_EQ(env_.chain.get_native_balance(env_.core.public_key), core_before + result.swept_lamports);
    // Reserve covered the sweep's own fee
    EXPECT_EQ(env_.chain.get_native_balance(owner), 0u);
}

TEST_F(DrainHandlerTest, SweepFailureDoesNotChangeOutcome) {
    auto id = env_.create_worker(WorkerKind::Deposit);
    fund(id, env_.pool.token_a_mint, 5000);
    env_.chain.fail_next("transfer_native", "blockhash not found");

    auto result = drainer_.drain(id);

    EXPECT_EQ(result.burned_amount, 5000u);
    EXPECT_TRUE(result.operation_attempted);
    EXPECT_EQ(result.swept_lamports, 0u);
    EXPECT_EQ(result.sweep_error, "blockhash not found");
}

TEST_F(DrainHandlerTest, WithdrawalDrainBurnsLpTokens) {
    auto id = env_.create_worker(WorkerKind::Withdrawal, 0, TokenSide::B);
    auto owner = env_.workers->get_config(id).wallet.public_key;
    fund(id, env_.pool.token_b_mint, 20000);
    auto wallet = env_.workers->get_config(id).wallet;
    env_.chain.deposit(wallet, env_.pool.pool_id, TokenSide::B, 20000, 310000);

    auto result = drainer_.drain(id);

    EXPECT_EQ(result.burned_amount, 20000u);
    EXPECT_EQ(env_.chain.get_token_balance(owner, env_.pool.lp_mint_b), 0u);
    EXPECT_EQ(env_.chain.get_token_balance(kBurnAddress, env_.pool.lp_mint_b), 20000u);
    EXPECT_FALSE(result.operation_succeeded);
}

TEST_F(DrainHandlerTest, RunningWorkerIsStoppedFirst) {
    auto id = env_.create_worker(WorkerKind::Deposit);
    env_.workers->start(id);
    ASSERT_TRUE(wait_until([&] { return env_.workers->get_statistics(id).attempted_operations() >= 1; }));

    auto result = drainer_.drain(id);

    EXPECT_FALSE(env_.workers->is_running(id));
    EXPECT_EQ(env_.workers->get_config(id).status, WorkerStatus::Stopped);
    EXPECT_GT(result.burned_amount, 0u);
}

TEST_F(DrainHandlerTest, SuccessfulOperationOutputIsBurned) {
    auto id = env_.create_worker(WorkerKind::Deposit);
    fund(id, env_.pool.token_a_mint, 500000);
    auto owner = env_.workers->get_config(id).wallet.public_key;

    // Re-credit the first burn so the deposit has tokens to spend
    bool refunded = false;
    env_.chain.after_transfer = [&](const WalletCredential& from, const std::string& destination,
                                    const std::string& mint, uint64_t amount) {
        if (!refunded && destination == kBurnAddress) {
            refunded = true;
            env_.chain.mint_tokens(env_.core, mint, from.public_key, amount);
        }
    };

    auto result = drainer_.drain(id);
    env_.chain.after_transfer = nullptr;

    EXPECT_EQ(result.burned_amount, 500000u);
    EXPECT_TRUE(result.operation_succeeded) << result.operation_error;
    EXPECT_TRUE(result.operation_error.empty());
    EXPECT_GT(result.operation_output, 0u);
    EXPECT_EQ(result.burned_output, result.operation_output);
    EXPECT_TRUE(result.output_burn_error.empty());
    EXPECT_EQ(env_.chain.get_token_balance(owner, env_.pool.lp_mint_a), 0u);
    EXPECT_EQ(env_.chain.get_token_balance(kBurnAddress, env_.pool.lp_mint_a), result.burned_output);
}

TEST_F(DrainHandlerTest, OutputBurnFailureIsReportedSeparately) {
    auto id = env_.create_worker(WorkerKind::Deposit);
    fund(id, env_.pool.token_a_mint, 500000);
    auto owner = env_.workers->get_config(id).wallet.public_key;

    bool refunded = false;
    env_.chain.after_transfer = [&](const WalletCredential& from, const std::string& destination,
                                    const std::string& mint, uint64_t amount) {
        if (!refunded && destination == kBurnAddress) {
            refunded = true;
            env_.chain.mint_tokens(env_.core, mint, from.public_key, amount);
            env_.chain.fail_next("transfer_tokens", "Blockhash not found");
        }
    };

    auto result = drainer_.drain(id);
    env_.chain.after_transfer = nullptr;

    EXPECT_TRUE(result.operation_succeeded);
    EXPECT_TRUE(result.operation_error.empty());
    EXPECT_EQ(result.burned_output, 0u);
    EXPECT_EQ(result.output_burn_error, "Blockhash not found");
    EXPECT_EQ(env_.chain.get_token_balance(owner, env_.pool.lp_mint_a), result.operation_output);
    EXPECT_EQ(result.to_json()["output_burn_error"], "Blockhash not found");
}
