#include "simulated_chain_client.hpp"
#include "error_classifier.hpp"
#include "contract_errors.hpp"
#include "test_support.hpp"
#include <gtest/gtest.h>

using test_support::SimulatedEnvironment;

class SimulatedChainClientTest : public ::testing::Test {
protected:
    void SetUp() override {
        trader_ = env_.chain.generate_wallet();
        env_.chain.request_airdrop(trader_.public_key, kLamportsPerSol);
        env_.chain.mint_tokens(env_.core, env_.pool.token_a_mint, trader_.public_key, 1000000);
    }

    SimulatedEnvironment env_;
    WalletCredential trader_;
};

TEST_F(SimulatedChainClientTest, GeneratedWalletRestores) {
    auto restored = env_.chain.restore_wallet(trader_.secret_key);
    EXPECT_EQ(restored.public_key, trader_.public_key);
    EXPECT_THROW(env_.chain.restore_wallet("not-a-key"), ChainError);
}

TEST_F(SimulatedChainClientTest, DepositMovesTokensIntoPoolForLp) {
    auto result = env_.chain.deposit(trader_, env_.pool.pool_id, TokenSide::A, 400000, 310000);

    EXPECT_EQ(result.input_amount, 400000u);
    EXPECT_EQ(result.output_amount, 400000u);
    EXPECT_FALSE(result.signature.empty());
    EXPECT_TRUE(env_.chain.confirm_transaction(result.signature, std::chrono::milliseconds(10)));
    EXPECT_EQ(env_.chain.get_token_balance(trader_.public_key, env_.pool.token_a_mint), 600000u);
    EXPECT_EQ(env_.chain.get_token_balance(trader_.public_key, env_.pool.lp_mint_a), 400000u);
    EXPECT_EQ(env_.chain.pool_reserve(env_.pool.pool_id, TokenSide::A), 400000u);
}

TEST_F(SimulatedChainClientTest, SwapEnforcesMinimumOutput) {
    // Liquidity on the B side
    auto provider = env_.chain.generate_wallet();
    env_.chain.request_airdrop(provider.public_key, kLamportsPerSol);
    env_.chain.mint_tokens(env_.core, env_.pool.token_b_mint, provider.public_key, 1000000000000ULL);
    env_.chain.deposit(provider, env_.pool.pool_id, TokenSide::B, 1000000000000ULL, 310000);

    uint64_t expected = env_.pool.swap_output(SwapDirection::AToB, 1000);
    auto result = env_.chain.swap(trader_, env_.pool.pool_id, SwapDirection::AToB, 1000, expected, 250000);
    EXPECT_EQ(result.output_amount, expected);

    try {
        env_.chain.swap(trader_, env_.pool.pool_id, SwapDirection::AToB, 1000, expected + 1, 250000);
        FAIL() << "expected slippage failure";
    } catch (const ChainError& e) {
        EXPECT_EQ(ErrorClassifier::classify(e.what()).kind, ErrorKind::SlippageExceeded);
    }
}

TEST_F(SimulatedChainClientTest, PauseFlagsSurfaceAsContractErrors) {
    env_.chain.set_pool_paused(env_.pool.pool_id, true);
    try {
        env_.chain.deposit(trader_, env_.pool.pool_id, TokenSide::A, 10, 310000);
        FAIL() << "expected pool paused";
    } catch (const ChainError& e) {
        auto classification = ErrorClassifier::classify(e.what());
        EXPECT_EQ(classification.kind, ErrorKind::PoolPaused);
        EXPECT_EQ(*classification.code, contract_error::PoolPaused);
    }
    EXPECT_TRUE(env_.chain.is_pool_paused(env_.pool.pool_id));
}

TEST_F(SimulatedChainClientTest, MintRequiresAuthority) {
    try {
        env_.chain.mint_tokens(trader_, env_.pool.token_a_mint, trader_.public_key, 1);
        FAIL() << "expected mint authority failure";
    } catch (const ChainError& e) {
        EXPECT_EQ(*ErrorClassifier::classify(e.what()).code, contract_error::InvalidMintAuthority);
    }
}

TEST_F(SimulatedChainClientTest, ScriptedFailuresAreConsumedInOrder) {
    env_.chain.fail_next_with_code("get_pool_state", contract_error::SystemPaused, 2);

    EXPECT_THROW(env_.chain.get_pool_state(env_.pool.pool_id), ChainError);
    EXPECT_THROW(env_.chain.get_pool_state(env_.pool.pool_id), ChainError);
    EXPECT_NO_THROW(env_.chain.get_pool_state(env_.pool.pool_id));
    EXPECT_GE(env_.chain.call_count("get_pool_state"), 3u);
}

TEST_F(SimulatedChainClientTest, UnfundedWalletCannotPayFees) {
    auto pauper = env_.chain.generate_wallet();
    EXPECT_THROW(env_.chain.transfer_native(pauper, trader_.public_key, 1), ChainError);
}
