#include "sqlite_state_store.hpp"
#include "test_support.hpp"
#include <gtest/gtest.h>
#include <filesystem>

class SqliteStateStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        db_path_ = test_support::temp_db_path("store");
        store_ = std::make_unique<SqliteStateStore>(db_path_.string());
    }

    void TearDown() override {
        store_.reset();
        std::error_code ec;
        std::filesystem::remove_all(db_path_.parent_path(), ec);
    }

    static WorkerConfig sample_worker(const std::string& id) {
        WorkerConfig config;
        config.worker_id = id;
        config.kind = WorkerKind::Deposit;
        config.pool_id = "pool-1";
        config.token_side = TokenSide::B;
        config.wallet.public_key = "pub-" + id;
        config.wallet.secret_key = "secret-" + id;
        config.initial_amount = 1000000;
        config.created_at = std::chrono::system_clock::now();
        return config;
    }

    std::filesystem::path db_path_;
    std::unique_ptr<SqliteStateStore> store_;
};

TEST_F(SqliteStateStoreTest, PersistsAndReloadsWorkers) {
    store_->save_worker(sample_worker("deposit_a"));
    auto config = sample_worker("deposit_a");
    config.status = WorkerStatus::Running;
    store_->save_worker(config);

    // Reopen to prove the data is on disk
    store_ = std::make_unique<SqliteStateStore>(db_path_.string());
    auto workers = store_->load_workers();
    ASSERT_EQ(workers.size(), 1u);
    EXPECT_EQ(workers[0].worker_id, "deposit_a");
    EXPECT_EQ(workers[0].status, WorkerStatus::Running);
    EXPECT_EQ(workers[0].token_side, TokenSide::B);
    EXPECT_EQ(workers[0].wallet.secret_key, "secret-deposit_a");

    EXPECT_TRUE(store_->load_worker("deposit_a").has_value());
    EXPECT_FALSE(store_->load_worker("missing").has_value());
}

TEST_F(SqliteStateStoreTest, DeleteRemovesStatisticsAndErrors) {
    store_->save_worker(sample_worker("deposit_b"));

    WorkerStatistics stats;
    stats.successful_operations = 4;
    stats.failed_operations = 1;
    stats.total_volume_processed = 12345;
    store_->save_statistics("deposit_b", stats);

    WorkerError error;
    error.timestamp = std::chrono::system_clock::now();
    error.message = "boom";
    error.operation_type = "deposit";
    store_->append_error("deposit_b", error);

    auto loaded = store_->load_statistics("deposit_b");
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->successful_operations, 4u);
    EXPECT_EQ(loaded->total_volume_processed, 12345u);
    EXPECT_EQ(store_->load_errors("deposit_b", 10).size(), 1u);

    store_->delete_worker("deposit_b");
    EXPECT_FALSE(store_->load_worker("deposit_b").has_value());
    EXPECT_FALSE(store_->load_statistics("deposit_b").has_value());
    EXPECT_TRUE(store_->load_errors("deposit_b", 10).empty());
}

TEST_F(SqliteStateStoreTest, ErrorsComeBackNewestFirstWithLimit) {
    for (int i = 0; i < 5; ++i) {
        WorkerError error;
        error.timestamp = std::chrono::system_clock::now();
        error.message = "error " + std::to_string(i);
        error.operation_type = "swap";
        store_->append_error("swap_x", error);
    }

    auto errors = store_->load_errors("swap_x", 3);
    ASSERT_EQ(errors.size(), 3u);
    EXPECT_EQ(errors[0].message, "error 4");
    EXPECT_EQ(errors[2].message, "error 2");
}

TEST_F(SqliteStateStoreTest, PoolRegistryAndCoreWallet) {
    PoolRegistryEntry entry;
    entry.pool_id = "pool-xyz";
    entry.ratio.token_a_mint = "mint-a";
    entry.ratio.token_b_mint = "mint-b";
    entry.ratio.ratio_a_numerator = 1000000000ULL;
    entry.ratio.ratio_b_denominator = 2000000ULL;
    entry.ratio.pool_id = "pool-xyz";
    entry.token_b_decimals = 6;
    entry.created_at = std::chrono::system_clock::now();
    store_->save_pool(entry);

    auto pools = store_->load_pools();
    ASSERT_EQ(pools.size(), 1u);
    EXPECT_EQ(pools[0].ratio, entry.ratio);
    EXPECT_EQ(pools[0].token_b_decimals, 6);

    store_->delete_pool("pool-xyz");
    EXPECT_TRUE(store_->load_pools().empty());

    EXPECT_FALSE(store_->load_core_wallet().has_value());
    CoreWallet wallet;
    wallet.credential.public_key = "core-pub";
    wallet.credential.secret_key = "core-secret";
    wallet.created_at = std::chrono::system_clock::now();
    store_->save_core_wallet(wallet);

    auto loaded = store_->load_core_wallet();
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->credential.public_key, "core-pub");
    EXPECT_EQ(loaded->credential.secret_key, "core-secret");
    EXPECT_TRUE(store_->is_healthy());
}
