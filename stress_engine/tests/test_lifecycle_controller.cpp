#include "lifecycle_controller.hpp"
#include "startup_routines.hpp"
#include "test_support.hpp"
#include <gtest/gtest.h>
#include <atomic>

using test_support::SimulatedEnvironment;
using test_support::wait_until;

namespace {

class RecordingRoutine : public StartupRoutine {
public:
    RecordingRoutine(std::string name, std::vector<std::string>& journal, bool fail = false)
        : name_(std::move(name)), journal_(journal), fail_(fail) {}

    std::string name() const override { return name_; }

    void start() override {
        if (fail_) {
            throw std::runtime_error(name_ + " refused to start");
        }
        journal_.push_back("start " + name_);
    }

    void stop() override { journal_.push_back("stop " + name_); }

private:
    std::string name_;
    std::vector<std::string>& journal_;
    bool fail_;
};

} // namespace

class LifecycleControllerTest : public ::testing::Test {
protected:
    LifecycleController::EngineFactory factory(bool fail_second = false) {
        return [this, fail_second]() {
            ++engines_built_;
            std::vector<std::unique_ptr<StartupRoutine>> routines;
            routines.push_back(std::make_unique<RecordingRoutine>("first", journal_));
            routines.push_back(std::make_unique<RecordingRoutine>("second", journal_, fail_second));
            routines.push_back(std::make_unique<RecordingRoutine>("third", journal_));
            return std::make_unique<StressEngine>(std::move(routines), *env_.workers);
        };
    }

    SimulatedEnvironment env_;
    std::vector<std::string> journal_;
    std::atomic<int> engines_built_{0};
};

TEST_F(LifecycleControllerTest, StartWhileStartedBuildsNoSecondEngine) {
    LifecycleController lifecycle(factory(), *env_.workers, env_.system_state);

    lifecycle.start();
    EXPECT_EQ(lifecycle.state(), ServiceState::Started);
    EXPECT_EQ(env_.system_state.service_state(), ServiceState::Started);

    lifecycle.start();
    EXPECT_EQ(engines_built_.load(), 1);
    EXPECT_EQ(lifecycle.state(), ServiceState::Started);

    std::vector<std::string> expected = {"start first", "start second", "start third"};
    EXPECT_EQ(journal_, expected);
}

TEST_F(LifecycleControllerTest, StopTwiceIsSafe) {
    LifecycleController lifecycle(factory(), *env_.workers, env_.system_state);
    lifecycle.start();

    lifecycle.stop();
    EXPECT_EQ(lifecycle.state(), ServiceState::Stopped);
    lifecycle.stop();
    EXPECT_EQ(lifecycle.state(), ServiceState::Stopped);

    // Routines stop in reverse order, exactly once
    std::vector<std::string> expected = {"start first", "start second", "start third",
                                         "stop third", "stop second", "stop first"};
    EXPECT_EQ(journal_, expected);
}

TEST_F(LifecycleControllerTest, FailedStartUnwindsAndEntersError) {
    LifecycleController lifecycle(factory(true), *env_.workers, env_.system_state);

    EXPECT_THROW(lifecycle.start(), std::runtime_error);
    EXPECT_EQ(lifecycle.state(), ServiceState::Error);
    EXPECT_EQ(env_.system_state.service_state(), ServiceState::Error);

    std::vector<std::string> expected = {"start first", "stop first"};
    EXPECT_EQ(journal_, expected);

    auto health = lifecycle.get_health();
    EXPECT_FALSE(health.healthy);
    EXPECT_FALSE(health.metrics["engine_exists"].get<bool>());
}

TEST_F(LifecycleControllerTest, StopClearsErrorBeforeRestart) {
    bool fail = true;
    LifecycleController lifecycle(
        [this, &fail]() {
            ++engines_built_;
            std::vector<std::unique_ptr<StartupRoutine>> routines;
            routines.push_back(std::make_unique<RecordingRoutine>("only", journal_, fail));
            return std::make_unique<StressEngine>(std::move(routines), *env_.workers);
        },
        *env_.workers, env_.system_state);

    EXPECT_THROW(lifecycle.start(), std::runtime_error);
    fail = false;

    // Start is only valid from Stopped
    lifecycle.start();
    EXPECT_EQ(lifecycle.state(), ServiceState::Error);
    EXPECT_EQ(engines_built_.load(), 1);

    lifecycle.stop();
    EXPECT_EQ(lifecycle.state(), ServiceState::Stopped);
    lifecycle.start();
    EXPECT_EQ(lifecycle.state(), ServiceState::Started);
    EXPECT_EQ(engines_built_.load(), 2);
}

TEST_F(LifecycleControllerTest, HealthWithoutEngineIsHealthyOnlyWhenStopped) {
    LifecycleController lifecycle(factory(), *env_.workers, env_.system_state);

    auto health = lifecycle.get_health();
    EXPECT_TRUE(health.healthy);
    EXPECT_EQ(health.status, "Stopped");

    lifecycle.start();
    health = lifecycle.get_health();
    EXPECT_TRUE(health.healthy);
    EXPECT_EQ(health.status, "Healthy");
    EXPECT_TRUE(health.metrics["engine_exists"].get<bool>());
}

TEST_F(LifecycleControllerTest, PauseAndResumeWorkers) {
    LifecycleController lifecycle(factory(), *env_.workers, env_.system_state);
    lifecycle.start();

    auto id = env_.create_worker(WorkerKind::Deposit);
    env_.workers->start(id);

    lifecycle.pause();
    EXPECT_EQ(lifecycle.state(), ServiceState::Paused);
    EXPECT_TRUE(env_.system_state.is_paused());
    EXPECT_EQ(env_.workers->get_config(id).status, WorkerStatus::Paused);
    EXPECT_FALSE(env_.workers->is_running(id));

    auto health = lifecycle.get_health();
    EXPECT_FALSE(health.healthy);
    EXPECT_EQ(health.status, "Paused");

    // Pause is only valid from Started
    lifecycle.pause();
    EXPECT_EQ(lifecycle.state(), ServiceState::Paused);

    lifecycle.resume();
    EXPECT_EQ(lifecycle.state(), ServiceState::Started);
    EXPECT_FALSE(env_.system_state.is_paused());
    EXPECT_TRUE(env_.workers->is_running(id));
    EXPECT_TRUE(wait_until([&] { return env_.workers->get_statistics(id).attempted_operations() >= 1; }));

    lifecycle.stop();
    EXPECT_FALSE(env_.workers->is_running(id));
    EXPECT_EQ(env_.workers->get_config(id).status, WorkerStatus::Stopped);
}

TEST_F(LifecycleControllerTest, NoWorkerStartsWithoutAnEngine) {
    LifecycleController lifecycle(factory(), *env_.workers, env_.system_state);
    auto id = env_.create_worker(WorkerKind::Deposit);

    lifecycle.start();
    EXPECT_TRUE(env_.workers->is_accepting());
    lifecycle.stop();
    EXPECT_FALSE(env_.workers->is_accepting());

    EXPECT_THROW(env_.workers->start(id), std::runtime_error);
    EXPECT_FALSE(env_.workers->is_running(id));
    EXPECT_EQ(env_.workers->get_config(id).status, WorkerStatus::Created);
    EXPECT_EQ(env_.workers->get_statistics(id).attempted_operations(), 0u);

    lifecycle.start();
    env_.workers->start(id);
    EXPECT_TRUE(env_.workers->is_running(id));
}

TEST_F(LifecycleControllerTest, FailedStartLeavesPoolClosed) {
    LifecycleController lifecycle(factory(true), *env_.workers, env_.system_state);
    auto id = env_.create_worker(WorkerKind::Deposit);

    EXPECT_THROW(lifecycle.start(), std::runtime_error);
    EXPECT_FALSE(env_.workers->is_accepting());
    EXPECT_THROW(env_.workers->start(id), std::runtime_error);
}

TEST_F(LifecycleControllerTest, ResumeIgnoredUnlessPaused) {
    LifecycleController lifecycle(factory(), *env_.workers, env_.system_state);
    lifecycle.resume();
    EXPECT_EQ(lifecycle.state(), ServiceState::Stopped);
}

TEST_F(LifecycleControllerTest, ObserversSeeEveryTransition) {
    LifecycleController lifecycle(factory(), *env_.workers, env_.system_state);
    std::vector<std::pair<ServiceState, ServiceState>> seen;
    lifecycle.on_state_changed([&seen](const StateChange& change) {
        seen.emplace_back(change.previous, change.current);
    });

    lifecycle.start();
    lifecycle.stop();

    std::vector<std::pair<ServiceState, ServiceState>> expected = {
        {ServiceState::Stopped, ServiceState::Starting},
        {ServiceState::Starting, ServiceState::Started},
        {ServiceState::Started, ServiceState::Stopping},
        {ServiceState::Stopping, ServiceState::Stopped},
    };
    EXPECT_EQ(seen, expected);
}

TEST_F(LifecycleControllerTest, EngineDegradedWhenMostWorkersFailed) {
    for (int i = 0; i < 3; ++i) {
        auto id = env_.create_worker(WorkerKind::Deposit);
        if (i < 2) {
            auto config = env_.workers->get_config(id);
            config.status = i == 0 ? WorkerStatus::Failed : WorkerStatus::Error;
            env_.store->save_worker(config);
        }
    }
    WorkerPool reloaded(env_.chain, *env_.store, env_.system_state, test_support::fast_pool_options());

    std::vector<std::unique_ptr<StartupRoutine>> routines;
    StressEngine engine(std::move(routines), reloaded);
    engine.start();

    auto health = engine.get_health();
    EXPECT_EQ(health.status, "Degraded");
    EXPECT_FALSE(health.healthy);
    EXPECT_EQ(health.metrics["workers_failed"].get<size_t>(), 2u);
    EXPECT_EQ(health.metrics["workers_total"].get<size_t>(), 3u);
}

TEST_F(LifecycleControllerTest, ContractVersionOutsideRangeBlocksStart) {
    env_.chain.set_contract_version("0.21.0");
    LifecycleController lifecycle(
        [this]() {
            std::vector<std::unique_ptr<StartupRoutine>> routines;
            routines.push_back(std::make_unique<ContractVersionStartup>(env_.chain, "0.15.0", "0.19.99"));
            return std::make_unique<StressEngine>(std::move(routines), *env_.workers);
        },
        *env_.workers, env_.system_state);

    EXPECT_THROW(lifecycle.start(), std::runtime_error);
    EXPECT_EQ(lifecycle.state(), ServiceState::Error);

    env_.chain.set_contract_version("0.16.2");
    lifecycle.stop();
    lifecycle.start();
    EXPECT_EQ(lifecycle.state(), ServiceState::Started);
}

TEST_F(LifecycleControllerTest, CoreWalletStartupPersistsAndReusesWallet) {
    env_.workers->set_core_wallet(WalletCredential{});
    CoreWalletStartup first(env_.chain, *env_.store, *env_.workers, 2 * kLamportsPerSol, 10 * kLamportsPerSol);
    first.start();

    auto created = env_.workers->core_wallet();
    ASSERT_FALSE(created.empty());
    EXPECT_GE(env_.chain.get_native_balance(created.public_key), 10 * kLamportsPerSol);
    EXPECT_TRUE(first.is_healthy());

    auto airdrops = env_.chain.call_count("request_airdrop");
    CoreWalletStartup second(env_.chain, *env_.store, *env_.workers, 2 * kLamportsPerSol, 10 * kLamportsPerSol);
    second.start();
    EXPECT_EQ(env_.workers->core_wallet().public_key, created.public_key);
    // Funded above the minimum, no second airdrop
    EXPECT_EQ(env_.chain.call_count("request_airdrop"), airdrops);
}
