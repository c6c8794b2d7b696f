#include "health.hpp"
#include "test_support.hpp"
#include <gtest/gtest.h>
#include <httplib.h>
#include <nlohmann/json.hpp>

using test_support::SimulatedEnvironment;

class HealthServerTest : public ::testing::Test {
protected:
    HealthServerTest()
        : lifecycle_(
              [this]() {
                  return std::make_unique<StressEngine>(std::vector<std::unique_ptr<StartupRoutine>>{},
                                                        *env_.workers);
              },
              *env_.workers, env_.system_state) {
        config_.health_host = "127.0.0.1";
        config_.health_port = 0;
    }

    nlohmann::json get_health(int port, int& status) {
        httplib::Client client("127.0.0.1", port);
        auto res = client.Get("/health");
        EXPECT_TRUE(res);
        if (!res) return {};
        status = res->status;
        return nlohmann::json::parse(res->body);
    }

    SimulatedEnvironment env_;
    Config config_;
    LifecycleController lifecycle_;
};

TEST_F(HealthServerTest, StopImmediatelyAfterStartReturns) {
    for (int i = 0; i < 20; ++i) {
        HealthServer server(config_, lifecycle_);
        server.start();
        EXPECT_GT(server.port(), 0);
        server.stop();
    }
}

TEST_F(HealthServerTest, ReportsLifecycleHealth) {
    HealthServer server(config_, lifecycle_);
    server.start();
    ASSERT_GT(server.port(), 0);

    int status = 0;
    auto body = get_health(server.port(), status);
    EXPECT_EQ(status, 200);
    EXPECT_EQ(body["service"], "stress_engine");
    EXPECT_EQ(body["status"], "Stopped");

    lifecycle_.start();
    lifecycle_.pause();
    body = get_health(server.port(), status);
    EXPECT_EQ(status, 503);
    EXPECT_EQ(body["status"], "Paused");

    lifecycle_.stop();
    server.stop();
}
