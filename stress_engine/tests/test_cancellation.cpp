#include "cancellation.hpp"
#include <gtest/gtest.h>
#include <thread>

using namespace std::chrono;

TEST(CancellationTest, WaitTimesOutWhenNotCancelled) {
    CancellationSource source;
    auto token = source.token();
    EXPECT_FALSE(token.wait_for(milliseconds(10)));
    EXPECT_FALSE(token.is_cancelled());
}

TEST(CancellationTest, CancelWakesLongWait) {
    CancellationSource source;
    auto token = source.token();

    auto started = steady_clock::now();
    std::thread canceller([&source]() {
        std::this_thread::sleep_for(milliseconds(50));
        source.cancel();
    });

    EXPECT_TRUE(token.wait_for(seconds(30)));
    canceller.join();

    EXPECT_LT(steady_clock::now() - started, seconds(5));
    EXPECT_TRUE(token.is_cancelled());
    EXPECT_TRUE(source.is_cancelled());
}

TEST(CancellationTest, AlreadyCancelledReturnsImmediately) {
    CancellationSource source;
    source.cancel();
    EXPECT_TRUE(source.token().wait_for(seconds(30)));
}

TEST(CancellationTest, NoneIsNeverCancelled) {
    auto token = CancellationToken::none();
    EXPECT_FALSE(token.is_cancelled());
    EXPECT_FALSE(token.wait_for(milliseconds(1)));
}
