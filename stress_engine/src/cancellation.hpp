#pragma once
#include <memory>
#include <mutex>
#include <condition_variable>
#include <chrono>

// Cooperative cancellation shared between a worker loop and its owner.
// Every wait in a loop goes through wait_for so a cancel wakes it immediately.
class CancellationToken {
public:
    CancellationToken();

    bool is_cancelled() const;

    // Sleeps up to `timeout`; returns true if cancellation was requested
    bool wait_for(std::chrono::milliseconds timeout) const;

    // A token that can never be cancelled
    static CancellationToken none();

private:
    friend class CancellationSource;

    struct State {
        mutable std::mutex mutex;
        std::condition_variable cv;
        bool cancelled = false;
    };

    explicit CancellationToken(std::shared_ptr<State> state);

    std::shared_ptr<State> state_;
};

class CancellationSource {
public:
    CancellationSource();

    void cancel();
    bool is_cancelled() const;
    CancellationToken token() const;

private:
    std::shared_ptr<CancellationToken::State> state_;
};
