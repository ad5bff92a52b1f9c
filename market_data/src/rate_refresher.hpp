#pragma once

#include "clock.hpp"
#include "market_types.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

struct RefreshPolicy {
    std::chrono::milliseconds startup_delay = std::chrono::minutes(2);
    std::chrono::milliseconds interval = std::chrono::hours(24);
    int max_retries = 3;
    std::chrono::milliseconds initial_backoff = std::chrono::minutes(5);

    // Delay before each retry: initial_backoff doubled per attempt
    std::vector<std::chrono::milliseconds> backoff_schedule() const;
};

enum class RefresherState {
    Idle,
    Refreshing
};

std::string refresher_state_to_string(RefresherState state);

// Background loop keeping tracked currency rates fresh:
// startup delay, cycle, interval, cycle, ... A failed cycle is retried with
// exponential backoff and then abandoned until the next interval.
class RateRefresher {
public:
    using RefreshFn = std::function<RefreshReport()>;
    // Blocks for the given duration; returns false once the refresher is stopping
    using Waiter = std::function<bool(std::chrono::milliseconds)>;

    RateRefresher(RefreshFn refresh, RefreshPolicy policy, std::shared_ptr<Clock> clock);
    ~RateRefresher();

    RateRefresher(const RateRefresher&) = delete;
    RateRefresher& operator=(const RateRefresher&) = delete;

    void set_waiter(Waiter waiter) { waiter_ = std::move(waiter); }

    void start();
    void stop();
    bool is_running() const { return running_; }

    // Wakes the loop out of the startup or interval wait
    void trigger_now();

    // One cycle: initial attempt plus retries. Returns true on success.
    bool run_cycle();

    RefresherState state() const { return state_; }
    std::optional<TimePoint> last_success() const;
    std::string last_error() const;

private:
    RefreshFn refresh_;
    RefreshPolicy policy_;
    std::shared_ptr<Clock> clock_;
    Waiter waiter_;

    std::atomic<bool> running_{false};
    std::atomic<RefresherState> state_{RefresherState::Idle};
    std::thread worker_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool triggered_ = false;
    std::optional<TimePoint> last_success_;
    std::string last_error_;

    void run_loop();
    bool wait(std::chrono::milliseconds duration, bool wake_on_trigger);
};
