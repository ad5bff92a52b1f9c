#include "rate_refresher.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>

std::vector<std::chrono::milliseconds> RefreshPolicy::backoff_schedule() const {
    std::vector<std::chrono::milliseconds> delays;
    auto delay = initial_backoff;
    for (int i = 0; i < max_retries; ++i) {
        delays.push_back(delay);
        delay *= 2;
    }
    return delays;
}

std::string refresher_state_to_string(RefresherState state) {
    switch (state) {
        case RefresherState::Idle: return "idle";
        case RefresherState::Refreshing: return "refreshing";
        default: return "unknown";
    }
}

RateRefresher::RateRefresher(RefreshFn refresh, RefreshPolicy policy, std::shared_ptr<Clock> clock)
    : refresh_(std::move(refresh))
    , policy_(policy)
    , clock_(std::move(clock))
{}

RateRefresher::~RateRefresher() {
    stop();
}

void RateRefresher::start() {
    if (running_) {
        spdlog::warn("Rate refresher already running");
        return;
    }

    running_ = true;
    worker_ = std::thread(&RateRefresher::run_loop, this);
    spdlog::info("Rate refresher started (startup delay {}s, interval {}h)",
                 std::chrono::duration_cast<std::chrono::seconds>(policy_.startup_delay).count(),
                 std::chrono::duration_cast<std::chrono::hours>(policy_.interval).count());
}

void RateRefresher::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_) return;
        running_ = false;
    }
    cv_.notify_all();

    if (worker_.joinable()) {
        worker_.join();
    }
    spdlog::info("Rate refresher stopped");
}

void RateRefresher::trigger_now() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        triggered_ = true;
    }
    cv_.notify_all();
    spdlog::info("Rate refresh requested");
}

std::optional<TimePoint> RateRefresher::last_success() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_success_;
}

std::string RateRefresher::last_error() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_error_;
}

bool RateRefresher::wait(std::chrono::milliseconds duration, bool wake_on_trigger) {
    if (waiter_) {
        return waiter_(duration);
    }

    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_for(lock, duration, [&]() {
        return !running_ || (wake_on_trigger && triggered_);
    });

    if (wake_on_trigger) {
        triggered_ = false;
    }
    return running_;
}

bool RateRefresher::run_cycle() {
    state_ = RefresherState::Refreshing;
    auto backoff = policy_.backoff_schedule();

    for (int attempt = 0; attempt <= policy_.max_retries; ++attempt) {
        try {
            auto report = refresh_();

            {
                std::lock_guard<std::mutex> lock(mutex_);
                last_success_ = clock_->now();
                last_error_.clear();
            }
            spdlog::info("Exchange rates refreshed at {} ({} pairs, {} failed)",
                         util::to_iso8601(clock_->now()), report.refreshed.size(), report.failed.size());
            state_ = RefresherState::Idle;
            return true;

        } catch (const std::exception& e) {
            {
                std::lock_guard<std::mutex> lock(mutex_);
                last_error_ = e.what();
            }

            if (attempt == policy_.max_retries) {
                spdlog::error("Rate refresh attempt {} failed: {}", attempt + 1, e.what());
                break;
            }

            auto delay = backoff[attempt];
            spdlog::warn("Rate refresh attempt {} failed: {}; retrying in {}s",
                         attempt + 1, e.what(),
                         std::chrono::duration_cast<std::chrono::seconds>(delay).count());

            if (!wait(delay, false)) {
                spdlog::info("Rate refresh retry cancelled");
                state_ = RefresherState::Idle;
                return false;
            }
        }
    }

    spdlog::error("Rate refresh gave up after {} attempts", policy_.max_retries + 1);
    state_ = RefresherState::Idle;
    return false;
}

void RateRefresher::run_loop() {
    if (!wait(policy_.startup_delay, true)) {
        return;
    }

    while (running_) {
        run_cycle();

        if (!wait(policy_.interval, true)) {
            break;
        }
    }
}
