#pragma once

// =============================================================================
// stockflow - Cooperative run control
// =============================================================================
// Shared between a running simulation (or a batch of them) and whoever wants
// to stop or pause it. The simulator polls should_stop() / should_pause()
// between time steps; a step in progress is never interrupted.
// =============================================================================

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>

namespace stockflow {

class SimulationControl {
public:
    // Flags a waiter re-checks are stored under mutex_ so a wake-up cannot be lost
    void request_stop() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stop_.store(true, std::memory_order_release);
        }
        cv_.notify_all();
    }

    void request_pause() { pause_.store(true, std::memory_order_release); }

    void resume() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            pause_.store(false, std::memory_order_release);
        }
        cv_.notify_all();
    }

    [[nodiscard]] bool should_stop() const { return stop_.load(std::memory_order_acquire); }
    [[nodiscard]] bool should_pause() const { return pause_.load(std::memory_order_acquire); }

    /// Block while paused; returns early when a stop is requested
    void wait_until_resumed() {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] { return !should_pause() || should_stop(); });
    }

    void reset() {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_.store(false, std::memory_order_release);
        pause_.store(false, std::memory_order_release);
    }

private:
    std::atomic<bool> stop_{false};
    std::atomic<bool> pause_{false};
    std::mutex mutex_;
    std::condition_variable cv_;
};

/// Snapshot handed to progress callbacks
struct SimulationProgress {
    double current_time = 0.0;
    double total_time = 0.0;
    double progress_percent = 0.0;
    std::int64_t steps_completed = 0;
    double elapsed_seconds = 0.0;
};

struct ProgressCallbackConfig {
    std::function<void(const SimulationProgress&)> callback;
    double min_interval_ms = 100.0;
    int min_steps = 1;
};

}  // namespace stockflow
