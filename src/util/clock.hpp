#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <thread>

namespace util {

// Thin clock abstraction to enable deterministic testing of backoff and timing.
class SteadyClock {
public:
    using time_point = std::chrono::steady_clock::time_point;

    virtual ~SteadyClock() = default;
    virtual time_point now() const noexcept { return std::chrono::steady_clock::now(); }
};

// Blocking wait used between retries. Tests substitute a recorder that never sleeps.
class Sleeper {
public:
    virtual ~Sleeper() = default;
    virtual void sleep_for(std::chrono::milliseconds d) {
        if (d.count() > 0) {
            std::this_thread::sleep_for(d);
        }
    }
    // Ends a wait in progress; later waits return at once. No-op by default.
    virtual void interrupt() noexcept {}
};

// Wait on a condition variable so another thread can cut a backoff short.
class InterruptibleSleeper : public Sleeper {
public:
    void sleep_for(std::chrono::milliseconds d) override {
        std::unique_lock<std::mutex> lk(mu_);
        cv_.wait_for(lk, d, [this] { return interrupted_; });
    }

    void interrupt() noexcept override {
        {
            std::lock_guard<std::mutex> lk(mu_);
            interrupted_ = true;
        }
        cv_.notify_all();
    }

    bool interrupted() const noexcept {
        std::lock_guard<std::mutex> lk(mu_);
        return interrupted_;
    }

private:
    mutable std::mutex mu_;
    std::condition_variable cv_;
    bool interrupted_{false};
};

[[nodiscard]] inline std::uint64_t elapsed_ms(const SteadyClock& clock, SteadyClock::time_point since) noexcept {
    return static_cast<std::uint64_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(clock.now() - since).count());
}

} // namespace util
