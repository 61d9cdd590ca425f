#pragma once
#include <chrono>
#include <cstdint>

namespace recload {

// Timer + byte counter for one record, reported to the monitor once.
class TimedEvent {
public:
    using Clock = std::chrono::steady_clock;

    TimedEvent() : start_(Clock::now()) {}

    void increment(uint64_t bytes) { bytes_ += bytes; }

    void stop() {
        if (stopped_) return;
        end_ = Clock::now();
        stopped_ = true;
    }

    uint64_t bytes() const { return bytes_; }

    double duration_ms() const {
        const auto end = stopped_ ? end_ : Clock::now();
        return std::chrono::duration<double, std::milli>(end - start_).count();
    }

private:
    Clock::time_point start_;
    Clock::time_point end_{};
    uint64_t bytes_{0};
    bool stopped_{false};
};

} // namespace recload
