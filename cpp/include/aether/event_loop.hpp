#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <vector>

namespace aether {

// Single-threaded cooperative scheduler. Every suspension point in the pipeline
// is a task that posts its own continuation; nothing here spawns threads.
class EventLoop {
public:
    using Task = std::function<void()>;
    // Monotonic seconds.
    using Clock = std::function<double()>;

    EventLoop();
    explicit EventLoop(Clock clock);

    EventLoop(const EventLoop&) = delete;
    EventLoop& operator=(const EventLoop&) = delete;

    void Post(Task task);
    void PostDelayed(double delay_seconds, Task task);

    double Now() const;

    // Runs ready tasks, including ones posted while running, and due timers.
    // Never waits. Returns the number of tasks run.
    std::size_t RunReady();

    // Like RunReady but sleeps until pending timers fall due. Returns when no
    // tasks or timers remain, or after Stop().
    std::size_t Run();
    void Stop();

    std::size_t Pending() const noexcept { return ready_.size() + timers_.size(); }

private:
    struct Timer {
        double due = 0.0;
        std::uint64_t sequence = 0;
        Task task;
    };

    bool PromoteDueTimers();

    Clock clock_;
    std::deque<Task> ready_;
    std::vector<Timer> timers_;
    std::uint64_t next_sequence_ = 0;
    bool stopped_ = false;
};

}  // namespace aether
