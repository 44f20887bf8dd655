#include "aether/event_loop.hpp"

#include <algorithm>
#include <chrono>
#include <thread>
#include <utility>

namespace aether {

namespace {

double SteadySeconds() {
    using namespace std::chrono;
    return duration<double>(steady_clock::now().time_since_epoch()).count();
}

}  // namespace

EventLoop::EventLoop() : clock_(&SteadySeconds) {}

EventLoop::EventLoop(Clock clock) : clock_(clock ? std::move(clock) : Clock(&SteadySeconds)) {}

void EventLoop::Post(Task task) {
    ready_.push_back(std::move(task));
}

void EventLoop::PostDelayed(double delay_seconds, Task task) {
    if (delay_seconds <= 0.0) {
        Post(std::move(task));
        return;
    }
    timers_.push_back(Timer{Now() + delay_seconds, next_sequence_++, std::move(task)});
}

double EventLoop::Now() const {
    return clock_();
}

bool EventLoop::PromoteDueTimers() {
    if (timers_.empty()) {
        return false;
    }
    double now = Now();
    std::vector<Timer> due;
    auto split = std::stable_partition(timers_.begin(), timers_.end(),
                                       [now](const Timer& timer) { return timer.due > now; });
    std::move(split, timers_.end(), std::back_inserter(due));
    timers_.erase(split, timers_.end());
    std::sort(due.begin(), due.end(), [](const Timer& a, const Timer& b) {
        return a.due < b.due || (a.due == b.due && a.sequence < b.sequence);
    });
    for (auto& timer : due) {
        ready_.push_back(std::move(timer.task));
    }
    return !due.empty();
}

std::size_t EventLoop::RunReady() {
    std::size_t ran = 0;
    stopped_ = false;
    PromoteDueTimers();
    while (!ready_.empty() && !stopped_) {
        Task task = std::move(ready_.front());
        ready_.pop_front();
        task();
        ++ran;
        if (ready_.empty()) {
            PromoteDueTimers();
        }
    }
    return ran;
}

std::size_t EventLoop::Run() {
    std::size_t ran = 0;
    stopped_ = false;
    while (!stopped_) {
        ran += RunReady();
        if (stopped_ || timers_.empty()) {
            break;
        }
        auto next = std::min_element(timers_.begin(), timers_.end(),
                                     [](const Timer& a, const Timer& b) { return a.due < b.due; });
        double wait = next->due - Now();
        if (wait > 0.0) {
            std::this_thread::sleep_for(std::chrono::duration<double>(wait));
        }
    }
    return ran;
}

void EventLoop::Stop() {
    stopped_ = true;
}

}  // namespace aether
