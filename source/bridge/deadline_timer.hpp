#ifndef CAPBRIDGE_DEADLINE_TIMER_HPP
#define CAPBRIDGE_DEADLINE_TIMER_HPP

// Single worker thread running delayed actions (call timeouts).

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <thread>

namespace deadline_timer {

class DeadlineTimer {
public:
    using TimerId = uint64_t;
    using Clock = std::chrono::steady_clock;

    DeadlineTimer();
    ~DeadlineTimer();

    DeadlineTimer(const DeadlineTimer &) = delete;
    DeadlineTimer &operator=(const DeadlineTimer &) = delete;

    // Run action on the worker thread after delay. Returns 0 after shutdown().
    TimerId schedule(std::chrono::milliseconds delay, std::function<void()> action);

    // Returns true if the action had not started yet and will not run.
    bool cancel(TimerId id);

    // Drop pending actions and stop the worker. Safe to call from an action.
    void shutdown();

    size_t pending_count() const;

private:
    struct Entry {
        Clock::time_point deadline;
        std::function<void()> action;
    };

    // Shared with the worker so the timer can be destroyed from inside an action.
    struct State {
        std::mutex mutex;
        std::condition_variable condition;
        std::map<TimerId, Entry> entries;
        std::multimap<Clock::time_point, TimerId> queue;
        TimerId next_id = 1;
        bool stopping = false;
    };

    static void run(std::shared_ptr<State> state);

    std::shared_ptr<State> state_;
    std::thread worker_;
};

} // namespace deadline_timer

#endif // CAPBRIDGE_DEADLINE_TIMER_HPP
