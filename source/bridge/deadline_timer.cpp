#include "bridge/deadline_timer.hpp"
#include "utils/log_sink.hpp"

#include <exception>
#include <vector>

namespace deadline_timer {

DeadlineTimer::DeadlineTimer() : state_(std::make_shared<State>()) {
    worker_ = std::thread(&DeadlineTimer::run, state_);
}

DeadlineTimer::~DeadlineTimer() {
    shutdown();
}

DeadlineTimer::TimerId DeadlineTimer::schedule(std::chrono::milliseconds delay, std::function<void()> action) {
    std::lock_guard<std::mutex> lock(state_->mutex);
    if (state_->stopping) {
        return 0;
    }
    TimerId id = state_->next_id++;
    Clock::time_point deadline = Clock::now() + delay;
    state_->entries[id] = Entry{deadline, std::move(action)};
    state_->queue.emplace(deadline, id);
    state_->condition.notify_one();
    return id;
}

bool DeadlineTimer::cancel(TimerId id) {
    std::lock_guard<std::mutex> lock(state_->mutex);
    auto iterator = state_->entries.find(id);
    if (iterator == state_->entries.end()) {
        return false;
    }
    auto range = state_->queue.equal_range(iterator->second.deadline);
    for (auto queued = range.first; queued != range.second; ++queued) {
        if (queued->second == id) {
            state_->queue.erase(queued);
            break;
        }
    }
    state_->entries.erase(iterator);
    return true;
}

void DeadlineTimer::shutdown() {
    std::map<TimerId, Entry> dropped;
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->stopping = true;
        dropped.swap(state_->entries);
        state_->queue.clear();
        state_->condition.notify_all();
    }
    // Dropped actions are destroyed outside the lock; their captures may own this timer.
    dropped.clear();

    if (!worker_.joinable()) {
        return;
    }
    if (worker_.get_id() == std::this_thread::get_id()) {
        // Called from inside an action; the loop exits once it returns.
        worker_.detach();
    } else {
        worker_.join();
    }
}

size_t DeadlineTimer::pending_count() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->entries.size();
}

void DeadlineTimer::run(std::shared_ptr<State> state) {
    std::unique_lock<std::mutex> lock(state->mutex);
    while (!state->stopping) {
        if (state->queue.empty()) {
            state->condition.wait(lock);
            continue;
        }

        Clock::time_point next_deadline = state->queue.begin()->first;
        if (Clock::now() < next_deadline) {
            state->condition.wait_until(lock, next_deadline);
            continue;
        }

        std::vector<std::function<void()>> due;
        Clock::time_point now = Clock::now();
        while (!state->queue.empty() && state->queue.begin()->first <= now) {
            TimerId id = state->queue.begin()->second;
            state->queue.erase(state->queue.begin());
            auto entry = state->entries.find(id);
            if (entry != state->entries.end()) {
                due.push_back(std::move(entry->second.action));
                state->entries.erase(entry);
            }
        }

        lock.unlock();
        for (auto &action : due) {
            try {
                action();
            } catch (const std::exception &exception) {
                log_sink::error(std::string("timer action threw: ") + exception.what());
            }
        }
        due.clear();
        lock.lock();
    }
}

} // namespace deadline_timer
