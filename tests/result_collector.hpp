#ifndef CAPBRIDGE_RESULT_COLLECTOR_HPP
#define CAPBRIDGE_RESULT_COLLECTOR_HPP

// Thread-safe sinks recording what a dispatcher or subscription manager emits.

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <vector>

#include "bridge/call_dispatcher.hpp"
#include "bridge/subscription_manager.hpp"

namespace result_collector {

class ResultCollector {
public:
    call_dispatcher::ResultSink sink() {
        return [this](const call_dispatcher::CallResult &result) {
            std::lock_guard<std::mutex> lock(mutex_);
            results_.push_back(result);
            condition_.notify_all();
        };
    }

    bool wait_for_count(size_t count, int timeout_milliseconds) {
        std::unique_lock<std::mutex> lock(mutex_);
        return condition_.wait_for(lock, std::chrono::milliseconds(timeout_milliseconds),
                                   [&]() { return results_.size() >= count; });
    }

    std::vector<call_dispatcher::CallResult> results() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return results_;
    }

    std::vector<call_dispatcher::CallResult> results_for(uint64_t correlation_id) const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<call_dispatcher::CallResult> matching;
        for (const auto &result : results_) {
            if (result.correlation_id == correlation_id) {
                matching.push_back(result);
            }
        }
        return matching;
    }

    size_t count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return results_.size();
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable condition_;
    std::vector<call_dispatcher::CallResult> results_;
};

class EventCollector {
public:
    subscription_manager::EventSink sink() {
        return [this](const subscription_manager::SubscriptionEvent &event) {
            std::lock_guard<std::mutex> lock(mutex_);
            events_.push_back(event);
        };
    }

    std::vector<subscription_manager::SubscriptionEvent> events() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return events_;
    }

    size_t count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return events_.size();
    }

private:
    mutable std::mutex mutex_;
    std::vector<subscription_manager::SubscriptionEvent> events_;
};

} // namespace result_collector

#endif // CAPBRIDGE_RESULT_COLLECTOR_HPP
