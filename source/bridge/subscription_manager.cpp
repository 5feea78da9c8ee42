#include "bridge/subscription_manager.hpp"
#include "utils/log_sink.hpp"

#include <exception>
#include <vector>

namespace subscription_manager {

SubscriptionManager::SubscriptionManager(EventSink sink, uint64_t bridge_id)
    : sink_(std::move(sink)), bridge_id_(bridge_id) {}

SubscriptionManager::~SubscriptionManager() {
    dispose_all();
}

std::optional<SubscriptionId> SubscriptionManager::start(const std::string &capability, const StartFunction &begin) {
    auto record = std::make_shared<Record>();
    {
        std::lock_guard<std::mutex> lock(table_mutex_);
        if (disposed_) {
            return std::nullopt;
        }
        record->id = next_id_++;
        record->capability = capability;
        table_[record->id] = record;
    }

    EventSink sink = sink_;
    platform::OutcomeCallback on_event = [record, sink](const platform::AdapterOutcome &outcome) {
        std::lock_guard<std::recursive_mutex> delivery_lock(record->delivery_mutex);
        if (!record->active) {
            return;
        }
        SubscriptionEvent event;
        event.subscription_id = record->id;
        event.outcome = outcome;
        try {
            sink(event);
        } catch (const std::exception &exception) {
            log_sink::error(std::string("event sink threw: ") + exception.what());
        }
    };

    platform::CancelFunction cancel_function;
    try {
        cancel_function = begin(on_event);
    } catch (...) {
        {
            std::lock_guard<std::mutex> lock(table_mutex_);
            table_.erase(record->id);
        }
        {
            std::lock_guard<std::recursive_mutex> delivery_lock(record->delivery_mutex);
            record->active = false;
        }
        throw;
    }

    bool cancelled_during_start = false;
    {
        std::lock_guard<std::recursive_mutex> delivery_lock(record->delivery_mutex);
        if (record->active) {
            record->cancel_function = std::move(cancel_function);
        } else {
            cancelled_during_start = true;
        }
    }
    if (cancelled_during_start && cancel_function) {
        cancel_function();
    }

    log_sink::debug("bridge " + std::to_string(bridge_id_) + " subscription " + std::to_string(record->id) +
                    " started for " + capability);
    return record->id;
}

void SubscriptionManager::cancel(SubscriptionId id) {
    std::shared_ptr<Record> record;
    {
        std::lock_guard<std::mutex> lock(table_mutex_);
        auto iterator = table_.find(id);
        if (iterator == table_.end()) {
            return;
        }
        record = iterator->second;
        table_.erase(iterator);
    }
    deactivate(record);
    log_sink::debug("bridge " + std::to_string(bridge_id_) + " subscription " + std::to_string(id) + " cancelled");
}

void SubscriptionManager::dispose_all() {
    std::map<SubscriptionId, std::shared_ptr<Record>> remaining;
    {
        std::lock_guard<std::mutex> lock(table_mutex_);
        if (disposed_) {
            return;
        }
        disposed_ = true;
        remaining.swap(table_);
    }
    for (const auto &pair : remaining) {
        deactivate(pair.second);
    }
    if (!remaining.empty()) {
        log_sink::debug("bridge " + std::to_string(bridge_id_) + " disposed " + std::to_string(remaining.size()) +
                        " subscription(s)");
    }
}

bool SubscriptionManager::is_active(SubscriptionId id) const {
    std::lock_guard<std::mutex> lock(table_mutex_);
    return table_.count(id) > 0;
}

size_t SubscriptionManager::active_count() const {
    std::lock_guard<std::mutex> lock(table_mutex_);
    return table_.size();
}

void SubscriptionManager::deactivate(const std::shared_ptr<Record> &record) {
    platform::CancelFunction cancel_function;
    {
        std::lock_guard<std::recursive_mutex> delivery_lock(record->delivery_mutex);
        if (!record->active) {
            return;
        }
        record->active = false;
        cancel_function = std::move(record->cancel_function);
        record->cancel_function = nullptr;
    }
    // The adapter's cancel runs outside the delivery lock: its own event thread
    // may be waiting on that lock.
    if (cancel_function) {
        try {
            cancel_function();
        } catch (const std::exception &exception) {
            log_sink::error(std::string("watch cancel threw: ") + exception.what());
        }
    }
}

} // namespace subscription_manager
