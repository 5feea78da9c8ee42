#ifndef CAPBRIDGE_SUBSCRIPTION_MANAGER_HPP
#define CAPBRIDGE_SUBSCRIPTION_MANAGER_HPP

// Long-lived capability subscriptions (watches) of one bridge instance.
//
// Each subscription delivers adapter events to the event sink, tagged with its
// id, until cancelled. Once cancel() or dispose_all() returns, no further event
// of that subscription reaches the sink: an event already being delivered on
// another thread finishes first, everything after it is dropped.

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "platform/platform_adapter.hpp"

namespace subscription_manager {

using SubscriptionId = uint64_t;

struct SubscriptionEvent {
    SubscriptionId subscription_id = 0;
    platform::AdapterOutcome outcome;
};

using EventSink = std::function<void(const SubscriptionEvent &event)>;

// Starts the underlying watch: receives the guarded event callback, returns the
// adapter's cancel function.
using StartFunction = std::function<platform::CancelFunction(platform::OutcomeCallback on_event)>;

class SubscriptionManager {
public:
    explicit SubscriptionManager(EventSink sink, uint64_t bridge_id = 0);
    ~SubscriptionManager();

    SubscriptionManager(const SubscriptionManager &) = delete;
    SubscriptionManager &operator=(const SubscriptionManager &) = delete;

    // Allocate an id and start delivering. Returns empty after dispose_all().
    // Exceptions from begin propagate after the subscription is discarded.
    std::optional<SubscriptionId> start(const std::string &capability, const StartFunction &begin);

    // Idempotent: unknown, already-cancelled and disposed ids are ignored.
    void cancel(SubscriptionId id);

    // Cancel every active subscription and refuse new ones. Runs once; later calls do nothing.
    void dispose_all();

    bool is_active(SubscriptionId id) const;
    size_t active_count() const;

private:
    struct Record {
        SubscriptionId id = 0;
        std::string capability;
        // Held while an event is delivered; recursive so the sink may cancel its own subscription.
        std::recursive_mutex delivery_mutex;
        bool active = true;
        platform::CancelFunction cancel_function;
    };

    static void deactivate(const std::shared_ptr<Record> &record);

    EventSink sink_;
    uint64_t bridge_id_;
    mutable std::mutex table_mutex_;
    std::map<SubscriptionId, std::shared_ptr<Record>> table_;
    SubscriptionId next_id_ = 1;
    bool disposed_ = false;
};

} // namespace subscription_manager

#endif // CAPBRIDGE_SUBSCRIPTION_MANAGER_HPP
