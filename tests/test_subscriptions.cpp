// Tests for the subscription manager: delivery, cancellation and disposal.

#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

#include "bridge/subscription_manager.hpp"
#include "fake_platform_adapter.hpp"
#include "result_collector.hpp"

namespace test_subscriptions {

using subscription_manager::SubscriptionId;
using subscription_manager::SubscriptionManager;

static std::optional<SubscriptionId> start_watch(SubscriptionManager &manager,
                                                 const std::shared_ptr<fake_platform::FakePlatformAdapter> &adapter) {
    return manager.start("geolocation.watchPosition", [adapter](platform::OutcomeCallback on_event) {
        return adapter->watch_position(platform::PositionOptions(), std::move(on_event));
    });
}

// Test: Events are tagged with their subscription id; ids are distinct.
static bool test_events_tagged_with_subscription() {
    auto adapter = std::make_shared<fake_platform::FakePlatformAdapter>();
    result_collector::EventCollector collector;
    SubscriptionManager manager(collector.sink());

    std::optional<SubscriptionId> first = start_watch(manager, adapter);
    std::optional<SubscriptionId> second = start_watch(manager, adapter);
    adapter->emit_watch_event(0, platform::make_success(1));
    adapter->emit_watch_event(1, platform::make_success(2));

    std::vector<subscription_manager::SubscriptionEvent> events = collector.events();
    bool success = first && second && *first != *second && events.size() == 2 &&
                   events[0].subscription_id == *first && events[1].subscription_id == *second &&
                   events[1].outcome.value == 2 && manager.active_count() == 2;

    if (success) {
        std::cout << "  OK: Events carry their subscription id" << std::endl;
    } else {
        std::cout << "  FAIL: Event tagging wrong (" << events.size() << " events)" << std::endl;
    }
    return success;
}

// Test: After cancel() no event of that subscription is delivered; cancel is idempotent.
static bool test_cancel_is_synchronous_and_idempotent() {
    auto adapter = std::make_shared<fake_platform::FakePlatformAdapter>();
    result_collector::EventCollector collector;
    SubscriptionManager manager(collector.sink());

    std::optional<SubscriptionId> id = start_watch(manager, adapter);
    adapter->emit_watch_event(0, platform::make_success(1));
    manager.cancel(*id);
    manager.cancel(*id);
    adapter->emit_watch_event(0, platform::make_success(2));

    bool success = collector.count() == 1 && !manager.is_active(*id) && adapter->watch_cancel_calls(0) == 1;

    if (success) {
        std::cout << "  OK: Cancel stops delivery and is idempotent" << std::endl;
    } else {
        std::cout << "  FAIL: Cancel (events " << collector.count() << ", adapter cancels "
                  << adapter->watch_cancel_calls(0) << ")" << std::endl;
    }
    return success;
}

// Test: Cancelling an unknown id is ignored.
static bool test_cancel_unknown_id() {
    result_collector::EventCollector collector;
    SubscriptionManager manager(collector.sink());
    manager.cancel(12345);
    bool success = manager.active_count() == 0;

    if (success) {
        std::cout << "  OK: Unknown id cancel ignored" << std::endl;
    } else {
        std::cout << "  FAIL: Unknown id cancel changed state" << std::endl;
    }
    return success;
}

// Test: dispose_all() cancels every watch and refuses new ones.
static bool test_dispose_all() {
    auto adapter = std::make_shared<fake_platform::FakePlatformAdapter>();
    result_collector::EventCollector collector;
    SubscriptionManager manager(collector.sink());

    start_watch(manager, adapter);
    start_watch(manager, adapter);
    manager.dispose_all();
    adapter->emit_watch_event(0, platform::make_success(1));
    adapter->emit_watch_event(1, platform::make_success(1));
    std::optional<SubscriptionId> refused = start_watch(manager, adapter);

    bool success = collector.count() == 0 && manager.active_count() == 0 && !refused &&
                   adapter->watch_cancel_calls(0) == 1 && adapter->watch_cancel_calls(1) == 1 &&
                   adapter->watch_count() == 2;

    if (success) {
        std::cout << "  OK: dispose_all cancels everything and refuses new watches" << std::endl;
    } else {
        std::cout << "  FAIL: dispose_all left " << manager.active_count() << " active" << std::endl;
    }
    return success;
}

// Test: A sink may cancel its own subscription from inside delivery.
static bool test_cancel_from_inside_sink() {
    auto adapter = std::make_shared<fake_platform::FakePlatformAdapter>();
    int delivered = 0;
    SubscriptionManager *manager_pointer = nullptr;
    SubscriptionManager manager([&delivered, &manager_pointer](const subscription_manager::SubscriptionEvent &event) {
        delivered++;
        manager_pointer->cancel(event.subscription_id);
    });
    manager_pointer = &manager;

    start_watch(manager, adapter);
    adapter->emit_watch_event(0, platform::make_success(1));
    adapter->emit_watch_event(0, platform::make_success(2));

    bool success = delivered == 1 && manager.active_count() == 0;

    if (success) {
        std::cout << "  OK: Sink can cancel its own subscription" << std::endl;
    } else {
        std::cout << "  FAIL: Re-entrant cancel delivered " << delivered << " events" << std::endl;
    }
    return success;
}

// Test: An exception from the adapter's start propagates and leaves no subscription behind.
static bool test_start_failure_discards_subscription() {
    auto adapter = std::make_shared<fake_platform::FakePlatformAdapter>();
    adapter->throw_from("watch_position");
    result_collector::EventCollector collector;
    SubscriptionManager manager(collector.sink());

    bool threw = false;
    try {
        start_watch(manager, adapter);
    } catch (const std::runtime_error &error) {
        threw = std::string(error.what()) == "watch_position failed in the OS layer";
    }
    adapter->emit_watch_event(0, platform::make_success(1));

    bool success = threw && manager.active_count() == 0 && collector.count() == 0;

    if (success) {
        std::cout << "  OK: Failed start leaves no subscription" << std::endl;
    } else {
        std::cout << "  FAIL: Failed start left state behind" << std::endl;
    }
    return success;
}

bool run_all_tests() {
    bool all_passed = true;
    all_passed &= test_events_tagged_with_subscription();
    all_passed &= test_cancel_is_synchronous_and_idempotent();
    all_passed &= test_cancel_unknown_id();
    all_passed &= test_dispose_all();
    all_passed &= test_cancel_from_inside_sink();
    all_passed &= test_start_failure_discards_subscription();
    return all_passed;
}

} // namespace test_subscriptions
