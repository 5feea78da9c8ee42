// Tests for the call dispatcher: check order, exactly-once results, timeouts and disposal.

#include <nlohmann/json.hpp>
#include <chrono>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "bridge/call_dispatcher.hpp"
#include "fake_platform_adapter.hpp"
#include "result_collector.hpp"

using json = nlohmann::json;

namespace test_dispatcher {

using bridge_error::ErrorKind;
using capability_contract::PermissionKind;
using capability_contract::PermissionState;

// Handler bookkeeping shared between a test and its registered handlers.
struct HandlerLog {
    int invocations = 0;
    std::vector<platform::OutcomeCallback> parked;
};

struct Fixture {
    std::shared_ptr<fake_platform::FakePlatformAdapter> adapter;
    std::shared_ptr<permission_gate::PermissionGate> gate;
    std::shared_ptr<capability_registry::CapabilityRegistry> registry;
    std::shared_ptr<HandlerLog> log;
    result_collector::ResultCollector collector;
    std::shared_ptr<call_dispatcher::CallDispatcher> dispatcher;
};

static capability_contract::CapabilityContract make_contract(const std::string &name) {
    capability_contract::CapabilityContract contract;
    contract.name = name;
    contract.platform_support = platform::all_os_families();
    contract.argument_schema = {{"type", "object"}};
    return contract;
}

// Completes immediately with "done".
static capability_registry::CapabilityHandler immediate_handler(std::shared_ptr<HandlerLog> log) {
    return [log](const json &arguments, platform::OutcomeCallback done) {
        (void)arguments;
        log->invocations++;
        done(platform::make_success("done"));
    };
}

// Keeps the completion callback for the test to fire later.
static capability_registry::CapabilityHandler parking_handler(std::shared_ptr<HandlerLog> log) {
    return [log](const json &arguments, platform::OutcomeCallback done) {
        (void)arguments;
        log->invocations++;
        log->parked.push_back(std::move(done));
    };
}

static void build_fixture(Fixture &fixture, std::chrono::milliseconds timeout) {
    fixture.adapter = std::make_shared<fake_platform::FakePlatformAdapter>();
    fixture.gate = std::make_shared<permission_gate::PermissionGate>(fixture.adapter);
    fixture.registry = std::make_shared<capability_registry::CapabilityRegistry>(platform::OsFamily::Linux);
    fixture.log = std::make_shared<HandlerLog>();

    fixture.registry->register_capability(make_contract("test.immediate"), immediate_handler(fixture.log));
    fixture.registry->register_capability(make_contract("test.parked"), parking_handler(fixture.log));

    capability_contract::CapabilityContract interactive = make_contract("test.interactive");
    interactive.interactive = true;
    fixture.registry->register_capability(interactive, parking_handler(fixture.log));

    capability_contract::CapabilityContract gated = make_contract("test.gated");
    gated.required_permission = PermissionKind::Location;
    fixture.registry->register_capability(gated, immediate_handler(fixture.log));

    capability_contract::CapabilityContract mobile = make_contract("test.mobile");
    mobile.platform_support = {platform::OsFamily::Android};
    mobile.argument_schema = {{"type", "object"},
                              {"properties", {{"text", {{"type", "string"}}}}},
                              {"required", {"text"}}};
    fixture.registry->register_capability(mobile, immediate_handler(fixture.log));

    fixture.registry->register_capability(make_contract("test.doubled"),
                                          [log = fixture.log](const json &arguments, platform::OutcomeCallback done) {
                                              (void)arguments;
                                              log->invocations++;
                                              done(platform::make_success(1));
                                              done(platform::make_success(2));
                                          });

    fixture.registry->register_capability(make_contract("test.throwing"),
                                          [log = fixture.log](const json &arguments, platform::OutcomeCallback done) {
                                              (void)arguments;
                                              (void)done;
                                              log->invocations++;
                                              throw std::runtime_error("device unplugged");
                                          });

    call_dispatcher::DispatcherOptions options;
    options.call_timeout = timeout;
    fixture.dispatcher = std::make_shared<call_dispatcher::CallDispatcher>(fixture.registry, fixture.gate,
                                                                           fixture.collector.sink(), options);
}

static call_dispatcher::CallRequest make_request(uint64_t id, const std::string &capability,
                                                 json arguments = json::object()) {
    call_dispatcher::CallRequest request;
    request.correlation_id = id;
    request.capability = capability;
    request.arguments = std::move(arguments);
    return request;
}

static bool single_failure(const result_collector::ResultCollector &collector, uint64_t id, ErrorKind kind) {
    std::vector<call_dispatcher::CallResult> results = collector.results_for(id);
    return results.size() == 1 && !results[0].success && results[0].error_kind == kind;
}

// Test: An unknown capability fails with UnknownCapability and reaches no handler.
static bool test_unknown_capability() {
    Fixture fixture;
    build_fixture(fixture, std::chrono::milliseconds(1000));
    fixture.dispatcher->dispatch(make_request(1, "teleport"));

    bool success = single_failure(fixture.collector, 1, ErrorKind::UnknownCapability) &&
                   fixture.log->invocations == 0 && fixture.dispatcher->outstanding_count() == 0;

    if (success) {
        std::cout << "  OK: Unknown capability rejected" << std::endl;
    } else {
        std::cout << "  FAIL: Unknown capability not rejected correctly" << std::endl;
    }
    return success;
}

// Test: Argument validation runs before the platform check.
static bool test_invalid_arguments_before_unavailable() {
    Fixture fixture;
    build_fixture(fixture, std::chrono::milliseconds(1000));
    fixture.dispatcher->dispatch(make_request(1, "test.mobile", json::object()));
    fixture.dispatcher->dispatch(make_request(2, "test.mobile", {{"text", "x"}}));

    bool success = single_failure(fixture.collector, 1, ErrorKind::InvalidArguments) &&
                   single_failure(fixture.collector, 2, ErrorKind::CapabilityUnavailable) &&
                   fixture.log->invocations == 0;

    if (success) {
        std::cout << "  OK: InvalidArguments precedes CapabilityUnavailable" << std::endl;
    } else {
        std::cout << "  FAIL: Check order wrong" << std::endl;
    }
    return success;
}

// Test: A denied permission fails without invoking the handler or prompting.
static bool test_denied_permission_never_invokes() {
    Fixture fixture;
    build_fixture(fixture, std::chrono::milliseconds(1000));
    fixture.adapter->set_os_permission(PermissionKind::Location, PermissionState::Denied);
    fixture.dispatcher->dispatch(make_request(1, "test.gated"));

    bool success = single_failure(fixture.collector, 1, ErrorKind::PermissionDenied) &&
                   fixture.log->invocations == 0 && fixture.adapter->calls("prompt_permission") == 0;

    if (success) {
        std::cout << "  OK: Denied permission short-circuits the handler" << std::endl;
    } else {
        std::cout << "  FAIL: Denied permission reached the handler or prompted" << std::endl;
    }
    return success;
}

// Test: Restricted behaves like denied.
static bool test_restricted_permission_denied() {
    Fixture fixture;
    build_fixture(fixture, std::chrono::milliseconds(1000));
    fixture.adapter->set_os_permission(PermissionKind::Location, PermissionState::Restricted);
    fixture.dispatcher->dispatch(make_request(1, "test.gated"));

    bool success = single_failure(fixture.collector, 1, ErrorKind::PermissionDenied) &&
                   fixture.log->invocations == 0;

    if (success) {
        std::cout << "  OK: Restricted permission denies the call" << std::endl;
    } else {
        std::cout << "  FAIL: Restricted permission did not deny" << std::endl;
    }
    return success;
}

// Test: Two gated calls while notDetermined share one prompt, then both run.
static bool test_gated_calls_share_prompt() {
    Fixture fixture;
    build_fixture(fixture, std::chrono::milliseconds(1000));
    fixture.dispatcher->dispatch(make_request(1, "test.gated"));
    fixture.dispatcher->dispatch(make_request(2, "test.gated"));

    bool waiting = fixture.collector.count() == 0 && fixture.adapter->calls("prompt_permission") == 1;
    fixture.adapter->answer_prompts(PermissionKind::Location, PermissionState::Granted);

    std::vector<call_dispatcher::CallResult> first = fixture.collector.results_for(1);
    std::vector<call_dispatcher::CallResult> second = fixture.collector.results_for(2);
    bool success = waiting && first.size() == 1 && first[0].success && second.size() == 1 && second[0].success &&
                   fixture.log->invocations == 2;

    if (success) {
        std::cout << "  OK: Concurrent gated calls share one prompt" << std::endl;
    } else {
        std::cout << "  FAIL: Prompt sharing (prompts " << fixture.adapter->calls("prompt_permission") << ")"
                  << std::endl;
    }
    return success;
}

// Test: A call waiting on a prompt and a call after it both fail once the user declines; no second prompt.
static bool test_declined_prompt_not_shown_again() {
    Fixture fixture;
    build_fixture(fixture, std::chrono::milliseconds(1000));
    fixture.dispatcher->dispatch(make_request(1, "test.gated"));
    fixture.dispatcher->dispatch(make_request(2, "test.gated"));
    // Dismissed: the OS still reports notDetermined afterwards.
    size_t answered = fixture.adapter->answer_prompts(PermissionKind::Location, PermissionState::NotDetermined);
    fixture.dispatcher->dispatch(make_request(3, "test.gated"));

    bool success = answered == 1 && single_failure(fixture.collector, 1, ErrorKind::PermissionDenied) &&
                   single_failure(fixture.collector, 2, ErrorKind::PermissionDenied) &&
                   single_failure(fixture.collector, 3, ErrorKind::PermissionDenied) &&
                   fixture.adapter->calls("prompt_permission") == 1 && fixture.log->invocations == 0 &&
                   fixture.adapter->pending_prompt_count(PermissionKind::Location) == 0;

    if (success) {
        std::cout << "  OK: Declined permission fails later calls without prompting again" << std::endl;
    } else {
        std::cout << "  FAIL: Declined permission (prompts " << fixture.adapter->calls("prompt_permission")
                  << ", results " << fixture.collector.count() << ")" << std::endl;
    }
    return success;
}

// Test: The call timeout does not run while the permission prompt is showing.
static bool test_timeout_excludes_prompt() {
    Fixture fixture;
    build_fixture(fixture, std::chrono::milliseconds(50));
    fixture.dispatcher->dispatch(make_request(1, "test.gated"));
    std::this_thread::sleep_for(std::chrono::milliseconds(150));
    bool nothing_yet = fixture.collector.count() == 0;
    fixture.adapter->answer_prompts(PermissionKind::Location, PermissionState::Granted);

    std::vector<call_dispatcher::CallResult> results = fixture.collector.results_for(1);
    bool success = nothing_yet && results.size() == 1 && results[0].success;

    if (success) {
        std::cout << "  OK: Slow prompt answer does not cause a Timeout" << std::endl;
    } else {
        std::cout << "  FAIL: Prompt time counted against the call timeout" << std::endl;
    }
    return success;
}

// Test: A timed-out call gets exactly one Timeout; the late real result is dropped.
static bool test_timeout_then_late_completion() {
    Fixture fixture;
    build_fixture(fixture, std::chrono::milliseconds(50));
    fixture.dispatcher->dispatch(make_request(7, "test.parked"));

    bool timed_out = fixture.collector.wait_for_count(1, 2000);
    for (auto &done : fixture.log->parked) {
        done(platform::make_success("late"));
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(50));

    bool success = timed_out && single_failure(fixture.collector, 7, ErrorKind::Timeout) &&
                   fixture.collector.count() == 1 && fixture.dispatcher->outstanding_count() == 0;

    if (success) {
        std::cout << "  OK: Timeout delivered once, late completion dropped" << std::endl;
    } else {
        std::cout << "  FAIL: Results after timeout: " << fixture.collector.count() << std::endl;
    }
    return success;
}

// Test: Interactive contracts are never timed out.
static bool test_interactive_has_no_timeout() {
    Fixture fixture;
    build_fixture(fixture, std::chrono::milliseconds(30));
    fixture.dispatcher->dispatch(make_request(1, "test.interactive"));
    std::this_thread::sleep_for(std::chrono::milliseconds(120));
    bool nothing_yet = fixture.collector.count() == 0;

    for (auto &done : fixture.log->parked) {
        done(platform::make_success(true));
    }
    std::vector<call_dispatcher::CallResult> results = fixture.collector.results_for(1);
    bool success = nothing_yet && results.size() == 1 && results[0].success;

    if (success) {
        std::cout << "  OK: Interactive call waits for the user" << std::endl;
    } else {
        std::cout << "  FAIL: Interactive call timed out" << std::endl;
    }
    return success;
}

// Test: A handler completing twice yields one result carrying the first value.
static bool test_duplicate_completion_dropped() {
    Fixture fixture;
    build_fixture(fixture, std::chrono::milliseconds(1000));
    fixture.dispatcher->dispatch(make_request(3, "test.doubled"));

    std::vector<call_dispatcher::CallResult> results = fixture.collector.results_for(3);
    bool success = results.size() == 1 && results[0].success && results[0].value == 1;

    if (success) {
        std::cout << "  OK: First completion wins" << std::endl;
    } else {
        std::cout << "  FAIL: Duplicate completion produced " << results.size() << " results" << std::endl;
    }
    return success;
}

// Test: Reusing an outstanding correlation id is refused; the original call survives.
static bool test_duplicate_correlation_id() {
    Fixture fixture;
    build_fixture(fixture, std::chrono::milliseconds(1000));
    fixture.dispatcher->dispatch(make_request(5, "test.parked"));
    fixture.dispatcher->dispatch(make_request(5, "test.immediate"));

    bool refused = single_failure(fixture.collector, 5, ErrorKind::InvalidArguments);
    for (auto &done : fixture.log->parked) {
        done(platform::make_success("original"));
    }
    std::vector<call_dispatcher::CallResult> results = fixture.collector.results_for(5);
    bool success = refused && results.size() == 2 && results[1].success && results[1].value == "original";

    if (success) {
        std::cout << "  OK: Duplicate correlation id refused" << std::endl;
    } else {
        std::cout << "  FAIL: Duplicate correlation id handling wrong" << std::endl;
    }
    return success;
}

// Test: A throwing handler becomes OperationFailed.
static bool test_handler_exception_becomes_operation_failed() {
    Fixture fixture;
    build_fixture(fixture, std::chrono::milliseconds(1000));
    fixture.dispatcher->dispatch(make_request(9, "test.throwing"));

    std::vector<call_dispatcher::CallResult> results = fixture.collector.results_for(9);
    bool success = results.size() == 1 && !results[0].success &&
                   results[0].error_kind == ErrorKind::OperationFailed &&
                   results[0].error_message == "device unplugged";

    if (success) {
        std::cout << "  OK: Handler exception reported as OperationFailed" << std::endl;
    } else {
        std::cout << "  FAIL: Handler exception not converted" << std::endl;
    }
    return success;
}

// Test: Disposal resolves outstanding calls with BridgeDisposed and refuses new ones.
static bool test_dispose_resolves_outstanding() {
    Fixture fixture;
    build_fixture(fixture, std::chrono::milliseconds(1000));
    fixture.dispatcher->dispatch(make_request(1, "test.parked"));
    fixture.dispatcher->dispose();
    fixture.dispatcher->dispatch(make_request(2, "test.immediate"));
    for (auto &done : fixture.log->parked) {
        done(platform::make_success("late"));
    }

    bool success = single_failure(fixture.collector, 1, ErrorKind::BridgeDisposed) &&
                   single_failure(fixture.collector, 2, ErrorKind::BridgeDisposed) &&
                   fixture.collector.count() == 2 && fixture.dispatcher->is_disposed();

    if (success) {
        std::cout << "  OK: Dispose resolves outstanding calls once" << std::endl;
    } else {
        std::cout << "  FAIL: Dispose produced " << fixture.collector.count() << " results" << std::endl;
    }
    return success;
}

// Test: Disposal while a prompt is showing resolves the call once; the later answer runs nothing.
static bool test_dispose_during_prompt() {
    Fixture fixture;
    build_fixture(fixture, std::chrono::milliseconds(1000));
    fixture.dispatcher->dispatch(make_request(1, "test.gated"));
    fixture.dispatcher->dispose();
    fixture.adapter->answer_prompts(PermissionKind::Location, PermissionState::Granted);

    bool success = single_failure(fixture.collector, 1, ErrorKind::BridgeDisposed) &&
                   fixture.collector.count() == 1 && fixture.log->invocations == 0;

    if (success) {
        std::cout << "  OK: Prompt answered after dispose is ignored" << std::endl;
    } else {
        std::cout << "  FAIL: Prompt answer after dispose invoked handler" << std::endl;
    }
    return success;
}

bool run_all_tests() {
    bool all_passed = true;
    all_passed &= test_unknown_capability();
    all_passed &= test_invalid_arguments_before_unavailable();
    all_passed &= test_denied_permission_never_invokes();
    all_passed &= test_restricted_permission_denied();
    all_passed &= test_gated_calls_share_prompt();
    all_passed &= test_declined_prompt_not_shown_again();
    all_passed &= test_timeout_excludes_prompt();
    all_passed &= test_timeout_then_late_completion();
    all_passed &= test_interactive_has_no_timeout();
    all_passed &= test_duplicate_completion_dropped();
    all_passed &= test_duplicate_correlation_id();
    all_passed &= test_handler_exception_becomes_operation_failed();
    all_passed &= test_dispose_resolves_outstanding();
    all_passed &= test_dispose_during_prompt();
    return all_passed;
}

} // namespace test_dispatcher
