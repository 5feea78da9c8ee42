// Tests for routing of CDP events to the attached page's bridge.

#include <nlohmann/json.hpp>
#include <iostream>
#include <string>

#include "host/cdp/cdp_renderer.hpp"

using json = nlohmann::json;

namespace test_cdp_classify {

static const std::string BINDING = "__capbridgeCall";
static const std::string SESSION = "session-A";
static const std::string TARGET = "target-A";

static cdp_renderer::ClassifiedEvent classify(const json &message) {
    return cdp_renderer::classify_event(message, BINDING, SESSION, TARGET);
}

// Test: A binding call on our session carries the payload through.
static bool test_binding_called() {
    json message = {{"method", "Runtime.bindingCalled"},
                    {"sessionId", SESSION},
                    {"params", {{"name", BINDING}, {"payload", "{\"type\":\"call\",\"id\":1}"}, {"executionContextId", 3}}}};
    cdp_renderer::ClassifiedEvent event = classify(message);
    bool success = event.kind == cdp_renderer::EventKind::BindingCalled &&
                   event.payload == "{\"type\":\"call\",\"id\":1}";

    if (success) {
        std::cout << "  OK: Binding call classified with payload" << std::endl;
    } else {
        std::cout << "  FAIL: Binding call not classified" << std::endl;
    }
    return success;
}

// Test: Other bindings and other sessions are ignored.
static bool test_foreign_events_ignored() {
    json other_binding = {{"method", "Runtime.bindingCalled"},
                          {"sessionId", SESSION},
                          {"params", {{"name", "somethingElse"}, {"payload", "x"}}}};
    json other_session = {{"method", "Runtime.bindingCalled"},
                          {"sessionId", "session-B"},
                          {"params", {{"name", BINDING}, {"payload", "x"}}}};
    json unrelated = {{"method", "Network.requestWillBeSent"}, {"sessionId", SESSION}, {"params", json::object()}};

    bool success = classify(other_binding).kind == cdp_renderer::EventKind::Ignored &&
                   classify(other_session).kind == cdp_renderer::EventKind::Ignored &&
                   classify(unrelated).kind == cdp_renderer::EventKind::Ignored;

    if (success) {
        std::cout << "  OK: Foreign events ignored" << std::endl;
    } else {
        std::cout << "  FAIL: Foreign event was routed" << std::endl;
    }
    return success;
}

// Test: A main-frame navigation reports the new URL; subframes are ignored.
static bool test_main_frame_navigation() {
    json main_frame = {{"method", "Page.frameNavigated"},
                       {"sessionId", SESSION},
                       {"params", {{"frame", {{"id", "F1"}, {"url", "https://example.com/next"}}}}}};
    json subframe = {{"method", "Page.frameNavigated"},
                     {"sessionId", SESSION},
                     {"params", {{"frame", {{"id", "F2"}, {"parentId", "F1"}, {"url", "https://ads.example/"}}}}}};

    cdp_renderer::ClassifiedEvent navigated = classify(main_frame);
    bool success = navigated.kind == cdp_renderer::EventKind::MainFrameNavigated &&
                   navigated.url == "https://example.com/next" &&
                   classify(subframe).kind == cdp_renderer::EventKind::Ignored;

    if (success) {
        std::cout << "  OK: Main frame navigation detected, subframe ignored" << std::endl;
    } else {
        std::cout << "  FAIL: Navigation classification wrong" << std::endl;
    }
    return success;
}

// Test: Destruction of our target or detachment of our session ends the page.
static bool test_target_gone() {
    json destroyed = {{"method", "Target.targetDestroyed"}, {"params", {{"targetId", TARGET}}}};
    json detached = {{"method", "Target.detachedFromTarget"},
                     {"params", {{"sessionId", SESSION}, {"targetId", TARGET}}}};
    json other_destroyed = {{"method", "Target.targetDestroyed"}, {"params", {{"targetId", "target-B"}}}};
    json other_detached = {{"method", "Target.detachedFromTarget"}, {"params", {{"sessionId", "session-B"}}}};

    bool success = classify(destroyed).kind == cdp_renderer::EventKind::TargetGone &&
                   classify(detached).kind == cdp_renderer::EventKind::TargetGone &&
                   classify(other_destroyed).kind == cdp_renderer::EventKind::Ignored &&
                   classify(other_detached).kind == cdp_renderer::EventKind::Ignored;

    if (success) {
        std::cout << "  OK: Target loss detected only for the attached page" << std::endl;
    } else {
        std::cout << "  FAIL: Target loss classification wrong" << std::endl;
    }
    return success;
}

// Test: Malformed params do not throw.
static bool test_malformed_event() {
    bool success = true;
    try {
        json no_params = {{"method", "Runtime.bindingCalled"}, {"sessionId", SESSION}};
        json string_params = {{"method", "Page.frameNavigated"}, {"sessionId", SESSION}, {"params", "oops"}};
        success = classify(no_params).kind == cdp_renderer::EventKind::Ignored &&
                  classify(string_params).kind == cdp_renderer::EventKind::Ignored &&
                  classify(json::object()).kind == cdp_renderer::EventKind::Ignored;
    } catch (const json::exception &error) {
        std::cout << "  FAIL: Malformed event threw: " << error.what() << std::endl;
        return false;
    }

    if (success) {
        std::cout << "  OK: Malformed events ignored" << std::endl;
    } else {
        std::cout << "  FAIL: Malformed event was routed" << std::endl;
    }
    return success;
}

bool run_all_tests() {
    bool all_passed = true;
    all_passed &= test_binding_called();
    all_passed &= test_foreign_events_ignored();
    all_passed &= test_main_frame_navigation();
    all_passed &= test_target_gone();
    all_passed &= test_malformed_event();
    return all_passed;
}

} // namespace test_cdp_classify
