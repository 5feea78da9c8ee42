#include "bridge/permission_gate.hpp"
#include "utils/log_sink.hpp"

#include <exception>

namespace permission_gate {

using capability_contract::permission_name;
using capability_contract::permission_state_name;

PermissionGate::PermissionGate(std::shared_ptr<platform::PlatformAdapter> adapter)
    : adapter_(std::move(adapter)) {}

PermissionGate::Slot &PermissionGate::slot_locked(PermissionKind kind) const {
    Slot &slot = slots_[kind];
    if (!slot.seeded) {
        slot.state = adapter_->query_permission(kind);
        slot.seeded = true;
        log_sink::debug(std::string("permission ") + permission_name(kind) + " seeded as " +
                        permission_state_name(slot.state));
    }
    return slot;
}

PermissionState PermissionGate::check(PermissionKind kind) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return slot_locked(kind).state;
}

PermissionState PermissionGate::refresh(PermissionKind kind) {
    std::lock_guard<std::mutex> lock(mutex_);
    Slot &slot = slot_locked(kind);
    if (slot.prompt_in_flight) {
        return slot.state;
    }
    return poll_locked(kind, slot);
}

PermissionState PermissionGate::poll_locked(PermissionKind kind, Slot &slot) {
    PermissionState reported = adapter_->query_permission(kind);
    PermissionState previous = slot.state;
    switch (previous) {
    case PermissionState::NotDetermined:
        slot.state = reported;
        break;
    case PermissionState::Granted:
        if (reported == PermissionState::Denied || reported == PermissionState::Restricted) {
            slot.state = reported;
        }
        break;
    case PermissionState::Denied:
        if (reported == PermissionState::Restricted) {
            slot.state = reported;
        }
        break;
    case PermissionState::Restricted:
        break;
    }

    if (slot.state != previous) {
        log_sink::info(std::string("permission ") + permission_name(kind) + " changed externally: " +
                       permission_state_name(previous) + " -> " + permission_state_name(slot.state));
    }
    return slot.state;
}

void PermissionGate::request(PermissionKind kind, StateCallback on_resolved) {
    PermissionState immediate = PermissionState::NotDetermined;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        Slot &slot = slot_locked(kind);
        if (slot.state == PermissionState::Granted || slot.state == PermissionState::Restricted) {
            immediate = slot.state;
        } else if (slot.prompt_in_flight) {
            slot.waiters.push_back(std::move(on_resolved));
            log_sink::debug(std::string("permission ") + permission_name(kind) +
                            " prompt already showing, request coalesced");
            return;
        } else {
            slot.prompt_in_flight = true;
            slot.waiters.push_back(std::move(on_resolved));
        }
    }

    if (immediate != PermissionState::NotDetermined) {
        on_resolved(immediate);
        return;
    }
    start_prompt(kind);
}

void PermissionGate::require(PermissionKind kind, StateCallback on_resolved) {
    PermissionState immediate = PermissionState::NotDetermined;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        Slot &slot = slot_locked(kind);
        if (slot.prompt_in_flight) {
            slot.waiters.push_back(std::move(on_resolved));
            log_sink::debug(std::string("permission ") + permission_name(kind) +
                            " prompt already showing, call waits for its answer");
            return;
        }
        immediate = poll_locked(kind, slot);
        if (immediate == PermissionState::NotDetermined) {
            slot.prompt_in_flight = true;
            slot.waiters.push_back(std::move(on_resolved));
        }
    }

    if (immediate != PermissionState::NotDetermined) {
        on_resolved(immediate);
        return;
    }
    start_prompt(kind);
}

void PermissionGate::start_prompt(PermissionKind kind) {
    log_sink::info(std::string("prompting for ") + permission_name(kind) + " permission");
    std::shared_ptr<PermissionGate> self = shared_from_this();
    try {
        adapter_->prompt_permission(kind, [self, kind](PermissionState answer) {
            self->finish_prompt(kind, answer);
        });
    } catch (const std::exception &exception) {
        log_sink::error(std::string("permission prompt failed: ") + exception.what());
        finish_prompt(kind, PermissionState::Denied);
    }
}

bool PermissionGate::is_prompting(PermissionKind kind) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto iterator = slots_.find(kind);
    return iterator != slots_.end() && iterator->second.prompt_in_flight;
}

void PermissionGate::finish_prompt(PermissionKind kind, PermissionState answer) {
    PermissionState resolved = (answer == PermissionState::NotDetermined) ? PermissionState::Denied : answer;
    std::vector<StateCallback> waiters;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        Slot &slot = slots_[kind];
        if (!slot.prompt_in_flight) {
            // Adapter answered the same prompt twice.
            return;
        }
        slot.state = resolved;
        slot.prompt_in_flight = false;
        waiters.swap(slot.waiters);
    }

    log_sink::info(std::string("permission ") + permission_name(kind) + " resolved as " +
                   permission_state_name(resolved) + " for " + std::to_string(waiters.size()) + " waiter(s)");
    for (auto &waiter : waiters) {
        waiter(resolved);
    }
}

} // namespace permission_gate
