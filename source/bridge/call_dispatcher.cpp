#include "bridge/call_dispatcher.hpp"
#include "bridge/argument_schema.hpp"
#include "utils/log_sink.hpp"

#include <exception>

namespace call_dispatcher {

using bridge_error::ErrorKind;
using capability_contract::PermissionState;

CallDispatcher::CallDispatcher(std::shared_ptr<const capability_registry::CapabilityRegistry> registry,
                               std::shared_ptr<permission_gate::PermissionGate> gate,
                               ResultSink sink,
                               DispatcherOptions options)
    : registry_(std::move(registry)),
      gate_(std::move(gate)),
      sink_(std::move(sink)),
      options_(options) {}

CallDispatcher::~CallDispatcher() {
    timer_.shutdown();
}

void CallDispatcher::dispatch(const CallRequest &request) {
    const uint64_t id = request.correlation_id;

    if (is_disposed()) {
        reject(id, request.capability, ErrorKind::BridgeDisposed, "bridge instance has been disposed");
        return;
    }

    const capability_registry::RegistryEntry *entry = registry_->resolve(request.capability);
    if (entry == nullptr) {
        reject(id, request.capability, ErrorKind::UnknownCapability, "unknown capability: " + request.capability);
        return;
    }

    argument_schema::ValidationResult validation =
        argument_schema::validate(entry->contract.argument_schema, request.arguments);
    if (!validation.valid) {
        reject(id, request.capability, ErrorKind::InvalidArguments, validation.error_detail);
        return;
    }

    if (!entry->available) {
        reject(id, request.capability, ErrorKind::CapabilityUnavailable,
               request.capability + " is not available on " + platform::os_family_name(registry_->running_os()));
        return;
    }

    switch (admit(id, request.capability)) {
    case Admission::Admitted:
        break;
    case Admission::Disposed:
        reject(id, request.capability, ErrorKind::BridgeDisposed, "bridge instance has been disposed");
        return;
    case Admission::DuplicateId:
        // The outstanding call keeps its id; only this request is refused.
        reject(id, request.capability, ErrorKind::InvalidArguments,
               "correlation id " + std::to_string(id) + " is already outstanding");
        return;
    }

    if (!entry->contract.required_permission) {
        invoke(id, entry, request.arguments);
        return;
    }

    // Prompts only from notDetermined; a denied state fails the call without asking again.
    capability_contract::PermissionKind kind = *entry->contract.required_permission;
    std::weak_ptr<CallDispatcher> weak_self = shared_from_this();
    json arguments = request.arguments;
    gate_->require(kind, [weak_self, id, entry, arguments](PermissionState resolved) {
        if (std::shared_ptr<CallDispatcher> self = weak_self.lock()) {
            self->after_permission(id, entry, arguments, resolved);
        }
    });
}

void CallDispatcher::dispose() {
    std::map<uint64_t, PendingCall> outstanding;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (disposed_) {
            return;
        }
        disposed_ = true;
        outstanding.swap(pending_);
    }

    log_sink::debug("bridge " + std::to_string(options_.bridge_id) + " dispatcher disposing, " +
                    std::to_string(outstanding.size()) + " call(s) outstanding");
    for (const auto &pair : outstanding) {
        if (pair.second.timer_id != 0) {
            timer_.cancel(pair.second.timer_id);
        }
        CallResult result;
        result.correlation_id = pair.first;
        result.success = false;
        result.error_kind = ErrorKind::BridgeDisposed;
        result.error_message = "bridge instance disposed before the call completed";
        deliver(result, pair.second.capability);
    }
    timer_.shutdown();
}

bool CallDispatcher::is_disposed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return disposed_;
}

size_t CallDispatcher::outstanding_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.size();
}

CallDispatcher::Admission CallDispatcher::admit(uint64_t correlation_id, const std::string &capability) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (disposed_) {
        return Admission::Disposed;
    }
    if (pending_.count(correlation_id) > 0) {
        return Admission::DuplicateId;
    }
    PendingCall pending;
    pending.capability = capability;
    pending_.emplace(correlation_id, pending);
    return Admission::Admitted;
}

void CallDispatcher::after_permission(uint64_t correlation_id, const capability_registry::RegistryEntry *entry,
                                      const json &arguments, PermissionState state) {
    if (state != PermissionState::Granted) {
        complete(correlation_id,
                 platform::make_failure(ErrorKind::PermissionDenied,
                                        std::string(capability_contract::permission_name(
                                            *entry->contract.required_permission)) +
                                            " permission is " + capability_contract::permission_state_name(state)));
        return;
    }
    invoke(correlation_id, entry, arguments);
}

void CallDispatcher::invoke(uint64_t correlation_id, const capability_registry::RegistryEntry *entry,
                            const json &arguments) {
    std::weak_ptr<CallDispatcher> weak_self = shared_from_this();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto iterator = pending_.find(correlation_id);
        if (iterator == pending_.end()) {
            // Disposed while waiting for the permission prompt.
            return;
        }
        if (!entry->contract.interactive) {
            iterator->second.timer_id = timer_.schedule(options_.call_timeout, [weak_self, correlation_id]() {
                if (std::shared_ptr<CallDispatcher> self = weak_self.lock()) {
                    self->complete(correlation_id,
                                   platform::make_failure(ErrorKind::Timeout, "operation did not complete in time"));
                }
            });
        }
    }

    platform::OutcomeCallback done = [weak_self, correlation_id](const platform::AdapterOutcome &outcome) {
        if (std::shared_ptr<CallDispatcher> self = weak_self.lock()) {
            self->complete(correlation_id, outcome);
        }
    };

    try {
        entry->handler(arguments, done);
    } catch (const std::exception &exception) {
        log_sink::error(entry->contract.name + " handler threw: " + exception.what());
        complete(correlation_id, platform::make_failure(ErrorKind::OperationFailed, exception.what()));
    } catch (...) {
        log_sink::error(entry->contract.name + " handler threw a non-standard exception");
        complete(correlation_id, platform::make_failure(ErrorKind::OperationFailed, "handler raised an unknown error"));
    }
}

void CallDispatcher::complete(uint64_t correlation_id, const platform::AdapterOutcome &outcome) {
    PendingCall finished;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto iterator = pending_.find(correlation_id);
        if (iterator == pending_.end()) {
            log_sink::debug("bridge " + std::to_string(options_.bridge_id) + " dropped late result for call " +
                            std::to_string(correlation_id));
            return;
        }
        finished = iterator->second;
        pending_.erase(iterator);
    }

    if (finished.timer_id != 0) {
        timer_.cancel(finished.timer_id);
    }
    if (!outcome.success && outcome.error_kind == ErrorKind::Timeout) {
        log_sink::warning(finished.capability + " call " + std::to_string(correlation_id) + " timed out");
    }

    CallResult result;
    result.correlation_id = correlation_id;
    result.success = outcome.success;
    if (outcome.success) {
        result.value = outcome.value;
    } else {
        result.error_kind = outcome.error_kind;
        result.error_message = outcome.error_detail;
    }
    deliver(result, finished.capability);
}

void CallDispatcher::reject(uint64_t correlation_id, const std::string &capability, ErrorKind kind,
                            const std::string &message) {
    CallResult result;
    result.correlation_id = correlation_id;
    result.success = false;
    result.error_kind = kind;
    result.error_message = message;
    deliver(result, capability);
}

void CallDispatcher::deliver(const CallResult &result, const std::string &capability) {
    log_sink::debug("bridge " + std::to_string(options_.bridge_id) + " call " +
                    std::to_string(result.correlation_id) + " " + capability + " -> " +
                    (result.success ? std::string("ok") : std::string(bridge_error::kind_name(result.error_kind))));
    try {
        sink_(result);
    } catch (const std::exception &exception) {
        log_sink::error(std::string("result sink threw: ") + exception.what());
    }
}

} // namespace call_dispatcher
