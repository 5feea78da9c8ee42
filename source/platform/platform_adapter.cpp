#include "platform/platform_adapter.hpp"

namespace platform {

AdapterOutcome make_success(json value) {
    AdapterOutcome outcome;
    outcome.success = true;
    outcome.value = std::move(value);
    return outcome;
}

AdapterOutcome make_failure(bridge_error::ErrorKind kind, const std::string &detail) {
    AdapterOutcome outcome;
    outcome.success = false;
    outcome.error_kind = kind;
    outcome.error_detail = detail;
    return outcome;
}

} // namespace platform
