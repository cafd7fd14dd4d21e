#include <tracksim/core/config.hpp>

namespace tracksim::core {

std::string_view to_string(SchedulingPolicy policy) noexcept {
    switch (policy) {
        case SchedulingPolicy::Synchronous:  return "synchronous";
        case SchedulingPolicy::Asynchronous: return "asynchronous";
    }
    return "unknown";
}

std::optional<SchedulingPolicy> scheduling_policy_from_string(std::string_view name) noexcept {
    if (name == "synchronous" || name == "sync") {
        return SchedulingPolicy::Synchronous;
    }
    if (name == "asynchronous" || name == "async") {
        return SchedulingPolicy::Asynchronous;
    }
    return std::nullopt;
}

} // namespace tracksim::core
