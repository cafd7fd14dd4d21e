#pragma once

#include <tracksim/core/event.hpp>

#include <map>

namespace tracksim::core {

class Engine;

/// @brief Provides O(1) cancellation of a queued event by wrapping a map iterator.
/// @ingroup core_events
///
/// The engine keeps one handle per pending step event and one per pending
/// expiry event of every particle, so that removing a particle drops its
/// events without scanning the queue. Default-constructed instances are
/// invalid; only the Engine may create valid handles.
class EventHandle {
    friend class Engine;

public:
    /// @brief Default-construct an invalid handle.
    EventHandle() = default;

    /// @brief Check whether the event is still queued.
    [[nodiscard]] bool valid() const noexcept { return valid_; }

    explicit operator bool() const noexcept { return valid_; }

    /// @brief Mark the handle as no longer valid.
    void clear() noexcept { valid_ = false; }

private:
    using Iterator = std::map<EventKey, Event>::iterator;

    EventHandle(Iterator it) : it_(it), valid_(true) {}

    Iterator it_{};
    bool valid_{false};
};

} // namespace tracksim::core
