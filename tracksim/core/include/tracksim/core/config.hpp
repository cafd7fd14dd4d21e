#pragma once

#include <tracksim/core/types.hpp>

#include <cstdint>
#include <optional>
#include <string_view>

namespace tracksim::core {

/// @brief How the engine drives time forward. Fixed for the lifetime of an Engine.
/// @ingroup core_engine
enum class SchedulingPolicy {
    /// Every tick, all particles are evaluated against the pre-tick track and
    /// all approved moves commit together at the tick boundary.
    Synchronous,
    /// Each particle owns its next-event time; events are processed one at a
    /// time in (time, priority, insertion) order.
    Asynchronous,
};

/// @brief Return the lowercase name of a policy ("synchronous", "asynchronous").
[[nodiscard]] std::string_view to_string(SchedulingPolicy policy) noexcept;

/// @brief Parse a policy name; accepts "synchronous"/"sync" and "asynchronous"/"async".
[[nodiscard]] std::optional<SchedulingPolicy> scheduling_policy_from_string(std::string_view name) noexcept;

/// @brief Engine configuration, fixed at construction.
/// @ingroup core_engine
struct EngineConfig {
    SchedulingPolicy policy{SchedulingPolicy::Synchronous};

    /// Simulated time covered by one synchronous tick. Must be positive.
    Duration tick_length{duration_from_seconds(1.0)};

    /// Seed of the single random stream handed to rules.
    uint64_t seed{0};

    /// Finish after this many steps (ticks, or events in asynchronous mode).
    std::optional<uint64_t> step_limit;

    /// Finish once simulation time would pass this point.
    std::optional<TimePoint> time_limit;

    /// Verify the occupancy/position bijection after every commit.
    bool check_invariants{true};
};

} // namespace tracksim::core
