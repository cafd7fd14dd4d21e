#pragma once

#include <tracksim/core/trajectory.hpp>

#include <cstdint>
#include <exception>
#include <string_view>

namespace tracksim::core {

/// @brief Why a run call returned.
/// @ingroup core_engine
enum class StopReason {
    RequestedSteps,  ///< run(n) executed its n steps.
    Deadline,        ///< run_until(t) reached t.
    StepLimit,       ///< EngineConfig::step_limit reached (engine finished).
    TimeLimit,       ///< EngineConfig::time_limit reached (engine finished).
    NoLiveParticles, ///< Only markers are left (engine finished).
    StopRequested,   ///< Engine::request_stop() was honoured.
    QueueEmpty,      ///< Asynchronous queue drained (engine finished).
    Failed,          ///< A step raised an exception (engine finished).
};

/// @brief Return the snake_case name of a stop reason.
[[nodiscard]] std::string_view to_string(StopReason reason) noexcept;

/// @brief Outcome of Engine::run() or Engine::run_until().
///
/// A failing step does not throw out of the run call. The exception is
/// captured in @ref error together with everything committed before it,
/// so the caller can inspect the partial trajectory and then rethrow
/// the original exception unchanged.
///
/// @code
/// auto result = engine.run(100);
/// save(result.entries);
/// result.rethrow_if_failed();
/// @endcode
///
/// @ingroup core_engine
struct RunResult {
    uint64_t steps{0};                          ///< Steps executed by this call.
    StopReason reason{StopReason::RequestedSteps};
    Trajectory entries;                         ///< Entries committed by this call.
    std::exception_ptr error;                   ///< Set when reason is Failed.

    [[nodiscard]] bool ok() const noexcept { return !error; }

    /// @brief Rethrow the captured exception, if any.
    void rethrow_if_failed() const {
        if (error) {
            std::rethrow_exception(error);
        }
    }
};

} // namespace tracksim::core
