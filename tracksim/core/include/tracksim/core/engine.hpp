#pragma once

#include <tracksim/core/checkpoint.hpp>
#include <tracksim/core/config.hpp>
#include <tracksim/core/event.hpp>
#include <tracksim/core/event_handle.hpp>
#include <tracksim/core/particle.hpp>
#include <tracksim/core/rule.hpp>
#include <tracksim/core/rule_set.hpp>
#include <tracksim/core/run_result.hpp>
#include <tracksim/core/trace_writer.hpp>
#include <tracksim/core/track.hpp>
#include <tracksim/core/trajectory.hpp>
#include <tracksim/core/types.hpp>

#include <cstddef>
#include <cstdint>
#include <exception>
#include <functional>
#include <map>
#include <optional>
#include <span>
#include <string_view>
#include <utility>
#include <vector>

namespace tracksim::core {

/// @brief Phase of the engine state machine.
/// @ingroup core_engine
enum class EngineState {
    Idle,       ///< Between steps.
    Stepping,   ///< Stepping rules are being evaluated.
    Resolving,  ///< Intents are being checked and collisions resolved.
    Committing, ///< Approved changes are being applied.
    Finished,   ///< Terminal; no further steps are accepted.
};

/// @brief Return the lowercase name of an engine state.
[[nodiscard]] std::string_view to_string(EngineState state) noexcept;

/// @brief Read-only view handed to the observer after each committed step.
/// @ingroup core_engine
struct Snapshot {
    uint64_t step;
    TimePoint time;
    const Track& track;
    const ParticleRegistry& particles;
    std::span<const TrajectoryEntry> committed; ///< Entries committed by this step.
};

/// @brief Rule-driven simulation engine for particles on a 1-D track.
///
/// The Engine owns the track, the particles and its copy of the rule set.
/// Each step it asks the particles' stepping rules what they want to do,
/// resolves conflicts through collision rules, commits the approved
/// changes atomically and appends one trajectory entry per change.
///
/// Two scheduling policies exist (see SchedulingPolicy). Under synchronous
/// scheduling a step is one tick: every particle decides against the
/// pre-tick track, same-target contests go to the lower particle id, and
/// all approved changes commit at the tick boundary. Under asynchronous
/// scheduling a step is one event popped from an ordered queue, and the
/// rule's waiting time decides when the particle acts again.
///
/// The Engine is non-copyable and non-movable, designed for stack
/// allocation. A typical usage pattern is:
///
/// @code
/// core::RuleSet rules;
/// rules.declare_trait("walker");
/// rules.bind_stepping("walker", walker_rule);
///
/// core::Engine engine(core::Track(100, core::BoundaryMode::Closed), std::move(rules));
/// engine.add_particle({10, {"walker"}, {}});
/// auto result = engine.run(50);
/// result.rethrow_if_failed();
/// @endcode
///
/// @see RuleSet, Track, TraceWriter
/// @ingroup core_engine
class Engine {
public:
    /// @brief Callback invoked once per committed step.
    using Observer = std::function<void(const Snapshot&)>;

    /// @brief Construct an engine.
    ///
    /// In marked mode the `track_end` tag is declared if missing and two
    /// marker particles are registered at both end sites (ids 0 and 1).
    ///
    /// @param track Empty track defining length and boundary mode.
    /// @param rules Trait and rule registry; copied into the engine.
    /// @param config Scheduling policy, tick length, seed and limits.
    /// @throws ConfigurationError on a non-positive tick length, an empty or
    ///         pre-populated track, a marked track shorter than two sites, or
    ///         a `track_end` trait that is not a tag.
    Engine(Track track, RuleSet rules, EngineConfig config = {});
    ~Engine();

    Engine(const Engine&) = delete;
    Engine& operator=(const Engine&) = delete;
    Engine(Engine&&) = delete;
    Engine& operator=(Engine&&) = delete;

    /// @name Setup
    /// @{

    /// @brief Register a particle before the first step.
    ///
    /// A spec without a position is placed on a uniformly random free site
    /// drawn from the engine's random stream.
    ///
    /// @return The new particle's id (creation order, starting at 0).
    /// @throws InvalidStateError if the engine is finalized.
    /// @throws ConfigurationError on an undeclared or duplicate trait, or
    ///         if the particle could not act (see RuleSet::require_stepping).
    /// @throws OutOfRangeError if the position lies outside the track.
    /// @throws OccupiedError if the site is taken or no free site exists.
    ParticleId add_particle(const ParticleSpec& spec);

    /// @brief Lock setup and prepare the first step.
    ///
    /// Called implicitly by the first step. Under asynchronous scheduling
    /// each non-marker particle gets its first stepping opportunity at its
    /// creation time, in ascending id order, and its expiry is queued.
    void finalize();

    /// @brief Returns true if the engine has been finalized.
    [[nodiscard]] bool is_finalized() const noexcept { return finalized_; }

    /// @}

    /// @name Driving
    /// @{

    /// @brief Execute exactly one step.
    ///
    /// If a termination condition already holds, the engine finishes and
    /// an empty list is returned. An exception raised during the step
    /// finishes the engine and propagates unchanged.
    ///
    /// @return Entries committed by the step.
    /// @throws InvalidStateError if the engine has finished.
    Trajectory step_once();

    /// @brief Execute up to @p steps steps.
    ///
    /// Stops early on a termination condition, a stop request, or a
    /// failure. Failures are captured in the result rather than thrown.
    ///
    /// @throws InvalidStateError if the engine has finished.
    RunResult run(std::size_t steps);

    /// @brief Execute steps until simulation time would pass @p until.
    ///
    /// Under synchronous scheduling the last tick executed is the last one
    /// whose boundary is not after @p until. Under asynchronous scheduling
    /// all events up to and including @p until are processed and time is
    /// then advanced to @p until.
    ///
    /// @throws InvalidStateError if the engine has finished.
    RunResult run_until(TimePoint until);

    /// @brief Request a stop after the current step commits.
    ///
    /// Auto-resets at the start of each run() or run_until() call.
    void request_stop() noexcept { stop_requested_ = true; }

    /// @brief Returns true if a stop has been requested.
    [[nodiscard]] bool stop_requested() const noexcept { return stop_requested_; }

    /// @}

    /// @name State
    /// @{

    [[nodiscard]] EngineState state() const noexcept { return state_; }
    [[nodiscard]] bool finished() const noexcept { return state_ == EngineState::Finished; }

    /// @brief Why the engine finished, if it has.
    [[nodiscard]] std::optional<StopReason> finish_reason() const noexcept { return finish_reason_; }

    /// @brief The exception that finished the engine, if any.
    [[nodiscard]] std::exception_ptr failure() const noexcept { return failure_; }

    /// @brief Returns the current simulation time.
    [[nodiscard]] TimePoint time() const noexcept { return current_time_; }

    /// @brief Number of steps executed so far.
    [[nodiscard]] uint64_t step_index() const noexcept { return step_; }

    [[nodiscard]] const Track& track() const noexcept { return track_; }
    [[nodiscard]] const ParticleRegistry& particles() const noexcept { return particles_; }

    /// @brief Access a particle.
    /// @throws OutOfRangeError if no particle has this id.
    [[nodiscard]] const Particle& particle(ParticleId id) const;

    [[nodiscard]] bool contains(ParticleId id) const noexcept { return particles_.contains(id); }

    /// @brief Number of non-marker particles on the track.
    [[nodiscard]] std::size_t live_particle_count() const;

    [[nodiscard]] const RuleSet& rules() const noexcept { return rules_; }
    [[nodiscard]] const EngineConfig& config() const noexcept { return config_; }

    /// @brief Every entry committed since construction, in commit order.
    [[nodiscard]] const Trajectory& trajectory() const noexcept { return trajectory_; }

    /// @brief Number of queued asynchronous events.
    [[nodiscard]] std::size_t pending_event_count() const noexcept { return event_queue_.size(); }

    /// @}

    /// @name Observation
    /// @{

    /// @brief Install the observer called after every committed step.
    /// Pass an empty function to remove it.
    void set_observer(Observer observer) { observer_ = std::move(observer); }

    /// @brief Set the trace writer for simulation event logging.
    ///
    /// The Engine does not own the writer. Pass nullptr to disable tracing.
    void set_trace_writer(TraceWriter* writer) noexcept { trace_writer_ = writer; }

    /// @brief Invoke a tracing callback only if a trace writer is set.
    ///
    /// @tparam F Callable with signature void(TraceWriter&).
    /// @param func Callback that writes trace data.
    template<typename F>
    void trace(F&& func);

    /// @}

    /// @name Checkpointing
    /// @{

    /// @brief Capture the complete resumable state.
    [[nodiscard]] Checkpoint checkpoint() const;

    /// @brief Replace the engine's state with @p saved.
    ///
    /// The engine must have been built with the same track length, boundary
    /// mode and scheduling policy, and its rule set must declare every
    /// trait named in the checkpoint. The observer and trace writer are
    /// kept. A finished engine becomes runnable again.
    ///
    /// The saved particles are checked before anything is replaced, so a
    /// rejected checkpoint leaves the engine untouched.
    ///
    /// @throws InvalidStateError if the geometry or policy differ.
    /// @throws ConfigurationError if a trait is not declared, or a saved
    ///         particle could not act (see RuleSet::require_stepping).
    /// @throws InvariantViolation if the saved track occupancy and particle
    ///         positions disagree, e.g. two records share an id.
    void restore(const Checkpoint& saved);

    /// @}

private:
    /// One particle's site change within a plan.
    struct Change {
        ParticleId particle;
        Site from;
        std::optional<Site> to;
        EventKind kind;
    };

    /// Changes that must commit together.
    struct Plan {
        std::vector<Change> changes;
        std::vector<ParticleId> involved; ///< Unchanged parties whose state the plan relies on.
    };

    struct ScheduledEvents {
        EventHandle step;
        EventHandle expiry;
    };

    RuleContext make_context(uint64_t step) noexcept;

    ParticleId create_particle(Site site, std::vector<TraitId> traits, StateMap state,
                               EventKind kind, uint64_t step);
    std::optional<Site> random_free_site();

    RunResult drive(std::optional<std::size_t> max_steps, std::optional<TimePoint> until);
    std::optional<StopReason> termination_reason() const;
    std::optional<TimePoint> next_step_time() const;
    void finish(StopReason reason);
    void execute_step();

    void execute_tick();
    void execute_event();
    void handle_step_event(ParticleId id, uint64_t step);
    void handle_expiry_event(ParticleId id, uint64_t step);

    std::optional<Plan> resolve_move(Particle& mover, Site target, EventKind kind,
                                     const RuleContext& ctx);
    std::optional<Plan> resolve_boundary(const Particle& mover, Site target);
    void validate_adjacent(const Particle& particle, Site target) const;

    void commit(const std::vector<Plan>& plans, uint64_t step, std::vector<ParticleSpec>& spawns);
    void finalize_removal(ParticleId id, uint64_t step, std::vector<ParticleSpec>& spawns);
    void apply_spawns(std::vector<ParticleSpec>& spawns, uint64_t step);
    void append_entry(const TrajectoryEntry& entry);
    void check_invariants() const;
    static void check_occupancy(const Track& track, const ParticleRegistry& particles);
    void notify_observer(uint64_t step, std::size_t first_entry);

    void schedule_step(ParticleId id, TimePoint when);
    void schedule_expiry(ParticleId id, uint64_t step);
    void cancel_events(ParticleId id);
    void cancel(EventHandle& handle);

    Track track_;
    RuleSet rules_;
    EngineConfig config_;
    RandomEngine rng_;

    ParticleRegistry particles_;
    Trajectory trajectory_;

    TimePoint current_time_{};
    uint64_t step_{0};
    uint64_t next_id_{0};
    uint64_t sequence_{0};
    EngineState state_{EngineState::Idle};
    std::optional<StopReason> finish_reason_;
    std::exception_ptr failure_;
    bool finalized_{false};
    bool stop_requested_{false};

    std::map<EventKey, Event> event_queue_;
    std::map<ParticleId, ScheduledEvents> scheduled_;

    Observer observer_;
    TraceWriter* trace_writer_{nullptr};
};

// Template implementation
template<typename F>
void Engine::trace(F&& func) {
    if (trace_writer_) {
        trace_writer_->begin(current_time_);
        func(*trace_writer_);
        trace_writer_->end();
    }
}

} // namespace tracksim::core
