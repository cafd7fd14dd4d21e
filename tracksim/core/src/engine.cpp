#include <tracksim/core/engine.hpp>
#include <tracksim/core/dispatch.hpp>
#include <tracksim/core/error.hpp>

#include <algorithm>
#include <initializer_list>
#include <random>
#include <set>
#include <sstream>
#include <string>
#include <type_traits>
#include <utility>

namespace tracksim::core {

namespace {

std::string_view outcome_name(CollisionOutcome::Kind kind) noexcept {
    switch (kind) {
        case CollisionOutcome::Kind::Pass:    return "pass";
        case CollisionOutcome::Kind::Blocked: return "blocked";
        case CollisionOutcome::Kind::Swap:    return "swap";
        case CollisionOutcome::Kind::Merge:   return "merge";
        case CollisionOutcome::Kind::Bounce:  return "bounce";
        case CollisionOutcome::Kind::Push:    return "push";
    }
    return "unknown";
}

std::string describe(ParticleId id) {
    return "particle " + std::to_string(id.value);
}

} // namespace

std::string_view to_string(EngineState state) noexcept {
    switch (state) {
        case EngineState::Idle:       return "idle";
        case EngineState::Stepping:   return "stepping";
        case EngineState::Resolving:  return "resolving";
        case EngineState::Committing: return "committing";
        case EngineState::Finished:   return "finished";
    }
    return "unknown";
}

std::string_view to_string(StopReason reason) noexcept {
    switch (reason) {
        case StopReason::RequestedSteps:  return "requested_steps";
        case StopReason::Deadline:        return "deadline";
        case StopReason::StepLimit:       return "step_limit";
        case StopReason::TimeLimit:       return "time_limit";
        case StopReason::NoLiveParticles: return "no_live_particles";
        case StopReason::StopRequested:   return "stop_requested";
        case StopReason::QueueEmpty:      return "queue_empty";
        case StopReason::Failed:          return "failed";
    }
    return "unknown";
}

Engine::Engine(Track track, RuleSet rules, EngineConfig config)
    : track_(std::move(track))
    , rules_(std::move(rules))
    , config_(config)
    , rng_(config.seed) {
    if (config_.tick_length <= Duration::zero()) {
        throw ConfigurationError("Tick length must be positive");
    }
    if (track_.length() == 0) {
        throw ConfigurationError("Track must have at least one site");
    }
    if (track_.occupied_count() != 0) {
        throw ConfigurationError("Track must be empty; particles are registered through the engine");
    }
    if (track_.boundary() == BoundaryMode::Marked) {
        if (track_.length() < 2) {
            throw ConfigurationError("A marked track needs at least two sites");
        }
        TraitId marker = rules_.ensure_tag(RuleSet::TRACK_END);
        const Site last = static_cast<Site>(track_.length()) - 1;
        for (Site site : {Site{0}, last}) {
            create_particle(site, {marker}, {}, EventKind::Place, 0);
        }
    }
}

Engine::~Engine() = default;

// ============================================================================
// Setup
// ============================================================================

ParticleId Engine::add_particle(const ParticleSpec& spec) {
    if (finalized_) {
        throw InvalidStateError("Cannot add particle after finalize()");
    }
    auto traits = rules_.resolve(spec.traits);
    rules_.require_stepping(traits);

    Site site = 0;
    if (spec.position) {
        site = *spec.position;
    } else {
        auto free_site = random_free_site();
        if (!free_site) {
            throw OccupiedError("No free site left for a randomly placed particle");
        }
        site = *free_site;
    }
    return create_particle(site, std::move(traits), spec.state, EventKind::Place, 0);
}

void Engine::finalize() {
    if (finalized_) {
        return;
    }
    finalized_ = true;

    if (config_.policy != SchedulingPolicy::Asynchronous) {
        return;
    }
    for (const auto& [id, particle] : particles_) {
        if (!rules_.is_marker(particle)) {
            schedule_step(id, particle.created_at());
        }
    }
    for (const auto& [id, particle] : particles_) {
        schedule_expiry(id, step_);
    }
}

ParticleId Engine::create_particle(Site site, std::vector<TraitId> traits, StateMap state,
                                   EventKind kind, uint64_t step) {
    ParticleId id{next_id_};
    track_.place(id, site);
    ++next_id_;
    particles_.emplace(id, Particle(id, site, std::move(traits), std::move(state), current_time_));
    append_entry(TrajectoryEntry{step, current_time_, id, std::nullopt, site, kind});
    return id;
}

std::optional<Site> Engine::random_free_site() {
    std::vector<Site> free_sites;
    for (Site site = 0; site < static_cast<Site>(track_.length()); ++site) {
        if (!track_.is_occupied(site)) {
            free_sites.push_back(site);
        }
    }
    if (free_sites.empty()) {
        return std::nullopt;
    }
    std::uniform_int_distribution<std::size_t> pick(0, free_sites.size() - 1);
    return free_sites[pick(rng_)];
}

RuleContext Engine::make_context(uint64_t step) noexcept {
    return RuleContext(track_, particles_, rules_, rng_, current_time_, step, config_.policy);
}

// ============================================================================
// Driving
// ============================================================================

Trajectory Engine::step_once() {
    if (finished()) {
        throw InvalidStateError("Engine has finished; no further steps are accepted");
    }
    finalize();

    if (auto reason = termination_reason()) {
        finish(*reason);
        return {};
    }

    const std::size_t first_entry = trajectory_.size();
    try {
        execute_step();
    } catch (...) {
        failure_ = std::current_exception();
        finish(StopReason::Failed);
        throw;
    }
    return Trajectory(trajectory_.begin() + static_cast<std::ptrdiff_t>(first_entry), trajectory_.end());
}

RunResult Engine::run(std::size_t steps) {
    return drive(steps, std::nullopt);
}

RunResult Engine::run_until(TimePoint until) {
    return drive(std::nullopt, until);
}

RunResult Engine::drive(std::optional<std::size_t> max_steps, std::optional<TimePoint> until) {
    if (finished()) {
        throw InvalidStateError("Engine has finished; no further steps are accepted");
    }
    stop_requested_ = false;
    finalize();

    RunResult result;
    result.reason = until ? StopReason::Deadline : StopReason::RequestedSteps;
    const std::size_t first_entry = trajectory_.size();

    while (!max_steps || result.steps < *max_steps) {
        if (auto reason = termination_reason()) {
            finish(*reason);
            result.reason = *reason;
            break;
        }
        if (until) {
            auto next = next_step_time();
            if (!next || *next > *until) {
                if (config_.policy == SchedulingPolicy::Asynchronous && current_time_ < *until) {
                    current_time_ = *until;
                }
                break;
            }
        }

        try {
            execute_step();
        } catch (...) {
            failure_ = std::current_exception();
            result.error = failure_;
            result.reason = StopReason::Failed;
            finish(StopReason::Failed);
            break;
        }
        ++result.steps;

        if (stop_requested_) {
            result.reason = StopReason::StopRequested;
            break;
        }
    }

    result.entries.assign(trajectory_.begin() + static_cast<std::ptrdiff_t>(first_entry),
                          trajectory_.end());
    return result;
}

std::optional<StopReason> Engine::termination_reason() const {
    if (config_.step_limit && step_ >= *config_.step_limit) {
        return StopReason::StepLimit;
    }
    if (live_particle_count() == 0) {
        return StopReason::NoLiveParticles;
    }
    if (config_.policy == SchedulingPolicy::Asynchronous && event_queue_.empty()) {
        return StopReason::QueueEmpty;
    }
    if (config_.time_limit) {
        auto next = next_step_time();
        if (next && *next > *config_.time_limit) {
            return StopReason::TimeLimit;
        }
    }
    return std::nullopt;
}

std::optional<TimePoint> Engine::next_step_time() const {
    if (config_.policy == SchedulingPolicy::Synchronous) {
        return TimePoint::epoch() + config_.tick_length * static_cast<int64_t>(step_ + 1);
    }
    if (event_queue_.empty()) {
        return std::nullopt;
    }
    return event_queue_.begin()->first.time;
}

void Engine::finish(StopReason reason) {
    state_ = EngineState::Finished;
    finish_reason_ = reason;
    if (reason == StopReason::TimeLimit && config_.policy == SchedulingPolicy::Asynchronous &&
        current_time_ < *config_.time_limit) {
        current_time_ = *config_.time_limit;
    }

    trace([&](TraceWriter& w) {
        w.type("sim_finished");
        w.field("reason", to_string(reason));
        w.field("steps", step_);
    });
}

void Engine::execute_step() {
    if (config_.policy == SchedulingPolicy::Synchronous) {
        execute_tick();
    } else {
        execute_event();
    }
}

// ============================================================================
// Synchronous scheduling
// ============================================================================

void Engine::execute_tick() {
    const uint64_t step = step_ + 1;
    const TimePoint boundary = TimePoint::epoch() + config_.tick_length * static_cast<int64_t>(step);
    const std::size_t first_entry = trajectory_.size();

    // The track is not touched until the commit phase, so every rule below
    // sees the pre-tick occupancy.
    state_ = EngineState::Stepping;
    RuleContext ctx = make_context(step);

    struct Intent {
        ParticleId particle;
        StepAction::Kind kind;
        Site target;
    };
    std::vector<Intent> intents;
    std::vector<ParticleSpec> spawns;

    for (auto& [id, particle] : particles_) {
        if (rules_.is_marker(particle)) {
            continue;
        }
        auto decision = dispatch_step(rules_, particle, ctx);
        StepAction& action = decision.result;
        if (action.kind == StepAction::Kind::Move) {
            validate_adjacent(particle, action.target);
        }
        for (auto& spawn : action.spawns) {
            spawns.push_back(std::move(spawn));
        }
        if (action.kind == StepAction::Kind::Move || action.kind == StepAction::Kind::Remove) {
            intents.push_back(Intent{id, action.kind, action.target});
        }
    }

    state_ = EngineState::Resolving;
    std::set<ParticleId> claimed_particles;
    std::set<Site> claimed_sites;
    std::vector<Plan> plans;

    auto approve = [&](Plan plan) {
        for (const auto& change : plan.changes) {
            if (claimed_particles.contains(change.particle) ||
                (change.to && claimed_sites.contains(*change.to))) {
                return false;
            }
        }
        for (ParticleId other : plan.involved) {
            if (claimed_particles.contains(other)) {
                return false;
            }
        }
        for (const auto& change : plan.changes) {
            claimed_particles.insert(change.particle);
            if (change.to) {
                claimed_sites.insert(*change.to);
            }
        }
        claimed_particles.insert(plan.involved.begin(), plan.involved.end());
        plans.push_back(std::move(plan));
        return true;
    };

    auto reject = [&](ParticleId id, Site target, std::string_view reason) {
        trace([&](TraceWriter& w) {
            w.type("move_rejected");
            w.particle("particle", id);
            w.field("target", target);
            w.field("reason", reason);
        });
    };

    for (const auto& intent : intents) {
        if (intent.kind == StepAction::Kind::Remove) {
            const Particle& particle = particles_.at(intent.particle);
            approve(Plan{{Change{intent.particle, particle.position(), std::nullopt, EventKind::Remove}}, {}});
        }
    }

    // Same-target contests: intents are in ascending id order, so the
    // first claim on a target is the winner.
    std::set<Site> targeted;
    std::vector<const Intent*> winners;
    for (const auto& intent : intents) {
        if (intent.kind != StepAction::Kind::Move) {
            continue;
        }
        if (!targeted.insert(intent.target).second) {
            reject(intent.particle, intent.target, "contest");
            continue;
        }
        winners.push_back(&intent);
    }

    std::vector<const Intent*> conflicting;
    for (const Intent* intent : winners) {
        if (!track_.is_in_bounds(intent->target) || track_.is_occupied(intent->target)) {
            conflicting.push_back(intent);
            continue;
        }
        const Particle& mover = particles_.at(intent->particle);
        if (!approve(Plan{{Change{mover.id(), mover.position(), intent->target, EventKind::Move}}, {}})) {
            reject(intent->particle, intent->target, "claimed");
        }
    }

    for (const Intent* intent : conflicting) {
        Particle& mover = particles_.at(intent->particle);
        auto plan = resolve_move(mover, intent->target, EventKind::Move, ctx);
        if (plan && !approve(std::move(*plan))) {
            reject(intent->particle, intent->target, "claimed");
        }
    }

    state_ = EngineState::Committing;
    current_time_ = boundary;
    commit(plans, step, spawns);

    RuleContext expiry_ctx = make_context(step);
    std::vector<ParticleId> expired;
    for (const auto& [id, particle] : particles_) {
        auto expiry = dispatch_lifetime(rules_, particle, expiry_ctx);
        if (expiry && *expiry <= current_time_) {
            expired.push_back(id);
        }
    }
    for (ParticleId id : expired) {
        const Particle& particle = particles_.at(id);
        commit({Plan{{Change{id, particle.position(), std::nullopt, EventKind::Expire}}, {}}}, step, spawns);
    }

    apply_spawns(spawns, step);

    step_ = step;
    if (config_.check_invariants) {
        check_invariants();
    }
    notify_observer(step, first_entry);
    state_ = EngineState::Idle;
}

// ============================================================================
// Asynchronous scheduling
// ============================================================================

void Engine::execute_event() {
    auto it = event_queue_.begin();
    const EventKey key = it->first;
    const Event event = it->second;
    event_queue_.erase(it);

    current_time_ = key.time;
    const uint64_t step = step_ + 1;
    const std::size_t first_entry = trajectory_.size();

    std::visit([&](const auto& ev) {
        using T = std::decay_t<decltype(ev)>;
        auto slot = scheduled_.find(ev.particle);
        if constexpr (std::is_same_v<T, StepEvent>) {
            if (slot != scheduled_.end()) {
                slot->second.step.clear();
            }
            handle_step_event(ev.particle, step);
        } else if constexpr (std::is_same_v<T, ExpiryEvent>) {
            if (slot != scheduled_.end()) {
                slot->second.expiry.clear();
            }
            handle_expiry_event(ev.particle, step);
        }
    }, event);

    step_ = step;
    if (config_.check_invariants) {
        check_invariants();
    }
    notify_observer(step, first_entry);
    state_ = EngineState::Idle;
}

void Engine::handle_step_event(ParticleId id, uint64_t step) {
    auto found = particles_.find(id);
    if (found == particles_.end()) {
        return;
    }
    Particle& particle = found->second;
    const Site from = particle.position();

    state_ = EngineState::Stepping;
    RuleContext ctx = make_context(step);
    auto decision = dispatch_step(rules_, particle, ctx);
    StepAction& action = decision.result;
    std::vector<ParticleSpec> spawns = std::move(action.spawns);

    if (decision.source == DecisionSource::Default) {
        // Without any stepping rule there is no waiting time to reschedule with.
        trace([&](TraceWriter& w) {
            w.type("dormant");
            w.particle("particle", id);
        });
        apply_spawns(spawns, step);
        return;
    }

    if (action.kind != StepAction::Kind::Remove) {
        if (!action.wait) {
            throw RuleError("Stepping rule for " + describe(id) +
                            " returned no waiting time under asynchronous scheduling");
        }
        if (*action.wait < Duration::zero()) {
            throw RuleError("Stepping rule for " + describe(id) + " returned a negative waiting time");
        }
    }

    state_ = EngineState::Resolving;
    std::vector<Plan> plans;
    if (action.kind == StepAction::Kind::Remove) {
        plans.push_back(Plan{{Change{id, from, std::nullopt, EventKind::Remove}}, {}});
    } else if (action.kind == StepAction::Kind::Move) {
        validate_adjacent(particle, action.target);
        if (auto plan = resolve_move(particle, action.target, EventKind::Move, ctx)) {
            plans.push_back(std::move(*plan));
        }
    }

    std::set<ParticleId> touched{id};
    for (const auto& plan : plans) {
        for (const auto& change : plan.changes) {
            touched.insert(change.particle);
        }
        touched.insert(plan.involved.begin(), plan.involved.end());
    }

    state_ = EngineState::Committing;
    commit(plans, step, spawns);

    if (particles_.contains(id)) {
        schedule_step(id, current_time_ + *action.wait);
    }
    for (ParticleId other : touched) {
        if (particles_.contains(other)) {
            schedule_expiry(other, step);
        }
    }
    apply_spawns(spawns, step);
}

void Engine::handle_expiry_event(ParticleId id, uint64_t step) {
    auto found = particles_.find(id);
    if (found == particles_.end()) {
        return;
    }

    state_ = EngineState::Resolving;
    RuleContext ctx = make_context(step);
    auto expiry = dispatch_lifetime(rules_, found->second, ctx);
    if (!expiry) {
        return;
    }
    if (*expiry > current_time_) {
        schedule_expiry(id, step);
        return;
    }

    state_ = EngineState::Committing;
    std::vector<ParticleSpec> spawns;
    commit({Plan{{Change{id, found->second.position(), std::nullopt, EventKind::Expire}}, {}}}, step, spawns);
    apply_spawns(spawns, step);
}

void Engine::schedule_step(ParticleId id, TimePoint when) {
    auto& slot = scheduled_[id];
    cancel(slot.step);
    auto [it, inserted] = event_queue_.emplace(EventKey{when, EventPriority::STEP, sequence_++},
                                               StepEvent{id});
    slot.step = EventHandle(it);
}

void Engine::schedule_expiry(ParticleId id, uint64_t step) {
    if (config_.policy != SchedulingPolicy::Asynchronous) {
        return;
    }
    auto& slot = scheduled_[id];
    cancel(slot.expiry);

    RuleContext ctx = make_context(step);
    auto expiry = dispatch_lifetime(rules_, particles_.at(id), ctx);
    if (!expiry) {
        return;
    }
    TimePoint when = std::max(*expiry, current_time_);
    auto [it, inserted] = event_queue_.emplace(EventKey{when, EventPriority::EXPIRY, sequence_++},
                                               ExpiryEvent{id});
    slot.expiry = EventHandle(it);
}

void Engine::cancel_events(ParticleId id) {
    auto slot = scheduled_.find(id);
    if (slot == scheduled_.end()) {
        return;
    }
    cancel(slot->second.step);
    cancel(slot->second.expiry);
    scheduled_.erase(slot);
}

void Engine::cancel(EventHandle& handle) {
    if (!handle.valid_) {
        return;
    }
    event_queue_.erase(handle.it_);
    handle.clear();
}

// ============================================================================
// Conflict resolution
// ============================================================================

void Engine::validate_adjacent(const Particle& particle, Site target) const {
    const Site from = particle.position();
    if (target != from - 1 && target != from + 1) {
        throw RuleError("Stepping rule moved " + describe(particle.id()) + " from site " +
                        std::to_string(from) + " to non-adjacent site " + std::to_string(target));
    }
}

std::optional<Engine::Plan> Engine::resolve_boundary(const Particle& mover, Site target) {
    switch (track_.boundary()) {
        case BoundaryMode::Closed:
            trace([&](TraceWriter& w) {
                w.type("move_blocked");
                w.particle("particle", mover.id());
                w.field("target", target);
                w.field("reason", std::string_view{"boundary"});
            });
            return std::nullopt;
        case BoundaryMode::Open:
            return Plan{{Change{mover.id(), mover.position(), std::nullopt, EventKind::Exit}}, {}};
        case BoundaryMode::Marked:
            throw BoundaryError(describe(mover.id()) + " left the marked track at site " +
                                std::to_string(target));
    }
    return std::nullopt;
}

std::optional<Engine::Plan> Engine::resolve_move(Particle& mover, Site target, EventKind kind,
                                                 const RuleContext& ctx) {
    const Site from = mover.position();
    if (!track_.is_in_bounds(target)) {
        return resolve_boundary(mover, target);
    }

    auto occupant_id = track_.occupant_at(target);
    if (!occupant_id) {
        return Plan{{Change{mover.id(), from, target, kind}}, {}};
    }

    const Particle& occupant = particles_.at(*occupant_id);
    auto decision = dispatch_collision(rules_, mover, occupant, ctx);
    const CollisionOutcome& outcome = decision.result;

    trace([&](TraceWriter& w) {
        w.type("collision");
        w.particle("mover", mover.id());
        w.particle("occupant", occupant.id());
        w.field("outcome", outcome_name(outcome.kind));
        w.field("source", to_string(decision.source));
        if (decision.trait) {
            w.field("trait", std::string_view{rules_.trait(*decision.trait).name});
        }
    });

    switch (outcome.kind) {
        case CollisionOutcome::Kind::Pass:
        case CollisionOutcome::Kind::Blocked:
            return std::nullopt;

        case CollisionOutcome::Kind::Swap:
            return Plan{{Change{mover.id(), from, target, EventKind::Swap},
                         Change{occupant.id(), target, from, EventKind::Swap}},
                        {}};

        case CollisionOutcome::Kind::Merge:
            if (outcome.survivor == Survivor::Mover) {
                return Plan{{Change{occupant.id(), target, std::nullopt, EventKind::Merge},
                             Change{mover.id(), from, target, EventKind::Merge}},
                            {}};
            }
            return Plan{{Change{mover.id(), from, std::nullopt, EventKind::Merge}}, {occupant.id()}};

        case CollisionOutcome::Kind::Bounce: {
            const Site bounce = outcome.target;
            if (bounce == target || (bounce != from - 1 && bounce != from + 1)) {
                throw RuleError("Collision rule bounced " + describe(mover.id()) + " from site " +
                                std::to_string(from) + " to site " + std::to_string(bounce) +
                                ", which is not a different adjacent site");
            }
            if (!track_.is_in_bounds(bounce)) {
                return resolve_boundary(mover, bounce);
            }
            if (track_.is_occupied(bounce)) {
                return std::nullopt;
            }
            return Plan{{Change{mover.id(), from, bounce, EventKind::Bounce}}, {occupant.id()}};
        }

        case CollisionOutcome::Kind::Push: {
            const Site beyond = target + (target - from);
            // The pushed particle becomes the mover of the next link.
            Particle& pushed = particles_.at(occupant.id());
            auto chain = resolve_move(pushed, beyond, EventKind::Push, ctx);
            if (!chain) {
                return std::nullopt;
            }
            chain->changes.push_back(Change{mover.id(), from, target, kind});
            return chain;
        }
    }
    return std::nullopt;
}

// ============================================================================
// Commit
// ============================================================================

void Engine::commit(const std::vector<Plan>& plans, uint64_t step, std::vector<ParticleSpec>& spawns) {
    for (const auto& plan : plans) {
        for (const auto& change : plan.changes) {
            auto vacated = track_.vacate(change.from);
            if (vacated != change.particle) {
                throw InvariantViolation("Site " + std::to_string(change.from) + " does not hold " +
                                         describe(change.particle));
            }
        }
    }

    std::vector<ParticleId> removed;
    for (const auto& plan : plans) {
        for (const auto& change : plan.changes) {
            if (change.to) {
                track_.place(change.particle, *change.to);
                particles_.at(change.particle).position_ = *change.to;
            } else {
                removed.push_back(change.particle);
            }
        }
    }

    for (const auto& plan : plans) {
        for (const auto& change : plan.changes) {
            append_entry(TrajectoryEntry{step, current_time_, change.particle, change.from, change.to,
                                         change.kind});
        }
    }

    for (ParticleId id : removed) {
        finalize_removal(id, step, spawns);
    }
}

void Engine::finalize_removal(ParticleId id, uint64_t step, std::vector<ParticleSpec>& spawns) {
    RuleContext ctx = make_context(step);
    auto replacements = dispatch_removal(rules_, particles_.at(id), ctx);
    for (auto& spec : replacements) {
        spawns.push_back(std::move(spec));
    }
    cancel_events(id);
    particles_.erase(id);
}

void Engine::apply_spawns(std::vector<ParticleSpec>& spawns, uint64_t step) {
    for (auto& spec : spawns) {
        std::vector<TraitId> traits;
        try {
            traits = rules_.resolve(spec.traits);
            rules_.require_stepping(traits);
        } catch (const ConfigurationError& e) {
            throw RuleError(std::string("Invalid spawn request: ") + e.what());
        }

        std::optional<Site> site = spec.position ? spec.position : random_free_site();
        if (!site || !track_.is_in_bounds(*site) || track_.is_occupied(*site)) {
            trace([&](TraceWriter& w) {
                w.type("spawn_dropped");
                w.site("site", site);
            });
            continue;
        }

        ParticleId id = create_particle(*site, std::move(traits), std::move(spec.state),
                                        EventKind::Spawn, step);
        if (config_.policy == SchedulingPolicy::Asynchronous) {
            if (!rules_.is_marker(particles_.at(id))) {
                schedule_step(id, current_time_);
            }
            schedule_expiry(id, step);
        }
    }
    spawns.clear();
}

void Engine::append_entry(const TrajectoryEntry& entry) {
    trajectory_.push_back(entry);
    trace([&](TraceWriter& w) {
        w.type(to_string(entry.kind));
        w.particle("particle", entry.particle);
        w.field("step", entry.step);
        w.site("from", entry.from);
        w.site("to", entry.to);
    });
}

void Engine::check_invariants() const {
    check_occupancy(track_, particles_);
}

void Engine::check_occupancy(const Track& track, const ParticleRegistry& particles) {
    for (const auto& [id, particle] : particles) {
        if (track.occupant_at(particle.position()) != id) {
            throw InvariantViolation(describe(id) + " believes it is at site " +
                                     std::to_string(particle.position()) +
                                     " but the track disagrees");
        }
    }
    if (track.occupied_count() != particles.size()) {
        throw InvariantViolation("Track holds " + std::to_string(track.occupied_count()) +
                                 " particles but the engine owns " +
                                 std::to_string(particles.size()));
    }
}

void Engine::notify_observer(uint64_t step, std::size_t first_entry) {
    if (!observer_) {
        return;
    }
    Snapshot snapshot{step, current_time_, track_, particles_,
                      std::span<const TrajectoryEntry>(trajectory_).subspan(first_entry)};
    observer_(snapshot);
}

// ============================================================================
// Queries
// ============================================================================

const Particle& Engine::particle(ParticleId id) const {
    auto it = particles_.find(id);
    if (it == particles_.end()) {
        throw OutOfRangeError("No " + describe(id));
    }
    return it->second;
}

std::size_t Engine::live_particle_count() const {
    return static_cast<std::size_t>(std::count_if(
        particles_.begin(), particles_.end(),
        [this](const auto& entry) { return !rules_.is_marker(entry.second); }));
}

// ============================================================================
// Checkpointing
// ============================================================================

Checkpoint Engine::checkpoint() const {
    Checkpoint saved;
    saved.track_length = track_.length();
    saved.boundary = track_.boundary();
    saved.policy = config_.policy;
    saved.finalized = finalized_;
    saved.step = step_;
    saved.time = current_time_;
    saved.next_id = next_id_;
    saved.sequence = sequence_;

    std::ostringstream rng_state;
    rng_state << rng_;
    saved.rng_state = rng_state.str();

    for (const auto& [id, particle] : particles_) {
        saved.particles.push_back(ParticleRecord{id, particle.position(), rules_.names_of(particle.traits()),
                                                 particle.state(), particle.created_at()});
    }
    for (const auto& [key, event] : event_queue_) {
        saved.pending.push_back(PendingEvent{key, event});
    }
    saved.trajectory = trajectory_;
    return saved;
}

void Engine::restore(const Checkpoint& saved) {
    if (saved.track_length != track_.length() || saved.boundary != track_.boundary()) {
        throw InvalidStateError("Checkpoint track geometry does not match this engine");
    }
    if (saved.policy != config_.policy) {
        throw InvalidStateError("Checkpoint scheduling policy does not match this engine");
    }

    // Build everything aside first so a bad checkpoint leaves the engine untouched.
    Track track(saved.track_length, saved.boundary);
    ParticleRegistry particles;
    for (const auto& record : saved.particles) {
        auto traits = rules_.resolve(record.traits);
        rules_.require_stepping(traits);
        if (record.id.value >= saved.next_id) {
            throw InvalidStateError("Checkpoint " + describe(record.id) + " is beyond the id counter");
        }
        track.place(record.id, record.position);
        particles.emplace(record.id, Particle(record.id, record.position, std::move(traits),
                                              record.state, record.created_at));
    }
    // Records sharing an id leave the staged track and registry disagreeing.
    check_occupancy(track, particles);
    for (const auto& pending : saved.pending) {
        ParticleId owner = std::visit([](const auto& ev) { return ev.particle; }, pending.event);
        if (!particles.contains(owner)) {
            throw InvalidStateError("Checkpoint event refers to missing " + describe(owner));
        }
    }

    std::istringstream rng_state(saved.rng_state);
    RandomEngine rng;
    rng_state >> rng;
    if (rng_state.fail()) {
        throw InvalidStateError("Checkpoint random engine state is malformed");
    }

    track_ = std::move(track);
    particles_ = std::move(particles);
    trajectory_ = saved.trajectory;
    rng_ = rng;
    current_time_ = saved.time;
    step_ = saved.step;
    next_id_ = saved.next_id;
    sequence_ = saved.sequence;
    finalized_ = saved.finalized;
    state_ = EngineState::Idle;
    finish_reason_.reset();
    failure_ = nullptr;
    stop_requested_ = false;

    event_queue_.clear();
    scheduled_.clear();
    for (const auto& pending : saved.pending) {
        auto [it, inserted] = event_queue_.emplace(pending.key, pending.event);
        std::visit([&](const auto& ev) {
            using T = std::decay_t<decltype(ev)>;
            auto& slot = scheduled_[ev.particle];
            if constexpr (std::is_same_v<T, StepEvent>) {
                slot.step = EventHandle(it);
            } else {
                slot.expiry = EventHandle(it);
            }
        }, pending.event);
    }
}

} // namespace tracksim::core
