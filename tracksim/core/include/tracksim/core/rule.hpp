#pragma once

#include <tracksim/core/config.hpp>
#include <tracksim/core/particle.hpp>
#include <tracksim/core/track.hpp>
#include <tracksim/core/types.hpp>

#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <random>
#include <string_view>
#include <utility>
#include <vector>

namespace tracksim::core {

class RuleSet;

/// @brief Particles owned by an engine, ordered by identity.
/// @ingroup core_particles
using ParticleRegistry = std::map<ParticleId, Particle>;

/// @brief Random engine shared by all rules of a run.
/// @ingroup core_rules
using RandomEngine = std::mt19937_64;

/// @brief What a stepping rule wants a particle to do.
///
/// `Pass` is the only non-definite answer: the engine moves on to the next
/// trait. `Stay` is a definite no-op. A `Move` must target a site adjacent
/// to the particle. Any action may carry a waiting time (required for
/// `Stay` and `Move` under asynchronous scheduling) and spawn requests,
/// which are committed after the step's moves.
///
/// @code
/// return StepAction::move_to(self.position() + 1).with_wait(duration_from_seconds(0.5));
/// @endcode
///
/// @ingroup core_rules
struct StepAction {
    enum class Kind {
        Pass,   ///< No opinion; ask the next trait.
        Stay,   ///< Definitely do nothing this opportunity.
        Move,   ///< Move to an adjacent site.
        Remove, ///< Take this particle off the track.
    };

    Kind kind{Kind::Pass};
    Site target{0};                    ///< Destination for Kind::Move.
    std::optional<Duration> wait;      ///< Time until the next opportunity (asynchronous).
    std::vector<ParticleSpec> spawns;  ///< Particles to create after the commit.

    static StepAction pass() { return StepAction{}; }
    static StepAction stay() { return StepAction{Kind::Stay, 0, std::nullopt, {}}; }
    static StepAction move_to(Site target) { return StepAction{Kind::Move, target, std::nullopt, {}}; }
    static StepAction remove() { return StepAction{Kind::Remove, 0, std::nullopt, {}}; }

    StepAction& with_wait(Duration d) {
        wait = d;
        return *this;
    }

    StepAction& with_spawn(ParticleSpec spec) {
        spawns.push_back(std::move(spec));
        return *this;
    }

    [[nodiscard]] bool is_definite() const noexcept { return kind != Kind::Pass; }
};

/// @brief Which party keeps its identity after a merge.
/// @ingroup core_rules
enum class Survivor {
    Mover,    ///< The occupant is absorbed; the mover takes the site.
    Occupant, ///< The mover is absorbed; the occupant stays.
};

/// @brief How a collision rule resolves a move onto an occupied site.
/// @ingroup core_rules
struct CollisionOutcome {
    enum class Kind {
        Pass,    ///< No opinion; ask the next trait.
        Blocked, ///< The move is cancelled.
        Swap,    ///< Mover and occupant exchange sites.
        Merge,   ///< One party is removed; see Survivor.
        Bounce,  ///< The mover goes to a different adjacent site instead.
        Push,    ///< The occupant is displaced one site further, recursively.
    };

    Kind kind{Kind::Pass};
    Survivor survivor{Survivor::Mover}; ///< For Kind::Merge.
    Site target{0};                     ///< For Kind::Bounce.

    static CollisionOutcome pass() { return CollisionOutcome{}; }
    static CollisionOutcome blocked() { return CollisionOutcome{Kind::Blocked, Survivor::Mover, 0}; }
    static CollisionOutcome swap() { return CollisionOutcome{Kind::Swap, Survivor::Mover, 0}; }
    static CollisionOutcome merge(Survivor survivor) { return CollisionOutcome{Kind::Merge, survivor, 0}; }
    static CollisionOutcome bounce(Site target) { return CollisionOutcome{Kind::Bounce, Survivor::Mover, target}; }
    static CollisionOutcome push() { return CollisionOutcome{Kind::Push, Survivor::Mover, 0}; }

    [[nodiscard]] bool is_definite() const noexcept { return kind != Kind::Pass; }
};

/// @brief Read-only view of the simulation handed to every rule.
///
/// Under synchronous scheduling track() is the pre-tick snapshot, so
/// evaluation order within a tick cannot influence what a rule sees.
/// Particle positions never change while rules run; only the calling
/// rule's own particle state may be written through the reference the
/// rule receives.
///
/// The random engine is the single seeded stream of the run. Drawing
/// from it is the only permitted source of nondeterminism.
///
/// @ingroup core_rules
class RuleContext {
public:
    RuleContext(const Track& track, const ParticleRegistry& particles, const RuleSet& rules,
                RandomEngine& rng, TimePoint now, uint64_t step, SchedulingPolicy policy) noexcept
        : track_(track)
        , particles_(particles)
        , rules_(rules)
        , rng_(rng)
        , now_(now)
        , step_(step)
        , policy_(policy) {}

    [[nodiscard]] const Track& track() const noexcept { return track_; }
    [[nodiscard]] const RuleSet& rules() const noexcept { return rules_; }
    [[nodiscard]] TimePoint now() const noexcept { return now_; }
    [[nodiscard]] uint64_t step() const noexcept { return step_; }
    [[nodiscard]] SchedulingPolicy policy() const noexcept { return policy_; }

    /// @brief The particle with identity @p id, or nullptr if it no longer exists.
    [[nodiscard]] const Particle* particle(ParticleId id) const noexcept;

    /// @brief The particle occupying @p site, or nullptr if the site is empty or off-track.
    [[nodiscard]] const Particle* particle_at(Site site) const noexcept;

    /// @brief True if @p particle carries the trait called @p trait_name.
    [[nodiscard]] bool has_trait(const Particle& particle, std::string_view trait_name) const noexcept;

    /// @brief True if the occupant of @p site carries the trait called @p trait_name.
    [[nodiscard]] bool site_has_trait(Site site, std::string_view trait_name) const noexcept;

    /// @brief The run's random engine.
    [[nodiscard]] RandomEngine& rng() const noexcept { return rng_; }

    /// @brief Uniform draw in [0, 1).
    [[nodiscard]] double uniform() const;

    /// @brief Exponentially distributed waiting time for an event of @p rate per second.
    [[nodiscard]] Duration exponential_wait(double rate) const;

private:
    const Track& track_;                 // NOLINT(cppcoreguidelines-avoid-const-or-ref-data-members)
    const ParticleRegistry& particles_;  // NOLINT(cppcoreguidelines-avoid-const-or-ref-data-members)
    const RuleSet& rules_;               // NOLINT(cppcoreguidelines-avoid-const-or-ref-data-members)
    RandomEngine& rng_;                  // NOLINT(cppcoreguidelines-avoid-const-or-ref-data-members)
    TimePoint now_;
    uint64_t step_;
    SchedulingPolicy policy_;
};

/// @brief Decides what a particle wants to do at a scheduling opportunity.
/// @ingroup core_rules
using StepRule = std::function<StepAction(Particle& self, const RuleContext& ctx)>;

/// @brief Resolves a move of @p mover onto the site held by @p occupant.
///
/// Only the mover's state may be updated; the occupant is read-only.
///
/// @ingroup core_rules
using CollisionRule =
    std::function<CollisionOutcome(Particle& mover, const Particle& occupant, const RuleContext& ctx)>;

/// @brief Returns the absolute time at which @p self expires, or std::nullopt to pass.
/// @ingroup core_rules
using LifetimeRule =
    std::function<std::optional<TimePoint>(const Particle& self, const RuleContext& ctx)>;

/// @brief Called once when @p self is removed; returns replacement spawns, or std::nullopt to pass.
/// @ingroup core_rules
using RemovalRule =
    std::function<std::optional<std::vector<ParticleSpec>>(const Particle& self, const RuleContext& ctx)>;

} // namespace tracksim::core
