#pragma once

#include <tracksim/core/particle.hpp>
#include <tracksim/core/rule.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tracksim::core {

/// @brief A named capability bundle with one optional handler per event kind.
///
/// A trait without any handler is identifying-only. A trait declared as a
/// tag is identifying-only for good: it exists purely so other rules can
/// test for it (e.g. "is my neighbour a track end?") and refuses every
/// binding.
///
/// @ingroup core_rules
struct Trait {
    std::string name;
    StepRule stepping;
    CollisionRule collision;
    LifetimeRule lifetime;
    RemovalRule removal;
    bool tag{false};  ///< Declared through RuleSet::declare_tag.

    /// @brief True if no handler of any kind is bound.
    [[nodiscard]] bool is_identifying_only() const noexcept {
        return !stepping && !collision && !lifetime && !removal;
    }
};

/// @brief Registry of traits, their rules, and the global fallback rules.
///
/// A RuleSet is built once during setup and handed to an Engine, which
/// keeps its own copy. There is no process-wide registry: two engines with
/// different rule sets never observe each other.
///
/// Traits must be declared before rules are bound to them. Each handler
/// kind may be bound at most once per trait; a second binding is a
/// contradiction and raises ConfigurationError.
///
/// Every particle must be able to act: unless all of its traits are tags,
/// one of them needs a stepping rule or a fallback stepping rule must be
/// set. The engine enforces this with require_stepping() when particles
/// are registered, restored or spawned.
///
/// @code
/// core::RuleSet rules;
/// rules.declare_trait("walker");
/// rules.bind_stepping("walker", [](core::Particle& self, const core::RuleContext&) {
///     return core::StepAction::move_to(self.position() + 1);
/// });
/// @endcode
///
/// @see Trait, Engine
/// @ingroup core_rules
class RuleSet {
public:
    /// @brief Name of the tag carried by track-end markers.
    static constexpr std::string_view TRACK_END = "track_end";

    /// @brief Declare a new trait.
    /// @return The new trait's id.
    /// @throws ConfigurationError if the name is empty or already declared.
    TraitId declare_trait(std::string_view name);

    /// @brief Declare @p name unless it already exists.
    /// @return The id of the existing or new trait.
    TraitId ensure_trait(std::string_view name);

    /// @brief Declare a tag: a trait that never takes a rule.
    ///
    /// A particle carrying only tags is a marker.
    ///
    /// @throws ConfigurationError if the name is empty or already declared.
    TraitId declare_tag(std::string_view name);

    /// @brief Declare tag @p name unless it already exists.
    /// @throws ConfigurationError if @p name exists as an ordinary trait.
    TraitId ensure_tag(std::string_view name);

    /// @name Rule binding
    /// @throws ConfigurationError if the trait is undeclared or a tag, the
    ///         handler is empty, or a handler of the same kind is already bound.
    /// @{
    void bind_stepping(std::string_view trait, StepRule rule);
    void bind_collision(std::string_view trait, CollisionRule rule);
    void bind_lifetime(std::string_view trait, LifetimeRule rule);
    void bind_removal(std::string_view trait, RemovalRule rule);
    /// @}

    /// @name Global fallbacks
    /// @brief Consulted after every attached trait passes.
    /// @throws ConfigurationError if the rule is empty or already set.
    /// @{
    void set_fallback_stepping(StepRule rule);
    void set_fallback_collision(CollisionRule rule);
    /// @}

    [[nodiscard]] const StepRule& fallback_stepping() const noexcept { return fallback_stepping_; }
    [[nodiscard]] const CollisionRule& fallback_collision() const noexcept { return fallback_collision_; }

    /// @brief Look up a trait by name.
    [[nodiscard]] std::optional<TraitId> find_trait(std::string_view name) const noexcept;

    /// @brief Look up a trait by name.
    /// @throws ConfigurationError if the trait is undeclared.
    [[nodiscard]] TraitId trait_id(std::string_view name) const;

    /// @brief Access a trait by id.
    /// @throws OutOfRangeError if @p id is not a trait of this set.
    [[nodiscard]] const Trait& trait(TraitId id) const;

    [[nodiscard]] std::size_t trait_count() const noexcept { return traits_.size(); }

    /// @brief Resolve trait names to ids, preserving order.
    /// @throws ConfigurationError on an undeclared name or a duplicate entry.
    [[nodiscard]] std::vector<TraitId> resolve(const std::vector<std::string>& names) const;

    /// @brief Names of @p traits, in order.
    [[nodiscard]] std::vector<std::string> names_of(const std::vector<TraitId>& traits) const;

    /// @brief True if @p particle carries the trait called @p name.
    [[nodiscard]] bool has_trait(const Particle& particle, std::string_view name) const noexcept;

    /// @brief True if all of @p particle's traits are tags.
    ///
    /// Marker particles are never stepped and do not count as live
    /// particles for termination. A particle without traits is not a marker.
    [[nodiscard]] bool is_marker(const Particle& particle) const { return is_marker(particle.traits()); }

    /// @overload
    [[nodiscard]] bool is_marker(const std::vector<TraitId>& traits) const;

    /// @brief Check that a particle carrying @p traits can act.
    ///
    /// Passes for a marker, for a trait list with a stepping rule, and for
    /// any trait list once a fallback stepping rule is set.
    ///
    /// @throws ConfigurationError otherwise, naming the traits. A particle
    ///         whose traits only bind collision, lifetime or removal rules
    ///         is rejected as well.
    void require_stepping(const std::vector<TraitId>& traits) const;

private:
    Trait& mutable_trait(std::string_view name, std::string_view handler_kind);

    std::vector<Trait> traits_;
    StepRule fallback_stepping_;
    CollisionRule fallback_collision_;
};

} // namespace tracksim::core
