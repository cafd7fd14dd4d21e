#pragma once

#include <tracksim/core/types.hpp>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>
#include <vector>

namespace tracksim::core {

/// @brief Index of a trait inside its RuleSet.
/// @ingroup core_particles
using TraitId = std::size_t;

/// @brief A single trait-private state value.
/// @ingroup core_particles
using StateValue = std::variant<int64_t, double, std::string>;

/// @brief Trait-private state of a particle, keyed by name.
///
/// Ordered so that checkpoints and traces list keys deterministically.
/// @ingroup core_particles
using StateMap = std::map<std::string, StateValue, std::less<>>;

/// @brief Everything needed to create a particle.
///
/// Used for setup-time registration (Engine::add_particle) and for spawn
/// requests returned by rules.
///
/// @ingroup core_particles
struct ParticleSpec {
    std::optional<Site> position;     ///< Initial site; std::nullopt picks a random free site.
    std::vector<std::string> traits;  ///< Trait names in attachment order.
    StateMap state;                   ///< Initial trait-private state.
};

/// @brief An individually evolvable entity on the track.
///
/// A particle's behaviour is the union of its traits' handlers, consulted
/// in attachment order. The trait list is fixed at creation; only the
/// trait-private state map changes during a run. Particles are owned by
/// the Engine; rules receive them by reference and may update their state
/// but never their position.
///
/// @see RuleSet, Engine
/// @ingroup core_particles
class Particle {
public:
    /// @brief Construct a particle.
    /// @param id Unique identity.
    /// @param position Current site.
    /// @param traits Trait ids in attachment order.
    /// @param state Initial trait-private state.
    /// @param created_at Simulation time of creation.
    Particle(ParticleId id, Site position, std::vector<TraitId> traits, StateMap state,
             TimePoint created_at);

    [[nodiscard]] ParticleId id() const noexcept { return id_; }
    [[nodiscard]] Site position() const noexcept { return position_; }
    [[nodiscard]] const std::vector<TraitId>& traits() const noexcept { return traits_; }
    [[nodiscard]] TimePoint created_at() const noexcept { return created_at_; }

    /// @brief True if @p trait is attached to this particle.
    [[nodiscard]] bool has_trait(TraitId trait) const noexcept;

    /// @name Trait-private state
    /// @{

    [[nodiscard]] const StateMap& state() const noexcept { return state_; }

    /// @brief True if @p key is present in the state map.
    [[nodiscard]] bool has(std::string_view key) const noexcept;

    /// @brief Read a state value.
    ///
    /// A stored integer converts to `double` on request; no other
    /// conversion is performed.
    ///
    /// @tparam T One of `int64_t`, `double`, `std::string`.
    /// @throws OutOfRangeError if @p key is missing.
    /// @throws InvalidStateError if the stored type does not match @p T.
    template<typename T>
    [[nodiscard]] T get(std::string_view key) const;

    /// @brief Read a state value, or @p fallback if @p key is missing.
    template<typename T>
    [[nodiscard]] T get_or(std::string_view key, T fallback) const;

    /// @brief Write a state value, replacing any previous value.
    void set(std::string_view key, StateValue value);

    /// @brief Remove @p key from the state map (no-op if absent).
    void erase(std::string_view key);

    /// @}

private:
    friend class Engine;

    [[noreturn]] void throw_missing(std::string_view key) const;
    [[noreturn]] void throw_type_mismatch(std::string_view key) const;

    ParticleId id_;
    Site position_;
    std::vector<TraitId> traits_;
    StateMap state_;
    TimePoint created_at_;
};

template<typename T>
T Particle::get(std::string_view key) const {
    static_assert(std::is_same_v<T, int64_t> || std::is_same_v<T, double> ||
                  std::is_same_v<T, std::string>,
                  "state values are int64_t, double or std::string");
    auto it = state_.find(key);
    if (it == state_.end()) {
        throw_missing(key);
    }
    if (const auto* value = std::get_if<T>(&it->second)) {
        return *value;
    }
    if constexpr (std::is_same_v<T, double>) {
        if (const auto* integral = std::get_if<int64_t>(&it->second)) {
            return static_cast<double>(*integral);
        }
    }
    throw_type_mismatch(key);
}

template<typename T>
T Particle::get_or(std::string_view key, T fallback) const {
    if (!has(key)) {
        return fallback;
    }
    return get<T>(key);
}

} // namespace tracksim::core
