#pragma once

#include <tracksim/core/types.hpp>

#include <cstddef>
#include <optional>
#include <string_view>
#include <vector>

namespace tracksim::core {

/// @brief What happens to a move that leaves the track.
/// @ingroup core_track
enum class BoundaryMode {
    Closed, ///< Moves past either end are blocked; the mover stays put.
    Open,   ///< The mover exits the track and is removed.
    Marked, ///< Track-end markers occupy both end sites; escaping is a BoundaryError.
};

/// @brief Return the lowercase name of a boundary mode ("closed", "open", "marked").
[[nodiscard]] std::string_view to_string(BoundaryMode mode) noexcept;

/// @brief Parse a boundary mode name.
/// @return The mode, or std::nullopt for an unknown name.
[[nodiscard]] std::optional<BoundaryMode> boundary_mode_from_string(std::string_view name) noexcept;

/// @brief Authoritative occupancy of a fixed-length sequence of sites.
///
/// Each site is empty or holds exactly one particle identity. The track
/// does not own particles; it only records which identity sits where.
/// Read queries are bounds-safe: asking about a site outside the track
/// reports it as empty, so rules can look one step past an edge without
/// special-casing it. Mutators reject out-of-range sites.
///
/// Inside an Engine the track is only mutated during the commit phase;
/// rules and observers receive it by const reference.
///
/// @see Engine, BoundaryMode
/// @ingroup core_track
class Track {
public:
    /// @brief Construct an empty track.
    /// @param length Number of sites (sites are 0 .. length-1).
    /// @param mode Boundary behaviour at both ends.
    Track(std::size_t length, BoundaryMode mode);

    [[nodiscard]] std::size_t length() const noexcept { return sites_.size(); }
    [[nodiscard]] BoundaryMode boundary() const noexcept { return mode_; }

    /// @brief True if @p site lies within [0, length()).
    [[nodiscard]] bool is_in_bounds(Site site) const noexcept;

    /// @brief Particle occupying @p site, or std::nullopt if empty or out of bounds.
    [[nodiscard]] std::optional<ParticleId> occupant_at(Site site) const noexcept;

    /// @brief True if @p site is in bounds and occupied.
    [[nodiscard]] bool is_occupied(Site site) const noexcept;

    /// @brief Put @p particle on @p site.
    /// @throws OutOfRangeError if @p site is outside the track.
    /// @throws OccupiedError if @p site already holds a particle.
    void place(ParticleId particle, Site site);

    /// @brief Clear @p site.
    /// @return The identity that was removed, or std::nullopt if the site was empty.
    /// @throws OutOfRangeError if @p site is outside the track.
    std::optional<ParticleId> vacate(Site site);

    /// @brief In-bounds sites adjacent to @p site, lower site first.
    [[nodiscard]] std::vector<Site> neighbors(Site site) const;

    /// @brief First empty site found walking from @p start in @p direction.
    ///
    /// Returns @p start itself if it is empty. Useful to find the end of a
    /// train of particles. The result may lie outside the track when the
    /// train reaches an end.
    ///
    /// @param start Site to begin the search at.
    /// @param direction +1 or -1.
    /// @throws OutOfRangeError if @p direction is neither +1 nor -1.
    [[nodiscard]] Site next_empty(Site start, int direction) const;

    /// @brief Identities found on the half-open stretch [first, last).
    ///
    /// Sites outside the track contribute nothing. Results are in site order.
    [[nodiscard]] std::vector<ParticleId> occupants_in(Site first, Site last) const;

    /// @brief Number of occupied sites.
    [[nodiscard]] std::size_t occupied_count() const noexcept { return occupied_; }

private:
    std::vector<std::optional<ParticleId>> sites_;
    BoundaryMode mode_;
    std::size_t occupied_{0};
};

} // namespace tracksim::core
