#include <tracksim/core/track.hpp>
#include <tracksim/core/error.hpp>

#include <string>

namespace tracksim::core {

std::string_view to_string(BoundaryMode mode) noexcept {
    switch (mode) {
        case BoundaryMode::Closed: return "closed";
        case BoundaryMode::Open:   return "open";
        case BoundaryMode::Marked: return "marked";
    }
    return "unknown";
}

std::optional<BoundaryMode> boundary_mode_from_string(std::string_view name) noexcept {
    if (name == "closed") {
        return BoundaryMode::Closed;
    }
    if (name == "open") {
        return BoundaryMode::Open;
    }
    if (name == "marked") {
        return BoundaryMode::Marked;
    }
    return std::nullopt;
}

Track::Track(std::size_t length, BoundaryMode mode)
    : sites_(length)
    , mode_(mode) {}

bool Track::is_in_bounds(Site site) const noexcept {
    return site >= 0 && static_cast<std::size_t>(site) < sites_.size();
}

std::optional<ParticleId> Track::occupant_at(Site site) const noexcept {
    if (!is_in_bounds(site)) {
        return std::nullopt;
    }
    return sites_[static_cast<std::size_t>(site)];
}

bool Track::is_occupied(Site site) const noexcept {
    return occupant_at(site).has_value();
}

void Track::place(ParticleId particle, Site site) {
    if (!is_in_bounds(site)) {
        throw OutOfRangeError("Cannot place particle " + std::to_string(particle.value) +
                              " at site " + std::to_string(site) + ": outside the track");
    }
    auto& slot = sites_[static_cast<std::size_t>(site)];
    if (slot) {
        throw OccupiedError("Site " + std::to_string(site) + " is already occupied by particle " +
                            std::to_string(slot->value));
    }
    slot = particle;
    ++occupied_;
}

std::optional<ParticleId> Track::vacate(Site site) {
    if (!is_in_bounds(site)) {
        throw OutOfRangeError("Cannot vacate site " + std::to_string(site) + ": outside the track");
    }
    auto& slot = sites_[static_cast<std::size_t>(site)];
    std::optional<ParticleId> previous = slot;
    if (slot) {
        slot.reset();
        --occupied_;
    }
    return previous;
}

std::vector<Site> Track::neighbors(Site site) const {
    std::vector<Site> result;
    if (is_in_bounds(site - 1)) {
        result.push_back(site - 1);
    }
    if (is_in_bounds(site + 1)) {
        result.push_back(site + 1);
    }
    return result;
}

Site Track::next_empty(Site start, int direction) const {
    if (direction != 1 && direction != -1) {
        throw OutOfRangeError("Search direction must be +1 or -1, got " + std::to_string(direction));
    }
    Site pos = start;
    while (is_occupied(pos)) {
        pos += direction;
    }
    return pos;
}

std::vector<ParticleId> Track::occupants_in(Site first, Site last) const {
    std::vector<ParticleId> result;
    for (Site site = first; site < last; ++site) {
        if (auto occupant = occupant_at(site)) {
            result.push_back(*occupant);
        }
    }
    return result;
}

} // namespace tracksim::core
