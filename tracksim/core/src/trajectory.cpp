#include <tracksim/core/trajectory.hpp>

#include <array>
#include <utility>

namespace tracksim::core {

namespace {

constexpr std::array<std::pair<EventKind, std::string_view>, 10> kEventKindNames{{
    {EventKind::Place, "place"},
    {EventKind::Move, "move"},
    {EventKind::Swap, "swap"},
    {EventKind::Push, "push"},
    {EventKind::Bounce, "bounce"},
    {EventKind::Merge, "merge"},
    {EventKind::Remove, "remove"},
    {EventKind::Expire, "expire"},
    {EventKind::Exit, "exit"},
    {EventKind::Spawn, "spawn"},
}};

} // namespace

std::string_view to_string(EventKind kind) noexcept {
    for (const auto& [value, name] : kEventKindNames) {
        if (value == kind) {
            return name;
        }
    }
    return "unknown";
}

std::optional<EventKind> event_kind_from_string(std::string_view name) noexcept {
    for (const auto& [value, candidate] : kEventKindNames) {
        if (candidate == name) {
            return value;
        }
    }
    return std::nullopt;
}

} // namespace tracksim::core
