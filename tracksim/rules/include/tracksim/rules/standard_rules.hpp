#pragma once

#include <tracksim/core/rule_set.hpp>

#include <array>
#include <string_view>

namespace tracksim::rules {

/// @name Stock trait names
/// @{
inline constexpr std::string_view TRACK_END = core::RuleSet::TRACK_END;
inline constexpr std::string_view WALKER = "walker";
inline constexpr std::string_view RANDOM_WALKER = "random_walker";
inline constexpr std::string_view FINITE_LIFE = "finite_life";
inline constexpr std::string_view REFLECT = "reflect";
inline constexpr std::string_view KICK_OFF = "kick_off";
inline constexpr std::string_view FALL_OFF = "fall_off";
inline constexpr std::string_view PUSH = "push";
inline constexpr std::string_view SWAP = "swap";
/// @}

/// @brief Every trait declared by register_standard_rules(), in declaration order.
inline constexpr std::array<std::string_view, 9> STANDARD_TRAITS = {
    TRACK_END, WALKER, RANDOM_WALKER, FINITE_LIFE, REFLECT, KICK_OFF, FALL_OFF, PUSH, SWAP,
};

/// @brief Declare the stock traits on @p rules and bind their rules.
///
/// | trait           | binding                               |
/// |-----------------|---------------------------------------|
/// | `track_end`     | none (tag)                            |
/// | `walker`        | stepping: walker_step()               |
/// | `random_walker` | stepping: random_walker_step()        |
/// | `finite_life`   | lifetime: finite_life_expiry()        |
/// | `reflect`       | collision: reflect()                  |
/// | `kick_off`      | collision: kick_off()                 |
/// | `fall_off`      | collision: fall_off()                 |
/// | `push`          | collision: push()                     |
/// | `swap`          | collision: swap()                     |
///
/// A trait already declared on @p rules (e.g. `track_end`) is reused.
/// The collision and lifetime traits do not step, so a particle carries
/// them together with a walker, e.g. `["walker", "reflect"]` for a walker
/// that turns around on contact.
///
/// @throws core::ConfigurationError if one of the stock traits already has
///         a handler of the kind being bound, or `track_end` exists as an
///         ordinary trait.
/// @ingroup rules
void register_standard_rules(core::RuleSet& rules);

} // namespace tracksim::rules
