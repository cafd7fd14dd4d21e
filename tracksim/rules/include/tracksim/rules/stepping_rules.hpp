#pragma once

#include <tracksim/core/rule.hpp>
#include <tracksim/core/types.hpp>

#include <cstdint>
#include <string_view>

namespace tracksim::rules {

/// @name State keys read by the walkers
/// @{
inline constexpr std::string_view DIRECTION = "direction"; ///< -1 or +1 (integer).
inline constexpr std::string_view SPEED = "speed";         ///< Steps per second (number, default 1).
inline constexpr std::string_view P_FORWARD = "p_forward"; ///< Forward probability (number, default 0.5).
/// @}

/// @brief Current direction of @p self.
///
/// A particle without a direction gets one drawn uniformly from {-1, +1},
/// which is then stored in its state so later steps keep it.
///
/// @throws core::RuleError if the stored direction is neither -1 nor +1.
/// @ingroup rules_stepping
int64_t direction_of(core::Particle& self, const core::RuleContext& ctx);

/// @brief Waiting time between two steps of @p self, i.e. 1 / speed.
/// @throws core::RuleError if the speed is not positive.
/// @ingroup rules_stepping
[[nodiscard]] core::Duration step_interval(const core::Particle& self);

/// @brief Directed walker: one site along its direction every 1 / speed seconds.
///
/// The walker never checks the target itself; what happens when the site
/// is taken is left to collision rules.
///
/// @ingroup rules_stepping
core::StepAction walker_step(core::Particle& self, const core::RuleContext& ctx);

/// @brief Random walker: every 1 / speed seconds, one site forward with
/// probability `p_forward`, otherwise one site backward.
///
/// "Forward" is the particle's direction (see direction_of()).
///
/// @throws core::RuleError if `p_forward` lies outside [0, 1].
/// @ingroup rules_stepping
core::StepAction random_walker_step(core::Particle& self, const core::RuleContext& ctx);

} // namespace tracksim::rules
