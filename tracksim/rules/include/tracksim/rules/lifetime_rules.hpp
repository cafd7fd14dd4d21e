#pragma once

#include <tracksim/core/rule.hpp>
#include <tracksim/core/types.hpp>

#include <optional>
#include <string_view>

namespace tracksim::rules {

/// @brief State key holding a particle's lifetime in seconds.
inline constexpr std::string_view LIFETIME = "lifetime";

/// @brief Finite life: expiry at `lifetime` seconds after creation.
///
/// A particle without a `lifetime` entry never expires through this rule.
///
/// @throws core::RuleError if the lifetime is negative.
/// @ingroup rules_lifetime
std::optional<core::TimePoint> finite_life_expiry(const core::Particle& self,
                                                  const core::RuleContext& ctx);

} // namespace tracksim::rules
