#pragma once

/// @defgroup rules Rules Library
/// @brief Reusable traits and rules built on the core engine.
///
/// The rules library provides the stock behaviours most track simulations
/// start from: directed and random walkers, finite lifetimes, and a handful
/// of collision responses. Every rule is a plain function matching one of
/// the core rule signatures, so it can be bound to any trait name.
/// register_standard_rules() declares the stock traits under their usual
/// names. Depends on core only.

/// @defgroup rules_stepping Stepping rules
/// @ingroup rules
/// @brief Walkers.

/// @defgroup rules_collision Collision rules
/// @ingroup rules
/// @brief Responses of a mover that runs into another particle.

/// @defgroup rules_lifetime Lifetime rules
/// @ingroup rules
/// @brief Expiry of finite-life particles.

// Convenience header for libtracksim-rules

#include <tracksim/rules/collision_rules.hpp>
#include <tracksim/rules/lifetime_rules.hpp>
#include <tracksim/rules/standard_rules.hpp>
#include <tracksim/rules/stepping_rules.hpp>
