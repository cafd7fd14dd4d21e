#include <tracksim/rules/standard_rules.hpp>

#include <tracksim/rules/collision_rules.hpp>
#include <tracksim/rules/lifetime_rules.hpp>
#include <tracksim/rules/stepping_rules.hpp>

#include <string>

namespace tracksim::rules {

void register_standard_rules(core::RuleSet& rules) {
    rules.ensure_tag(TRACK_END);
    for (auto name : STANDARD_TRAITS) {
        if (name != TRACK_END) {
            rules.ensure_trait(name);
        }
    }

    rules.bind_stepping(WALKER, walker_step);
    rules.bind_stepping(RANDOM_WALKER, random_walker_step);
    rules.bind_lifetime(FINITE_LIFE, finite_life_expiry);

    rules.bind_collision(REFLECT, reflect(std::string(REFLECT)));
    rules.bind_collision(KICK_OFF, kick_off(std::string(KICK_OFF)));
    rules.bind_collision(FALL_OFF, fall_off(std::string(FALL_OFF)));
    rules.bind_collision(PUSH, push(std::string(PUSH)));
    rules.bind_collision(SWAP, swap(std::string(SWAP)));
}

} // namespace tracksim::rules
