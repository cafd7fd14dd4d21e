#include <tracksim/core/rule_set.hpp>
#include <tracksim/core/error.hpp>

#include <algorithm>
#include <utility>

namespace tracksim::core {

TraitId RuleSet::declare_trait(std::string_view name) {
    if (name.empty()) {
        throw ConfigurationError("Trait name must not be empty");
    }
    if (find_trait(name)) {
        throw ConfigurationError("Trait '" + std::string(name) + "' is already declared");
    }
    TraitId id = traits_.size();
    traits_.push_back(Trait{std::string(name), {}, {}, {}, {}, false});
    return id;
}

TraitId RuleSet::ensure_trait(std::string_view name) {
    if (auto existing = find_trait(name)) {
        return *existing;
    }
    return declare_trait(name);
}

TraitId RuleSet::declare_tag(std::string_view name) {
    TraitId id = declare_trait(name);
    traits_[id].tag = true;
    return id;
}

TraitId RuleSet::ensure_tag(std::string_view name) {
    if (auto existing = find_trait(name)) {
        if (!traits_[*existing].tag) {
            throw ConfigurationError("Trait '" + std::string(name) +
                                     "' is already declared and is not a tag");
        }
        return *existing;
    }
    return declare_tag(name);
}

Trait& RuleSet::mutable_trait(std::string_view name, std::string_view handler_kind) {
    auto id = find_trait(name);
    if (!id) {
        throw ConfigurationError("Cannot bind " + std::string(handler_kind) +
                                 " rule: trait '" + std::string(name) + "' is not declared");
    }
    if (traits_[*id].tag) {
        throw ConfigurationError("Cannot bind " + std::string(handler_kind) +
                                 " rule: '" + std::string(name) + "' is a tag");
    }
    return traits_[*id];
}

void RuleSet::bind_stepping(std::string_view trait, StepRule rule) {
    Trait& t = mutable_trait(trait, "stepping");
    if (!rule) {
        throw ConfigurationError("Stepping rule for trait '" + t.name + "' is empty");
    }
    if (t.stepping) {
        throw ConfigurationError("Trait '" + t.name + "' already has a stepping rule");
    }
    t.stepping = std::move(rule);
}

void RuleSet::bind_collision(std::string_view trait, CollisionRule rule) {
    Trait& t = mutable_trait(trait, "collision");
    if (!rule) {
        throw ConfigurationError("Collision rule for trait '" + t.name + "' is empty");
    }
    if (t.collision) {
        throw ConfigurationError("Trait '" + t.name + "' already has a collision rule");
    }
    t.collision = std::move(rule);
}

void RuleSet::bind_lifetime(std::string_view trait, LifetimeRule rule) {
    Trait& t = mutable_trait(trait, "lifetime");
    if (!rule) {
        throw ConfigurationError("Lifetime rule for trait '" + t.name + "' is empty");
    }
    if (t.lifetime) {
        throw ConfigurationError("Trait '" + t.name + "' already has a lifetime rule");
    }
    t.lifetime = std::move(rule);
}

void RuleSet::bind_removal(std::string_view trait, RemovalRule rule) {
    Trait& t = mutable_trait(trait, "removal");
    if (!rule) {
        throw ConfigurationError("Removal rule for trait '" + t.name + "' is empty");
    }
    if (t.removal) {
        throw ConfigurationError("Trait '" + t.name + "' already has a removal rule");
    }
    t.removal = std::move(rule);
}

void RuleSet::set_fallback_stepping(StepRule rule) {
    if (!rule) {
        throw ConfigurationError("Fallback stepping rule is empty");
    }
    if (fallback_stepping_) {
        throw ConfigurationError("Fallback stepping rule already set");
    }
    fallback_stepping_ = std::move(rule);
}

void RuleSet::set_fallback_collision(CollisionRule rule) {
    if (!rule) {
        throw ConfigurationError("Fallback collision rule is empty");
    }
    if (fallback_collision_) {
        throw ConfigurationError("Fallback collision rule already set");
    }
    fallback_collision_ = std::move(rule);
}

std::optional<TraitId> RuleSet::find_trait(std::string_view name) const noexcept {
    auto it = std::find_if(traits_.begin(), traits_.end(),
                           [name](const Trait& t) { return t.name == name; });
    if (it == traits_.end()) {
        return std::nullopt;
    }
    return static_cast<TraitId>(it - traits_.begin());
}

TraitId RuleSet::trait_id(std::string_view name) const {
    auto id = find_trait(name);
    if (!id) {
        throw ConfigurationError("Trait '" + std::string(name) + "' is not declared");
    }
    return *id;
}

const Trait& RuleSet::trait(TraitId id) const {
    if (id >= traits_.size()) {
        throw OutOfRangeError("Trait id " + std::to_string(id) + " is out of range");
    }
    return traits_[id];
}

std::vector<TraitId> RuleSet::resolve(const std::vector<std::string>& names) const {
    std::vector<TraitId> ids;
    ids.reserve(names.size());
    for (const auto& name : names) {
        TraitId id = trait_id(name);
        if (std::find(ids.begin(), ids.end(), id) != ids.end()) {
            throw ConfigurationError("Trait '" + name + "' is attached twice");
        }
        ids.push_back(id);
    }
    return ids;
}

std::vector<std::string> RuleSet::names_of(const std::vector<TraitId>& traits) const {
    std::vector<std::string> names;
    names.reserve(traits.size());
    for (TraitId id : traits) {
        names.push_back(trait(id).name);
    }
    return names;
}

bool RuleSet::has_trait(const Particle& particle, std::string_view name) const noexcept {
    auto id = find_trait(name);
    return id && particle.has_trait(*id);
}

bool RuleSet::is_marker(const std::vector<TraitId>& traits) const {
    if (traits.empty()) {
        return false;
    }
    return std::all_of(traits.begin(), traits.end(), [this](TraitId id) { return trait(id).tag; });
}

void RuleSet::require_stepping(const std::vector<TraitId>& traits) const {
    if (fallback_stepping_ || is_marker(traits)) {
        return;
    }
    if (std::any_of(traits.begin(), traits.end(),
                    [this](TraitId id) { return static_cast<bool>(trait(id).stepping); })) {
        return;
    }
    std::string names;
    for (const auto& name : names_of(traits)) {
        names += names.empty() ? name : ", " + name;
    }
    throw ConfigurationError("A particle with traits [" + names +
                             "] has no stepping rule and no fallback stepping rule is set; "
                             "declare identifying-only traits with declare_tag()");
}

} // namespace tracksim::core
