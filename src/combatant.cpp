/**
 * pokesim - Combatant Implementation
 */

#include "combatant.hpp"
#include <algorithm>
#include <sstream>

namespace pokesim {

// ============================================================================
// STAT HELPERS
// ============================================================================

double boost_multiplier(int stage) {
    stage = std::clamp(stage, MIN_BOOST, MAX_BOOST);
    if (stage >= 0) {
        return (2.0 + stage) / 2.0;
    }
    return 2.0 / (2.0 - stage);
}

double accuracy_boost_multiplier(int stage) {
    stage = std::clamp(stage, MIN_BOOST, MAX_BOOST);
    if (stage >= 0) {
        return (3.0 + stage) / 3.0;
    }
    return 3.0 / (3.0 - stage);
}

int calculate_stat(Stat stat, int base, int level, int iv, int ev) {
    int core = ((2 * base + iv + ev / 4) * level) / 100;
    if (stat == Stat::HP) {
        return core + level + 10;
    }
    return core + 5;
}

// ============================================================================
// STATE QUERIES
// ============================================================================

bool Combatant::has_type(Type type) const {
    return std::find(types.begin(), types.end(), type) != types.end();
}

// ============================================================================
// MUTATION
// ============================================================================

int Combatant::take_damage(int amount) {
    if (amount <= 0) {
        return 0;
    }
    int dealt = std::min(amount, hp);
    hp -= dealt;
    return dealt;
}

int Combatant::heal(int amount) {
    if (amount <= 0 || fainted()) {
        return 0;
    }
    int restored = std::min(amount, max_hp - hp);
    hp += restored;
    return restored;
}

int Combatant::change_boost(BoostStat stat, int delta) {
    int& stage = boosts[static_cast<size_t>(stat)];
    int before = stage;
    stage = std::clamp(stage + delta, MIN_BOOST, MAX_BOOST);
    return stage - before;
}

// ============================================================================
// VOLATILES
// ============================================================================

bool Combatant::has_volatile(Volatile kind) const {
    return find_volatile(kind) != nullptr;
}

VolatileState* Combatant::find_volatile(Volatile kind) {
    for (auto& v : volatiles) {
        if (v.kind == kind) return &v;
    }
    return nullptr;
}

const VolatileState* Combatant::find_volatile(Volatile kind) const {
    for (const auto& v : volatiles) {
        if (v.kind == kind) return &v;
    }
    return nullptr;
}

bool Combatant::add_volatile(VolatileState state) {
    if (has_volatile(state.kind)) {
        return false;
    }
    volatiles.push_back(std::move(state));
    return true;
}

bool Combatant::remove_volatile(Volatile kind) {
    auto it = std::remove_if(volatiles.begin(), volatiles.end(),
        [kind](const VolatileState& v) { return v.kind == kind; });
    if (it == volatiles.end()) {
        return false;
    }
    volatiles.erase(it, volatiles.end());
    if (kind == Volatile::SUBSTITUTE) {
        substitute_hp = 0;
    }
    if (kind == Volatile::PARADOX_BOOST) {
        paradox_stat.reset();
    }
    return true;
}

void Combatant::on_switch_out() {
    volatiles.clear();
    clear_boosts();
    choice_locked_move.clear();
    last_move.clear();
    protect_chain = 0;
    substitute_hp = 0;
    paradox_stat.reset();
    if (status == MajorStatus::BADLY_POISONED) {
        status_turns = 0;  // Toxic counter restarts
    }
}

// ============================================================================
// MOVES
// ============================================================================

MoveSlot* Combatant::find_move(const MoveID& id) {
    for (auto& slot : moves) {
        if (slot.move && slot.move->id == id) return &slot;
    }
    return nullptr;
}

const MoveSlot* Combatant::find_move(const MoveID& id) const {
    for (const auto& slot : moves) {
        if (slot.move && slot.move->id == id) return &slot;
    }
    return nullptr;
}

bool Combatant::has_usable_pp() const {
    return std::any_of(moves.begin(), moves.end(),
        [](const MoveSlot& slot) { return slot.pp > 0; });
}

bool Combatant::terastallize() {
    if (terastallized || !tera_type.has_value()) {
        return false;
    }
    types = {*tera_type};
    terastallized = true;
    return true;
}

void Combatant::check_invariants() const {
    std::ostringstream problem;

    if (max_hp <= 0) {
        problem << name << ": max HP " << max_hp << " is not positive";
    } else if (hp < 0 || hp > max_hp) {
        problem << name << ": HP " << hp << " outside [0, " << max_hp << "]";
    }

    for (size_t i = 0; i < boosts.size() && problem.str().empty(); i++) {
        if (boosts[i] < MIN_BOOST || boosts[i] > MAX_BOOST) {
            problem << name << ": boost " << to_string(static_cast<BoostStat>(i))
                    << " = " << boosts[i] << " outside [-6, 6]";
        }
    }

    for (const auto& slot : moves) {
        if (!problem.str().empty()) break;
        if (!slot.move) {
            problem << name << ": empty move slot";
        } else if (slot.pp < 0 || slot.pp > slot.max_pp) {
            problem << name << ": PP " << slot.pp << " for " << slot.move->id
                    << " outside [0, " << slot.max_pp << "]";
        }
    }

    if (problem.str().empty()) {
        if (status == MajorStatus::NONE && status_turns != 0) {
            problem << name << ": status counter " << status_turns << " without a status";
        } else if (status_turns < 0) {
            problem << name << ": negative status counter";
        } else if (types.empty() || types.size() > 2) {
            problem << name << ": " << types.size() << " types";
        } else if (substitute_hp > 0 && !has_volatile(Volatile::SUBSTITUTE)) {
            problem << name << ": substitute HP without a substitute";
        }
    }

    if (!problem.str().empty()) {
        throw InvariantViolation(problem.str());
    }
}

} // namespace pokesim
