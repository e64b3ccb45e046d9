/**
 * Shared builders for engine tests
 *
 * Rule tables are assembled through the programmatic add_* API so most
 * suites do not depend on the JSON loader.
 */

#pragma once

#include <cmath>
#include <sstream>
#include "pokesim.hpp"

namespace pokesim_test {

using namespace pokesim;

// ============================================================================
// DEFINITIONS
// ============================================================================

inline MoveDef make_move(const std::string& name, Type type, MoveCategory category,
                         int power, std::optional<int> accuracy = 100) {
    MoveDef move;
    move.id = RuleTables::normalize_id(name);
    move.name = name;
    move.type = type;
    move.category = category;
    move.power = power;
    move.accuracy = accuracy;
    move.pp = 10;
    return move;
}

inline MoveDef make_status_move(const std::string& name, Type type, std::optional<int> accuracy = std::nullopt) {
    return make_move(name, type, MoveCategory::STATUS, 0, accuracy);
}

inline EffectDef make_effect(const std::string& name, const std::string& effect,
                             std::unordered_map<std::string, std::string> params = {}) {
    EffectDef def;
    def.id = RuleTables::normalize_id(name);
    def.name = name;
    def.effect = effect;
    def.params = std::move(params);
    return def;
}

inline SpeciesDef make_species(const std::string& name, std::vector<Type> types,
                               StatBlock base = StatBlock::uniform(100)) {
    SpeciesDef species;
    species.id = RuleTables::normalize_id(name);
    species.name = name;
    species.types = std::move(types);
    species.base_stats = base;
    return species;
}

/**
 * Rule tables with a small pool of moves, abilities and items shared by
 * the engine suites. Species with base 100 everywhere come out at
 * 341 HP / 236 other stats at level 100 with 31 IVs and 0 EVs.
 */
inline RuleTables standard_rules() {
    RuleTables rules;

    rules.add_species(make_species("Normie", {Type::NORMAL}));
    rules.add_species(make_species("Slowpoke", {Type::WATER}, StatBlock{100, 100, 100, 100, 100, 50}));
    rules.add_species(make_species("Speedster", {Type::ELECTRIC}, StatBlock{100, 100, 100, 100, 100, 150}));
    rules.add_species(make_species("Leafy", {Type::GRASS}));
    rules.add_species(make_species("Ghosty", {Type::GHOST}));
    rules.add_species(make_species("Digger", {Type::GROUND}));
    rules.add_species(make_species("Birdy", {Type::NORMAL, Type::FLYING}));
    rules.add_species(make_species("Glass", {Type::NORMAL}, StatBlock{10, 100, 5, 100, 5, 100}));

    MoveDef body_slam = make_move("Body Slam", Type::NORMAL, MoveCategory::PHYSICAL, 85);
    body_slam.flags.contact = true;
    rules.add_move(body_slam);

    rules.add_move(make_move("Thunderbolt", Type::ELECTRIC, MoveCategory::SPECIAL, 90));
    rules.add_move(make_move("Flamethrower", Type::FIRE, MoveCategory::SPECIAL, 90));

    MoveDef earthquake = make_move("Earthquake", Type::GROUND, MoveCategory::PHYSICAL, 100);
    earthquake.flags.grassy_halved = true;
    rules.add_move(earthquake);

    MoveDef quick_attack = make_move("Quick Attack", Type::NORMAL, MoveCategory::PHYSICAL, 40);
    quick_attack.priority = 1;
    quick_attack.flags.contact = true;
    rules.add_move(quick_attack);

    MoveDef sucker_punch = make_move("Sucker Punch", Type::DARK, MoveCategory::PHYSICAL, 70);
    sucker_punch.priority = 1;
    sucker_punch.flags.contact = true;
    sucker_punch.flags.requires_target_attack = true;
    rules.add_move(sucker_punch);

    MoveDef feint = make_move("Feint", Type::NORMAL, MoveCategory::PHYSICAL, 30);
    feint.priority = 2;
    feint.flags.breaks_protect = true;
    rules.add_move(feint);

    MoveDef protect = make_status_move("Protect", Type::NORMAL);
    protect.priority = 4;
    protect.protect = ProtectKind::PROTECT;
    rules.add_move(protect);

    MoveDef spiky = make_status_move("Spiky Shield", Type::GRASS);
    spiky.priority = 4;
    spiky.protect = ProtectKind::SPIKY_SHIELD;
    rules.add_move(spiky);

    MoveDef thunder_wave = make_status_move("Thunder Wave", Type::ELECTRIC, 90);
    thunder_wave.inflicts_status = MajorStatus::PARALYSIS;
    rules.add_move(thunder_wave);

    MoveDef toxic = make_status_move("Toxic", Type::POISON, 90);
    toxic.inflicts_status = MajorStatus::BADLY_POISONED;
    rules.add_move(toxic);

    MoveDef spore = make_status_move("Spore", Type::GRASS, 100);
    spore.inflicts_status = MajorStatus::SLEEP;
    spore.flags.powder = true;
    rules.add_move(spore);

    MoveDef swords_dance = make_status_move("Swords Dance", Type::NORMAL);
    swords_dance.self_boosts = {{BoostStat::ATK, 2}};
    rules.add_move(swords_dance);

    MoveDef growl = make_status_move("Growl", Type::NORMAL, 100);
    growl.target_boosts = {{BoostStat::ATK, -1}};
    growl.flags.sound = true;
    rules.add_move(growl);

    MoveDef substitute = make_status_move("Substitute", Type::NORMAL);
    substitute.inflicts_volatile = Volatile::SUBSTITUTE;
    rules.add_move(substitute);

    MoveDef recover = make_status_move("Recover", Type::NORMAL);
    recover.heal = 0.5;
    rules.add_move(recover);

    MoveDef stealth_rock = make_status_move("Stealth Rock", Type::ROCK);
    stealth_rock.hazard = Hazard::STEALTH_ROCK;
    rules.add_move(stealth_rock);

    MoveDef sunny_day = make_status_move("Sunny Day", Type::FIRE);
    sunny_day.sets_weather = Weather::SUN;
    rules.add_move(sunny_day);

    MoveDef trick_room = make_status_move("Trick Room", Type::PSYCHIC);
    trick_room.priority = -7;
    trick_room.room = Room::TRICK_ROOM;
    rules.add_move(trick_room);

    MoveDef bullet_seed = make_move("Bullet Seed", Type::GRASS, MoveCategory::PHYSICAL, 25);
    bullet_seed.min_hits = 2;
    bullet_seed.max_hits = 5;
    rules.add_move(bullet_seed);

    MoveDef counter = make_move("Counter", Type::FIGHTING, MoveCategory::PHYSICAL, 1);
    counter.priority = -5;
    counter.fixed_damage = FixedDamage::COUNTER;
    rules.add_move(counter);

    MoveDef night_shade = make_move("Night Shade", Type::GHOST, MoveCategory::SPECIAL, 1);
    night_shade.fixed_damage = FixedDamage::LEVEL;
    rules.add_move(night_shade);

    MoveDef fissure = make_move("Fissure", Type::GROUND, MoveCategory::PHYSICAL, 1, 30);
    fissure.fixed_damage = FixedDamage::OHKO;
    rules.add_move(fissure);

    MoveDef double_team = make_status_move("Double Team", Type::NORMAL);
    double_team.self_boosts = {{BoostStat::EVASION, 1}};
    rules.add_move(double_team);

    MoveDef solar_beam = make_move("Solar Beam", Type::GRASS, MoveCategory::SPECIAL, 120);
    solar_beam.flags.charge = true;
    solar_beam.flags.solar = true;
    rules.add_move(solar_beam);

    MoveDef u_turn = make_move("U-turn", Type::BUG, MoveCategory::PHYSICAL, 70);
    u_turn.flags.contact = true;
    u_turn.flags.self_switch = true;
    rules.add_move(u_turn);

    MoveDef fire_fang = make_move("Fire Fang", Type::FIRE, MoveCategory::PHYSICAL, 65, 95);
    fire_fang.flags.contact = true;
    SecondaryEffect burn;
    burn.chance = 10;
    burn.status = MajorStatus::BURN;
    fire_fang.secondary = burn;
    rules.add_move(fire_fang);

    rules.add_ability(make_effect("Intimidate", "intimidate"));
    rules.add_ability(make_effect("Clear Body", "clear_body"));
    rules.add_ability(make_effect("Contrary", "contrary"));
    rules.add_ability(make_effect("Unaware", "unaware"));
    rules.add_ability(make_effect("Mold Breaker", "mold_breaker"));
    rules.add_ability(make_effect("Magic Guard", "magic_guard"));
    rules.add_ability(make_effect("Magic Bounce", "magic_bounce"));
    rules.add_ability(make_effect("Good as Gold", "good_as_gold"));
    rules.add_ability(make_effect("Infiltrator", "infiltrator"));
    rules.add_ability(make_effect("Levitate", "levitate"));
    rules.add_ability(make_effect("Volt Absorb", "absorb_heal", {{"type", "electric"}}));
    rules.add_ability(make_effect("Technician", "technician"));
    rules.add_ability(make_effect("Rough Skin", "contact_damage"));
    rules.add_ability(make_effect("Prankster", "prankster"));
    rules.add_ability(make_effect("Drought", "weather_setter", {{"weather", "sun"}}));
    rules.add_ability(make_effect("Regenerator", "regenerator"));
    rules.add_ability(make_effect("Pixilate", "type_change", {{"type", "fairy"}}));

    rules.add_item(make_effect("Leftovers", "leftovers"));
    rules.add_item(make_effect("Life Orb", "life_orb"));
    rules.add_item(make_effect("Focus Sash", "focus_sash"));
    rules.add_item(make_effect("Rocky Helmet", "rocky_helmet"));
    rules.add_item(make_effect("Heavy-Duty Boots", "heavy_duty_boots"));
    rules.add_item(make_effect("Choice Scarf", "choice", {{"stat", "spe"}}));
    rules.add_item(make_effect("Choice Band", "choice", {{"stat", "atk"}}));
    rules.add_item(make_effect("Quick Claw", "quick_claw"));
    rules.add_item(make_effect("Loaded Dice", "loaded_dice"));
    rules.add_item(make_effect("Assault Vest", "assault_vest"));
    rules.add_item(make_effect("Air Balloon", "air_balloon"));
    rules.add_item(make_effect("Eject Button", "eject_button"));

    return rules;
}

// ============================================================================
// COMBATANTS AND STATE
// ============================================================================

/**
 * Combatant with explicit final stats (no stat formula).
 */
inline Combatant make_combatant(const std::string& name, std::vector<Type> types,
                                int hp, int atk, int def, int spa, int spd, int spe,
                                int level = 100) {
    Combatant c;
    c.species = RuleTables::normalize_id(name);
    c.name = name;
    c.level = level;
    c.stats = StatBlock{hp, atk, def, spa, spd, spe};
    c.max_hp = hp;
    c.hp = hp;
    c.types = types;
    c.original_types = types;
    return c;
}

inline Combatant make_combatant(const std::string& name, std::vector<Type> types = {Type::NORMAL}) {
    return make_combatant(name, std::move(types), 200, 100, 100, 100, 100, 100);
}

inline void give_move(Combatant& c, const RuleTables& rules, const std::string& move_id) {
    const MoveDef* move = rules.get_move(move_id);
    if (!move) {
        throw std::runtime_error("test rules lack move " + move_id);
    }
    MoveSlot slot;
    slot.move = move;
    slot.pp = slot.max_pp = move->pp;
    c.moves.push_back(slot);
}

/**
 * One-on-one state, already started (no lead logs).
 */
inline BattleState make_state(Combatant a, Combatant b) {
    BattleState state;
    state.side(SIDE_A).roster.push_back(std::move(a));
    state.side(SIDE_B).roster.push_back(std::move(b));
    state.started = true;
    return state;
}

inline CombatantSpec member(const std::string& species, std::vector<std::string> moves,
                            const std::string& ability = "", const std::string& item = "") {
    CombatantSpec spec;
    spec.species = species;
    spec.moves = std::move(moves);
    spec.ability = ability;
    spec.item = item;
    return spec;
}

inline Roster roster(std::vector<CombatantSpec> members, const std::string& name = "") {
    Roster r;
    r.name = name;
    r.members = std::move(members);
    return r;
}

// ============================================================================
// LOG QUERIES
// ============================================================================

inline bool log_has(const BattleState& state, LogKind kind, Outcome outcome) {
    return state.log.count(kind, outcome) > 0;
}

inline bool log_detail_contains(const BattleState& state, LogKind kind, const std::string& text) {
    for (const auto& entry : state.log.entries()) {
        if (entry.kind == kind && entry.detail.find(text) != std::string::npos) {
            return true;
        }
    }
    return false;
}

inline const LogEntry* last_of(const BattleState& state, LogKind kind) {
    const auto& entries = state.log.entries();
    for (auto it = entries.rbegin(); it != entries.rend(); ++it) {
        if (it->kind == kind) return &*it;
    }
    return nullptr;
}

/**
 * Actor of the first MOVE entry logged in a turn, "" if none.
 */
inline std::string first_mover(const BattleState& state, int turn) {
    for (const auto& entry : state.log.entries()) {
        if (entry.turn == turn && entry.kind == LogKind::MOVE) {
            return entry.actor;
        }
    }
    return "";
}

// ============================================================================
// ENGINE FIXTURE
// ============================================================================

/**
 * Engine over standard_rules(), a battle built from two rosters and a
 * scripted random source (0.99 once the script runs out: hits land, no
 * crits, max roll, speed ties go to side B).
 */
struct Arena {
    RuleTables rules;
    BattleEngine engine;
    ScriptedRandom rng;
    BattleState state;

    Arena(const Roster& a, const Roster& b, FormatRules format = {})
        : rules(standard_rules())
        , engine(rules, std::move(format))
        , state(engine.create_battle(a, b))
    {}

    void start() { engine.start_battle(state, rng); }

    void turn(const BattleAction& a, const BattleAction& b) {
        engine.run_turn(state, a, b, rng);
    }

    void turn(int slot_a, int slot_b) {
        turn(BattleAction::move(SIDE_A, slot_a), BattleAction::move(SIDE_B, slot_b));
    }

    Combatant& active(SideID side) { return state.active(side); }
};

inline bool approx(double actual, double expected) {
    return std::fabs(actual - expected) < 1e-9;
}

} // namespace pokesim_test
