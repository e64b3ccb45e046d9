/**
 * pokesim - Effect Catalog Implementation
 *
 * Tracks which effect functions the rule tables may name.
 */

#include "effects/effect_catalog.hpp"
#include <algorithm>

namespace pokesim {
namespace effects {

// ============================================================================
// EFFECT INFO DATABASE
// ============================================================================

namespace {

// Static list of all known effect functions for tracking implementation status
const std::vector<EffectInfo> g_effect_info = {
    // Abilities - Implemented
    {"intimidate", "Intimidate", "ability", "Lower the opposing active's Attack by 1 on switch-in", true},
    {"clear_body", "Clear Body", "ability", "Block stat drops caused by the opponent", true},
    {"contrary", "Contrary", "ability", "Invert every stat stage change", true},
    {"unaware", "Unaware", "ability", "Ignore the opponent's stat stages in damage", true},
    {"mold_breaker", "Mold Breaker", "ability", "Ignore the target's ability when attacking", true},
    {"magic_guard", "Magic Guard", "ability", "Take no indirect damage", true},
    {"magic_bounce", "Magic Bounce", "ability", "Reflect status moves back at the user", true},
    {"good_as_gold", "Good as Gold", "ability", "Immune to the opponent's status moves", true},
    {"infiltrator", "Infiltrator", "ability", "Ignore screens and substitutes", true},
    {"levitate", "Levitate", "ability", "Immune to Ground moves and grounded hazards", true},
    {"absorb_heal", "Volt Absorb / Water Absorb", "ability", "Absorb a move type and heal 1/4", true},
    {"absorb_boost", "Lightning Rod / Storm Drain", "ability", "Absorb a move type and raise a stat", true},
    {"flash_fire", "Flash Fire", "ability", "Absorb Fire moves; own Fire moves x1.5 afterwards", true},
    {"technician", "Technician", "ability", "Moves of 60 base power or less x1.5", true},
    {"sheer_force", "Sheer Force", "ability", "Drop secondary effects for x1.3 power", true},
    {"type_change", "Pixilate / Aerilate / Galvanize / Refrigerate", "ability", "Normal moves change type with x1.2 power", true},
    {"contact_damage", "Rough Skin / Iron Barbs", "ability", "Contact attackers lose 1/8 max HP", true},
    {"contact_status", "Static / Flame Body", "ability", "30% to inflict a status on contact attackers", true},
    {"prankster", "Prankster", "ability", "Status moves +1 priority; fail against Dark", true},
    {"gale_wings", "Gale Wings", "ability", "Flying moves +1 priority at full HP", true},
    {"weather_setter", "Drought / Drizzle / Sand Stream / Snow Warning", "ability", "Set weather on switch-in, sustained while active", true},
    {"terrain_setter", "Electric / Grassy / Misty / Psychic Surge", "ability", "Set terrain on switch-in", true},
    {"weather_speed", "Swift Swim / Chlorophyll / Sand Rush / Slush Rush", "ability", "Speed x2 in the matching weather", true},
    {"paradox", "Protosynthesis / Quark Drive", "ability", "Boost the highest stat in sun / Electric Terrain", true},
    {"regenerator", "Regenerator", "ability", "Heal 1/3 max HP on switch-out", true},

    // Abilities - Not Yet Implemented
    {"multiscale", "Multiscale", "ability", "Halve damage taken at full HP", false},
    {"guts", "Guts", "ability", "Attack x1.5 when statused; ignores burn halving", false},

    // Items - Implemented
    {"heavy_duty_boots", "Heavy-Duty Boots", "item", "Ignore entry hazards", true},
    {"focus_sash", "Focus Sash", "item", "Survive a hit from full HP at 1 HP", true},
    {"life_orb", "Life Orb", "item", "Damage x1.3, lose 10% max HP per damaging move", true},
    {"choice", "Choice Band / Specs / Scarf", "item", "Stat x1.5, locked into the first move", true},
    {"assault_vest", "Assault Vest", "item", "Special Defense x1.5, no status moves", true},
    {"leftovers", "Leftovers", "item", "Heal 1/16 max HP at end of turn", true},
    {"rocky_helmet", "Rocky Helmet", "item", "Contact attackers lose 1/4 max HP", true},
    {"eject_button", "Eject Button", "item", "Switch out after being hit", true},
    {"eject_pack", "Eject Pack", "item", "Switch out after a stat drop", true},
    {"red_card", "Red Card", "item", "Force the attacker out after being hit", true},
    {"booster_energy", "Booster Energy", "item", "Activate Protosynthesis / Quark Drive", true},
    {"loaded_dice", "Loaded Dice", "item", "Multi-hit moves roll uniformly over their range", true},
    {"type_boost", "Type-boost items", "item", "Moves of one type x1.2", true},
    {"quick_claw", "Quick Claw", "item", "20% to act first within the priority bracket", true},
    {"air_balloon", "Air Balloon", "item", "Ground immunity until hit", true},

    // Items - Not Yet Implemented
    {"sitrus_berry", "Sitrus Berry", "item", "Heal 1/4 at half HP", false},
    {"weakness_policy", "Weakness Policy", "item", "+2 Atk/SpA when hit super effectively", false},
};

} // anonymous namespace

std::vector<EffectInfo> get_effect_info() {
    return g_effect_info;
}

bool is_effect_implemented(const std::string& effect) {
    std::string id = RuleTables::normalize_id(effect);
    for (const auto& info : g_effect_info) {
        if (RuleTables::normalize_id(info.effect) == id) {
            return info.implemented;
        }
    }
    return false;
}

std::vector<std::string> find_inert_effects(const RuleTables& rules) {
    std::vector<std::string> inert;
    for (const auto& [id, def] : rules.abilities()) {
        if (!is_effect_implemented(def.effect)) {
            inert.push_back("ability " + id + " (" + def.effect + ")");
        }
    }
    for (const auto& [id, def] : rules.items()) {
        if (!is_effect_implemented(def.effect)) {
            inert.push_back("item " + id + " (" + def.effect + ")");
        }
    }
    std::sort(inert.begin(), inert.end());
    return inert;
}

} // namespace effects
} // namespace pokesim
