/**
 * pokesim - Effect Catalog
 *
 * Central registration point for all built-in ability and item effects.
 * Rule tables name an effect function per ability/item; this catalog
 * provides the handlers for those names and tracks which are implemented.
 */

#pragma once

#include "../effect_registry.hpp"
#include <string>
#include <vector>

namespace pokesim {

struct BattleContext;

namespace effects {

// ============================================================================
// EFFECT INFO STRUCTURE
// ============================================================================

/**
 * EffectInfo - Metadata about a built-in effect function.
 */
struct EffectInfo {
    std::string effect;        // Effect function name referenced by the tables
    std::string name;
    std::string category;      // "ability", "item"
    std::string description;   // What the effect does
    bool implemented = false;
};

// ============================================================================
// REGISTRATION FUNCTIONS
// ============================================================================

/**
 * Register all implemented ability effects.
 */
void register_all_abilities(EffectRegistry& registry);

/**
 * Register all implemented item effects.
 */
void register_all_items(EffectRegistry& registry);

/**
 * Get list of all known effects and their implementation status.
 */
std::vector<EffectInfo> get_effect_info();

/**
 * Check if a specific effect function is implemented.
 */
bool is_effect_implemented(const std::string& effect);

/**
 * Abilities and items in the tables whose effect function has no handler.
 * These load fine and stay inert in battle. Sorted by id.
 */
std::vector<std::string> find_inert_effects(const RuleTables& rules);

// ============================================================================
// INDIVIDUAL ABILITY REGISTRATIONS
// ============================================================================

// Stat stages
void register_intimidate(EffectRegistry& registry);
void register_clear_body(EffectRegistry& registry);
void register_contrary(EffectRegistry& registry);
void register_unaware(EffectRegistry& registry);

// Rule breakers
void register_mold_breaker(EffectRegistry& registry);
void register_magic_guard(EffectRegistry& registry);
void register_magic_bounce(EffectRegistry& registry);
void register_good_as_gold(EffectRegistry& registry);
void register_infiltrator(EffectRegistry& registry);
void register_levitate(EffectRegistry& registry);

// Absorbers
void register_absorb_heal(EffectRegistry& registry);
void register_absorb_boost(EffectRegistry& registry);
void register_flash_fire(EffectRegistry& registry);

// Power
void register_technician(EffectRegistry& registry);
void register_sheer_force(EffectRegistry& registry);
void register_type_change(EffectRegistry& registry);

// Contact punishers
void register_contact_damage(EffectRegistry& registry);
void register_contact_status(EffectRegistry& registry);

// Priority
void register_prankster(EffectRegistry& registry);
void register_gale_wings(EffectRegistry& registry);

// Field
void register_weather_setter(EffectRegistry& registry);
void register_terrain_setter(EffectRegistry& registry);
void register_weather_speed(EffectRegistry& registry);
void register_paradox(EffectRegistry& registry);

// Switching
void register_regenerator(EffectRegistry& registry);

// ============================================================================
// INDIVIDUAL ITEM REGISTRATIONS
// ============================================================================

void register_heavy_duty_boots(EffectRegistry& registry);
void register_focus_sash(EffectRegistry& registry);
void register_life_orb(EffectRegistry& registry);
void register_choice_item(EffectRegistry& registry);
void register_assault_vest(EffectRegistry& registry);
void register_leftovers(EffectRegistry& registry);
void register_rocky_helmet(EffectRegistry& registry);
void register_eject_button(EffectRegistry& registry);
void register_eject_pack(EffectRegistry& registry);
void register_red_card(EffectRegistry& registry);
void register_booster_energy(EffectRegistry& registry);
void register_loaded_dice(EffectRegistry& registry);
void register_type_boost(EffectRegistry& registry);
void register_quick_claw(EffectRegistry& registry);
void register_air_balloon(EffectRegistry& registry);

// ============================================================================
// SHARED HELPERS
// ============================================================================

/**
 * Remove the holder's item and log the consumption.
 */
void consume_item(BattleContext& battle, SideID side, Combatant& holder, const std::string& reason);

/**
 * Boost the holder's highest stat (Protosynthesis / Quark Drive).
 * No-op if already boosted.
 *
 * @param source  "weather", "terrain" or the item that triggered it
 */
void activate_paradox_boost(BattleContext& battle, SideID side, Combatant& holder,
                            const std::string& source);

/**
 * The stat a paradox boost would raise: highest of Atk/Def/SpA/SpD/Spe,
 * earliest on ties.
 */
Stat highest_stat(const Combatant& combatant);

} // namespace effects
} // namespace pokesim
