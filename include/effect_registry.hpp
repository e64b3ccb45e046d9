/**
 * pokesim - Effect Registry
 *
 * Central registry for ability and item logic.
 *
 * Architecture:
 * - Abilities and items in the rule tables name an effect function
 *   (EffectDef::effect); the registry maps that name to an EffectHandler
 * - A handler is a bundle of optional callbacks: modifiers (change a
 *   number during damage/speed/priority calculation), guards (flags and
 *   absorb checks) and hooks (fire on battle events)
 * - Entries whose effect has no handler are inert
 *
 * Example usage:
 *   EffectHandler handler;
 *   handler.power = [](const ModifierContext& ctx, double value) { ... };
 *   registry.register_ability("technician", handler);
 */

#pragma once

#include "rule_tables.hpp"
#include <functional>
#include <unordered_map>

namespace pokesim {

// Forward declarations
struct BattleContext;
struct Combatant;
struct FieldState;

// ============================================================================
// CALLBACK CONTEXTS
// ============================================================================

/**
 * Read-only context for modifier callbacks.
 */
struct ModifierContext {
    const Combatant& holder;
    const Combatant* other;       // Opposing active, if any
    const MoveDef* move;          // Move being used/received, if any
    Type move_type;               // Effective move type (after type changes)
    const FieldState& field;
    const EffectDef& def;
};

/**
 * Mutable context for hook callbacks.
 */
struct HookContext {
    BattleContext& battle;
    SideID side;                  // Holder's side
    Combatant& holder;
    const EffectDef& def;
    const MoveDef* move = nullptr;
    Combatant* other = nullptr;   // Attacker / target involved in the event
    SideID other_side = NO_SIDE;
    int damage = 0;               // Damage dealt/received by the event
};

// ============================================================================
// CALLBACK TYPES
// ============================================================================

// Modifier: (context, value) -> modified value
using ModifierCallback = std::function<double(const ModifierContext&, double)>;

// Priority: (context) -> bracket bonus
using PriorityCallback = std::function<int(const ModifierContext&)>;

// Type change: (context) -> new move type, or nullopt to keep it
using TypeChangeCallback = std::function<std::optional<Type>(const ModifierContext&)>;

// Absorb: (context, move type) -> true if the holder absorbs the move
using AbsorbCallback = std::function<bool(HookContext&, Type)>;

// Damage guard: (context, incoming damage) -> adjusted damage
using DamageGuardCallback = std::function<int(HookContext&, int)>;

// Hook: (context) -> void
using HookCallback = std::function<void(HookContext&)>;

// ============================================================================
// EFFECT HANDLER
// ============================================================================

struct EffectHandler {
    // Guard flags
    static constexpr uint32_t IGNORES_BOOSTS        = 1 << 0;   // Unaware
    static constexpr uint32_t IGNORES_ABILITIES     = 1 << 1;   // Mold Breaker
    static constexpr uint32_t NO_INDIRECT_DAMAGE    = 1 << 2;   // Magic Guard
    static constexpr uint32_t REFLECTS_STATUS_MOVES = 1 << 3;   // Magic Bounce
    static constexpr uint32_t BLOCKS_STATUS_MOVES   = 1 << 4;   // Good as Gold
    static constexpr uint32_t BLOCKS_STAT_DROPS     = 1 << 5;   // Clear Body
    static constexpr uint32_t REVERSES_BOOSTS       = 1 << 6;   // Contrary
    static constexpr uint32_t INFILTRATES           = 1 << 7;   // Infiltrator
    static constexpr uint32_t LEVITATES             = 1 << 8;   // Levitate, Air Balloon
    static constexpr uint32_t HAZARD_IMMUNE         = 1 << 9;   // Heavy-Duty Boots
    static constexpr uint32_t REMOVES_SECONDARIES   = 1 << 10;  // Sheer Force
    static constexpr uint32_t FORBIDS_STATUS_MOVES  = 1 << 11;  // Assault Vest
    static constexpr uint32_t CHOICE_LOCK           = 1 << 12;  // Choice items
    static constexpr uint32_t UNIFORM_MULTI_HIT     = 1 << 13;  // Loaded Dice
    static constexpr uint32_t PRANKSTER             = 1 << 14;  // Status moves fail vs Dark
    static constexpr uint32_t MAY_ACT_FIRST         = 1 << 15;  // Quick Claw

    uint32_t flags = 0;

    // Modifiers
    ModifierCallback power;           // Holder attacking: damage multiplier
    ModifierCallback attack_stat;     // Holder attacking
    ModifierCallback defense_stat;    // Holder defending
    ModifierCallback speed;
    PriorityCallback priority;
    TypeChangeCallback move_type;

    // Guards
    AbsorbCallback absorb;            // Holder targeted by a move
    DamageGuardCallback before_damage;// Holder about to take move damage

    // Hooks
    HookCallback on_switch_in;
    HookCallback on_switch_out;
    HookCallback on_end_of_turn;
    HookCallback on_contact;          // Holder hit by a contact move (other = attacker)
    HookCallback on_hit;              // Holder hit by a damaging move
    HookCallback on_after_attack;     // Holder finished a damaging move
    HookCallback on_stat_lowered;

    bool has(uint32_t flag) const { return (flags & flag) != 0; }
};

// ============================================================================
// EFFECT REGISTRY
// ============================================================================

/**
 * EffectRegistry - Effect-function name -> handler.
 *
 * Thread-safe for read operations (lookup).
 * Not thread-safe for registration (call before battles start).
 */
class EffectRegistry {
public:
    EffectRegistry() = default;
    ~EffectRegistry() = default;

    // ========================================================================
    // REGISTRATION
    // ========================================================================

    void register_ability(const std::string& effect, EffectHandler handler);
    void register_item(const std::string& effect, EffectHandler handler);

    // ========================================================================
    // LOOKUP (nullptr if not registered)
    // ========================================================================

    const EffectHandler* find_ability(const std::string& effect) const;
    const EffectHandler* find_item(const std::string& effect) const;

    bool has_ability(const std::string& effect) const { return find_ability(effect) != nullptr; }
    bool has_item(const std::string& effect) const { return find_item(effect) != nullptr; }

    // ========================================================================
    // STATISTICS
    // ========================================================================

    size_t ability_count() const { return abilities_.size(); }
    size_t item_count() const { return items_.size(); }

private:
    std::unordered_map<std::string, EffectHandler> abilities_;
    std::unordered_map<std::string, EffectHandler> items_;
};

// ============================================================================
// BOUND EFFECTS
// ============================================================================

/**
 * An ability/item definition paired with its handler.
 */
struct BoundEffect {
    const EffectDef* def = nullptr;
    const EffectHandler* handler = nullptr;

    explicit operator bool() const { return def != nullptr && handler != nullptr; }

    bool has(uint32_t flag) const { return handler && handler->has(flag); }
};

/**
 * EffectView - Resolves a combatant's active ability/item handlers
 * against the current field (Magic Room suppresses items).
 */
class EffectView {
public:
    EffectView(const RuleTables& rules, const EffectRegistry& registry, const FieldState& field)
        : rules_(rules), registry_(registry), field_(field) {}

    BoundEffect ability(const Combatant& combatant) const;
    BoundEffect item(const Combatant& combatant) const;

    /**
     * Target's ability as seen by an attacker; Mold Breaker-class
     * attackers see none.
     */
    BoundEffect target_ability(const Combatant& attacker, const Combatant& target) const;

    bool ability_has(const Combatant& combatant, uint32_t flag) const {
        return ability(combatant).has(flag);
    }

    bool item_has(const Combatant& combatant, uint32_t flag) const {
        return item(combatant).has(flag);
    }

    /**
     * Ability or item carries the flag.
     */
    bool has(const Combatant& combatant, uint32_t flag) const {
        return ability_has(combatant, flag) || item_has(combatant, flag);
    }

    /**
     * Run a modifier through the holder's ability then item.
     */
    double modify(ModifierCallback EffectHandler::*modifier, const Combatant& holder,
                  const Combatant* other, const MoveDef* move, Type move_type,
                  double value) const;

    /**
     * Same as modify() for a holder being attacked: the ability is
     * skipped when the attacker ignores abilities.
     */
    double modify_target(ModifierCallback EffectHandler::*modifier, const Combatant& attacker,
                         const Combatant& target, const MoveDef* move, Type move_type,
                         double value) const;

    /**
     * Sum of priority bonuses from ability and item.
     */
    int priority_bonus(const Combatant& holder, const Combatant* other, const MoveDef& move) const;

    const RuleTables& rules() const { return rules_; }
    const FieldState& field() const { return field_; }

private:
    const RuleTables& rules_;
    const EffectRegistry& registry_;
    const FieldState& field_;
};

/**
 * Run one modifier of a bound effect; the value is unchanged when the
 * effect or the modifier is absent.
 */
double apply_modifier(const BoundEffect& bound, ModifierCallback EffectHandler::*modifier,
                      const Combatant& holder, const Combatant* other, const MoveDef* move,
                      Type move_type, const FieldState& field, double value);

// ============================================================================
// BUILT-IN HANDLERS
// ============================================================================

/**
 * Register every built-in ability and item handler.
 */
void register_all_effects(EffectRegistry& registry);

} // namespace pokesim
