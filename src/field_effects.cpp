/**
 * pokesim - Field Effects Engine Implementation
 */

#include "field_effects.hpp"
#include "status_engine.hpp"
#include <algorithm>
#include <cmath>
#include <initializer_list>

namespace pokesim {

namespace {

std::string field_detail(const char* what, const char* value) {
    return std::string(what) + " " + value;
}

void log_field(BattleContext& ctx, SideID side, Outcome outcome,
               const std::string& actor, const std::string& detail) {
    ctx.state.record(side, LogKind::FIELD_CHANGE, outcome, actor, detail);
}

bool countdown(int& turns) {
    if (turns <= 0) {
        return false;
    }
    return --turns == 0;
}

} // anonymous namespace

// ============================================================================
// QUERIES
// ============================================================================

bool is_grounded(const EffectView& view, const Combatant& combatant) {
    if (view.field().gravity()) {
        return true;
    }
    if (combatant.has_type(Type::FLYING)) {
        return false;
    }
    return !view.has(combatant, EffectHandler::LEVITATES);
}

double weather_damage_modifier(const RuleTables& rules, Weather weather, Type move_type) {
    if (weather == Weather::NONE) {
        return 1.0;
    }
    for (const auto& [type, multiplier] : rules.get_weather(weather).type_modifiers) {
        if (type == move_type) {
            return multiplier;
        }
    }
    return 1.0;
}

double stealth_rock_fraction(const RuleTables& rules, const Combatant& combatant) {
    if (!rules.stealth_rock_type_scaled()) {
        return STEALTH_ROCK_FRACTION;
    }
    return STEALTH_ROCK_FRACTION * rules.type_chart().effectiveness(Type::ROCK, combatant.types);
}

// ============================================================================
// HAZARDS
// ============================================================================

void apply_switch_in_hazards(BattleContext& ctx, SideID side, Combatant& combatant) {
    SideState& side_state = ctx.state.side(side);
    if (!side_state.hazards.any() || combatant.fainted()) {
        return;
    }

    EffectView view = ctx.view();
    if (view.item_has(combatant, EffectHandler::HAZARD_IMMUNE)) {
        ctx.state.record(side, LogKind::ITEM_TRIGGER, Outcome::BLOCKED, combatant.name,
                         combatant.item + " (hazards)");
        return;
    }

    SideHazards& hazards = side_state.hazards;
    bool grounded = is_grounded(view, combatant);

    if (hazards.stealth_rock) {
        double fraction = stealth_rock_fraction(ctx.rules, combatant);
        if (fraction > 0.0) {
            apply_indirect_damage(ctx, side, combatant, fraction_of_max_hp(combatant, fraction),
                                  LogKind::HAZARD, "stealth_rock");
        }
        if (record_faint(ctx, side, combatant)) return;
    }

    if (hazards.spikes > 0 && grounded) {
        apply_indirect_damage(ctx, side, combatant,
                              fraction_of_max_hp(combatant, SPIKES_FRACTION_PER_LAYER * hazards.spikes),
                              LogKind::HAZARD, "spikes");
        if (record_faint(ctx, side, combatant)) return;
    }

    if (hazards.toxic_spikes > 0 && grounded) {
        if (combatant.has_type(Type::POISON)) {
            hazards.toxic_spikes = 0;
            ctx.state.record(side, LogKind::HAZARD, Outcome::EXPIRED, combatant.name, "toxic_spikes absorbed");
        } else {
            MajorStatus status = hazards.toxic_spikes >= 2 ? MajorStatus::BADLY_POISONED : MajorStatus::POISON;
            try_apply_status(ctx, side, combatant, status, "toxic_spikes", false, false);
        }
    }

    if (hazards.sticky_web && grounded) {
        apply_boost(ctx, side, combatant, BoostStat::SPE, -1, "sticky_web", true);
    }
}

Outcome add_hazard(BattleContext& ctx, SideID target_side, Hazard hazard, const std::string& actor) {
    SideHazards& hazards = ctx.state.side(target_side).hazards;
    bool added = false;

    switch (hazard) {
        case Hazard::STEALTH_ROCK:
            added = !hazards.stealth_rock;
            hazards.stealth_rock = true;
            break;
        case Hazard::SPIKES:
            added = hazards.spikes < MAX_SPIKES;
            if (added) hazards.spikes++;
            break;
        case Hazard::TOXIC_SPIKES:
            added = hazards.toxic_spikes < MAX_TOXIC_SPIKES;
            if (added) hazards.toxic_spikes++;
            break;
        case Hazard::STICKY_WEB:
            added = !hazards.sticky_web;
            hazards.sticky_web = true;
            break;
    }

    Outcome outcome = added ? Outcome::APPLIED : Outcome::FAILED;
    log_field(ctx, target_side, outcome, actor, field_detail("hazard", to_string(hazard)));
    return outcome;
}

void remove_hazards(BattleContext& ctx, SideID user_side, HazardRemoval removal, const std::string& actor) {
    SideState& own = ctx.state.side(user_side);
    SideState& foe = ctx.state.foe_side(user_side);

    switch (removal) {
        case HazardRemoval::DEFOG:
            own.hazards.clear();
            foe.hazards.clear();
            foe.screens.fill(0);
            log_field(ctx, user_side, Outcome::APPLIED, actor, "defog");
            break;
        case HazardRemoval::RAPID_SPIN: {
            own.hazards.clear();
            Combatant& user = own.active_combatant();
            user.remove_volatile(Volatile::LEECH_SEED);
            user.remove_volatile(Volatile::PARTIAL_TRAP);
            log_field(ctx, user_side, Outcome::APPLIED, actor, "rapid_spin");
            break;
        }
        case HazardRemoval::COURT_CHANGE:
            std::swap(own.hazards, foe.hazards);
            std::swap(own.screens, foe.screens);
            std::swap(own.tailwind_turns, foe.tailwind_turns);
            log_field(ctx, user_side, Outcome::APPLIED, actor, "court_change");
            break;
        case HazardRemoval::NONE:
            break;
    }
}

// ============================================================================
// SIDE CONDITIONS
// ============================================================================

Outcome raise_screen(BattleContext& ctx, SideID side, Screen screen, const std::string& actor) {
    SideState& side_state = ctx.state.side(side);
    Weather weather = ctx.state.field.weather;

    bool allowed = !side_state.screen_up(screen);
    if (screen == Screen::AURORA_VEIL && weather != Weather::HAIL && weather != Weather::SNOW) {
        allowed = false;
    }

    Outcome outcome = allowed ? Outcome::APPLIED : Outcome::FAILED;
    if (allowed) {
        side_state.screens[static_cast<size_t>(screen)] = SCREEN_TURNS;
    }
    log_field(ctx, side, outcome, actor, field_detail("screen", to_string(screen)));
    return outcome;
}

Outcome set_tailwind(BattleContext& ctx, SideID side, const std::string& actor) {
    SideState& side_state = ctx.state.side(side);
    Outcome outcome = side_state.tailwind() ? Outcome::FAILED : Outcome::APPLIED;
    if (outcome == Outcome::APPLIED) {
        side_state.tailwind_turns = TAILWIND_TURNS;
    }
    log_field(ctx, side, outcome, actor, "tailwind");
    return outcome;
}

// ============================================================================
// GLOBAL CONDITIONS
// ============================================================================

Outcome set_weather(BattleContext& ctx, Weather weather, SideID setter,
                    const std::string& actor, bool sustained) {
    FieldState& field = ctx.state.field;
    if (weather == Weather::NONE || field.weather == weather) {
        log_field(ctx, setter, Outcome::FAILED, actor, field_detail("weather", to_string(weather)));
        return Outcome::FAILED;
    }

    field.weather = weather;
    field.weather_turns = ctx.rules.get_weather(weather).duration;
    field.weather_sustained = sustained;
    field.weather_setter = sustained ? setter : NO_SIDE;

    log_field(ctx, setter, Outcome::APPLIED, actor, field_detail("weather", to_string(weather)));
    return Outcome::APPLIED;
}

Outcome set_terrain(BattleContext& ctx, Terrain terrain, const std::string& actor) {
    FieldState& field = ctx.state.field;
    if (terrain == Terrain::NONE || field.terrain == terrain) {
        log_field(ctx, NO_SIDE, Outcome::FAILED, actor, field_detail("terrain", to_string(terrain)));
        return Outcome::FAILED;
    }

    field.terrain = terrain;
    field.terrain_turns = ctx.rules.get_terrain(terrain).duration;
    log_field(ctx, NO_SIDE, Outcome::APPLIED, actor, field_detail("terrain", to_string(terrain)));
    return Outcome::APPLIED;
}

Outcome toggle_room(BattleContext& ctx, Room room, const std::string& actor) {
    int& turns = ctx.state.field.rooms[static_cast<size_t>(room)];
    if (turns > 0) {
        turns = 0;
        log_field(ctx, NO_SIDE, Outcome::EXPIRED, actor, field_detail("room", to_string(room)));
        return Outcome::EXPIRED;
    }
    turns = ROOM_TURNS;
    log_field(ctx, NO_SIDE, Outcome::APPLIED, actor, field_detail("room", to_string(room)));
    return Outcome::APPLIED;
}

void release_sustained_weather(BattleContext& ctx, SideID side) {
    FieldState& field = ctx.state.field;
    if (!field.weather_sustained || field.weather_setter != side) {
        return;
    }
    field.weather_sustained = false;
    field.weather_setter = NO_SIDE;
    field.weather_turns = ctx.rules.get_weather(field.weather).duration;
}

// ============================================================================
// END OF TURN
// ============================================================================

void end_of_turn_weather(BattleContext& ctx) {
    Weather weather = ctx.state.field.weather;
    if (weather == Weather::NONE) {
        return;
    }

    const WeatherDef& def = ctx.rules.get_weather(weather);
    if (def.chip_fraction <= 0.0) {
        return;
    }

    for (SideID side : {SIDE_A, SIDE_B}) {
        Combatant& active = ctx.state.active(side);
        if (active.fainted()) continue;

        bool immune = std::any_of(def.chip_immune_types.begin(), def.chip_immune_types.end(),
            [&active](Type type) { return active.has_type(type); });
        if (immune) continue;

        apply_indirect_damage(ctx, side, active, fraction_of_max_hp(active, def.chip_fraction),
                              LogKind::WEATHER_TICK, to_string(weather));
        record_faint(ctx, side, active);
    }
}

void end_of_turn_terrain(BattleContext& ctx) {
    Terrain terrain = ctx.state.field.terrain;
    if (terrain == Terrain::NONE) {
        return;
    }

    const TerrainDef& def = ctx.rules.get_terrain(terrain);
    if (def.heal_fraction <= 0.0) {
        return;
    }

    EffectView view = ctx.view();
    for (SideID side : {SIDE_A, SIDE_B}) {
        Combatant& active = ctx.state.active(side);
        if (active.fainted() || !is_grounded(view, active)) continue;
        apply_heal(ctx, side, active, fraction_of_max_hp(active, def.heal_fraction),
                   LogKind::TERRAIN_TICK, field_detail("terrain", to_string(terrain)));
    }
}

void tick_field_durations(BattleContext& ctx) {
    FieldState& field = ctx.state.field;

    if (field.weather != Weather::NONE && !field.weather_sustained && countdown(field.weather_turns)) {
        log_field(ctx, NO_SIDE, Outcome::EXPIRED, "field", field_detail("weather", to_string(field.weather)));
        field.weather = Weather::NONE;
    }

    if (field.terrain != Terrain::NONE && countdown(field.terrain_turns)) {
        log_field(ctx, NO_SIDE, Outcome::EXPIRED, "field", field_detail("terrain", to_string(field.terrain)));
        field.terrain = Terrain::NONE;
    }

    for (size_t i = 0; i < field.rooms.size(); i++) {
        if (countdown(field.rooms[i])) {
            log_field(ctx, NO_SIDE, Outcome::EXPIRED, "field",
                      field_detail("room", to_string(static_cast<Room>(i))));
        }
    }

    for (auto& side : ctx.state.sides) {
        for (size_t i = 0; i < side.screens.size(); i++) {
            if (countdown(side.screens[i])) {
                log_field(ctx, side.id, Outcome::EXPIRED, side.name,
                          field_detail("screen", to_string(static_cast<Screen>(i))));
            }
        }
        if (countdown(side.tailwind_turns)) {
            log_field(ctx, side.id, Outcome::EXPIRED, side.name, "tailwind");
        }
    }
}

} // namespace pokesim
