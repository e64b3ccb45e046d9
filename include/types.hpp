/**
 * pokesim - Core Type Definitions
 *
 * This file defines all enums and basic types used throughout the engine.
 * Enum names double as the identifiers used in JSON rule tables and logs.
 */

#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include <array>
#include <optional>

namespace pokesim {

// ============================================================================
// ENUMS
// ============================================================================

enum class Type : uint8_t {
    NORMAL,
    FIRE,
    WATER,
    ELECTRIC,
    GRASS,
    ICE,
    FIGHTING,
    POISON,
    GROUND,
    FLYING,
    PSYCHIC,
    BUG,
    ROCK,
    GHOST,
    DRAGON,
    DARK,
    STEEL,
    FAIRY,
    TYPELESS    // Struggle, confusion self-hit
};

constexpr size_t TYPE_COUNT = 18;

enum class MoveCategory : uint8_t {
    PHYSICAL,
    SPECIAL,
    STATUS
};

enum class Stat : uint8_t {
    HP,
    ATK,
    DEF,
    SPA,
    SPD,
    SPE
};

// Stages that can be boosted; HP has no stage.
enum class BoostStat : uint8_t {
    ATK,
    DEF,
    SPA,
    SPD,
    SPE,
    ACCURACY,
    EVASION
};

constexpr size_t BOOST_STAT_COUNT = 7;
constexpr int MIN_BOOST = -6;
constexpr int MAX_BOOST = 6;

enum class MajorStatus : uint8_t {
    NONE,
    BURN,
    POISON,
    BADLY_POISONED,
    PARALYSIS,
    SLEEP,
    FREEZE
};

enum class Volatile : uint8_t {
    CONFUSION,
    FLINCH,
    TAUNT,
    ENCORE,
    DISABLE,
    TORMENT,
    IMPRISON,
    SUBSTITUTE,
    TRAPPED,        // Mean Look, Shadow Tag style: no switching
    PARTIAL_TRAP,   // Fire Spin, Whirlpool, Infestation: no switching + chip
    LEECH_SEED,
    PERISH_SONG,
    PROTECT,
    CHARGING,
    DESTINY_BOND,
    FLASH_FIRE,
    PARADOX_BOOST   // Protosynthesis / Quark Drive active
};

enum class Weather : uint8_t {
    NONE,
    SUN,
    RAIN,
    SANDSTORM,
    HAIL,
    SNOW
};

enum class Terrain : uint8_t {
    NONE,
    ELECTRIC,
    GRASSY,
    MISTY,
    PSYCHIC
};

enum class Hazard : uint8_t {
    STEALTH_ROCK,
    SPIKES,
    TOXIC_SPIKES,
    STICKY_WEB
};

enum class Screen : uint8_t {
    REFLECT,
    LIGHT_SCREEN,
    AURORA_VEIL
};

constexpr size_t SCREEN_COUNT = 3;

enum class Room : uint8_t {
    TRICK_ROOM,
    GRAVITY,
    WONDER_ROOM,
    MAGIC_ROOM
};

constexpr size_t ROOM_COUNT = 4;

enum class ActionType : uint8_t {
    MOVE,
    SWITCH
};

enum class LogKind : uint8_t {
    MOVE,
    SWITCH,
    STATUS_TICK,
    VOLATILE_TICK,
    WEATHER_TICK,
    TERRAIN_TICK,
    HAZARD,
    ITEM_TRIGGER,
    ABILITY_TRIGGER,
    STAT_CHANGE,
    STATUS_APPLIED,
    FIELD_CHANGE,
    TERA,
    FAINT,
    FALLBACK,
    ACTION_PREVENTED
};

enum class Outcome : uint8_t {
    HIT,
    MISS,
    STATUS_PREVENTED,
    SWITCHED,
    HEALED,
    FAINTED,
    DAMAGED,
    APPLIED,
    BLOCKED,
    FAILED,
    IMMUNE,
    EXPIRED,
    FALLBACK,
    NO_EFFECT
};

enum class BattleWinner : uint8_t {
    SIDE_A,
    SIDE_B,
    TIE
};

enum class TurnPhase : uint8_t {
    AWAITING_ACTIONS,
    ORDER_DETERMINED,
    EXECUTING_FIRST,
    EXECUTING_SECOND,
    END_OF_TURN,
    CONTINUE,
    BATTLE_OVER
};

// ============================================================================
// TYPE ALIASES
// ============================================================================

using SideID = uint8_t;               // 0 (side A) or 1 (side B)
using SpeciesID = std::string;        // Normalized identifier (e.g., "garchomp")
using MoveID = std::string;           // Normalized identifier (e.g., "earthquake")
using BoostPair = std::pair<BoostStat, int>;

constexpr SideID SIDE_A = 0;
constexpr SideID SIDE_B = 1;
constexpr SideID NO_SIDE = 255;

inline SideID opponent_of(SideID side) {
    return side == SIDE_A ? SIDE_B : SIDE_A;
}

// ============================================================================
// UTILITY FUNCTIONS
// ============================================================================

inline const char* to_string(Type type) {
    switch (type) {
        case Type::NORMAL: return "Normal";
        case Type::FIRE: return "Fire";
        case Type::WATER: return "Water";
        case Type::ELECTRIC: return "Electric";
        case Type::GRASS: return "Grass";
        case Type::ICE: return "Ice";
        case Type::FIGHTING: return "Fighting";
        case Type::POISON: return "Poison";
        case Type::GROUND: return "Ground";
        case Type::FLYING: return "Flying";
        case Type::PSYCHIC: return "Psychic";
        case Type::BUG: return "Bug";
        case Type::ROCK: return "Rock";
        case Type::GHOST: return "Ghost";
        case Type::DRAGON: return "Dragon";
        case Type::DARK: return "Dark";
        case Type::STEEL: return "Steel";
        case Type::FAIRY: return "Fairy";
        case Type::TYPELESS: return "Typeless";
        default: return "Unknown";
    }
}

inline const char* to_string(MoveCategory category) {
    switch (category) {
        case MoveCategory::PHYSICAL: return "physical";
        case MoveCategory::SPECIAL: return "special";
        case MoveCategory::STATUS: return "status";
        default: return "unknown";
    }
}

inline const char* to_string(Stat stat) {
    switch (stat) {
        case Stat::HP: return "hp";
        case Stat::ATK: return "atk";
        case Stat::DEF: return "def";
        case Stat::SPA: return "spa";
        case Stat::SPD: return "spd";
        case Stat::SPE: return "spe";
        default: return "unknown";
    }
}

inline const char* to_string(BoostStat stat) {
    switch (stat) {
        case BoostStat::ATK: return "atk";
        case BoostStat::DEF: return "def";
        case BoostStat::SPA: return "spa";
        case BoostStat::SPD: return "spd";
        case BoostStat::SPE: return "spe";
        case BoostStat::ACCURACY: return "accuracy";
        case BoostStat::EVASION: return "evasion";
        default: return "unknown";
    }
}

inline const char* to_string(MajorStatus status) {
    switch (status) {
        case MajorStatus::NONE: return "none";
        case MajorStatus::BURN: return "burn";
        case MajorStatus::POISON: return "poison";
        case MajorStatus::BADLY_POISONED: return "badly_poisoned";
        case MajorStatus::PARALYSIS: return "paralysis";
        case MajorStatus::SLEEP: return "sleep";
        case MajorStatus::FREEZE: return "freeze";
        default: return "unknown";
    }
}

inline const char* to_string(Volatile v) {
    switch (v) {
        case Volatile::CONFUSION: return "confusion";
        case Volatile::FLINCH: return "flinch";
        case Volatile::TAUNT: return "taunt";
        case Volatile::ENCORE: return "encore";
        case Volatile::DISABLE: return "disable";
        case Volatile::TORMENT: return "torment";
        case Volatile::IMPRISON: return "imprison";
        case Volatile::SUBSTITUTE: return "substitute";
        case Volatile::TRAPPED: return "trapped";
        case Volatile::PARTIAL_TRAP: return "partial_trap";
        case Volatile::LEECH_SEED: return "leech_seed";
        case Volatile::PERISH_SONG: return "perish_song";
        case Volatile::PROTECT: return "protect";
        case Volatile::CHARGING: return "charging";
        case Volatile::DESTINY_BOND: return "destiny_bond";
        case Volatile::FLASH_FIRE: return "flash_fire";
        case Volatile::PARADOX_BOOST: return "paradox_boost";
        default: return "unknown";
    }
}

inline const char* to_string(Weather weather) {
    switch (weather) {
        case Weather::NONE: return "none";
        case Weather::SUN: return "sun";
        case Weather::RAIN: return "rain";
        case Weather::SANDSTORM: return "sandstorm";
        case Weather::HAIL: return "hail";
        case Weather::SNOW: return "snow";
        default: return "unknown";
    }
}

inline const char* to_string(Terrain terrain) {
    switch (terrain) {
        case Terrain::NONE: return "none";
        case Terrain::ELECTRIC: return "electric";
        case Terrain::GRASSY: return "grassy";
        case Terrain::MISTY: return "misty";
        case Terrain::PSYCHIC: return "psychic";
        default: return "unknown";
    }
}

inline const char* to_string(Hazard hazard) {
    switch (hazard) {
        case Hazard::STEALTH_ROCK: return "stealth_rock";
        case Hazard::SPIKES: return "spikes";
        case Hazard::TOXIC_SPIKES: return "toxic_spikes";
        case Hazard::STICKY_WEB: return "sticky_web";
        default: return "unknown";
    }
}

inline const char* to_string(Screen screen) {
    switch (screen) {
        case Screen::REFLECT: return "reflect";
        case Screen::LIGHT_SCREEN: return "light_screen";
        case Screen::AURORA_VEIL: return "aurora_veil";
        default: return "unknown";
    }
}

inline const char* to_string(Room room) {
    switch (room) {
        case Room::TRICK_ROOM: return "trick_room";
        case Room::GRAVITY: return "gravity";
        case Room::WONDER_ROOM: return "wonder_room";
        case Room::MAGIC_ROOM: return "magic_room";
        default: return "unknown";
    }
}

inline const char* to_string(LogKind kind) {
    switch (kind) {
        case LogKind::MOVE: return "move";
        case LogKind::SWITCH: return "switch";
        case LogKind::STATUS_TICK: return "status_tick";
        case LogKind::VOLATILE_TICK: return "volatile_tick";
        case LogKind::WEATHER_TICK: return "weather_tick";
        case LogKind::TERRAIN_TICK: return "terrain_tick";
        case LogKind::HAZARD: return "hazard";
        case LogKind::ITEM_TRIGGER: return "item_trigger";
        case LogKind::ABILITY_TRIGGER: return "ability_trigger";
        case LogKind::STAT_CHANGE: return "stat_change";
        case LogKind::STATUS_APPLIED: return "status_applied";
        case LogKind::FIELD_CHANGE: return "field_change";
        case LogKind::TERA: return "tera";
        case LogKind::FAINT: return "faint";
        case LogKind::FALLBACK: return "fallback";
        case LogKind::ACTION_PREVENTED: return "action_prevented";
        default: return "unknown";
    }
}

inline const char* to_string(Outcome outcome) {
    switch (outcome) {
        case Outcome::HIT: return "hit";
        case Outcome::MISS: return "miss";
        case Outcome::STATUS_PREVENTED: return "status_prevented";
        case Outcome::SWITCHED: return "switched";
        case Outcome::HEALED: return "healed";
        case Outcome::FAINTED: return "fainted";
        case Outcome::DAMAGED: return "damaged";
        case Outcome::APPLIED: return "applied";
        case Outcome::BLOCKED: return "blocked";
        case Outcome::FAILED: return "failed";
        case Outcome::IMMUNE: return "immune";
        case Outcome::EXPIRED: return "expired";
        case Outcome::FALLBACK: return "fallback";
        case Outcome::NO_EFFECT: return "no_effect";
        default: return "unknown";
    }
}

inline const char* to_string(BattleWinner winner) {
    switch (winner) {
        case BattleWinner::SIDE_A: return "side_a";
        case BattleWinner::SIDE_B: return "side_b";
        case BattleWinner::TIE: return "tie";
        default: return "unknown";
    }
}

inline const char* to_string(TurnPhase phase) {
    switch (phase) {
        case TurnPhase::AWAITING_ACTIONS: return "awaiting_actions";
        case TurnPhase::ORDER_DETERMINED: return "order_determined";
        case TurnPhase::EXECUTING_FIRST: return "executing_first";
        case TurnPhase::EXECUTING_SECOND: return "executing_second";
        case TurnPhase::END_OF_TURN: return "end_of_turn";
        case TurnPhase::CONTINUE: return "continue";
        case TurnPhase::BATTLE_OVER: return "battle_over";
        default: return "unknown";
    }
}

} // namespace pokesim
