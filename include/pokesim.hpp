/**
 * pokesim - Battle Simulation Engine
 *
 * Deterministic single-battle engine for self-play and analysis.
 *
 * Include this header to get access to the complete engine API.
 */

#pragma once

// Core types
#include "types.hpp"
#include "random_source.hpp"

// Static data
#include "rule_tables.hpp"
#include "format_rules.hpp"

// Battle state
#include "combatant.hpp"
#include "roster.hpp"
#include "side_state.hpp"
#include "battle_log.hpp"
#include "battle_state.hpp"
#include "action.hpp"

// Mechanics
#include "effect_registry.hpp"
#include "damage_calculator.hpp"
#include "accuracy.hpp"
#include "status_engine.hpp"
#include "field_effects.hpp"

// Engine
#include "action_source.hpp"
#include "engine.hpp"
#include "replay_writer.hpp"

namespace pokesim {

/**
 * Version information.
 */
constexpr int VERSION_MAJOR = 1;
constexpr int VERSION_MINOR = 0;
constexpr int VERSION_PATCH = 0;

inline std::string get_version() {
    return std::to_string(VERSION_MAJOR) + "." +
           std::to_string(VERSION_MINOR) + "." +
           std::to_string(VERSION_PATCH);
}

} // namespace pokesim
