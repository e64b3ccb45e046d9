/**
 * pokesim - Python Bindings
 *
 * pybind11 wrapper for the battle engine.
 * Exposes rule tables, rosters, the engine and callback action sources
 * to the Python self-play loop.
 */

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/operators.h>
#include <pybind11/functional.h>

#include "pokesim.hpp"

namespace py = pybind11;

PYBIND11_MODULE(pokesim_cpp, m) {
    m.doc() = "Deterministic Pokemon battle simulation engine";

    // ========================================================================
    // ENUMS
    // ========================================================================

    py::enum_<pokesim::Type>(m, "Type")
        .value("NORMAL", pokesim::Type::NORMAL)
        .value("FIRE", pokesim::Type::FIRE)
        .value("WATER", pokesim::Type::WATER)
        .value("ELECTRIC", pokesim::Type::ELECTRIC)
        .value("GRASS", pokesim::Type::GRASS)
        .value("ICE", pokesim::Type::ICE)
        .value("FIGHTING", pokesim::Type::FIGHTING)
        .value("POISON", pokesim::Type::POISON)
        .value("GROUND", pokesim::Type::GROUND)
        .value("FLYING", pokesim::Type::FLYING)
        .value("PSYCHIC", pokesim::Type::PSYCHIC)
        .value("BUG", pokesim::Type::BUG)
        .value("ROCK", pokesim::Type::ROCK)
        .value("GHOST", pokesim::Type::GHOST)
        .value("DRAGON", pokesim::Type::DRAGON)
        .value("DARK", pokesim::Type::DARK)
        .value("STEEL", pokesim::Type::STEEL)
        .value("FAIRY", pokesim::Type::FAIRY)
        .value("TYPELESS", pokesim::Type::TYPELESS);

    py::enum_<pokesim::MoveCategory>(m, "MoveCategory")
        .value("PHYSICAL", pokesim::MoveCategory::PHYSICAL)
        .value("SPECIAL", pokesim::MoveCategory::SPECIAL)
        .value("STATUS", pokesim::MoveCategory::STATUS);

    py::enum_<pokesim::MajorStatus>(m, "MajorStatus")
        .value("NONE", pokesim::MajorStatus::NONE)
        .value("BURN", pokesim::MajorStatus::BURN)
        .value("POISON", pokesim::MajorStatus::POISON)
        .value("BADLY_POISONED", pokesim::MajorStatus::BADLY_POISONED)
        .value("PARALYSIS", pokesim::MajorStatus::PARALYSIS)
        .value("SLEEP", pokesim::MajorStatus::SLEEP)
        .value("FREEZE", pokesim::MajorStatus::FREEZE);

    py::enum_<pokesim::Weather>(m, "Weather")
        .value("NONE", pokesim::Weather::NONE)
        .value("SUN", pokesim::Weather::SUN)
        .value("RAIN", pokesim::Weather::RAIN)
        .value("SANDSTORM", pokesim::Weather::SANDSTORM)
        .value("HAIL", pokesim::Weather::HAIL)
        .value("SNOW", pokesim::Weather::SNOW);

    py::enum_<pokesim::Terrain>(m, "Terrain")
        .value("NONE", pokesim::Terrain::NONE)
        .value("ELECTRIC", pokesim::Terrain::ELECTRIC)
        .value("GRASSY", pokesim::Terrain::GRASSY)
        .value("MISTY", pokesim::Terrain::MISTY)
        .value("PSYCHIC", pokesim::Terrain::PSYCHIC);

    py::enum_<pokesim::ActionType>(m, "ActionType")
        .value("MOVE", pokesim::ActionType::MOVE)
        .value("SWITCH", pokesim::ActionType::SWITCH)
        .export_values();

    py::enum_<pokesim::BattleWinner>(m, "BattleWinner")
        .value("SIDE_A", pokesim::BattleWinner::SIDE_A)
        .value("SIDE_B", pokesim::BattleWinner::SIDE_B)
        .value("TIE", pokesim::BattleWinner::TIE);

    py::enum_<pokesim::TurnPhase>(m, "TurnPhase")
        .value("AWAITING_ACTIONS", pokesim::TurnPhase::AWAITING_ACTIONS)
        .value("ORDER_DETERMINED", pokesim::TurnPhase::ORDER_DETERMINED)
        .value("EXECUTING_FIRST", pokesim::TurnPhase::EXECUTING_FIRST)
        .value("EXECUTING_SECOND", pokesim::TurnPhase::EXECUTING_SECOND)
        .value("END_OF_TURN", pokesim::TurnPhase::END_OF_TURN)
        .value("CONTINUE", pokesim::TurnPhase::CONTINUE)
        .value("BATTLE_OVER", pokesim::TurnPhase::BATTLE_OVER);

    m.attr("SIDE_A") = pokesim::SIDE_A;
    m.attr("SIDE_B") = pokesim::SIDE_B;

    // ========================================================================
    // RULE TABLES
    // ========================================================================

    py::class_<pokesim::MoveDef>(m, "MoveDef")
        .def_readonly("id", &pokesim::MoveDef::id)
        .def_readonly("name", &pokesim::MoveDef::name)
        .def_readonly("type", &pokesim::MoveDef::type)
        .def_readonly("category", &pokesim::MoveDef::category)
        .def_readonly("power", &pokesim::MoveDef::power)
        .def_readonly("accuracy", &pokesim::MoveDef::accuracy)
        .def_readonly("pp", &pokesim::MoveDef::pp)
        .def_readonly("priority", &pokesim::MoveDef::priority)
        .def("is_status", &pokesim::MoveDef::is_status)
        .def("is_damaging", &pokesim::MoveDef::is_damaging);

    py::class_<pokesim::SpeciesDef>(m, "SpeciesDef")
        .def_readonly("id", &pokesim::SpeciesDef::id)
        .def_readonly("name", &pokesim::SpeciesDef::name)
        .def_readonly("types", &pokesim::SpeciesDef::types)
        .def_readonly("abilities", &pokesim::SpeciesDef::abilities);

    py::class_<pokesim::RuleTables>(m, "RuleTables")
        .def(py::init<>())
        .def("load_from_json", &pokesim::RuleTables::load_from_json)
        .def("load_from_string", &pokesim::RuleTables::load_from_string)
        .def("get_species", &pokesim::RuleTables::get_species, py::return_value_policy::reference_internal)
        .def("get_move", &pokesim::RuleTables::get_move, py::return_value_policy::reference_internal)
        .def("species_count", &pokesim::RuleTables::species_count)
        .def("move_count", &pokesim::RuleTables::move_count)
        .def("ability_count", &pokesim::RuleTables::ability_count)
        .def("item_count", &pokesim::RuleTables::item_count)
        .def_static("normalize_id", &pokesim::RuleTables::normalize_id);

    py::class_<pokesim::FormatRules>(m, "FormatRules")
        .def(py::init<>())
        .def_readwrite("name", &pokesim::FormatRules::name)
        .def_readwrite("tera_allowed", &pokesim::FormatRules::tera_allowed)
        .def_readwrite("banned_species", &pokesim::FormatRules::banned_species)
        .def_readwrite("banned_moves", &pokesim::FormatRules::banned_moves)
        .def_readwrite("banned_items", &pokesim::FormatRules::banned_items)
        .def_readwrite("banned_abilities", &pokesim::FormatRules::banned_abilities)
        .def_readwrite("clauses", &pokesim::FormatRules::clauses)
        .def_readwrite("max_turns", &pokesim::FormatRules::max_turns)
        .def("load_from_json", &pokesim::FormatRules::load_from_json)
        .def("load_from_string", &pokesim::FormatRules::load_from_string);

    // ========================================================================
    // ROSTERS
    // ========================================================================

    py::class_<pokesim::CombatantSpec>(m, "CombatantSpec")
        .def(py::init<>())
        .def_readwrite("species", &pokesim::CombatantSpec::species)
        .def_readwrite("nickname", &pokesim::CombatantSpec::nickname)
        .def_readwrite("level", &pokesim::CombatantSpec::level)
        .def_readwrite("moves", &pokesim::CombatantSpec::moves)
        .def_readwrite("ability", &pokesim::CombatantSpec::ability)
        .def_readwrite("item", &pokesim::CombatantSpec::item)
        .def_readwrite("tera_type", &pokesim::CombatantSpec::tera_type);

    py::class_<pokesim::Roster>(m, "Roster")
        .def(py::init<>())
        .def_readwrite("name", &pokesim::Roster::name)
        .def_readwrite("members", &pokesim::Roster::members)
        .def("load_from_json", &pokesim::Roster::load_from_json)
        .def("load_from_string", &pokesim::Roster::load_from_string)
        .def("__len__", &pokesim::Roster::size);

    // ========================================================================
    // BATTLE STATE
    // ========================================================================

    py::class_<pokesim::MoveSlot>(m, "MoveSlot")
        .def_property_readonly("id", &pokesim::MoveSlot::id)
        .def_readonly("pp", &pokesim::MoveSlot::pp)
        .def_readonly("max_pp", &pokesim::MoveSlot::max_pp);

    py::class_<pokesim::Combatant>(m, "Combatant")
        .def_readonly("species", &pokesim::Combatant::species)
        .def_readonly("name", &pokesim::Combatant::name)
        .def_readonly("level", &pokesim::Combatant::level)
        .def_readonly("hp", &pokesim::Combatant::hp)
        .def_readonly("max_hp", &pokesim::Combatant::max_hp)
        .def_readonly("types", &pokesim::Combatant::types)
        .def_readonly("tera_type", &pokesim::Combatant::tera_type)
        .def_readonly("terastallized", &pokesim::Combatant::terastallized)
        .def_readonly("ability", &pokesim::Combatant::ability)
        .def_readonly("item", &pokesim::Combatant::item)
        .def_readonly("moves", &pokesim::Combatant::moves)
        .def_readonly("status", &pokesim::Combatant::status)
        .def_readonly("boosts", &pokesim::Combatant::boosts)
        .def("fainted", &pokesim::Combatant::fainted);

    py::class_<pokesim::SideState>(m, "SideState")
        .def_readonly("name", &pokesim::SideState::name)
        .def_readonly("roster", &pokesim::SideState::roster)
        .def_readonly("active", &pokesim::SideState::active)
        .def_readonly("tera_used", &pokesim::SideState::tera_used)
        .def("remaining", &pokesim::SideState::remaining)
        .def("defeated", &pokesim::SideState::defeated);

    py::class_<pokesim::FieldState>(m, "FieldState")
        .def_readonly("weather", &pokesim::FieldState::weather)
        .def_readonly("weather_turns", &pokesim::FieldState::weather_turns)
        .def_readonly("terrain", &pokesim::FieldState::terrain)
        .def_readonly("terrain_turns", &pokesim::FieldState::terrain_turns)
        .def("trick_room", &pokesim::FieldState::trick_room);

    py::class_<pokesim::LogEntry>(m, "LogEntry")
        .def_readonly("turn", &pokesim::LogEntry::turn)
        .def_readonly("side", &pokesim::LogEntry::side)
        .def_property_readonly("kind", [](const pokesim::LogEntry& e) {
            return std::string(pokesim::to_string(e.kind));
        })
        .def_readonly("actor", &pokesim::LogEntry::actor)
        .def_readonly("target", &pokesim::LogEntry::target)
        .def_readonly("detail", &pokesim::LogEntry::detail)
        .def_property_readonly("outcome", [](const pokesim::LogEntry& e) {
            return std::string(pokesim::to_string(e.outcome));
        })
        .def_readonly("damage", &pokesim::LogEntry::damage)
        .def_readonly("accuracy_roll", &pokesim::LogEntry::accuracy_roll)
        .def_readonly("critical_hit", &pokesim::LogEntry::critical_hit)
        .def_readonly("effectiveness", &pokesim::LogEntry::effectiveness)
        .def("__str__", &pokesim::LogEntry::to_string)
        .def("__repr__", &pokesim::LogEntry::to_string);

    py::class_<pokesim::BattleLog>(m, "BattleLog")
        .def("entries", &pokesim::BattleLog::entries, py::return_value_policy::reference_internal)
        .def("to_jsonl", &pokesim::BattleLog::to_jsonl)
        .def("__len__", &pokesim::BattleLog::size);

    py::class_<pokesim::BattleState>(m, "BattleState")
        .def_readonly("sides", &pokesim::BattleState::sides)
        .def_readonly("field", &pokesim::BattleState::field)
        .def_readonly("turn", &pokesim::BattleState::turn)
        .def_readonly("phase", &pokesim::BattleState::phase)
        .def_readonly("winner", &pokesim::BattleState::winner)
        .def_readonly("log", &pokesim::BattleState::log)
        .def("is_over", &pokesim::BattleState::is_over)
        .def("clone", [](const pokesim::BattleState& state) { return pokesim::BattleState(state); });

    // ========================================================================
    // ACTION
    // ========================================================================

    py::class_<pokesim::BattleAction>(m, "BattleAction")
        .def(py::init<>())
        .def(py::init<pokesim::ActionType, pokesim::SideID, int, bool>(),
             py::arg("type"), py::arg("side"), py::arg("index"), py::arg("terastallize") = false)
        .def_readwrite("type", &pokesim::BattleAction::type)
        .def_readwrite("side", &pokesim::BattleAction::side)
        .def_readwrite("index", &pokesim::BattleAction::index)
        .def_readwrite("terastallize", &pokesim::BattleAction::terastallize)
        .def("__str__", &pokesim::BattleAction::to_string)
        .def("__repr__", &pokesim::BattleAction::to_string)
        .def(py::self == py::self)
        .def(py::self != py::self)
        // Factory methods
        .def_static("move", &pokesim::BattleAction::move,
                    py::arg("side"), py::arg("slot"), py::arg("tera") = false)
        .def_static("struggle", &pokesim::BattleAction::struggle)
        .def_static("switch_to", &pokesim::BattleAction::switch_to);

    // ========================================================================
    // RANDOMNESS AND ACTION SOURCES
    // ========================================================================

    py::class_<pokesim::RandomSource>(m, "RandomSource");

    py::class_<pokesim::Mt19937Random, pokesim::RandomSource>(m, "Mt19937Random")
        .def(py::init<uint64_t>(), py::arg("seed") = 0)
        .def("next_unit", &pokesim::Mt19937Random::next_unit);

    py::class_<pokesim::ActionSource>(m, "ActionSource");

    py::class_<pokesim::RandomActionSource, pokesim::ActionSource>(m, "RandomActionSource")
        .def(py::init<uint64_t, double>(), py::arg("seed") = 0, py::arg("move_bias") = 0.7);

    py::class_<pokesim::FirstLegalActionSource, pokesim::ActionSource>(m, "FirstLegalActionSource")
        .def(py::init<>());

    py::class_<pokesim::CallbackActionSource, pokesim::ActionSource>(m, "CallbackActionSource")
        .def(py::init<pokesim::CallbackActionSource::ActionCallback,
                      pokesim::CallbackActionSource::ReplacementCallback>(),
             py::arg("on_action"), py::arg("on_replacement") = nullptr);

    // ========================================================================
    // ENGINE
    // ========================================================================

    py::class_<pokesim::BattleResult>(m, "BattleResult")
        .def_readonly("winner", &pokesim::BattleResult::winner)
        .def_readonly("turn_count", &pokesim::BattleResult::turn_count)
        .def_readonly("log", &pokesim::BattleResult::log);

    py::class_<pokesim::BattleEngine>(m, "BattleEngine")
        .def(py::init<const pokesim::RuleTables&, pokesim::FormatRules>(),
             py::arg("rules"), py::arg("format") = pokesim::FormatRules{},
             py::keep_alive<1, 2>())
        .def("create_battle", &pokesim::BattleEngine::create_battle)
        .def("get_legal_actions", &pokesim::BattleEngine::get_legal_actions)
        .def("is_legal", &pokesim::BattleEngine::is_legal)
        .def("start_battle", &pokesim::BattleEngine::start_battle)
        .def("run_turn", &pokesim::BattleEngine::run_turn,
             py::arg("state"), py::arg("action_a"), py::arg("action_b"), py::arg("rng"),
             py::arg("source_a") = nullptr, py::arg("source_b") = nullptr)
        .def("simulate", &pokesim::BattleEngine::simulate,
             py::arg("state"), py::arg("source_a"), py::arg("source_b"),
             py::arg("max_turns"), py::arg("rng"))
        .def("check_winner", &pokesim::BattleEngine::check_winner);

    m.def("simulate_battle",
          [](const pokesim::RuleTables& rules, const pokesim::Roster& roster_a,
             const pokesim::Roster& roster_b, int max_turns, uint64_t seed,
             pokesim::ActionSource* source_a, pokesim::ActionSource* source_b,
             const pokesim::FormatRules& format) {
              return pokesim::simulate_battle(rules, roster_a, roster_b, max_turns, seed,
                                              source_a, source_b, format);
          },
          py::arg("rules"), py::arg("roster_a"), py::arg("roster_b"),
          py::arg("max_turns") = 0, py::arg("seed") = 0,
          py::arg("source_a") = nullptr, py::arg("source_b") = nullptr,
          py::arg("format") = pokesim::FormatRules{});

    // ========================================================================
    // MODULE INFO
    // ========================================================================

    m.attr("VERSION") = pokesim::get_version();
    m.attr("__version__") = pokesim::get_version();
}
