/**
 * pokesim - Command Line Runner
 *
 * Runs one battle from JSON inputs and prints the result.
 * With --policy interactive, side A is played from the terminal.
 */

#include <iostream>
#include <sstream>
#include <string>
#include <vector>
#include <memory>
#include <chrono>
#include <cctype>

#include "pokesim.hpp"
#include "replay_writer.hpp"
#include "effects/effect_catalog.hpp"

using namespace pokesim;

// ============================================================================
// OPTIONS
// ============================================================================

struct Options {
    std::string rules_path = "data/rules.json";
    std::string format_path;
    std::string team_a_path = "data/team_a.json";
    std::string team_b_path = "data/team_b.json";
    uint64_t seed = 0;
    bool seed_given = false;
    int max_turns = 0;            // 0 = format default
    std::string out_dir;          // "" = no replay files
    std::string policy = "random";
    bool verbose = false;
};

void print_usage(const char* program) {
    std::cout << "Usage: " << program << " [options]\n"
              << "  --rules <path>       Rule tables JSON (default data/rules.json)\n"
              << "  --format <path>      Format rules JSON\n"
              << "  --team-a <path>      Side A roster JSON\n"
              << "  --team-b <path>      Side B roster JSON\n"
              << "  --seed <n>           RNG seed (default: clock)\n"
              << "  --max-turns <n>      Turn cap (default: format max_turns)\n"
              << "  --out <dir>          Write replay trace and JSONL log to <dir>\n"
              << "  --policy <name>      random | first | interactive (side A)\n"
              << "  --verbose            Print every log entry\n"
              << "  --help               Show this message\n";
}

bool parse_options(int argc, char** argv, Options& options) {
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return false;
        }
        if (arg == "--verbose" || arg == "-v") {
            options.verbose = true;
            continue;
        }
        if (i + 1 >= argc) {
            std::cerr << "Missing value for " << arg << std::endl;
            return false;
        }
        std::string value = argv[++i];
        try {
            if (arg == "--rules") {
                options.rules_path = value;
            } else if (arg == "--format") {
                options.format_path = value;
            } else if (arg == "--team-a") {
                options.team_a_path = value;
            } else if (arg == "--team-b") {
                options.team_b_path = value;
            } else if (arg == "--seed") {
                options.seed = std::stoull(value);
                options.seed_given = true;
            } else if (arg == "--max-turns") {
                options.max_turns = std::stoi(value);
            } else if (arg == "--out") {
                options.out_dir = value;
            } else if (arg == "--policy") {
                options.policy = value;
            } else {
                std::cerr << "Unknown option: " << arg << std::endl;
                return false;
            }
        } catch (const std::exception&) {
            std::cerr << "Invalid value for " << arg << ": " << value << std::endl;
            return false;
        }
    }

    if (options.policy != "random" && options.policy != "first" && options.policy != "interactive") {
        std::cerr << "Unknown policy: " << options.policy << std::endl;
        return false;
    }
    return true;
}

// ============================================================================
// DISPLAY
// ============================================================================

std::string describe_action(const BattleState& state, const BattleAction& action) {
    const SideState& side = state.side(action.side);
    if (action.is_struggle()) {
        return "Struggle";
    }
    if (action.is_switch()) {
        return "Switch to " + side.roster.at(static_cast<size_t>(action.index)).name;
    }
    const Combatant& active = side.active_combatant();
    const MoveSlot& slot = active.moves.at(static_cast<size_t>(action.index));
    std::string text = slot.move->name + " (" + std::to_string(slot.pp) + "/" +
                       std::to_string(slot.max_pp) + " PP)";
    if (action.terastallize) {
        text += " + Tera";
    }
    return text;
}

void show_matchup(const BattleState& state) {
    const Combatant& a = state.active(SIDE_A);
    const Combatant& b = state.active(SIDE_B);
    std::cout << "\n+-------------------------------------------------------------+" << std::endl;
    std::cout << "  Turn " << (state.turn + 1) << std::endl;
    std::cout << "  A: " << a.name << "  HP " << a.hp << "/" << a.max_hp
              << "  [" << to_string(a.status) << "]" << std::endl;
    std::cout << "  B: " << b.name << "  HP " << b.hp << "/" << b.max_hp
              << "  [" << to_string(b.status) << "]" << std::endl;
    std::cout << "+-------------------------------------------------------------+" << std::endl;
}

/**
 * Terminal prompt for side A. EOF or "quit" picks the first legal action.
 */
BattleAction prompt_action(const BattleState& state, const std::vector<BattleAction>& legal) {
    show_matchup(state);
    for (size_t i = 0; i < legal.size(); i++) {
        std::cout << "  [" << i << "] " << describe_action(state, legal[i]) << std::endl;
    }

    std::string line;
    while (true) {
        std::cout << "\n> ";
        if (!std::getline(std::cin, line) || line == "quit" || line == "q") {
            return legal.front();
        }
        if (!line.empty() && std::isdigit(static_cast<unsigned char>(line[0]))) {
            size_t choice = std::stoul(line);
            if (choice < legal.size()) {
                return legal[choice];
            }
        }
        std::cout << "Enter a number between 0 and " << (legal.size() - 1) << std::endl;
    }
}

int prompt_replacement(const BattleState& state, const std::vector<int>& candidates) {
    std::cout << "\nChoose a replacement:" << std::endl;
    for (size_t i = 0; i < candidates.size(); i++) {
        const Combatant& c = state.side(SIDE_A).roster.at(static_cast<size_t>(candidates[i]));
        std::cout << "  [" << i << "] " << c.name << "  HP " << c.hp << "/" << c.max_hp << std::endl;
    }
    std::string line;
    while (true) {
        std::cout << "\n> ";
        if (!std::getline(std::cin, line)) {
            return candidates.front();
        }
        if (!line.empty() && std::isdigit(static_cast<unsigned char>(line[0]))) {
            size_t choice = std::stoul(line);
            if (choice < candidates.size()) {
                return candidates[choice];
            }
        }
    }
}

std::unique_ptr<ActionSource> make_source(const std::string& policy, uint64_t seed) {
    if (policy == "first") {
        return std::make_unique<FirstLegalActionSource>();
    }
    if (policy == "interactive") {
        return std::make_unique<CallbackActionSource>(
            [](const BattleState& state, SideID, const std::vector<BattleAction>& legal) {
                return prompt_action(state, legal);
            },
            [](const BattleState& state, SideID, const std::vector<int>& candidates) {
                return prompt_replacement(state, candidates);
            });
    }
    return std::make_unique<RandomActionSource>(seed);
}

// ============================================================================
// MAIN
// ============================================================================

int main(int argc, char** argv) {
    Options options;
    if (!parse_options(argc, argv, options)) {
        return 1;
    }
    if (!options.seed_given) {
        options.seed = static_cast<uint64_t>(
            std::chrono::high_resolution_clock::now().time_since_epoch().count());
    }

    std::cout << "pokesim " << get_version() << std::endl;
    std::cout << "=====================================\n" << std::endl;

    RuleTables rules;
    if (!rules.load_from_json(options.rules_path)) {
        std::cerr << "Failed to load rule tables: " << options.rules_path << std::endl;
        return 1;
    }
    for (const auto& inert : effects::find_inert_effects(rules)) {
        std::cout << "[RuleTables] No handler for " << inert << "; it has no effect in battle" << std::endl;
    }

    FormatRules format;
    if (!options.format_path.empty() && !format.load_from_json(options.format_path)) {
        std::cerr << "Failed to load format: " << options.format_path << std::endl;
        return 1;
    }

    Roster team_a;
    Roster team_b;
    if (!team_a.load_from_json(options.team_a_path) || !team_b.load_from_json(options.team_b_path)) {
        std::cerr << "Failed to load rosters" << std::endl;
        return 1;
    }

    BattleEngine engine(rules, format);
    BattleState state;
    try {
        state = engine.create_battle(team_a, team_b);
    } catch (const std::invalid_argument& e) {
        std::cerr << "Cannot start battle: " << e.what() << std::endl;
        return 1;
    }

    std::unique_ptr<ActionSource> source_a = make_source(options.policy, options.seed * 2 + 1);
    std::unique_ptr<ActionSource> source_b = make_source(
        options.policy == "interactive" ? "random" : options.policy, options.seed * 2 + 2);

    std::unique_ptr<ReplayWriter> replay;
    if (!options.out_dir.empty()) {
        replay = std::make_unique<ReplayWriter>(options.out_dir);
    }

    int max_turns = options.max_turns > 0 ? options.max_turns : format.max_turns;
    Mt19937Random rng(options.seed);
    std::cout << "Seed: " << options.seed << " | Max turns: " << max_turns << std::endl;

    engine.start_battle(state, rng);
    size_t logged = 0;
    if (replay) {
        logged = replay->log_turn(state, logged);
    }

    try {
        while (!state.is_over() && state.turn < max_turns) {
            std::vector<BattleAction> legal_a = engine.get_legal_actions(state, SIDE_A);
            std::vector<BattleAction> legal_b = engine.get_legal_actions(state, SIDE_B);
            BattleAction action_a = source_a->choose_action(state, SIDE_A, legal_a);
            BattleAction action_b = source_b->choose_action(state, SIDE_B, legal_b);

            if (replay) {
                replay->log_actions(state.turn + 1, action_a, action_b);
            }
            size_t before = state.log.size();
            engine.run_turn(state, action_a, action_b, rng, source_a.get(), source_b.get());

            if (options.verbose || options.policy == "interactive") {
                for (size_t i = before; i < state.log.size(); i++) {
                    std::cout << state.log.entries()[i].to_string() << std::endl;
                }
            }
            if (replay) {
                logged = replay->log_turn(state, logged);
            }
        }
    } catch (const InvariantViolation& e) {
        std::cerr << "Invariant violation: " << e.what() << std::endl;
        return 2;
    }

    engine.check_winner(state);
    BattleResult result;
    result.winner = state.winner.value_or(BattleWinner::TIE);
    result.turn_count = state.turn;
    result.log = state.log;

    if (replay) {
        replay->log_battle_end(result);
        std::cout << "Replay: " << replay->get_log_path() << std::endl;
        std::cout << "JSONL:  " << replay->get_jsonl_path() << std::endl;
    }

    std::cout << "\nWinner: " << to_string(result.winner) << std::endl;
    std::cout << "Turns:  " << result.turn_count << std::endl;
    for (const auto& side : state.sides) {
        std::cout << "Side " << side.name << ": " << side.remaining() << "/"
                  << side.roster.size() << " remaining" << std::endl;
    }
    return 0;
}
