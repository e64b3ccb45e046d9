/**
 * pokesim - Battle Log
 *
 * Append-only sequence of flat records, one per causally distinct event.
 * Serializes to JSON objects / JSON lines for downstream analysis.
 */

#pragma once

#include "types.hpp"
#include <nlohmann/json_fwd.hpp>
#include <iosfwd>

namespace pokesim {

/**
 * LogEntry - One immutable battle event.
 */
struct LogEntry {
    int turn = 0;
    SideID side = NO_SIDE;
    LogKind kind = LogKind::MOVE;
    std::string actor;
    std::string target;
    std::string detail;
    Outcome outcome = Outcome::NO_EFFECT;
    int damage = 0;
    std::optional<double> accuracy_roll;
    bool critical_hit = false;
    double effectiveness = 1.0;

    bool operator==(const LogEntry& other) const;
    bool operator!=(const LogEntry& other) const { return !(*this == other); }

    std::string to_string() const;
};

/**
 * BattleLog - Append-only log owned by one battle.
 */
class BattleLog {
public:
    /**
     * Append an entry and return it for filling optional fields.
     * The reference is only valid until the next append.
     */
    LogEntry& add(int turn, SideID side, LogKind kind, Outcome outcome,
                  std::string actor, std::string detail = "");

    const std::vector<LogEntry>& entries() const { return entries_; }
    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }
    const LogEntry& back() const { return entries_.back(); }

    size_t count(LogKind kind) const;
    size_t count(LogKind kind, Outcome outcome) const;

    /**
     * Entries matching a kind, in order.
     */
    std::vector<LogEntry> filter(LogKind kind) const;

    /**
     * One JSON object per line.
     */
    void write_jsonl(std::ostream& out) const;
    std::string to_jsonl() const;

private:
    std::vector<LogEntry> entries_;
};

void to_json(nlohmann::json& j, const LogEntry& entry);

} // namespace pokesim
