/**
 * pokesim - Random Source
 *
 * Every random decision in a battle (accuracy, critical hits, damage roll,
 * status rolls, multi-hit counts, speed ties) is drawn from one of these.
 * A battle seeded identically replays identically.
 */

#pragma once

#include <cstdint>
#include <random>
#include <vector>

namespace pokesim {

/**
 * RandomSource - Injectable source of uniform draws.
 *
 * Subclasses only provide next_unit(); integer and chance draws are
 * derived from it so scripted sources control every roll.
 */
class RandomSource {
public:
    virtual ~RandomSource() = default;

    /**
     * Uniform draw in [0, 1).
     */
    virtual double next_unit() = 0;

    /**
     * Uniform integer in [lo, hi] (inclusive).
     */
    int next_int(int lo, int hi) {
        if (hi <= lo) {
            return lo;
        }
        int span = hi - lo + 1;
        int offset = static_cast<int>(next_unit() * span);
        if (offset >= span) offset = span - 1;
        return lo + offset;
    }

    /**
     * True with the given probability.
     */
    bool chance(double probability) {
        return next_unit() < probability;
    }
};

/**
 * Mt19937Random - Seeded Mersenne Twister.
 *
 * Uses raw 32-bit outputs rather than std::uniform_real_distribution so
 * the stream is identical across standard library implementations.
 */
class Mt19937Random : public RandomSource {
public:
    explicit Mt19937Random(uint64_t seed = 0)
        : rng_(static_cast<std::mt19937::result_type>(seed ^ (seed >> 32)))
    {}

    double next_unit() override {
        return static_cast<double>(rng_()) / 4294967296.0;
    }

    void reseed(uint64_t seed) {
        rng_.seed(static_cast<std::mt19937::result_type>(seed ^ (seed >> 32)));
    }

private:
    std::mt19937 rng_;
};

/**
 * ScriptedRandom - Replays a fixed list of draws, then a constant.
 *
 * Used by tests to force specific rolls (crit, miss, damage roll).
 */
class ScriptedRandom : public RandomSource {
public:
    explicit ScriptedRandom(std::vector<double> values = {}, double fallback = 0.99)
        : values_(std::move(values))
        , fallback_(fallback)
    {}

    double next_unit() override {
        draws_++;
        if (index_ < values_.size()) {
            return values_[index_++];
        }
        return fallback_;
    }

    void push(double value) { values_.push_back(value); }
    size_t draws() const { return draws_; }
    size_t remaining() const { return values_.size() - index_; }

private:
    std::vector<double> values_;
    size_t index_ = 0;
    size_t draws_ = 0;
    double fallback_;
};

} // namespace pokesim
