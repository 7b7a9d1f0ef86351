#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include <functional>
#include "common/types.hpp"

namespace desk {
namespace oracle {

// Seeds handed out by the default assignment rule fall in [1, MAX_HASH_SEED]
constexpr int64_t MAX_HASH_SEED = 99999;

// Upper bound on points returned by sample_series
constexpr size_t MAX_SERIES_POINTS = 10000;

// Timestamps whose whole seconds fit in int64 with margin
constexpr double MAX_ABS_TIMESTAMP = 9.0e18;

inline bool valid_timestamp(EpochSeconds ts) {
    return ts > -MAX_ABS_TIMESTAMP && ts < MAX_ABS_TIMESTAMP;
}

/**
 * Deterministic synthetic price for a pair seed at a unix timestamp.
 *
 * A per-seed baseline plus a slow (1440 min) and a medium (60 min) sine wave
 * and a bounded jitter derived from trunc(ts) XOR seed. Same inputs always
 * produce the same value, so entry and exit prices can be recomputed by
 * anyone holding the seed. ts must satisfy valid_timestamp().
 */
Price price_at(int64_t seed, EpochSeconds ts);

/**
 * Default seed-assignment rule: FNV-1a of the pair symbol folded into
 * [1, MAX_HASH_SEED].
 */
int64_t hash_pair_seed(const std::string& pair);

struct PricePoint {
    EpochSeconds ts{0.0};
    Price price{0.0};
};

using PriceFn = std::function<Price(int64_t seed, EpochSeconds ts)>;

/**
 * Price samples from start to end (inclusive) every step seconds.
 * Empty when step <= 0 or end < start; capped at MAX_SERIES_POINTS.
 */
std::vector<PricePoint> sample_series(int64_t seed, EpochSeconds start,
                                      EpochSeconds end, EpochSeconds step,
                                      const PriceFn& price_fn = price_at);

} // namespace oracle
} // namespace desk
