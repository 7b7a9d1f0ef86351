#include "oracle/price_oracle.hpp"
#include <cmath>

namespace desk {
namespace oracle {

namespace {

constexpr double PI = 3.14159265358979323846;

// Waveform parameters tuned for FX-like movement
constexpr double BASELINE_SPREAD = 0.5;
constexpr double SLOW_PERIOD_MIN = 1440.0;
constexpr double SLOW_AMPLITUDE = 0.0025;
constexpr double MEDIUM_PERIOD_MIN = 60.0;
constexpr double MEDIUM_AMPLITUDE = 0.0015;
constexpr double JITTER_AMPLITUDE = 0.0008;

// Floor modulo: result always in [0, m)
int64_t floor_mod(int64_t v, int64_t m) {
    int64_t r = v % m;
    return r < 0 ? r + m : r;
}

} // namespace

Price price_at(int64_t seed, EpochSeconds ts) {
    double t = ts / 60.0;  // minutes

    double base = 1.0 + (static_cast<double>(floor_mod(seed, 1000)) / 1000.0) * BASELINE_SPREAD;

    double slow = std::sin((t * 2.0 * PI) / SLOW_PERIOD_MIN +
                           static_cast<double>(floor_mod(seed, 17))) * SLOW_AMPLITUDE;
    double medium = std::sin((t * 2.0 * PI) / MEDIUM_PERIOD_MIN +
                             static_cast<double>(floor_mod(seed, 23))) * MEDIUM_AMPLITUDE;

    int64_t whole_ts = static_cast<int64_t>(ts);
    double jitter = (static_cast<double>(floor_mod(whole_ts ^ seed, 1000)) / 1000.0 - 0.5)
                    * JITTER_AMPLITUDE;

    return base + slow + medium + jitter;
}

int64_t hash_pair_seed(const std::string& pair) {
    uint64_t hash = 14695981039346656037ULL;
    for (unsigned char c : pair) {
        hash ^= c;
        hash *= 1099511628211ULL;
    }
    return static_cast<int64_t>(hash % static_cast<uint64_t>(MAX_HASH_SEED)) + 1;
}

std::vector<PricePoint> sample_series(int64_t seed, EpochSeconds start,
                                      EpochSeconds end, EpochSeconds step,
                                      const PriceFn& price_fn) {
    std::vector<PricePoint> points;
    if (step <= 0.0 || end < start) {
        return points;
    }

    for (size_t i = 0; i < MAX_SERIES_POINTS; ++i) {
        EpochSeconds ts = start + static_cast<double>(i) * step;
        if (ts > end) break;
        points.push_back({ts, price_fn(seed, ts)});
    }

    return points;
}

} // namespace oracle
} // namespace desk
