#pragma once

#include <string>
#include <cstdint>
#include "common/types.hpp"

namespace desk {
namespace time_utils {

/**
 * Convert timestamp to ISO 8601 string (UTC, millisecond precision).
 */
std::string to_iso8601(WallClock t);
std::string to_iso8601(EpochSeconds ts);

/**
 * Get current timestamp as ISO 8601.
 */
std::string now_iso8601();

/**
 * Format a span of whole seconds for display: "45s", "2m 5s", "1h 30m".
 */
std::string format_seconds(int64_t seconds);

} // namespace time_utils
} // namespace desk
