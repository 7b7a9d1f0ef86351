#include "utils/time_utils.hpp"
#include <sstream>
#include <iomanip>
#include <ctime>
#include <cmath>

namespace desk {
namespace time_utils {

std::string to_iso8601(WallClock t) {
    auto whole = std::chrono::floor<std::chrono::seconds>(t);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(t - whole);
    auto time_t = std::chrono::system_clock::to_time_t(whole);

    std::tm tm = *std::gmtime(&time_t);

    std::ostringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");
    ss << '.' << std::setfill('0') << std::setw(3) << ms.count() << 'Z';

    return ss.str();
}

std::string to_iso8601(EpochSeconds ts) {
    auto ms = static_cast<int64_t>(std::floor(ts * 1000.0));
    return to_iso8601(WallClock(std::chrono::milliseconds(ms)));
}

std::string now_iso8601() {
    return to_iso8601(std::chrono::system_clock::now());
}

std::string format_seconds(int64_t seconds) {
    if (seconds < 0) seconds = 0;

    int64_t hours = seconds / 3600;
    int64_t minutes = (seconds % 3600) / 60;
    int64_t secs = seconds % 60;

    std::ostringstream ss;
    if (hours > 0) {
        ss << hours << "h";
        if (minutes > 0) ss << " " << minutes << "m";
    } else if (minutes > 0) {
        ss << minutes << "m";
        if (secs > 0) ss << " " << secs << "s";
    } else {
        ss << secs << "s";
    }
    return ss.str();
}

} // namespace time_utils
} // namespace desk
