#include "common/time.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace ctxgraph {

int64_t toEpochMillis(TimePoint tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch()).count();
}

TimePoint fromEpochMillis(int64_t ms) {
    return TimePoint(std::chrono::duration_cast<Clock::duration>(
        std::chrono::milliseconds(ms)));
}

std::string toIsoString(TimePoint tp) {
    int64_t ms = toEpochMillis(tp);
    std::time_t secs = static_cast<std::time_t>(ms / 1000);
    std::tm utc{};
    gmtime_r(&secs, &utc);

    std::ostringstream oss;
    oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setw(3) << std::setfill('0') << (ms % 1000) << 'Z';
    return oss.str();
}

} // namespace ctxgraph
