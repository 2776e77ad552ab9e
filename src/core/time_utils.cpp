#include "time_utils.hpp"
#include "utils.hpp"
#include <fmt/format.h>

std::string format_age(int64_t seconds) {
    if (seconds < 0) return "-";

    int64_t hours = seconds / 3600;
    int64_t mins = (seconds % 3600) / 60;
    int64_t secs = seconds % 60;

    if (hours > 0) {
        return fmt::format("{}h{}m", hours, mins);
    } else if (mins > 0) {
        return fmt::format("{}m{}s", mins, secs);
    } else {
        return fmt::format("{}s", secs);
    }
}

std::string format_registered_at(int64_t epoch) {
    if (epoch <= 0) return "unknown";
    return format_epoch(epoch);
}
