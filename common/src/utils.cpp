#include <ctime>
#include <sa_utils.h>

std::string sa::utils::time_to_rfc3339(std::chrono::system_clock::time_point time) {
    if (time == std::chrono::system_clock::time_point{}) {
        return {};
    }

    std::time_t t = std::chrono::system_clock::to_time_t(time);
    std::tm tm = {};
    gmtime_r(&t, &tm);
    return fmt::format("{:%Y-%m-%dT%H:%M:%SZ}", tm);
}
