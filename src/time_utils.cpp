#include "time_utils.hpp"
#include <chrono>
#include <ctime>

namespace {

std::tm local_now() {
    auto now = std::chrono::system_clock::now();
    std::time_t t = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
    localtime_r(&t, &tm);
    return tm;
}

} // namespace

std::string timestamp() {
    std::tm tm = local_now();
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
    return std::string(buf);
}

std::string iso8601_now() {
    std::tm tm = local_now();
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm);
    // strftime's %z has no colon (+0100); the registry uses +01:00.
    char off[8];
    std::strftime(off, sizeof(off), "%z", &tm);
    std::string zone(off);
    if (zone.size() == 5)
        zone.insert(3, ":");
    return std::string(buf) + zone;
}
