#include "TimeUtils.hpp"

#include <chrono>
#include <cmath>
#include <cstdio>
#include <ctime>

double now_seconds() {
    return std::chrono::duration<double>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

std::string format_iso8601_utc(double epoch_seconds) {
    double whole = std::floor(epoch_seconds);
    auto micros = static_cast<long>(std::lround((epoch_seconds - whole) * 1e6));
    if (micros >= 1000000) {
        whole += 1.0;
        micros -= 1000000;
    }

    std::time_t seconds = static_cast<std::time_t>(whole);
    std::tm utc{};
    gmtime_r(&seconds, &utc);

    char date[32];
    std::strftime(date, sizeof(date), "%Y-%m-%dT%H:%M:%S", &utc);
    char buffer[64];
    std::snprintf(buffer, sizeof(buffer), "%s.%06ld+00:00", date, micros);
    return buffer;
}
