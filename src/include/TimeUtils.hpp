#ifndef TIMEUTILS_HPP
#define TIMEUTILS_HPP

#include <string>

// Wall clock as fractional seconds since the Unix epoch.
double now_seconds();

// "2025-01-01T00:00:00.000000+00:00"
std::string format_iso8601_utc(double epoch_seconds);

#endif  // TIMEUTILS_HPP
