#pragma once
#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <iomanip>
#include <sstream>
#include <string>

#include "types.h"

namespace fsched {

// Monotonic milliseconds, for budgets and elapsed times.
static inline long long NowMillis() {
    using namespace std::chrono;
    return duration_cast<milliseconds>(steady_clock::now().time_since_epoch()).count();
}

// Wall clock milliseconds since epoch, for run timestamps.
static inline long long WallMillis() {
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

static inline double clampd(double x, double lo, double hi) { return std::max(lo, std::min(hi, x)); }

// FNV-1a 64-bit
static inline uint64_t fnv1a(const std::string& s, uint64_t h = 1469598103934665603ull) {
    for (unsigned char c : s) {
        h ^= c;
        h *= 1099511628211ull;
    }
    return h;
}

static inline std::string hex64(uint64_t h) {
    std::ostringstream out;
    out << std::hex << std::setw(16) << std::setfill('0') << h;
    return out.str();
}

// Great-circle distance in kilometres.
static inline double haversine_km(const GeoPoint& a, const GeoPoint& b) {
    constexpr double R = 6371.0;
    constexpr double DEG = 3.14159265358979323846 / 180.0;
    const double dlat = (b.lat - a.lat) * DEG;
    const double dlng = (b.lng - a.lng) * DEG;
    const double s = std::sin(dlat / 2) * std::sin(dlat / 2) +
                     std::cos(a.lat * DEG) * std::cos(b.lat * DEG) * std::sin(dlng / 2) * std::sin(dlng / 2);
    return 2.0 * R * std::asin(std::min(1.0, std::sqrt(s)));
}

// "HH:MM" for log lines; minutes past the planning-day origin.
static inline std::string hhmm(int minute) {
    std::ostringstream out;
    const int m = ((minute % MINUTES_PER_DAY) + MINUTES_PER_DAY) % MINUTES_PER_DAY;
    out << std::setw(2) << std::setfill('0') << m / 60 << ":" << std::setw(2) << std::setfill('0') << m % 60;
    if (minute >= MINUTES_PER_DAY) out << "+" << minute / MINUTES_PER_DAY << "d";
    return out.str();
}

}  // namespace fsched
