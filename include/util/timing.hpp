#pragma once
#include <chrono>
#include <string>
#include <cstdio>

struct Stopwatch {
    std::chrono::steady_clock::time_point t0 = std::chrono::steady_clock::now();
    void reset() { t0 = std::chrono::steady_clock::now(); }
    double seconds() const {
        using namespace std::chrono;
        return duration_cast<duration<double>>(steady_clock::now() - t0).count();
    }
};

// "12.345 s" style, for the run summary
inline std::string format_seconds(double s) {
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.3f s", s);
    return buf;
}
