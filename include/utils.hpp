// utils.hpp - Common utility functions

#pragma once
#include <chrono>
#include <string>

namespace utils {
    std::string timestamp();          // "YYYY-MM-DD HH:MM:SS" for log lines
    std::string fileTimestamp();      // "YYYYMMDD_HHMMSS" for output file names
    double      secondsSince(std::chrono::steady_clock::time_point start);
}
