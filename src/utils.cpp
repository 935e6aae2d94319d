// utils.cpp - Common utility function implementations

#include "utils.hpp"
#include <ctime>
#include <iomanip>
#include <sstream>

namespace utils {

namespace {
std::string formatNow(const char* fmt) {
    auto now_time = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm = *std::localtime(&now_time);
    std::ostringstream ss;
    ss << std::put_time(&tm, fmt);
    return ss.str();
}
}

std::string timestamp() {
    return formatNow("%F %T");
}

std::string fileTimestamp() {
    return formatNow("%Y%m%d_%H%M%S");
}

double secondsSince(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
}

}
