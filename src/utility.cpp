#include <algorithm>
#include <cctype>
#include <cmath>
#include <iostream>

#include "utility.hpp"

namespace tgen {

float deg_to_rad(float deg) {
    return deg * pi / 180.f;
}

float clamp_finite(float what, float lo, float hi) {
    if (std::isnan(what)) return lo;
    return std::clamp(what, lo, hi);
}

std::string normalize_token(std::string_view token) {
    std::string out;
    out.reserve(token.size());
    for (char c : token) {
        if (c == '-' || c == ' ') out += '_';
        else out += (char)std::toupper((unsigned char)c);
    }
    return out;
}

void log(std::function<std::string()>&& str, size_t log_level, size_t level, bool endl) {
    if (log_level < level) return;
    std::lock_guard<std::mutex> lock(log_mutex);
    std::cout << str();
    if (endl) std::cout << std::endl;
}

}
