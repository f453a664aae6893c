#pragma once

#include <format>
#include <functional>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

#include "constants.hpp"

// define this to omit invariant checks in hotcode
#ifdef TGEN_NOEXCEPT
#define CHECKEXCEPT if constexpr (false)
#else
#define CHECKEXCEPT if constexpr (true)
#endif

namespace tgen {

float deg_to_rad(float deg);

// clamps to [lo, hi], mapping NaN to lo
float clamp_finite(float what, float lo, float hi);

// uppercases and turns '-' and ' ' into '_' so "multi-port" matches "MULTI_PORT"
std::string normalize_token(std::string_view token);

inline std::mutex log_mutex;
void log(std::function<std::string()>&& str, size_t log_level, size_t level, bool endl = true);

template<typename T>
inline std::string vec_to_str(const std::vector<T>& vec, std::string_view sep = ", ", std::function<std::string(const T&)>&& fmt = [](const T& arg){ return std::format("{}", arg); }) {
    size_t to = vec.size();
    if (to == 0) return "[empty]";
    std::string out_str = std::format("{}", fmt(vec[0]));
    for (size_t i = 1; i < to; ++i) {
        out_str += std::format("{}{}", sep, fmt(vec[i]));
    }
    return out_str;
}

}
