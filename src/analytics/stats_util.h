#pragma once

/// @file stats_util.h
/// @brief Small numeric helpers shared by the analyzers

#include <cmath>
#include <cstdint>

namespace runlens::analytics {

/// @brief Round half away from zero to one decimal place
inline double Round1(double value) {
    return std::round(value * 10.0) / 10.0;
}

/// @brief Round half away from zero to the given number of decimals
inline double RoundTo(double value, int decimals) {
    const double scale = std::pow(10.0, decimals);
    return std::round(value * scale) / scale;
}

/// @brief part/whole*100 rounded to one decimal, 0 when whole is 0
inline double Percentage(double part, double whole) {
    return whole > 0 ? Round1(part / whole * 100.0) : 0.0;
}

/// @brief Mean rounded to one decimal, 0 for an empty population
inline double Mean1(double sum, int64_t count) {
    return count > 0 ? Round1(sum / static_cast<double>(count)) : 0.0;
}

}  // namespace runlens::analytics
