/**
 * @file RotationMap.hpp
 * @brief Requested per-page rotation deltas.
 */

#pragma once
#include <map>

namespace submitkit::domain {

/** @brief 1-based page number -> degrees to add to the page's current rotation. */
using RotationMap = std::map<int, int>;

/** @brief Folds any angle into [0, 360). */
inline int NormalizeRotation(long long degrees) {
    long long r = degrees % 360;
    if (r < 0) r += 360;
    return static_cast<int>(r);
}

} // namespace submitkit::domain
