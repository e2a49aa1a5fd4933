/**
 * @file math_utils.hpp
 * @brief Shared vector helpers and Eigen bridging.
 * @author Watosn
 */
#pragma once

#include <cmath>

#include <Eigen/Dense>

#include "spacetraffic/core/types.hpp"

namespace spacetraffic::core {

/**
 * @brief Vector cross product.
 */
inline Vec3 vec_cross(const Vec3& a, const Vec3& b) {
  return Vec3{
      a.y * b.z - a.z * b.y,
      a.z * b.x - a.x * b.z,
      a.x * b.y - a.y * b.x,
  };
}

/**
 * @brief Normalize a vector with optional returned norm.
 */
inline Vec3 unit_direction(const Vec3& v, double* norm_out = nullptr) {
  const double n = norm(v);
  if (norm_out) {
    *norm_out = n;
  }
  if (n <= 0.0 || !std::isfinite(n)) {
    return Vec3{};
  }
  return v / n;
}

inline Eigen::Vector3d to_eigen(const Vec3& v) { return Eigen::Vector3d{v.x, v.y, v.z}; }
inline Vec3 from_eigen(const Eigen::Vector3d& v) { return Vec3{v.x(), v.y(), v.z()}; }

/**
 * @brief Wrap an angle in degrees to [0, 360).
 */
inline double wrap_degrees(double deg) {
  double w = std::fmod(deg, 360.0);
  if (w < 0.0) {
    w += 360.0;
  }
  if (w >= 360.0) {
    w = 0.0;
  }
  return w;
}

}  // namespace spacetraffic::core
