/**
 * @file types.hpp
 * @brief Core domain types for spacetraffic.
 * @author Watosn
 */
#pragma once

#include <cmath>
#include <cstdint>
#include <string_view>

namespace spacetraffic::core {

/**
 * @brief Standard status code used by model outputs.
 */
enum class Status : std::uint8_t { Ok, InvalidInput, DegenerateInput, DataUnavailable, NumericalError, Cancelled, Reentry };

[[nodiscard]] constexpr std::string_view to_string(Status s) {
  switch (s) {
    case Status::Ok:
      return "ok";
    case Status::InvalidInput:
      return "invalid_input";
    case Status::DegenerateInput:
      return "degenerate_input";
    case Status::DataUnavailable:
      return "data_unavailable";
    case Status::NumericalError:
      return "numerical_error";
    case Status::Cancelled:
      return "cancelled";
    case Status::Reentry:
      return "reentry";
  }
  return "unknown";
}

/**
 * @brief Cartesian 3-vector.
 */
struct Vec3 {
  double x{};
  double y{};
  double z{};
};

inline Vec3 operator+(const Vec3& a, const Vec3& b) { return Vec3{a.x + b.x, a.y + b.y, a.z + b.z}; }
inline Vec3 operator-(const Vec3& a, const Vec3& b) { return Vec3{a.x - b.x, a.y - b.y, a.z - b.z}; }
inline Vec3 operator-(const Vec3& v) { return Vec3{-v.x, -v.y, -v.z}; }
inline Vec3 operator*(double s, const Vec3& v) { return Vec3{s * v.x, s * v.y, s * v.z}; }
inline Vec3 operator*(const Vec3& v, double s) { return s * v; }
inline Vec3 operator/(const Vec3& v, double s) { return Vec3{v.x / s, v.y / s, v.z / s}; }

inline double dot(const Vec3& a, const Vec3& b) { return a.x * b.x + a.y * b.y + a.z * b.z; }
inline double norm(const Vec3& v) { return std::sqrt(dot(v, v)); }
inline bool is_finite(const Vec3& v) { return std::isfinite(v.x) && std::isfinite(v.y) && std::isfinite(v.z); }

/**
 * @brief UTC epoch expressed as seconds since Unix epoch.
 */
struct Epoch {
  double utc_seconds{};
};

/**
 * @brief Earth-centered inertial position/velocity at an epoch.
 */
struct StateVector {
  Epoch epoch{};
  Vec3 position_m{};
  Vec3 velocity_mps{};
};

inline bool is_finite(const StateVector& s) { return is_finite(s.position_m) && is_finite(s.velocity_mps); }

/**
 * @brief Atmospheric density sample.
 */
struct AtmosphereSample {
  double density_kg_m3{};
  Status status{Status::Ok};
};

}  // namespace spacetraffic::core
