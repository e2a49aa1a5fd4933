/**
 * @file conversions.cpp
 * @brief Keplerian <-> Cartesian state conversion implementation.
 * @author Watosn
 */

#include "spacetraffic/orbit/conversions.hpp"

#include <algorithm>
#include <cmath>

#include <Eigen/Dense>

#include "spacetraffic/core/math_utils.hpp"

namespace spacetraffic::orbit {
namespace {

using spacetraffic::core::Status;
namespace constants = spacetraffic::core::constants;

bool all_finite(const OrbitalElements& e) {
  return std::isfinite(e.semi_major_axis_km) && std::isfinite(e.eccentricity) && std::isfinite(e.inclination_deg) &&
         std::isfinite(e.raan_deg) && std::isfinite(e.arg_perigee_deg) && std::isfinite(e.true_anomaly_deg);
}

// Signed angle from `from` to `to` about the orbit normal.
double plane_angle_rad(const Eigen::Vector3d& from, const Eigen::Vector3d& to, const Eigen::Vector3d& normal_unit) {
  return std::atan2(from.cross(to).dot(normal_unit), from.dot(to));
}

}  // namespace

CartesianResult to_cartesian(const OrbitalElements& elements, double mu_m3_s2) {
  if (!all_finite(elements) || !(mu_m3_s2 > 0.0)) {
    return CartesianResult{.status = Status::InvalidInput};
  }
  if (!(elements.semi_major_axis_km > 0.0) || elements.eccentricity < 0.0 || elements.eccentricity >= 1.0) {
    return CartesianResult{.status = Status::DegenerateInput};
  }

  const double a_m = elements.semi_major_axis_km * 1000.0;
  const double e = elements.eccentricity;
  const double p = a_m * (1.0 - e * e);
  const double nu = elements.true_anomaly_deg * constants::kDegToRad;
  const double r = p / (1.0 + e * std::cos(nu));
  const double vscale = std::sqrt(mu_m3_s2 / p);

  const Eigen::Vector3d r_pf{r * std::cos(nu), r * std::sin(nu), 0.0};
  const Eigen::Vector3d v_pf{-vscale * std::sin(nu), vscale * (e + std::cos(nu)), 0.0};

  const Eigen::Matrix3d rot =
      (Eigen::AngleAxisd(elements.raan_deg * constants::kDegToRad, Eigen::Vector3d::UnitZ()) *
       Eigen::AngleAxisd(elements.inclination_deg * constants::kDegToRad, Eigen::Vector3d::UnitX()) *
       Eigen::AngleAxisd(elements.arg_perigee_deg * constants::kDegToRad, Eigen::Vector3d::UnitZ()))
          .toRotationMatrix();

  CartesianResult out{};
  out.state.position_m = spacetraffic::core::from_eigen(rot * r_pf);
  out.state.velocity_mps = spacetraffic::core::from_eigen(rot * v_pf);
  out.status = Status::Ok;
  return out;
}

ElementsResult to_keplerian(const spacetraffic::core::StateVector& state, double mu_m3_s2) {
  if (!spacetraffic::core::is_finite(state) || !(mu_m3_s2 > 0.0)) {
    return ElementsResult{.status = Status::InvalidInput};
  }

  const Eigen::Vector3d r = spacetraffic::core::to_eigen(state.position_m);
  const Eigen::Vector3d v = spacetraffic::core::to_eigen(state.velocity_mps);
  const double rn = r.norm();
  const double vn = v.norm();
  if (!(rn > 0.0)) {
    return ElementsResult{.status = Status::DegenerateInput};
  }

  const Eigen::Vector3d h = r.cross(v);
  const double hn = h.norm();
  if (!(hn > 1e-12 * rn * vn)) {
    return ElementsResult{.status = Status::DegenerateInput};
  }

  const double v2 = v.squaredNorm();
  const double inv_a = 2.0 / rn - v2 / mu_m3_s2;
  if (!(inv_a > 0.0)) {
    return ElementsResult{.status = Status::DegenerateInput};
  }

  const Eigen::Vector3d e_vec = ((v2 - mu_m3_s2 / rn) * r - r.dot(v) * v) / mu_m3_s2;
  const double e = e_vec.norm();
  if (e >= 1.0) {
    return ElementsResult{.status = Status::DegenerateInput};
  }

  const Eigen::Vector3d h_hat = h / hn;
  const Eigen::Vector3d n = Eigen::Vector3d::UnitZ().cross(h);
  const double nn = n.norm();
  const bool equatorial = nn < kEquatorialNodeTol * hn;
  const bool circular = e < kCircularEccentricityTol;
  const Eigen::Vector3d node_dir = equatorial ? Eigen::Vector3d(Eigen::Vector3d::UnitX()) : Eigen::Vector3d(n / nn);

  OrbitalElements out{};
  out.semi_major_axis_km = (1.0 / inv_a) / 1000.0;
  out.eccentricity = e;
  out.inclination_deg = std::acos(std::clamp(h_hat.z(), -1.0, 1.0)) * constants::kRadToDeg;
  out.raan_deg = equatorial ? 0.0 : spacetraffic::core::wrap_degrees(std::atan2(n.y(), n.x()) * constants::kRadToDeg);
  if (circular) {
    out.arg_perigee_deg = 0.0;
    out.true_anomaly_deg = spacetraffic::core::wrap_degrees(plane_angle_rad(node_dir, r, h_hat) * constants::kRadToDeg);
  } else {
    out.arg_perigee_deg =
        spacetraffic::core::wrap_degrees(plane_angle_rad(node_dir, e_vec, h_hat) * constants::kRadToDeg);
    out.true_anomaly_deg = spacetraffic::core::wrap_degrees(plane_angle_rad(e_vec, r, h_hat) * constants::kRadToDeg);
  }
  return ElementsResult{.elements = out, .status = Status::Ok};
}

}  // namespace spacetraffic::orbit
