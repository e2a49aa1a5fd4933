/**
 * @file j2_perturbation.cpp
 * @brief J2 perturbation model implementation.
 * @author Watosn
 */

#include "spacetraffic/forces/gravity/j2_perturbation.hpp"

namespace spacetraffic::forces {

PerturbationContribution J2PerturbationModel::evaluate(const PerturbationRequest& request) const {
  PerturbationContribution out{};
  out.name = name_;
  out.type = PerturbationType::Gravity;
  out.acceleration_mps2 = j2_acceleration(request.state, config_);
  out.status = spacetraffic::core::Status::Ok;
  return out;
}

}  // namespace spacetraffic::forces
