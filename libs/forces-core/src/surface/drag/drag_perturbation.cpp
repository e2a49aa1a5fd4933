/**
 * @file drag_perturbation.cpp
 * @brief Drag perturbation model implementation.
 * @author Watosn
 */

#include "spacetraffic/forces/surface/drag/drag_perturbation.hpp"

namespace spacetraffic::forces {

PerturbationContribution DragPerturbationModel::evaluate(const PerturbationRequest& request) const {
  PerturbationContribution out{};
  out.name = name_;
  out.type = PerturbationType::Drag;

  const auto* sat = request.satellite ? request.satellite : default_satellite_;
  if (!sat) {
    out.status = spacetraffic::core::Status::InvalidInput;
    return out;
  }

  const auto drag = drag_.evaluate(request.state, *sat);
  out.acceleration_mps2 = drag.acceleration_mps2;
  out.status = drag.status;
  return out;
}

}  // namespace spacetraffic::forces
