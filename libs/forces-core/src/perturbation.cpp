/**
 * @file perturbation.cpp
 * @brief Perturbation stack aggregation implementation.
 * @author Watosn
 */

#include "spacetraffic/forces/perturbation.hpp"

namespace spacetraffic::forces {

using spacetraffic::core::Status;

void PerturbationStack::add(std::unique_ptr<IPerturbationModel> model) {
  if (model) {
    models_.push_back(std::move(model));
  }
}

PerturbationResult PerturbationStack::evaluate(const PerturbationRequest& request) const {
  PerturbationResult out{};
  out.contributions.reserve(models_.size());
  for (const auto& model : models_) {
    auto& c = out.contributions.emplace_back(model->evaluate(request));
    if (c.status == Status::Ok && !spacetraffic::core::is_finite(c.acceleration_mps2)) {
      c.status = Status::NumericalError;
    }
    if (c.status != Status::Ok) {
      if (out.status == Status::Ok) {
        out.status = c.status;
      }
      continue;
    }
    out.total_acceleration_mps2 = out.total_acceleration_mps2 + c.acceleration_mps2;
  }
  return out;
}

}  // namespace spacetraffic::forces
