/**
 * @file j2_perturbation.hpp
 * @brief J2 perturbation model adapter for the generic force interface.
 * @author Watosn
 */
#pragma once

#include <string>
#include <utility>

#include "spacetraffic/forces/gravity/j2_model.hpp"
#include "spacetraffic/forces/perturbation.hpp"

namespace spacetraffic::forces {

/**
 * @brief Perturbation-stack wrapper around j2_acceleration.
 */
class J2PerturbationModel final : public IPerturbationModel {
 public:
  explicit J2PerturbationModel(J2Config config = {}, std::string name = "j2") : config_(config), name_(std::move(name)) {}

  /**
   * @brief Evaluate J2 contribution.
   */
  [[nodiscard]] PerturbationContribution evaluate(const PerturbationRequest& request) const override;

 private:
  J2Config config_{};
  std::string name_{};
};

}  // namespace spacetraffic::forces
