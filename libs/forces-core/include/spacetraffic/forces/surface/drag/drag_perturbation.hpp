/**
 * @file drag_perturbation.hpp
 * @brief Drag perturbation model adapter for the generic force interface.
 * @author Watosn
 */
#pragma once

#include <string>
#include <utility>

#include "spacetraffic/forces/perturbation.hpp"
#include "spacetraffic/forces/surface/drag/drag_model.hpp"

namespace spacetraffic::forces {

/**
 * @brief Perturbation-stack wrapper around DragAccelerationModel.
 */
class DragPerturbationModel final : public IPerturbationModel {
 public:
  /**
   * @brief Construct drag wrapper with an atmosphere reference.
   */
  DragPerturbationModel(const spacetraffic::core::IAtmosphereModel& atmosphere,
                        DragConfig config = {},
                        const spacetraffic::sc::SatelliteParameters* default_satellite = nullptr,
                        std::string name = "drag")
      : drag_(atmosphere, config), default_satellite_(default_satellite), name_(std::move(name)) {}

  /**
   * @brief Evaluate drag contribution.
   */
  [[nodiscard]] PerturbationContribution evaluate(const PerturbationRequest& request) const override;

 private:
  DragAccelerationModel drag_;
  const spacetraffic::sc::SatelliteParameters* default_satellite_{nullptr};
  std::string name_{};
};

}  // namespace spacetraffic::forces
