/**
 * @file exponential_atmosphere.hpp
 * @brief Basic exponential atmosphere model.
 * @author Watosn
 */
#pragma once

#include "spacetraffic/core/constants.hpp"
#include "spacetraffic/core/interfaces.hpp"

namespace spacetraffic::models {

/**
 * @brief Exponential density profile rho0 * exp(-(h - h0) / H) above the mean Earth radius.
 */
class ExponentialAtmosphereModel final : public spacetraffic::core::IAtmosphereModel {
 public:
  /**
   * @brief Construct model with reference density/height and scale height.
   */
  explicit ExponentialAtmosphereModel(double rho0_kg_m3 = spacetraffic::core::constants::kSeaLevelDensityKgM3,
                                      double h0_m = 0.0,
                                      double scale_height_m = spacetraffic::core::constants::kAtmosphereScaleHeightM)
      : rho0_(rho0_kg_m3), h0_(h0_m), hs_(scale_height_m) {}

  /**
   * @brief Evaluate exponential density at the state's altitude.
   *
   * Positions below the mean radius are outside the profile and return InvalidInput.
   */
  [[nodiscard]] spacetraffic::core::AtmosphereSample evaluate(const spacetraffic::core::StateVector& state) const override;

 private:
  double rho0_{};
  double h0_{};
  double hs_{};
};

}  // namespace spacetraffic::models
