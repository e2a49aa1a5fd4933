/**
 * @file interfaces.hpp
 * @brief Core model interfaces for atmosphere density.
 * @author Watosn
 */
#pragma once

#include "spacetraffic/core/types.hpp"

namespace spacetraffic::core {

/**
 * @brief Interface for neutral density models.
 */
class IAtmosphereModel {
 public:
  virtual ~IAtmosphereModel() = default;
  /**
   * @brief Evaluate atmospheric density for a spacecraft state.
   * @param state Input state vector.
   * @return Atmosphere sample with `status` set.
   */
  [[nodiscard]] virtual AtmosphereSample evaluate(const StateVector& state) const = 0;
};

}  // namespace spacetraffic::core
