/**
 * @file perturbation.hpp
 * @brief Generic perturbation model interfaces and aggregation utilities.
 * @author Watosn
 */
#pragma once

#include <memory>
#include <string>
#include <vector>

#include "spacetraffic/core/types.hpp"
#include "spacetraffic/sc/spacecraft.hpp"

namespace spacetraffic::forces {

/**
 * @brief High-level perturbation category identifier.
 */
enum class PerturbationType : unsigned char { Unknown, Drag, Gravity };

/**
 * @brief Evaluation request passed to a perturbation model.
 */
struct PerturbationRequest {
  spacetraffic::core::StateVector state{};
  const spacetraffic::sc::SatelliteParameters* satellite{nullptr};
};

/**
 * @brief One model contribution to total acceleration.
 */
struct PerturbationContribution {
  std::string name{};
  PerturbationType type{PerturbationType::Unknown};
  spacetraffic::core::Vec3 acceleration_mps2{};
  spacetraffic::core::Status status{spacetraffic::core::Status::Ok};
};

/**
 * @brief Aggregated perturbation output across all active models.
 *
 * The total only sums contributions with Status::Ok. The status is the first failing contribution's.
 */
struct PerturbationResult {
  spacetraffic::core::Vec3 total_acceleration_mps2{};
  std::vector<PerturbationContribution> contributions{};
  spacetraffic::core::Status status{spacetraffic::core::Status::Ok};
};

/**
 * @brief Interface for one force-model contribution.
 */
class IPerturbationModel {
 public:
  virtual ~IPerturbationModel() = default;
  /**
   * @brief Evaluate one perturbation contribution.
   * @param request Input state and satellite parameters.
   * @return Contribution with acceleration and status.
   */
  [[nodiscard]] virtual PerturbationContribution evaluate(const PerturbationRequest& request) const = 0;
};

/**
 * @brief Composes multiple perturbation models into one aggregate result.
 */
class PerturbationStack final {
 public:
  /**
   * @brief Add one model to the stack.
   */
  void add(std::unique_ptr<IPerturbationModel> model);
  /**
   * @brief Evaluate all added models and return total acceleration.
   *
   * A contribution reporting Ok with a non-finite acceleration is downgraded to NumericalError.
   */
  [[nodiscard]] PerturbationResult evaluate(const PerturbationRequest& request) const;
  /**
   * @brief Number of models in the stack.
   */
  [[nodiscard]] std::size_t size() const { return models_.size(); }

 private:
  std::vector<std::unique_ptr<IPerturbationModel>> models_{};
};

}  // namespace spacetraffic::forces
