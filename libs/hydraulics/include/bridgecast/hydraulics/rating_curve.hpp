/**
 * @file rating_curve.hpp
 * @brief Flow-to-depth lookup on a synthetic rating curve.
 * @author Watosn
 */
#pragma once

#include "bridgecast/core/types.hpp"

namespace bridgecast::hydraulics {

/**
 * @brief Depth lookup output.
 */
struct DepthSample {
  double depth{};
  bool clamped{};       ///< Flow fell below the first sample; depth held at the minimum.
  bool extrapolated{};  ///< Flow exceeded the last sample; depth follows the trailing slope.
  bridgecast::core::Status status{bridgecast::core::Status::Ok};
};

/**
 * @brief Check that a curve can be interpolated.
 * @return `InvalidCurve` for fewer than two samples, non-finite values, or flows that are not
 *         strictly ascending; `Ok` otherwise.
 */
[[nodiscard]] bridgecast::core::Status validate_rating_curve(const bridgecast::core::RatingCurve& curve);

/**
 * @brief Map a flow to a depth above the channel invert.
 *
 * Negative flows are treated as zero. Flows below the first sample clamp to its depth; flows
 * above the last sample extrapolate along the slope of the last two samples.
 *
 * @param curve Flow-ascending sample table.
 * @param flow Flow in the curve's units.
 * @return Depth sample with `status` set.
 */
[[nodiscard]] DepthSample depth_for(const bridgecast::core::RatingCurve& curve, double flow);

}  // namespace bridgecast::hydraulics
