/**
 * @file geometry.hpp
 * @brief Eigen views of bridge cross-section geometry.
 * @author Watosn
 */
#pragma once

#include <cstddef>
#include <vector>

#include <Eigen/Dense>

#include "bridgecast/core/types.hpp"

namespace bridgecast::hydraulics {

/**
 * @brief Stations of the cross-section polyline.
 */
inline Eigen::ArrayXd stations(const bridgecast::core::BridgeRecord& record) {
  Eigen::ArrayXd out(static_cast<Eigen::Index>(record.geometry.size()));
  for (Eigen::Index i = 0; i < out.size(); ++i) {
    out(i) = record.geometry[static_cast<std::size_t>(i)].station;
  }
  return out;
}

/**
 * @brief Ground elevations of the cross-section polyline.
 */
inline Eigen::ArrayXd ground_elevations(const bridgecast::core::BridgeRecord& record) {
  Eigen::ArrayXd out(static_cast<Eigen::Index>(record.geometry.size()));
  for (Eigen::Index i = 0; i < out.size(); ++i) {
    out(i) = record.geometry[static_cast<std::size_t>(i)].elevation;
  }
  return out;
}

/**
 * @brief Per-station profile, or a flat line at `fallback` when the record carries none.
 */
inline Eigen::ArrayXd station_profile(const bridgecast::core::BridgeRecord& record,
                                      const std::vector<double>& profile,
                                      double fallback) {
  const auto n = static_cast<Eigen::Index>(record.geometry.size());
  if (profile.size() != record.geometry.size()) {
    return Eigen::ArrayXd::Constant(n, fallback);
  }
  return Eigen::Map<const Eigen::ArrayXd>(profile.data(), n);
}

}  // namespace bridgecast::hydraulics
