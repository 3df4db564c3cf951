/**
 * @file warning_zones.cpp
 * @brief Stage-graph warning band implementation.
 * @author Watosn
 */

#include "bridgecast/hydraulics/warning_zones.hpp"

#include <cmath>
#include <cstddef>

#include "bridgecast/hydraulics/geometry.hpp"

namespace bridgecast::hydraulics {
namespace {

double round_hundredths(double v) { return std::round(v * 100.0) / 100.0; }

}  // namespace

std::vector<double> compute_warning_zones(const bridgecast::core::BridgeRecord& record) {
  if (record.geometry.empty()) {
    return {};
  }
  const Eigen::ArrayXd ground = ground_elevations(record);
  const double invert = ground.minCoeff();
  const double top_depth = ground.maxCoeff() - invert;
  const double low_chord_depth = record.low_chord_elevation - invert;

  std::vector<double> limits{top_depth, low_chord_depth - kZoneOffsets[0]};
  for (std::size_t i = 0; i + 1U < kZoneOffsets.size(); ++i) {
    if (low_chord_depth > kZoneOffsets[i]) {
      const double next = kZoneOffsets[i + 1U];
      limits.push_back(low_chord_depth > next ? low_chord_depth - next : -kGroundBuffer);
    }
  }
  if (low_chord_depth > kZoneOffsets.back()) {
    limits.push_back(-kGroundBuffer);
  }

  for (auto& v : limits) {
    v = round_hundredths(v);
  }
  return limits;
}

}  // namespace bridgecast::hydraulics
