/**
 * @file risk_classifier.cpp
 * @brief Risk classification implementation.
 * @author Watosn
 */

#include "bridgecast/hydraulics/risk_classifier.hpp"

#include <algorithm>

namespace bridgecast::hydraulics {

bridgecast::core::RiskLevel classify(double depth,
                                     double low_chord_elevation,
                                     double deck_elevation,
                                     double channel_invert_elevation,
                                     double warning_margin) {
  const double water_surface = channel_invert_elevation + depth;
  if (water_surface >= deck_elevation) {
    return bridgecast::core::RiskLevel::DeckSubmerged;
  }
  if (water_surface >= low_chord_elevation) {
    return bridgecast::core::RiskLevel::LowChordSubmerged;
  }
  if (water_surface >= low_chord_elevation - warning_margin) {
    return bridgecast::core::RiskLevel::ApproachingLowChord;
  }
  return bridgecast::core::RiskLevel::Clear;
}

bridgecast::core::RiskLevel classify(double depth,
                                     const bridgecast::core::BridgeRecord& record,
                                     const RiskThresholds& thresholds) {
  return classify(depth, record.low_chord_elevation, record.deck_elevation, record.channel_invert_elevation(),
                  thresholds.warning_margin);
}

bridgecast::core::RiskLevel worst_risk(const std::vector<bridgecast::core::RiskLevel>& levels) {
  if (levels.empty()) {
    return bridgecast::core::RiskLevel::Clear;
  }
  return *std::max_element(levels.begin(), levels.end());
}

}  // namespace bridgecast::hydraulics
