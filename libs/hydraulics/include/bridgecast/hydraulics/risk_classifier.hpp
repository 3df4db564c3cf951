/**
 * @file risk_classifier.hpp
 * @brief Submersion risk classification against bridge structural elevations.
 * @author Watosn
 */
#pragma once

#include <vector>

#include "bridgecast/core/types.hpp"

namespace bridgecast::hydraulics {

/// Freeboard below the low chord at which a bridge is flagged as approaching (ft).
inline constexpr double kDefaultWarningMargin = 0.5;

/**
 * @brief Tunable classification thresholds.
 */
struct RiskThresholds {
  double warning_margin{kDefaultWarningMargin};
};

/**
 * @brief Classify one depth sample.
 *
 * The water surface is `channel_invert_elevation + depth`. Levels are tested from most to least
 * severe: deck, low chord, low chord minus `warning_margin`.
 */
[[nodiscard]] bridgecast::core::RiskLevel classify(double depth,
                                                   double low_chord_elevation,
                                                   double deck_elevation,
                                                   double channel_invert_elevation,
                                                   double warning_margin = kDefaultWarningMargin);

/**
 * @brief Classify one depth sample against a bridge record.
 */
[[nodiscard]] bridgecast::core::RiskLevel classify(double depth,
                                                   const bridgecast::core::BridgeRecord& record,
                                                   const RiskThresholds& thresholds = {});

/**
 * @brief Most severe level in a sequence, `Clear` when empty.
 */
[[nodiscard]] bridgecast::core::RiskLevel worst_risk(const std::vector<bridgecast::core::RiskLevel>& levels);

}  // namespace bridgecast::hydraulics
