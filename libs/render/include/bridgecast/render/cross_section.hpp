/**
 * @file cross_section.hpp
 * @brief Render-ready bridge cross-section with forecast water surfaces.
 * @author Watosn
 */
#pragma once

#include <string>
#include <vector>

#include "bridgecast/core/types.hpp"
#include "bridgecast/hydraulics/depth_profiler.hpp"

namespace bridgecast::render {

/**
 * @brief Station-aligned polyline.
 */
struct Polyline {
  std::vector<double> station{};
  std::vector<double> elevation{};
};

/**
 * @brief Water surface at one forecast step.
 */
struct WaterSurfaceFrame {
  bridgecast::core::Epoch epoch{};
  int forecast_hour{};
  std::string label{};
  double flow{};
  double depth{};
  double water_surface_elevation{};  ///< Horizontal line across the section.
  bridgecast::core::RiskLevel risk{bridgecast::core::RiskLevel::Clear};
  Polyline surface{};  ///< Water surface clipped to ground, per station.
};

/**
 * @brief Everything the charting layer needs for one bridge forecast.
 */
struct RenderModel {
  std::string bridge_uuid{};
  std::string reach_id{};
  bridgecast::core::BridgeAnnotations annotations{};
  Polyline ground{};
  Polyline deck{};
  Polyline low_chord{};
  Polyline low_chord_fill{};  ///< Upper envelope of ground and low chord.
  double ground_fill_elevation{};
  double channel_invert_elevation{};
  double low_chord_elevation{};
  double deck_elevation{};
  double low_chord_depth{};  ///< Low chord height above the channel invert.
  std::vector<double> warning_zone_limits{};
  std::vector<WaterSurfaceFrame> frames{};
  bridgecast::core::RiskLevel worst_risk{bridgecast::core::RiskLevel::Clear};
  bridgecast::core::Status status{bridgecast::core::Status::Ok};
};

/**
 * @brief Combine a bridge record with its classified depth profile.
 * @param record Bridge geometry and structural elevations.
 * @param profile Depth profile computed for `record`.
 * @return Model with frames in chronological order; status mirrors a failed profile, or is
 *         `InvalidInput` when the profile belongs to another bridge.
 */
[[nodiscard]] RenderModel assemble(const bridgecast::core::BridgeRecord& record,
                                   const bridgecast::hydraulics::DepthProfile& profile);

}  // namespace bridgecast::render
