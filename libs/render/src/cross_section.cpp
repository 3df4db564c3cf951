/**
 * @file cross_section.cpp
 * @brief Cross-section assembly implementation.
 * @author Watosn
 */

#include "bridgecast/render/cross_section.hpp"

#include <algorithm>
#include <cstddef>

#include <Eigen/Dense>
#include <fmt/format.h>

#include "bridgecast/core/uuid.hpp"
#include "bridgecast/hydraulics/geometry.hpp"
#include "bridgecast/hydraulics/warning_zones.hpp"

namespace bridgecast::render {
namespace {

std::vector<double> to_vector(const Eigen::ArrayXd& a) { return std::vector<double>(a.data(), a.data() + a.size()); }

Polyline polyline(const std::vector<double>& station, const Eigen::ArrayXd& elevation) {
  return Polyline{.station = station, .elevation = to_vector(elevation)};
}

}  // namespace

RenderModel assemble(const bridgecast::core::BridgeRecord& record, const bridgecast::hydraulics::DepthProfile& profile) {
  if (profile.status != bridgecast::core::Status::Ok) {
    return RenderModel{.bridge_uuid = record.uuid, .status = profile.status};
  }
  if (!bridgecast::core::same_uuid(profile.bridge_uuid, record.uuid)) {
    return RenderModel{.bridge_uuid = record.uuid, .status = bridgecast::core::Status::InvalidInput};
  }
  if (record.geometry.empty()) {
    return RenderModel{.bridge_uuid = record.uuid, .status = bridgecast::core::Status::InvalidRecord};
  }

  const std::vector<double> station = to_vector(bridgecast::hydraulics::stations(record));
  const Eigen::ArrayXd ground = bridgecast::hydraulics::ground_elevations(record);
  const Eigen::ArrayXd deck = bridgecast::hydraulics::station_profile(record, record.deck_profile, record.deck_elevation);
  const Eigen::ArrayXd low_chord =
      bridgecast::hydraulics::station_profile(record, record.low_chord_profile, record.low_chord_elevation);
  const double invert = ground.minCoeff();

  RenderModel out{
      .bridge_uuid = record.uuid,
      .reach_id = record.reach_id,
      .annotations = record.annotations,
      .ground = polyline(station, ground),
      .deck = polyline(station, deck),
      .low_chord = polyline(station, low_chord),
      .low_chord_fill = polyline(station, ground.max(low_chord)),
      .ground_fill_elevation = invert - bridgecast::hydraulics::kGroundBuffer,
      .channel_invert_elevation = invert,
      .low_chord_elevation = record.low_chord_elevation,
      .deck_elevation = record.deck_elevation,
      .low_chord_depth = record.low_chord_elevation - invert,
      .warning_zone_limits = bridgecast::hydraulics::compute_warning_zones(record),
      .worst_risk = profile.worst_risk,
  };

  std::vector<bridgecast::hydraulics::ProfilePoint> points = profile.points;
  std::stable_sort(points.begin(), points.end(), [](const auto& a, const auto& b) {
    return a.epoch.utc_seconds < b.epoch.utc_seconds;
  });

  out.frames.reserve(points.size());
  for (std::size_t i = 0; i < points.size(); ++i) {
    const auto& p = points[i];
    const int hour = static_cast<int>(i) + 1;
    out.frames.push_back(WaterSurfaceFrame{
        .epoch = p.epoch,
        .forecast_hour = hour,
        .label = fmt::format("+{}hr", hour),
        .flow = p.flow,
        .depth = p.depth,
        .water_surface_elevation = p.water_surface_elevation,
        .risk = p.risk,
        .surface = polyline(station, ground.max(p.water_surface_elevation)),
    });
  }
  return out;
}

}  // namespace bridgecast::render
