/**
 * @file render_json.cpp
 * @brief JSON serialization of render models and depth profiles.
 * @author Watosn
 */

#include "bridgecast/render/render_json.hpp"

#include <string>
#include <utility>

#include "bridgecast/core/time.hpp"

namespace bridgecast::render {
namespace {

nlohmann::json polyline_json(const Polyline& p) {
  return nlohmann::json{{"station", p.station}, {"elevation", p.elevation}};
}

std::string name(bridgecast::core::RiskLevel r) { return std::string(bridgecast::core::to_string(r)); }

std::string name(bridgecast::core::Status s) { return std::string(bridgecast::core::to_string(s)); }

}  // namespace

nlohmann::json to_json(const RenderModel& model) {
  nlohmann::json doc{
      {"uuid", model.bridge_uuid},
      {"status", name(model.status)},
  };
  if (model.status != bridgecast::core::Status::Ok) {
    return doc;
  }

  doc["reach_id"] = model.reach_id;
  doc["annotations"] = {
      {"title", model.annotations.title},
      {"lat_long", model.annotations.lat_long},
      {"nbi", model.annotations.nbi},
      {"comid", model.annotations.comid},
  };
  doc["geometry"] = {
      {"ground", polyline_json(model.ground)},
      {"deck", polyline_json(model.deck)},
      {"low_chord", polyline_json(model.low_chord)},
      {"low_chord_fill", polyline_json(model.low_chord_fill)},
      {"ground_fill_elevation", model.ground_fill_elevation},
      {"channel_invert_elevation", model.channel_invert_elevation},
      {"low_chord_elevation", model.low_chord_elevation},
      {"deck_elevation", model.deck_elevation},
      {"low_chord_depth", model.low_chord_depth},
  };
  doc["warning_zone_limits"] = model.warning_zone_limits;
  doc["worst_risk"] = name(model.worst_risk);

  nlohmann::json frames = nlohmann::json::array();
  for (const auto& f : model.frames) {
    frames.push_back({
        {"utc_time", bridgecast::core::time::format_iso8601_utc(f.epoch)},
        {"forecast_hour", f.forecast_hour},
        {"label", f.label},
        {"flow", f.flow},
        {"depth", f.depth},
        {"water_surface_elevation", f.water_surface_elevation},
        {"risk", name(f.risk)},
        {"surface", f.surface.elevation},
    });
  }
  doc["frames"] = std::move(frames);
  return doc;
}

nlohmann::json to_json(const bridgecast::hydraulics::DepthProfile& profile) {
  nlohmann::json doc{
      {"uuid", profile.bridge_uuid},
      {"status", name(profile.status)},
      {"worst_risk", name(profile.worst_risk)},
  };
  nlohmann::json points = nlohmann::json::array();
  for (const auto& p : profile.points) {
    points.push_back({
        {"utc_time", bridgecast::core::time::format_iso8601_utc(p.epoch)},
        {"flow", p.flow},
        {"depth", p.depth},
        {"water_surface_elevation", p.water_surface_elevation},
        {"risk", name(p.risk)},
        {"clamped", p.clamped},
        {"extrapolated", p.extrapolated},
    });
  }
  doc["points"] = std::move(points);
  return doc;
}

}  // namespace bridgecast::render
