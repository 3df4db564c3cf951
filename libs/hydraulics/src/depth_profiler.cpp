/**
 * @file depth_profiler.cpp
 * @brief Forecast depth profiler implementation.
 * @author Watosn
 */

#include "bridgecast/hydraulics/depth_profiler.hpp"

#include <cmath>
#include <cstddef>

#include "bridgecast/core/uuid.hpp"
#include "bridgecast/hydraulics/rating_curve.hpp"

namespace bridgecast::hydraulics {
namespace {

DepthProfile failed(const std::string& uuid, bridgecast::core::Status status) {
  return DepthProfile{.bridge_uuid = uuid, .status = status};
}

}  // namespace

DepthProfile ForecastDepthProfiler::profile(const bridgecast::core::ForecastRequest& request) const {
  if (request.flows.empty()) {
    return failed(request.bridge_uuid, bridgecast::core::Status::EmptyForecast);
  }
  const auto lookup = provider_.get(request.bridge_uuid);
  if (lookup.status != bridgecast::core::Status::Ok) {
    return failed(request.bridge_uuid, lookup.status);
  }
  if (!lookup.record) {
    return failed(request.bridge_uuid, bridgecast::core::Status::UnknownBridge);
  }
  return profile(*lookup.record, request);
}

DepthProfile ForecastDepthProfiler::profile(const bridgecast::core::BridgeRecord& record,
                                            const bridgecast::core::ForecastRequest& request) const {
  if (request.flows.empty()) {
    return failed(record.uuid, bridgecast::core::Status::EmptyForecast);
  }
  if (!request.bridge_uuid.empty() && !bridgecast::core::same_uuid(request.bridge_uuid, record.uuid)) {
    return failed(record.uuid, bridgecast::core::Status::InvalidInput);
  }
  if (!std::isfinite(request.start.utc_seconds) || !std::isfinite(request.step_seconds) || request.step_seconds <= 0.0) {
    return failed(record.uuid, bridgecast::core::Status::InvalidInput);
  }
  for (const double q : request.flows) {
    if (!std::isfinite(q) || q < 0.0) {
      return failed(record.uuid, bridgecast::core::Status::InvalidForecast);
    }
  }
  const auto curve_status = validate_rating_curve(record.rating_curve);
  if (curve_status != bridgecast::core::Status::Ok) {
    return failed(record.uuid, curve_status);
  }

  const double invert = record.channel_invert_elevation();
  DepthProfile out{.bridge_uuid = record.uuid};
  out.points.reserve(request.flows.size());
  for (std::size_t i = 0; i < request.flows.size(); ++i) {
    const auto sample = depth_for(record.rating_curve, request.flows[i]);
    if (sample.status != bridgecast::core::Status::Ok) {
      return failed(record.uuid, sample.status);
    }
    double depth = sample.depth;
    if (config_.depth_resolution > 0.0) {
      depth = std::round(depth / config_.depth_resolution) * config_.depth_resolution;
    }
    const auto risk = classify(depth, record.low_chord_elevation, record.deck_elevation, invert,
                               config_.thresholds.warning_margin);
    out.points.push_back(ProfilePoint{
        .epoch = bridgecast::core::Epoch{.utc_seconds = request.start.utc_seconds +
                                                        static_cast<double>(i) * request.step_seconds},
        .flow = request.flows[i],
        .depth = depth,
        .water_surface_elevation = invert + depth,
        .risk = risk,
        .clamped = sample.clamped,
        .extrapolated = sample.extrapolated,
    });
    if (risk > out.worst_risk) {
      out.worst_risk = risk;
    }
  }
  return out;
}

}  // namespace bridgecast::hydraulics
