/**
 * @file types.hpp
 * @brief Core domain types for bridgecast.
 * @author Watosn
 */
#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace bridgecast::core {

/**
 * @brief Standard status code used by model and provider outputs.
 */
enum class Status : std::uint8_t {
  Ok,
  InvalidInput,
  InvalidCurve,
  InvalidRecord,
  UnknownBridge,
  EmptyForecast,
  InvalidForecast,
  ProviderUnavailable,
};

/**
 * @brief Submersion risk at a bridge, ordered from least to most severe.
 */
enum class RiskLevel : std::uint8_t { Clear, ApproachingLowChord, LowChordSubmerged, DeckSubmerged };

/**
 * @brief Stable lowercase name for a status code.
 */
inline std::string_view to_string(Status s) {
  switch (s) {
    case Status::Ok:
      return "ok";
    case Status::InvalidInput:
      return "invalid_input";
    case Status::InvalidCurve:
      return "invalid_curve";
    case Status::InvalidRecord:
      return "invalid_record";
    case Status::UnknownBridge:
      return "unknown_bridge";
    case Status::EmptyForecast:
      return "empty_forecast";
    case Status::InvalidForecast:
      return "invalid_forecast";
    case Status::ProviderUnavailable:
      return "provider_unavailable";
  }
  return "unknown";
}

/**
 * @brief Stable lowercase name for a risk level.
 */
inline std::string_view to_string(RiskLevel r) {
  switch (r) {
    case RiskLevel::Clear:
      return "clear";
    case RiskLevel::ApproachingLowChord:
      return "approaching_low_chord";
    case RiskLevel::LowChordSubmerged:
      return "low_chord_submerged";
    case RiskLevel::DeckSubmerged:
      return "deck_submerged";
  }
  return "unknown";
}

/**
 * @brief UTC epoch expressed as seconds since Unix epoch.
 */
struct Epoch {
  double utc_seconds{};
};

/**
 * @brief One cross-section sample: horizontal station and ground elevation (ft).
 */
struct StationElevation {
  double station{};
  double elevation{};
};

/**
 * @brief One rating curve sample: flow (cfs) and depth above channel invert (ft).
 */
struct RatingPoint {
  double flow{};
  double depth{};
};

using RatingCurve = std::vector<RatingPoint>;

/**
 * @brief Display labels carried with a bridge for the charting layer.
 */
struct BridgeAnnotations {
  std::string title{};
  std::string lat_long{};
  std::string nbi{};
  std::string comid{};
};

/**
 * @brief Static reference data for one bridge cross-section.
 *
 * `deck_profile` and `low_chord_profile` are either empty or aligned with `geometry`.
 */
struct BridgeRecord {
  std::string uuid{};
  std::string reach_id{};
  std::vector<StationElevation> geometry{};
  std::vector<double> deck_profile{};
  std::vector<double> low_chord_profile{};
  RatingCurve rating_curve{};
  double low_chord_elevation{};
  double deck_elevation{};
  BridgeAnnotations annotations{};

  /**
   * @brief Lowest geometry elevation, the datum of all rating curve depths.
   */
  [[nodiscard]] double channel_invert_elevation() const {
    double lowest = geometry.empty() ? 0.0 : geometry.front().elevation;
    for (const auto& p : geometry) {
      if (p.elevation < lowest) {
        lowest = p.elevation;
      }
    }
    return lowest;
  }
};

/**
 * @brief Forecasted flows for one bridge, one value per step starting at `start`.
 */
struct ForecastRequest {
  std::string bridge_uuid{};
  std::vector<double> flows{};
  Epoch start{};
  double step_seconds{3600.0};
};

/**
 * @brief Provider lookup outcome. `record` is null unless `status` is Ok.
 */
struct BridgeLookup {
  std::shared_ptr<const BridgeRecord> record{};
  Status status{Status::Ok};
};

}  // namespace bridgecast::core
