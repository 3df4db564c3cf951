/**
 * @file depth_profiler.hpp
 * @brief Forecast flow sequence to classified depth time series.
 * @author Watosn
 */
#pragma once

#include <string>
#include <vector>

#include "bridgecast/core/interfaces.hpp"
#include "bridgecast/hydraulics/risk_classifier.hpp"

namespace bridgecast::hydraulics {

/**
 * @brief One forecast step of a depth profile.
 */
struct ProfilePoint {
  bridgecast::core::Epoch epoch{};
  double flow{};
  double depth{};
  double water_surface_elevation{};
  bridgecast::core::RiskLevel risk{bridgecast::core::RiskLevel::Clear};
  bool clamped{};
  bool extrapolated{};
};

/**
 * @brief Depth time series for one forecast, in input order.
 */
struct DepthProfile {
  std::string bridge_uuid{};
  std::vector<ProfilePoint> points{};
  bridgecast::core::RiskLevel worst_risk{bridgecast::core::RiskLevel::Clear};
  bridgecast::core::Status status{bridgecast::core::Status::Ok};
};

/**
 * @brief Applies a bridge rating curve and risk thresholds across a forecast.
 */
class ForecastDepthProfiler {
 public:
  /**
   * @brief Profiler configuration.
   */
  struct Config {
    RiskThresholds thresholds{};
    double depth_resolution{};  ///< Round depths to this multiple; 0 keeps them exact.
  };

  /**
   * @brief Construct profiler over a record provider with default thresholds and exact depths.
   */
  explicit ForecastDepthProfiler(const bridgecast::core::IBridgeRecordProvider& provider) : provider_(provider) {}

  /**
   * @brief Construct profiler over a record provider.
   * @param provider Bridge record provider used by `profile(request)`.
   * @param config Thresholds and output resolution.
   */
  ForecastDepthProfiler(const bridgecast::core::IBridgeRecordProvider& provider, const Config& config)
      : provider_(provider), config_(config) {}

  /**
   * @brief Resolve the request's bridge through the provider and profile it.
   * @return Profile with `status` set; provider failures are passed through.
   */
  [[nodiscard]] DepthProfile profile(const bridgecast::core::ForecastRequest& request) const;

  /**
   * @brief Profile a forecast against an already resolved record.
   */
  [[nodiscard]] DepthProfile profile(const bridgecast::core::BridgeRecord& record,
                                     const bridgecast::core::ForecastRequest& request) const;

  [[nodiscard]] const Config& config() const { return config_; }

 private:
  const bridgecast::core::IBridgeRecordProvider& provider_;
  Config config_{};
};

}  // namespace bridgecast::hydraulics
