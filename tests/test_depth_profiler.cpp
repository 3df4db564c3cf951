/**
 * @file test_depth_profiler.cpp
 * @brief Forecast depth profiler tests.
 * @author Watosn
 */

#include <atomic>
#include <cmath>
#include <limits>
#include <string>

#include <spdlog/spdlog.h>

#include "bridgecast/hydraulics/depth_profiler.hpp"
#include "bridgecast/records/static_provider.hpp"

namespace {

constexpr const char* kBridge = "6b1f0c8e-93a4-4d55-8c1e-2f7d9a0b3c21";

bool approx(double a, double b, double tol = 1e-9) { return std::abs(a - b) <= tol; }

bridgecast::core::BridgeRecord make_bridge() {
  bridgecast::core::BridgeRecord r{};
  r.uuid = kBridge;
  r.reach_id = "5781369";
  r.geometry = {{0.0, 12.0}, {10.0, 4.0}, {20.0, 0.0}, {30.0, 4.0}, {40.0, 12.0}};
  r.rating_curve = {{0.0, 0.0}, {1000.0, 2.0}, {5000.0, 6.5}};
  r.low_chord_elevation = 8.0;
  r.deck_elevation = 10.0;
  return r;
}

class FailingProvider final : public bridgecast::core::IBridgeRecordProvider {
 public:
  bridgecast::core::BridgeLookup get(std::string_view) const override {
    ++calls;
    return bridgecast::core::BridgeLookup{.status = bridgecast::core::Status::ProviderUnavailable};
  }
  mutable std::atomic<int> calls{0};
};

}  // namespace

int main() {
  using namespace bridgecast;

  const records::StaticBridgeProvider provider(make_bridge());
  const hydraulics::ForecastDepthProfiler profiler(provider);

  core::ForecastRequest req{};
  req.bridge_uuid = kBridge;
  req.flows = {0.0, 500.0, 5000.0, 8000.0};
  req.start = core::Epoch{.utc_seconds = 1717200000.0};

  const auto p = profiler.profile(req);
  if (p.status != core::Status::Ok || p.points.size() != req.flows.size() || p.bridge_uuid != kBridge) {
    spdlog::error("profile failed: {}", core::to_string(p.status));
    return 1;
  }
  const double expected[] = {0.0, 1.0, 6.5, 9.875};
  for (std::size_t i = 0; i < p.points.size(); ++i) {
    const auto& pt = p.points[i];
    if (!approx(pt.depth, expected[i]) || pt.flow != req.flows[i]) {
      spdlog::error("depth mismatch at step {}: {}", i, pt.depth);
      return 2;
    }
    if (pt.epoch.utc_seconds != req.start.utc_seconds + 3600.0 * static_cast<double>(i)) {
      spdlog::error("timestamp mismatch at step {}", i);
      return 3;
    }
    if (!approx(pt.water_surface_elevation, pt.depth)) {
      spdlog::error("water surface not referenced to invert at step {}", i);
      return 4;
    }
  }
  if (p.points[3].risk != core::RiskLevel::LowChordSubmerged || !p.points[3].extrapolated ||
      p.points[0].risk != core::RiskLevel::Clear || p.worst_risk != core::RiskLevel::LowChordSubmerged) {
    spdlog::error("risk levels mismatch");
    return 5;
  }

  core::ForecastRequest empty = req;
  empty.flows.clear();
  if (profiler.profile(empty).status != core::Status::EmptyForecast) {
    spdlog::error("empty forecast accepted");
    return 6;
  }

  core::ForecastRequest unknown = req;
  unknown.bridge_uuid = "00000000-0000-0000-0000-000000000000";
  if (profiler.profile(unknown).status != core::Status::UnknownBridge) {
    spdlog::error("unknown bridge not reported");
    return 7;
  }

  core::ForecastRequest negative = req;
  negative.flows[1] = -1.0;
  core::ForecastRequest nan = req;
  nan.flows[2] = std::numeric_limits<double>::quiet_NaN();
  if (profiler.profile(negative).status != core::Status::InvalidForecast ||
      profiler.profile(nan).status != core::Status::InvalidForecast) {
    spdlog::error("invalid flows accepted");
    return 8;
  }

  auto bad_curve = make_bridge();
  bad_curve.rating_curve = {{0.0, 0.0}};
  if (profiler.profile(bad_curve, req).status != core::Status::InvalidCurve) {
    spdlog::error("single-sample curve accepted");
    return 9;
  }

  auto other = make_bridge();
  other.uuid = "11111111-2222-3333-4444-555555555555";
  if (profiler.profile(other, req).status != core::Status::InvalidInput) {
    spdlog::error("profile accepted a record for another bridge");
    return 10;
  }

  core::ForecastRequest bad_step = req;
  bad_step.step_seconds = 0.0;
  if (profiler.profile(bad_step).status != core::Status::InvalidInput) {
    spdlog::error("zero step accepted");
    return 11;
  }

  FailingProvider failing;
  const hydraulics::ForecastDepthProfiler down(failing);
  if (down.profile(req).status != core::Status::ProviderUnavailable || failing.calls.load() != 1) {
    spdlog::error("provider failure not passed through");
    return 12;
  }
  if (down.profile(empty).status != core::Status::EmptyForecast || failing.calls.load() != 1) {
    spdlog::error("empty forecast reached the provider");
    return 13;
  }

  const hydraulics::ForecastDepthProfiler rounding(
      provider, hydraulics::ForecastDepthProfiler::Config{.thresholds = {.warning_margin = 1.0}, .depth_resolution = 0.1});
  core::ForecastRequest fine = req;
  fine.flows = {1234.0, 7400.0};
  const auto r = rounding.profile(fine);
  if (r.status != core::Status::Ok || !approx(r.points[0].depth, 2.3) || !approx(r.points[1].depth, 9.2)) {
    spdlog::error("depth rounding failed: {} {}", r.points.empty() ? -1.0 : r.points[0].depth,
                  r.points.size() < 2 ? -1.0 : r.points[1].depth);
    return 14;
  }
  if (r.points[0].risk != core::RiskLevel::Clear || r.points[1].risk != core::RiskLevel::LowChordSubmerged) {
    spdlog::error("configured thresholds not applied");
    return 15;
  }

  // Stored documents may spell the identifier in uppercase.
  auto shouting = make_bridge();
  shouting.uuid = "6B1F0C8E-93A4-4D55-8C1E-2F7D9A0B3C21";
  const records::StaticBridgeProvider upper_store(shouting);
  const hydraulics::ForecastDepthProfiler upper_profiler(upper_store);
  const auto lookup = upper_store.get(kBridge);
  const auto mixed = upper_profiler.profile(req);
  if (lookup.status != core::Status::Ok || mixed.status != core::Status::Ok || mixed.points.size() != req.flows.size()) {
    spdlog::error("identifier letter case broke the profile: {}", core::to_string(mixed.status));
    return 16;
  }
  core::ForecastRequest upper_req = req;
  upper_req.bridge_uuid = shouting.uuid;
  if (profiler.profile(make_bridge(), upper_req).status != core::Status::Ok) {
    spdlog::error("uppercase request rejected for a lowercase record");
    return 17;
  }

  return 0;
}
