/**
 * @file rating_curve.cpp
 * @brief Rating curve interpolation implementation.
 * @author Watosn
 */

#include "bridgecast/hydraulics/rating_curve.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>

namespace bridgecast::hydraulics {

bridgecast::core::Status validate_rating_curve(const bridgecast::core::RatingCurve& curve) {
  if (curve.size() < 2U) {
    return bridgecast::core::Status::InvalidCurve;
  }
  for (std::size_t i = 0; i < curve.size(); ++i) {
    if (!std::isfinite(curve[i].flow) || !std::isfinite(curve[i].depth)) {
      return bridgecast::core::Status::InvalidCurve;
    }
    if (i > 0U && !(curve[i].flow > curve[i - 1U].flow)) {
      return bridgecast::core::Status::InvalidCurve;
    }
  }
  return bridgecast::core::Status::Ok;
}

DepthSample depth_for(const bridgecast::core::RatingCurve& curve, double flow) {
  const auto valid = validate_rating_curve(curve);
  if (valid != bridgecast::core::Status::Ok) {
    return DepthSample{.status = valid};
  }
  if (!std::isfinite(flow)) {
    return DepthSample{.status = bridgecast::core::Status::InvalidInput};
  }
  const double q = std::max(flow, 0.0);

  const auto& first = curve.front();
  if (q < first.flow) {
    return DepthSample{.depth = first.depth, .clamped = true};
  }

  const auto& last = curve.back();
  if (q > last.flow) {
    const auto& prev = curve[curve.size() - 2U];
    const double slope = (last.depth - prev.depth) / (last.flow - prev.flow);
    return DepthSample{.depth = last.depth + slope * (q - last.flow), .extrapolated = true};
  }

  const auto it = std::lower_bound(curve.begin(), curve.end(), q,
                                   [](const bridgecast::core::RatingPoint& p, double v) { return p.flow < v; });
  if (it->flow == q) {
    return DepthSample{.depth = it->depth};
  }

  const auto& hi = *it;
  const auto& lo = *(it - 1);
  const double alpha = (q - lo.flow) / (hi.flow - lo.flow);
  return DepthSample{.depth = lo.depth + alpha * (hi.depth - lo.depth)};
}

}  // namespace bridgecast::hydraulics
