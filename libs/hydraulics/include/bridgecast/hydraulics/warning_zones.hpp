/**
 * @file warning_zones.hpp
 * @brief Stage-graph warning bands below a bridge low chord.
 * @author Watosn
 */
#pragma once

#include <array>
#include <vector>

#include "bridgecast/core/types.hpp"

namespace bridgecast::hydraulics {

/// Depth below the channel invert used as the floor of the lowest band (ft).
inline constexpr double kGroundBuffer = 1.0;

/// Distances below the low chord at which successive bands begin (ft).
inline constexpr std::array<double, 3> kZoneOffsets{0.5, 2.0, 5.0};

/**
 * @brief Band limits for the forecast stage graph, as depths above the channel invert.
 *
 * The first limit is the top of the cross-section, the second the first warning level below
 * the low chord. Each further limit steps down by the next offset while the low chord is high
 * enough above the invert, and the sequence ends at `-kGroundBuffer`. Values are rounded to
 * 0.01.
 */
[[nodiscard]] std::vector<double> compute_warning_zones(const bridgecast::core::BridgeRecord& record);

}  // namespace bridgecast::hydraulics
