/**
 * @file render_json.hpp
 * @brief JSON documents for the charting layer.
 * @author Watosn
 */
#pragma once

#include <nlohmann/json.hpp>

#include "bridgecast/hydraulics/depth_profiler.hpp"
#include "bridgecast/render/cross_section.hpp"

namespace bridgecast::render {

/**
 * @brief Serialize a render model. Timestamps are ISO-8601 UTC strings.
 */
[[nodiscard]] nlohmann::json to_json(const RenderModel& model);

/**
 * @brief Serialize a depth profile without geometry.
 */
[[nodiscard]] nlohmann::json to_json(const bridgecast::hydraulics::DepthProfile& profile);

}  // namespace bridgecast::render
