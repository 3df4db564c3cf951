/**
 * @file main.cpp
 * @brief bridgecast single-forecast cross-section command-line entrypoint.
 * @author Watosn
 */

#include <cstdlib>
#include <string>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "bridgecast/forecast/forecast_input.hpp"
#include "bridgecast/hydraulics/depth_profiler.hpp"
#include "bridgecast/records/caching_provider.hpp"
#include "bridgecast/records/json_directory_provider.hpp"
#include "bridgecast/render/cross_section.hpp"
#include "bridgecast/render/render_json.hpp"

namespace {

bool looks_like_url(const std::string& arg) { return arg.find('?') != std::string::npos; }

}  // namespace

int main(int argc, char** argv) {
  const bool url_mode = argc >= 2 && looks_like_url(argv[1]);
  const int first_opt = url_mode ? 2 : 4;
  if (argc < first_opt || argc > first_opt + 3) {
    spdlog::error("usage: bridge_xs_cli <uuid> <list_flows> <first_utc_time> [record_root] [warning_margin] [depth_resolution]");
    spdlog::error("   or: bridge_xs_cli <request_url> [record_root] [warning_margin] [depth_resolution]");
    spdlog::error("request_url query: uuid=<uuid>&list_flows=<q0,...,q17>&first_utc_time=<iso8601>");
    spdlog::error("record_root defaults to $PATH_TO_BRIDGE_JSONS");
    return 1;
  }

  const char* env_root = std::getenv("PATH_TO_BRIDGE_JSONS");
  const std::string record_root = (argc > first_opt) ? argv[first_opt] : (env_root != nullptr ? env_root : "");
  const double warning_margin =
      (argc > first_opt + 1) ? std::atof(argv[first_opt + 1]) : bridgecast::hydraulics::kDefaultWarningMargin;
  const double depth_resolution = (argc > first_opt + 2) ? std::atof(argv[first_opt + 2]) : 0.1;
  if (record_root.empty()) {
    spdlog::error("no record root given and PATH_TO_BRIDGE_JSONS is not set");
    return 1;
  }

  const auto parsed = url_mode ? bridgecast::forecast::parse_forecast_url(argv[1])
                               : bridgecast::forecast::parse_forecast_request(argv[1], argv[2], argv[3]);
  if (parsed.status != bridgecast::core::Status::Ok) {
    spdlog::error("invalid forecast request: {} ({})", bridgecast::core::to_string(parsed.status),
                  bridgecast::forecast::describe(parsed.error));
    return 2;
  }

  const auto directory = bridgecast::records::JsonDirectoryBridgeProvider::Create(
      bridgecast::records::JsonDirectoryBridgeProvider::Config{.root = record_root});
  const bridgecast::records::CachingBridgeProvider provider(*directory);
  const bridgecast::hydraulics::ForecastDepthProfiler profiler(
      provider, bridgecast::hydraulics::ForecastDepthProfiler::Config{
                    .thresholds = {.warning_margin = warning_margin}, .depth_resolution = depth_resolution});

  const auto profile = profiler.profile(parsed.request);
  if (profile.status != bridgecast::core::Status::Ok) {
    spdlog::error("profile failed for {}: {}", parsed.request.bridge_uuid, bridgecast::core::to_string(profile.status));
    return 3;
  }

  const auto lookup = provider.get(parsed.request.bridge_uuid);
  if (lookup.status != bridgecast::core::Status::Ok) {
    spdlog::error("bridge record lookup failed: {}", bridgecast::core::to_string(lookup.status));
    return 3;
  }
  const auto model = bridgecast::render::assemble(*lookup.record, profile);
  if (model.status != bridgecast::core::Status::Ok) {
    spdlog::error("cross-section assembly failed: {}", bridgecast::core::to_string(model.status));
    return 4;
  }

  fmt::print("{}\n", bridgecast::render::to_json(model).dump(2));
  return 0;
}
