/**
 * @file profile_batch_cli.cpp
 * @brief Batch forecast depth profiles across many bridges, CSV in and out.
 * @author Watosn
 */

#include <algorithm>
#include <atomic>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "bridgecast/core/time.hpp"
#include "bridgecast/forecast/forecast_input.hpp"
#include "bridgecast/hydraulics/depth_profiler.hpp"
#include "bridgecast/records/caching_provider.hpp"
#include "bridgecast/records/json_directory_provider.hpp"

namespace {

struct BatchRow {
  std::size_t line_no{};
  std::string uuid{};
  std::string start_text{};
  std::string flows_text{};
};

bool split_row(const std::string& line, std::size_t line_no, BatchRow& out) {
  const auto c1 = line.find(',');
  if (c1 == std::string::npos) {
    return false;
  }
  const auto c2 = line.find(',', c1 + 1U);
  if (c2 == std::string::npos) {
    return false;
  }
  out.line_no = line_no;
  out.uuid = line.substr(0, c1);
  out.start_text = line.substr(c1 + 1U, c2 - c1 - 1U);
  out.flows_text = line.substr(c2 + 1U);
  return true;
}

}  // namespace

int main(int argc, char** argv) {
  if (argc < 3 || argc > 6) {
    spdlog::error("usage: bridge_profile_batch_cli <input_csv> <output_csv> [record_root] [threads] [warning_margin]");
    spdlog::error("input row: uuid,first_utc_time,flow_0,...,flow_n");
    spdlog::error("record_root defaults to $PATH_TO_BRIDGE_JSONS");
    return 1;
  }

  const std::filesystem::path input_csv = argv[1];
  const std::filesystem::path output_csv = argv[2];
  const char* env_root = std::getenv("PATH_TO_BRIDGE_JSONS");
  const std::string record_root = (argc >= 4) ? argv[3] : (env_root != nullptr ? env_root : "");
  const int threads = (argc >= 5) ? std::max(1, std::atoi(argv[4])) : 4;
  const double warning_margin = (argc >= 6) ? std::atof(argv[5]) : bridgecast::hydraulics::kDefaultWarningMargin;
  if (record_root.empty()) {
    spdlog::error("no record root given and PATH_TO_BRIDGE_JSONS is not set");
    return 1;
  }

  std::ifstream in(input_csv);
  if (!in) {
    spdlog::error("failed to open input csv: {}", input_csv.string());
    return 2;
  }
  std::ofstream out(output_csv);
  if (!out) {
    spdlog::error("failed to open output csv: {}", output_csv.string());
    return 3;
  }

  std::vector<BatchRow> rows;
  std::string line;
  std::size_t line_no = 0;
  while (std::getline(in, line)) {
    ++line_no;
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    if (line.empty()) {
      continue;
    }
    BatchRow row{};
    if (!split_row(line, line_no, row)) {
      spdlog::warn("skipping malformed row {}", line_no);
      continue;
    }
    if (line_no == 1 && row.uuid == "uuid") {
      continue;
    }
    rows.push_back(std::move(row));
  }

  const auto directory = bridgecast::records::JsonDirectoryBridgeProvider::Create(
      bridgecast::records::JsonDirectoryBridgeProvider::Config{.root = record_root});
  const bridgecast::records::CachingBridgeProvider provider(*directory);
  const bridgecast::hydraulics::ForecastDepthProfiler profiler(
      provider, bridgecast::hydraulics::ForecastDepthProfiler::Config{.thresholds = {.warning_margin = warning_margin}});

  std::vector<bridgecast::hydraulics::DepthProfile> results(rows.size());
  std::atomic<std::size_t> next{0};
  const auto worker = [&]() {
    for (std::size_t i = next.fetch_add(1); i < rows.size(); i = next.fetch_add(1)) {
      const auto& row = rows[i];
      const auto parsed = bridgecast::forecast::parse_forecast_request(row.uuid, row.flows_text, row.start_text, 0U);
      if (parsed.status != bridgecast::core::Status::Ok) {
        results[i] = bridgecast::hydraulics::DepthProfile{.bridge_uuid = row.uuid, .status = parsed.status};
        continue;
      }
      results[i] = profiler.profile(parsed.request);
    }
  };

  const std::size_t hardware = std::max(1U, std::thread::hardware_concurrency());
  const std::size_t workers =
      std::min({static_cast<std::size_t>(threads), hardware, std::max<std::size_t>(rows.size(), 1U)});
  if (workers < static_cast<std::size_t>(threads)) {
    spdlog::info("using {} worker threads ({} requested)", workers, threads);
  }
  std::vector<std::thread> pool;
  pool.reserve(workers);
  for (std::size_t t = 0; t < workers; ++t) {
    pool.emplace_back(worker);
  }
  for (auto& t : pool) {
    t.join();
  }

  out << "uuid,step,utc_time,flow,depth,water_surface_elevation,risk,status\n";
  std::size_t failed = 0;
  for (std::size_t i = 0; i < rows.size(); ++i) {
    const auto& p = results[i];
    if (p.status != bridgecast::core::Status::Ok) {
      ++failed;
      spdlog::warn("row {} ({}) failed: {}", rows[i].line_no, rows[i].uuid, bridgecast::core::to_string(p.status));
      out << fmt::format("{},-1,,,,,,{}\n", rows[i].uuid, bridgecast::core::to_string(p.status));
      continue;
    }
    for (std::size_t s = 0; s < p.points.size(); ++s) {
      const auto& pt = p.points[s];
      out << fmt::format("{},{},{},{:.6f},{:.6f},{:.6f},{},{}\n", p.bridge_uuid, s,
                         bridgecast::core::time::format_iso8601_utc(pt.epoch), pt.flow, pt.depth,
                         pt.water_surface_elevation, bridgecast::core::to_string(pt.risk),
                         bridgecast::core::to_string(p.status));
    }
  }

  spdlog::info("wrote {} profiles ({} failed, {} bridges cached): {}", rows.size(), failed, provider.size(),
               output_csv.string());
  return 0;
}
