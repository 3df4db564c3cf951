/**
 * @file json_directory_provider.cpp
 * @brief JSON directory bridge provider implementation.
 * @author Watosn
 */

#include "bridgecast/records/json_directory_provider.hpp"

#include <algorithm>
#include <fstream>
#include <sstream>
#include <string>
#include <system_error>
#include <thread>

#include <spdlog/spdlog.h>

#include "bridgecast/core/uuid.hpp"
#include "bridgecast/records/record_parser.hpp"

namespace bridgecast::records {
namespace {

enum class ReadOutcome : unsigned char { Ok, Missing, Transient };

ReadOutcome read_document(const std::filesystem::path& root, const std::filesystem::path& path, std::string& text) {
  std::error_code ec;
  if (!std::filesystem::is_directory(root, ec) || ec) {
    return ReadOutcome::Transient;
  }
  const bool exists = std::filesystem::exists(path, ec);
  if (ec) {
    return ReadOutcome::Transient;
  }
  if (!exists) {
    return ReadOutcome::Missing;
  }
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    return ReadOutcome::Transient;
  }
  std::ostringstream ss;
  ss << in.rdbuf();
  if (in.bad()) {
    return ReadOutcome::Transient;
  }
  text = ss.str();
  return ReadOutcome::Ok;
}

}  // namespace

std::unique_ptr<JsonDirectoryBridgeProvider> JsonDirectoryBridgeProvider::Create(const Config& config) {
  return std::unique_ptr<JsonDirectoryBridgeProvider>(new JsonDirectoryBridgeProvider(config));
}

bridgecast::core::BridgeLookup JsonDirectoryBridgeProvider::get(std::string_view uuid) const {
  if (!is_canonical_uuid(uuid)) {
    return bridgecast::core::BridgeLookup{.status = bridgecast::core::Status::UnknownBridge};
  }

  const auto path = config_.root / (bridgecast::core::normalize_uuid(uuid) + ".json");
  const int attempts = std::max(config_.max_attempts, 1);
  for (int attempt = 1; attempt <= attempts; ++attempt) {
    if (attempt > 1) {
      std::this_thread::sleep_for(config_.retry_backoff * (attempt - 1));
    }

    std::string text;
    const auto outcome = read_document(config_.root, path, text);
    if (outcome == ReadOutcome::Missing) {
      return bridgecast::core::BridgeLookup{.status = bridgecast::core::Status::UnknownBridge};
    }
    if (outcome == ReadOutcome::Transient) {
      spdlog::warn("bridge record read failed: {} (attempt {}/{})", path.string(), attempt, attempts);
      continue;
    }

    auto parsed = parse_bridge_record(text);
    if (parsed.status != bridgecast::core::Status::Ok) {
      spdlog::warn("bridge record rejected: {}: {}", path.string(), parsed.message);
      return bridgecast::core::BridgeLookup{.status = parsed.status};
    }
    if (!bridgecast::core::same_uuid(parsed.record->uuid, uuid)) {
      spdlog::warn("bridge record {} declares uuid {}", path.string(), parsed.record->uuid);
      return bridgecast::core::BridgeLookup{.status = bridgecast::core::Status::InvalidRecord};
    }
    return bridgecast::core::BridgeLookup{.record = std::move(parsed.record)};
  }

  spdlog::error("bridge record unavailable after {} attempts: {}", attempts, path.string());
  return bridgecast::core::BridgeLookup{.status = bridgecast::core::Status::ProviderUnavailable};
}

}  // namespace bridgecast::records
