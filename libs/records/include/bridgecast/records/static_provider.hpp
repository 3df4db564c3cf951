/**
 * @file static_provider.hpp
 * @brief In-memory bridge record provider.
 * @author Watosn
 */
#pragma once

#include <map>
#include <memory>
#include <string>
#include <utility>

#include "bridgecast/core/interfaces.hpp"
#include "bridgecast/core/uuid.hpp"

namespace bridgecast::records {

/**
 * @brief Fixed record set for testing and deterministic runs.
 */
class StaticBridgeProvider final : public bridgecast::core::IBridgeRecordProvider {
 public:
  StaticBridgeProvider() = default;

  /**
   * @brief Construct provider holding one record.
   */
  explicit StaticBridgeProvider(bridgecast::core::BridgeRecord record) { add(std::move(record)); }

  /**
   * @brief Add or replace a record, keyed by its lowercase uuid. Not safe against concurrent `get`.
   */
  void add(bridgecast::core::BridgeRecord record) {
    auto key = bridgecast::core::normalize_uuid(record.uuid);
    records_[std::move(key)] = std::make_shared<const bridgecast::core::BridgeRecord>(std::move(record));
  }

  [[nodiscard]] bridgecast::core::BridgeLookup get(std::string_view uuid) const override {
    const auto it = records_.find(bridgecast::core::normalize_uuid(uuid));
    if (it == records_.end()) {
      return bridgecast::core::BridgeLookup{.status = bridgecast::core::Status::UnknownBridge};
    }
    return bridgecast::core::BridgeLookup{.record = it->second};
  }

 private:
  std::map<std::string, std::shared_ptr<const bridgecast::core::BridgeRecord>> records_{};
};

}  // namespace bridgecast::records
