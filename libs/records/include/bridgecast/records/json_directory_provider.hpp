/**
 * @file json_directory_provider.hpp
 * @brief Bridge record provider backed by one JSON document per bridge.
 * @author Watosn
 */
#pragma once

#include <chrono>
#include <filesystem>
#include <memory>
#include <utility>

#include "bridgecast/core/interfaces.hpp"

namespace bridgecast::records {

/**
 * @brief Reads `<root>/<uuid>.json` from a mounted object store location. File names are the
 *        lowercase identifier; lookups ignore letter case.
 */
class JsonDirectoryBridgeProvider final : public bridgecast::core::IBridgeRecordProvider {
 public:
  /**
   * @brief Directory provider configuration.
   */
  struct Config {
    std::filesystem::path root{};
    int max_attempts{3};                          ///< Read attempts before `ProviderUnavailable`.
    std::chrono::milliseconds retry_backoff{50};  ///< Attempt n waits (n - 1) * backoff first.
  };

  /**
   * @brief Factory helper. An unreadable `root` is reported per lookup as `ProviderUnavailable`.
   */
  static std::unique_ptr<JsonDirectoryBridgeProvider> Create(const Config& config);

  /**
   * @brief Load and validate the record for `uuid`.
   * @return `UnknownBridge` for non-canonical identifiers or missing documents,
   *         `InvalidRecord` for documents that fail validation, `ProviderUnavailable` when reads
   *         keep failing.
   */
  [[nodiscard]] bridgecast::core::BridgeLookup get(std::string_view uuid) const override;

  [[nodiscard]] const Config& config() const { return config_; }

 private:
  explicit JsonDirectoryBridgeProvider(Config config) : config_(std::move(config)) {}

  Config config_{};
};

}  // namespace bridgecast::records
