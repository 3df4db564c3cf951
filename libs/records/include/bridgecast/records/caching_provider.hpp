/**
 * @file caching_provider.hpp
 * @brief Memoizing decorator for bridge record providers.
 * @author Watosn
 */
#pragma once

#include <cstddef>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include "bridgecast/core/interfaces.hpp"

namespace bridgecast::records {

/**
 * @brief Caches successful lookups of an upstream provider.
 *
 * Records are cached indefinitely once loaded, keyed by the lowercase identifier, which is also
 * what the upstream provider is asked for. Concurrent misses for the same identifier share a
 * single upstream fetch; callers that arrive while it runs receive its outcome. Failed lookups
 * are not cached, and any exception thrown by the upstream is reported as `ProviderUnavailable`.
 */
class CachingBridgeProvider final : public bridgecast::core::IBridgeRecordProvider {
 public:
  /**
   * @brief Wrap an upstream provider. `upstream` must outlive this object.
   */
  explicit CachingBridgeProvider(const bridgecast::core::IBridgeRecordProvider& upstream) : upstream_(upstream) {}

  [[nodiscard]] bridgecast::core::BridgeLookup get(std::string_view uuid) const override;

  /**
   * @brief Number of records currently cached.
   */
  [[nodiscard]] std::size_t size() const;

 private:
  const bridgecast::core::IBridgeRecordProvider& upstream_;
  mutable std::mutex mutex_{};
  mutable std::unordered_map<std::string, std::shared_ptr<const bridgecast::core::BridgeRecord>> cache_{};
  mutable std::unordered_map<std::string, std::shared_future<bridgecast::core::BridgeLookup>> in_flight_{};
};

}  // namespace bridgecast::records
