/**
 * @file caching_provider.cpp
 * @brief Single-flight caching provider implementation.
 * @author Watosn
 */

#include "bridgecast/records/caching_provider.hpp"

#include <exception>
#include <utility>

#include <spdlog/spdlog.h>

#include "bridgecast/core/uuid.hpp"

namespace bridgecast::records {

bridgecast::core::BridgeLookup CachingBridgeProvider::get(std::string_view uuid) const {
  const std::string key = bridgecast::core::normalize_uuid(uuid);
  std::promise<bridgecast::core::BridgeLookup> promise;
  {
    std::unique_lock<std::mutex> lock(mutex_);
    const auto hit = cache_.find(key);
    if (hit != cache_.end()) {
      return bridgecast::core::BridgeLookup{.record = hit->second};
    }
    const auto pending = in_flight_.find(key);
    if (pending != in_flight_.end()) {
      auto shared = pending->second;
      lock.unlock();
      return shared.get();
    }
    in_flight_.emplace(key, promise.get_future().share());
  }

  bridgecast::core::BridgeLookup result{};
  try {
    spdlog::debug("fetching bridge record {}", key);
    result = upstream_.get(key);
  } catch (const std::exception& e) {
    spdlog::error("bridge record fetch for {} threw: {}", key, e.what());
    result = bridgecast::core::BridgeLookup{.status = bridgecast::core::Status::ProviderUnavailable};
  } catch (...) {
    spdlog::error("bridge record fetch for {} threw a non-standard exception", key);
    result = bridgecast::core::BridgeLookup{.status = bridgecast::core::Status::ProviderUnavailable};
  }
  if (result.status == bridgecast::core::Status::Ok && !result.record) {
    result.status = bridgecast::core::Status::ProviderUnavailable;
  }

  {
    const std::lock_guard<std::mutex> lock(mutex_);
    if (result.status == bridgecast::core::Status::Ok) {
      cache_.emplace(key, result.record);
    }
    in_flight_.erase(key);
  }
  promise.set_value(result);
  return result;
}

std::size_t CachingBridgeProvider::size() const {
  const std::lock_guard<std::mutex> lock(mutex_);
  return cache_.size();
}

}  // namespace bridgecast::records
