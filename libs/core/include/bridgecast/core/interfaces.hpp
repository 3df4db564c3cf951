/**
 * @file interfaces.hpp
 * @brief Core provider interfaces.
 * @author Watosn
 */
#pragma once

#include <string_view>

#include "bridgecast/core/types.hpp"

namespace bridgecast::core {

/**
 * @brief Interface for bridge reference-data providers.
 *
 * Implementations must be safe to call concurrently from multiple threads.
 */
class IBridgeRecordProvider {
 public:
  virtual ~IBridgeRecordProvider() = default;
  /**
   * @brief Resolve a bridge identifier to its static record.
   * @param uuid Bridge identifier.
   * @return Lookup with `status` set; `UnknownBridge` when the identifier does not resolve.
   */
  [[nodiscard]] virtual BridgeLookup get(std::string_view uuid) const = 0;
};

}  // namespace bridgecast::core
