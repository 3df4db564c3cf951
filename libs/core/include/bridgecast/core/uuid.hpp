/**
 * @file uuid.hpp
 * @brief Bridge identifier normalization.
 * @author Watosn
 */
#pragma once

#include <algorithm>
#include <cctype>
#include <string>
#include <string_view>

namespace bridgecast::core {

/**
 * @brief Lowercase form of a bridge identifier, used for storage keys and cache keys.
 */
inline std::string normalize_uuid(std::string_view uuid) {
  std::string out(uuid);
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

/**
 * @brief Identifier equality ignoring letter case.
 */
inline bool same_uuid(std::string_view a, std::string_view b) {
  return a.size() == b.size() && std::equal(a.begin(), a.end(), b.begin(), [](unsigned char x, unsigned char y) {
           return std::tolower(x) == std::tolower(y);
         });
}

}  // namespace bridgecast::core
