/**
 * @file record_parser.hpp
 * @brief Bridge record JSON decoding and validation.
 * @author Watosn
 */
#pragma once

#include <memory>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "bridgecast/core/types.hpp"

namespace bridgecast::records {

/**
 * @brief Decoding outcome. `message` describes the first problem found when `status` is not Ok.
 */
struct RecordParse {
  std::shared_ptr<const bridgecast::core::BridgeRecord> record{};
  bridgecast::core::Status status{bridgecast::core::Status::Ok};
  std::string message{};
};

/**
 * @brief True for a canonical 8-4-4-4-12 hexadecimal UUID.
 */
[[nodiscard]] bool is_canonical_uuid(std::string_view text);

/**
 * @brief Check record invariants: non-empty geometry with finite, non-negative, strictly
 *        increasing stations; aligned deck/low-chord profiles; non-empty rating curve with
 *        non-negative strictly increasing flows and non-decreasing depths.
 * @param record Record to check.
 * @param message Optional sink for the first violation.
 */
[[nodiscard]] bridgecast::core::Status validate_bridge_record(const bridgecast::core::BridgeRecord& record,
                                                              std::string* message = nullptr);

/**
 * @brief Decode and validate a bridge record document.
 *
 * Both the native layout and the legacy catalog export (`sta`, `ground_elv`, `hand_r`, ...) are
 * accepted.
 */
[[nodiscard]] RecordParse decode_bridge_record(const nlohmann::json& doc);

/**
 * @brief Parse JSON text and decode it as a bridge record.
 */
[[nodiscard]] RecordParse parse_bridge_record(std::string_view json_text);

}  // namespace bridgecast::records
