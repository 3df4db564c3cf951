/**
 * @file forecast_input.hpp
 * @brief Parsing of forecast requests from their text form.
 * @author Watosn
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <vector>

#include "bridgecast/core/types.hpp"

namespace bridgecast::forecast {

/// Steps in the National Water Model short-range forecast.
inline constexpr std::size_t kShortRangeForecastSteps = 18;

/**
 * @brief Reason a forecast request was rejected.
 */
enum class ForecastInputError : std::uint8_t {
  None,
  MissingParameter,
  NonNumericFlow,
  NegativeFlow,
  WrongStepCount,
  InvalidTimestamp,
};

/**
 * @brief Human-readable description of an input error.
 */
[[nodiscard]] std::string_view describe(ForecastInputError error);

/**
 * @brief Parsing outcome; `request` is populated only when `status` is Ok.
 */
struct ForecastParse {
  bridgecast::core::ForecastRequest request{};
  ForecastInputError error{ForecastInputError::None};
  bridgecast::core::Status status{bridgecast::core::Status::Ok};
};

/**
 * @brief Parse comma-separated flows, optionally wrapped in brackets.
 * @param text Flow list such as `10,20,30` or `[10, 20, 30]`.
 * @param flows Output flows in input order.
 * @return Error kind; `None` on success. An empty list parses to no flows.
 */
[[nodiscard]] ForecastInputError parse_flow_list(std::string_view text, std::vector<double>& flows);

/**
 * @brief Build a forecast request from its three text fields.
 * @param uuid Bridge identifier.
 * @param flows_text Comma-separated flows.
 * @param start_text ISO-8601 time of the first step.
 * @param expected_steps Required flow count; 0 accepts any non-empty count.
 * @return `EmptyForecast` for an empty flow list, `InvalidForecast` for any other input error.
 */
[[nodiscard]] ForecastParse parse_forecast_request(std::string_view uuid,
                                                   std::string_view flows_text,
                                                   std::string_view start_text,
                                                   std::size_t expected_steps = kShortRangeForecastSteps);

/**
 * @brief Decode the query component of a URL into key/value pairs (first value wins).
 */
[[nodiscard]] std::map<std::string, std::string> parse_query(std::string_view url);

/**
 * @brief Build a forecast request from a URL carrying `uuid`, `list_flows` and `first_utc_time`.
 */
[[nodiscard]] ForecastParse parse_forecast_url(std::string_view url,
                                               std::size_t expected_steps = kShortRangeForecastSteps);

}  // namespace bridgecast::forecast
