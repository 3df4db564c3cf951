/**
 * @file forecast_input.cpp
 * @brief Forecast request parsing implementation.
 * @author Watosn
 */

#include "bridgecast/forecast/forecast_input.hpp"

#include <cctype>
#include <cmath>
#include <cstdlib>
#include <utility>

#include "bridgecast/core/time.hpp"

namespace bridgecast::forecast {
namespace {

std::string_view trim(std::string_view s) {
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front())) != 0) {
    s.remove_prefix(1);
  }
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back())) != 0) {
    s.remove_suffix(1);
  }
  return s;
}

bool parse_number(std::string_view token, double& value) {
  const std::string text(token);
  if (text.empty()) {
    return false;
  }
  char* end = nullptr;
  value = std::strtod(text.c_str(), &end);
  return end != text.c_str() && *end == '\0' && std::isfinite(value);
}

int hex_value(char c) {
  if (c >= '0' && c <= '9') {
    return c - '0';
  }
  if (c >= 'a' && c <= 'f') {
    return c - 'a' + 10;
  }
  if (c >= 'A' && c <= 'F') {
    return c - 'A' + 10;
  }
  return -1;
}

std::string percent_decode(std::string_view s) {
  std::string out;
  out.reserve(s.size());
  for (std::size_t i = 0; i < s.size(); ++i) {
    if (s[i] == '+') {
      out.push_back(' ');
    } else if (s[i] == '%' && i + 2U < s.size() && hex_value(s[i + 1U]) >= 0 && hex_value(s[i + 2U]) >= 0) {
      out.push_back(static_cast<char>(hex_value(s[i + 1U]) * 16 + hex_value(s[i + 2U])));
      i += 2U;
    } else {
      out.push_back(s[i]);
    }
  }
  return out;
}

ForecastParse reject(ForecastInputError error) {
  return ForecastParse{.error = error, .status = bridgecast::core::Status::InvalidForecast};
}

}  // namespace

std::string_view describe(ForecastInputError error) {
  switch (error) {
    case ForecastInputError::None:
      return "ok";
    case ForecastInputError::MissingParameter:
      return "required parameters are missing";
    case ForecastInputError::NonNumericFlow:
      return "non-numeric value in flow list";
    case ForecastInputError::NegativeFlow:
      return "negative value in flow list";
    case ForecastInputError::WrongStepCount:
      return "flow list does not match the forecast step count";
    case ForecastInputError::InvalidTimestamp:
      return "start time is not an ISO-8601 timestamp";
  }
  return "unknown";
}

ForecastInputError parse_flow_list(std::string_view text, std::vector<double>& flows) {
  flows.clear();
  text = trim(text);
  if (text.size() >= 2U && text.front() == '[' && text.back() == ']') {
    text = trim(text.substr(1U, text.size() - 2U));
  }
  if (text.empty()) {
    return ForecastInputError::None;
  }

  while (true) {
    const auto comma = text.find(',');
    const auto token = trim(text.substr(0, comma));
    double value = 0.0;
    if (!parse_number(token, value)) {
      flows.clear();
      return ForecastInputError::NonNumericFlow;
    }
    if (value < 0.0) {
      flows.clear();
      return ForecastInputError::NegativeFlow;
    }
    flows.push_back(value);
    if (comma == std::string_view::npos) {
      break;
    }
    text.remove_prefix(comma + 1U);
  }
  return ForecastInputError::None;
}

ForecastParse parse_forecast_request(std::string_view uuid,
                                     std::string_view flows_text,
                                     std::string_view start_text,
                                     std::size_t expected_steps) {
  uuid = trim(uuid);
  if (uuid.empty() || trim(start_text).empty()) {
    return reject(ForecastInputError::MissingParameter);
  }

  std::vector<double> flows;
  const auto flow_error = parse_flow_list(flows_text, flows);
  if (flow_error != ForecastInputError::None) {
    return reject(flow_error);
  }
  if (flows.empty()) {
    return ForecastParse{.status = bridgecast::core::Status::EmptyForecast};
  }
  if (expected_steps != 0U && flows.size() != expected_steps) {
    return reject(ForecastInputError::WrongStepCount);
  }

  const auto start = bridgecast::core::time::parse_iso8601_utc(start_text);
  if (!start.has_value()) {
    return reject(ForecastInputError::InvalidTimestamp);
  }

  return ForecastParse{.request = bridgecast::core::ForecastRequest{.bridge_uuid = std::string(uuid),
                                                                    .flows = std::move(flows),
                                                                    .start = *start,
                                                                    .step_seconds = bridgecast::core::time::kSecondsPerHour}};
}

std::map<std::string, std::string> parse_query(std::string_view url) {
  std::map<std::string, std::string> out;
  const auto q = url.find('?');
  if (q == std::string_view::npos) {
    return out;
  }
  std::string_view query = url.substr(q + 1U);
  const auto hash = query.find('#');
  if (hash != std::string_view::npos) {
    query = query.substr(0, hash);
  }

  while (!query.empty()) {
    const auto amp = query.find('&');
    const auto pair = query.substr(0, amp);
    if (!pair.empty()) {
      const auto eq = pair.find('=');
      auto key = percent_decode(pair.substr(0, eq));
      auto value = (eq == std::string_view::npos) ? std::string{} : percent_decode(pair.substr(eq + 1U));
      out.emplace(std::move(key), std::move(value));
    }
    if (amp == std::string_view::npos) {
      break;
    }
    query.remove_prefix(amp + 1U);
  }
  return out;
}

ForecastParse parse_forecast_url(std::string_view url, std::size_t expected_steps) {
  const auto query = parse_query(url);
  const auto uuid = query.find("uuid");
  const auto flows = query.find("list_flows");
  const auto start = query.find("first_utc_time");
  if (uuid == query.end() || flows == query.end() || start == query.end()) {
    return reject(ForecastInputError::MissingParameter);
  }
  return parse_forecast_request(uuid->second, flows->second, start->second, expected_steps);
}

}  // namespace bridgecast::forecast
