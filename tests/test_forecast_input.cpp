/**
 * @file test_forecast_input.cpp
 * @brief Forecast request parsing and timestamp tests.
 * @author Watosn
 */

#include <string>
#include <vector>

#include <spdlog/spdlog.h>

#include "bridgecast/core/time.hpp"
#include "bridgecast/forecast/forecast_input.hpp"

namespace {

constexpr const char* kBridge = "9e2c4f61-0b8a-4d37-a5e2-7c1d3b9f8e04";

std::string flow_text(int n) {
  std::string out;
  for (int i = 0; i < n; ++i) {
    out += (i == 0 ? "" : ",") + std::to_string(100 + 10 * i);
  }
  return out;
}

}  // namespace

int main() {
  using namespace bridgecast;
  namespace t = bridgecast::core::time;

  constexpr double kJune1 = 1717200000.0;  // 2024-06-01T00:00:00Z
  const auto z = t::parse_iso8601_utc("2024-06-01T00:00:00Z");
  const auto date_only = t::parse_iso8601_utc("2024-06-01");
  const auto no_zone = t::parse_iso8601_utc("2024-06-01 00:00");
  if (!z || !date_only || !no_zone || z->utc_seconds != kJune1 || date_only->utc_seconds != kJune1 ||
      no_zone->utc_seconds != kJune1) {
    spdlog::error("basic timestamp parse failed");
    return 1;
  }
  const auto plus = t::parse_iso8601_utc("2024-06-01T05:30:00+05:30");
  const auto minus = t::parse_iso8601_utc("2024-05-31T19:00:00-0500");
  const auto frac = t::parse_iso8601_utc("2024-06-01T00:00:00.500Z");
  if (!plus || !minus || !frac || plus->utc_seconds != kJune1 || minus->utc_seconds != kJune1 ||
      frac->utc_seconds != kJune1 + 0.5) {
    spdlog::error("offset or fractional timestamp parse failed");
    return 2;
  }
  for (const char* bad : {"", "2024-13-01", "2023-02-29", "2024-06-01T24:00", "2024-06-01T12", "06/01/2024",
                          "2024-06-01T12:00:00+05:", "2024-06-01T12:00:00Q", "2024-06-01T12:00:00."}) {
    if (t::parse_iso8601_utc(bad).has_value()) {
      spdlog::error("accepted malformed timestamp '{}'", bad);
      return 3;
    }
  }
  if (!t::parse_iso8601_utc("2024-02-29T00:00:00Z")) {
    spdlog::error("leap day rejected");
    return 4;
  }
  if (t::format_iso8601_utc(core::Epoch{.utc_seconds = kJune1 + 13.0 * 3600.0 + 61.0}) != "2024-06-01T13:01:01Z") {
    spdlog::error("timestamp formatting mismatch");
    return 5;
  }

  std::vector<double> flows;
  if (forecast::parse_flow_list("[10, 20.5 ,30]", flows) != forecast::ForecastInputError::None || flows.size() != 3U ||
      flows[1] != 20.5) {
    spdlog::error("bracketed flow list not parsed");
    return 6;
  }
  if (forecast::parse_flow_list("10,abc,30", flows) != forecast::ForecastInputError::NonNumericFlow || !flows.empty() ||
      forecast::parse_flow_list("10,,30", flows) != forecast::ForecastInputError::NonNumericFlow ||
      forecast::parse_flow_list("10,-5,30", flows) != forecast::ForecastInputError::NegativeFlow ||
      forecast::parse_flow_list("10,nan", flows) != forecast::ForecastInputError::NonNumericFlow) {
    spdlog::error("flow list errors misreported");
    return 7;
  }
  if (forecast::parse_flow_list(" [ ] ", flows) != forecast::ForecastInputError::None || !flows.empty()) {
    spdlog::error("empty flow list not accepted as empty");
    return 8;
  }

  const auto ok = forecast::parse_forecast_request(kBridge, flow_text(18), "2024-06-01T00:00:00Z");
  if (ok.status != core::Status::Ok || ok.request.bridge_uuid != kBridge || ok.request.flows.size() != 18U ||
      ok.request.start.utc_seconds != kJune1 || ok.request.step_seconds != 3600.0 || ok.request.flows[17] != 270.0) {
    spdlog::error("forecast request not built");
    return 9;
  }
  const auto short_list = forecast::parse_forecast_request(kBridge, flow_text(17), "2024-06-01T00:00:00Z");
  if (short_list.status != core::Status::InvalidForecast ||
      short_list.error != forecast::ForecastInputError::WrongStepCount) {
    spdlog::error("wrong step count accepted");
    return 10;
  }
  if (forecast::parse_forecast_request(kBridge, flow_text(5), "2024-06-01", 0U).status != core::Status::Ok) {
    spdlog::error("free step count rejected");
    return 11;
  }
  if (forecast::parse_forecast_request(kBridge, "", "2024-06-01").status != core::Status::EmptyForecast) {
    spdlog::error("empty flows not reported as empty forecast");
    return 12;
  }
  const auto bad_time = forecast::parse_forecast_request(kBridge, flow_text(18), "yesterday");
  const auto missing = forecast::parse_forecast_request("", flow_text(18), "2024-06-01");
  if (bad_time.error != forecast::ForecastInputError::InvalidTimestamp || bad_time.status != core::Status::InvalidForecast ||
      missing.error != forecast::ForecastInputError::MissingParameter) {
    spdlog::error("request errors misreported");
    return 13;
  }

  const auto q = forecast::parse_query("https://host/api/xs?uuid=abc&title=Bear+Creek%20Rd&uuid=def#frag");
  if (q.size() != 2U || q.at("uuid") != "abc" || q.at("title") != "Bear Creek Rd") {
    spdlog::error("query decoding failed");
    return 14;
  }

  const std::string url = std::string("/bridge?uuid=") + kBridge + "&list_flows=" + flow_text(18) +
                          "&first_utc_time=2024-06-01T00%3A00%3A00Z";
  const auto from_url = forecast::parse_forecast_url(url);
  if (from_url.status != core::Status::Ok || from_url.request.bridge_uuid != kBridge ||
      from_url.request.start.utc_seconds != kJune1) {
    spdlog::error("url request not parsed: {}", forecast::describe(from_url.error));
    return 15;
  }
  if (forecast::parse_forecast_url("/bridge?uuid=x&list_flows=1").error != forecast::ForecastInputError::MissingParameter) {
    spdlog::error("url with missing start accepted");
    return 16;
  }

  return 0;
}
