/**
 * @file record_parser.cpp
 * @brief Bridge record JSON decoding implementation.
 * @author Watosn
 */

#include "bridgecast/records/record_parser.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstddef>
#include <stdexcept>
#include <utility>
#include <vector>

#include <fmt/format.h>

namespace bridgecast::records {
namespace {

using nlohmann::json;

struct DecodeError : std::runtime_error {
  using std::runtime_error::runtime_error;
};

const json& require(const json& doc, const char* key) {
  const auto it = doc.find(key);
  if (it == doc.end() || it->is_null()) {
    throw DecodeError(fmt::format("missing field '{}'", key));
  }
  return *it;
}

std::string text_value(const json& v) {
  if (v.is_string()) {
    return v.get<std::string>();
  }
  if (v.is_number_integer() || v.is_number_unsigned()) {
    return v.dump();
  }
  if (v.is_number()) {
    return fmt::format("{}", v.get<double>());
  }
  throw DecodeError(fmt::format("expected text, got {}", v.type_name()));
}

std::string optional_text(const json& doc, const char* key) {
  const auto it = doc.find(key);
  if (it == doc.end() || it->is_null()) {
    return {};
  }
  return text_value(*it);
}

// Legacy exports store lists as Python literals inside strings, tuples included.
json list_value(const json& v, const char* key) {
  if (v.is_array()) {
    return v;
  }
  if (!v.is_string()) {
    throw DecodeError(fmt::format("field '{}' is not a list", key));
  }
  std::string text = v.get<std::string>();
  std::replace(text.begin(), text.end(), '(', '[');
  std::replace(text.begin(), text.end(), ')', ']');
  json parsed = json::parse(text, nullptr, false);
  if (parsed.is_discarded() || !parsed.is_array()) {
    throw DecodeError(fmt::format("field '{}' is not a list literal", key));
  }
  return parsed;
}

std::vector<double> number_list(const json& v, const char* key) {
  const json list = list_value(v, key);
  std::vector<double> out;
  out.reserve(list.size());
  for (const auto& item : list) {
    if (!item.is_number()) {
      throw DecodeError(fmt::format("field '{}' holds a non-numeric value", key));
    }
    out.push_back(item.get<double>());
  }
  return out;
}

bridgecast::core::RatingCurve rating_list(const json& v, const char* key) {
  const json list = list_value(v, key);
  bridgecast::core::RatingCurve out;
  out.reserve(list.size());
  for (const auto& item : list) {
    if (item.is_array() && item.size() == 2U && item[0].is_number() && item[1].is_number()) {
      out.push_back(bridgecast::core::RatingPoint{.flow = item[0].get<double>(), .depth = item[1].get<double>()});
    } else if (item.is_object()) {
      out.push_back(bridgecast::core::RatingPoint{.flow = require(item, "flow").get<double>(),
                                                  .depth = require(item, "depth").get<double>()});
    } else {
      throw DecodeError(fmt::format("field '{}' holds a malformed rating point", key));
    }
  }
  return out;
}

std::vector<bridgecast::core::StationElevation> zip_geometry(const std::vector<double>& station,
                                                             const std::vector<double>& elevation) {
  if (station.size() != elevation.size()) {
    throw DecodeError(fmt::format("station/elevation length mismatch ({} vs {})", station.size(), elevation.size()));
  }
  std::vector<bridgecast::core::StationElevation> out;
  out.reserve(station.size());
  for (std::size_t i = 0; i < station.size(); ++i) {
    out.push_back(bridgecast::core::StationElevation{.station = station[i], .elevation = elevation[i]});
  }
  return out;
}

double lowest(const std::vector<double>& values, const char* key) {
  if (values.empty()) {
    throw DecodeError(fmt::format("field '{}' is empty", key));
  }
  return *std::min_element(values.begin(), values.end());
}

bridgecast::core::BridgeRecord decode_native(const json& doc) {
  bridgecast::core::BridgeRecord r{};
  r.uuid = text_value(require(doc, "uuid"));
  r.reach_id = optional_text(doc, "reach_id");

  const json& geometry = require(doc, "geometry");
  r.geometry = zip_geometry(number_list(require(geometry, "station"), "station"),
                            number_list(require(geometry, "ground_elevation"), "ground_elevation"));
  if (geometry.contains("deck_elevation")) {
    r.deck_profile = number_list(geometry.at("deck_elevation"), "deck_elevation");
  }
  if (geometry.contains("low_chord_elevation")) {
    r.low_chord_profile = number_list(geometry.at("low_chord_elevation"), "low_chord_elevation");
  }
  r.rating_curve = rating_list(require(doc, "rating_curve"), "rating_curve");

  r.low_chord_elevation = doc.contains("low_chord_elevation")
                              ? require(doc, "low_chord_elevation").get<double>()
                              : lowest(r.low_chord_profile, "low_chord_elevation");
  r.deck_elevation = doc.contains("deck_elevation") ? require(doc, "deck_elevation").get<double>()
                                                    : lowest(r.deck_profile, "deck_elevation");

  if (doc.contains("annotations")) {
    const json& a = doc.at("annotations");
    r.annotations = bridgecast::core::BridgeAnnotations{.title = optional_text(a, "title"),
                                                        .lat_long = optional_text(a, "lat_long"),
                                                        .nbi = optional_text(a, "nbi"),
                                                        .comid = optional_text(a, "comid")};
  }
  return r;
}

std::string comid_from_annotation(const std::string& anno) {
  const auto pos = anno.find_last_of(" :");
  std::string id = (pos == std::string::npos) ? anno : anno.substr(pos + 1U);
  const bool numeric = !id.empty() && std::all_of(id.begin(), id.end(), [](unsigned char c) { return std::isdigit(c) != 0; });
  return numeric ? id : std::string{};
}

bridgecast::core::BridgeRecord decode_legacy(const json& doc) {
  bridgecast::core::BridgeRecord r{};
  r.uuid = text_value(require(doc, "uuid"));
  r.geometry = zip_geometry(number_list(require(doc, "sta"), "sta"), number_list(require(doc, "ground_elv"), "ground_elv"));
  if (doc.contains("deck_elev")) {
    r.deck_profile = number_list(doc.at("deck_elev"), "deck_elev");
  }
  if (doc.contains("low_ch_elv")) {
    r.low_chord_profile = number_list(doc.at("low_ch_elv"), "low_ch_elv");
  }
  r.rating_curve = rating_list(require(doc, "hand_r"), "hand_r");
  r.low_chord_elevation = doc.contains("min_low_ch") ? require(doc, "min_low_ch").get<double>()
                                                     : lowest(r.low_chord_profile, "low_ch_elv");
  r.deck_elevation = lowest(r.deck_profile, "deck_elev");

  r.annotations = bridgecast::core::BridgeAnnotations{.title = optional_text(doc, "anno_xs_title"),
                                                      .lat_long = optional_text(doc, "anno_latlong"),
                                                      .nbi = optional_text(doc, "anno_nbi"),
                                                      .comid = optional_text(doc, "anno_comid")};
  r.reach_id = doc.contains("feature_id") ? optional_text(doc, "feature_id") : comid_from_annotation(r.annotations.comid);
  return r;
}

bool is_hex(char c) { return std::isxdigit(static_cast<unsigned char>(c)) != 0; }

}  // namespace

bool is_canonical_uuid(std::string_view text) {
  if (text.size() != 36U) {
    return false;
  }
  for (std::size_t i = 0; i < text.size(); ++i) {
    if (i == 8U || i == 13U || i == 18U || i == 23U) {
      if (text[i] != '-') {
        return false;
      }
    } else if (!is_hex(text[i])) {
      return false;
    }
  }
  return true;
}

bridgecast::core::Status validate_bridge_record(const bridgecast::core::BridgeRecord& record, std::string* message) {
  const auto fail = [&](std::string why) {
    if (message != nullptr) {
      *message = std::move(why);
    }
    return bridgecast::core::Status::InvalidRecord;
  };

  if (record.uuid.empty()) {
    return fail("empty uuid");
  }
  if (record.geometry.empty()) {
    return fail("empty cross-section geometry");
  }
  for (std::size_t i = 0; i < record.geometry.size(); ++i) {
    const auto& p = record.geometry[i];
    if (!std::isfinite(p.station) || p.station < 0.0 || !std::isfinite(p.elevation)) {
      return fail(fmt::format("invalid geometry sample {}", i));
    }
    if (i > 0U && !(p.station > record.geometry[i - 1U].station)) {
      return fail(fmt::format("station not increasing at sample {}", i));
    }
  }
  const auto check_profile = [&](const std::vector<double>& profile) -> bool {
    if (profile.empty()) {
      return true;
    }
    if (profile.size() != record.geometry.size()) {
      return false;
    }
    return std::all_of(profile.begin(), profile.end(), [](double v) { return std::isfinite(v); });
  };
  if (!check_profile(record.deck_profile)) {
    return fail("deck profile not aligned with geometry");
  }
  if (!check_profile(record.low_chord_profile)) {
    return fail("low chord profile not aligned with geometry");
  }

  if (record.rating_curve.empty()) {
    return fail("empty rating curve");
  }
  for (std::size_t i = 0; i < record.rating_curve.size(); ++i) {
    const auto& p = record.rating_curve[i];
    if (!std::isfinite(p.flow) || !std::isfinite(p.depth) || p.flow < 0.0 || p.depth < 0.0) {
      return fail(fmt::format("invalid rating sample {}", i));
    }
    if (i > 0U) {
      const auto& prev = record.rating_curve[i - 1U];
      if (!(p.flow > prev.flow)) {
        return fail(fmt::format("rating flow not increasing at sample {}", i));
      }
      if (p.depth < prev.depth) {
        return fail(fmt::format("rating depth decreasing at sample {}", i));
      }
    }
  }
  if (!std::isfinite(record.low_chord_elevation) || !std::isfinite(record.deck_elevation)) {
    return fail("non-finite structural elevation");
  }
  return bridgecast::core::Status::Ok;
}

RecordParse decode_bridge_record(const nlohmann::json& doc) {
  if (!doc.is_object()) {
    return RecordParse{.status = bridgecast::core::Status::InvalidRecord, .message = "document is not an object"};
  }
  bridgecast::core::BridgeRecord record{};
  try {
    record = doc.contains("hand_r") ? decode_legacy(doc) : decode_native(doc);
  } catch (const DecodeError& e) {
    return RecordParse{.status = bridgecast::core::Status::InvalidRecord, .message = e.what()};
  } catch (const nlohmann::json::exception& e) {
    return RecordParse{.status = bridgecast::core::Status::InvalidRecord, .message = e.what()};
  }

  std::string why;
  const auto status = validate_bridge_record(record, &why);
  if (status != bridgecast::core::Status::Ok) {
    return RecordParse{.status = status, .message = std::move(why)};
  }
  return RecordParse{.record = std::make_shared<const bridgecast::core::BridgeRecord>(std::move(record))};
}

RecordParse parse_bridge_record(std::string_view json_text) {
  const json doc = json::parse(json_text.begin(), json_text.end(), nullptr, false);
  if (doc.is_discarded()) {
    return RecordParse{.status = bridgecast::core::Status::InvalidRecord, .message = "malformed JSON"};
  }
  return decode_bridge_record(doc);
}

}  // namespace bridgecast::records
