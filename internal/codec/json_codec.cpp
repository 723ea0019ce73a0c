#include "json_codec.hpp"

#include <array>
#include <cmath>
#include <cstdint>
#include <limits>
#include <sstream>
#include <string_view>

#include "internal/model/metadata.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace pmm::codec {

using model::Value;
using model::ValueList;
using model::ValueMap;

namespace {

/*
  JSON has no literal for non-finite reals. The sidecar uses the bare tokens
  NaN, Infinity and -Infinity; nlohmann can neither emit nor parse them, so
  they travel through nlohmann as marker strings that are swapped for the
  bare tokens after dumping and before parsing.
*/
struct NonFiniteToken {
  std::string_view token;
  std::string_view marker;
  double           value;
};

const std::array<NonFiniteToken, 3>& NonFiniteTokens() {
  // -Infinity first so it wins over Infinity when scanning.
  static const std::array<NonFiniteToken, 3> tokens = {{
      {"-Infinity", "\x01-Infinity\x01", -std::numeric_limits<double>::infinity()},
      {"Infinity", "\x01Infinity\x01", std::numeric_limits<double>::infinity()},
      {"NaN", "\x01NaN\x01", std::numeric_limits<double>::quiet_NaN()},
  }};
  return tokens;
}

std::string_view MarkerFor(double value) {
  if (std::isnan(value)) return NonFiniteTokens()[2].marker;
  return value > 0 ? NonFiniteTokens()[1].marker : NonFiniteTokens()[0].marker;
}

// Marker strings as nlohmann dumps them with ensure_ascii: "\u0001NaN\u0001".
std::string EscapedMarker(std::string_view token) {
  return "\"\\u0001" + std::string(token) + "\\u0001\"";
}

std::string ReplaceMarkersWithTokens(std::string text) {
  for (const auto& entry : NonFiniteTokens()) {
    const auto escaped = EscapedMarker(entry.token);
    for (auto pos = text.find(escaped); pos != std::string::npos; pos = text.find(escaped, pos + entry.token.size())) {
      text.replace(pos, escaped.size(), entry.token);
    }
  }
  return text;
}

// Bare NaN / Infinity / -Infinity outside string literals become marker strings.
std::string ReplaceTokensWithMarkers(const std::string& text) {
  std::string out;
  out.reserve(text.size());
  bool in_string = false;
  for (std::size_t i = 0; i < text.size(); ++i) {
    const char c = text[i];
    if (in_string) {
      out.push_back(c);
      if (c == '\\' && i + 1 < text.size()) {
        out.push_back(text[++i]);
      } else if (c == '"') {
        in_string = false;
      }
      continue;
    }
    if (c == '"') {
      in_string = true;
      out.push_back(c);
      continue;
    }
    bool replaced = false;
    for (const auto& entry : NonFiniteTokens()) {
      if (text.compare(i, entry.token.size(), entry.token) == 0) {
        out += EscapedMarker(entry.token);
        i += entry.token.size() - 1;
        replaced = true;
        break;
      }
    }
    if (!replaced) out.push_back(c);
  }
  return out;
}

std::string StripTrailingWhitespace(const std::string& text) {
  std::istringstream in(text);
  std::string        out;
  std::string        line;
  bool               first = true;
  while (std::getline(in, line)) {
    const auto last = line.find_last_not_of(" \t\r");
    line.resize(last == std::string::npos ? 0 : last + 1);
    if (!first) out.push_back('\n');
    first = false;
    out += line;
  }
  return out;
}

} // namespace

nlohmann::ordered_json ToJson(const Value& value) {
  switch (value.kind()) {
    case Value::Kind::kNone:
      return nullptr;
    case Value::Kind::kBool:
      return value.AsBool();
    case Value::Kind::kInt:
      return value.AsInt();
    case Value::Kind::kReal:
      if (!std::isfinite(value.AsReal())) return std::string(MarkerFor(value.AsReal()));
      return value.AsReal();
    case Value::Kind::kString:
      return value.AsString();
    case Value::Kind::kTimestamp:
      // Tag dates are transcoded before emission; anything left (e.g. a stats
      // minimum of a datestamp column) falls back to the default tag format.
      return util::FormatTimePoint(value.AsTimestamp(), std::string(model::kDefaultDateTagFormat));
    case Value::Kind::kList: {
      auto array = nlohmann::ordered_json::array();
      for (const auto& element : value.AsList()) {
        array.push_back(ToJson(element));
      }
      return array;
    }
    case Value::Kind::kMap: {
      auto object = nlohmann::ordered_json::object();
      for (const auto& [key, element] : value.AsMap()) {
        object[key] = ToJson(element);
      }
      return object;
    }
  }
  return nullptr;
}

Value FromJson(const nlohmann::ordered_json& json) {
  switch (json.type()) {
    case nlohmann::ordered_json::value_t::null:
      return Value();
    case nlohmann::ordered_json::value_t::boolean:
      return Value(json.get<bool>());
    case nlohmann::ordered_json::value_t::number_integer:
      return Value(json.get<std::int64_t>());
    case nlohmann::ordered_json::value_t::number_unsigned: {
      const auto unsigned_value = json.get<std::uint64_t>();
      if (unsigned_value > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
        return Value(static_cast<double>(unsigned_value));
      }
      return Value(static_cast<std::int64_t>(unsigned_value));
    }
    case nlohmann::ordered_json::value_t::number_float:
      return Value(json.get<double>());
    case nlohmann::ordered_json::value_t::string: {
      auto text = json.get<std::string>();
      for (const auto& entry : NonFiniteTokens()) {
        if (text == entry.marker) return Value(entry.value);
      }
      return Value(std::move(text));
    }
    case nlohmann::ordered_json::value_t::array: {
      ValueList list;
      list.reserve(json.size());
      for (const auto& element : json) {
        list.push_back(FromJson(element));
      }
      return Value(std::move(list));
    }
    case nlohmann::ordered_json::value_t::object: {
      ValueMap map;
      for (const auto& [key, element] : json.items()) {
        map.Set(key, FromJson(element));
      }
      return Value(std::move(map));
    }
    default:
      throw util::PmmError("Unsupported JSON value in sidecar document");
  }
}

Value ParseJson(const std::string& text) {
  try {
    return FromJson(nlohmann::ordered_json::parse(ReplaceTokensWithMarkers(text)));
  } catch (const nlohmann::ordered_json::exception& e) {
    throw util::PmmError("Invalid sidecar JSON: " + std::string(e.what()));
  }
}

std::string EmitCanonical(const Value& value) {
  try {
    return ReplaceMarkersWithTokens(StripTrailingWhitespace(ToJson(value).dump(4, ' ', true)));
  } catch (const nlohmann::ordered_json::exception& e) {
    throw util::PmmError("Cannot encode sidecar JSON: " + std::string(e.what()));
  }
}

} // namespace pmm::codec
