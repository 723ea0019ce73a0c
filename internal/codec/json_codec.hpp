#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include "internal/model/value.hpp"

namespace pmm::codec {

/*
  Canonical JSON form of the wire structure.

  Layout is fixed so that logically identical documents are byte-identical:
  4-space indentation, ": " between key and value, keys in map order,
  non-ASCII escaped as \uXXXX, trailing whitespace stripped from every line
  and no final newline.
*/

nlohmann::ordered_json ToJson(const model::Value& value);
model::Value           FromJson(const nlohmann::ordered_json& json);

// Throws util::PmmError on malformed text.
model::Value ParseJson(const std::string& text);

std::string EmitCanonical(const model::Value& value);

} // namespace pmm::codec
