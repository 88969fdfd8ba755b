#pragma once
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace mcpdiff::util::json {

using json = nlohmann::json;

// Parse without throwing; nullopt when `s` is not a complete JSON document
inline std::optional<json> try_parse(const std::string& s)
{
  auto j = json::parse(s, nullptr, /*allow_exceptions=*/false);
  if (j.is_discarded())
    return std::nullopt;
  return j;
}

// Shape name used in human-readable reports. Integers and floats are
// distinguished; signed and unsigned integers are not.
inline std::string shape_name(const json& j)
{
  switch (j.type())
  {
  case json::value_t::object: return "object";
  case json::value_t::array: return "array";
  case json::value_t::string: return "string";
  case json::value_t::boolean: return "boolean";
  case json::value_t::number_integer:
  case json::value_t::number_unsigned: return "integer";
  case json::value_t::number_float: return "float";
  case json::value_t::null: return "null";
  default: return j.type_name();
  }
}

} // namespace mcpdiff::util::json
