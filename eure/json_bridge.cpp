#include "json_bridge.hpp"
#include <limits>

namespace eure {

static std::string json_key(const object_key &key)
{
  if (const auto *name = std::get_if<std::string>(&key.value))
    return *name;
  if (const auto *i = std::get_if<std::int64_t>(&key.value))
    return std::to_string(*i);
  return std::get<bool>(key.value) ? "true" : "false";
}

static nlohmann::json primitive_to_json(const primitive &p)
{
  if (std::holds_alternative<null_value>(p))
    return nullptr;
  if (const auto *b = std::get_if<bool>(&p))
    return *b;
  if (const auto *i = std::get_if<std::int64_t>(&p))
    return *i;
  if (const auto *d = std::get_if<double>(&p))
    return *d;
  return std::get<text>(p).content;
}

nlohmann::json to_json(const value &v)
{
  if (const auto *p = v.as_primitive())
    return primitive_to_json(*p);

  if (const auto *map = std::get_if<value_map>(&v.content)) {
    auto object = nlohmann::json::object();
    for (const auto &entry: map->entries)
      object[json_key(entry.key)] = to_json(entry.val);
    return object;
  }

  const std::vector<value> *elements = nullptr;
  if (const auto *array = std::get_if<value_array>(&v.content))
    elements = &array->elements;
  else if (const auto *tuple = std::get_if<value_tuple>(&v.content))
    elements = &tuple->elements;

  if (elements) {
    auto array = nlohmann::json::array();
    for (const auto &element: *elements)
      array.push_back(to_json(element));
    return array;
  }
  return nullptr;
}

nlohmann::json to_json(const document &doc)
{
  return to_json(doc.to_value());
}

value value_from_json(const nlohmann::json &j)
{
  switch (j.type()) {
    case nlohmann::json::value_t::null:
      return value{ primitive{ null_value{} } };
    case nlohmann::json::value_t::boolean:
      return value{ primitive{ j.get<bool>() } };
    case nlohmann::json::value_t::number_integer:
      return value{ primitive{ j.get<std::int64_t>() } };
    case nlohmann::json::value_t::number_unsigned:
      // Values beyond int64 keep their magnitude as a float
      if (j.get<std::uint64_t>() > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max()))
        return value{ primitive{ j.get<double>() } };
      return value{ primitive{ static_cast<std::int64_t>(j.get<std::uint64_t>()) } };
    case nlohmann::json::value_t::number_float:
      return value{ primitive{ j.get<double>() } };
    case nlohmann::json::value_t::string:
      return value{ primitive{ text::plaintext(j.get<std::string>()) } };
    case nlohmann::json::value_t::array: {
      value_array array;
      for (const auto &element: j)
        array.elements.push_back(value_from_json(element));
      return value{ std::move(array) };
    }
    case nlohmann::json::value_t::object: {
      value_map map;
      for (const auto &[key, child]: j.items()) {
        auto entry_key = is_identifier(key) ? object_key::ident(key) : object_key::literal(key);
        map.entries.push_back(value_entry{ std::move(entry_key), value_from_json(child) });
      }
      return value{ std::move(map) };
    }
    default:
      return value{};
  }
}

std::expected<std::shared_ptr<const document>, path_error> document_from_json(const nlohmann::json &j)
{
  return document_from_value(value_from_json(j));
}

} // namespace eure
