#include "value.hpp"
#include <algorithm>
#include <charconv>

namespace eure {

text text::plaintext(std::string content)
{
  return text{ std::move(content), language_kind::Plaintext, {} };
}

text text::implicit(std::string content)
{
  return text{ std::move(content), language_kind::Implicit, {} };
}

text text::with_language(std::string content, std::string language)
{
  return text{ std::move(content), language_kind::Other, std::move(language) };
}

std::string_view primitive_kind_name(const primitive &value)
{
  switch (value.index()) {
    case 0:
      return "null";
    case 1:
      return "boolean";
    case 2:
      return "integer";
    case 3:
      return "float";
    default:
      return "text";
  }
}

static std::string quote(std::string_view content)
{
  std::string out = "\"";
  for (const char c: content) {
    if (c == '"' || c == '\\')
      out.push_back('\\');
    out.push_back(c);
  }
  out.push_back('"');
  return out;
}

static std::string format_double(double d)
{
  char buffer[64];
  const auto result = std::to_chars(buffer, buffer + sizeof(buffer), d);
  return std::string(buffer, result.ptr);
}

std::string describe(const primitive &value)
{
  if (std::holds_alternative<null_value>(value))
    return "null";
  if (const auto *b = std::get_if<bool>(&value))
    return *b ? "true" : "false";
  if (const auto *i = std::get_if<std::int64_t>(&value))
    return std::to_string(*i);
  if (const auto *d = std::get_if<double>(&value))
    return format_double(*d);

  const auto &t = std::get<text>(value);
  switch (t.language) {
    case language_kind::Implicit:
      return "`" + t.content + "`";
    case language_kind::Other:
      return t.language_name + "`" + t.content + "`";
    default:
      return quote(t.content);
  }
}

object_key object_key::ident(std::string name)
{
  return object_key{ key_kind::Identifier, std::move(name) };
}

object_key object_key::extension(std::string name)
{
  return object_key{ key_kind::Extension, std::move(name) };
}

object_key object_key::literal(key_literal value)
{
  return object_key{ key_kind::Literal, std::move(value) };
}

std::optional<std::string_view> object_key::field_name() const
{
  if (kind == key_kind::Extension)
    return std::nullopt;
  if (const auto *name = std::get_if<std::string>(&value))
    return std::string_view(*name);
  return std::nullopt;
}

std::string to_string(const key_literal &key)
{
  if (const auto *s = std::get_if<std::string>(&key))
    return quote(*s);
  if (const auto *i = std::get_if<std::int64_t>(&key))
    return std::to_string(*i);
  return std::get<bool>(key) ? "true" : "false";
}

bool is_identifier(std::string_view name)
{
  if (name.empty())
    return false;

  const auto first = static_cast<unsigned char>(name.front());
  if ((first >= '0' && first <= '9') || first == '-' || first == '$')
    return false;

  return std::all_of(name.begin(), name.end(), [](char ch) {
    const auto c = static_cast<unsigned char>(ch);
    // Bytes >= 0x80 belong to multi-byte UTF-8 sequences and are accepted as letters
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '_' || c == '-' || c >= 0x80;
  });
}

const value *value_map::find(const object_key &key) const
{
  for (const auto &entry: entries)
    if (entry.key == key)
      return &entry.val;
  return nullptr;
}

value::value() : content(value_hole{})
{
}

value::value(value_content content) : content(std::move(content))
{
}

bool value::is_hole() const
{
  return std::holds_alternative<value_hole>(content);
}

const primitive *value::as_primitive() const
{
  return std::get_if<primitive>(&content);
}

bool operator==(const value_hole &, const value_hole &)
{
  return true;
}

bool operator==(const value_array &a, const value_array &b)
{
  return a.elements == b.elements;
}

bool operator==(const value_tuple &a, const value_tuple &b)
{
  return a.elements == b.elements;
}

// Keys are unique within one entry list, so equal sizes plus one-way containment is equality
static bool same_entries(const std::vector<value_entry> &a, const std::vector<value_entry> &b)
{
  if (a.size() != b.size())
    return false;

  return std::all_of(a.begin(), a.end(), [&b](const value_entry &entry) {
    const auto match = std::find_if(b.begin(), b.end(), [&entry](const value_entry &other) {
      return other.key == entry.key;
    });
    return match != b.end() && match->val == entry.val;
  });
}

bool operator==(const value_map &a, const value_map &b)
{
  return same_entries(a.entries, b.entries);
}

bool operator==(const value &a, const value &b)
{
  return a.content == b.content && same_entries(a.extensions, b.extensions);
}

bool operator==(const value_entry &a, const value_entry &b)
{
  return a.key == b.key && a.val == b.val;
}

} // namespace eure
