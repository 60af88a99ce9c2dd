#include "path.hpp"
#include <charconv>

namespace eure {

path_segment segment_for(const object_key &key)
{
  switch (key.kind) {
    case key_kind::Identifier:
      return ident_segment{ std::get<std::string>(key.value) };
    case key_kind::Extension:
      return extension_segment{ std::get<std::string>(key.value) };
    default:
      return key_segment{ key.value };
  }
}

eure_path::eure_path(std::vector<path_segment> segments) : segments_(std::move(segments))
{
}

eure_path eure_path::child(path_segment segment) const
{
  eure_path result = *this;
  result.segments_.push_back(std::move(segment));
  return result;
}

void eure_path::push(path_segment segment)
{
  segments_.push_back(std::move(segment));
}

void eure_path::pop()
{
  if (!segments_.empty())
    segments_.pop_back();
}

std::string eure_path::to_string() const
{
  if (segments_.empty())
    return "(root)";

  std::string out;
  bool first = true;
  for (const auto &segment: segments_) {
    if (const auto *array = std::get_if<array_index_segment>(&segment)) {
      out += array->index ? "[" + std::to_string(*array->index) + "]" : "[]";
      first = false;
      continue;
    }

    if (!first)
      out += '.';
    first = false;

    if (const auto *ident = std::get_if<ident_segment>(&segment))
      out += ident->name;
    else if (const auto *ext = std::get_if<extension_segment>(&segment))
      out += "$" + ext->name;
    else if (const auto *key = std::get_if<key_segment>(&segment))
      out += eure::to_string(key->key);
    else
      out += "#" + std::to_string(std::get<tuple_index_segment>(segment).index);
  }
  return out;
}

static bool is_name_char(char c)
{
  return c != '.' && c != '[' && c != ']' && c != '"' && c != '#' && c != '$' && c != ' ';
}

static std::string_view take_name(std::string_view text, size_t &pos)
{
  const size_t start = pos;
  while (pos < text.size() && is_name_char(text[pos]))
    ++pos;
  return text.substr(start, pos - start);
}

std::expected<eure_path, std::string> eure_path::parse(std::string_view text)
{
  eure_path path;
  if (text.empty() || text == "(root)")
    return path;

  size_t pos             = 0;
  bool expecting_segment = true;
  while (pos < text.size()) {
    const char c = text[pos];

    if (c == '[') {
      const size_t close = text.find(']', pos);
      if (close == std::string_view::npos)
        return std::unexpected("Unterminated array index at offset " + std::to_string(pos));
      const auto digits = text.substr(pos + 1, close - pos - 1);
      if (digits.empty()) {
        path.push(array_index_segment{});
      } else {
        size_t index      = 0;
        const auto result = std::from_chars(digits.data(), digits.data() + digits.size(), index);
        if (result.ec != std::errc() || result.ptr != digits.data() + digits.size())
          return std::unexpected("Invalid array index '" + std::string(digits) + "'");
        path.push(array_index_segment{ index });
      }
      pos               = close + 1;
      expecting_segment = false;
      continue;
    }

    if (!expecting_segment) {
      if (c != '.')
        return std::unexpected("Expected '.' at offset " + std::to_string(pos));
      ++pos;
      expecting_segment = true;
      continue;
    }

    if (c == '$') {
      ++pos;
      const auto name = take_name(text, pos);
      if (name.empty())
        return std::unexpected("Empty extension name at offset " + std::to_string(pos));
      path.push(extension_segment{ std::string(name) });
    } else if (c == '"') {
      std::string content;
      ++pos;
      bool closed = false;
      while (pos < text.size()) {
        char ch = text[pos++];
        if (ch == '\\' && pos < text.size()) {
          content.push_back(text[pos++]);
        } else if (ch == '"') {
          closed = true;
          break;
        } else {
          content.push_back(ch);
        }
      }
      if (!closed)
        return std::unexpected(std::string("Unterminated quoted key"));
      path.push(key_segment{ std::move(content) });
    } else if (c == '#') {
      ++pos;
      const auto digits = take_name(text, pos);
      unsigned index    = 0;
      const auto result = std::from_chars(digits.data(), digits.data() + digits.size(), index);
      if (digits.empty() || result.ec != std::errc() || result.ptr != digits.data() + digits.size() || index > 255)
        return std::unexpected("Invalid tuple index '" + std::string(digits) + "'");
      path.push(tuple_index_segment{ static_cast<std::uint8_t>(index) });
    } else {
      const auto name = take_name(text, pos);
      if (name.empty())
        return std::unexpected("Empty segment at offset " + std::to_string(pos));

      std::int64_t number = 0;
      const auto result   = std::from_chars(name.data(), name.data() + name.size(), number);
      if (result.ec == std::errc() && result.ptr == name.data() + name.size())
        path.push(key_segment{ number });
      else if (is_identifier(name))
        path.push(ident_segment{ std::string(name) });
      else
        return std::unexpected("Invalid identifier '" + std::string(name) + "'");
    }
    expecting_segment = false;
  }

  if (expecting_segment)
    return std::unexpected(std::string("Path ends with '.'"));
  return path;
}

} // namespace eure
