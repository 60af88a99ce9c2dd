#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace eure {

enum class language_kind {
  Plaintext, // "quoted string"
  Implicit,  // `code` without a language tag
  Other,     // lang`code`
};

struct text {
  std::string content;
  language_kind language = language_kind::Plaintext;
  std::string language_name; // Only meaningful for language_kind::Other

  static text plaintext(std::string content);
  static text implicit(std::string content);
  static text with_language(std::string content, std::string language);

  bool operator==(const text &) const = default;
};

struct null_value {
  bool operator==(const null_value &) const = default;
};

using primitive = std::variant<null_value, bool, std::int64_t, double, text>;

std::string_view primitive_kind_name(const primitive &value);
std::string describe(const primitive &value);

/// A literal used as a map key
using key_literal = std::variant<std::string, std::int64_t, bool>;

enum class key_kind {
  Identifier,
  Extension,
  Literal,
};

/**
 * @brief Key of a map entry or of a node's extension table
 *
 * Identifier and extension keys hold their name as a string literal.
 * Extension keys live in their own namespace, so `$type` and `type` never
 * address the same entry.
 */
struct object_key {
  key_kind kind = key_kind::Identifier;
  key_literal value;

  static object_key ident(std::string name);
  static object_key extension(std::string name);
  static object_key literal(key_literal value);

  /// Name used to match record fields: identifiers and literal text keys have one
  std::optional<std::string_view> field_name() const;

  bool operator==(const object_key &) const = default;
};

std::string to_string(const key_literal &key);
bool is_identifier(std::string_view name);

struct value;
struct value_entry;

struct value_hole {};

struct value_array {
  std::vector<value> elements;
};

struct value_tuple {
  std::vector<value> elements;
};

struct value_map {
  std::vector<value_entry> entries;

  const value *find(const object_key &key) const;
};

using value_content = std::variant<value_hole, primitive, value_array, value_tuple, value_map>;

/**
 * @brief Self-contained projection of a document subtree
 *
 * Keeps holes, tuples, text languages, key kinds and extensions, so a document
 * rebuilt from a value projects back to an equal value.
 */
struct value {
  value_content content;
  std::vector<value_entry> extensions;

  value();
  value(value_content content);

  bool is_hole() const;
  const primitive *as_primitive() const;
};

struct value_entry {
  object_key key;
  value val;
};

bool operator==(const value_hole &, const value_hole &);
bool operator==(const value_array &a, const value_array &b);
bool operator==(const value_tuple &a, const value_tuple &b);
// Entries compare by key, independent of insertion order
bool operator==(const value_map &a, const value_map &b);
bool operator==(const value &a, const value &b);
bool operator==(const value_entry &a, const value_entry &b);

} // namespace eure
