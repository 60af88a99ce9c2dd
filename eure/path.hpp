#pragma once

#include "value.hpp"
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace eure {

struct ident_segment {
  std::string name;
  bool operator==(const ident_segment &) const = default;
};

struct extension_segment {
  std::string name;
  bool operator==(const extension_segment &) const = default;
};

struct key_segment {
  key_literal key;
  bool operator==(const key_segment &) const = default;
};

struct tuple_index_segment {
  std::uint8_t index = 0;
  bool operator==(const tuple_index_segment &) const = default;
};

struct array_index_segment {
  std::optional<std::size_t> index; // Absent means the append position
  bool operator==(const array_index_segment &) const = default;
};

using path_segment = std::variant<ident_segment, extension_segment, key_segment, tuple_index_segment, array_index_segment>;

/// Segment addressing the entry stored under the given key
path_segment segment_for(const object_key &key);

/**
 * @brief Location of a node relative to a document root
 *
 * Every diagnostic carries one of these. Renders as `a.b.$ext."key".#0[3]`,
 * the empty path renders as `(root)`.
 */
class eure_path {
public:
  eure_path() = default;
  eure_path(std::vector<path_segment> segments);

  /**
   * @brief Parse the rendered form of a path
   *
   * Accepts identifiers, `$extension`, quoted keys, integer keys, `#n` tuple
   * indices and `[n]` / `[]` array indices.
   */
  static std::expected<eure_path, std::string> parse(std::string_view text);

  eure_path child(path_segment segment) const;
  void push(path_segment segment);
  void pop();

  const std::vector<path_segment> &segments() const
  {
    return segments_;
  }
  bool empty() const
  {
    return segments_.empty();
  }
  std::size_t size() const
  {
    return segments_.size();
  }

  std::string to_string() const;

  bool operator==(const eure_path &) const = default;

private:
  std::vector<path_segment> segments_;
};

} // namespace eure
