#pragma once

#include <compare>
#include <cstddef>
#include <functional>
#include <limits>

namespace eure {

/**
 * @brief Index handle into a table owned by a single container
 *
 * The tag type keeps handles of different tables from being mixed up. A
 * default constructed handle is invalid.
 */
template <typename Tag> class basic_id {
public:
  static constexpr std::size_t invalid_index = std::numeric_limits<std::size_t>::max();

  constexpr basic_id() = default;
  constexpr explicit basic_id(std::size_t index) : index_(index)
  {
  }

  constexpr std::size_t index() const
  {
    return index_;
  }

  constexpr bool valid() const
  {
    return index_ != invalid_index;
  }

  friend constexpr bool operator==(const basic_id &, const basic_id &)  = default;
  friend constexpr auto operator<=>(const basic_id &, const basic_id &) = default;

private:
  std::size_t index_ = invalid_index;
};

struct node_tag {};
using node_id = basic_id<node_tag>;

} // namespace eure

template <typename Tag> struct std::hash<eure::basic_id<Tag>> {
  std::size_t operator()(const eure::basic_id<Tag> &id) const noexcept
  {
    return std::hash<std::size_t>{}(id.index());
  }
};
