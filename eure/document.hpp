#pragma once

#include "id.hpp"
#include "path.hpp"
#include "value.hpp"
#include <expected>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace eure {

enum class path_error_kind {
  PathNotFound,
  ExpectedMap,
  ExpectedArray,
  ExpectedTuple,
  AlreadyAssigned,
  IndexOutOfRange,
  DocumentFinalized,
};

std::string_view to_string(path_error_kind kind);

struct path_error {
  path_error_kind kind;
  eure_path path;

  std::string message() const;
};

struct hole_content {};

struct map_content {
  std::vector<std::pair<object_key, node_id>> entries;

  std::optional<node_id> find(const object_key &key) const;
  /// Entry whose identifier or literal text key is spelled `name`
  std::optional<node_id> find_field(std::string_view name) const;
};

struct array_content {
  std::vector<node_id> elements;
};

struct tuple_content {
  std::vector<node_id> elements;
};

using node_content = std::variant<hole_content, primitive, map_content, array_content, tuple_content>;

struct node {
  node_content content;
  std::vector<std::pair<std::string, node_id>> extensions;

  std::optional<node_id> extension(std::string_view name) const;

  bool is_hole() const
  {
    return std::holds_alternative<hole_content>(content);
  }
  const primitive *as_primitive() const
  {
    return std::get_if<primitive>(&content);
  }
  const map_content *as_map() const
  {
    return std::get_if<map_content>(&content);
  }
  const array_content *as_array() const
  {
    return std::get_if<array_content>(&content);
  }
  const tuple_content *as_tuple() const
  {
    return std::get_if<tuple_content>(&content);
  }
};

std::string_view node_kind_name(const node &n);

/**
 * @brief Immutable tree of nodes produced by a document_builder
 *
 * Node ids are only issued by the owning document, so `get` never fails for
 * an id obtained from it. Finalized documents are shared read-only.
 */
class document {
public:
  node_id root() const
  {
    return root_;
  }
  const node &get(node_id id) const
  {
    return nodes_[id.index()];
  }
  std::size_t size() const
  {
    return nodes_.size();
  }

  /**
   * @brief Read-mode path resolution
   *
   * Fails with PathNotFound on the first segment that names no existing node.
   */
  std::expected<node_id, path_error> resolve(const eure_path &path, node_id start) const;
  std::expected<node_id, path_error> resolve(const eure_path &path) const
  {
    return resolve(path, root_);
  }

  value to_value(node_id id) const;
  value to_value() const
  {
    return to_value(root_);
  }

private:
  friend class document_builder;

  std::vector<node> nodes_;
  node_id root_;
};

/// Structural equality: map entries and extensions compare by key, not by order
bool operator==(const document &a, const document &b);

/**
 * @brief Exclusive owner of a document under construction
 *
 * New nodes start as holes. Adding a child to a hole turns it into a map.
 * After finalize() the builder is empty and every mutation fails with
 * DocumentFinalized.
 */
class document_builder {
public:
  document_builder();
  document_builder(const document_builder &)            = delete;
  document_builder &operator=(const document_builder &) = delete;
  document_builder(document_builder &&)                 = default;
  document_builder &operator=(document_builder &&)      = default;

  node_id root() const;
  std::expected<const node *, path_error> get(node_id id) const;

  /// Map entry or, for extension keys, an entry of the node's extension table
  std::expected<node_id, path_error> add_child(node_id parent, object_key key);
  std::expected<node_id, path_error> add_field(node_id parent, std::string name)
  {
    return add_child(parent, object_key::ident(std::move(name)));
  }
  std::expected<node_id, path_error> add_extension(node_id parent, std::string name)
  {
    return add_child(parent, object_key::extension(std::move(name)));
  }
  std::expected<node_id, path_error> add_array_element(node_id parent, std::optional<std::size_t> index = std::nullopt);
  std::expected<node_id, path_error> add_tuple_element(node_id parent, std::uint8_t index);

  std::expected<void, path_error> set_primitive(node_id id, primitive value);
  std::expected<void, path_error> make_map(node_id id);
  std::expected<void, path_error> make_array(node_id id);
  std::expected<void, path_error> make_tuple(node_id id);

  /**
   * @brief Construction-mode path resolution
   *
   * Walks existing nodes and creates missing ones, turning holes into maps for
   * key segments. Array and tuple segments may only name an existing element
   * or the next free position.
   */
  std::expected<node_id, path_error> resolve_or_create(const eure_path &path, node_id start);
  std::expected<node_id, path_error> resolve_or_create(const eure_path &path)
  {
    return resolve_or_create(path, root());
  }

  std::shared_ptr<const document> finalize() &&;

private:
  std::expected<void, path_error> check_open(node_id id) const;
  node_id new_node(eure_path path);
  template <typename Content> std::expected<Content *, path_error> require(node_id id, path_error_kind mismatch);

  std::unique_ptr<document> doc_;
  std::vector<eure_path> paths_;
};

/// Rebuilds a document whose projection equals `v`
std::expected<std::shared_ptr<const document>, path_error> document_from_value(const value &v);

} // namespace eure
