#include "document.hpp"
#include "spdlog/spdlog.h"

namespace eure {

std::string_view to_string(path_error_kind kind)
{
  switch (kind) {
    case path_error_kind::PathNotFound:
      return "PathNotFound";
    case path_error_kind::ExpectedMap:
      return "ExpectedMap";
    case path_error_kind::ExpectedArray:
      return "ExpectedArray";
    case path_error_kind::ExpectedTuple:
      return "ExpectedTuple";
    case path_error_kind::AlreadyAssigned:
      return "AlreadyAssigned";
    case path_error_kind::IndexOutOfRange:
      return "IndexOutOfRange";
    case path_error_kind::DocumentFinalized:
      return "DocumentFinalized";
  }
  return "Unknown";
}

std::string path_error::message() const
{
  return std::string(to_string(kind)) + " at " + path.to_string();
}

std::optional<node_id> map_content::find(const object_key &key) const
{
  for (const auto &[k, id]: entries)
    if (k == key)
      return id;
  return std::nullopt;
}

std::optional<node_id> map_content::find_field(std::string_view name) const
{
  for (const auto &[k, id]: entries)
    if (k.field_name() == name)
      return id;
  return std::nullopt;
}

std::optional<node_id> node::extension(std::string_view name) const
{
  for (const auto &[ext, id]: extensions)
    if (ext == name)
      return id;
  return std::nullopt;
}

std::string_view node_kind_name(const node &n)
{
  switch (n.content.index()) {
    case 0:
      return "hole";
    case 1:
      return primitive_kind_name(std::get<primitive>(n.content));
    case 2:
      return "map";
    case 3:
      return "array";
    default:
      return "tuple";
  }
}

std::expected<node_id, path_error> document::resolve(const eure_path &path, node_id start) const
{
  node_id current = start;
  eure_path visited;

  for (const auto &segment: path.segments()) {
    visited.push(segment);
    const node &n = get(current);

    std::optional<node_id> next;
    if (const auto *ext = std::get_if<extension_segment>(&segment)) {
      next = n.extension(ext->name);
    } else if (const auto *ident = std::get_if<ident_segment>(&segment)) {
      if (const auto *map = n.as_map())
        next = map->find(object_key::ident(ident->name));
    } else if (const auto *key = std::get_if<key_segment>(&segment)) {
      if (const auto *map = n.as_map())
        next = map->find(object_key::literal(key->key));
    } else if (const auto *tuple_index = std::get_if<tuple_index_segment>(&segment)) {
      if (const auto *tuple = n.as_tuple(); tuple && tuple_index->index < tuple->elements.size())
        next = tuple->elements[tuple_index->index];
    } else {
      const auto &array_index = std::get<array_index_segment>(segment);
      if (const auto *array = n.as_array(); array && array_index.index && *array_index.index < array->elements.size())
        next = array->elements[*array_index.index];
    }

    if (!next)
      return std::unexpected(path_error{ path_error_kind::PathNotFound, visited });
    current = *next;
  }
  return current;
}

value document::to_value(node_id id) const
{
  const node &n = get(id);
  value result;

  if (const auto *p = n.as_primitive()) {
    result.content = *p;
  } else if (const auto *map = n.as_map()) {
    value_map out;
    out.entries.reserve(map->entries.size());
    for (const auto &[key, child]: map->entries)
      out.entries.push_back(value_entry{ key, to_value(child) });
    result.content = std::move(out);
  } else if (const auto *array = n.as_array()) {
    value_array out;
    for (const auto child: array->elements)
      out.elements.push_back(to_value(child));
    result.content = std::move(out);
  } else if (const auto *tuple = n.as_tuple()) {
    value_tuple out;
    for (const auto child: tuple->elements)
      out.elements.push_back(to_value(child));
    result.content = std::move(out);
  }

  for (const auto &[name, child]: n.extensions)
    result.extensions.push_back(value_entry{ object_key::extension(name), to_value(child) });
  return result;
}

bool operator==(const document &a, const document &b)
{
  return a.to_value() == b.to_value();
}

document_builder::document_builder() : doc_(std::make_unique<document>())
{
  doc_->root_ = new_node({});
}

node_id document_builder::root() const
{
  return doc_ ? doc_->root_ : node_id{};
}

std::expected<const node *, path_error> document_builder::get(node_id id) const
{
  if (auto open = check_open(id); !open)
    return std::unexpected(open.error());
  return &doc_->get(id);
}

node_id document_builder::new_node(eure_path path)
{
  const node_id id{ doc_->nodes_.size() };
  doc_->nodes_.push_back(node{ hole_content{}, {} });
  paths_.push_back(std::move(path));
  return id;
}

std::expected<void, path_error> document_builder::check_open(node_id id) const
{
  if (!doc_)
    return std::unexpected(path_error{ path_error_kind::DocumentFinalized, {} });
  if (!id.valid() || id.index() >= doc_->nodes_.size())
    return std::unexpected(path_error{ path_error_kind::PathNotFound, {} });
  return {};
}

template <typename Content> std::expected<Content *, path_error> document_builder::require(node_id id, path_error_kind mismatch)
{
  if (auto open = check_open(id); !open)
    return std::unexpected(open.error());

  node &n = doc_->nodes_[id.index()];
  if (n.is_hole())
    n.content = Content{};
  if (auto *content = std::get_if<Content>(&n.content))
    return content;
  return std::unexpected(path_error{ mismatch, paths_[id.index()] });
}

std::expected<node_id, path_error> document_builder::add_child(node_id parent, object_key key)
{
  if (auto open = check_open(parent); !open)
    return std::unexpected(open.error());

  auto child_path = paths_[parent.index()].child(segment_for(key));

  if (key.kind == key_kind::Extension) {
    auto name = std::get<std::string>(key.value);
    if (doc_->get(parent).extension(name))
      return std::unexpected(path_error{ path_error_kind::AlreadyAssigned, std::move(child_path) });
    const auto id = new_node(std::move(child_path));
    doc_->nodes_[parent.index()].extensions.emplace_back(std::move(name), id);
    return id;
  }

  auto map = require<map_content>(parent, path_error_kind::ExpectedMap);
  if (!map)
    return std::unexpected(map.error());
  if ((*map)->find(key))
    return std::unexpected(path_error{ path_error_kind::AlreadyAssigned, std::move(child_path) });

  // new_node may reallocate the node table, so the map is looked up again afterwards
  const auto id = new_node(std::move(child_path));
  std::get<map_content>(doc_->nodes_[parent.index()].content).entries.emplace_back(std::move(key), id);
  return id;
}

std::expected<node_id, path_error> document_builder::add_array_element(node_id parent, std::optional<std::size_t> index)
{
  auto array = require<array_content>(parent, path_error_kind::ExpectedArray);
  if (!array)
    return std::unexpected(array.error());

  const auto position = (*array)->elements.size();
  auto child_path     = paths_[parent.index()].child(array_index_segment{ position });
  if (index && *index != position)
    return std::unexpected(path_error{ path_error_kind::IndexOutOfRange, paths_[parent.index()].child(array_index_segment{ index }) });

  const auto id = new_node(std::move(child_path));
  std::get<array_content>(doc_->nodes_[parent.index()].content).elements.push_back(id);
  return id;
}

std::expected<node_id, path_error> document_builder::add_tuple_element(node_id parent, std::uint8_t index)
{
  auto tuple = require<tuple_content>(parent, path_error_kind::ExpectedTuple);
  if (!tuple)
    return std::unexpected(tuple.error());

  auto child_path = paths_[parent.index()].child(tuple_index_segment{ index });
  if (index != (*tuple)->elements.size())
    return std::unexpected(path_error{ path_error_kind::IndexOutOfRange, std::move(child_path) });

  const auto id = new_node(std::move(child_path));
  std::get<tuple_content>(doc_->nodes_[parent.index()].content).elements.push_back(id);
  return id;
}

std::expected<void, path_error> document_builder::set_primitive(node_id id, primitive value)
{
  if (auto open = check_open(id); !open)
    return open;

  node &n = doc_->nodes_[id.index()];
  if (!n.is_hole())
    return std::unexpected(path_error{ path_error_kind::AlreadyAssigned, paths_[id.index()] });
  n.content = std::move(value);
  return {};
}

std::expected<void, path_error> document_builder::make_map(node_id id)
{
  auto map = require<map_content>(id, path_error_kind::AlreadyAssigned);
  if (!map)
    return std::unexpected(map.error());
  return {};
}

std::expected<void, path_error> document_builder::make_array(node_id id)
{
  auto array = require<array_content>(id, path_error_kind::AlreadyAssigned);
  if (!array)
    return std::unexpected(array.error());
  return {};
}

std::expected<void, path_error> document_builder::make_tuple(node_id id)
{
  auto tuple = require<tuple_content>(id, path_error_kind::AlreadyAssigned);
  if (!tuple)
    return std::unexpected(tuple.error());
  return {};
}

std::expected<node_id, path_error> document_builder::resolve_or_create(const eure_path &path, node_id start)
{
  if (auto open = check_open(start); !open)
    return std::unexpected(open.error());

  node_id current = start;
  for (const auto &segment: path.segments()) {
    std::expected<node_id, path_error> next = std::unexpected(path_error{ path_error_kind::PathNotFound, paths_[current.index()] });

    if (const auto *ext = std::get_if<extension_segment>(&segment)) {
      if (const auto existing = doc_->get(current).extension(ext->name))
        next = *existing;
      else
        next = add_extension(current, ext->name);
    } else if (std::holds_alternative<ident_segment>(segment) || std::holds_alternative<key_segment>(segment)) {
      auto key = std::holds_alternative<ident_segment>(segment) ? object_key::ident(std::get<ident_segment>(segment).name) : object_key::literal(std::get<key_segment>(segment).key);
      const auto *map = doc_->get(current).as_map();
      if (const auto existing = map ? map->find(key) : std::nullopt)
        next = *existing;
      else
        next = add_child(current, std::move(key));
    } else if (const auto *tuple_index = std::get_if<tuple_index_segment>(&segment)) {
      const auto *tuple = doc_->get(current).as_tuple();
      if (tuple && tuple_index->index < tuple->elements.size())
        next = tuple->elements[tuple_index->index];
      else
        next = add_tuple_element(current, tuple_index->index);
    } else {
      const auto &array_index = std::get<array_index_segment>(segment);
      const auto *array       = doc_->get(current).as_array();
      if (array && array_index.index && *array_index.index < array->elements.size())
        next = array->elements[*array_index.index];
      else
        next = add_array_element(current, array_index.index);
    }

    if (!next)
      return next;
    current = *next;
  }
  return current;
}

std::shared_ptr<const document> document_builder::finalize() &&
{
  spdlog::trace("Finalizing document with {} nodes", doc_ ? doc_->size() : 0);
  paths_.clear();
  return std::shared_ptr<const document>(std::move(doc_));
}

static std::expected<void, path_error> fill_node(document_builder &builder, node_id id, const value &v)
{
  std::expected<void, path_error> status;

  if (const auto *p = v.as_primitive()) {
    status = builder.set_primitive(id, *p);
  } else if (const auto *map = std::get_if<value_map>(&v.content)) {
    status = builder.make_map(id);
    for (const auto &entry: map->entries) {
      if (!status)
        break;
      auto child = builder.add_child(id, entry.key);
      if (!child)
        return std::unexpected(child.error());
      status = fill_node(builder, *child, entry.val);
    }
  } else if (const auto *array = std::get_if<value_array>(&v.content)) {
    status = builder.make_array(id);
    for (const auto &element: array->elements) {
      if (!status)
        break;
      auto child = builder.add_array_element(id);
      if (!child)
        return std::unexpected(child.error());
      status = fill_node(builder, *child, element);
    }
  } else if (const auto *tuple = std::get_if<value_tuple>(&v.content)) {
    status = builder.make_tuple(id);
    if (status && tuple->elements.size() > 256)
      return std::unexpected(path_error{ path_error_kind::IndexOutOfRange, {} });
    for (std::size_t i = 0; status && i < tuple->elements.size(); ++i) {
      auto child = builder.add_tuple_element(id, static_cast<std::uint8_t>(i));
      if (!child)
        return std::unexpected(child.error());
      status = fill_node(builder, *child, tuple->elements[i]);
    }
  }

  for (const auto &entry: v.extensions) {
    if (!status)
      break;
    auto child = builder.add_child(id, object_key::extension(std::get<std::string>(entry.key.value)));
    if (!child)
      return std::unexpected(child.error());
    status = fill_node(builder, *child, entry.val);
  }
  return status;
}

std::expected<std::shared_ptr<const document>, path_error> document_from_value(const value &v)
{
  document_builder builder;
  if (auto status = fill_node(builder, builder.root(), v); !status)
    return std::unexpected(status.error());
  return std::move(builder).finalize();
}

} // namespace eure
