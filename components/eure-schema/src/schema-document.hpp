#ifndef EURE_SCHEMA_DOCUMENT_HPP
#define EURE_SCHEMA_DOCUMENT_HPP

#include "id.hpp"
#include "value.hpp"
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

namespace eure_schema {

struct schema_node_tag {};
using schema_node_id = eure::basic_id<schema_node_tag>;

/// Numeric literal as written in the schema, never converted between kinds
using number = std::variant<std::int64_t, double>;

struct bound {
    number limit;
    bool exclusive = false;

    bool operator==(const bound&) const = default;
};

struct text_schema {
    std::optional<std::size_t> min_length;
    std::optional<std::size_t> max_length;
    std::optional<std::string> pattern;
    std::optional<std::string> language;

    bool operator==(const text_schema&) const = default;
};

struct integer_schema {
    std::optional<bound> min;
    std::optional<bound> max;
    std::optional<std::int64_t> multiple_of;

    bool operator==(const integer_schema&) const = default;
};

struct float_schema {
    std::optional<bound> min;
    std::optional<bound> max;
    std::optional<number> multiple_of;

    bool operator==(const float_schema&) const = default;
};

struct boolean_schema {
    bool operator==(const boolean_schema&) const = default;
};

struct null_schema {
    bool operator==(const null_schema&) const = default;
};

struct any_schema {
    bool operator==(const any_schema&) const = default;
};

struct literal_schema {
    eure::value expected;
};

enum class unknown_fields_policy {
    Deny,
    Allow,
};

struct record_field {
    std::string name;
    schema_node_id schema;
    bool optional = false;
};

struct record_schema {
    std::vector<record_field> fields;
    unknown_fields_policy unknown_fields = unknown_fields_policy::Deny;

    const record_field* find(std::string_view name) const;
};

struct array_schema {
    schema_node_id item;
    std::optional<std::size_t> min_items;
    std::optional<std::size_t> max_items;
    bool unique = false;
};

struct map_schema {
    schema_node_id key;
    schema_node_id value;
    std::optional<std::size_t> min_size;
    std::optional<std::size_t> max_size;
};

struct tuple_schema {
    std::vector<schema_node_id> elements;
};

enum class variant_repr_kind {
    Tagged,   // $variant extension on the value
    External, // { variant-name = content }
    Internal, // { <tag> = "variant-name", ...fields }
    Adjacent, // { <tag> = "variant-name", <content> = content }
};

struct variant_repr {
    variant_repr_kind kind = variant_repr_kind::Tagged;
    std::string tag;
    std::string content;

    bool operator==(const variant_repr&) const = default;
};

struct union_variant {
    std::string name;
    schema_node_id schema;
};

struct union_schema {
    std::vector<union_variant> variants;
    variant_repr repr;

    const union_variant* find(std::string_view name) const;
};

/// Named type, resolved against the owning schema_document when used
struct reference_schema {
    std::string name;

    bool operator==(const reference_schema&) const = default;
};

using schema_node_content = std::variant<
    text_schema,
    integer_schema,
    float_schema,
    boolean_schema,
    null_schema,
    any_schema,
    literal_schema,
    record_schema,
    array_schema,
    map_schema,
    tuple_schema,
    union_schema,
    reference_schema>;

std::string_view kind_name(const schema_node_content& content);

/**
 * @brief Documentation attached to a schema node
 *
 * Never changes whether a document passes validation.
 */
struct schema_metadata {
    std::optional<std::string> description;
    bool deprecated = false;
    std::optional<eure::value> default_value;
    std::vector<eure::value> examples;
    // Unrecognised extensions, kept verbatim
    std::vector<std::pair<std::string, eure::value>> extensions;
};

struct schema_node {
    schema_node_content content;
    schema_metadata metadata;
};

enum class rename_rule {
    CamelCase,
    SnakeCase,
    KebabCase,
    PascalCase,
    LowerCase,
    UpperCase,
};

std::optional<rename_rule> parse_rename_rule(std::string_view name);
std::string_view to_string(rename_rule rule);

/// Naming hints for code generators, not used by validation
struct naming_options {
    std::optional<std::string> rename;
    std::optional<rename_rule> rename_all;

    bool empty() const { return !rename && !rename_all; }
    bool operator==(const naming_options&) const = default;
};

/**
 * @brief Arena of schema nodes plus the registry of named types
 *
 * Nodes refer to each other by schema_node_id, so recursive types through
 * reference_schema need no special handling.
 */
class schema_document {
public:
    schema_node_id root() const { return root_; }
    void set_root(schema_node_id id) { root_ = id; }

    schema_node_id add(schema_node_content content, schema_metadata metadata = {});
    bool contains(schema_node_id id) const { return id.valid() && id.index() < nodes_.size(); }
    const schema_node& get(schema_node_id id) const { return nodes_[id.index()]; }
    schema_node& get(schema_node_id id) { return nodes_[id.index()]; }
    std::size_t size() const { return nodes_.size(); }

    /// Returns false when the name is already taken
    bool define_type(std::string name, schema_node_id id);
    std::optional<schema_node_id> find_type(std::string_view name) const;
    bool remove_type(std::string_view name);
    const std::vector<std::pair<std::string, schema_node_id>>& types() const { return types_; }

    naming_options& global_naming() { return global_naming_; }
    const naming_options& global_naming() const { return global_naming_; }
    naming_options& type_naming(const std::string& name) { return type_naming_[name]; }
    const std::map<std::string, naming_options>& type_naming() const { return type_naming_; }

    /**
     * @brief Structural equality
     *
     * Compares the root and every named type by name, so registry order and
     * node numbering do not matter.
     */
    bool equivalent(const schema_document& other) const;

private:
    std::vector<schema_node> nodes_;
    schema_node_id root_;
    std::vector<std::pair<std::string, schema_node_id>> types_;
    std::unordered_map<std::string, std::size_t> type_index_;
    naming_options global_naming_;
    std::map<std::string, naming_options> type_naming_;
};

} // namespace eure_schema

#endif // EURE_SCHEMA_DOCUMENT_HPP
