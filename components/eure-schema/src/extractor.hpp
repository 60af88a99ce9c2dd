#ifndef EURE_SCHEMA_EXTRACTOR_HPP
#define EURE_SCHEMA_EXTRACTOR_HPP

#include "document.hpp"
#include "schema-document.hpp"
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace eure_schema {

enum class schema_error_kind {
    InvalidTypeExpression,
    ConflictingTypeAnnotation,
    MalformedConstraint,
    DuplicateField,
    DuplicateVariant,
    DanglingReference,
    EmptyVariant,
    InvalidVariantRepr,
    InvalidUnknownFieldsPolicy,
};

std::string_view to_string(schema_error_kind kind);

/// Defect in the annotations of a schema source, aborts extraction
struct schema_error {
    schema_error_kind kind;
    eure::eure_path path;
    std::string message;
};

struct extracted_schema {
    schema_document schema;
    // True when the source holds declarations only, no example data
    bool is_pure_schema = false;
};

/**
 * @brief Synthesizes a schema from the `$`-annotations of a document
 *
 * Handles inline overlays on data fields, named types under `$types` and
 * per-variant field declarations under `$variants`.
 */
std::expected<extracted_schema, schema_error> extract(const eure::document& doc);

/**
 * @brief Parsed form of a type expression such as `integer` or `$types.Point`
 */
struct type_expression {
    enum class kind { Text, Integer, Float, Boolean, Null, Any, Reference };
    kind type;
    std::string name; // Only for references
};

/// Accepts an optional leading '.', capitalised names are shorthand for `$types.Name`
std::optional<type_expression> parse_type_expression(std::string_view expression);

class schema_extractor {
public:
    explicit schema_extractor(const eure::document& doc);

    std::expected<extracted_schema, schema_error> run();

private:
    enum class position { Root, TypeEntry, Variant, Nested };

    std::expected<schema_node_id, schema_error> extract_node(eure::node_id id, const eure::eure_path& path, position where);
    std::expected<schema_node_id, schema_error> extract_base(eure::node_id id, const eure::eure_path& path, position where);
    std::expected<schema_node_id, schema_error> extract_type_annotation(eure::node_id id, const eure::eure_path& path);
    std::expected<schema_node_id, schema_error> extract_record(eure::node_id id, const eure::eure_path& path);
    std::expected<schema_node_id, schema_error> extract_union(eure::node_id owner, const eure::eure_path& owner_path);
    std::expected<variant_repr, schema_error> extract_variant_repr(eure::node_id id, const eure::eure_path& path);
    std::expected<void, schema_error> apply_constraints(schema_node_id target, eure::node_id id, const eure::eure_path& path);
    std::expected<void, schema_error> apply_metadata(schema_node_id target, eure::node_id id, const eure::eure_path& path, position where);
    std::expected<void, schema_error> extract_naming(naming_options& naming, eure::node_id id, const eure::eure_path& path);
    std::expected<void, schema_error> extract_types(eure::node_id types, const eure::eure_path& path);

    schema_node_id add_expression(const type_expression& expression, const eure::eure_path& path);
    std::optional<type_expression> content_type_expression(eure::node_id id) const;
    bool is_declared(eure::node_id id);
    bool contains_data(eure::node_id id) const;

    const eure::document& doc_;
    schema_document schema_;
    std::vector<std::pair<std::string, eure::eure_path>> references_;
    std::vector<signed char> declared_cache_;
};

} // namespace eure_schema

#endif // EURE_SCHEMA_EXTRACTOR_HPP
