#ifndef EURE_SCHEMA_VALIDATOR_HPP
#define EURE_SCHEMA_VALIDATOR_HPP

#include "config.hpp"
#include "document.hpp"
#include "schema-document.hpp"
#include <expected>
#include <string>
#include <string_view>
#include <vector>

namespace eure_schema {

using eure::union_tag_mode;

struct validation_options {
    union_tag_mode tag_mode = union_tag_mode::Explicit;
    std::size_t max_depth = 256;
    std::size_t max_errors = 0; // 0 = unlimited

    static validation_options from_config(const eure::config& cfg);
};

enum class validation_error_kind {
    TypeMismatch,
    MissingField,
    UnknownField,
    OutOfRange,
    NotMultipleOf,
    LengthOutOfBounds,
    PatternMismatch,
    LanguageMismatch,
    ArrayLengthOutOfBounds,
    MapSizeOutOfBounds,
    NotUnique,
    InvalidKey,
    LiteralMismatch,
    ArityMismatch,
    MissingVariantTag,
    InvalidVariantTag,
    UnknownVariant,
    AmbiguousVariant,
    NoVariantMatched,
    ConflictingVariantTags,
    DanglingReference,
    RecursionLimit,
};

enum class validation_warning_kind {
    Deprecated,
};

enum class validator_error_kind {
    InvalidSchemaNode,
    ReferenceCycle,
    InvalidPattern,
};

std::string_view to_string(validation_error_kind kind);
std::string_view to_string(validation_warning_kind kind);
std::string_view to_string(validator_error_kind kind);

/// A mismatch between the document and the schema at one location
struct validation_error {
    validation_error_kind kind;
    eure::eure_path path;
    std::string title;
};

struct validation_warning {
    validation_warning_kind kind;
    eure::eure_path path;
    std::string title;
};

/// The schema itself is unusable, validation could not run
struct validator_error {
    validator_error_kind kind;
    eure::eure_path path;
    std::string message;
};

struct validation_result {
    std::vector<validation_error> errors;
    std::vector<validation_warning> warnings;
    // Set when max_errors cut the error list short
    bool truncated = false;
    // Set when the completeness pass found required holes
    bool incomplete = false;

    bool is_valid() const { return errors.empty(); }
};

/**
 * @brief Check a document against a schema
 *
 * Runs the structural pass followed by the completeness pass. Mismatches are
 * collected in the result; only a corrupt schema yields a validator_error.
 */
std::expected<validation_result, validator_error> validate(const eure::document& doc,
                                                           const schema_document& schema,
                                                           const validation_options& options = {});

/// Same as validate() for a single subtree against a single schema node
std::expected<validation_result, validator_error> validate_node(const eure::document& doc,
                                                                eure::node_id node,
                                                                const schema_document& schema,
                                                                schema_node_id schema_node,
                                                                const validation_options& options = {});

} // namespace eure_schema

#endif // EURE_SCHEMA_VALIDATOR_HPP
