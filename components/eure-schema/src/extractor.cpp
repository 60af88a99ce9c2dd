#include "extractor.hpp"
#include "spdlog/spdlog.h"
#include <algorithm>
#include <array>
#include <cctype>
#include <regex>
#include <unordered_set>

namespace eure_schema {

namespace {

// Extensions that give a node its base type. At most one per node.
constexpr std::array<std::string_view, 5> base_annotations = {"type", "array", "map", "literal", "variants"};

constexpr std::array<std::string_view, 30> recognised_extensions = {
    "type", "array", "map", "literal", "variants", "variant-repr", "variant", "optional", "unknown-fields",
    "length", "min-length", "max-length", "pattern", "language",
    "range", "minimum", "maximum", "exclusive-min", "exclusive-max", "multiple-of",
    "min-items", "max-items", "unique", "min-size", "max-size",
    "description", "deprecated", "default", "examples", "types",
};

bool is_recognised(std::string_view name) {
    return std::find(recognised_extensions.begin(), recognised_extensions.end(), name) != recognised_extensions.end();
}

std::unexpected<schema_error> fail(schema_error_kind kind, eure::eure_path path, std::string message) {
    return std::unexpected(schema_error{kind, std::move(path), std::move(message)});
}

eure::eure_path extension_path(const eure::eure_path& path, std::string_view name) {
    return path.child(eure::extension_segment{std::string(name)});
}

std::optional<std::int64_t> as_integer(const eure::node& n) {
    if (const auto* p = n.as_primitive()) {
        if (const auto* i = std::get_if<std::int64_t>(p)) {
            return *i;
        }
    }
    return std::nullopt;
}

std::optional<number> as_number(const eure::node& n) {
    if (const auto* p = n.as_primitive()) {
        if (const auto* i = std::get_if<std::int64_t>(p)) {
            return number{*i};
        }
        if (const auto* d = std::get_if<double>(p)) {
            return number{*d};
        }
    }
    return std::nullopt;
}

std::optional<std::string> as_text(const eure::node& n) {
    if (const auto* p = n.as_primitive()) {
        if (const auto* t = std::get_if<eure::text>(p)) {
            return t->content;
        }
    }
    return std::nullopt;
}

std::optional<bool> as_bool(const eure::node& n) {
    if (const auto* p = n.as_primitive()) {
        if (const auto* b = std::get_if<bool>(p)) {
            return *b;
        }
    }
    return std::nullopt;
}

bool is_positive(const number& n) {
    if (const auto* i = std::get_if<std::int64_t>(&n)) {
        return *i > 0;
    }
    return std::get<double>(n) > 0.0;
}

} // namespace

std::string_view to_string(schema_error_kind kind) {
    switch (kind) {
        case schema_error_kind::InvalidTypeExpression: return "InvalidTypeExpression";
        case schema_error_kind::ConflictingTypeAnnotation: return "ConflictingTypeAnnotation";
        case schema_error_kind::MalformedConstraint: return "MalformedConstraint";
        case schema_error_kind::DuplicateField: return "DuplicateField";
        case schema_error_kind::DuplicateVariant: return "DuplicateVariant";
        case schema_error_kind::DanglingReference: return "DanglingReference";
        case schema_error_kind::EmptyVariant: return "EmptyVariant";
        case schema_error_kind::InvalidVariantRepr: return "InvalidVariantRepr";
        case schema_error_kind::InvalidUnknownFieldsPolicy: return "InvalidUnknownFieldsPolicy";
    }
    return "Unknown";
}

std::optional<type_expression> parse_type_expression(std::string_view expression) {
    if (expression.starts_with('.')) {
        expression.remove_prefix(1);
    }

    using kind = type_expression::kind;
    if (expression == "text" || expression == "string") return type_expression{kind::Text, {}};
    if (expression == "integer") return type_expression{kind::Integer, {}};
    if (expression == "float") return type_expression{kind::Float, {}};
    if (expression == "boolean" || expression == "bool") return type_expression{kind::Boolean, {}};
    if (expression == "null") return type_expression{kind::Null, {}};
    if (expression == "any") return type_expression{kind::Any, {}};

    constexpr std::string_view types_prefix = "$types.";
    if (expression.starts_with(types_prefix)) {
        expression.remove_prefix(types_prefix.size());
        if (eure::is_identifier(expression)) {
            return type_expression{kind::Reference, std::string(expression)};
        }
        return std::nullopt;
    }

    if (!expression.empty() && std::isupper(static_cast<unsigned char>(expression.front())) && eure::is_identifier(expression)) {
        return type_expression{kind::Reference, std::string(expression)};
    }
    return std::nullopt;
}

std::expected<extracted_schema, schema_error> extract(const eure::document& doc) {
    schema_extractor extractor(doc);
    return extractor.run();
}

schema_extractor::schema_extractor(const eure::document& doc)
    : doc_(doc)
    , declared_cache_(doc.size(), -1)
{}

std::expected<extracted_schema, schema_error> schema_extractor::run() {
    spdlog::debug("Extracting schema from a document of {} nodes", doc_.size());

    const auto root = doc_.root();
    const eure::eure_path root_path;

    if (const auto types = doc_.get(root).extension("types")) {
        if (auto status = extract_types(*types, extension_path(root_path, "types")); !status) {
            return std::unexpected(status.error());
        }
    }
    if (auto status = extract_naming(schema_.global_naming(), root, root_path); !status) {
        return std::unexpected(status.error());
    }

    auto root_schema = extract_node(root, root_path, position::Root);
    if (!root_schema) {
        return std::unexpected(root_schema.error());
    }
    schema_.set_root(*root_schema);

    for (const auto& [name, path] : references_) {
        if (!schema_.find_type(name)) {
            spdlog::error("Type '{}' referenced at {} is not defined", name, path.to_string());
            return fail(schema_error_kind::DanglingReference, path, "type '" + name + "' is not defined");
        }
    }

    const bool pure = !contains_data(root);
    spdlog::debug("Extracted {} schema nodes and {} named types ({})", schema_.size(), schema_.types().size(),
                  pure ? "pure schema" : "self-describing");
    return extracted_schema{std::move(schema_), pure};
}

std::expected<void, schema_error> schema_extractor::extract_types(eure::node_id types, const eure::eure_path& path) {
    const auto* map = doc_.get(types).as_map();
    if (!map) {
        return fail(schema_error_kind::InvalidTypeExpression, path, "$types must be a map of type declarations");
    }

    for (const auto& [key, child] : map->entries) {
        const auto type_path = path.child(eure::segment_for(key));
        const auto name = key.field_name();
        if (!name) {
            return fail(schema_error_kind::InvalidTypeExpression, type_path, "type names must be identifiers or text keys");
        }

        auto id = extract_node(child, type_path, position::TypeEntry);
        if (!id) {
            return std::unexpected(id.error());
        }
        if (!schema_.define_type(std::string(*name), *id)) {
            return fail(schema_error_kind::DuplicateField, type_path, "type '" + std::string(*name) + "' is defined more than once");
        }
        if (auto status = extract_naming(schema_.type_naming(std::string(*name)), child, type_path); !status) {
            return status;
        }
    }
    return {};
}

std::expected<void, schema_error> schema_extractor::extract_naming(naming_options& naming, eure::node_id id, const eure::eure_path& path) {
    const auto& n = doc_.get(id);

    if (const auto rename = n.extension("rename")) {
        auto name = as_text(doc_.get(*rename));
        if (!name) {
            return fail(schema_error_kind::MalformedConstraint, extension_path(path, "rename"), "$rename must be text");
        }
        naming.rename = std::move(*name);
    }
    if (const auto rename_all = n.extension("rename-all")) {
        const auto rule_name = as_text(doc_.get(*rename_all));
        const auto rule = rule_name ? parse_rename_rule(*rule_name) : std::nullopt;
        if (!rule) {
            return fail(schema_error_kind::MalformedConstraint, extension_path(path, "rename-all"),
                        "$rename-all must be one of camelCase, snake_case, kebab-case, PascalCase, lowercase, UPPERCASE");
        }
        naming.rename_all = *rule;
    }
    return {};
}

std::expected<schema_node_id, schema_error> schema_extractor::extract_node(eure::node_id id, const eure::eure_path& path, position where) {
    spdlog::trace("Extracting schema at {}", path.to_string());

    auto base = extract_base(id, path, where);
    if (!base) {
        return base;
    }
    if (auto status = apply_constraints(*base, id, path); !status) {
        return std::unexpected(status.error());
    }
    if (auto status = apply_metadata(*base, id, path, where); !status) {
        return std::unexpected(status.error());
    }
    return base;
}

std::expected<schema_node_id, schema_error> schema_extractor::extract_base(eure::node_id id, const eure::eure_path& path, position where) {
    const auto& n = doc_.get(id);

    std::vector<std::string_view> present;
    for (const auto name : base_annotations) {
        if (n.extension(name)) {
            present.push_back(name);
        }
    }
    const auto content_type = content_type_expression(id);

    if (present.size() > 1) {
        return fail(schema_error_kind::ConflictingTypeAnnotation, path,
                    "$" + std::string(present[0]) + " and $" + std::string(present[1]) + " cannot be combined");
    }
    if (!present.empty() && content_type) {
        return fail(schema_error_kind::ConflictingTypeAnnotation, path,
                    "$" + std::string(present[0]) + " conflicts with the inline type expression " + eure::describe(*n.as_primitive()));
    }

    if (present.empty()) {
        if (content_type) {
            return add_expression(*content_type, path);
        }
        if (const auto* tuple = n.as_tuple(); tuple && is_declared(id)) {
            tuple_schema result;
            for (std::size_t i = 0; i < tuple->elements.size(); ++i) {
                const auto element = tuple->elements[i];
                if (!is_declared(element)) {
                    result.elements.push_back(schema_.add(any_schema{}));
                    continue;
                }
                auto element_schema = extract_node(element, path.child(eure::tuple_index_segment{static_cast<std::uint8_t>(i)}), position::Nested);
                if (!element_schema) {
                    return element_schema;
                }
                result.elements.push_back(*element_schema);
            }
            return schema_.add(std::move(result));
        }
        if (n.as_map() && (where == position::Variant || is_declared(id))) {
            return extract_record(id, path);
        }
        return schema_.add(any_schema{});
    }

    const auto annotation = present.front();
    const auto child = *n.extension(annotation);
    const auto child_path = extension_path(path, annotation);

    if (annotation == "type") {
        return extract_type_annotation(child, child_path);
    }
    if (annotation == "array") {
        auto item = extract_node(child, child_path, position::Nested);
        if (!item) {
            return item;
        }
        return schema_.add(array_schema{*item, std::nullopt, std::nullopt, false});
    }
    if (annotation == "map") {
        const auto* declaration = doc_.get(child).as_map();
        const auto key = declaration ? declaration->find_field("key") : std::nullopt;
        const auto value = declaration ? declaration->find_field("value") : std::nullopt;
        if (!key || !value) {
            return fail(schema_error_kind::InvalidTypeExpression, child_path, "$map needs both 'key' and 'value' declarations");
        }
        auto key_schema = extract_node(*key, child_path.child(eure::ident_segment{"key"}), position::Nested);
        if (!key_schema) {
            return key_schema;
        }
        auto value_schema = extract_node(*value, child_path.child(eure::ident_segment{"value"}), position::Nested);
        if (!value_schema) {
            return value_schema;
        }
        return schema_.add(map_schema{*key_schema, *value_schema, std::nullopt, std::nullopt});
    }
    if (annotation == "literal") {
        auto expected = doc_.to_value(child);
        expected.extensions.clear();
        return schema_.add(literal_schema{std::move(expected)});
    }
    return extract_union(id, path);
}

std::expected<schema_node_id, schema_error> schema_extractor::extract_type_annotation(eure::node_id id, const eure::eure_path& path) {
    const auto& n = doc_.get(id);

    if (const auto* tuple = n.as_tuple()) {
        tuple_schema result;
        for (std::size_t i = 0; i < tuple->elements.size(); ++i) {
            auto element = extract_type_annotation(tuple->elements[i], path.child(eure::tuple_index_segment{static_cast<std::uint8_t>(i)}));
            if (!element) {
                return element;
            }
            result.elements.push_back(*element);
        }
        return schema_.add(std::move(result));
    }

    const auto expression_text = as_text(n);
    if (!expression_text) {
        return fail(schema_error_kind::InvalidTypeExpression, path, "$type expects a type expression, found " + std::string(eure::node_kind_name(n)));
    }
    const auto expression = parse_type_expression(*expression_text);
    if (!expression) {
        return fail(schema_error_kind::InvalidTypeExpression, path, "'" + *expression_text + "' is not a type expression");
    }
    return add_expression(*expression, path);
}

std::expected<schema_node_id, schema_error> schema_extractor::extract_record(eure::node_id id, const eure::eure_path& path) {
    const auto& map = *doc_.get(id).as_map();
    record_schema record;
    std::unordered_set<std::string> seen;

    for (const auto& [key, child] : map.entries) {
        const auto child_path = path.child(eure::segment_for(key));
        const auto name = key.field_name();
        if (!name) {
            if (is_declared(child)) {
                spdlog::warn("Ignoring declaration under non-text key at {}", child_path.to_string());
            }
            continue;
        }
        if (!seen.insert(std::string(*name)).second) {
            return fail(schema_error_kind::DuplicateField, child_path, "field '" + std::string(*name) + "' is declared more than once");
        }
        if (!is_declared(child)) {
            continue;
        }

        auto field_schema = extract_node(child, child_path, position::Nested);
        if (!field_schema) {
            return field_schema;
        }

        bool optional = false;
        if (const auto flag = doc_.get(child).extension("optional")) {
            const auto value = as_bool(doc_.get(*flag));
            if (!value) {
                return fail(schema_error_kind::MalformedConstraint, extension_path(child_path, "optional"), "$optional must be a boolean");
            }
            optional = *value;
        }
        record.fields.push_back(record_field{std::string(*name), *field_schema, optional});
    }

    if (const auto policy = doc_.get(id).extension("unknown-fields")) {
        const auto policy_name = as_text(doc_.get(*policy));
        if (policy_name == "allow") {
            record.unknown_fields = unknown_fields_policy::Allow;
        } else if (policy_name != "deny") {
            return fail(schema_error_kind::InvalidUnknownFieldsPolicy, extension_path(path, "unknown-fields"),
                        "$unknown-fields must be \"deny\" or \"allow\"");
        }
    }
    return schema_.add(std::move(record));
}

std::expected<schema_node_id, schema_error> schema_extractor::extract_union(eure::node_id owner, const eure::eure_path& owner_path) {
    const auto variants = *doc_.get(owner).extension("variants");
    const auto path = extension_path(owner_path, "variants");
    const auto* map = doc_.get(variants).as_map();
    if (!map) {
        return fail(schema_error_kind::InvalidTypeExpression, path, "$variants must be a map of variant declarations");
    }

    union_schema result;
    std::unordered_set<std::string> seen;
    for (const auto& [key, child] : map->entries) {
        const auto variant_path = path.child(eure::segment_for(key));
        const auto name = key.field_name();
        if (!name) {
            return fail(schema_error_kind::InvalidTypeExpression, variant_path, "variant names must be identifiers or text keys");
        }
        if (!seen.insert(std::string(*name)).second) {
            return fail(schema_error_kind::DuplicateVariant, variant_path, "variant '" + std::string(*name) + "' is declared more than once");
        }

        const auto& declaration = doc_.get(child);
        const auto* p = declaration.as_primitive();
        if (p && std::holds_alternative<eure::null_value>(*p)) {
            // null declares a unit variant
            result.variants.push_back(union_variant{std::string(*name), schema_.add(null_schema{})});
            continue;
        }

        auto variant_schema = extract_node(child, variant_path, position::Variant);
        if (!variant_schema) {
            return variant_schema;
        }
        const auto* record = std::get_if<record_schema>(&schema_.get(*variant_schema).content);
        if (declaration.is_hole() || (record && record->fields.empty())) {
            return fail(schema_error_kind::EmptyVariant, variant_path,
                        "variant '" + std::string(*name) + "' declares no fields, use null for a unit variant");
        }
        result.variants.push_back(union_variant{std::string(*name), *variant_schema});
    }

    if (result.variants.empty()) {
        return fail(schema_error_kind::EmptyVariant, path, "union declares no variants");
    }

    if (const auto repr = doc_.get(owner).extension("variant-repr")) {
        auto parsed = extract_variant_repr(*repr, extension_path(owner_path, "variant-repr"));
        if (!parsed) {
            return std::unexpected(parsed.error());
        }
        result.repr = std::move(*parsed);
    }
    return schema_.add(std::move(result));
}

std::expected<variant_repr, schema_error> schema_extractor::extract_variant_repr(eure::node_id id, const eure::eure_path& path) {
    const auto& n = doc_.get(id);

    if (const auto name = as_text(n)) {
        if (*name == "external") {
            return variant_repr{variant_repr_kind::External, {}, {}};
        }
        if (*name == "tagged") {
            return variant_repr{variant_repr_kind::Tagged, {}, {}};
        }
        return fail(schema_error_kind::InvalidVariantRepr, path, "unsupported variant representation '" + *name + "'");
    }

    const auto* map = n.as_map();
    if (!map) {
        return fail(schema_error_kind::InvalidVariantRepr, path, "$variant-repr must be text or a map with 'tag' and optional 'content'");
    }

    std::optional<std::string> tag;
    std::optional<std::string> content;
    for (const auto& [key, child] : map->entries) {
        const auto name = key.field_name();
        if (name == "tag") {
            tag = as_text(doc_.get(child));
        } else if (name == "content") {
            content = as_text(doc_.get(child));
            if (!content) {
                return fail(schema_error_kind::InvalidVariantRepr, path.child(eure::segment_for(key)), "'content' must be text");
            }
        } else {
            return fail(schema_error_kind::InvalidVariantRepr, path.child(eure::segment_for(key)), "unexpected key in $variant-repr");
        }
    }
    if (!tag) {
        return fail(schema_error_kind::InvalidVariantRepr, path, "$variant-repr needs a text 'tag'");
    }
    if (content) {
        if (*content == *tag) {
            return fail(schema_error_kind::InvalidVariantRepr, path, "'tag' and 'content' must differ");
        }
        return variant_repr{variant_repr_kind::Adjacent, std::move(*tag), std::move(*content)};
    }
    return variant_repr{variant_repr_kind::Internal, std::move(*tag), {}};
}

std::expected<void, schema_error> schema_extractor::apply_constraints(schema_node_id target, eure::node_id id, const eure::eure_path& path) {
    auto& content = schema_.get(target).content;
    const auto target_kind = std::string(kind_name(content));

    for (const auto& [name, child] : doc_.get(id).extensions) {
        const auto child_path = extension_path(path, name);
        const auto& value = doc_.get(child);
        auto malformed = [&](const std::string& message) {
            return fail(schema_error_kind::MalformedConstraint, child_path, "$" + name + " " + message);
        };
        auto not_applicable = [&]() {
            return malformed("does not apply to " + target_kind);
        };

        if (name == "length" || name == "min-length" || name == "max-length" || name == "pattern" || name == "language") {
            auto* text = std::get_if<text_schema>(&content);
            if (!text) {
                return not_applicable();
            }
            if (name == "length") {
                const auto* pair = value.as_tuple();
                if (!pair || pair->elements.size() != 2) {
                    return malformed("must be a (min, max) tuple");
                }
                const auto min = as_integer(doc_.get(pair->elements[0]));
                const auto max = as_integer(doc_.get(pair->elements[1]));
                if (!min || !max || *min < 0 || *max < *min) {
                    return malformed("must hold two non-negative integers with min <= max");
                }
                text->min_length = static_cast<std::size_t>(*min);
                text->max_length = static_cast<std::size_t>(*max);
            } else if (name == "pattern") {
                auto pattern = as_text(value);
                if (!pattern) {
                    return malformed("must be text");
                }
                try {
                    std::regex compiled(*pattern, std::regex::ECMAScript);
                } catch (const std::regex_error& e) {
                    return malformed("is not a valid regular expression: " + std::string(e.what()));
                }
                text->pattern = std::move(*pattern);
            } else if (name == "language") {
                auto language = as_text(value);
                if (!language) {
                    return malformed("must be text");
                }
                text->language = std::move(*language);
            } else {
                const auto length = as_integer(value);
                if (!length || *length < 0) {
                    return malformed("must be a non-negative integer");
                }
                (name == "min-length" ? text->min_length : text->max_length) = static_cast<std::size_t>(*length);
            }
            if (text->min_length && text->max_length && *text->min_length > *text->max_length) {
                return malformed("leaves an empty length range");
            }
        } else if (name == "range" || name == "minimum" || name == "maximum" || name == "exclusive-min" || name == "exclusive-max" || name == "multiple-of") {
            auto* integer = std::get_if<integer_schema>(&content);
            auto* floating = std::get_if<float_schema>(&content);
            if (!integer && !floating) {
                return not_applicable();
            }

            auto read_number = [&](const eure::node& n) -> std::optional<number> {
                if (integer) {
                    if (const auto i = as_integer(n)) {
                        return number{*i};
                    }
                    return std::nullopt;
                }
                return as_number(n);
            };
            const std::string expected_kind = integer ? "an integer" : "a number";

            if (name == "range") {
                const auto* pair = value.as_tuple();
                if (!pair || pair->elements.size() != 2) {
                    return malformed("must be a (min, max) tuple");
                }
                const auto min = read_number(doc_.get(pair->elements[0]));
                const auto max = read_number(doc_.get(pair->elements[1]));
                if (!min || !max) {
                    return malformed("bounds must be " + expected_kind);
                }
                auto& lower = integer ? integer->min : floating->min;
                auto& upper = integer ? integer->max : floating->max;
                lower = bound{*min, false};
                upper = bound{*max, false};
            } else if (name == "multiple-of") {
                const auto divisor = read_number(value);
                if (!divisor || !is_positive(*divisor)) {
                    return malformed("must be " + expected_kind + " greater than zero");
                }
                if (integer) {
                    integer->multiple_of = std::get<std::int64_t>(*divisor);
                } else {
                    floating->multiple_of = *divisor;
                }
            } else {
                const auto limit = read_number(value);
                if (!limit) {
                    return malformed("must be " + expected_kind);
                }
                const bool lower_bound = name == "minimum" || name == "exclusive-min";
                const bool exclusive = name == "exclusive-min" || name == "exclusive-max";
                auto& slot = integer ? (lower_bound ? integer->min : integer->max) : (lower_bound ? floating->min : floating->max);
                slot = bound{*limit, exclusive};
            }
        } else if (name == "min-items" || name == "max-items" || name == "unique") {
            auto* array = std::get_if<array_schema>(&content);
            if (!array) {
                return not_applicable();
            }
            if (name == "unique") {
                const auto unique = as_bool(value);
                if (!unique) {
                    return malformed("must be a boolean");
                }
                array->unique = *unique;
                continue;
            }
            const auto count = as_integer(value);
            if (!count || *count < 0) {
                return malformed("must be a non-negative integer");
            }
            (name == "min-items" ? array->min_items : array->max_items) = static_cast<std::size_t>(*count);
            if (array->min_items && array->max_items && *array->min_items > *array->max_items) {
                return malformed("leaves an empty item count range");
            }
        } else if (name == "min-size" || name == "max-size") {
            auto* map = std::get_if<map_schema>(&content);
            if (!map) {
                return not_applicable();
            }
            const auto count = as_integer(value);
            if (!count || *count < 0) {
                return malformed("must be a non-negative integer");
            }
            (name == "min-size" ? map->min_size : map->max_size) = static_cast<std::size_t>(*count);
        } else if (name == "unknown-fields") {
            if (!std::holds_alternative<record_schema>(content)) {
                return not_applicable();
            }
        } else if (name == "variant-repr") {
            if (!std::holds_alternative<union_schema>(content)) {
                return fail(schema_error_kind::InvalidVariantRepr, child_path, "$variant-repr requires $variants on the same node");
            }
        }
    }
    return {};
}

std::expected<void, schema_error> schema_extractor::apply_metadata(schema_node_id target, eure::node_id id, const eure::eure_path& path, position where) {
    auto& metadata = schema_.get(target).metadata;

    for (const auto& [name, child] : doc_.get(id).extensions) {
        const auto child_path = extension_path(path, name);
        const auto& value = doc_.get(child);

        if (name == "description") {
            auto description = as_text(value);
            if (!description) {
                return fail(schema_error_kind::MalformedConstraint, child_path, "$description must be text");
            }
            metadata.description = std::move(*description);
        } else if (name == "deprecated") {
            const auto deprecated = as_bool(value);
            if (!deprecated) {
                return fail(schema_error_kind::MalformedConstraint, child_path, "$deprecated must be a boolean");
            }
            metadata.deprecated = *deprecated;
        } else if (name == "default") {
            metadata.default_value = doc_.to_value(child);
        } else if (name == "examples") {
            const auto* examples = value.as_array();
            if (!examples) {
                return fail(schema_error_kind::MalformedConstraint, child_path, "$examples must be an array");
            }
            for (const auto example : examples->elements) {
                metadata.examples.push_back(doc_.to_value(example));
            }
        } else if ((name == "rename" || name == "rename-all") && where != position::Nested && where != position::Variant) {
            // Naming options of the root and of named types are read by extract_naming
            continue;
        } else if (!is_recognised(name)) {
            spdlog::warn("Keeping unknown extension ${} at {} as metadata", name, path.to_string());
            metadata.extensions.emplace_back(name, doc_.to_value(child));
        }
    }
    return {};
}

schema_node_id schema_extractor::add_expression(const type_expression& expression, const eure::eure_path& path) {
    using kind = type_expression::kind;
    switch (expression.type) {
        case kind::Text: return schema_.add(text_schema{});
        case kind::Integer: return schema_.add(integer_schema{});
        case kind::Float: return schema_.add(float_schema{});
        case kind::Boolean: return schema_.add(boolean_schema{});
        case kind::Null: return schema_.add(null_schema{});
        case kind::Any: return schema_.add(any_schema{});
        case kind::Reference: break;
    }
    references_.emplace_back(expression.name, path);
    return schema_.add(reference_schema{expression.name});
}

std::optional<type_expression> schema_extractor::content_type_expression(eure::node_id id) const {
    const auto* p = doc_.get(id).as_primitive();
    const auto* t = p ? std::get_if<eure::text>(p) : nullptr;
    if (!t || t->language != eure::language_kind::Implicit) {
        return std::nullopt;
    }
    return parse_type_expression(t->content);
}

bool schema_extractor::is_declared(eure::node_id id) {
    if (declared_cache_[id.index()] >= 0) {
        return declared_cache_[id.index()] == 1;
    }

    const auto& n = doc_.get(id);
    bool declared = std::any_of(n.extensions.begin(), n.extensions.end(), [](const auto& extension) {
        const auto& name = extension.first;
        return name == "optional" || std::find(base_annotations.begin(), base_annotations.end(), name) != base_annotations.end();
    });
    if (!declared) {
        declared = content_type_expression(id).has_value();
    }
    if (!declared) {
        if (const auto* map = n.as_map()) {
            declared = std::any_of(map->entries.begin(), map->entries.end(), [this](const auto& entry) { return is_declared(entry.second); });
        } else if (const auto* tuple = n.as_tuple()) {
            declared = std::any_of(tuple->elements.begin(), tuple->elements.end(), [this](eure::node_id element) { return is_declared(element); });
        }
    }

    declared_cache_[id.index()] = declared ? 1 : 0;
    return declared;
}

bool schema_extractor::contains_data(eure::node_id id) const {
    const auto& n = doc_.get(id);
    if (n.is_hole()) {
        return false;
    }
    if (n.as_primitive()) {
        return !content_type_expression(id);
    }
    if (const auto* map = n.as_map()) {
        return std::any_of(map->entries.begin(), map->entries.end(), [this](const auto& entry) { return contains_data(entry.second); });
    }
    if (const auto* tuple = n.as_tuple()) {
        return std::any_of(tuple->elements.begin(), tuple->elements.end(), [this](eure::node_id element) { return contains_data(element); });
    }
    const auto& elements = n.as_array()->elements;
    return elements.empty() || std::any_of(elements.begin(), elements.end(), [this](eure::node_id element) { return contains_data(element); });
}

} // namespace eure_schema
