#include "validator.hpp"
#include "validation-walker.hpp"
#include "spdlog/spdlog.h"
#include <algorithm>

namespace eure_schema {

std::string_view to_string(validation_error_kind kind) {
    switch (kind) {
        case validation_error_kind::TypeMismatch: return "TypeMismatch";
        case validation_error_kind::MissingField: return "MissingField";
        case validation_error_kind::UnknownField: return "UnknownField";
        case validation_error_kind::OutOfRange: return "OutOfRange";
        case validation_error_kind::NotMultipleOf: return "NotMultipleOf";
        case validation_error_kind::LengthOutOfBounds: return "LengthOutOfBounds";
        case validation_error_kind::PatternMismatch: return "PatternMismatch";
        case validation_error_kind::LanguageMismatch: return "LanguageMismatch";
        case validation_error_kind::ArrayLengthOutOfBounds: return "ArrayLengthOutOfBounds";
        case validation_error_kind::MapSizeOutOfBounds: return "MapSizeOutOfBounds";
        case validation_error_kind::NotUnique: return "NotUnique";
        case validation_error_kind::InvalidKey: return "InvalidKey";
        case validation_error_kind::LiteralMismatch: return "LiteralMismatch";
        case validation_error_kind::ArityMismatch: return "ArityMismatch";
        case validation_error_kind::MissingVariantTag: return "MissingVariantTag";
        case validation_error_kind::InvalidVariantTag: return "InvalidVariantTag";
        case validation_error_kind::UnknownVariant: return "UnknownVariant";
        case validation_error_kind::AmbiguousVariant: return "AmbiguousVariant";
        case validation_error_kind::NoVariantMatched: return "NoVariantMatched";
        case validation_error_kind::ConflictingVariantTags: return "ConflictingVariantTags";
        case validation_error_kind::DanglingReference: return "DanglingReference";
        case validation_error_kind::RecursionLimit: return "RecursionLimit";
    }
    return "Unknown";
}

std::string_view to_string(validation_warning_kind kind) {
    switch (kind) {
        case validation_warning_kind::Deprecated: return "Deprecated";
    }
    return "Unknown";
}

std::string_view to_string(validator_error_kind kind) {
    switch (kind) {
        case validator_error_kind::InvalidSchemaNode: return "InvalidSchemaNode";
        case validator_error_kind::ReferenceCycle: return "ReferenceCycle";
        case validator_error_kind::InvalidPattern: return "InvalidPattern";
    }
    return "Unknown";
}

validation_options validation_options::from_config(const eure::config& cfg) {
    return validation_options{cfg.tag_mode, cfg.max_depth, cfg.max_errors};
}

std::expected<validation_result, validator_error> validate_node(const eure::document& doc,
                                                                eure::node_id node,
                                                                const schema_document& schema,
                                                                schema_node_id schema_node,
                                                                const validation_options& options) {
    if (!schema.contains(schema_node)) {
        spdlog::error("Validation started from a schema node that does not exist");
        return std::unexpected(validator_error{validator_error_kind::InvalidSchemaNode, {}, "schema node does not exist"});
    }

    validation_walker walker(doc, schema, options);
    if (auto status = walker.validate(node, schema_node, {}); !status) {
        spdlog::error("Schema is unusable at {}: {}", status.error().path.to_string(), status.error().message);
        return std::unexpected(status.error());
    }
    if (auto status = walker.complete(node, schema_node, {}, false); !status) {
        spdlog::error("Schema is unusable at {}: {}", status.error().path.to_string(), status.error().message);
        return std::unexpected(status.error());
    }

    auto result = walker.take_result();
    spdlog::debug("Validation finished with {} errors and {} warnings", result.errors.size(), result.warnings.size());
    return result;
}

std::expected<validation_result, validator_error> validate(const eure::document& doc,
                                                           const schema_document& schema,
                                                           const validation_options& options) {
    return validate_node(doc, doc.root(), schema, schema.root(), options);
}

validation_walker::validation_walker(const eure::document& doc, const schema_document& schema, const validation_options& options)
    : doc_(doc)
    , schema_(schema)
    , options_(options)
{}

validation_walker validation_walker::fork() const {
    auto options = options_;
    options.max_errors = 1;
    validation_walker trial(doc_, schema_, options);
    trial.depth_ = depth_;
    return trial;
}

validation_walker::status validation_walker::validate(eure::node_id node, schema_node_id schema, const eure::eure_path& path) {
    depth_guard guard(depth_);
    if (depth_ > options_.max_depth) {
        report(validation_error_kind::RecursionLimit, path, "nesting exceeds " + std::to_string(options_.max_depth) + " levels");
        return {};
    }

    auto resolved = resolve(schema, path);
    if (!resolved) {
        return std::unexpected(resolved.error());
    }
    if (!*resolved) {
        return {};
    }

    const auto& n = doc_.get(node);
    // Holes are only reported by the completeness pass
    if (n.is_hole()) {
        return {};
    }

    const auto& target = schema_.get(**resolved);
    if (schema_.get(schema).metadata.deprecated || target.metadata.deprecated) {
        warn(validation_warning_kind::Deprecated, path, "deprecated value is used");
    }

    spdlog::trace("Validating {} against {}", path.to_string(), kind_name(target.content));
    return std::visit([&](const auto& content) { return check(content, node, path); }, target.content);
}

std::expected<std::optional<schema_node_id>, validator_error> validation_walker::resolve(schema_node_id id, const eure::eure_path& path, bool report_dangling) {
    if (!schema_.contains(id)) {
        return std::unexpected(validator_error{validator_error_kind::InvalidSchemaNode, path, "schema node does not exist"});
    }

    std::vector<std::size_t> chain;
    auto current = id;

    while (const auto* reference = std::get_if<reference_schema>(&schema_.get(current).content)) {
        if (std::find(chain.begin(), chain.end(), current.index()) != chain.end()) {
            spdlog::warn("Reference cycle through type '{}'", reference->name);
            return std::unexpected(validator_error{validator_error_kind::ReferenceCycle, path,
                                                   "type '" + reference->name + "' refers to itself without structure"});
        }
        chain.push_back(current.index());

        const auto target = schema_.find_type(reference->name);
        if (!target) {
            if (report_dangling) {
                report(validation_error_kind::DanglingReference, path, "type '" + reference->name + "' is not defined");
            }
            return std::optional<schema_node_id>{};
        }
        if (!schema_.contains(*target)) {
            return std::unexpected(validator_error{validator_error_kind::InvalidSchemaNode, path,
                                                   "type '" + reference->name + "' points to a missing schema node"});
        }
        current = *target;
    }
    return std::optional<schema_node_id>{current};
}

validation_walker::status validation_walker::check(const reference_schema& schema, eure::node_id, const eure::eure_path& path) {
    // resolve() never stops on a reference
    return std::unexpected(validator_error{validator_error_kind::InvalidSchemaNode, path, "unresolved reference to '" + schema.name + "'"});
}

std::expected<const std::regex*, validator_error> validation_walker::compiled_pattern(const std::string& pattern, const eure::eure_path& path) {
    if (auto it = patterns_.find(pattern); it != patterns_.end()) {
        return &it->second;
    }
    try {
        auto inserted = patterns_.emplace(pattern, std::regex(pattern, std::regex::ECMAScript));
        return &inserted.first->second;
    } catch (const std::regex_error& e) {
        return std::unexpected(validator_error{validator_error_kind::InvalidPattern, path,
                                               "pattern '" + pattern + "' does not compile: " + e.what()});
    }
}

void validation_walker::report(validation_error_kind kind, const eure::eure_path& path, std::string title) {
    if (options_.max_errors != 0 && result_.errors.size() >= options_.max_errors) {
        result_.truncated = true;
        return;
    }
    spdlog::trace("{} at {}: {}", to_string(kind), path.to_string(), title);
    result_.errors.push_back(validation_error{kind, path, std::move(title)});
}

void validation_walker::report_type_mismatch(std::string_view expected, const eure::node& found, const eure::eure_path& path) {
    report(validation_error_kind::TypeMismatch, path,
           "expected " + std::string(expected) + ", found " + std::string(eure::node_kind_name(found)));
}

void validation_walker::warn(validation_warning_kind kind, const eure::eure_path& path, std::string title) {
    result_.warnings.push_back(validation_warning{kind, path, std::move(title)});
}

} // namespace eure_schema
