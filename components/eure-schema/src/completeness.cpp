#include "validation-walker.hpp"
#include <algorithm>

namespace eure_schema {

namespace {

eure::path_segment field_segment(const std::string& name) {
    if (eure::is_identifier(name)) {
        return eure::ident_segment{name};
    }
    return eure::key_segment{name};
}

} // namespace

// Second pass: a hole is an error only where a value is required
validation_walker::status validation_walker::complete(eure::node_id node, schema_node_id schema, const eure::eure_path& path, bool optional) {
    depth_guard guard(depth_);
    if (depth_ > options_.max_depth) {
        return {};
    }

    // Dangling references were already reported by the structural pass
    auto resolved = resolve(schema, path, false);
    if (!resolved) {
        return std::unexpected(resolved.error());
    }
    if (!*resolved) {
        return {};
    }
    const auto& content = schema_.get(**resolved).content;

    const auto& n = doc_.get(node);
    if (n.is_hole()) {
        if (!optional && !std::holds_alternative<any_schema>(content)) {
            report(validation_error_kind::MissingField, path, "required value is missing");
            result_.incomplete = true;
        }
        return {};
    }

    if (const auto* record = std::get_if<record_schema>(&content)) {
        const auto* map = n.as_map();
        if (!map) {
            return {};
        }
        for (const auto& field : record->fields) {
            if (const auto child = map->find_field(field.name)) {
                if (auto status = complete(*child, field.schema, path.child(field_segment(field.name)), field.optional); !status) {
                    return status;
                }
            }
        }
        return {};
    }

    if (const auto* array = std::get_if<array_schema>(&content)) {
        const auto* elements = n.as_array();
        if (!elements) {
            return {};
        }
        for (std::size_t i = 0; i < elements->elements.size(); ++i) {
            if (auto status = complete(elements->elements[i], array->item, path.child(eure::array_index_segment{i}), false); !status) {
                return status;
            }
        }
        return {};
    }

    if (const auto* map_type = std::get_if<map_schema>(&content)) {
        const auto* map = n.as_map();
        if (!map) {
            return {};
        }
        for (const auto& [key, child] : map->entries) {
            if (auto status = complete(child, map_type->value, path.child(eure::segment_for(key)), false); !status) {
                return status;
            }
        }
        return {};
    }

    if (const auto* tuple = std::get_if<tuple_schema>(&content)) {
        const auto* elements = n.as_tuple();
        if (!elements) {
            return {};
        }
        const auto common = std::min(tuple->elements.size(), elements->elements.size());
        for (std::size_t i = 0; i < common; ++i) {
            const auto element_path = path.child(eure::tuple_index_segment{static_cast<std::uint8_t>(i)});
            if (auto status = complete(elements->elements[i], tuple->elements[i], element_path, false); !status) {
                return status;
            }
        }
        return {};
    }

    if (const auto* variants = std::get_if<union_schema>(&content)) {
        // Only the variant chosen by the structural pass is inspected
        const auto it = selections_.find(std::make_pair(node.index(), variants));
        if (it == selections_.end()) {
            return {};
        }
        const auto selection = it->second;
        return complete(selection.target, selection.variant, selection.path, false);
    }
    return {};
}

} // namespace eure_schema
