#include "validation-walker.hpp"

namespace eure_schema {

namespace {

eure::path_segment field_segment(const std::string& name) {
    if (eure::is_identifier(name)) {
        return eure::ident_segment{name};
    }
    return eure::key_segment{name};
}

} // namespace

validation_walker::status validation_walker::check(const record_schema& schema, eure::node_id node, const eure::eure_path& path) {
    return check_record(schema, node, path, std::nullopt);
}

validation_walker::status validation_walker::check_record(const record_schema& schema,
                                                          eure::node_id node,
                                                          const eure::eure_path& path,
                                                          std::optional<std::string_view> excluded) {
    const auto& n = doc_.get(node);
    const auto* map = n.as_map();
    if (!map) {
        report_type_mismatch("record", n, path);
        return {};
    }

    for (const auto& field : schema.fields) {
        const auto child = map->find_field(field.name);
        if (!child) {
            if (!field.optional) {
                report(validation_error_kind::MissingField, path.child(field_segment(field.name)), "missing required field '" + field.name + "'");
            }
            continue;
        }
        if (auto status = validate(*child, field.schema, path.child(field_segment(field.name))); !status) {
            return status;
        }
    }

    if (schema.unknown_fields == unknown_fields_policy::Allow) {
        return {};
    }
    for (const auto& [key, child] : map->entries) {
        const auto name = key.field_name();
        if (name && (name == excluded || schema.find(*name))) {
            continue;
        }
        const auto label = name ? std::string(*name) : eure::to_string(key.value);
        report(validation_error_kind::UnknownField, path.child(eure::segment_for(key)), "unknown field '" + label + "'");
    }
    return {};
}

} // namespace eure_schema
