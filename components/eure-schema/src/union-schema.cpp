#include "validation-walker.hpp"
#include "spdlog/spdlog.h"
#include <algorithm>

namespace eure_schema {

namespace {

std::optional<std::string> text_of(const eure::node& n) {
    const auto* p = n.as_primitive();
    if (!p) {
        return std::nullopt;
    }
    if (const auto* t = std::get_if<eure::text>(p)) {
        return t->content;
    }
    return std::nullopt;
}

eure::path_segment field_segment(const std::string& name) {
    if (eure::is_identifier(name)) {
        return eure::ident_segment{name};
    }
    return eure::key_segment{name};
}

std::string join_names(const std::vector<const union_variant*>& variants) {
    std::string out;
    for (const auto* v : variants) {
        if (!out.empty()) {
            out += ", ";
        }
        out += v->name;
    }
    return out;
}

} // namespace

validation_walker::status validation_walker::check(const union_schema& schema, eure::node_id node, const eure::eure_path& path) {
    const auto& n = doc_.get(node);
    const auto variant_path = path.child(eure::extension_segment{"variant"});

    // $variant is honoured in every representation
    std::optional<std::string> explicit_tag;
    if (const auto ext = n.extension("variant")) {
        explicit_tag = text_of(doc_.get(*ext));
        if (!explicit_tag) {
            report(validation_error_kind::InvalidVariantTag, variant_path,
                   "$variant must be text, found " + std::string(eure::node_kind_name(doc_.get(*ext))));
            return {};
        }
    }

    auto conflicting = [&](const std::string& named) {
        if (explicit_tag && *explicit_tag != named) {
            report(validation_error_kind::ConflictingVariantTags, path,
                   "$variant names '" + *explicit_tag + "' but the value names '" + named + "'");
            return true;
        }
        return false;
    };

    switch (schema.repr.kind) {
        case variant_repr_kind::Tagged:
            break;

        case variant_repr_kind::External: {
            const auto* map = n.as_map();
            std::vector<std::size_t> matched;
            if (map) {
                for (std::size_t i = 0; i < map->entries.size(); ++i) {
                    const auto name = map->entries[i].first.field_name();
                    if (name && schema.find(*name)) {
                        matched.push_back(i);
                    }
                }
            }
            if (matched.size() > 1) {
                std::string names;
                for (const auto i : matched) {
                    names += (names.empty() ? "" : ", ") + std::string(*map->entries[i].first.field_name());
                }
                report(validation_error_kind::AmbiguousVariant, path, "value names several variants: " + names);
                return {};
            }
            if (matched.size() == 1) {
                const auto& [key, child] = map->entries[matched.front()];
                const std::string name(*key.field_name());
                if (conflicting(name)) {
                    return {};
                }
                for (std::size_t i = 0; i < map->entries.size(); ++i) {
                    if (i != matched.front()) {
                        const auto& other = map->entries[i].first;
                        const auto label = other.field_name() ? std::string(*other.field_name()) : eure::to_string(other.value);
                        report(validation_error_kind::UnknownField, path.child(eure::segment_for(other)), "unknown field '" + label + "'");
                    }
                }
                const auto content_path = path.child(eure::segment_for(key));
                return select_variant(schema, node, name, child, content_path, content_path, std::nullopt);
            }
            if (!explicit_tag) {
                // The wrapping key is required even in lenient mode
                report(validation_error_kind::MissingVariantTag, path, "expected exactly one key naming a variant");
                return {};
            }
            break;
        }

        case variant_repr_kind::Internal: {
            const auto* map = n.as_map();
            if (!map) {
                report_type_mismatch("map", n, path);
                return {};
            }
            const auto tag_child = map->find_field(schema.repr.tag);
            if (!tag_child) {
                break;
            }
            const auto tag_path = path.child(field_segment(schema.repr.tag));
            const auto tag = text_of(doc_.get(*tag_child));
            if (!tag) {
                report(validation_error_kind::InvalidVariantTag, tag_path,
                       "variant tag must be text, found " + std::string(eure::node_kind_name(doc_.get(*tag_child))));
                return {};
            }
            if (conflicting(*tag)) {
                return {};
            }
            return select_variant(schema, node, *tag, node, path, tag_path, schema.repr.tag);
        }

        case variant_repr_kind::Adjacent: {
            const auto* map = n.as_map();
            if (!map) {
                report_type_mismatch("map", n, path);
                return {};
            }
            for (const auto& [key, child] : map->entries) {
                const auto name = key.field_name();
                if (!name || (*name != schema.repr.tag && *name != schema.repr.content)) {
                    const auto label = name ? std::string(*name) : eure::to_string(key.value);
                    report(validation_error_kind::UnknownField, path.child(eure::segment_for(key)), "unknown field '" + label + "'");
                }
            }

            const auto tag_child = map->find_field(schema.repr.tag);
            const auto content_child = map->find_field(schema.repr.content);
            const auto content_path = path.child(field_segment(schema.repr.content));
            auto tag_path = variant_path;
            std::optional<std::string> tag = explicit_tag;
            if (tag_child) {
                tag_path = path.child(field_segment(schema.repr.tag));
                tag = text_of(doc_.get(*tag_child));
                if (!tag) {
                    report(validation_error_kind::InvalidVariantTag, tag_path,
                           "variant tag must be text, found " + std::string(eure::node_kind_name(doc_.get(*tag_child))));
                    return {};
                }
                if (conflicting(*tag)) {
                    return {};
                }
            }

            if (!tag) {
                if (!content_child) {
                    report(validation_error_kind::MissingVariantTag, path, "missing tag field '" + schema.repr.tag + "'");
                    return {};
                }
                return missing_tag(schema, node, *content_child, content_path, std::nullopt);
            }

            if (content_child) {
                return select_variant(schema, node, *tag, *content_child, content_path, tag_path, std::nullopt);
            }

            // Only unit variants may omit the content field
            const auto* variant = schema.find(*tag);
            if (!variant) {
                report(validation_error_kind::UnknownVariant, tag_path, "unknown variant '" + *tag + "'");
                return {};
            }
            auto resolved = resolve(variant->schema, path);
            if (!resolved) {
                return std::unexpected(resolved.error());
            }
            if (*resolved && !std::holds_alternative<null_schema>(schema_.get(**resolved).content)) {
                report(validation_error_kind::MissingField, content_path, "missing content field '" + schema.repr.content + "'");
            }
            return {};
        }
    }

    if (explicit_tag) {
        return select_variant(schema, node, *explicit_tag, node, path, variant_path, std::nullopt);
    }
    return missing_tag(schema, node, node, path, std::nullopt);
}

validation_walker::status validation_walker::select_variant(const union_schema& schema,
                                                            eure::node_id owner,
                                                            std::string_view name,
                                                            eure::node_id target,
                                                            const eure::eure_path& target_path,
                                                            const eure::eure_path& tag_path,
                                                            std::optional<std::string_view> excluded) {
    const auto* variant = schema.find(name);
    if (!variant) {
        report(validation_error_kind::UnknownVariant, tag_path, "unknown variant '" + std::string(name) + "'");
        return {};
    }
    selections_.insert_or_assign(std::make_pair(owner.index(), &schema), union_selection{variant->schema, target, target_path});
    return validate_variant(variant->schema, target, target_path, excluded);
}

validation_walker::status validation_walker::validate_variant(schema_node_id variant,
                                                              eure::node_id target,
                                                              const eure::eure_path& path,
                                                              std::optional<std::string_view> excluded) {
    if (!excluded) {
        return validate(target, variant, path);
    }

    // The tag field shares the map with the variant's own fields
    auto resolved = resolve(variant, path);
    if (!resolved) {
        return std::unexpected(resolved.error());
    }
    if (!*resolved) {
        return {};
    }
    const auto& content = schema_.get(**resolved).content;
    if (const auto* record = std::get_if<record_schema>(&content)) {
        return check_record(*record, target, path, excluded);
    }
    if (std::holds_alternative<null_schema>(content)) {
        if (const auto* map = doc_.get(target).as_map()) {
            for (const auto& [key, child] : map->entries) {
                const auto name = key.field_name();
                if (name && *name == *excluded) {
                    continue;
                }
                const auto label = name ? std::string(*name) : eure::to_string(key.value);
                report(validation_error_kind::UnknownField, path.child(eure::segment_for(key)), "unknown field '" + label + "'");
            }
        }
        return {};
    }
    return validate(target, variant, path);
}

validation_walker::status validation_walker::missing_tag(const union_schema& schema,
                                                         eure::node_id owner,
                                                         eure::node_id target,
                                                         const eure::eure_path& path,
                                                         std::optional<std::string_view> excluded) {
    if (options_.tag_mode == union_tag_mode::Lenient) {
        return infer_variant(schema, owner, target, path, excluded);
    }

    // External values without a variant key are rejected by check()
    if (schema.repr.kind == variant_repr_kind::Tagged) {
        report(validation_error_kind::MissingVariantTag, path, "missing $variant tag");
    } else {
        report(validation_error_kind::MissingVariantTag, path, "missing tag field '" + schema.repr.tag + "'");
    }
    return {};
}

validation_walker::status validation_walker::infer_variant(const union_schema& schema,
                                                           eure::node_id owner,
                                                           eure::node_id target,
                                                           const eure::eure_path& path,
                                                           std::optional<std::string_view> excluded) {
    const auto* map = doc_.get(target).as_map();
    std::vector<std::string_view> present;
    if (map) {
        for (const auto& [key, child] : map->entries) {
            const auto name = key.field_name();
            if (name && name != excluded) {
                present.push_back(*name);
            }
        }
    }
    auto is_present = [&](std::string_view name) {
        return std::find(present.begin(), present.end(), name) != present.end();
    };

    std::vector<const union_variant*> candidates;
    std::vector<const union_variant*> covering;
    for (const auto& variant : schema.variants) {
        auto trial = fork();
        auto resolved = trial.resolve(variant.schema, path);
        if (!resolved) {
            return std::unexpected(resolved.error());
        }
        if (!*resolved) {
            continue;
        }

        const auto* record = std::get_if<record_schema>(&schema_.get(**resolved).content);
        if (record && map) {
            // Records compete on field names alone
            const bool required_present = std::all_of(record->fields.begin(), record->fields.end(),
                                                      [&](const record_field& f) { return f.optional || is_present(f.name); });
            if (!required_present) {
                continue;
            }
            candidates.push_back(&variant);
            if (std::all_of(present.begin(), present.end(), [&](std::string_view name) { return record->find(name) != nullptr; })) {
                covering.push_back(&variant);
            }
            continue;
        }

        if (auto status = trial.validate_variant(variant.schema, target, path, excluded); !status) {
            return status;
        }
        if (trial.result_.errors.empty()) {
            candidates.push_back(&variant);
        }
    }

    if (candidates.empty()) {
        report(validation_error_kind::NoVariantMatched, path, "value matches none of the variants");
        return {};
    }

    const union_variant* chosen = nullptr;
    if (candidates.size() == 1) {
        chosen = candidates.front();
    } else if (covering.size() == 1) {
        chosen = covering.front();
    }
    if (!chosen) {
        report(validation_error_kind::AmbiguousVariant, path, "value matches several variants: " + join_names(candidates));
        return {};
    }

    spdlog::debug("Inferred variant '{}' at {}", chosen->name, path.to_string());
    return select_variant(schema, owner, chosen->name, target, path, path, excluded);
}

} // namespace eure_schema
