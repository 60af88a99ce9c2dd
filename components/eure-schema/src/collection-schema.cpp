#include "validation-walker.hpp"
#include <algorithm>

namespace eure_schema {

namespace {

std::string count_range(const std::optional<std::size_t>& min, const std::optional<std::size_t>& max) {
    return "[" + (min ? std::to_string(*min) : std::string("0")) + ", " + (max ? std::to_string(*max) : std::string("inf")) + "]";
}

bool outside(std::size_t count, const std::optional<std::size_t>& min, const std::optional<std::size_t>& max) {
    return (min && count < *min) || (max && count > *max);
}

} // namespace

validation_walker::status validation_walker::check(const array_schema& schema, eure::node_id node, const eure::eure_path& path) {
    const auto& n = doc_.get(node);
    const auto* array = n.as_array();
    if (!array) {
        report_type_mismatch("array", n, path);
        return {};
    }

    const auto count = array->elements.size();
    if (outside(count, schema.min_items, schema.max_items)) {
        report(validation_error_kind::ArrayLengthOutOfBounds, path,
               "array has " + std::to_string(count) + " items, expected " + count_range(schema.min_items, schema.max_items));
    }

    for (std::size_t i = 0; i < count; ++i) {
        if (auto status = validate(array->elements[i], schema.item, path.child(eure::array_index_segment{i})); !status) {
            return status;
        }
    }

    if (schema.unique) {
        std::vector<eure::value> seen;
        seen.reserve(count);
        for (std::size_t i = 0; i < count; ++i) {
            auto item = doc_.to_value(array->elements[i]);
            for (std::size_t j = 0; j < seen.size(); ++j) {
                if (seen[j] == item) {
                    report(validation_error_kind::NotUnique, path.child(eure::array_index_segment{i}),
                           "item duplicates item " + std::to_string(j));
                    break;
                }
            }
            seen.push_back(std::move(item));
        }
    }
    return {};
}

validation_walker::status validation_walker::check(const map_schema& schema, eure::node_id node, const eure::eure_path& path) {
    const auto& n = doc_.get(node);
    const auto* map = n.as_map();
    if (!map) {
        report_type_mismatch("map", n, path);
        return {};
    }

    const auto count = map->entries.size();
    if (outside(count, schema.min_size, schema.max_size)) {
        report(validation_error_kind::MapSizeOutOfBounds, path,
               "map has " + std::to_string(count) + " entries, expected " + count_range(schema.min_size, schema.max_size));
    }

    for (const auto& [key, child] : map->entries) {
        const auto child_path = path.child(eure::segment_for(key));
        if (auto status = check_key(schema.key, key, child_path); !status) {
            return status;
        }
        if (auto status = validate(child, schema.value, child_path); !status) {
            return status;
        }
    }
    return {};
}

validation_walker::status validation_walker::check_key(schema_node_id key_schema, const eure::object_key& key, const eure::eure_path& path) {
    auto resolved = resolve(key_schema, path);
    if (!resolved) {
        return std::unexpected(resolved.error());
    }
    if (!*resolved) {
        return {};
    }

    const auto& content = schema_.get(**resolved).content;
    const auto* text_key = std::get_if<std::string>(&key.value);
    auto invalid = [&]() {
        report(validation_error_kind::InvalidKey, path,
               "key " + eure::to_string(key.value) + " does not fit the " + std::string(kind_name(content)) + " key type");
    };

    if (std::holds_alternative<any_schema>(content)) {
        return {};
    }
    if (const auto* text = std::get_if<text_schema>(&content)) {
        if (!text_key) {
            invalid();
            return {};
        }
        return check_text_value(*text, eure::text::plaintext(*text_key), path);
    }
    if (const auto* integer = std::get_if<integer_schema>(&content)) {
        if (const auto* i = std::get_if<std::int64_t>(&key.value)) {
            check_integer_value(*integer, *i, path);
        } else {
            invalid();
        }
        return {};
    }
    if (std::holds_alternative<boolean_schema>(content)) {
        if (!std::holds_alternative<bool>(key.value)) {
            invalid();
        }
        return {};
    }
    if (const auto* literal = std::get_if<literal_schema>(&content)) {
        const auto* expected = literal->expected.as_primitive();
        bool matches = false;
        if (expected) {
            if (const auto* t = std::get_if<eure::text>(expected)) {
                matches = text_key && t->content == *text_key;
            } else if (const auto* i = std::get_if<std::int64_t>(expected)) {
                matches = std::holds_alternative<std::int64_t>(key.value) && std::get<std::int64_t>(key.value) == *i;
            } else if (const auto* b = std::get_if<bool>(expected)) {
                matches = std::holds_alternative<bool>(key.value) && std::get<bool>(key.value) == *b;
            }
        }
        if (!matches) {
            report(validation_error_kind::LiteralMismatch, path, "key " + eure::to_string(key.value) + " differs from the expected literal");
        }
        return {};
    }

    invalid();
    return {};
}

validation_walker::status validation_walker::check(const tuple_schema& schema, eure::node_id node, const eure::eure_path& path) {
    const auto& n = doc_.get(node);
    const auto* tuple = n.as_tuple();
    if (!tuple) {
        report_type_mismatch("tuple", n, path);
        return {};
    }

    const auto expected = schema.elements.size();
    const auto actual = tuple->elements.size();
    if (expected != actual) {
        report(validation_error_kind::ArityMismatch, path,
               "expected " + std::to_string(expected) + " elements, found " + std::to_string(actual));
    }

    const auto common = std::min(expected, actual);
    for (std::size_t i = 0; i < common; ++i) {
        const auto element_path = path.child(eure::tuple_index_segment{static_cast<std::uint8_t>(i)});
        if (auto status = validate(tuple->elements[i], schema.elements[i], element_path); !status) {
            return status;
        }
    }
    return {};
}

} // namespace eure_schema
