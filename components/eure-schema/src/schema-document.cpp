#include "schema-document.hpp"
#include <set>

namespace eure_schema {

const record_field* record_schema::find(std::string_view name) const {
    for (const auto& field : fields) {
        if (field.name == name) {
            return &field;
        }
    }
    return nullptr;
}

const union_variant* union_schema::find(std::string_view name) const {
    for (const auto& variant : variants) {
        if (variant.name == name) {
            return &variant;
        }
    }
    return nullptr;
}

std::string_view kind_name(const schema_node_content& content) {
    struct namer {
        std::string_view operator()(const text_schema&) const { return "text"; }
        std::string_view operator()(const integer_schema&) const { return "integer"; }
        std::string_view operator()(const float_schema&) const { return "float"; }
        std::string_view operator()(const boolean_schema&) const { return "boolean"; }
        std::string_view operator()(const null_schema&) const { return "null"; }
        std::string_view operator()(const any_schema&) const { return "any"; }
        std::string_view operator()(const literal_schema&) const { return "literal"; }
        std::string_view operator()(const record_schema&) const { return "record"; }
        std::string_view operator()(const array_schema&) const { return "array"; }
        std::string_view operator()(const map_schema&) const { return "map"; }
        std::string_view operator()(const tuple_schema&) const { return "tuple"; }
        std::string_view operator()(const union_schema&) const { return "union"; }
        std::string_view operator()(const reference_schema&) const { return "reference"; }
    };
    return std::visit(namer{}, content);
}

std::optional<rename_rule> parse_rename_rule(std::string_view name) {
    if (name == "camelCase") return rename_rule::CamelCase;
    if (name == "snake_case") return rename_rule::SnakeCase;
    if (name == "kebab-case") return rename_rule::KebabCase;
    if (name == "PascalCase") return rename_rule::PascalCase;
    if (name == "lowercase") return rename_rule::LowerCase;
    if (name == "UPPERCASE") return rename_rule::UpperCase;
    return std::nullopt;
}

std::string_view to_string(rename_rule rule) {
    switch (rule) {
        case rename_rule::CamelCase: return "camelCase";
        case rename_rule::SnakeCase: return "snake_case";
        case rename_rule::KebabCase: return "kebab-case";
        case rename_rule::PascalCase: return "PascalCase";
        case rename_rule::LowerCase: return "lowercase";
        case rename_rule::UpperCase: return "UPPERCASE";
    }
    return "";
}

schema_node_id schema_document::add(schema_node_content content, schema_metadata metadata) {
    const schema_node_id id{nodes_.size()};
    nodes_.push_back(schema_node{std::move(content), std::move(metadata)});
    return id;
}

bool schema_document::define_type(std::string name, schema_node_id id) {
    if (type_index_.contains(name)) {
        return false;
    }
    type_index_.emplace(name, types_.size());
    types_.emplace_back(std::move(name), id);
    return true;
}

std::optional<schema_node_id> schema_document::find_type(std::string_view name) const {
    auto it = type_index_.find(std::string(name));
    if (it == type_index_.end()) {
        return std::nullopt;
    }
    return types_[it->second].second;
}

bool schema_document::remove_type(std::string_view name) {
    auto it = type_index_.find(std::string(name));
    if (it == type_index_.end()) {
        return false;
    }
    types_.erase(types_.begin() + static_cast<std::ptrdiff_t>(it->second));
    type_index_.clear();
    for (std::size_t i = 0; i < types_.size(); ++i) {
        type_index_.emplace(types_[i].first, i);
    }
    type_naming_.erase(std::string(name));
    return true;
}

namespace {

class equivalence_check {
public:
    equivalence_check(const schema_document& a, const schema_document& b) : a_(a), b_(b) {}

    bool same(schema_node_id x, schema_node_id y) {
        if (!a_.contains(x) || !b_.contains(y)) {
            return a_.contains(x) == b_.contains(y);
        }
        // Pairs already under comparison are assumed equal, which closes cycles
        if (!visited_.emplace(x.index(), y.index()).second) {
            return true;
        }
        const auto& nx = a_.get(x);
        const auto& ny = b_.get(y);
        return same_metadata(nx.metadata, ny.metadata) && same_content(nx.content, ny.content);
    }

private:
    static bool same_metadata(const schema_metadata& x, const schema_metadata& y) {
        return x.description == y.description && x.deprecated == y.deprecated && x.default_value == y.default_value
            && x.examples == y.examples && x.extensions == y.extensions;
    }

    bool same_content(const schema_node_content& x, const schema_node_content& y) {
        if (x.index() != y.index()) {
            return false;
        }

        if (const auto* rx = std::get_if<record_schema>(&x)) {
            const auto& ry = std::get<record_schema>(y);
            if (rx->unknown_fields != ry.unknown_fields || rx->fields.size() != ry.fields.size()) {
                return false;
            }
            for (std::size_t i = 0; i < rx->fields.size(); ++i) {
                const auto& fx = rx->fields[i];
                const auto& fy = ry.fields[i];
                if (fx.name != fy.name || fx.optional != fy.optional || !same(fx.schema, fy.schema)) {
                    return false;
                }
            }
            return true;
        }
        if (const auto* ax = std::get_if<array_schema>(&x)) {
            const auto& ay = std::get<array_schema>(y);
            return ax->min_items == ay.min_items && ax->max_items == ay.max_items && ax->unique == ay.unique
                && same(ax->item, ay.item);
        }
        if (const auto* mx = std::get_if<map_schema>(&x)) {
            const auto& my = std::get<map_schema>(y);
            return mx->min_size == my.min_size && mx->max_size == my.max_size && same(mx->key, my.key)
                && same(mx->value, my.value);
        }
        if (const auto* tx = std::get_if<tuple_schema>(&x)) {
            const auto& ty = std::get<tuple_schema>(y);
            if (tx->elements.size() != ty.elements.size()) {
                return false;
            }
            for (std::size_t i = 0; i < tx->elements.size(); ++i) {
                if (!same(tx->elements[i], ty.elements[i])) {
                    return false;
                }
            }
            return true;
        }
        if (const auto* ux = std::get_if<union_schema>(&x)) {
            const auto& uy = std::get<union_schema>(y);
            if (!(ux->repr == uy.repr) || ux->variants.size() != uy.variants.size()) {
                return false;
            }
            for (std::size_t i = 0; i < ux->variants.size(); ++i) {
                if (ux->variants[i].name != uy.variants[i].name || !same(ux->variants[i].schema, uy.variants[i].schema)) {
                    return false;
                }
            }
            return true;
        }
        if (const auto* lx = std::get_if<literal_schema>(&x)) {
            return lx->expected == std::get<literal_schema>(y).expected;
        }
        if (const auto* text = std::get_if<text_schema>(&x)) return *text == std::get<text_schema>(y);
        if (const auto* integer = std::get_if<integer_schema>(&x)) return *integer == std::get<integer_schema>(y);
        if (const auto* floating = std::get_if<float_schema>(&x)) return *floating == std::get<float_schema>(y);
        if (const auto* reference = std::get_if<reference_schema>(&x)) return *reference == std::get<reference_schema>(y);
        // boolean, null and any carry no data
        return true;
    }

    const schema_document& a_;
    const schema_document& b_;
    std::set<std::pair<std::size_t, std::size_t>> visited_;
};

} // namespace

bool schema_document::equivalent(const schema_document& other) const {
    if (types_.size() != other.types_.size() || global_naming_ != other.global_naming_) {
        return false;
    }

    std::map<std::string, naming_options> mine;
    std::map<std::string, naming_options> theirs;
    for (const auto& [name, naming] : type_naming_) {
        if (!naming.empty()) mine.emplace(name, naming);
    }
    for (const auto& [name, naming] : other.type_naming_) {
        if (!naming.empty()) theirs.emplace(name, naming);
    }
    if (mine != theirs) {
        return false;
    }

    equivalence_check check(*this, other);
    if (!check.same(root_, other.root_)) {
        return false;
    }
    for (const auto& [name, id] : types_) {
        auto counterpart = other.find_type(name);
        if (!counterpart || !check.same(id, *counterpart)) {
            return false;
        }
    }
    return true;
}

} // namespace eure_schema
