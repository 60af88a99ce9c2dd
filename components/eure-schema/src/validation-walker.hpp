#ifndef EURE_SCHEMA_VALIDATION_WALKER_HPP
#define EURE_SCHEMA_VALIDATION_WALKER_HPP

#include "validator.hpp"
#include <map>
#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>

namespace eure_schema {

/**
 * @brief Walks one document against one schema
 *
 * The structural pass (validate) checks every node, recording the variant
 * chosen for each union it meets. The completeness pass (complete) reuses
 * those choices to find holes where a value is required.
 */
class validation_walker {
public:
    using status = std::expected<void, validator_error>;

    validation_walker(const eure::document& doc, const schema_document& schema, const validation_options& options);

    status validate(eure::node_id node, schema_node_id schema, const eure::eure_path& path);
    status complete(eure::node_id node, schema_node_id schema, const eure::eure_path& path, bool optional);

    validation_result take_result() { return std::move(result_); }

private:
    struct union_selection {
        schema_node_id variant;
        eure::node_id target;
        eure::eure_path path;
    };

    class depth_guard {
    public:
        explicit depth_guard(std::size_t& depth) : depth_(depth) { ++depth_; }
        ~depth_guard() { --depth_; }

    private:
        std::size_t& depth_;
    };

    // One overload per schema kind, selected by std::visit in validate()
    status check(const text_schema& schema, eure::node_id node, const eure::eure_path& path);
    status check(const integer_schema& schema, eure::node_id node, const eure::eure_path& path);
    status check(const float_schema& schema, eure::node_id node, const eure::eure_path& path);
    status check(const boolean_schema& schema, eure::node_id node, const eure::eure_path& path);
    status check(const null_schema& schema, eure::node_id node, const eure::eure_path& path);
    status check(const any_schema& schema, eure::node_id node, const eure::eure_path& path);
    status check(const literal_schema& schema, eure::node_id node, const eure::eure_path& path);
    status check(const record_schema& schema, eure::node_id node, const eure::eure_path& path);
    status check(const array_schema& schema, eure::node_id node, const eure::eure_path& path);
    status check(const map_schema& schema, eure::node_id node, const eure::eure_path& path);
    status check(const tuple_schema& schema, eure::node_id node, const eure::eure_path& path);
    status check(const union_schema& schema, eure::node_id node, const eure::eure_path& path);
    status check(const reference_schema& schema, eure::node_id node, const eure::eure_path& path);

    status check_text_value(const text_schema& schema, const eure::text& value, const eure::eure_path& path);
    void check_integer_value(const integer_schema& schema, std::int64_t value, const eure::eure_path& path);
    status check_record(const record_schema& schema, eure::node_id node, const eure::eure_path& path, std::optional<std::string_view> excluded);
    status check_key(schema_node_id key_schema, const eure::object_key& key, const eure::eure_path& path);

    // Union dispatch, see union-schema.cpp
    status select_variant(const union_schema& schema, eure::node_id owner, std::string_view name, eure::node_id target,
                          const eure::eure_path& target_path, const eure::eure_path& tag_path, std::optional<std::string_view> excluded);
    status validate_variant(schema_node_id variant, eure::node_id target, const eure::eure_path& path, std::optional<std::string_view> excluded);
    status missing_tag(const union_schema& schema, eure::node_id owner, eure::node_id target, const eure::eure_path& path,
                       std::optional<std::string_view> excluded);
    status infer_variant(const union_schema& schema, eure::node_id owner, eure::node_id target, const eure::eure_path& path,
                         std::optional<std::string_view> excluded);

    /**
     * @brief Follow references until a non-reference node
     *
     * Returns nullopt for a name missing from the registry, reporting
     * DanglingReference when `report_dangling` is set.
     */
    std::expected<std::optional<schema_node_id>, validator_error> resolve(schema_node_id id, const eure::eure_path& path, bool report_dangling = true);
    std::expected<const std::regex*, validator_error> compiled_pattern(const std::string& pattern, const eure::eure_path& path);

    void report(validation_error_kind kind, const eure::eure_path& path, std::string title);
    void report_type_mismatch(std::string_view expected, const eure::node& found, const eure::eure_path& path);
    void warn(validation_warning_kind kind, const eure::eure_path& path, std::string title);

    // Scratch walker used to try a variant without touching this walker's findings
    validation_walker fork() const;

    const eure::document& doc_;
    const schema_document& schema_;
    validation_options options_;
    validation_result result_;
    std::size_t depth_ = 0;
    std::map<std::pair<std::size_t, const union_schema*>, union_selection> selections_;
    std::unordered_map<std::string, std::regex> patterns_;
};

} // namespace eure_schema

#endif // EURE_SCHEMA_VALIDATION_WALKER_HPP
