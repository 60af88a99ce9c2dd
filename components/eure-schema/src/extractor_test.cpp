#include "gtest/gtest.h"
#include "extractor.hpp"
#include "spdlog/sinks/ostream_sink.h"
#include "spdlog/spdlog.h"
#include <sstream>

using namespace eure_schema;

class ExtractorTest : public ::testing::Test {
protected:
    eure::node_id at(const std::string& path) {
        return builder.resolve_or_create(eure::eure_path::parse(path).value()).value();
    }
    void set(const std::string& path, eure::primitive value) {
        ASSERT_TRUE(builder.set_primitive(at(path), std::move(value))) << path;
    }
    // Inline type expression, `integer` in source
    void declare(const std::string& path, const std::string& expression) {
        set(path, eure::text::implicit(expression));
    }
    std::expected<extracted_schema, schema_error> extract_built() {
        doc = std::move(builder).finalize();
        return extract(*doc);
    }

    const schema_node& root_of(const extracted_schema& extracted) {
        return extracted.schema.get(extracted.schema.root());
    }
    const record_field& field_of(const extracted_schema& extracted, std::string_view name) {
        const auto* field = std::get<record_schema>(root_of(extracted).content).find(name);
        EXPECT_NE(field, nullptr) << name;
        return *field;
    }

    eure::document_builder builder;
    std::shared_ptr<const eure::document> doc;
};

TEST_F(ExtractorTest, TestParseTypeExpression) {
    using kind = type_expression::kind;
    EXPECT_EQ(parse_type_expression("text")->type, kind::Text);
    EXPECT_EQ(parse_type_expression("string")->type, kind::Text);
    EXPECT_EQ(parse_type_expression(".integer")->type, kind::Integer);
    EXPECT_EQ(parse_type_expression("bool")->type, kind::Boolean);
    EXPECT_EQ(parse_type_expression("any")->type, kind::Any);

    const auto reference = parse_type_expression("$types.Point");
    ASSERT_TRUE(reference);
    EXPECT_EQ(reference->type, kind::Reference);
    EXPECT_EQ(reference->name, "Point");
    EXPECT_EQ(parse_type_expression("Point")->name, "Point");

    EXPECT_FALSE(parse_type_expression("intger"));
    EXPECT_FALSE(parse_type_expression("$types."));
    EXPECT_FALSE(parse_type_expression(""));
}

TEST_F(ExtractorTest, TestInlineTypeExpressions) {
    declare("name", "text");
    declare("age", "integer");
    declare("ratio", "float");
    auto extracted = extract_built();
    ASSERT_TRUE(extracted) << extracted.error().message;

    EXPECT_TRUE(extracted->is_pure_schema);
    const auto& root = std::get<record_schema>(root_of(*extracted).content);
    ASSERT_EQ(root.fields.size(), 3u);
    EXPECT_EQ(root.unknown_fields, unknown_fields_policy::Deny);
    EXPECT_EQ(kind_name(extracted->schema.get(field_of(*extracted, "name").schema).content), "text");
    EXPECT_EQ(kind_name(extracted->schema.get(field_of(*extracted, "age").schema).content), "integer");
    EXPECT_EQ(kind_name(extracted->schema.get(field_of(*extracted, "ratio").schema).content), "float");
}

TEST_F(ExtractorTest, TestSelfDescribingOverlay) {
    set("port", std::int64_t{8080});
    declare("port.$type", "integer");
    set("host", eure::text::plaintext("localhost"));
    declare("host.$type", "text");
    auto extracted = extract_built();
    ASSERT_TRUE(extracted) << extracted.error().message;

    EXPECT_FALSE(extracted->is_pure_schema);
    EXPECT_TRUE(std::holds_alternative<integer_schema>(extracted->schema.get(field_of(*extracted, "port").schema).content));
    EXPECT_TRUE(std::holds_alternative<text_schema>(extracted->schema.get(field_of(*extracted, "host").schema).content));
}

TEST_F(ExtractorTest, TestUnannotatedDataIsNotDeclared) {
    declare("name", "text");
    set("note", eure::text::plaintext("just data"));
    auto extracted = extract_built();
    ASSERT_TRUE(extracted) << extracted.error().message;

    EXPECT_FALSE(extracted->is_pure_schema);
    const auto& root = std::get<record_schema>(root_of(*extracted).content);
    EXPECT_EQ(root.fields.size(), 1u);
    EXPECT_EQ(root.find("note"), nullptr);
}

TEST_F(ExtractorTest, TestNamedTypesAndReferences) {
    declare("$types.Point.x", "integer");
    declare("$types.Point.y", "integer");
    declare("origin", "Point");
    declare("target", "$types.Point");
    auto extracted = extract_built();
    ASSERT_TRUE(extracted) << extracted.error().message;

    const auto point = extracted->schema.find_type("Point");
    ASSERT_TRUE(point);
    EXPECT_EQ(std::get<record_schema>(extracted->schema.get(*point).content).fields.size(), 2u);

    const auto& origin = extracted->schema.get(field_of(*extracted, "origin").schema).content;
    ASSERT_TRUE(std::holds_alternative<reference_schema>(origin));
    EXPECT_EQ(std::get<reference_schema>(origin).name, "Point");
    EXPECT_TRUE(std::holds_alternative<reference_schema>(extracted->schema.get(field_of(*extracted, "target").schema).content));
}

TEST_F(ExtractorTest, TestDanglingReference) {
    declare("origin", "Missing");
    auto extracted = extract_built();
    ASSERT_FALSE(extracted);
    EXPECT_EQ(extracted.error().kind, schema_error_kind::DanglingReference);
    EXPECT_EQ(extracted.error().path.to_string(), "origin");
}

TEST_F(ExtractorTest, TestConflictingAnnotations) {
    declare("a.$type", "integer");
    declare("a.$array", "integer");
    auto extracted = extract_built();
    ASSERT_FALSE(extracted);
    EXPECT_EQ(extracted.error().kind, schema_error_kind::ConflictingTypeAnnotation);
    EXPECT_EQ(extracted.error().path.to_string(), "a");
}

TEST_F(ExtractorTest, TestAnnotationConflictsWithInlineExpression) {
    declare("a", "integer");
    declare("a.$array", "text");
    auto extracted = extract_built();
    ASSERT_FALSE(extracted);
    EXPECT_EQ(extracted.error().kind, schema_error_kind::ConflictingTypeAnnotation);
}

TEST_F(ExtractorTest, TestInvalidTypeExpression) {
    declare("a.$type", "intger");
    auto extracted = extract_built();
    ASSERT_FALSE(extracted);
    EXPECT_EQ(extracted.error().kind, schema_error_kind::InvalidTypeExpression);
    EXPECT_EQ(extracted.error().path.to_string(), "a.$type");
}

TEST_F(ExtractorTest, TestNumericConstraints) {
    declare("port", "integer");
    set("port.$range.#0", std::int64_t{1});
    set("port.$range.#1", std::int64_t{65535});
    declare("step", "float");
    set("step.$exclusive-min", std::int64_t{0});
    set("step.$multiple-of", 0.25);
    auto extracted = extract_built();
    ASSERT_TRUE(extracted) << extracted.error().message;

    const auto& port = std::get<integer_schema>(extracted->schema.get(field_of(*extracted, "port").schema).content);
    ASSERT_TRUE(port.min);
    ASSERT_TRUE(port.max);
    EXPECT_EQ(port.min->limit, number{std::int64_t{1}});
    EXPECT_FALSE(port.min->exclusive);
    EXPECT_EQ(port.max->limit, number{std::int64_t{65535}});

    const auto& step = std::get<float_schema>(extracted->schema.get(field_of(*extracted, "step").schema).content);
    ASSERT_TRUE(step.min);
    EXPECT_TRUE(step.min->exclusive);
    EXPECT_EQ(step.multiple_of, number{0.25});
}

TEST_F(ExtractorTest, TestTextConstraints) {
    declare("code", "text");
    set("code.$length.#0", std::int64_t{2});
    set("code.$length.#1", std::int64_t{3});
    set("code.$pattern", eure::text::plaintext("^[A-Z]+$"));
    auto extracted = extract_built();
    ASSERT_TRUE(extracted) << extracted.error().message;

    const auto& code = std::get<text_schema>(extracted->schema.get(field_of(*extracted, "code").schema).content);
    EXPECT_EQ(code.min_length, 2u);
    EXPECT_EQ(code.max_length, 3u);
    EXPECT_EQ(code.pattern, "^[A-Z]+$");
}

TEST_F(ExtractorTest, TestConstraintOnWrongKind) {
    declare("flag", "boolean");
    set("flag.$min-length", std::int64_t{3});
    auto extracted = extract_built();
    ASSERT_FALSE(extracted);
    EXPECT_EQ(extracted.error().kind, schema_error_kind::MalformedConstraint);
    EXPECT_EQ(extracted.error().path.to_string(), "flag.$min-length");
}

TEST_F(ExtractorTest, TestInvalidPatternIsRejected) {
    declare("code", "text");
    set("code.$pattern", eure::text::plaintext("(unclosed"));
    auto extracted = extract_built();
    ASSERT_FALSE(extracted);
    EXPECT_EQ(extracted.error().kind, schema_error_kind::MalformedConstraint);
}

TEST_F(ExtractorTest, TestOptionalFieldsAndUnknownFieldPolicy) {
    declare("nick", "text");
    set("nick.$optional", true);
    declare("name", "text");
    set("$unknown-fields", eure::text::plaintext("allow"));
    auto extracted = extract_built();
    ASSERT_TRUE(extracted) << extracted.error().message;

    EXPECT_TRUE(field_of(*extracted, "nick").optional);
    EXPECT_FALSE(field_of(*extracted, "name").optional);
    EXPECT_EQ(std::get<record_schema>(root_of(*extracted).content).unknown_fields, unknown_fields_policy::Allow);
}

TEST_F(ExtractorTest, TestInvalidUnknownFieldPolicy) {
    declare("name", "text");
    set("$unknown-fields", eure::text::plaintext("sometimes"));
    auto extracted = extract_built();
    ASSERT_FALSE(extracted);
    EXPECT_EQ(extracted.error().kind, schema_error_kind::InvalidUnknownFieldsPolicy);
}

TEST_F(ExtractorTest, TestArrayAndMapAnnotations) {
    declare("tags.$array", "text");
    set("tags.$min-items", std::int64_t{1});
    set("tags.$unique", true);
    declare("env.$map.key", "text");
    declare("env.$map.value", "integer");
    set("env.$max-size", std::int64_t{4});
    auto extracted = extract_built();
    ASSERT_TRUE(extracted) << extracted.error().message;

    const auto& tags = std::get<array_schema>(extracted->schema.get(field_of(*extracted, "tags").schema).content);
    EXPECT_EQ(tags.min_items, 1u);
    EXPECT_TRUE(tags.unique);
    EXPECT_TRUE(std::holds_alternative<text_schema>(extracted->schema.get(tags.item).content));

    const auto& env = std::get<map_schema>(extracted->schema.get(field_of(*extracted, "env").schema).content);
    EXPECT_EQ(env.max_size, 4u);
    EXPECT_TRUE(std::holds_alternative<integer_schema>(extracted->schema.get(env.value).content));
}

TEST_F(ExtractorTest, TestMapNeedsKeyAndValue) {
    declare("env.$map.key", "text");
    auto extracted = extract_built();
    ASSERT_FALSE(extracted);
    EXPECT_EQ(extracted.error().kind, schema_error_kind::InvalidTypeExpression);
    EXPECT_EQ(extracted.error().path.to_string(), "env.$map");
}

TEST_F(ExtractorTest, TestLiteralAnnotation) {
    set("version.$literal", std::int64_t{2});
    auto extracted = extract_built();
    ASSERT_TRUE(extracted) << extracted.error().message;

    const auto& literal = std::get<literal_schema>(extracted->schema.get(field_of(*extracted, "version").schema).content);
    EXPECT_EQ(literal.expected, eure::value{eure::primitive{std::int64_t{2}}});
}

TEST_F(ExtractorTest, TestTupleDeclarations) {
    declare("pair.#0", "integer");
    declare("pair.#1", "text");
    declare("range.$type.#0", "float");
    declare("range.$type.#1", "float");
    auto extracted = extract_built();
    ASSERT_TRUE(extracted) << extracted.error().message;

    const auto& pair = std::get<tuple_schema>(extracted->schema.get(field_of(*extracted, "pair").schema).content);
    ASSERT_EQ(pair.elements.size(), 2u);
    EXPECT_TRUE(std::holds_alternative<text_schema>(extracted->schema.get(pair.elements[1]).content));

    const auto& range = std::get<tuple_schema>(extracted->schema.get(field_of(*extracted, "range").schema).content);
    EXPECT_EQ(range.elements.size(), 2u);
}

TEST_F(ExtractorTest, TestVariants) {
    declare("shape.$variants.circle.radius", "float");
    declare("shape.$variants.rect.width", "float");
    declare("shape.$variants.rect.height", "float");
    set("shape.$variants.none", eure::null_value{});
    auto extracted = extract_built();
    ASSERT_TRUE(extracted) << extracted.error().message;

    const auto& shape = std::get<union_schema>(extracted->schema.get(field_of(*extracted, "shape").schema).content);
    ASSERT_EQ(shape.variants.size(), 3u);
    EXPECT_EQ(shape.repr.kind, variant_repr_kind::Tagged);
    ASSERT_NE(shape.find("rect"), nullptr);
    EXPECT_EQ(std::get<record_schema>(extracted->schema.get(shape.find("rect")->schema).content).fields.size(), 2u);
    EXPECT_TRUE(std::holds_alternative<null_schema>(extracted->schema.get(shape.find("none")->schema).content));
}

TEST_F(ExtractorTest, TestVariantRepresentations) {
    declare("a.$variants.x.v", "integer");
    set("a.$variant-repr", eure::text::plaintext("external"));
    declare("b.$variants.x.v", "integer");
    set("b.$variant-repr.tag", eure::text::plaintext("kind"));
    declare("c.$variants.x.v", "integer");
    set("c.$variant-repr.tag", eure::text::plaintext("t"));
    set("c.$variant-repr.content", eure::text::plaintext("c"));
    auto extracted = extract_built();
    ASSERT_TRUE(extracted) << extracted.error().message;

    auto repr_of = [&](std::string_view field) {
        return std::get<union_schema>(extracted->schema.get(field_of(*extracted, field).schema).content).repr;
    };
    EXPECT_EQ(repr_of("a").kind, variant_repr_kind::External);
    EXPECT_EQ(repr_of("b").kind, variant_repr_kind::Internal);
    EXPECT_EQ(repr_of("b").tag, "kind");
    EXPECT_EQ(repr_of("c").kind, variant_repr_kind::Adjacent);
    EXPECT_EQ(repr_of("c").content, "c");
}

TEST_F(ExtractorTest, TestAdjacentTagMustDifferFromContent) {
    declare("a.$variants.x.v", "integer");
    set("a.$variant-repr.tag", eure::text::plaintext("same"));
    set("a.$variant-repr.content", eure::text::plaintext("same"));
    auto extracted = extract_built();
    ASSERT_FALSE(extracted);
    EXPECT_EQ(extracted.error().kind, schema_error_kind::InvalidVariantRepr);
    EXPECT_EQ(extracted.error().path.to_string(), "a.$variant-repr");
}

TEST_F(ExtractorTest, TestUnknownVariantRepr) {
    declare("a.$variants.x.v", "integer");
    set("a.$variant-repr", eure::text::plaintext("untagged"));
    auto extracted = extract_built();
    ASSERT_FALSE(extracted);
    EXPECT_EQ(extracted.error().kind, schema_error_kind::InvalidVariantRepr);
}

TEST_F(ExtractorTest, TestEmptyVariant) {
    declare("a.$variants.full.v", "integer");
    ASSERT_TRUE(builder.make_map(at("a.$variants.empty")));
    auto extracted = extract_built();
    ASSERT_FALSE(extracted);
    EXPECT_EQ(extracted.error().kind, schema_error_kind::EmptyVariant);
    EXPECT_EQ(extracted.error().path.to_string(), "a.$variants.empty");
}

TEST_F(ExtractorTest, TestMetadata) {
    declare("port", "integer");
    set("port.$description", eure::text::plaintext("listening port"));
    set("port.$deprecated", true);
    set("port.$default", std::int64_t{80});
    set("port.$examples[]", std::int64_t{8080});
    set("port.$x-ui", eure::text::plaintext("spinner"));
    auto extracted = extract_built();
    ASSERT_TRUE(extracted) << extracted.error().message;

    const auto& metadata = extracted->schema.get(field_of(*extracted, "port").schema).metadata;
    EXPECT_EQ(metadata.description, "listening port");
    EXPECT_TRUE(metadata.deprecated);
    ASSERT_TRUE(metadata.default_value);
    EXPECT_EQ(*metadata.default_value, eure::value{eure::primitive{std::int64_t{80}}});
    ASSERT_EQ(metadata.examples.size(), 1u);
    ASSERT_EQ(metadata.extensions.size(), 1u);
    EXPECT_EQ(metadata.extensions[0].first, "x-ui");
}

TEST_F(ExtractorTest, TestUnknownExtensionIsLoggedAsWarning) {
    std::ostringstream captured;
    auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(captured);
    sink->set_pattern("[%l] %v");
    const auto previous = spdlog::default_logger();
    auto capture = std::make_shared<spdlog::logger>("extractor-test", sink);
    capture->set_level(spdlog::level::warn);
    spdlog::set_default_logger(capture);

    declare("port", "integer");
    set("port.$x-ui", eure::text::plaintext("spinner"));
    auto extracted = extract_built();
    spdlog::set_default_logger(previous);
    ASSERT_TRUE(extracted) << extracted.error().message;

    EXPECT_NE(captured.str().find("[warning] Keeping unknown extension $x-ui at port"), std::string::npos) << captured.str();
}

TEST_F(ExtractorTest, TestNamingOptions) {
    set("$rename-all", eure::text::plaintext("camelCase"));
    declare("$types.Point.x", "integer");
    set("$types.Point.$rename", eure::text::plaintext("point_t"));
    declare("origin", "Point");
    auto extracted = extract_built();
    ASSERT_TRUE(extracted) << extracted.error().message;

    EXPECT_EQ(extracted->schema.global_naming().rename_all, rename_rule::CamelCase);
    ASSERT_TRUE(extracted->schema.type_naming().contains("Point"));
    EXPECT_EQ(extracted->schema.type_naming().at("Point").rename, "point_t");
}

TEST_F(ExtractorTest, TestInvalidRenameRule) {
    declare("name", "text");
    set("$rename-all", eure::text::plaintext("Title Case"));
    auto extracted = extract_built();
    ASSERT_FALSE(extracted);
    EXPECT_EQ(extracted.error().kind, schema_error_kind::MalformedConstraint);
}

TEST_F(ExtractorTest, TestDuplicateFieldThroughKeyKinds) {
    declare("name", "text");
    ASSERT_TRUE(builder.set_primitive(builder.add_child(builder.root(), eure::object_key::literal(std::string("name"))).value(),
                                      eure::text::implicit("integer")));
    auto extracted = extract_built();
    ASSERT_FALSE(extracted);
    EXPECT_EQ(extracted.error().kind, schema_error_kind::DuplicateField);
}

TEST_F(ExtractorTest, TestExtractionIsIdempotent) {
    declare("$types.Point.x", "integer");
    declare("$types.Point.y", "integer");
    declare("$types.Line.from", "Point");
    declare("$types.Line.to", "Point");
    declare("lines.$array", "Line");
    declare("shape.$variants.dot.at", "Point");
    set("shape.$variants.none", eure::null_value{});
    auto first = extract_built();
    ASSERT_TRUE(first) << first.error().message;
    auto second = extract(*doc);
    ASSERT_TRUE(second) << second.error().message;
    EXPECT_TRUE(first->schema.equivalent(second->schema));
    EXPECT_EQ(first->is_pure_schema, second->is_pure_schema);
}

TEST_F(ExtractorTest, TestPureSchemaWithExamples) {
    declare("$types.User.name", "text");
    declare("$types.User.age", "integer");
    set("$types.User.$examples[0].name", eure::text::plaintext("Ada"));
    set("$types.User.$examples[0].age", std::int64_t{36});
    auto extracted = extract_built();
    ASSERT_TRUE(extracted) << extracted.error().message;

    EXPECT_TRUE(extracted->is_pure_schema);
    const auto user = extracted->schema.find_type("User");
    ASSERT_TRUE(user);
    EXPECT_EQ(extracted->schema.get(*user).metadata.examples.size(), 1u);
}
