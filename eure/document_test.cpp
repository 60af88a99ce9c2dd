#include "gtest/gtest.h"
#include "document.hpp"

using namespace eure;

class DocumentBuilderTest : public ::testing::Test {
protected:
  node_id at(const std::string &path)
  {
    return builder.resolve_or_create(eure_path::parse(path).value()).value();
  }

  document_builder builder;
};

TEST_F(DocumentBuilderTest, TestNewDocumentHasHoleRoot)
{
  EXPECT_TRUE(builder.get(builder.root()).value()->is_hole());
  auto doc = std::move(builder).finalize();
  ASSERT_TRUE(doc);
  EXPECT_EQ(doc->size(), 1u);
  EXPECT_TRUE(doc->to_value().is_hole());
}

TEST_F(DocumentBuilderTest, TestAddChildTurnsHoleIntoMap)
{
  auto name = builder.add_field(builder.root(), "name");
  ASSERT_TRUE(name);
  ASSERT_TRUE(builder.set_primitive(*name, text::plaintext("eure")));
  EXPECT_NE(builder.get(builder.root()).value()->as_map(), nullptr);
}

TEST_F(DocumentBuilderTest, TestSetPrimitiveTwiceFails)
{
  const auto id = at("a");
  ASSERT_TRUE(builder.set_primitive(id, std::int64_t{ 1 }));
  auto second = builder.set_primitive(id, std::int64_t{ 2 });
  ASSERT_FALSE(second);
  EXPECT_EQ(second.error().kind, path_error_kind::AlreadyAssigned);
  EXPECT_EQ(second.error().path.to_string(), "a");
}

TEST_F(DocumentBuilderTest, TestDuplicateKeyFails)
{
  ASSERT_TRUE(builder.add_field(builder.root(), "a"));
  auto again = builder.add_field(builder.root(), "a");
  ASSERT_FALSE(again);
  EXPECT_EQ(again.error().kind, path_error_kind::AlreadyAssigned);
}

TEST_F(DocumentBuilderTest, TestChildOfPrimitiveFails)
{
  const auto id = at("a");
  ASSERT_TRUE(builder.set_primitive(id, true));
  auto child = builder.add_field(id, "b");
  ASSERT_FALSE(child);
  EXPECT_EQ(child.error().kind, path_error_kind::ExpectedMap);
  EXPECT_EQ(child.error().path.to_string(), "a");
}

TEST_F(DocumentBuilderTest, TestExtensionsAreSeparateFromFields)
{
  const auto field = builder.add_field(builder.root(), "type");
  const auto ext   = builder.add_extension(builder.root(), "type");
  ASSERT_TRUE(field);
  ASSERT_TRUE(ext);
  EXPECT_NE(*field, *ext);

  const auto &root = *builder.get(builder.root()).value();
  ASSERT_NE(root.as_map(), nullptr);
  EXPECT_EQ(root.as_map()->entries.size(), 1u);
  EXPECT_EQ(root.extension("type"), *ext);
}

TEST_F(DocumentBuilderTest, TestExtensionOnPrimitive)
{
  const auto id = at("port");
  ASSERT_TRUE(builder.set_primitive(id, std::int64_t{ 80 }));
  EXPECT_TRUE(builder.add_extension(id, "deprecated"));
  EXPECT_TRUE(builder.get(id).value()->as_primitive());
}

TEST_F(DocumentBuilderTest, TestArrayElementsAppendInOrder)
{
  const auto list = at("list");
  ASSERT_TRUE(builder.make_array(list));
  EXPECT_TRUE(builder.add_array_element(list));
  EXPECT_TRUE(builder.add_array_element(list, 1));

  auto skipped = builder.add_array_element(list, 5);
  ASSERT_FALSE(skipped);
  EXPECT_EQ(skipped.error().kind, path_error_kind::IndexOutOfRange);
  EXPECT_EQ(skipped.error().path.to_string(), "list[5]");
}

TEST_F(DocumentBuilderTest, TestTupleElementsMustBeContiguous)
{
  const auto pair = at("pair");
  ASSERT_TRUE(builder.add_tuple_element(pair, 0));
  auto gap = builder.add_tuple_element(pair, 2);
  ASSERT_FALSE(gap);
  EXPECT_EQ(gap.error().kind, path_error_kind::IndexOutOfRange);
}

TEST_F(DocumentBuilderTest, TestArrayElementOnMapFails)
{
  ASSERT_TRUE(builder.add_field(builder.root(), "a"));
  auto element = builder.add_array_element(builder.root());
  ASSERT_FALSE(element);
  EXPECT_EQ(element.error().kind, path_error_kind::ExpectedArray);
}

TEST_F(DocumentBuilderTest, TestResolveOrCreateReusesNodes)
{
  const auto first  = at("server.host");
  const auto second = at("server.host");
  EXPECT_EQ(first, second);

  const auto element = at("server.ports[]");
  EXPECT_EQ(at("server.ports[0]"), element);
  EXPECT_EQ(at("server.$type"), at("server.$type"));
}

TEST_F(DocumentBuilderTest, TestMutationAfterFinalizeFails)
{
  const auto root = builder.root();
  auto doc        = std::move(builder).finalize();
  ASSERT_TRUE(doc);

  auto child = builder.add_field(root, "late");
  ASSERT_FALSE(child);
  EXPECT_EQ(child.error().kind, path_error_kind::DocumentFinalized);
  EXPECT_FALSE(builder.root().valid());
}

TEST_F(DocumentBuilderTest, TestGetAfterFinalizeFails)
{
  const auto root = builder.root();
  ASSERT_TRUE(builder.get(root));
  auto doc = std::move(builder).finalize();
  ASSERT_TRUE(doc);

  auto gone = builder.get(root);
  ASSERT_FALSE(gone);
  EXPECT_EQ(gone.error().kind, path_error_kind::DocumentFinalized);
}

TEST_F(DocumentBuilderTest, TestGetUnknownNodeFails)
{
  auto missing = builder.get(node_id{ 42 });
  ASSERT_FALSE(missing);
  EXPECT_EQ(missing.error().kind, path_error_kind::PathNotFound);
}

TEST_F(DocumentBuilderTest, TestReadModeResolve)
{
  ASSERT_TRUE(builder.set_primitive(at("a.b"), std::int64_t{ 1 }));
  auto doc = std::move(builder).finalize();

  auto found = doc->resolve(eure_path::parse("a.b").value());
  ASSERT_TRUE(found);
  EXPECT_EQ(*doc->get(*found).as_primitive(), primitive{ std::int64_t{ 1 } });

  auto missing = doc->resolve(eure_path::parse("a.c.d").value());
  ASSERT_FALSE(missing);
  EXPECT_EQ(missing.error().kind, path_error_kind::PathNotFound);
  EXPECT_EQ(missing.error().path.to_string(), "a.c");
  EXPECT_EQ(missing.error().message(), "PathNotFound at a.c");
}

TEST_F(DocumentBuilderTest, TestDocumentEqualityIgnoresInsertionOrder)
{
  ASSERT_TRUE(builder.set_primitive(at("x"), std::int64_t{ 1 }));
  ASSERT_TRUE(builder.set_primitive(at("y"), std::int64_t{ 2 }));
  auto a = std::move(builder).finalize();

  document_builder other;
  ASSERT_TRUE(other.set_primitive(other.resolve_or_create(eure_path::parse("y").value()).value(), std::int64_t{ 2 }));
  ASSERT_TRUE(other.set_primitive(other.resolve_or_create(eure_path::parse("x").value()).value(), std::int64_t{ 1 }));
  auto b = std::move(other).finalize();

  EXPECT_TRUE(*a == *b);
}

TEST_F(DocumentBuilderTest, TestValueProjectionRoundTrip)
{
  ASSERT_TRUE(builder.set_primitive(at("name"), text::plaintext("eure")));
  ASSERT_TRUE(builder.set_primitive(at("name.$description"), text::plaintext("project name")));
  ASSERT_TRUE(builder.set_primitive(at("pair.#0"), std::int64_t{ 1 }));
  ASSERT_TRUE(builder.set_primitive(at("pair.#1"), text::implicit("integer")));
  ASSERT_TRUE(builder.set_primitive(at("items[]"), 2.5));
  at("todo");
  auto doc = std::move(builder).finalize();

  const auto projected = doc->to_value();
  auto rebuilt         = document_from_value(projected);
  ASSERT_TRUE(rebuilt) << rebuilt.error().message();
  EXPECT_EQ((*rebuilt)->to_value(), projected);
  EXPECT_TRUE((*rebuilt)->get((*rebuilt)->resolve(eure_path::parse("todo").value()).value()).is_hole());
}

TEST_F(DocumentBuilderTest, TestNodeKindNames)
{
  ASSERT_TRUE(builder.set_primitive(at("flag"), false));
  ASSERT_TRUE(builder.make_array(at("list")));
  at("hole");
  auto doc = std::move(builder).finalize();

  auto kind_at = [&](const std::string &path) {
    return std::string(node_kind_name(doc->get(doc->resolve(eure_path::parse(path).value()).value())));
  };
  EXPECT_EQ(kind_at("flag"), "boolean");
  EXPECT_EQ(kind_at("list"), "array");
  EXPECT_EQ(kind_at("hole"), "hole");
  EXPECT_EQ(node_kind_name(doc->get(doc->root())), "map");
}
