#include <gtest/gtest.h>
#include <sentinel/schema/value.hpp>

using sentinel::schema::array_t;
using sentinel::schema::object_t;
using sentinel::schema::value_kind_t;
using sentinel::schema::value_t;

TEST(value, kind_follows_the_stored_alternative) {
  EXPECT_EQ(value_t{}.kind(), value_kind_t::null);
  EXPECT_EQ(value_t{true}.kind(), value_kind_t::boolean);
  EXPECT_EQ(value_t{7}.kind(), value_kind_t::integer);
  EXPECT_EQ(value_t{7.5}.kind(), value_kind_t::number);
  EXPECT_EQ(value_t{"x"}.kind(), value_kind_t::string);
  EXPECT_EQ(value_t{array_t{}}.kind(), value_kind_t::array);
  EXPECT_EQ(value_t{object_t{}}.kind(), value_kind_t::object);
}

TEST(value, integers_and_numbers_compare_by_magnitude) {
  EXPECT_EQ(value_t{1}, value_t{1.0});
  EXPECT_NE(value_t{1}, value_t{1.5});
  EXPECT_NE(value_t{1}, value_t{"1"});
}

TEST(value, object_equality_ignores_member_order) {
  auto a = value_t{object_t{{"x", 1}, {"y", "two"}}};
  auto b = value_t{object_t{{"y", "two"}, {"x", 1}}};
  auto c = value_t{object_t{{"x", 1}}};
  EXPECT_EQ(a, b);
  EXPECT_NE(a, c);
}

TEST(value, find_looks_up_object_members_only) {
  auto doc = value_t{object_t{{"name", "report.txt"}}};
  ASSERT_NE(doc.find("name"), nullptr);
  EXPECT_EQ(*doc.find("name")->string_if(), "report.txt");
  EXPECT_EQ(doc.find("missing"), nullptr);
  EXPECT_EQ(value_t{"name"}.find("name"), nullptr);
}

TEST(value, to_json_keeps_declaration_order) {
  auto doc = value_t{object_t{
      {"b", 1},
      {"a", array_t{value_t{true}, value_t{}, value_t{"q\"uote"}}}}};
  EXPECT_EQ(sentinel::schema::to_json(doc),
            R"({"b":1,"a":[true,null,"q\"uote"]})");
}

TEST(value, quote_json_escapes_control_characters) {
  EXPECT_EQ(sentinel::schema::quote_json("a\nb\x01"), R"("a\nb\u0001")");
}
