#include <gtest/gtest.h>
#include <sentinel/common/error.hpp>
#include <sentinel/validation/schema_validator.hpp>

using sentinel::schema::array_t;
using sentinel::schema::object_t;
using sentinel::schema::reason_code_t;
using sentinel::schema::schema_validator_t;
using sentinel::schema::value_t;

namespace {

schema_validator_t make_schema(value_t document) {
  auto root = sentinel::validation::compile_schema(document, "test.schema");
  return schema_validator_t{std::move(document), std::move(root)};
}

schema_validator_t make_request_schema() {
  return make_schema(object_t{
      {"type", "object"},
      {"required", array_t{"name"}},
      {"properties",
       object_t{{"name", object_t{{"type", "string"}, {"maxLength", 16}}},
                {"size", object_t{{"type", "integer"}, {"minimum", 0}}}}},
      {"additionalProperties", false}});
}

std::string detail_of(const schema_validator_t& schema, const value_t& v) {
  auto result = sentinel::validation::evaluate(schema, v);
  if (result.passed()) {
    return {};
  }
  EXPECT_EQ(*result.failure, reason_code_t::schema_violation);
  return result.detail;
}

}  // namespace

TEST(schema_validator, conforming_instance_passes) {
  auto schema = make_request_schema();
  EXPECT_EQ(detail_of(schema, object_t{{"name", "report"}, {"size", 10}}), "");
  EXPECT_EQ(detail_of(schema, object_t{{"name", "report"}}), "");
}

TEST(schema_validator, reports_pointer_and_keyword) {
  auto schema = make_request_schema();
  EXPECT_EQ(detail_of(schema, object_t{{"name", "x"}, {"size", -1}}),
            "/size: minimum");
  EXPECT_EQ(detail_of(schema, object_t{{"size", 1}}), "/: required 'name'");
  EXPECT_EQ(detail_of(schema, object_t{{"name", "x"}, {"extra", true}}),
            "/extra: additionalProperties");
  EXPECT_EQ(detail_of(schema, object_t{{"name", 5}}), "/name: type");
  EXPECT_EQ(detail_of(schema, object_t{{"name", "abcdefghijklmnopq"}}),
            "/name: maxLength");
  EXPECT_EQ(detail_of(schema, array_t{}), "/: type");
}

TEST(schema_validator, properties_are_checked_in_declaration_order) {
  auto schema = make_request_schema();
  // Both members are wrong; "name" is declared first in the schema.
  EXPECT_EQ(detail_of(schema, object_t{{"size", "big"}, {"name", 1}}),
            "/name: type");
}

TEST(schema_validator, integer_accepts_integral_numbers) {
  auto schema = make_schema(object_t{{"type", "integer"}});
  EXPECT_EQ(detail_of(schema, value_t{3.0}), "");
  EXPECT_EQ(detail_of(schema, value_t{3.5}), "/: type");
}

TEST(schema_validator, items_descend_with_index_pointers) {
  auto schema = make_schema(object_t{
      {"type", "array"},
      {"maxItems", 3},
      {"items", object_t{{"type", "string"}, {"pattern", "^[a-z]+$"}}}});
  EXPECT_EQ(detail_of(schema, array_t{"a", "b"}), "");
  EXPECT_EQ(detail_of(schema, array_t{"a", "B"}), "/1: pattern");
  EXPECT_EQ(detail_of(schema, array_t{"a", "b", "c", "d"}), "/: maxItems");
}

TEST(schema_validator, enum_and_exclusive_bounds) {
  auto schema = make_schema(object_t{
      {"properties",
       object_t{{"mode", object_t{{"enum", array_t{"read", "write"}}}},
                {"ratio", object_t{{"exclusiveMinimum", 0},
                                   {"exclusiveMaximum", 1}}}}}});
  EXPECT_EQ(detail_of(schema, object_t{{"mode", "read"}, {"ratio", 0.5}}), "");
  EXPECT_EQ(detail_of(schema, object_t{{"mode", "exec"}}), "/mode: enum");
  EXPECT_EQ(detail_of(schema, object_t{{"ratio", 1}}),
            "/ratio: exclusiveMaximum");
}

TEST(schema_validator, pointer_tokens_are_escaped) {
  auto schema = make_schema(object_t{
      {"properties", object_t{{"a/b", object_t{{"type", "string"}}}}}});
  EXPECT_EQ(detail_of(schema, object_t{{"a/b", 1}}), "/a~1b: type");
}

TEST(schema_validator, compile_rejects_malformed_documents) {
  using sentinel::common::policy_error;
  using sentinel::validation::compile_schema;
  EXPECT_THROW(compile_schema(value_t{"object"}, "s"), policy_error);
  EXPECT_THROW(compile_schema(object_t{{"type", "widget"}}, "s"),
               policy_error);
  EXPECT_THROW(compile_schema(object_t{{"minLength", -1}}, "s"), policy_error);
  EXPECT_THROW(
      compile_schema(object_t{{"additionalProperties", object_t{}}}, "s"),
      policy_error);
  EXPECT_THROW(compile_schema(object_t{{"pattern", "(a+)+"}}, "s"),
               policy_error);
}

TEST(schema_validator, annotation_keywords_are_ignored) {
  auto schema = make_schema(object_t{{"title", "Upload"},
                                     {"description", "request body"},
                                     {"type", "object"}});
  EXPECT_EQ(detail_of(schema, object_t{}), "");
}

TEST(schema_validator, const_and_combinators_are_enforced) {
  auto schema = make_schema(object_t{
      {"properties",
       object_t{{"role", object_t{{"const", "user"}}},
                {"n", object_t{{"anyOf", array_t{object_t{{"type", "integer"}},
                                                 object_t{{"type", "null"}}}}}},
                {"tag", object_t{{"oneOf",
                                  array_t{object_t{{"maxLength", 3}},
                                          object_t{{"pattern", "^x"}}}}}},
                {"id", object_t{{"allOf",
                                 array_t{object_t{{"type", "string"}},
                                         object_t{{"minLength", 2}}}}}},
                {"mode", object_t{{"not", object_t{{"const", "root"}}}}}}}});
  EXPECT_EQ(detail_of(schema, object_t{{"role", "user"},
                                       {"n", 4},
                                       {"tag", "ab"},
                                       {"id", "u1"},
                                       {"mode", "read"}}),
            "");
  EXPECT_EQ(detail_of(schema, object_t{{"role", "admin"}}), "/role: const");
  EXPECT_EQ(detail_of(schema, object_t{{"n", "not-a-number"}}), "/n: anyOf");
  EXPECT_EQ(detail_of(schema, object_t{{"n", value_t{}}}), "");
  // "xy" satisfies both branches, "abcd" neither.
  EXPECT_EQ(detail_of(schema, object_t{{"tag", "xy"}}), "/tag: oneOf");
  EXPECT_EQ(detail_of(schema, object_t{{"tag", "abcd"}}), "/tag: oneOf");
  EXPECT_EQ(detail_of(schema, object_t{{"tag", "xyzw"}}), "");
  EXPECT_EQ(detail_of(schema, object_t{{"id", "u"}}), "/id: minLength");
  EXPECT_EQ(detail_of(schema, object_t{{"mode", "root"}}), "/mode: not");
}

TEST(schema_validator, unsupported_keywords_fail_to_compile) {
  using sentinel::common::policy_error;
  using sentinel::validation::compile_schema;
  EXPECT_THROW(compile_schema(object_t{{"format", "email"}}, "s"),
               policy_error);
  EXPECT_THROW(compile_schema(object_t{{"$ref", "#/definitions/a"}}, "s"),
               policy_error);
  EXPECT_THROW(
      compile_schema(
          object_t{{"properties",
                    object_t{{"a", object_t{{"patternProperties", object_t{}}}}}}},
          "s"),
      policy_error);
  EXPECT_THROW(compile_schema(object_t{{"anyOf", array_t{}}}, "s"),
               policy_error);
  try {
    compile_schema(object_t{{"if", object_t{}}}, "s");
    FAIL() << "expected policy_error";
  } catch (const policy_error& e) {
    EXPECT_EQ(e.code(),
              sentinel::common::error_code_t::invalid_validator_spec);
    EXPECT_EQ(std::string{e.what()}, "s/if: unsupported keyword 'if'");
  }
}
