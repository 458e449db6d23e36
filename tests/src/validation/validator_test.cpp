#include <gtest/gtest.h>
#include <sentinel/common/error.hpp>
#include <sentinel/validation/validator.hpp>

using sentinel::schema::object_t;
using sentinel::schema::validator_spec_t;
using sentinel::schema::value_t;

TEST(validator, string_validator_rejects_non_string_values) {
  auto spec = validator_spec_t{sentinel::schema::string_validator_t{}};
  try {
    sentinel::validation::evaluate("safe_filename", spec, value_t{42});
    FAIL() << "integer accepted by a string validator";
  } catch (const sentinel::common::evaluation_error& e) {
    EXPECT_EQ(e.validator_id(), "safe_filename");
    EXPECT_EQ(e.code(), sentinel::common::error_code_t::type_mismatch);
    EXPECT_EQ(std::string{e.what()},
              "validator 'safe_filename' expects a string, got integer");
  }
}

TEST(validator, path_validator_rejects_objects) {
  auto spec = validator_spec_t{sentinel::schema::path_validator_t{
      .allowed_roots = {"/srv/uploads"}}};
  EXPECT_THROW(
      sentinel::validation::evaluate("path_in_uploads", spec, object_t{}),
      sentinel::common::evaluation_error);
}

TEST(validator, schema_validator_rejects_scalar_roots) {
  auto spec = validator_spec_t{sentinel::schema::schema_validator_t{}};
  EXPECT_THROW(sentinel::validation::evaluate("request_shape", spec, "x"),
               sentinel::common::evaluation_error);
  EXPECT_TRUE(
      sentinel::validation::evaluate("request_shape", spec, object_t{})
          .passed());
}

TEST(validator, dispatches_to_the_matching_evaluator) {
  auto spec = validator_spec_t{sentinel::schema::path_validator_t{
      .allowed_roots = {"/srv/uploads"}}};
  auto result = sentinel::validation::evaluate("path_in_uploads", spec,
                                               "/srv/uploads/../etc");
  ASSERT_FALSE(result.passed());
  EXPECT_EQ(*result.failure, sentinel::schema::reason_code_t::path_escape);
}
