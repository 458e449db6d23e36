#include <gtest/gtest.h>
#include <sentinel/common/error.hpp>
#include <sentinel/execution/engine.hpp>
#include <sentinel/testing/common.hpp>

#include <future>
#include <string>
#include <vector>

using sentinel::execution::decider;
using sentinel::execution::step_outcome_t;
using sentinel::schema::allow_t;
using sentinel::schema::block_t;
using sentinel::schema::decision_t;
using sentinel::schema::reason_code_t;
using sentinel::schema::value_t;
using sentinel::schema::warn_t;

namespace {

constexpr auto kFilenamePolicy = std::string_view{R"(
version: 1
defaults:
  mode: block
validators:
  - id: safe_filename
    type: string
    max_len: 128
    regex: "^[A-Za-z0-9._-]+$"
    deny_substrings: ["..", "/", "\\"]
  - id: txt_only
    type: string
    regex: "^.*\\.txt$"
sinks:
  - id: file_write
    function: file.write
    require: [safe_filename]
  - id: text_write
    function: text.write
    require: [safe_filename, txt_only]
  - id: noisy_write
    function: noisy.write
    require: [safe_filename]
    on_violation:
      mode: warn
  - id: audit_only_write
    function: audit.write
    require: [safe_filename, txt_only]
    on_violation:
      mode: allow
)"};

std::string with_default_mode(const std::string_view mode) {
  auto text = std::string{kFilenamePolicy};
  text.replace(text.find("mode: block"), 11, "mode: " + std::string{mode});
  return text;
}

}  // namespace

TEST(engine, safe_file_name_is_allowed) {
  auto bound = decider{sentinel::testing::make_policy(kFilenamePolicy),
                       "file_write"};
  EXPECT_EQ(bound.decide(value_t{"test.txt"}), decision_t{allow_t{}});
}

TEST(engine, traversal_is_blocked_with_attribution) {
  auto bound = decider{sentinel::testing::make_policy(kFilenamePolicy),
                       "file_write"};
  EXPECT_EQ(bound.decide(value_t{"../../etc/passwd"}),
            decision_t(block_t{"safe_filename",
                               reason_code_t::denied_substring}));
}

TEST(engine, first_failing_validator_is_attributed) {
  auto bound = decider{sentinel::testing::make_policy(kFilenamePolicy),
                       "text_write"};
  EXPECT_EQ(bound.decide(value_t{"notes.txt"}), decision_t{allow_t{}});
  EXPECT_EQ(bound.decide(value_t{"notes.md"}),
            decision_t(block_t{"txt_only", reason_code_t::pattern_mismatch}));
  EXPECT_EQ(bound.decide(value_t{"../notes.md"}),
            decision_t(block_t{"safe_filename",
                               reason_code_t::denied_substring}));
}

TEST(engine, evaluation_stops_at_first_failure) {
  auto bound = decider{sentinel::testing::make_policy(kFilenamePolicy),
                       "text_write"};
  auto args = sentinel::testing::make_strings({"a.md"});
  auto evaluation = bound.evaluate(args);
  ASSERT_EQ(evaluation.steps.size(), 2u);
  EXPECT_EQ(evaluation.steps[0].outcome, step_outcome_t::passed);
  EXPECT_EQ(evaluation.steps[1].validator_id, "txt_only");
  EXPECT_EQ(evaluation.steps[1].outcome, step_outcome_t::failed);
  ASSERT_NE(evaluation.failure(), nullptr);
  EXPECT_EQ(evaluation.failure()->reason, reason_code_t::pattern_mismatch);
}

TEST(engine, arguments_are_checked_validator_major) {
  auto bound = decider{sentinel::testing::make_policy(kFilenamePolicy),
                       "text_write"};
  // The second argument fails safe_filename before the first argument
  // reaches txt_only.
  auto args = sentinel::testing::make_strings({"a.md", "b/c.txt"});
  auto evaluation = bound.evaluate(args);
  EXPECT_EQ(evaluation.decision,
            decision_t(block_t{"safe_filename",
                               reason_code_t::denied_substring}));
  ASSERT_NE(evaluation.failure(), nullptr);
  EXPECT_EQ(evaluation.failure()->argument_index, 1u);
}

TEST(engine, warn_mode_reports_without_blocking) {
  auto bound = decider{sentinel::testing::make_policy(with_default_mode("warn")),
                       "file_write"};
  EXPECT_EQ(bound.effective_mode(), sentinel::schema::enforcement_mode_t::warn);
  EXPECT_EQ(bound.decide(value_t{"../x"}),
            decision_t(warn_t{"safe_filename",
                              reason_code_t::denied_substring}));
}

TEST(engine, sink_override_beats_default_mode) {
  auto policy = sentinel::testing::make_policy(kFilenamePolicy);
  auto noisy = decider{policy, "noisy_write"};
  EXPECT_EQ(noisy.decide(value_t{"../x"}),
            decision_t(warn_t{"safe_filename",
                              reason_code_t::denied_substring}));
}

TEST(engine, allow_mode_suppresses_but_records_the_failure) {
  auto bound = decider{sentinel::testing::make_policy(kFilenamePolicy),
                       "audit_only_write"};
  auto args = sentinel::testing::make_strings({"../x"});
  auto evaluation = bound.evaluate(args);
  EXPECT_EQ(evaluation.decision, decision_t{allow_t{}});
  ASSERT_NE(evaluation.failure(), nullptr);
  EXPECT_EQ(evaluation.failure()->outcome, step_outcome_t::suppressed);
  EXPECT_EQ(evaluation.failure()->validator_id, "safe_filename");
  // Nothing runs after the suppressed failure.
  EXPECT_EQ(evaluation.steps.size(), 1u);
}

TEST(engine, passing_value_has_no_failure_step) {
  auto bound = decider{sentinel::testing::make_policy(kFilenamePolicy),
                       "audit_only_write"};
  auto args = sentinel::testing::make_strings({"ok.txt"});
  auto evaluation = bound.evaluate(args);
  EXPECT_EQ(evaluation.failure(), nullptr);
  EXPECT_EQ(evaluation.steps.size(), 2u);
}

TEST(engine, unknown_sink_fails_at_binding) {
  auto policy = sentinel::testing::make_policy(kFilenamePolicy);
  try {
    auto bound = decider{policy, "shell_exec"};
    FAIL() << "bound an unknown sink";
  } catch (const sentinel::common::unknown_sink_error& e) {
    EXPECT_EQ(e.sink_id(), "shell_exec");
  }
}

TEST(engine, type_mismatch_is_an_error_not_a_decision) {
  auto bound = decider{sentinel::testing::make_policy(kFilenamePolicy),
                       "file_write"};
  EXPECT_THROW(bound.decide(value_t{17}), sentinel::common::evaluation_error);
}

TEST(engine, empty_arguments_are_an_error_not_an_allow) {
  auto bound = decider{sentinel::testing::make_policy(kFilenamePolicy),
                       "file_write"};
  try {
    bound.decide(std::span<const value_t>{});
    FAIL() << "empty argument list decided";
  } catch (const sentinel::common::evaluation_error& e) {
    EXPECT_EQ(e.validator_id(), "safe_filename");
    EXPECT_EQ(e.code(), sentinel::common::error_code_t::type_mismatch);
  }
}

TEST(engine, mode_only_changes_the_outcome_of_failures) {
  for (const auto* mode : {"block", "warn", "allow"}) {
    auto bound = decider{sentinel::testing::make_policy(with_default_mode(mode)),
                         "file_write"};
    EXPECT_EQ(bound.decide(value_t{"fine.txt"}), decision_t{allow_t{}})
        << mode;
  }
}

TEST(engine, adding_a_validator_never_relaxes_a_decision) {
  auto policy = sentinel::testing::make_policy(kFilenamePolicy);
  auto narrow = decider{policy, "file_write"};
  auto wide = decider{policy, "text_write"};
  for (const auto* input : {"ok.txt", "ok.md", "../ok.txt", "a/b", "x"}) {
    auto narrow_decision = narrow.decide(value_t{input});
    auto wide_decision = wide.decide(value_t{input});
    if (sentinel::schema::is_block(narrow_decision)) {
      EXPECT_EQ(wide_decision, narrow_decision) << input;
    }
  }
}

TEST(engine, decisions_are_deterministic) {
  auto a = sentinel::testing::make_policy(kFilenamePolicy);
  auto b = sentinel::testing::make_policy(kFilenamePolicy);
  for (const auto* input : {"ok.txt", "../etc", "a b", ""}) {
    EXPECT_EQ(sentinel::execution::decide("text_write", value_t{input}, *a),
              sentinel::execution::decide("text_write", value_t{input}, *b))
        << input;
  }
}

TEST(engine, concurrent_decisions_share_one_binding) {
  auto bound = decider{sentinel::testing::make_policy(kFilenamePolicy),
                       "file_write"};
  auto tasks = std::vector<std::future<bool>>{};
  for (auto t = 0; t < 8; ++t) {
    tasks.push_back(std::async(std::launch::async, [&bound]() {
      for (auto i = 0; i < 200; ++i) {
        if (!sentinel::schema::is_allow(bound.decide(value_t{"ok.txt"})) ||
            !sentinel::schema::is_block(bound.decide(value_t{"../x"}))) {
          return false;
        }
      }
      return true;
    }));
  }
  for (auto& task : tasks) {
    EXPECT_TRUE(task.get());
  }
}

TEST(engine, binding_survives_the_callers_policy_reference) {
  auto policy = sentinel::testing::make_policy(kFilenamePolicy);
  auto bound = decider{policy, "file_write"};
  policy.reset();
  EXPECT_EQ(bound.decide(value_t{"../x"}),
            decision_t(block_t{"safe_filename",
                               reason_code_t::denied_substring}));
  EXPECT_EQ(bound.sink().function, "file.write");
}
