#include <gtest/gtest.h>
#include <sentinel/schema/encoding/scale/encoder.hpp>
#include <sentinel/storage/rocksdb/storage.hpp>
#include <sentinel/storage/storage.hpp>
#include <sentinel/testing/common.hpp>

#include <optional>
#include <string>

namespace {

using storage_tag_t = sentinel::storage::rocksdb_storage_tag;
using encoder_t = sentinel::schema::encoding::encoder<
    sentinel::schema::encoding::scale_encoder_tag>;

sentinel::schema::audit_record_t make_record(const uint64_t sequence) {
  auto record = sentinel::schema::audit_record_t{};
  record.sequence = sequence;
  record.recorded_at = 1'700'000'000'000 + sequence;
  record.sink_id = "file_write";
  record.decision = sentinel::schema::decision_kind_t::block;
  record.validator_id = "safe_filename";
  record.reason = sentinel::schema::reason_code_t::denied_substring;
  record.detail = "contains forbidden substring '..'";
  record.mode = sentinel::schema::enforcement_mode_t::block;
  record.policy_fingerprint[0] = static_cast<uint8_t>(sequence);
  record.taint_tags = {"http_request"};
  record.taint_flow = {"http_request", "file_write"};
  return record;
}

}  // namespace

TEST(audit_storage, keys_sort_numerically) {
  EXPECT_LT(sentinel::storage::detail::make_audit_key(9),
            sentinel::storage::detail::make_audit_key(10));
  EXPECT_LT(sentinel::storage::detail::make_audit_key(255),
            sentinel::storage::detail::make_audit_key(256));
  EXPECT_EQ(sentinel::storage::detail::parse_audit_key(
                sentinel::storage::detail::make_audit_key(4242)),
            4242u);
  EXPECT_FALSE(sentinel::storage::detail::parse_audit_key("OTHER|x"));
}

TEST(audit_storage, record_encoding_keeps_every_field) {
  auto encoder = encoder_t{};
  auto record = make_record(3);
  auto encoded = encoder.encode(record);
  auto decoded = encoder.decode<sentinel::schema::audit_record_t>(
      sentinel::schema::make_bytes_view(encoded));
  EXPECT_EQ(decoded.sequence, record.sequence);
  EXPECT_EQ(decoded.sink_id, record.sink_id);
  EXPECT_EQ(decoded.decision, record.decision);
  EXPECT_EQ(decoded.reason, record.reason);
  EXPECT_EQ(decoded.policy_fingerprint, record.policy_fingerprint);
  EXPECT_EQ(decoded.taint_flow, record.taint_flow);
}

TEST(audit_storage, empty_store_has_no_sequence) {
  auto db = sentinel::testing::make_db_path("sentinel_audit_empty");
  {
    auto store = sentinel::storage::make_storage<storage_tag_t>(db);
    EXPECT_FALSE(store.last_audit_sequence().has_value());
    EXPECT_TRUE(store.list_audit_records().empty());
  }
  sentinel::testing::remove_path(db);
}

TEST(audit_storage, records_list_in_sequence_order) {
  auto db = sentinel::testing::make_db_path("sentinel_audit_order");
  {
    auto store = sentinel::storage::make_storage<storage_tag_t>(db);
    for (const auto sequence : {uint64_t{2}, uint64_t{300}, uint64_t{1}}) {
      store.put_audit_record(make_record(sequence));
    }
    auto records = store.list_audit_records();
    ASSERT_EQ(records.size(), 3u);
    EXPECT_EQ(records[0].sequence, 1u);
    EXPECT_EQ(records[1].sequence, 2u);
    EXPECT_EQ(records[2].sequence, 300u);
    EXPECT_EQ(records[2].detail, "contains forbidden substring '..'");
    EXPECT_EQ(store.last_audit_sequence(), 300u);
  }
  sentinel::testing::remove_path(db);
}

TEST(audit_storage, records_survive_reopening) {
  auto db = sentinel::testing::make_db_path("sentinel_audit_reopen");
  {
    auto store = sentinel::storage::make_storage<storage_tag_t>(db);
    store.put_audit_record(make_record(1));
    store.put_audit_record(make_record(2));
  }
  {
    auto store = sentinel::storage::make_storage<storage_tag_t>(db);
    EXPECT_EQ(store.last_audit_sequence(), 2u);
    EXPECT_EQ(store.list_audit_records().size(), 2u);
  }
  sentinel::testing::remove_path(db);
}
