#include <gtest/gtest.h>
#include <sentinel/blake3/hash.hpp>
#include <sentinel/schema/primitives.hpp>

TEST(primitives, to_hex_renders_lowercase_pairs) {
  auto bytes = sentinel::schema::bytes_t{0x00, 0x0f, 0xab, 0xff};
  EXPECT_EQ(sentinel::schema::to_hex(sentinel::schema::make_bytes_view(bytes)),
            "000fabff");
}

TEST(primitives, make_zero_hash_returns_zero_bytes) {
  auto zero = sentinel::schema::make_zero_hash();
  for (auto byte : zero) {
    EXPECT_EQ(byte, 0u);
  }
}

TEST(primitives, utf8_length_counts_code_points) {
  EXPECT_EQ(sentinel::schema::utf8_length(""), 0u);
  EXPECT_EQ(sentinel::schema::utf8_length("abc"), 3u);
  EXPECT_EQ(sentinel::schema::utf8_length("h\xc3\xa9llo"), 5u);     // é
  EXPECT_EQ(sentinel::schema::utf8_length("\xf0\x9f\x98\x80"), 1u);  // emoji
}

TEST(primitives, make_string_round_trips_bytes) {
  auto bytes = sentinel::schema::make_bytes("payload");
  EXPECT_EQ(sentinel::schema::make_string(
                sentinel::schema::make_bytes_view(bytes)),
            "payload");
}

TEST(blake3, hash_matches_known_empty_digest) {
  EXPECT_EQ(sentinel::blake3::hash_hex(""),
            "af1349b9f5f9a1a6a0404dea36dcc9499bcb25c9adc112b7cc9a93cae41f3262");
}

TEST(blake3, string_and_byte_overloads_agree) {
  auto text = std::string_view{"sentinel"};
  EXPECT_EQ(sentinel::blake3::hash(text),
            sentinel::blake3::hash(sentinel::schema::make_bytes_view(text)));
}
