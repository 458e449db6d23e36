#pragma once
#include <sentinel/common/critical.hpp>
#include <sentinel/schema/audit_record.hpp>
#include <sentinel/schema/encoding/encoder.hpp>
#include <sentinel/schema/encoding/scale/decision_kind.hpp>
#include <sentinel/schema/encoding/scale/enforcement_mode.hpp>
#include <sentinel/schema/encoding/scale/reason_code.hpp>
#include <scale/scale.hpp>
#include <typeinfo>
#include <utility>

namespace sentinel::schema::encoding {

struct scale_encoder_tag {};

template <>
struct encoder<scale_encoder_tag> final {
  template <typename T>
  sentinel::schema::bytes_t encode(const T& obj);

  template <typename T>
  T decode(const sentinel::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const sentinel::schema::bytes_view_t& bytes);
};

template <typename T>
sentinel::schema::bytes_t encoder<scale_encoder_tag>::encode(const T& obj) {
  auto encoded = ::scale::impl::memory::encode(obj);
  if (!encoded) {
    sentinel::common::critical("failed to SCALE-encode {}", typeid(T).name());
  }
  return encoded.value();
}

template <typename T>
T encoder<scale_encoder_tag>::decode(
    const sentinel::schema::bytes_view_t& bytes) {
  auto decoded = try_decode<T>(bytes);
  if (!decoded) {
    sentinel::common::critical("failed to decode {} SCALE bytes as {}",
                               bytes.size(), typeid(T).name());
  }
  return std::move(decoded).value();
}

template <typename T>
std::optional<T> encoder<scale_encoder_tag>::try_decode(
    const sentinel::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    return std::nullopt;
  }
  return std::move(decoded).value();
}

}  // namespace sentinel::schema::encoding
