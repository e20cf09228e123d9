#pragma once
#include <spdlog/spdlog.h>
#include <beacon/common/critical.hpp>
#include <beacon/schema/encoding/encoder.hpp>
#include <beacon/schema/encoding/scale/intent_side.hpp>
#include <scale/scale.hpp>
#include <utility>

namespace beacon::schema::encoding {

struct scale_encoder_tag {};

template <>
struct encoder<scale_encoder_tag> final {
  template <typename T>
  beacon::schema::bytes_t encode(const T& obj);

  template <typename T>
  T decode(const beacon::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const beacon::schema::bytes_view_t& bytes);
};

template <typename T>
beacon::schema::bytes_t encoder<scale_encoder_tag>::encode(const T& obj) {
  auto encoded = ::scale::impl::memory::encode(obj);
  if (!encoded) {
    beacon::common::critical("SCALE encode failed: {}",
                             encoded.error().message());
  }
  return std::move(encoded.value());
}

template <typename T>
T encoder<scale_encoder_tag>::decode(
    const beacon::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    beacon::common::critical("SCALE decode of {} stored byte(s) failed: {}",
                             bytes.size(), decoded.error().message());
  }
  return std::move(decoded.value());
}

template <typename T>
std::optional<T> encoder<scale_encoder_tag>::try_decode(
    const beacon::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    spdlog::debug("Rejected {} byte(s) of SCALE input: {}", bytes.size(),
                  decoded.error().message());
    return std::nullopt;
  }
  return std::move(decoded.value());
}

}  // namespace beacon::schema::encoding
