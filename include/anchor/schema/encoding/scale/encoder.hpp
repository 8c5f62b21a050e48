#pragma once
#include <anchor/common/critical.hpp>
#include <anchor/schema/encoding/encoder.hpp>
#include <iterator>
#include <scale/scale.hpp>

namespace anchor::schema::encoding {

struct scale_encoder_tag {};

template <>
struct encoder<scale_encoder_tag> final {
  template <typename T>
  anchor::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, anchor::schema::bytes_t& out);

  /// Concatenated encodings of every argument. Produces the same bytes as
  /// encoding a tuple of them.
  template <typename... Ts>
  anchor::schema::bytes_t encode_all(const Ts&... objs);

  template <typename T>
  T decode(const anchor::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const anchor::schema::bytes_view_t& bytes);
};

template <typename T>
anchor::schema::bytes_t encoder<scale_encoder_tag>::encode(const T& obj) {
  auto encoded = ::scale::impl::memory::encode(obj);
  if (!encoded) {
    anchor::common::critical("failed to encode SCALE object");
  }
  return encoded.value();
}

template <typename T>
void encoder<scale_encoder_tag>::encode(const T& obj,
                                        anchor::schema::bytes_t& out) {
  auto encoded = encode(obj);
  out.insert(std::end(out), std::begin(encoded), std::end(encoded));
}

template <typename... Ts>
anchor::schema::bytes_t encoder<scale_encoder_tag>::encode_all(
    const Ts&... objs) {
  auto out = anchor::schema::bytes_t{};
  (encode(objs, out), ...);
  return out;
}

template <typename T>
T encoder<scale_encoder_tag>::decode(
    const anchor::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    anchor::common::critical("failed to decode {} SCALE bytes", bytes.size());
  }
  return decoded.value();
}

template <typename T>
std::optional<T> encoder<scale_encoder_tag>::try_decode(
    const anchor::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    return std::nullopt;
  }
  return decoded.value();
}

}  // namespace anchor::schema::encoding
