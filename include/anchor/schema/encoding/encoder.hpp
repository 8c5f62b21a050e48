#pragma once
#include <anchor/schema/primitives.hpp>
#include <optional>
#include <span>

namespace anchor::schema::encoding {

// Build time selection of the wire codec. Call sites hold an
// encoder<Library> and never touch the codec library directly.
template <typename Library>
struct encoder {
  template <typename T>
  anchor::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, anchor::schema::bytes_t& out);

  template <typename... Ts>
  anchor::schema::bytes_t encode_all(const Ts&... objs);

  template <typename T>
  T decode(const anchor::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const anchor::schema::bytes_view_t& bytes);
};

}  // namespace anchor::schema::encoding
