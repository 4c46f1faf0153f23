#pragma once
#include <keyward/schema/primitives.hpp>
#include <optional>
#include <span>

namespace keyward::schema::encoding {

// Build-time selected codec for persisted records. The tag picks the
// library; callers only ever see bytes in and typed values out.
template <typename Library>
struct encoder {
  template <typename T>
  keyward::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, keyward::schema::bytes_t& out);

  template <typename T>
  T decode(const keyward::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const keyward::schema::bytes_view_t& bytes);
};

}  // namespace keyward::schema::encoding
