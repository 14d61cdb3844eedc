#pragma once
#include <hashlock/schema/primitives.hpp>

#include <optional>
#include <span>

namespace hashlock::schema::encoding {

// Codec selection is a build time setting: callers name the tag of the
// library they were built against (e.g. `encoder<scale_encoder_tag>`) and
// the specialization forwards to it.
template <typename Library>
struct encoder {
  template <typename T>
  hashlock::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, hashlock::schema::bytes_t& out);

  template <typename T>
  T decode(const hashlock::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const hashlock::schema::bytes_view_t& bytes);
};

}  // namespace hashlock::schema::encoding
